#include "hashEngine.h"

#include <stdexcept>

HashEngine::HashEngine(Algorithm algorithm, Encoding encoding, bool security, size_t chunkSize)
    : algorithm(algorithm), encoding(encoding), security(security), chunkSize(chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Digest chunk size must be positive");
    }

    if (security) {
        leafPrefix = EncodeText(std::string(1, '\x00'), encoding);
        pairPrefix = EncodeText(std::string(1, '\x01'), encoding);
    }
}

HashEngine::HashEngine(const std::string& algorithm, const std::string& encoding, bool security)
    : HashEngine(ParseAlgorithm(algorithm), ParseEncoding(encoding), security) {}

std::vector<uint8_t> HashEngine::consume(const std::vector<uint8_t>& buffer) const {
    return EncodeText(HexDigest(algorithm, buffer, chunkSize), encoding);
}

std::vector<uint8_t> HashEngine::HashEntry(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> buffer;
    buffer.reserve(leafPrefix.size() + data.size());
    buffer.insert(buffer.end(), leafPrefix.begin(), leafPrefix.end());
    buffer.insert(buffer.end(), data.begin(), data.end());
    return consume(buffer);
}

std::vector<uint8_t> HashEngine::HashEntry(const std::string& data) const {
    return HashEntry(EncodeText(data, encoding));
}

std::vector<uint8_t> HashEngine::HashPair(const std::vector<uint8_t>& left,
                                          const std::vector<uint8_t>& right) const {
    // prefix01 | left | prefix01 | right
    std::vector<uint8_t> buffer;
    buffer.reserve(2 * pairPrefix.size() + left.size() + right.size());
    buffer.insert(buffer.end(), pairPrefix.begin(), pairPrefix.end());
    buffer.insert(buffer.end(), left.begin(), left.end());
    buffer.insert(buffer.end(), pairPrefix.begin(), pairPrefix.end());
    buffer.insert(buffer.end(), right.begin(), right.end());
    return consume(buffer);
}
