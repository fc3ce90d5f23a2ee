#ifndef HASH_ENGINE_H
#define HASH_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config.h"
#include "crypto.h"
#include "encoding.h"

// Computes leaf and internal node digests for one fixed configuration.
//
// Digests are the lowercase hex text of the underlying algorithm's output,
// encoded back into bytes with the configured encoding. With security on,
// leaf inputs get "\x00" prepended and each operand of a pair gets "\x01"
// prepended (both encoded), so a leaf digest can never be replayed as an
// internal node digest.
class HashEngine {
    private:
        Algorithm algorithm;
        Encoding encoding;
        bool security;
        size_t chunkSize;

        std::vector<uint8_t> leafPrefix;  // empty when security is off
        std::vector<uint8_t> pairPrefix;  // empty when security is off

        std::vector<uint8_t> consume(const std::vector<uint8_t>& buffer) const;

    public:
        HashEngine(Algorithm algorithm, Encoding encoding, bool security,
                   size_t chunkSize = Defaults::DIGEST_CHUNK_SIZE);

        // parses both names, throws UnsupportedParameterError
        HashEngine(const std::string& algorithm = Defaults::ALGORITHM,
                   const std::string& encoding = Defaults::ENCODING,
                   bool security = Defaults::SECURITY);

        Algorithm GetAlgorithm() const { return algorithm; }
        Encoding GetEncoding() const { return encoding; }
        bool GetSecurity() const { return security; }

        std::vector<uint8_t> HashEntry(const std::vector<uint8_t>& data) const;

        // text is encoded with the configured encoding first
        std::vector<uint8_t> HashEntry(const std::string& data) const;

        std::vector<uint8_t> HashPair(const std::vector<uint8_t>& left,
                                      const std::vector<uint8_t>& right) const;
};

#endif
