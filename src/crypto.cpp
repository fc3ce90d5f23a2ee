#include "crypto.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <utility>

#include "errors.h"
#include "utils.h"

static const std::array<std::pair<const char*, Algorithm>, 9> ALGORITHMS = {{
    {"md5", Algorithm::MD5},
    {"sha224", Algorithm::SHA224},
    {"sha256", Algorithm::SHA256},
    {"sha384", Algorithm::SHA384},
    {"sha512", Algorithm::SHA512},
    {"sha3_224", Algorithm::SHA3_224},
    {"sha3_256", Algorithm::SHA3_256},
    {"sha3_384", Algorithm::SHA3_384},
    {"sha3_512", Algorithm::SHA3_512},
}};

Algorithm ParseAlgorithm(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });

    for (const auto& [supported, algorithm] : ALGORITHMS) {
        if (normalized == supported) {
            return algorithm;
        }
    }

    throw UnsupportedParameterError(name);
}

std::string AlgorithmName(Algorithm algorithm) {
    for (const auto& [name, supported] : ALGORITHMS) {
        if (supported == algorithm) {
            return name;
        }
    }
    throw std::logic_error("Unknown algorithm value");
}

static const EVP_MD* evpAlgorithm(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::MD5:
            return EVP_md5();
        case Algorithm::SHA224:
            return EVP_sha224();
        case Algorithm::SHA256:
            return EVP_sha256();
        case Algorithm::SHA384:
            return EVP_sha384();
        case Algorithm::SHA512:
            return EVP_sha512();
        case Algorithm::SHA3_224:
            return EVP_sha3_224();
        case Algorithm::SHA3_256:
            return EVP_sha3_256();
        case Algorithm::SHA3_384:
            return EVP_sha3_384();
        case Algorithm::SHA3_512:
            return EVP_sha3_512();
    }
    throw std::logic_error("Unknown algorithm value");
}

static std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> makeCtx() {
    auto ctx =
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    return ctx;
}

std::vector<uint8_t> Digest(Algorithm algorithm, const std::vector<uint8_t>& data,
                            size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Digest chunk size must be positive");
    }

    auto ctx = makeCtx();

    if (EVP_DigestInit_ex(ctx.get(), evpAlgorithm(algorithm), nullptr) <= 0) {
        throw std::runtime_error("EVP digest init failed for " + AlgorithmName(algorithm));
    }

    // feed the buffer sequentially so large inputs never go through in one call
    for (size_t offset = 0; offset < data.size(); offset += chunkSize) {
        size_t len = std::min(chunkSize, data.size() - offset);
        if (EVP_DigestUpdate(ctx.get(), data.data() + offset, len) <= 0) {
            throw std::runtime_error("EVP digest update failed for " + AlgorithmName(algorithm));
        }
    }

    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), buf, &len) <= 0) {
        throw std::runtime_error("EVP digest final failed for " + AlgorithmName(algorithm));
    }

    return {buf, buf + len};
}

std::string HexDigest(Algorithm algorithm, const std::vector<uint8_t>& data, size_t chunkSize) {
    return ByteArrayToHexString(Digest(algorithm, data, chunkSize));
}
