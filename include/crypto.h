#ifndef CRYPTO_H
#define CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// digest functions a hash engine may be configured with
enum class Algorithm {
    MD5,
    SHA224,
    SHA256,
    SHA384,
    SHA512,
    SHA3_224,
    SHA3_256,
    SHA3_384,
    SHA3_512,
};

// lower-cases and maps '-' to '_' before matching, throws UnsupportedParameterError
Algorithm ParseAlgorithm(const std::string& name);
std::string AlgorithmName(Algorithm algorithm);

std::vector<uint8_t> Digest(Algorithm algorithm, const std::vector<uint8_t>& data,
                            size_t chunkSize);

// lowercase hex text of Digest
std::string HexDigest(Algorithm algorithm, const std::vector<uint8_t>& data, size_t chunkSize);

#endif
