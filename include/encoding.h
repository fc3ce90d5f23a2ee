#ifndef ENCODING_H
#define ENCODING_H

#include <cstdint>
#include <string>
#include <vector>

// text encodings a hash engine may be configured with
enum class Encoding {
    ASCII,
    LATIN_1,
    UTF_8,
    UTF_16,  // little-endian with byte order mark
    UTF_16_LE,
    UTF_16_BE,
    UTF_32,  // little-endian with byte order mark
    UTF_32_LE,
    UTF_32_BE,
};

// lower-cases and maps '-' to '_' before matching, throws UnsupportedParameterError
Encoding ParseEncoding(const std::string& name);
std::string EncodingName(Encoding encoding);

// text is taken as UTF-8 and re-encoded; throws std::invalid_argument when a
// character cannot be represented
std::vector<uint8_t> EncodeText(const std::string& text, Encoding encoding);

// inverse of EncodeText, returns UTF-8
std::string DecodeText(const std::vector<uint8_t>& bytes, Encoding encoding);

#endif
