#include "encoding.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "errors.h"

static const std::array<std::pair<const char*, Encoding>, 9> ENCODINGS = {{
    {"ascii", Encoding::ASCII},
    {"latin_1", Encoding::LATIN_1},
    {"utf_8", Encoding::UTF_8},
    {"utf_16", Encoding::UTF_16},
    {"utf_16_le", Encoding::UTF_16_LE},
    {"utf_16_be", Encoding::UTF_16_BE},
    {"utf_32", Encoding::UTF_32},
    {"utf_32_le", Encoding::UTF_32_LE},
    {"utf_32_be", Encoding::UTF_32_BE},
}};

Encoding ParseEncoding(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });

    for (const auto& [supported, encoding] : ENCODINGS) {
        if (normalized == supported) {
            return encoding;
        }
    }

    throw UnsupportedParameterError(name);
}

std::string EncodingName(Encoding encoding) {
    for (const auto& [name, supported] : ENCODINGS) {
        if (supported == encoding) {
            return name;
        }
    }
    throw std::logic_error("Unknown encoding value");
}

static std::vector<uint32_t> decodeUtf8(const std::string& text) {
    std::vector<uint32_t> codePoints;
    codePoints.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            throw std::invalid_argument("Invalid UTF-8 lead byte at offset " + std::to_string(i));
        }

        if (i + extra >= text.size() && extra > 0) {
            throw std::invalid_argument("Truncated UTF-8 sequence at offset " + std::to_string(i));
        }

        for (size_t k = 1; k <= extra; k++) {
            uint8_t cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                throw std::invalid_argument("Invalid UTF-8 continuation byte at offset " +
                                            std::to_string(i + k));
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000)) {
            throw std::invalid_argument("Overlong UTF-8 sequence at offset " + std::to_string(i));
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw std::invalid_argument("Invalid code point in UTF-8 text");
        }

        codePoints.push_back(cp);
        i += extra + 1;
    }

    return codePoints;
}

static void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static void writeUnit16(std::vector<uint8_t>& buf, uint16_t unit, bool bigEndian) {
    if (bigEndian) {
        buf.push_back(static_cast<uint8_t>(unit >> 8));
        buf.push_back(static_cast<uint8_t>(unit & 0xFF));
    } else {
        buf.push_back(static_cast<uint8_t>(unit & 0xFF));
        buf.push_back(static_cast<uint8_t>(unit >> 8));
    }
}

static void writeUnit32(std::vector<uint8_t>& buf, uint32_t unit, bool bigEndian) {
    for (int i = 0; i < 4; i++) {
        int shift = bigEndian ? 8 * (3 - i) : 8 * i;
        buf.push_back(static_cast<uint8_t>((unit >> shift) & 0xFF));
    }
}

std::vector<uint8_t> EncodeText(const std::string& text, Encoding encoding) {
    if (encoding == Encoding::UTF_8) {
        // validates only, the input already is UTF-8
        decodeUtf8(text);
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::vector<uint32_t> codePoints = decodeUtf8(text);
    std::vector<uint8_t> encoded;

    switch (encoding) {
        case Encoding::ASCII:
        case Encoding::LATIN_1: {
            uint32_t limit = encoding == Encoding::ASCII ? 0x7F : 0xFF;
            encoded.reserve(codePoints.size());
            for (uint32_t cp : codePoints) {
                if (cp > limit) {
                    throw std::invalid_argument("Character cannot be encoded with " +
                                                EncodingName(encoding));
                }
                encoded.push_back(static_cast<uint8_t>(cp));
            }
            break;
        }
        case Encoding::UTF_16:
        case Encoding::UTF_16_LE:
        case Encoding::UTF_16_BE: {
            bool bigEndian = encoding == Encoding::UTF_16_BE;
            if (encoding == Encoding::UTF_16) {
                writeUnit16(encoded, 0xFEFF, false);
            }
            for (uint32_t cp : codePoints) {
                if (cp >= 0x10000) {
                    uint32_t v = cp - 0x10000;
                    writeUnit16(encoded, static_cast<uint16_t>(0xD800 | (v >> 10)), bigEndian);
                    writeUnit16(encoded, static_cast<uint16_t>(0xDC00 | (v & 0x3FF)), bigEndian);
                } else {
                    writeUnit16(encoded, static_cast<uint16_t>(cp), bigEndian);
                }
            }
            break;
        }
        case Encoding::UTF_32:
        case Encoding::UTF_32_LE:
        case Encoding::UTF_32_BE: {
            bool bigEndian = encoding == Encoding::UTF_32_BE;
            if (encoding == Encoding::UTF_32) {
                writeUnit32(encoded, 0xFEFF, false);
            }
            for (uint32_t cp : codePoints) {
                writeUnit32(encoded, cp, bigEndian);
            }
            break;
        }
        case Encoding::UTF_8:
            break;
    }

    return encoded;
}

static std::string decodeUtf16(const std::vector<uint8_t>& bytes, bool bigEndian,
                               size_t offset) {
    if ((bytes.size() - offset) % 2 != 0) {
        throw std::invalid_argument("Truncated UTF-16 data");
    }

    std::string out;
    for (size_t i = offset; i < bytes.size(); i += 2) {
        uint16_t unit = bigEndian ? static_cast<uint16_t>((bytes[i] << 8) | bytes[i + 1])
                                  : static_cast<uint16_t>(bytes[i] | (bytes[i + 1] << 8));

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 3 >= bytes.size()) {
                throw std::invalid_argument("Unpaired UTF-16 surrogate");
            }
            uint16_t low = bigEndian ? static_cast<uint16_t>((bytes[i + 2] << 8) | bytes[i + 3])
                                     : static_cast<uint16_t>(bytes[i + 2] | (bytes[i + 3] << 8));
            if (low < 0xDC00 || low > 0xDFFF) {
                throw std::invalid_argument("Unpaired UTF-16 surrogate");
            }
            appendUtf8(out, 0x10000 + (((unit - 0xD800) << 10) | (low - 0xDC00)));
            i += 2;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            throw std::invalid_argument("Unpaired UTF-16 surrogate");
        } else {
            appendUtf8(out, unit);
        }
    }
    return out;
}

static std::string decodeUtf32(const std::vector<uint8_t>& bytes, bool bigEndian,
                               size_t offset) {
    if ((bytes.size() - offset) % 4 != 0) {
        throw std::invalid_argument("Truncated UTF-32 data");
    }

    std::string out;
    for (size_t i = offset; i < bytes.size(); i += 4) {
        uint32_t cp = 0;
        for (int k = 0; k < 4; k++) {
            int shift = bigEndian ? 8 * (3 - k) : 8 * k;
            cp |= static_cast<uint32_t>(bytes[i + k]) << shift;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw std::invalid_argument("Invalid code point in UTF-32 data");
        }
        appendUtf8(out, cp);
    }
    return out;
}

std::string DecodeText(const std::vector<uint8_t>& bytes, Encoding encoding) {
    switch (encoding) {
        case Encoding::ASCII:
        case Encoding::LATIN_1: {
            std::string out;
            for (uint8_t b : bytes) {
                if (encoding == Encoding::ASCII && b > 0x7F) {
                    throw std::invalid_argument("Byte cannot be decoded with ascii");
                }
                appendUtf8(out, b);
            }
            return out;
        }
        case Encoding::UTF_8: {
            std::string out(bytes.begin(), bytes.end());
            decodeUtf8(out);
            return out;
        }
        case Encoding::UTF_16: {
            // honour a byte order mark when present, little-endian otherwise
            if (bytes.size() >= 2 && bytes[0] == 0xFE && bytes[1] == 0xFF) {
                return decodeUtf16(bytes, true, 2);
            }
            size_t offset = (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xFE) ? 2 : 0;
            return decodeUtf16(bytes, false, offset);
        }
        case Encoding::UTF_16_LE:
            return decodeUtf16(bytes, false, 0);
        case Encoding::UTF_16_BE:
            return decodeUtf16(bytes, true, 0);
        case Encoding::UTF_32: {
            if (bytes.size() >= 4 && bytes[0] == 0x00 && bytes[1] == 0x00 && bytes[2] == 0xFE &&
                bytes[3] == 0xFF) {
                return decodeUtf32(bytes, true, 4);
            }
            size_t offset = (bytes.size() >= 4 && bytes[0] == 0xFF && bytes[1] == 0xFE &&
                             bytes[2] == 0x00 && bytes[3] == 0x00)
                                ? 4
                                : 0;
            return decodeUtf32(bytes, false, offset);
        }
        case Encoding::UTF_32_LE:
            return decodeUtf32(bytes, false, 0);
        case Encoding::UTF_32_BE:
            return decodeUtf32(bytes, true, 0);
    }

    throw std::logic_error("Unknown encoding value");
}
