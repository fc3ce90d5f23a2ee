#include "utils.h"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

std::string ByteArrayToHexString(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

leveldb::Slice ByteArrayToSlice(const std::vector<uint8_t>& bytes) {
    return leveldb::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::vector<uint8_t> StringToBytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

std::string BytesToString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::string GenerateUUID() {
    // 100ns intervals between 1582-10-15 (gregorian reform) and the unix epoch
    constexpr uint64_t GREGORIAN_OFFSET = 0x01B21DD213814000ULL;

    auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    uint64_t ticks =
        static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch).count() / 100) +
        GREGORIAN_OFFSET;

    // random clock sequence and node, node has the multicast bit set so it
    // never collides with a real MAC address
    std::random_device rd;
    std::mt19937_64 gen(rd());
    uint64_t random = gen();

    uint32_t timeLow = static_cast<uint32_t>(ticks & 0xFFFFFFFF);
    uint16_t timeMid = static_cast<uint16_t>((ticks >> 32) & 0xFFFF);
    uint16_t timeHiAndVersion = static_cast<uint16_t>(((ticks >> 48) & 0x0FFF) | 0x1000);
    uint16_t clockSeq = static_cast<uint16_t>((random & 0x3FFF) | 0x8000);
    uint64_t node = ((random >> 16) & 0xFFFFFFFFFFFFULL) | 0x010000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << timeLow << '-' << std::setw(4)
       << timeMid << '-' << std::setw(4) << timeHiAndVersion << '-' << std::setw(4) << clockSeq
       << '-' << std::setw(12) << node;
    return ss.str();
}

std::string FormatMoment(std::time_t moment) {
    const char* raw = std::ctime(&moment);
    if (!raw) {
        throw std::runtime_error("Failed to format timestamp " + std::to_string(moment));
    }

    std::string text = raw;
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}
