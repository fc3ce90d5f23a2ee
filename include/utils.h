#ifndef UTILS_H
#define UTILS_H

#include <leveldb/slice.h>

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

std::string ByteArrayToHexString(const std::vector<uint8_t>& bytes);
leveldb::Slice ByteArrayToSlice(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> StringToBytes(const std::string& str);
std::string BytesToString(const std::vector<uint8_t>& bytes);

// time based identifier in the canonical 8-4-4-4-12 form
std::string GenerateUUID();

// ctime style rendering without the trailing newline
std::string FormatMoment(std::time_t moment);

#endif
