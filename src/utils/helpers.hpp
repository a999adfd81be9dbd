#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <iomanip>
#include <sstream>

//
// Little-endian readers
// Callers check bounds; these index the blob directly.
//
 uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset);
 uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);

//
// UTF-8 text from raw bytes. Malformed sequences become U+FFFD.
//
 std::string decode_utf8_lossy(const std::vector<uint8_t>& blob, size_t offset, size_t length);

 std::string format_dos_datetime(uint16_t dosTime, uint16_t dosDate);
std::string to_hex(uint64_t value);
bool ends_with_ci(const std::string& text, const std::string& suffix);
