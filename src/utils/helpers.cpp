#include "helpers.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <charconv>
#include <array>
#include <cctype>
#include <algorithm>

namespace {
const char* const REPLACEMENT_CHAR = "\xEF\xBF\xBD";
}

//
// Little-endian readers
//
 uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset) {
    return static_cast<uint16_t>((blob[offset + 1] << 8) |
                                 (blob[offset]));
}

 uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset + 3]) << 24) |
           (static_cast<uint32_t>(blob[offset + 2]) << 16) |
           (static_cast<uint32_t>(blob[offset + 1]) << 8) |
           (static_cast<uint32_t>(blob[offset]));
}

//
// Lossy UTF-8 decoder. Reads at most `length` bytes, stopping at the end of the blob.
// Overlong forms, surrogates and code points above U+10FFFF are rejected.
//
 std::string decode_utf8_lossy(const std::vector<uint8_t>& blob, size_t offset, size_t length) {
    std::string result;
    if (offset >= blob.size()) return result;
    size_t end = offset + std::min(length, blob.size() - offset);
    result.reserve(end - offset);

    size_t i = offset;
    while (i < end) {
        uint8_t lead = blob[i];
        if (lead < 0x80) {
            result += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t need;
        uint32_t cp;
        uint32_t minCp;
        if ((lead & 0xE0) == 0xC0) { need = 1; cp = lead & 0x1F; minCp = 0x80; }
        else if ((lead & 0xF0) == 0xE0) { need = 2; cp = lead & 0x0F; minCp = 0x800; }
        else if ((lead & 0xF8) == 0xF0) { need = 3; cp = lead & 0x07; minCp = 0x10000; }
        else {
            result += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        size_t j = 1;
        while (j <= need && i + j < end && (blob[i + j] & 0xC0) == 0x80) {
            cp = (cp << 6) | (blob[i + j] & 0x3F);
            ++j;
        }

        if (j <= need) {
            // truncated sequence: replace what was consumed, resync on the next byte
            result += REPLACEMENT_CHAR;
            i += j;
            continue;
        }

        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            result += REPLACEMENT_CHAR;
        } else {
            result.append(reinterpret_cast<const char*>(&blob[i]), need + 1);
        }
        i += need + 1;
    }
    return result;
}

// MS-DOS packed time/date as stored in ZIP headers.
std::string format_dos_datetime(uint16_t dosTime, uint16_t dosDate) {
    int year   = 1980 + ((dosDate >> 9) & 0x7F);
    int month  = (dosDate >> 5) & 0x0F;
    int day    = dosDate & 0x1F;
    int hour   = (dosTime >> 11) & 0x1F;
    int minute = (dosTime >> 5) & 0x3F;
    int second = (dosTime & 0x1F) * 2;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2) << day
        << " " << std::setw(2) << hour << ":" << std::setw(2) << minute << ":" << std::setw(2) << second;
    return oss.str();
}

std::string to_hex(uint64_t value)
{
   std::array<char, 16> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

bool ends_with_ci(const std::string& text, const std::string& suffix)
{
    if (suffix.size() > text.size()) return false;
    size_t base = text.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[base + i])) !=
            std::tolower(static_cast<unsigned char>(suffix[i])))
            return false;
    }
    return true;
}
