#include "directory_scanner.hpp"
#include "zip_layout.hpp"
#include "helpers.hpp"
#include "logger.hpp"

#include <algorithm>
#include <string>
#include <vector>

std::optional<size_t> findEndOfCentralDirectory(const std::vector<uint8_t>& blob) {
    size_t len = blob.size();
    if (len < ZIP_EOCD_MIN_SIZE)
        return std::nullopt;

    size_t lowest = len - std::min(len, ZIP_EOCD_SEARCH_WINDOW);

    // Backward scan: the first hit is the one closest to the end. A signature that shows
    // up earlier, e.g. inside the archive comment, never wins over it.
    for (size_t i = len - ZIP_EOCD_MIN_SIZE + 1; i-- > lowest;) {
        if (read_le32(blob, i) == ZIP_EOCD_SIGNATURE)
            return i;
    }
    return std::nullopt;
}

std::vector<ArchiveEntry> scanDirectoryEntries(const std::vector<uint8_t>& blob) {
    std::vector<ArchiveEntry> entries;

    auto eocd = findEndOfCentralDirectory(blob);
    if (!eocd) {
        Logger::debug("No end of central directory record found");
        return entries;
    }

    uint16_t totalEntries = read_le16(blob, *eocd + ZIP_EOCD_TOTAL_ENTRIES);
    uint32_t cdOffset = read_le32(blob, *eocd + ZIP_EOCD_CD_OFFSET);
    Logger::debug("EOCD at 0x" + to_hex(*eocd) + ", entries=" + std::to_string(totalEntries) +
                  ", central directory at 0x" + to_hex(cdOffset));

    size_t len = blob.size();
    uint64_t cursor = cdOffset;
    for (uint16_t i = 0; i < totalEntries; ++i) {
        if (cursor + ZIP_CDH_FIXED_SIZE > len) {
            Logger::debug("Central directory header " + std::to_string(i) + " runs past end of buffer");
            break;
        }

        size_t pos = static_cast<size_t>(cursor);
        if (read_le32(blob, pos) != ZIP_CDH_SIGNATURE) {
            Logger::debug("Bad central directory signature at 0x" + to_hex(pos));
            break;
        }

        uint16_t nameLen    = read_le16(blob, pos + ZIP_CDH_NAME_LENGTH);
        uint16_t extraLen   = read_le16(blob, pos + ZIP_CDH_EXTRA_LENGTH);
        uint16_t commentLen = read_le16(blob, pos + ZIP_CDH_COMMENT_LENGTH);

        ArchiveEntry entry;
        entry.headerOffset      = pos;
        entry.flags             = read_le16(blob, pos + ZIP_CDH_FLAGS);
        entry.method            = read_le16(blob, pos + ZIP_CDH_METHOD);
        entry.modTime           = read_le16(blob, pos + ZIP_CDH_MOD_TIME);
        entry.modDate           = read_le16(blob, pos + ZIP_CDH_MOD_DATE);
        entry.crc32             = read_le32(blob, pos + ZIP_CDH_CRC32);
        entry.compressedSize    = read_le32(blob, pos + ZIP_CDH_COMPRESSED_SIZE);
        entry.uncompressedSize  = read_le32(blob, pos + ZIP_CDH_UNCOMPRESSED_SIZE);
        entry.localHeaderOffset = read_le32(blob, pos + ZIP_CDH_LOCAL_OFFSET);
        // name is clamped to the buffer; the next iteration's bounds check ends the walk
        entry.name = decode_utf8_lossy(blob, pos + ZIP_CDH_FIXED_SIZE, nameLen);
        entries.push_back(std::move(entry));

        cursor += ZIP_CDH_FIXED_SIZE + static_cast<uint64_t>(nameLen) + extraLen + commentLen;
    }

    return entries;
}

std::vector<std::string> scanDirectory(const std::vector<uint8_t>& blob) {
    std::vector<std::string> names;
    for (auto& entry : scanDirectoryEntries(blob)) {
        names.push_back(std::move(entry.name));
    }
    return names;
}

std::string compressionMethodName(uint16_t method) {
    switch (method) {
    case 0:  return "stored";
    case 8:  return "deflate";
    case 9:  return "deflate64";
    case 12: return "bzip2";
    case 14: return "lzma";
    case 93: return "zstd";
    case 95: return "xz";
    case 99: return "aes";
    default: return "method " + std::to_string(method);
    }
}
