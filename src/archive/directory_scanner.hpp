#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One central directory record. Only metadata; nothing here is ever decompressed.
struct ArchiveEntry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t modTime = 0;
    uint16_t modDate = 0;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    uint32_t localHeaderOffset = 0;
    size_t headerOffset = 0;      // position of the record inside the scanned buffer
};

// Offset of the EOCD record closest to the end of the buffer, searched backward over the
// last 65535 + 22 bytes. std::nullopt when no signature is present.
std::optional<size_t> findEndOfCentralDirectory(const std::vector<uint8_t>& blob);

// Walks the central directory and returns every record that could be read, in directory
// order. Never throws: a missing EOCD, a bad header signature or a record running past the
// end of the buffer just ends the walk.
std::vector<ArchiveEntry> scanDirectoryEntries(const std::vector<uint8_t>& blob);

// Entry names of scanDirectoryEntries, same order.
std::vector<std::string> scanDirectory(const std::vector<uint8_t>& blob);

std::string compressionMethodName(uint16_t method);
