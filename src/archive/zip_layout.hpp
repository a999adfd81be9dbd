#pragma once
#include <cstddef>
#include <cstdint>

// ZIP end of central directory record (APPNOTE 4.3.16)
constexpr uint32_t ZIP_EOCD_SIGNATURE        = 0x06054B50;
constexpr size_t   ZIP_EOCD_MIN_SIZE         = 22;
constexpr size_t   ZIP_EOCD_MAX_COMMENT      = 65535;
constexpr size_t   ZIP_EOCD_SEARCH_WINDOW    = ZIP_EOCD_MAX_COMMENT + ZIP_EOCD_MIN_SIZE;
constexpr size_t   ZIP_EOCD_TOTAL_ENTRIES    = 10;
constexpr size_t   ZIP_EOCD_CD_OFFSET        = 16;

// Central directory file header (APPNOTE 4.3.12)
constexpr uint32_t ZIP_CDH_SIGNATURE         = 0x02014B50;
constexpr size_t   ZIP_CDH_FIXED_SIZE        = 46;
constexpr size_t   ZIP_CDH_FLAGS             = 8;
constexpr size_t   ZIP_CDH_METHOD            = 10;
constexpr size_t   ZIP_CDH_MOD_TIME          = 12;
constexpr size_t   ZIP_CDH_MOD_DATE          = 14;
constexpr size_t   ZIP_CDH_CRC32             = 16;
constexpr size_t   ZIP_CDH_COMPRESSED_SIZE   = 20;
constexpr size_t   ZIP_CDH_UNCOMPRESSED_SIZE = 24;
constexpr size_t   ZIP_CDH_NAME_LENGTH       = 28;
constexpr size_t   ZIP_CDH_EXTRA_LENGTH      = 30;
constexpr size_t   ZIP_CDH_COMMENT_LENGTH    = 32;
constexpr size_t   ZIP_CDH_LOCAL_OFFSET      = 42;

// Local file header
constexpr uint32_t ZIP_LFH_SIGNATURE         = 0x04034B50;
