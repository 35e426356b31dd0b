#pragma once

#include <cstddef>
#include <cstdint>

// Names and sentinels shared with the directory scanner and protocol layers
inline constexpr const char* BLOCK_FILE_PREFIX = "blk_";
inline constexpr const char* METADATA_EXTENSION = ".meta";
inline constexpr const char* NO_CHECKSUM = "nochecksum";
inline constexpr size_t CHECKSUM_LENGTH = 32;  // SHA-256 digest size

// Generation stamp for blocks written before generation stamps existed
inline constexpr int64_t GRANDFATHER_GENERATION_STAMP = 0;
