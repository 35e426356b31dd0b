#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * Naming convention for block files (blk_<id>) and their metadata files
 * (blk_<id>_<genstamp>.meta). Names are matched in full, never by prefix.
 * None of these functions throw.
 */
class BlockFilename {
 public:
  static bool isBlockFilename(const std::string& name);

  // Returns 0 when name is not a block file name, which is
  // indistinguishable from block 0. New callers should use tryFilename2id.
  static int64_t filename2id(const std::string& name);
  static std::optional<int64_t> tryFilename2id(const std::string& name);

  static bool isMetaFilename(const std::string& name);

  // <dir>/blk_<id>_<genstamp>.meta -> <dir>/blk_<id>. String transform only.
  static std::string metaToBlockFile(const std::string& meta_path);

  // GRANDFATHER_GENERATION_STAMP when name is not a metadata file name
  static int64_t getGenerationStamp(const std::string& meta_name);

  // Accepts either a block or a metadata file name; 0 on no match
  static int64_t getBlockId(const std::string& meta_or_block_name);
  static std::optional<int64_t> tryGetBlockId(const std::string& meta_or_block_name);

  // Final path component
  static std::string baseName(const std::string& path);
};
