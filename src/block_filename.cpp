#include "block_filename.hpp"

#include <charconv>
#include <regex>

#include "block_constants.hpp"

static const std::regex& blockFilePattern() {
  static const std::regex pattern(std::string(BLOCK_FILE_PREFIX) + R"((-?\d+))");
  return pattern;
}

static const std::regex& metaFilePattern() {
  static const std::regex pattern(std::string(BLOCK_FILE_PREFIX) + R"((-?\d+)_(\d+)\)" +
                                  METADATA_EXTENSION);
  return pattern;
}

static const std::regex& metaOrBlockFilePattern() {
  static const std::regex pattern(std::string(BLOCK_FILE_PREFIX) + R"((-?\d+)(_(\d+)\)" +
                                  METADATA_EXTENSION + ")?");
  return pattern;
}

// Digits that overflow int64 are treated as a non-matching name
static std::optional<int64_t> parseLong(const std::ssub_match& group) {
  const std::string text = group.str();
  int64_t value = 0;
  auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

bool BlockFilename::isBlockFilename(const std::string& name) {
  return std::regex_match(name, blockFilePattern());
}

int64_t BlockFilename::filename2id(const std::string& name) {
  return tryFilename2id(name).value_or(0);
}

std::optional<int64_t> BlockFilename::tryFilename2id(const std::string& name) {
  std::smatch m;
  if (!std::regex_match(name, m, blockFilePattern())) return std::nullopt;
  return parseLong(m[1]);
}

bool BlockFilename::isMetaFilename(const std::string& name) {
  return std::regex_match(name, metaFilePattern());
}

std::string BlockFilename::metaToBlockFile(const std::string& meta_path) {
  const size_t slash = meta_path.find_last_of('/');
  const size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
  const size_t underscore = meta_path.find_last_of('_');
  if (underscore == std::string::npos || underscore < name_start) return meta_path;
  return meta_path.substr(0, underscore);
}

int64_t BlockFilename::getGenerationStamp(const std::string& meta_name) {
  std::smatch m;
  if (!std::regex_match(meta_name, m, metaFilePattern())) return GRANDFATHER_GENERATION_STAMP;
  return parseLong(m[2]).value_or(GRANDFATHER_GENERATION_STAMP);
}

int64_t BlockFilename::getBlockId(const std::string& meta_or_block_name) {
  return tryGetBlockId(meta_or_block_name).value_or(0);
}

std::optional<int64_t> BlockFilename::tryGetBlockId(const std::string& meta_or_block_name) {
  std::smatch m;
  if (!std::regex_match(meta_or_block_name, m, metaOrBlockFilePattern())) return std::nullopt;
  return parseLong(m[1]);
}

std::string BlockFilename::baseName(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return (slash == std::string::npos) ? path : path.substr(slash + 1);
}
