#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * SHA-256 content digests for block files and their text form
 * (URL-safe base64, no padding).
 */
class Checksum {
 public:
  static constexpr size_t READ_CHUNK_SIZE = 8192;

  // Best effort: any I/O failure yields nullopt instead of an error.
  // Throws DigestUnavailableError if SHA-256 cannot be set up.
  static std::optional<std::vector<uint8_t>> compute(const std::string& path);

  static std::string encode(const std::vector<uint8_t>& bytes);
  // Throws ChecksumFormatError on malformed input
  static std::vector<uint8_t> decode(const std::string& text);
};
