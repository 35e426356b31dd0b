#pragma once

#include <stdexcept>
#include <string>

/**
 * A decoded block description failed validation (e.g. negative length)
 */
class CorruptBlockError : public std::runtime_error {
 public:
  explicit CorruptBlockError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * SHA-256 could not be initialised by the crypto library
 */
class DigestUnavailableError : public std::runtime_error {
 public:
  explicit DigestUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Text checksum is not valid URL-safe unpadded base64
 */
class ChecksumFormatError : public std::runtime_error {
 public:
  explicit ChecksumFormatError(const std::string& what) : std::runtime_error(what) {}
};
