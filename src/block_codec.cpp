#include "block.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include "block_errors.hpp"
#include "logger.hpp"

// macOS compatibility for byte order functions
#ifdef __APPLE__
#include <libkern/OSByteOrder.h>
#define htobe64(x) OSSwapHostToBigInt64(x)
#define be64toh(x) OSSwapBigToHostInt64(x)
#define htobe32(x) OSSwapHostToBigInt32(x)
#define be32toh(x) OSSwapBigToHostInt32(x)
#else
#include <endian.h>
#endif

// Helper to serialize a signed 64-bit integer in network byte order
static size_t serializeLong(char* buffer, size_t buffer_size, size_t offset, int64_t value) {
  if (offset + sizeof(uint64_t) > buffer_size) {
    throw std::runtime_error("Buffer too small for long");
  }
  uint64_t network_value = htobe64(static_cast<uint64_t>(value));
  std::memcpy(buffer + offset, &network_value, sizeof(network_value));
  return offset + sizeof(network_value);
}

static int64_t deserializeLong(const char* buffer, size_t buffer_size, size_t& offset) {
  if (offset + sizeof(uint64_t) > buffer_size) {
    throw std::runtime_error("Buffer too small for long");
  }
  uint64_t network_value;
  std::memcpy(&network_value, buffer + offset, sizeof(network_value));
  offset += sizeof(network_value);
  return static_cast<int64_t>(be64toh(network_value));
}

static size_t serializeInt(char* buffer, size_t buffer_size, size_t offset, int32_t value) {
  if (offset + sizeof(uint32_t) > buffer_size) {
    throw std::runtime_error("Buffer too small for int");
  }
  uint32_t network_value = htobe32(static_cast<uint32_t>(value));
  std::memcpy(buffer + offset, &network_value, sizeof(network_value));
  return offset + sizeof(network_value);
}

static int32_t deserializeInt(const char* buffer, size_t buffer_size, size_t& offset) {
  if (offset + sizeof(uint32_t) > buffer_size) {
    throw std::runtime_error("Buffer too small for int");
  }
  uint32_t network_value;
  std::memcpy(&network_value, buffer + offset, sizeof(network_value));
  offset += sizeof(network_value);
  return static_cast<int32_t>(be32toh(network_value));
}

size_t Block::serializedSize() const {
  return FIXED_SERIALIZED_SIZE + (checksum ? checksum->size() : 0);
}

size_t Block::serialize(char* buffer, size_t buffer_size, Logger* logger) const {
  if (serializedSize() > buffer_size) throw std::runtime_error("Buffer too small for Block");

  size_t offset = 0;
  offset = serializeLong(buffer, buffer_size, offset, block_id);
  offset = serializeLong(buffer, buffer_size, offset, num_bytes);
  offset = serializeLong(buffer, buffer_size, offset, generation_stamp);

  if (!checksum) {
    offset = serializeInt(buffer, buffer_size, offset, 0);
    if (logger) logger->log("Serialize Checksum: len=0");
    return offset;
  }

  offset = serializeInt(buffer, buffer_size, offset, static_cast<int32_t>(checksum->size()));
  if (!checksum->empty()) {
    std::memcpy(buffer + offset, checksum->data(), checksum->size());
    offset += checksum->size();
  }
  if (logger) {
    logger->log("Serialize Checksum: len=" + std::to_string(checksum->size()) +
                " value=" + getChecksumAsString());
  }
  return offset;
}

size_t Block::readFields(const char* buffer, size_t buffer_size, Logger* logger) {
  size_t offset = 0;

  int64_t new_id = deserializeLong(buffer, buffer_size, offset);
  int64_t new_len = deserializeLong(buffer, buffer_size, offset);
  int64_t new_gen_stamp = deserializeLong(buffer, buffer_size, offset);
  if (new_len < 0) {
    throw CorruptBlockError("Unexpected block size: " + std::to_string(new_len));
  }

  int32_t checksum_len = deserializeInt(buffer, buffer_size, offset);
  if (checksum_len < 0) {
    throw CorruptBlockError("Unexpected checksum length: " + std::to_string(checksum_len));
  }

  std::optional<Bytes> new_checksum;
  if (checksum_len != 0) {
    if (offset + static_cast<size_t>(checksum_len) > buffer_size) {
      throw std::runtime_error("Buffer too small for checksum");
    }
    new_checksum.emplace(buffer + offset, buffer + offset + checksum_len);
    offset += static_cast<size_t>(checksum_len);
  }

  set(new_id, new_len, new_gen_stamp, std::move(new_checksum));
  if (logger) {
    logger->log("Deserialize Checksum: len=" + std::to_string(checksum_len) +
                " value=" + getChecksumAsString());
  }
  return offset;
}

Block Block::deserialize(const char* buffer, size_t buffer_size, Logger* logger) {
  Block block;
  block.readFields(buffer, buffer_size, logger);
  return block;
}

size_t Block::writeId(char* buffer, size_t buffer_size) const {
  if (ID_SERIALIZED_SIZE > buffer_size) throw std::runtime_error("Buffer too small for block id");

  size_t offset = 0;
  offset = serializeLong(buffer, buffer_size, offset, block_id);
  offset = serializeLong(buffer, buffer_size, offset, generation_stamp);
  return offset;
}

size_t Block::readId(const char* buffer, size_t buffer_size) {
  size_t offset = 0;
  int64_t new_id = deserializeLong(buffer, buffer_size, offset);
  int64_t new_gen_stamp = deserializeLong(buffer, buffer_size, offset);
  block_id = new_id;
  generation_stamp = new_gen_stamp;
  return offset;
}
