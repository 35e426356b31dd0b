#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "block_constants.hpp"

class Logger;

/**
 * A storage block, identified by its 64-bit block ID.
 *
 * A block also carries a generation stamp, a monotonically increasing version
 * assigned by the namespace authority. Two blocks are equal iff their block IDs
 * are equal; numBytes, generationStamp and checksum do not take part in
 * equality, ordering or hashing. Use matchingIdAndGenStamp() when the version
 * matters.
 *
 * Not thread-safe: copy a Block before handing it to another thread.
 */
class Block {
 public:
  using Bytes = std::vector<uint8_t>;

  // blockId + numBytes + generationStamp + checksum length
  static constexpr size_t FIXED_SERIALIZED_SIZE =
      sizeof(int64_t) + sizeof(int64_t) + sizeof(int64_t) + sizeof(int32_t);
  // blockId + generationStamp
  static constexpr size_t ID_SERIALIZED_SIZE = sizeof(int64_t) + sizeof(int64_t);

  Block() : Block(0, 0, 0) {}
  Block(int64_t blkid, int64_t len, int64_t gen_stamp);
  Block(int64_t blkid, int64_t len, int64_t gen_stamp, std::optional<Bytes> checksum);
  explicit Block(int64_t blkid);

  // Block id from the file name, checksum computed from the file contents
  static Block fromFile(const std::string& path, int64_t len, int64_t gen_stamp);

  void set(int64_t blkid, int64_t len, int64_t gen_stamp, std::optional<Bytes> checksum);
  void set(int64_t blkid, int64_t len, int64_t gen_stamp);

  int64_t getBlockId() const { return block_id; }
  void setBlockId(int64_t bid) { block_id = bid; }

  // blk_<id>
  std::string getBlockName() const;

  int64_t getNumBytes() const { return num_bytes; }
  void setNumBytes(int64_t len) { num_bytes = len; }

  int64_t getGenerationStamp() const { return generation_stamp; }
  void setGenerationStamp(int64_t stamp) { generation_stamp = stamp; }

  // Checksum accessors copy; callers never share the stored buffer
  std::optional<Bytes> getChecksum() const { return checksum; }
  void setChecksum(std::optional<Bytes> value) { checksum = std::move(value); }
  // "nochecksum" leaves the current checksum untouched
  void setChecksum(const std::string& encoded);
  void setChecksumFromFile(const std::string& path);
  bool hasChecksum() const { return checksum.has_value(); }
  std::string getChecksumAsString() const;

  // blk_<id>_<genstamp>, plus --<checksum> when one is set
  std::string toString() const;
  // blk_<id>_<genstamp>--<checksum or nochecksum>
  void appendStringTo(std::ostream& os) const;

  // Full description: id, length, generation stamp, length-prefixed checksum.
  // All integers are big-endian. Returns bytes written.
  size_t serialize(char* buffer, size_t buffer_size, Logger* logger = nullptr) const;
  // Decode a full description into this block. Returns bytes consumed.
  // Throws CorruptBlockError on a negative length.
  size_t readFields(const char* buffer, size_t buffer_size, Logger* logger = nullptr);
  static Block deserialize(const char* buffer, size_t buffer_size, Logger* logger = nullptr);
  size_t serializedSize() const;

  // Identifier only: block id then generation stamp
  size_t writeId(char* buffer, size_t buffer_size) const;
  size_t readId(const char* buffer, size_t buffer_size);

  // Negative, zero or positive as this block's id is below, equal to or above b's
  int compareTo(const Block& b) const;

  bool operator==(const Block& other) const { return block_id == other.block_id; }
  bool operator!=(const Block& other) const { return block_id != other.block_id; }
  bool operator<(const Block& other) const { return block_id < other.block_id; }
  bool operator>(const Block& other) const { return block_id > other.block_id; }
  bool operator<=(const Block& other) const { return block_id <= other.block_id; }
  bool operator>=(const Block& other) const { return block_id >= other.block_id; }

  /**
   * Stricter match than operator==: block id and generation stamp must both
   * agree. Two null pointers match; a null and a non-null pointer do not.
   */
  static bool matchingIdAndGenStamp(const Block* a, const Block* b);

 private:
  int64_t block_id;
  int64_t num_bytes;
  int64_t generation_stamp;
  std::optional<Bytes> checksum;  // nullopt means "no checksum"
};

inline std::ostream& operator<<(std::ostream& os, const Block& block) {
  os << block.toString();
  return os;
}

namespace std {
template <>
struct hash<Block> {
  std::size_t operator()(const Block& b) const { return std::hash<int64_t>()(b.getBlockId()); }
};
}  // namespace std
