#include "block.hpp"

#include <sstream>

#include "block_filename.hpp"
#include "checksum.hpp"

Block::Block(int64_t blkid, int64_t len, int64_t gen_stamp) {
  set(blkid, len, gen_stamp, std::nullopt);
}

Block::Block(int64_t blkid, int64_t len, int64_t gen_stamp, std::optional<Bytes> checksum) {
  set(blkid, len, gen_stamp, std::move(checksum));
}

Block::Block(int64_t blkid) : Block(blkid, 0, GRANDFATHER_GENERATION_STAMP) {}

Block Block::fromFile(const std::string& path, int64_t len, int64_t gen_stamp) {
  return Block(BlockFilename::filename2id(BlockFilename::baseName(path)), len, gen_stamp,
               Checksum::compute(path));
}

void Block::set(int64_t blkid, int64_t len, int64_t gen_stamp, std::optional<Bytes> checksum) {
  block_id = blkid;
  num_bytes = len;
  generation_stamp = gen_stamp;
  this->checksum = std::move(checksum);
}

void Block::set(int64_t blkid, int64_t len, int64_t gen_stamp) {
  set(blkid, len, gen_stamp, std::nullopt);
}

std::string Block::getBlockName() const { return BLOCK_FILE_PREFIX + std::to_string(block_id); }

void Block::setChecksum(const std::string& encoded) {
  if (encoded == NO_CHECKSUM) return;
  checksum = Checksum::decode(encoded);
}

void Block::setChecksumFromFile(const std::string& path) { checksum = Checksum::compute(path); }

std::string Block::getChecksumAsString() const {
  return checksum ? Checksum::encode(*checksum) : std::string(NO_CHECKSUM);
}

std::string Block::toString() const {
  std::ostringstream ss;
  ss << BLOCK_FILE_PREFIX << block_id << '_' << generation_stamp;
  if (checksum) ss << "--" << getChecksumAsString();
  return ss.str();
}

void Block::appendStringTo(std::ostream& os) const {
  os << BLOCK_FILE_PREFIX << block_id << '_' << generation_stamp << "--" << getChecksumAsString();
}

int Block::compareTo(const Block& b) const {
  if (block_id < b.block_id) return -1;
  if (block_id > b.block_id) return 1;
  return 0;
}

bool Block::matchingIdAndGenStamp(const Block* a, const Block* b) {
  if (a == b) return true;
  if (a == nullptr || b == nullptr) return false;
  return a->block_id == b->block_id && a->generation_stamp == b->generation_stamp;
}
