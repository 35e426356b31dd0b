#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <sstream>
#include <unordered_set>
#include <vector>

#include "block.hpp"

TEST_CASE("Block constructors") {
  Block empty;
  REQUIRE(empty.getBlockId() == 0);
  REQUIRE(empty.getNumBytes() == 0);
  REQUIRE(empty.getGenerationStamp() == 0);
  REQUIRE_FALSE(empty.hasChecksum());

  Block id_only(42);
  REQUIRE(id_only.getBlockId() == 42);
  REQUIRE(id_only.getNumBytes() == 0);
  REQUIRE(id_only.getGenerationStamp() == GRANDFATHER_GENERATION_STAMP);

  Block full(1, 2, 3, std::vector<uint8_t>{9, 8, 7});
  Block copy(full);
  REQUIRE(copy.getBlockId() == 1);
  REQUIRE(copy.getNumBytes() == 2);
  REQUIRE(copy.getGenerationStamp() == 3);
  REQUIRE(copy.getChecksum() == full.getChecksum());
}

TEST_CASE("Block set replaces every field") {
  Block block(1, 2, 3, std::vector<uint8_t>{1});
  block.set(10, 20, 30);
  REQUIRE(block.getBlockId() == 10);
  REQUIRE(block.getNumBytes() == 20);
  REQUIRE(block.getGenerationStamp() == 30);
  REQUIRE_FALSE(block.hasChecksum());

  block.set(11, 21, 31, std::vector<uint8_t>{4, 5});
  REQUIRE(block.getChecksum() == (std::vector<uint8_t>{4, 5}));

  block.setBlockId(-7);
  block.setNumBytes(512);
  block.setGenerationStamp(1001);
  REQUIRE(block.getBlockId() == -7);
  REQUIRE(block.getNumBytes() == 512);
  REQUIRE(block.getGenerationStamp() == 1001);
}

TEST_CASE("Checksum is copied in and out") {
  std::vector<uint8_t> digest = {1, 2, 3};
  Block block(1, 0, 0, digest);

  digest[0] = 99;
  REQUIRE(block.getChecksum()->at(0) == 1);

  auto out = block.getChecksum();
  (*out)[1] = 99;
  REQUIRE(block.getChecksum()->at(1) == 2);

  Block copy(block);
  copy.setChecksum(std::vector<uint8_t>{7});
  REQUIRE(block.getChecksum() == (std::vector<uint8_t>{1, 2, 3}));
}

TEST_CASE("Block equality and hashing use only the block id") {
  Block a(5, 100, 1, std::vector<uint8_t>{1});
  Block b(5, 200, 2);
  Block c(6, 100, 1, std::vector<uint8_t>{1});

  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(std::hash<Block>()(a) == std::hash<Block>()(b));

  std::unordered_set<Block> blocks = {a, b, c};
  REQUIRE(blocks.size() == 2);
  REQUIRE(blocks.count(Block(6)) == 1);
}

TEST_CASE("Block ordering uses only the block id") {
  Block low(-3, 0, 99);
  Block mid(0, 0, 1);
  Block high(8, 0, 0);

  REQUIRE(low.compareTo(mid) < 0);
  REQUIRE(high.compareTo(mid) > 0);
  REQUIRE(mid.compareTo(Block(0, 5, 7)) == 0);
  REQUIRE(low < mid);
  REQUIRE(high > mid);
  REQUIRE(mid <= Block(0, 1, 2));
  REQUIRE(mid >= Block(0, 1, 2));

  std::vector<Block> blocks = {high, low, mid};
  std::sort(blocks.begin(), blocks.end());
  REQUIRE(blocks[0].getBlockId() == -3);
  REQUIRE(blocks[1].getBlockId() == 0);
  REQUIRE(blocks[2].getBlockId() == 8);

  std::map<Block, int> by_block;
  by_block[Block(1, 0, 1)] = 1;
  by_block[Block(1, 0, 2)] = 2;
  REQUIRE(by_block.size() == 1);
  REQUIRE(by_block.begin()->second == 2);
}

TEST_CASE("matchingIdAndGenStamp compares id and generation stamp") {
  Block a(5, 100, 1);
  Block same(5, 999, 1);
  Block newer(5, 100, 2);
  Block other(6, 100, 1);

  REQUIRE(Block::matchingIdAndGenStamp(nullptr, nullptr));
  REQUIRE_FALSE(Block::matchingIdAndGenStamp(&a, nullptr));
  REQUIRE_FALSE(Block::matchingIdAndGenStamp(nullptr, &a));
  REQUIRE(Block::matchingIdAndGenStamp(&a, &a));
  REQUIRE(Block::matchingIdAndGenStamp(&a, &same));
  REQUIRE_FALSE(Block::matchingIdAndGenStamp(&a, &newer));
  REQUIRE_FALSE(Block::matchingIdAndGenStamp(&a, &other));
  REQUIRE(a == newer);
}

TEST_CASE("Block names and string forms") {
  Block block(1073741825, 134217728, 1001);
  REQUIRE(block.getBlockName() == "blk_1073741825");
  REQUIRE(block.toString() == "blk_1073741825_1001");

  std::ostringstream plain;
  block.appendStringTo(plain);
  REQUIRE(plain.str() == "blk_1073741825_1001--nochecksum");

  block.setChecksum(std::vector<uint8_t>{0xFB, 0xFF, 0xFE});
  REQUIRE(block.toString() == "blk_1073741825_1001---__-");

  std::ostringstream streamed;
  streamed << block;
  REQUIRE(streamed.str() == block.toString());

  REQUIRE(Block(-5).getBlockName() == "blk_-5");
}

TEST_CASE("Checksum text form") {
  Block block(7, 100, 2);
  REQUIRE(block.getChecksumAsString() == NO_CHECKSUM);

  block.setChecksum(std::string("ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0"));
  REQUIRE(block.getChecksum()->size() == CHECKSUM_LENGTH);
  REQUIRE(block.getChecksum()->at(0) == 0xBA);
  REQUIRE(block.getChecksumAsString() == "ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0");

  block.setChecksum(std::string(NO_CHECKSUM));
  REQUIRE(block.getChecksumAsString() == "ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0");

  block.setChecksum(std::nullopt);
  REQUIRE(block.getChecksumAsString() == NO_CHECKSUM);

  Block fresh(8);
  fresh.setChecksum(std::string(NO_CHECKSUM));
  REQUIRE_FALSE(fresh.hasChecksum());
}
