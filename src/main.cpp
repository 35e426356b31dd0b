#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "block.hpp"
#include "block_errors.hpp"
#include "block_filename.hpp"
#include "checksum.hpp"
#include "logger.hpp"

#define DEFAULT_STORAGE_DIR "."

// Relative operands are resolved against the storage directory
static std::string resolve(const std::string& storage_dir, const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  return storage_dir + "/" + path;
}

static void printHelp() {
  std::cout << "\n=== blocktool Commands ===\n\n";
  std::cout << "Naming:\n";
  std::cout << "  parse <filename>                 - Classify a block/meta file name\n";
  std::cout << "  meta2block <metapath>            - Block file path for a meta file\n";
  std::cout << "\nChecksums:\n";
  std::cout << "  checksum <file>                  - SHA-256 of a file (base64url)\n";
  std::cout << "  describe <blockfile> <len> <genstamp>\n";
  std::cout << "                                   - Build a block from a block file\n";
  std::cout << "\nCodec:\n";
  std::cout << "  write <id> <len> <genstamp> <datafile> <outfile>\n";
  std::cout << "                                   - Serialize a block description\n";
  std::cout << "  read <file>                      - Decode a serialized block description\n";
  std::cout << "  trace on|off                     - Log checksum fields on write/read\n";
  std::cout << "\nOther:\n";
  std::cout << "  help                             - Show this help message\n";
  std::cout << "  quit                             - Exit\n";
  std::cout << "\nExamples:\n";
  std::cout << "  parse blk_1073741825_1001.meta\n";
  std::cout << "  describe blk_1073741825 134217728 1001\n";
  std::cout << "  write 7 100 2 blk_7 blk_7.desc\n";
  std::cout << "\n";
}

static void parseName(const std::string& name) {
  std::cout << "  block file: " << (BlockFilename::isBlockFilename(name) ? "yes" : "no") << "\n";
  std::cout << "  meta file:  " << (BlockFilename::isMetaFilename(name) ? "yes" : "no") << "\n";
  auto id = BlockFilename::tryGetBlockId(name);
  if (id) {
    std::cout << "  block id:   " << *id << "\n";
  } else {
    std::cout << "  block id:   (no match)\n";
  }
  std::cout << "  genstamp:   " << BlockFilename::getGenerationStamp(name) << "\n";
}

static void skipBadInput(const char* usage) {
  std::cerr << "usage: " << usage << std::endl;
  std::cin.clear();
  std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

static void writeBlock(const Block& block, const std::string& out_path, Logger* trace) {
  std::vector<char> buffer(block.serializedSize());
  size_t written = block.serialize(buffer.data(), buffer.size(), trace);

  std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("Cannot open " + out_path + " for writing");
  out.write(buffer.data(), static_cast<std::streamsize>(written));
  if (!out) throw std::runtime_error("Failed writing " + out_path);
  std::cout << "[BLOCKTOOL] Wrote " << written << " bytes to " << out_path << std::endl;
}

static Block readBlock(const std::string& in_path, Logger* trace) {
  std::ifstream in(in_path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open " + in_path);
  std::vector<char> buffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return Block::deserialize(buffer.data(), buffer.size(), trace);
}

int main(int argc, char* argv[]) {
  if (argc > 2) {
    std::cerr << "usage: ./build/blocktool [storage_dir]" << std::endl;
    exit(1);
  }

  const std::string storage_dir = (argc == 2) ? argv[1] : DEFAULT_STORAGE_DIR;

  Logger logger{std::cout, "CODEC"};
  Logger* trace = nullptr;

  std::cout << "[BLOCKTOOL] Storage directory: " << storage_dir << std::endl;

  std::string input;
  while (std::cin >> input) {
    try {
      if (input == "help") {
        printHelp();
      } else if (input == "parse") {
        std::string name;
        std::cin >> name;
        parseName(name);
      } else if (input == "meta2block") {
        std::string meta_path;
        std::cin >> meta_path;
        std::cout << BlockFilename::metaToBlockFile(meta_path) << std::endl;
      } else if (input == "checksum") {
        std::string file;
        std::cin >> file;
        auto digest = Checksum::compute(resolve(storage_dir, file));
        std::cout << (digest ? Checksum::encode(*digest) : std::string(NO_CHECKSUM)) << std::endl;
      } else if (input == "describe") {
        std::string file;
        int64_t len = 0, gen_stamp = 0;
        if (!(std::cin >> file >> len >> gen_stamp)) {
          skipBadInput("describe <blockfile> <len> <genstamp>");
          continue;
        }
        Block block = Block::fromFile(resolve(storage_dir, file), len, gen_stamp);
        std::cout << block << " (" << block.getNumBytes() << " bytes)" << std::endl;
      } else if (input == "write") {
        int64_t id = 0, len = 0, gen_stamp = 0;
        std::string data_file, out_file;
        if (!(std::cin >> id >> len >> gen_stamp >> data_file >> out_file)) {
          skipBadInput("write <id> <len> <genstamp> <datafile> <outfile>");
          continue;
        }
        Block block(id, len, gen_stamp);
        block.setChecksumFromFile(resolve(storage_dir, data_file));
        writeBlock(block, resolve(storage_dir, out_file), trace);
      } else if (input == "read") {
        std::string file;
        std::cin >> file;
        Block block = readBlock(resolve(storage_dir, file), trace);
        block.appendStringTo(std::cout);
        std::cout << " (" << block.getNumBytes() << " bytes)" << std::endl;
      } else if (input == "trace") {
        std::string mode;
        std::cin >> mode;
        trace = (mode == "on") ? &logger : nullptr;
      } else if (input == "quit") {
        break;
      } else {
        std::cerr << "INVALID COMMAND" << std::endl;
      }
    } catch (const CorruptBlockError& e) {
      std::cerr << "[BLOCKTOOL] Corrupt block: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
      std::cerr << "[BLOCKTOOL] " << e.what() << std::endl;
    }
  }

  return 0;
}
