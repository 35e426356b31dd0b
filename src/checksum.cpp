#include "checksum.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>

#include "block_errors.hpp"

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::optional<std::vector<uint8_t>> Checksum::compute(const std::string& path) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw DigestUnavailableError("cannot compute SHA256: no digest context");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    throw DigestUnavailableError("cannot compute SHA256");

  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  std::vector<char> buffer(READ_CHUNK_SIZE);
  while (in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize count = in.gcount();
    if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1)
      return std::nullopt;
  }
  // eof is the only acceptable way out of the loop
  if (in.bad() || !in.eof()) return std::nullopt;

  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) return std::nullopt;
  digest.resize(digest_len);
  return digest;
}

std::string Checksum::encode(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) return "";

  // EVP_EncodeBlock writes the standard alphabet with '=' padding and a NUL
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                                static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));

  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

std::vector<uint8_t> Checksum::decode(const std::string& text) {
  if (text.empty()) return {};
  if (text.size() % 4 == 1) throw ChecksumFormatError("Invalid checksum length: " + text);

  std::string standard = text;
  for (char& c : standard) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '+' || c == '/' || c == '=')
      throw ChecksumFormatError("Invalid checksum character in: " + text);
  }
  size_t padding = (4 - standard.size() % 4) % 4;
  standard.append(padding, '=');

  std::vector<uint8_t> out(3 * (standard.size() / 4));
  int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                static_cast<int>(standard.size()));
  if (decoded < 0) throw ChecksumFormatError("Invalid checksum encoding: " + text);

  // EVP_DecodeBlock counts padding positions as zero bytes
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}
