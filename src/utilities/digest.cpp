#include "utilities/digest.hpp"
#include "utilities/blockio.hpp"

#include <stdexcept>

namespace sharedidx {

std::string digestToHex(const DigestArray &digest) {
  static const char *kHex = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

DigestArray digestFromHex(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::invalid_argument("Hex digest must be " +
                                std::to_string(DIGEST_SIZE * 2) +
                                " characters long: " + hex);
  }
  DigestArray digest{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    int hi = hexValue(hex[i * 2]);
    int lo = hexValue(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Invalid hex digest: " + hex);
    }
    digest[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return digest;
}

DigestArray sha256Of(const std::vector<std::byte> &data) {
  BlockIO bio;
  bio.ingest(data.data(), data.size());
  return bio.finalize_hashed().digest;
}

DigestArray sha256Of(const std::string &data) {
  BlockIO bio;
  bio.ingest(reinterpret_cast<const std::byte *>(data.data()), data.size());
  return bio.finalize_hashed().digest;
}

} // namespace sharedidx
