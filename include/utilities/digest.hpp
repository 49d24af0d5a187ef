#ifndef SHAREDIDX_DIGEST_HPP
#define SHAREDIDX_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sharedidx {

/// SHA-256 digest size in bytes.
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// A file content hash as stored in a chunk's content hash table.
using ContentHash = DigestArray;

/// Lowercase hex rendering of a digest.
std::string digestToHex(const DigestArray &digest);

/**
 * @brief Parse a 64 character hex string.
 * @throws std::invalid_argument on bad length or characters.
 */
DigestArray digestFromHex(const std::string &hex);

/// SHA-256 of @p data.
DigestArray sha256Of(const std::vector<std::byte> &data);
DigestArray sha256Of(const std::string &data);

} // namespace sharedidx

#endif // SHAREDIDX_DIGEST_HPP
