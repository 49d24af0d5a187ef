#ifndef SHAREDIDX_BLOCKIO_HPP
#define SHAREDIDX_BLOCKIO_HPP

#include <array>
#include <cstddef>
#include <sodium.h>
#include <string>
#include <vector>
#include <zstd.h>

#include "utilities/digest.hpp"

struct DigestResult {
  sharedidx::DigestArray digest; // SHA-256 of the ingested bytes
  std::string hex;               // Lowercase hex form of digest
  std::vector<std::byte> raw;
};

/**
 * @brief Buffered block processing used for archive entries: SHA-256
 * integrity digests and optional zstd compression.
 */
class BlockIO {
public:
  /**
   * @brief Construct a new BlockIO processor.
   * @param compression_level Zstd compression level used by compress_data().
   * @throws std::runtime_error if libsodium cannot be initialized.
   */
  explicit BlockIO(int compression_level = 3);

  BlockIO(const BlockIO &) = delete;
  BlockIO &operator=(const BlockIO &) = delete;

  // Appends data to the internal buffer and the running digest.
  void ingest(const std::byte *data, size_t size);

  // Returns a copy of the concatenated plaintext data.
  std::vector<std::byte> finalize_raw() const;

  /**
   * @brief Finalize the digest.
   * @throws std::logic_error if called twice or after further ingest.
   */
  DigestResult finalize_hashed();

  std::vector<std::byte>
  compress_data(const std::vector<std::byte> &plaintext_data) const;

  /**
   * @brief Inverse of compress_data().
   * @param original_size Expected size; 0 reads it from the zstd frame.
   * @throws std::runtime_error on malformed input or size mismatch.
   */
  std::vector<std::byte>
  decompress_data(const std::vector<std::byte> &compressed_data,
                  size_t original_size) const;

  int compression_level() const { return compression_level_; }

private:
  std::vector<std::byte> buffer_;
  crypto_hash_sha256_state hash_state_;
  bool finalized_ = false;
  int compression_level_ = 3;
};

#endif // SHAREDIDX_BLOCKIO_HPP
