#include "utilities/blockio.hpp"

#include <stdexcept>

BlockIO::BlockIO(int compression_level) : compression_level_(compression_level) {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&hash_state_);
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    buffer_.insert(buffer_.end(), data, data + size);
    crypto_hash_sha256_update(
        &hash_state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

std::vector<std::byte> BlockIO::finalize_raw() const { return buffer_; }

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }
  DigestResult result;
  crypto_hash_sha256_final(&hash_state_, result.digest.data());
  result.hex = sharedidx::digestToHex(result.digest);
  result.raw = buffer_;
  finalized_ = true;
  return result;
}

std::vector<std::byte>
BlockIO::compress_data(const std::vector<std::byte> &plaintext_data) const {
  if (plaintext_data.empty()) {
    return {};
  }

  size_t const cBuffSize = ZSTD_compressBound(plaintext_data.size());
  std::vector<std::byte> compressed_data(cBuffSize);

  size_t const cSize =
      ZSTD_compress(compressed_data.data(), cBuffSize, plaintext_data.data(),
                    plaintext_data.size(), compression_level_);
  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(cSize));
  }

  compressed_data.resize(cSize);
  return compressed_data;
}

std::vector<std::byte>
BlockIO::decompress_data(const std::vector<std::byte> &compressed_data,
                         size_t original_size) const {
  if (compressed_data.empty()) {
    return {};
  }
  unsigned long long const frameSize =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
    throw std::runtime_error("ZSTD_decompress failed: not a zstd frame");
  }
  if (original_size == 0) {
    if (frameSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throw std::runtime_error(
          "ZSTD_decompress failed: original size unknown");
    }
    original_size = static_cast<size_t>(frameSize);
    if (original_size == 0) {
      return {};
    }
  } else if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN &&
             frameSize != original_size) {
    // Frame header and stored size disagree.
    throw std::runtime_error("ZSTD_decompress failed: frame holds " +
                             std::to_string(frameSize) + " bytes, expected " +
                             std::to_string(original_size));
  }

  std::vector<std::byte> decompressed_data(original_size);
  size_t const dSize =
      ZSTD_decompress(decompressed_data.data(), original_size,
                      compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }
  if (dSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return decompressed_data;
}
