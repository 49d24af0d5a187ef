#ifndef SHAREDIDX_CONTENT_HASH_ENUMERATOR_HPP
#define SHAREDIDX_CONTENT_HASH_ENUMERATOR_HPP

#include "utilities/digest.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sharedidx {

/**
 * @brief Per-chunk table mapping file content hashes to local ids.
 *
 * A chunk ships its table as the `hashes` archive entry. Loaded tables are
 * read-only; a builder instance (default constructed) assigns ids with
 * enumerate() and produces the entry bytes with serialize().
 */
class ContentHashEnumerator {
public:
  /// Empty, writable table used to build a chunk's `hashes` entry.
  ContentHashEnumerator();

  /**
   * @brief Load a read-only table from the bytes of a `hashes` entry.
   * @throws StorageError on a bad header or a record of the wrong size.
   */
  static ContentHashEnumerator load(const std::vector<std::byte> &bytes);

  ContentHashEnumerator(ContentHashEnumerator &&other) noexcept;
  ContentHashEnumerator &operator=(ContentHashEnumerator &&other) noexcept;

  /// @throws std::logic_error on a read-only or closed table.
  int enumerate(const ContentHash &hash);

  /// Local id of @p hash or 0.
  int tryEnumerate(const ContentHash &hash) const;

  std::vector<std::byte> serialize() const;

  size_t size() const;
  bool isReadOnly() const { return readOnly_; }

  /** Release the table. Lookups on a closed table return 0. */
  void close();
  bool isClosed() const;

  static const char MAGIC[9];

private:
  mutable std::mutex mutex_;
  bool readOnly_{false};
  bool closed_{false};
  std::unordered_map<std::string, int> ids_;
  std::vector<std::string> hashes_;
};

} // namespace sharedidx

#endif // SHAREDIDX_CONTENT_HASH_ENUMERATOR_HPP
