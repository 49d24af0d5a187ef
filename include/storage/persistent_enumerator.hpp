#ifndef SHAREDIDX_PERSISTENT_ENUMERATOR_HPP
#define SHAREDIDX_PERSISTENT_ENUMERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sharedidx {

/**
 * @brief Record codec shared by every enumerator table.
 *
 * A table is an 8 byte magic followed by records `[u32 LE length][bytes]`.
 * The id of a value is its 1-based record ordinal.
 */
namespace enumerator_format {

inline constexpr size_t MAGIC_SIZE = 8;

void appendRecord(std::vector<std::byte> &out, const std::string &value);

/**
 * @brief Decode all complete records after the magic.
 * @param consumed Set to the byte offset just past the last complete record.
 * @throws StorageError if the magic does not match.
 */
std::vector<std::string> decodeRecords(const std::byte *data, size_t size,
                                       const char *magic, size_t &consumed);

} // namespace enumerator_format

/**
 * @brief Durable bidirectional mapping between strings and positive ids.
 *
 * Backs the chunk descriptor table: every chunk unique id is assigned an id
 * exactly once and keeps it across restarts. All methods are thread-safe.
 * I/O failures surface as StorageError.
 */
class PersistentStringEnumerator {
public:
  /**
   * @brief Open (or create) the table at @p path and load it.
   *
   * A torn trailing record left by a crash is dropped and the file is
   * truncated to the last complete record.
   */
  explicit PersistentStringEnumerator(const std::string &path);
  ~PersistentStringEnumerator();

  PersistentStringEnumerator(const PersistentStringEnumerator &) = delete;
  PersistentStringEnumerator &
  operator=(const PersistentStringEnumerator &) = delete;

  /// Existing id of @p value, or a newly assigned and persisted one.
  int enumerate(const std::string &value);

  /// Id of @p value or 0. Never mutates the table.
  int tryEnumerate(const std::string &value) const;

  std::optional<std::string> valueOf(int id) const;

  size_t size() const;

  /** Flush and release the file handle. Idempotent. */
  void close();
  bool isClosed() const;

  const std::string &path() const { return path_; }

  static const char MAGIC[enumerator_format::MAGIC_SIZE + 1];

private:
  void load();
  void ensureOpen() const;

  std::string path_;
  mutable std::mutex mutex_;
  std::fstream file_;
  bool closed_{false};
  std::unordered_map<std::string, int> ids_;
  std::vector<std::string> values_;
};

} // namespace sharedidx

#endif // SHAREDIDX_PERSISTENT_ENUMERATOR_HPP
