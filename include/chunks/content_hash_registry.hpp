#ifndef SHAREDIDX_CONTENT_HASH_REGISTRY_HPP
#define SHAREDIDX_CONTENT_HASH_REGISTRY_HPP

#include "storage/content_hash_enumerator.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace sharedidx {

/// Returned when no loaded chunk knows a content hash.
inline constexpr int64_t kNullHashId = 0;

/// Chunk id meaning "not a shared chunk".
inline constexpr int kNullIndexId = 0;

/// Global content id: chunk id in the high word, local id in the low word.
inline int64_t makeHashId(int chunkId, int localId) {
  return (static_cast<int64_t>(chunkId) << 32) |
         static_cast<int64_t>(static_cast<uint32_t>(localId));
}

inline int chunkIdOf(int64_t hashId) {
  return static_cast<int>(hashId >> 32);
}

inline int localIdOf(int64_t hashId) {
  return static_cast<int>(static_cast<uint32_t>(hashId & 0xffffffffLL));
}

/**
 * @brief Open content hash tables of every loaded chunk, keyed by chunk id.
 *
 * Lookups visit the tables in ascending chunk id order and the first chunk
 * that knows a hash wins. All methods take the registry lock.
 */
class ContentHashRegistry {
public:
  using Loader = std::function<ContentHashEnumerator()>;

  ContentHashRegistry() = default;
  ContentHashRegistry(const ContentHashRegistry &) = delete;
  ContentHashRegistry &operator=(const ContentHashRegistry &) = delete;

  /**
   * @brief Open the table of @p chunkId with @p loader unless already open.
   * @return true if the table was opened by this call.
   * Exceptions from @p loader propagate and leave the registry unchanged.
   */
  bool openIfAbsent(int chunkId, const Loader &loader);

  bool contains(int chunkId) const;

  /// Close and drop the tables of @p chunkIds. Returns how many were open.
  size_t remove(const std::set<int> &chunkIds);

  /// Close every table.
  void clear();

  std::vector<int> loadedChunkIds() const;

  /// Global id of @p hash, or kNullHashId.
  int64_t tryEnumerateContentHash(const ContentHash &hash) const;

private:
  mutable std::mutex mutex_;
  std::map<int, std::unique_ptr<ContentHashEnumerator>> enumerators_;
};

} // namespace sharedidx

#endif // SHAREDIDX_CONTENT_HASH_REGISTRY_HPP
