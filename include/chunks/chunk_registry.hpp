#ifndef SHAREDIDX_CHUNK_REGISTRY_HPP
#define SHAREDIDX_CHUNK_REGISTRY_HPP

#include "chunks/shared_index_chunk.hpp"

#include <functional>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sharedidx {

/**
 * @brief In-memory catalog of attached chunks, index name -> chunk id ->
 * chunk.
 *
 * Also tracks which projects use each chunk id, so a chunk without any
 * index directory is still released when its last project closes.
 */
class ChunkRegistry {
public:
  struct DetachResult {
    std::vector<SharedIndexChunkPtr> removedChunks;
    std::set<int> orphanedChunkIds; ///< No project uses these ids any more
  };

  /**
   * @brief Insert @p chunks and attach @p project to them and to @p chunkId.
   *
   * A chunk whose (index, chunk id) pair is already present is not
   * replaced; the project is attached to the present one. Idempotent.
   * @return Number of chunks the project is attached to.
   */
  size_t attach(int chunkId, const std::vector<SharedIndexChunkPtr> &chunks,
                const std::string &project);

  /**
   * @brief Drop @p project from every chunk.
   *
   * Chunks left without projects are removed from the catalog; the caller
   * closes them.
   */
  DetachResult detachProject(const std::string &project);

  bool isAttached(int chunkId) const;
  std::vector<SharedIndexChunkPtr> chunksOf(int chunkId) const;

  /// Chunk of @p indexName in @p chunkId, null if absent.
  SharedIndexChunkPtr find(const std::string &indexName, int chunkId) const;

  /**
   * @brief Visit chunks of @p indexName in ascending chunk id order.
   *
   * Incompatible and closed chunks are skipped. Stops when @p visitor
   * returns false.
   * @return false if the visitor stopped the iteration.
   */
  bool forEachCompatible(
      const std::string &indexName,
      const std::function<bool(const SharedIndexChunkPtr &)> &visitor) const;

  std::vector<SharedIndexChunkPtr> all() const;
  std::set<int> attachedChunkIds() const;
  size_t size() const;

  /// Remove everything and return the removed chunks.
  std::vector<SharedIndexChunkPtr> clear();

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::map<int, SharedIndexChunkPtr>> chunks_;
  std::map<int, std::set<std::string>> chunkProjects_;
};

} // namespace sharedidx

#endif // SHAREDIDX_CHUNK_REGISTRY_HPP
