#ifndef SHAREDIDX_SHARED_INDEX_CHUNK_HPP
#define SHAREDIDX_SHARED_INDEX_CHUNK_HPP

#include "index/index_registry.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sharedidx {

/**
 * @brief The data of one index inside one downloaded chunk.
 *
 * Holds the set of projects it is attached to and owns the index engine.
 * The engine is closed together with the chunk.
 */
class SharedIndexChunk {
public:
  SharedIndexChunk(std::string chunkRoot, std::string indexName, int chunkId,
                   int64_t timestamp, bool empty, bool compatible,
                   std::unique_ptr<IndexEngine> engine);
  ~SharedIndexChunk();

  SharedIndexChunk(const SharedIndexChunk &) = delete;
  SharedIndexChunk &operator=(const SharedIndexChunk &) = delete;

  const std::string &chunkRoot() const { return chunkRoot_; }
  const std::string &indexName() const { return indexName_; }
  int chunkId() const { return chunkId_; }
  int64_t timestamp() const { return timestamp_; }
  bool isEmpty() const { return empty_; }

  /// False when the chunk was built with other base index versions.
  bool isCompatible() const { return compatible_; }

  IndexEngine *engine() const { return engine_.get(); }

  /// @return true if @p project was not attached yet.
  bool addProject(const std::string &project);

  /// @return true if the project set is empty afterwards.
  bool removeProject(const std::string &project);

  bool hasProject(const std::string &project) const;
  std::set<std::string> projects() const;

  /** Close the engine. Idempotent. */
  void close();
  bool isClosed() const;

private:
  std::string chunkRoot_;
  std::string indexName_;
  int chunkId_;
  int64_t timestamp_;
  bool empty_;
  bool compatible_;
  std::unique_ptr<IndexEngine> engine_;

  mutable std::mutex mutex_;
  std::set<std::string> projects_;
  bool closed_{false};
};

using SharedIndexChunkPtr = std::shared_ptr<SharedIndexChunk>;

} // namespace sharedidx

#endif // SHAREDIDX_SHARED_INDEX_CHUNK_HPP
