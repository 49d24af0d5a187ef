#ifndef SHAREDIDX_SHARED_INDEX_CHUNK_CONFIGURATION_HPP
#define SHAREDIDX_SHARED_INDEX_CHUNK_CONFIGURATION_HPP

#include "chunks/chunk_descriptor.hpp"
#include "chunks/chunk_registry.hpp"
#include "chunks/content_hash_registry.hpp"
#include "index/index_registry.hpp"
#include "storage/chunk_archive.hpp"
#include "storage/persistent_enumerator.hpp"
#include "utilities/config.hpp"
#include "utilities/sequential_executor.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sharedidx {

/**
 * @brief Shared index chunk cache of one configuration root.
 *
 * Downloads chunks through the registered locators, appends them to the
 * shared archive, registers the indexes each chunk carries and attaches
 * them to projects. Archive mutations run on a single sequential worker.
 * Lookups (processChunks, getChunk, tryEnumerateContentHash) may be called
 * from any thread.
 */
class SharedIndexChunkConfiguration {
public:
  /**
   * @brief Open (or create) the descriptor enumerator and the archive under
   * options.rootDir.
   * @throws StorageError if either cannot be opened.
   */
  SharedIndexChunkConfiguration(const StorageOptions &options,
                                std::shared_ptr<IndexRegistry> indexes);
  ~SharedIndexChunkConfiguration();

  SharedIndexChunkConfiguration(const SharedIndexChunkConfiguration &) = delete;
  SharedIndexChunkConfiguration &
  operator=(const SharedIndexChunkConfiguration &) = delete;

  void addLocator(ChunkLocatorPtr locator);
  std::vector<ChunkLocatorPtr> locators() const;

  /**
   * @brief Download and append @p descriptor on the worker.
   *
   * The future completes once the chunk is in the archive, or the load was
   * skipped or failed (failures are logged). It holds a CancellationError
   * if @p progress was canceled.
   * @throws std::logic_error after dispose().
   */
  std::shared_future<void>
  preloadIndex(ChunkDescriptorPtr descriptor,
               std::shared_ptr<ProgressIndicator> progress);

  /**
   * @brief Synchronous body of preloadIndex.
   *
   * Stores @p version with the chunk. Does nothing if the descriptor is
   * already registered.
   * @throws CancellationError only; every other failure is logged.
   */
  void loadSharedIndex(ChunkDescriptor &descriptor, ProgressIndicator &progress,
                       const InfrastructureVersion &version);

  /**
   * @brief Ask every locator for chunks covering @p entries, load the
   * supported ones and attach all of them to @p project.
   *
   * Skipped when the project is disposed or its root modification count is
   * unchanged since the last completed call. A project disposed while the
   * lookup runs stops it before the next descriptor, without a stamp.
   * A descriptor that fails to load or attach does not stop the others.
   * @throws std::logic_error after dispose().
   */
  std::shared_future<void>
  locateIndexes(std::shared_ptr<Project> project, std::vector<OrderEntry> entries,
                std::shared_ptr<ProgressIndicator> progress);

  /**
   * @brief Attach the registered chunk @p chunkId to @p project.
   *
   * kNullIndexId is accepted and returns true. A failed registration
   * leaves nothing attached and no content hash table open.
   * @return true if at least one index chunk was bound; false on failure.
   * @throws CancellationError only; every other failure is logged.
   */
  bool attachExistingChunk(int chunkId, const Project &project);

  /// Register @p descriptor if needed and attach it to @p project.
  bool attachChunk(const ChunkDescriptor &descriptor, const Project &project);

  /**
   * @brief Build the index chunks of a chunk present in the archive.
   *
   * The returned chunks are not attached to any project.
   * @throws StorageError if the chunk is not in the archive.
   * @throws CorruptedIndexError on a bad timestamp or version entry.
   */
  std::vector<SharedIndexChunkPtr> registerChunk(const ChunkDescriptor &descriptor);
  std::vector<SharedIndexChunkPtr> registerChunk(int chunkId);

  /// Detach @p project everywhere and release what it alone used.
  void projectClosed(const Project &project);
  void projectClosed(const std::string &projectName);

  /**
   * @brief Visit the compatible chunks of @p indexName.
   *
   * Chunks are visited outside the registry lock and closed chunks are
   * skipped. A chunk closed by a concurrent projectClosed after it was
   * handed to @p processor makes its engine throw StorageError.
   * @return false if @p processor returned false.
   */
  bool processChunks(
      const std::string &indexName,
      const std::function<bool(const SharedIndexChunkPtr &)> &processor) const;

  /// Engine of @p indexName in @p chunkId, null if absent or incompatible.
  IndexEngine *getChunk(const std::string &indexName, int chunkId) const;

  int64_t tryEnumerateContentHash(const ContentHash &hash) const;

  /// Id of @p uniqueId in the descriptor enumerator, 0 if unknown.
  int chunkIdOf(const std::string &uniqueId) const;

  /// Every (id, unique id) pair in the descriptor enumerator.
  std::vector<std::pair<int, std::string>> registeredChunks() const;

  /**
   * @brief Stop the worker and release the archive and the enumerator.
   *
   * Runs once; later calls do nothing. Failures are logged.
   */
  void dispose();
  bool isDisposed() const { return disposed_; }

  const StorageOptions &options() const { return options_; }
  const ChunkRegistry &chunkRegistry() const { return chunks_; }
  const ContentHashRegistry &contentHashes() const { return hashes_; }
  const ArchiveFileSystem &readView() const { return *readView_; }
  const IndexRegistry &indexRegistry() const { return *indexes_; }
  bool hasStructureStamp(const std::string &projectName) const;

private:
  std::vector<SharedIndexChunkPtr> doRegister(int chunkId);
  void buildIndexChunks(int chunkId, const std::string &chunkRoot,
                        int64_t timestamp, bool compatible,
                        std::vector<SharedIndexChunkPtr> &result);
  bool bind(int chunkId, const std::vector<SharedIndexChunkPtr> &chunks,
            const Project &project);
  int64_t timestampOf(int chunkId, const std::string &chunkRoot);
  void appendChunk(const std::string &uniqueId, const std::string &fragment,
                   const InfrastructureVersion &version);
  void removeTempChunk(const std::string &path);
  void publishLoadedChunks();

  StorageOptions options_;
  std::shared_ptr<IndexRegistry> indexes_;
  std::unique_ptr<PersistentStringEnumerator> descriptors_;
  std::unique_ptr<ArchiveFileSystem> readView_;
  std::unique_ptr<SequentialExecutor> executor_;

  ChunkRegistry chunks_;
  ContentHashRegistry hashes_;

  // Serializes registration, attach and detach.
  std::mutex registrationMutex_;
  // Serializes appends to the archive.
  std::mutex storageMutex_;

  mutable std::mutex timestampMutex_;
  std::map<int, int64_t> timestamps_;

  mutable std::mutex stampMutex_;
  std::map<std::string, int64_t> structureStamps_;

  mutable std::mutex locatorMutex_;
  std::vector<ChunkLocatorPtr> locators_;

  std::atomic<bool> disposed_{false};
};

} // namespace sharedidx

#endif // SHAREDIDX_SHARED_INDEX_CHUNK_CONFIGURATION_HPP
