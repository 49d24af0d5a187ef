#ifndef SHAREDIDX_CHUNK_DESCRIPTOR_HPP
#define SHAREDIDX_CHUNK_DESCRIPTOR_HPP

#include "index/index_registry.hpp"
#include "utilities/progress.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sharedidx {

/// A dependency unit of a project (module or library root).
struct OrderEntry {
  std::string name;

  bool operator==(const OrderEntry &other) const { return name == other.name; }
  bool operator<(const OrderEntry &other) const { return name < other.name; }
};

/**
 * @brief Host session that chunks are attached to.
 *
 * The name identifies the project in chunk reference sets. The root
 * modification count changes whenever the project's dependency roots do.
 */
class Project {
public:
  explicit Project(std::string name) : name_(std::move(name)) {}
  virtual ~Project() = default;

  const std::string &name() const { return name_; }

  virtual int64_t rootModificationCount() const { return modCount_; }
  virtual bool isDisposed() const { return disposed_; }

  void incrementRootModificationCount() { ++modCount_; }
  void dispose() { disposed_ = true; }

private:
  std::string name_;
  std::atomic<int64_t> modCount_{0};
  std::atomic<bool> disposed_{false};
};

/**
 * @brief A downloadable shared index chunk.
 *
 * Implementations are produced by a ChunkLocator.
 */
class ChunkDescriptor {
public:
  virtual ~ChunkDescriptor() = default;

  /// Stable identifier of the chunk, used as its archive directory name.
  virtual std::string uniqueId() const = 0;

  virtual InfrastructureVersion supportedInfrastructureVersion() const = 0;

  virtual std::vector<OrderEntry> orderEntries() const = 0;

  /**
   * @brief Write the chunk as an archive fragment to @p destination.
   *
   * Must call ProgressIndicator::checkCanceled() periodically.
   * @throws CancellationError if canceled, StorageError or any other
   *         std::exception on failure.
   */
  virtual void downloadChunk(const std::string &destination,
                             ProgressIndicator &progress) = 0;
};

using ChunkDescriptorPtr = std::shared_ptr<ChunkDescriptor>;

/// Source of chunk descriptors for a project's order entries.
class ChunkLocator {
public:
  virtual ~ChunkLocator() = default;

  virtual std::string name() const = 0;

  /// @throws any std::exception; the caller logs it and skips the locator.
  virtual std::vector<ChunkDescriptorPtr>
  locateIndex(const Project &project, const std::vector<OrderEntry> &entries,
              ProgressIndicator &progress) = 0;
};

using ChunkLocatorPtr = std::shared_ptr<ChunkLocator>;

} // namespace sharedidx

#endif // SHAREDIDX_CHUNK_DESCRIPTOR_HPP
