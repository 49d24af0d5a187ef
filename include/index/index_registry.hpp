#ifndef SHAREDIDX_INDEX_REGISTRY_HPP
#define SHAREDIDX_INDEX_REGISTRY_HPP

#include "utilities/config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sharedidx {

class ArchiveFileSystem;
class ContentHashRegistry;

/**
 * Directory holding one subdirectory per stub index key inside a chunk. It
 * may also be registered as a file-based index of its own.
 */
inline constexpr const char *kStubUpdatingIndexName = "Stubs";

enum class IndexKind { FileBased, Stub };

/**
 * @brief Index algorithm versions a chunk was built with.
 *
 * Only the base indexes decide compatibility; file-based and stub index
 * versions are recorded for diagnostics.
 */
struct InfrastructureVersion {
  std::map<std::string, std::string> baseIndexes;
  std::map<std::string, std::string> fileBasedIndexes;
  std::map<std::string, std::string> stubIndexes;

  bool isCompatibleWith(const InfrastructureVersion &other) const {
    return baseIndexes == other.baseIndexes;
  }

  bool operator==(const InfrastructureVersion &other) const {
    return baseIndexes == other.baseIndexes &&
           fileBasedIndexes == other.fileBasedIndexes &&
           stubIndexes == other.stubIndexes;
  }

  /// "name:version,name:version" of the base indexes, for log messages.
  std::string describe() const;
};

/// Everything an index engine needs to open its data inside a chunk.
struct IndexChunkContext {
  const ArchiveFileSystem *archive{nullptr};
  std::string chunkRoot;  ///< Archive directory of the chunk, "<id>"
  std::string indexDir;   ///< Archive directory of this index in the chunk
  std::string indexName;
  int chunkId{0};
  int64_t timestamp{0};
  bool empty{false};
};

/**
 * @brief Queryable index data backed by one chunk.
 *
 * Engines are owned by their SharedIndexChunk and closed with it.
 */
class IndexEngine {
public:
  virtual ~IndexEngine() = default;

  virtual const std::string &indexName() const = 0;

  /// Keys stored for this index in the chunk, sorted.
  virtual std::vector<std::string> keys() const = 0;

  /// Value stored under @p key, nullopt if absent.
  virtual std::optional<std::vector<std::byte>>
  value(const std::string &key) const = 0;

  virtual void close() = 0;
  virtual bool isClosed() const = 0;
};

using IndexEngineFactory = std::function<std::unique_ptr<IndexEngine>(
    const IndexChunkContext &, ContentHashRegistry &)>;

/// Capability record of one index implementation.
struct IndexExtension {
  std::string name;
  IndexKind kind{IndexKind::FileBased};
  std::string version{"1"};
  bool baseIndex{false};
  IndexEngineFactory factory;
};

/**
 * @brief Index name to implementation lookup, filled at startup.
 *
 * Thread-safe. Registration looks names up here to decide which chunk
 * directories it understands.
 */
class IndexRegistry {
public:
  /**
   * @brief Add or replace an extension.
   * @throws std::invalid_argument on an empty name or a missing factory.
   */
  void registerExtension(IndexExtension extension);

  std::optional<IndexExtension> find(const std::string &name) const;
  bool isFileBasedIndex(const std::string &name) const;
  bool isStubIndex(const std::string &name) const;

  std::vector<IndexExtension> extensions() const;
  size_t size() const;

  /// Version built from every registered extension.
  InfrastructureVersion currentVersion() const;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, IndexExtension> extensions_;
};

/**
 * @brief Register every declared index backed by ArchiveIndexEngine.
 *
 * Unknown kinds are logged and skipped.
 */
void registerDeclaredIndexes(IndexRegistry &registry,
                             const std::vector<IndexDeclaration> &declarations);

} // namespace sharedidx

#endif // SHAREDIDX_INDEX_REGISTRY_HPP
