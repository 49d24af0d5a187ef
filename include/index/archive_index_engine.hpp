#ifndef SHAREDIDX_ARCHIVE_INDEX_ENGINE_HPP
#define SHAREDIDX_ARCHIVE_INDEX_ENGINE_HPP

#include "index/index_registry.hpp"
#include "utilities/digest.hpp"

#include <atomic>
#include <cstdint>

namespace sharedidx {

/**
 * @brief Index engine that serves the files of its index directory.
 *
 * Each file below the index directory is one key, its archive path relative
 * to the index directory; the file contents are the value. Empty chunks
 * expose no keys.
 */
class ArchiveIndexEngine : public IndexEngine {
public:
  ArchiveIndexEngine(const IndexChunkContext &context,
                     ContentHashRegistry &hashes);

  const std::string &indexName() const override { return context_.indexName; }
  std::vector<std::string> keys() const override;
  std::optional<std::vector<std::byte>>
  value(const std::string &key) const override;
  void close() override;
  bool isClosed() const override { return closed_; }

  /// Global content id of @p hash across every loaded chunk.
  int64_t contentIdOf(const ContentHash &hash) const;

  const IndexChunkContext &context() const { return context_; }

  static IndexEngineFactory factory();

private:
  void collectKeys(const std::string &dir, const std::string &relative,
                   std::vector<std::string> &out) const;

  IndexChunkContext context_;
  ContentHashRegistry &hashes_;
  std::atomic<bool> closed_{false};
};

} // namespace sharedidx

#endif // SHAREDIDX_ARCHIVE_INDEX_ENGINE_HPP
