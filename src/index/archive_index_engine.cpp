#include "index/archive_index_engine.hpp"
#include "chunks/content_hash_registry.hpp"
#include "storage/chunk_archive.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace sharedidx {

ArchiveIndexEngine::ArchiveIndexEngine(const IndexChunkContext &context,
                                       ContentHashRegistry &hashes)
    : context_(context), hashes_(hashes) {
  if (!context_.archive) {
    throw std::invalid_argument("Index engine for " + context_.indexName +
                                " has no archive");
  }
}

void ArchiveIndexEngine::collectKeys(const std::string &dir,
                                     const std::string &relative,
                                     std::vector<std::string> &out) const {
  for (const auto &file : context_.archive->listFiles(dir)) {
    out.push_back(joinArchivePath(relative, file));
  }
  for (const auto &sub : context_.archive->listDirectories(dir)) {
    collectKeys(joinArchivePath(dir, sub), joinArchivePath(relative, sub), out);
  }
}

std::vector<std::string> ArchiveIndexEngine::keys() const {
  std::vector<std::string> out;
  if (closed_ || context_.empty) {
    return out;
  }
  collectKeys(context_.indexDir, "", out);
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<std::vector<std::byte>>
ArchiveIndexEngine::value(const std::string &key) const {
  if (closed_) {
    throw StorageError("Index " + context_.indexName + " of chunk " +
                       std::to_string(context_.chunkId) + " is closed");
  }
  if (context_.empty) {
    return std::nullopt;
  }
  return context_.archive->tryRead(joinArchivePath(context_.indexDir, key));
}

void ArchiveIndexEngine::close() { closed_ = true; }

int64_t ArchiveIndexEngine::contentIdOf(const ContentHash &hash) const {
  return hashes_.tryEnumerateContentHash(hash);
}

IndexEngineFactory ArchiveIndexEngine::factory() {
  return [](const IndexChunkContext &context, ContentHashRegistry &hashes) {
    return std::make_unique<ArchiveIndexEngine>(context, hashes);
  };
}

} // namespace sharedidx
