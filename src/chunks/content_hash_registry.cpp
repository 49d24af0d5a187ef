#include "chunks/content_hash_registry.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace sharedidx {

bool ContentHashRegistry::openIfAbsent(int chunkId, const Loader &loader) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (enumerators_.count(chunkId)) {
    return false;
  }
  auto table = std::make_unique<ContentHashEnumerator>(loader());
  Logger::getInstance().log(LogLevel::DEBUG, "hashes",
                            "Opened content hashes of chunk " +
                                std::to_string(chunkId) + " (" +
                                std::to_string(table->size()) + " entries)");
  enumerators_.emplace(chunkId, std::move(table));
  return true;
}

bool ContentHashRegistry::contains(int chunkId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enumerators_.count(chunkId) > 0;
}

size_t ContentHashRegistry::remove(const std::set<int> &chunkIds) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t closed = 0;
  for (int id : chunkIds) {
    auto it = enumerators_.find(id);
    if (it == enumerators_.end())
      continue;
    it->second->close();
    enumerators_.erase(it);
    ++closed;
    Logger::getInstance().log(LogLevel::DEBUG, "hashes",
                              "Closed content hashes of chunk " +
                                  std::to_string(id));
  }
  return closed;
}

void ContentHashRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : enumerators_) {
    kv.second->close();
  }
  enumerators_.clear();
}

std::vector<int> ContentHashRegistry::loadedChunkIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<int> ids;
  ids.reserve(enumerators_.size());
  for (const auto &kv : enumerators_)
    ids.push_back(kv.first);
  return ids;
}

int64_t
ContentHashRegistry::tryEnumerateContentHash(const ContentHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : enumerators_) {
    int localId = kv.second->tryEnumerate(hash);
    if (localId != 0) {
      MetricsRegistry::instance().incrementCounter(
          "sharedidx_content_hash_lookups_total", 1.0, {{"result", "hit"}});
      return makeHashId(kv.first, localId);
    }
  }
  MetricsRegistry::instance().incrementCounter(
      "sharedidx_content_hash_lookups_total", 1.0, {{"result", "miss"}});
  return kNullHashId;
}

} // namespace sharedidx
