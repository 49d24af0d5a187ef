#include "chunks/chunk_registry.hpp"

#include <iterator>
#include <mutex>

namespace sharedidx {

size_t ChunkRegistry::attach(int chunkId,
                             const std::vector<SharedIndexChunkPtr> &chunks,
                             const std::string &project) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t bound = 0;
  for (const auto &chunk : chunks) {
    auto &byId = chunks_[chunk->indexName()];
    auto it = byId.find(chunk->chunkId());
    if (it == byId.end()) {
      it = byId.emplace(chunk->chunkId(), chunk).first;
    }
    it->second->addProject(project);
    ++bound;
  }
  chunkProjects_[chunkId].insert(project);
  return bound;
}

ChunkRegistry::DetachResult
ChunkRegistry::detachProject(const std::string &project) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  DetachResult result;

  for (auto outer = chunks_.begin(); outer != chunks_.end();) {
    auto &byId = outer->second;
    for (auto it = byId.begin(); it != byId.end();) {
      if (it->second->hasProject(project) &&
          it->second->removeProject(project)) {
        result.removedChunks.push_back(it->second);
        it = byId.erase(it);
      } else {
        ++it;
      }
    }
    outer = byId.empty() ? chunks_.erase(outer) : std::next(outer);
  }

  for (auto it = chunkProjects_.begin(); it != chunkProjects_.end();) {
    if (it->second.erase(project) && it->second.empty()) {
      result.orphanedChunkIds.insert(it->first);
      it = chunkProjects_.erase(it);
    } else {
      ++it;
    }
  }
  return result;
}

bool ChunkRegistry::isAttached(int chunkId) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chunkProjects_.count(chunkId) > 0;
}

std::vector<SharedIndexChunkPtr> ChunkRegistry::chunksOf(int chunkId) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<SharedIndexChunkPtr> out;
  for (const auto &outer : chunks_) {
    auto it = outer.second.find(chunkId);
    if (it != outer.second.end())
      out.push_back(it->second);
  }
  return out;
}

SharedIndexChunkPtr ChunkRegistry::find(const std::string &indexName,
                                        int chunkId) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto outer = chunks_.find(indexName);
  if (outer == chunks_.end())
    return nullptr;
  auto it = outer->second.find(chunkId);
  return it == outer->second.end() ? nullptr : it->second;
}

bool ChunkRegistry::forEachCompatible(
    const std::string &indexName,
    const std::function<bool(const SharedIndexChunkPtr &)> &visitor) const {
  std::vector<SharedIndexChunkPtr> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto outer = chunks_.find(indexName);
    if (outer == chunks_.end())
      return true;
    for (const auto &kv : outer->second) {
      if (kv.second->isCompatible())
        snapshot.push_back(kv.second);
    }
  }
  // Visit outside the lock; the visitor may call back into the registry.
  for (const auto &chunk : snapshot) {
    if (chunk->isClosed())
      continue;
    if (!visitor(chunk))
      return false;
  }
  return true;
}

std::vector<SharedIndexChunkPtr> ChunkRegistry::all() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<SharedIndexChunkPtr> out;
  for (const auto &outer : chunks_)
    for (const auto &kv : outer.second)
      out.push_back(kv.second);
  return out;
}

std::set<int> ChunkRegistry::attachedChunkIds() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::set<int> ids;
  for (const auto &kv : chunkProjects_)
    ids.insert(kv.first);
  return ids;
}

size_t ChunkRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  size_t n = 0;
  for (const auto &outer : chunks_)
    n += outer.second.size();
  return n;
}

std::vector<SharedIndexChunkPtr> ChunkRegistry::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<SharedIndexChunkPtr> out;
  for (const auto &outer : chunks_)
    for (const auto &kv : outer.second)
      out.push_back(kv.second);
  chunks_.clear();
  chunkProjects_.clear();
  return out;
}

} // namespace sharedidx
