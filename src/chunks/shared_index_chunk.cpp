#include "chunks/shared_index_chunk.hpp"
#include "utilities/logger.h"

namespace sharedidx {

SharedIndexChunk::SharedIndexChunk(std::string chunkRoot, std::string indexName,
                                   int chunkId, int64_t timestamp, bool empty,
                                   bool compatible,
                                   std::unique_ptr<IndexEngine> engine)
    : chunkRoot_(std::move(chunkRoot)), indexName_(std::move(indexName)),
      chunkId_(chunkId), timestamp_(timestamp), empty_(empty),
      compatible_(compatible), engine_(std::move(engine)) {}

SharedIndexChunk::~SharedIndexChunk() { close(); }

bool SharedIndexChunk::addProject(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  return projects_.insert(project).second;
}

bool SharedIndexChunk::removeProject(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  projects_.erase(project);
  return projects_.empty();
}

bool SharedIndexChunk::hasProject(const std::string &project) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return projects_.count(project) > 0;
}

std::set<std::string> SharedIndexChunk::projects() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return projects_;
}

void SharedIndexChunk::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
    return;
  closed_ = true;
  if (engine_) {
    try {
      engine_->close();
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, "chunks",
                                "Failed to close " + indexName_ + " of chunk " +
                                    std::to_string(chunkId_) + ": " + e.what());
    }
  }
}

bool SharedIndexChunk::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace sharedidx
