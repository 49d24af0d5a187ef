#include "chunks/shared_index_chunk_configuration.hpp"
#include "storage/chunk_metadata.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sharedidx {

namespace {

void logInfo(const std::string &msg) {
  Logger::getInstance().log(LogLevel::INFO, "shared-index", msg);
}

void logError(const std::string &msg) {
  Logger::getInstance().log(LogLevel::ERROR, "shared-index", msg);
}

} // namespace

SharedIndexChunkConfiguration::SharedIndexChunkConfiguration(
    const StorageOptions &options, std::shared_ptr<IndexRegistry> indexes)
    : options_(options), indexes_(std::move(indexes)) {
  if (!indexes_) {
    throw std::invalid_argument("SharedIndexChunkConfiguration needs an index "
                                "registry");
  }
  std::error_code ec;
  fs::create_directories(options_.rootDir, ec);
  if (ec) {
    throw StorageError("Cannot create " + options_.rootDir + ": " +
                       ec.message());
  }

  descriptors_ = std::make_unique<PersistentStringEnumerator>(
      descriptorsPath(options_.rootDir));
  readView_ =
      std::make_unique<ArchiveFileSystem>(chunkStoragePath(options_.rootDir));
  executor_ = std::make_unique<SequentialExecutor>(
      "shared-index-loader", options_.sameThreadExecutor
                                 ? SequentialExecutor::Mode::SameThread
                                 : SequentialExecutor::Mode::Background);

  MetricsRegistry::instance().setGauge(
      "sharedidx_registered_chunks", static_cast<double>(descriptors_->size()));
  logInfo("Shared index storage at " + options_.rootDir + ": " +
          std::to_string(descriptors_->size()) + " known chunk(s), " +
          std::to_string(readView_->entryCount()) + " archive record(s)");
}

SharedIndexChunkConfiguration::~SharedIndexChunkConfiguration() { dispose(); }

void SharedIndexChunkConfiguration::addLocator(ChunkLocatorPtr locator) {
  std::lock_guard<std::mutex> lock(locatorMutex_);
  locators_.push_back(std::move(locator));
}

std::vector<ChunkLocatorPtr> SharedIndexChunkConfiguration::locators() const {
  std::lock_guard<std::mutex> lock(locatorMutex_);
  return locators_;
}

// ---------------------------------------------------------------------------
// Loading

std::shared_future<void> SharedIndexChunkConfiguration::preloadIndex(
    ChunkDescriptorPtr descriptor, std::shared_ptr<ProgressIndicator> progress) {
  auto promise = std::make_shared<std::promise<void>>();
  std::shared_future<void> future = promise->get_future().share();
  InfrastructureVersion version = indexes_->currentVersion();

  executor_->execute([this, promise, descriptor, progress, version]() {
    try {
      loadSharedIndex(*descriptor, *progress, version);
      promise->set_value();
    } catch (const std::exception &) {
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

void SharedIndexChunkConfiguration::loadSharedIndex(
    ChunkDescriptor &descriptor, ProgressIndicator &progress,
    const InfrastructureVersion &version) {
  const std::string id = descriptor.uniqueId();
  if (descriptors_->tryEnumerate(id) != kNullIndexId) {
    Logger::getInstance().log(LogLevel::DEBUG, "shared-index",
                              "Chunk " + id + " already registered");
    return;
  }
  if (readView_->isDirectory(id)) {
    // Appended earlier but not attached yet; registration picks it up.
    Logger::getInstance().log(LogLevel::DEBUG, "shared-index",
                              "Chunk " + id + " already in the archive");
    return;
  }

  const std::string tempChunk = tempChunkPath(options_.rootDir, id);
  auto &metrics = MetricsRegistry::instance();
  auto started = std::chrono::steady_clock::now();
  try {
    progress.checkCanceled();
    descriptor.downloadChunk(tempChunk, progress);
    progress.checkCanceled();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    metrics.observe("sharedidx_chunk_download_ms",
                    static_cast<double>(elapsed.count()));

    appendChunk(id, tempChunk, version);
    metrics.incrementCounter("sharedidx_chunks_downloaded_total");
    logInfo("Shared index " + id + " downloaded in " +
            std::to_string(elapsed.count()) + " ms");
  } catch (const CancellationError &) {
    removeTempChunk(tempChunk);
    Logger::getInstance().log(LogLevel::INFO, "shared-index",
                              "Loading of " + id + " canceled");
    throw;
  } catch (const std::exception &e) {
    metrics.incrementCounter("sharedidx_chunk_download_failures_total");
    logError("Failed to load shared index " + id + ": " + e.what());
  }
  removeTempChunk(tempChunk);
}

void SharedIndexChunkConfiguration::appendChunk(
    const std::string &uniqueId, const std::string &fragment,
    const InfrastructureVersion &version) {
  std::vector<PendingEntry> extra;
  extra.push_back(PendingEntry{kTimestampEntry,
                               timestampEntry(currentTimeMillis()), true});
  extra.push_back(PendingEntry{kInfrastructureVersionEntry,
                               infrastructureVersionEntry(version), false});

  std::lock_guard<std::mutex> lock(storageMutex_);
  ChunkArchiveAppender appender(readView_->archivePath());
  size_t records = appender.appendFragment(fragment, uniqueId, extra);
  readView_->sync();
  Logger::getInstance().log(LogLevel::DEBUG, "shared-index",
                            "Appended " + std::to_string(records) +
                                " record(s) of " + uniqueId);
}

void SharedIndexChunkConfiguration::removeTempChunk(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN, "shared-index",
                              "Cannot delete " + path + ": " + ec.message());
  }
}

std::shared_future<void> SharedIndexChunkConfiguration::locateIndexes(
    std::shared_ptr<Project> project, std::vector<OrderEntry> entries,
    std::shared_ptr<ProgressIndicator> progress) {
  auto promise = std::make_shared<std::promise<void>>();
  std::shared_future<void> future = promise->get_future().share();

  executor_->execute([this, promise, project, entries, progress]() {
    try {
      if (project->isDisposed()) {
        promise->set_value();
        return;
      }
      const int64_t stamp = project->rootModificationCount();
      {
        std::lock_guard<std::mutex> lock(stampMutex_);
        auto it = structureStamps_.find(project->name());
        if (it != structureStamps_.end() && it->second == stamp) {
          promise->set_value();
          return;
        }
      }

      const InfrastructureVersion ideVersion = indexes_->currentVersion();
      for (const auto &locator : locators()) {
        std::vector<ChunkDescriptorPtr> descriptors;
        try {
          descriptors = locator->locateIndex(*project, entries, *progress);
        } catch (const CancellationError &) {
          throw;
        } catch (const std::exception &e) {
          logError("Locator " + locator->name() + " failed for " +
                   project->name() + ": " + e.what());
          continue;
        }

        for (const auto &descriptor : descriptors) {
          progress->checkCanceled();
          if (project->isDisposed()) {
            logInfo("Project " + project->name() +
                    " was closed, stopping shared index lookup");
            promise->set_value();
            return;
          }
          InfrastructureVersion chunkVersion =
              descriptor->supportedInfrastructureVersion();
          if (chunkVersion.isCompatibleWith(ideVersion)) {
            logInfo("Shared index " + descriptor->uniqueId() +
                    " is supported, loading");
            loadSharedIndex(*descriptor, *progress, ideVersion);
          } else {
            logInfo("Shared index " + descriptor->uniqueId() +
                    " is unsupported: built with " + chunkVersion.describe() +
                    ", current " + ideVersion.describe());
          }
          attachChunk(*descriptor, *project);
        }
      }

      std::lock_guard<std::mutex> lock(stampMutex_);
      structureStamps_[project->name()] = stamp;
      promise->set_value();
    } catch (const std::exception &) {
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

// ---------------------------------------------------------------------------
// Registration

int64_t SharedIndexChunkConfiguration::timestampOf(int chunkId,
                                                   const std::string &chunkRoot) {
  std::lock_guard<std::mutex> lock(timestampMutex_);
  auto it = timestamps_.find(chunkId);
  if (it != timestamps_.end()) {
    return it->second;
  }
  int64_t timestamp = readTimestamp(*readView_, chunkRoot);
  if (timestamp <= 0) {
    throw CorruptedIndexError("Corrupted shared index " + chunkRoot +
                              ": missing or invalid timestamp");
  }
  timestamps_.emplace(chunkId, timestamp);
  return timestamp;
}

std::vector<SharedIndexChunkPtr>
SharedIndexChunkConfiguration::registerChunk(const ChunkDescriptor &descriptor) {
  const std::string id = descriptor.uniqueId();
  if (!readView_->isDirectory(id)) {
    throw StorageError("Chunk " + id + " is not present in " +
                       readView_->archivePath());
  }
  int chunkId = descriptors_->enumerate(id);
  if (chunkId == kNullIndexId) {
    throw CorruptedIndexError("Chunk " + id + " could not be enumerated");
  }
  MetricsRegistry::instance().setGauge(
      "sharedidx_registered_chunks", static_cast<double>(descriptors_->size()));
  std::lock_guard<std::mutex> lock(registrationMutex_);
  return doRegister(chunkId);
}

std::vector<SharedIndexChunkPtr>
SharedIndexChunkConfiguration::registerChunk(int chunkId) {
  std::lock_guard<std::mutex> lock(registrationMutex_);
  return doRegister(chunkId);
}

std::vector<SharedIndexChunkPtr>
SharedIndexChunkConfiguration::doRegister(int chunkId) {
  std::optional<std::string> rootName = descriptors_->valueOf(chunkId);
  if (!rootName) {
    throw CorruptedIndexError("No chunk with id " + std::to_string(chunkId));
  }
  const std::string &chunkRoot = *rootName;
  if (!readView_->isDirectory(chunkRoot)) {
    throw StorageError("Chunk " + chunkRoot + " is not present in " +
                       readView_->archivePath());
  }

  const int64_t timestamp = timestampOf(chunkId, chunkRoot);
  std::optional<InfrastructureVersion> stored =
      readInfrastructureVersion(*readView_, chunkRoot);
  const bool compatible =
      !stored || stored->isCompatibleWith(indexes_->currentVersion());

  const bool openedHashes = hashes_.openIfAbsent(chunkId, [this, &chunkRoot]() {
    auto data = readView_->tryRead(joinArchivePath(chunkRoot, kHashesEntry));
    if (!data) {
      Logger::getInstance().log(LogLevel::WARN, "shared-index",
                                "Chunk " + chunkRoot +
                                    " has no content hashes");
      return ContentHashEnumerator();
    }
    return ContentHashEnumerator::load(*data);
  });

  std::vector<SharedIndexChunkPtr> result;
  try {
    buildIndexChunks(chunkId, chunkRoot, timestamp, compatible, result);
  } catch (const std::exception &) {
    // A half-registered chunk must not stay visible to content hash lookups.
    for (const auto &chunk : result) {
      chunk->close();
    }
    if (openedHashes) {
      hashes_.remove({chunkId});
    }
    throw;
  }

  Logger::getInstance().log(
      LogLevel::DEBUG, "shared-index",
      "Registered " + std::to_string(result.size()) + " index chunk(s) of " +
          chunkRoot + (compatible ? "" : " (unsupported version)"));
  return result;
}

void SharedIndexChunkConfiguration::buildIndexChunks(
    int chunkId, const std::string &chunkRoot, int64_t timestamp,
    bool compatible, std::vector<SharedIndexChunkPtr> &result) {
  const std::set<std::string> emptyIndexes =
      readEmptyIndexes(*readView_, chunkRoot);
  const std::set<std::string> emptyStubIndexes =
      readEmptyStubIndexes(*readView_, chunkRoot);

  auto makeChunk = [&](const IndexExtension &ext, const std::string &indexDir,
                       bool empty) {
    IndexChunkContext context;
    context.archive = readView_.get();
    context.chunkRoot = chunkRoot;
    context.indexDir = indexDir;
    context.indexName = ext.name;
    context.chunkId = chunkId;
    context.timestamp = timestamp;
    context.empty = empty;
    return std::make_shared<SharedIndexChunk>(chunkRoot, ext.name, chunkId,
                                              timestamp, empty, compatible,
                                              ext.factory(context, hashes_));
  };

  for (const auto &dir : readView_->listDirectories(chunkRoot)) {
    const std::string indexDir = joinArchivePath(chunkRoot, dir);
    auto ext = indexes_->find(dir);
    if (ext && ext->kind == IndexKind::FileBased) {
      bool empty = emptyIndexes.count(dir) || emptyStubIndexes.count(dir);
      result.push_back(makeChunk(*ext, indexDir, empty));
    } else if (dir != kStubUpdatingIndexName) {
      Logger::getInstance().log(LogLevel::DEBUG, "shared-index",
                                "Skipping unknown index " + dir + " in " +
                                    chunkRoot);
    }

    if (dir == kStubUpdatingIndexName) {
      for (const auto &key : readView_->listDirectories(indexDir)) {
        auto stubExt = indexes_->find(key);
        if (!stubExt || stubExt->kind != IndexKind::Stub) {
          Logger::getInstance().log(LogLevel::DEBUG, "shared-index",
                                    "Skipping unknown stub index " + key +
                                        " in " + chunkRoot);
          continue;
        }
        result.push_back(makeChunk(*stubExt, joinArchivePath(indexDir, key),
                                   emptyStubIndexes.count(key) > 0));
      }
    }
  }
}

// ---------------------------------------------------------------------------
// Attach / detach

bool SharedIndexChunkConfiguration::bind(
    int chunkId, const std::vector<SharedIndexChunkPtr> &chunks,
    const Project &project) {
  chunks_.attach(chunkId, chunks, project.name());
  for (const auto &chunk : chunks) {
    if (chunks_.find(chunk->indexName(), chunk->chunkId()) != chunk) {
      chunk->close();
    }
  }
  publishLoadedChunks();
  return !chunks.empty();
}

bool SharedIndexChunkConfiguration::attachExistingChunk(int chunkId,
                                                        const Project &project) {
  if (chunkId == kNullIndexId) {
    return true;
  }
  try {
    std::lock_guard<std::mutex> lock(registrationMutex_);
    std::vector<SharedIndexChunkPtr> chunks = chunks_.isAttached(chunkId)
                                                  ? chunks_.chunksOf(chunkId)
                                                  : doRegister(chunkId);
    return bind(chunkId, chunks, project);
  } catch (const CancellationError &) {
    throw;
  } catch (const std::exception &e) {
    logError("Cannot attach chunk " + std::to_string(chunkId) + " to " +
             project.name() + ": " + e.what());
  }
  return false;
}

bool SharedIndexChunkConfiguration::attachChunk(const ChunkDescriptor &descriptor,
                                                const Project &project) {
  const std::string id = descriptor.uniqueId();
  int chunkId = descriptors_->tryEnumerate(id);
  if (chunkId != kNullIndexId) {
    return attachExistingChunk(chunkId, project);
  }
  try {
    std::vector<SharedIndexChunkPtr> chunks = registerChunk(descriptor);
    std::lock_guard<std::mutex> lock(registrationMutex_);
    return bind(descriptors_->tryEnumerate(id), chunks, project);
  } catch (const CancellationError &) {
    throw;
  } catch (const std::exception &e) {
    logError("Cannot attach " + id + " to " + project.name() + ": " + e.what());
  }
  return false;
}

void SharedIndexChunkConfiguration::projectClosed(const Project &project) {
  projectClosed(project.name());
}

void SharedIndexChunkConfiguration::projectClosed(
    const std::string &projectName) {
  size_t removed = 0;
  size_t closedTables = 0;
  {
    std::lock_guard<std::mutex> lock(registrationMutex_);
    ChunkRegistry::DetachResult result = chunks_.detachProject(projectName);
    for (const auto &chunk : result.removedChunks) {
      chunk->close();
    }
    removed = result.removedChunks.size();
    closedTables = hashes_.remove(result.orphanedChunkIds);
  }
  {
    std::lock_guard<std::mutex> lock(stampMutex_);
    structureStamps_.erase(projectName);
  }
  publishLoadedChunks();
  if (removed > 0 || closedTables > 0) {
    logInfo("Project " + projectName + " closed: released " +
            std::to_string(removed) + " index chunk(s) and " +
            std::to_string(closedTables) + " content hash table(s)");
  }
}

// ---------------------------------------------------------------------------
// Lookups

bool SharedIndexChunkConfiguration::processChunks(
    const std::string &indexName,
    const std::function<bool(const SharedIndexChunkPtr &)> &processor) const {
  return chunks_.forEachCompatible(indexName, processor);
}

IndexEngine *SharedIndexChunkConfiguration::getChunk(const std::string &indexName,
                                                     int chunkId) const {
  SharedIndexChunkPtr chunk = chunks_.find(indexName, chunkId);
  if (!chunk || !chunk->isCompatible()) {
    return nullptr;
  }
  return chunk->engine();
}

int64_t SharedIndexChunkConfiguration::tryEnumerateContentHash(
    const ContentHash &hash) const {
  return hashes_.tryEnumerateContentHash(hash);
}

int SharedIndexChunkConfiguration::chunkIdOf(const std::string &uniqueId) const {
  return descriptors_->tryEnumerate(uniqueId);
}

std::vector<std::pair<int, std::string>>
SharedIndexChunkConfiguration::registeredChunks() const {
  std::vector<std::pair<int, std::string>> out;
  const int count = static_cast<int>(descriptors_->size());
  for (int id = 1; id <= count; ++id) {
    if (auto name = descriptors_->valueOf(id)) {
      out.emplace_back(id, *name);
    }
  }
  return out;
}

bool SharedIndexChunkConfiguration::hasStructureStamp(
    const std::string &projectName) const {
  std::lock_guard<std::mutex> lock(stampMutex_);
  return structureStamps_.count(projectName) > 0;
}

void SharedIndexChunkConfiguration::publishLoadedChunks() {
  MetricsRegistry::instance().setGauge("sharedidx_loaded_chunks",
                                       static_cast<double>(chunks_.size()));
}

// ---------------------------------------------------------------------------
// Shutdown

void SharedIndexChunkConfiguration::dispose() {
  if (disposed_.exchange(true)) {
    return;
  }
  try {
    executor_->stop();
  } catch (const std::exception &e) {
    logError(std::string("Failed to stop shared index worker: ") + e.what());
  }
  for (const auto &chunk : chunks_.clear()) {
    chunk->close();
  }
  hashes_.clear();
  publishLoadedChunks();
  try {
    readView_->close();
  } catch (const std::exception &e) {
    logError(std::string("Failed to close shared index archive: ") + e.what());
  }
  try {
    descriptors_->close();
  } catch (const std::exception &e) {
    logError(std::string("Failed to close chunk descriptors: ") + e.what());
  }
  logInfo("Shared index storage " + options_.rootDir + " disposed");
}

} // namespace sharedidx
