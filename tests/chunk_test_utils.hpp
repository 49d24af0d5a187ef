#pragma once

#include "chunks/chunk_descriptor.hpp"
#include "index/archive_index_engine.hpp"
#include "storage/chunk_archive.hpp"
#include "storage/chunk_metadata.hpp"
#include "storage/content_hash_enumerator.hpp"
#include "utilities/config.hpp"
#include "utilities/var_dir.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sharedidx {
namespace test {

// Empty directory under the test var dir, recreated on every call.
inline std::string freshDir(const std::string &name) {
  namespace fs = std::filesystem;
  fs::path dir = fs::path(getVarDir()) / "tmp" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

inline std::vector<std::byte> bytesOf(const std::string &s) {
  const auto *p = reinterpret_cast<const std::byte *>(s.data());
  return std::vector<std::byte>(p, p + s.size());
}

inline std::string textOf(const std::vector<std::byte> &b) {
  return std::string(reinterpret_cast<const char *>(b.data()), b.size());
}

// Contents of a downloadable chunk fragment.
struct ChunkLayout {
  std::map<std::string, std::string> files;
  std::vector<std::string> dirs;
  std::vector<std::string> contents; // sha256 of each goes into `hashes`
  bool withHashes = true;
  std::string timestamp = "1600000000000"; // empty: no timestamp entry
};

// File-based FileTypes/IdIndex/Stubs, stub keys java.class.shortName and
// java.method.name, plus directories no index claims.
inline ChunkLayout standardChunk(std::vector<std::string> contents) {
  ChunkLayout layout;
  layout.files = {{"FileTypes/data", "file types"},
                {"IdIndex/data", "ids"},
                {"IdIndex/nested/more", "more ids"},
                {"Unknown/data", "?"},
                {"Stubs/meta", "stub meta"},
                {"Stubs/java.class.shortName/data", "classes"},
                {"Stubs/java.method.name/data", "methods"},
                {"Stubs/unknown.key/data", "?"}};
  layout.contents = std::move(contents);
  return layout;
}

inline void writeFragment(const std::string &path, const ChunkLayout &layout) {
  ChunkArchiveWriter writer(path);
  if (layout.withHashes) {
    ContentHashEnumerator hashes;
    for (const auto &c : layout.contents)
      hashes.enumerate(sha256Of(c));
    writer.addFile(kHashesEntry, hashes.serialize());
  }
  if (!layout.timestamp.empty())
    writer.addFile(kTimestampEntry, layout.timestamp);
  for (const auto &dir : layout.dirs)
    writer.addDirectory(dir);
  for (const auto &kv : layout.files)
    writer.addFile(kv.first, kv.second);
  writer.finish();
}

inline std::shared_ptr<IndexRegistry> makeIndexes(const std::string &ftVersion = "1") {
  auto indexes = std::make_shared<IndexRegistry>();
  auto add = [&](const std::string &name, IndexKind kind, bool base,
                 const std::string &version) {
    IndexExtension ext;
    ext.name = name;
    ext.kind = kind;
    ext.baseIndex = base;
    ext.version = version;
    ext.factory = ArchiveIndexEngine::factory();
    indexes->registerExtension(ext);
  };
  add("FileTypes", IndexKind::FileBased, true, ftVersion);
  add("IdIndex", IndexKind::FileBased, false, "3");
  add(kStubUpdatingIndexName, IndexKind::FileBased, false, "1");
  add("java.class.shortName", IndexKind::Stub, false, "1");
  add("java.method.name", IndexKind::Stub, false, "1");
  return indexes;
}

// File-based index whose engine factory always throws @p error.
template <typename Error>
inline void addFailingIndex(IndexRegistry &indexes, const std::string &name,
                            const std::string &message) {
  IndexExtension ext;
  ext.name = name;
  ext.kind = IndexKind::FileBased;
  ext.version = "1";
  ext.factory = [message](const IndexChunkContext &,
                          ContentHashRegistry &) -> std::unique_ptr<IndexEngine> {
    throw Error(message);
  };
  indexes.registerExtension(ext);
}

inline InfrastructureVersion baseVersion(const std::string &ftVersion) {
  InfrastructureVersion v;
  v.baseIndexes["FileTypes"] = ftVersion;
  return v;
}

inline StorageOptions testOptions(const std::string &root) {
  StorageOptions opts;
  opts.rootDir = root;
  opts.sameThreadExecutor = true;
  opts.compressionLevel = 0;
  return opts;
}

class FakeChunkDescriptor : public ChunkDescriptor {
public:
  FakeChunkDescriptor(std::string id, ChunkLayout layout,
                      InfrastructureVersion version = baseVersion("1"),
                      std::vector<OrderEntry> entries = {})
      : id_(std::move(id)), layout_(std::move(layout)),
        version_(std::move(version)), entries_(std::move(entries)) {}

  std::string uniqueId() const override { return id_; }
  InfrastructureVersion supportedInfrastructureVersion() const override {
    return version_;
  }
  std::vector<OrderEntry> orderEntries() const override { return entries_; }

  void downloadChunk(const std::string &destination,
                     ProgressIndicator &progress) override {
    ++downloads;
    lastDestination = destination;
    progress.checkCanceled();
    writeFragment(destination, layout_);
    if (onDownload) {
      onDownload();
    }
    if (cancelDuringDownload) {
      progress.cancel();
      progress.checkCanceled();
    }
    if (failDownload) {
      throw std::runtime_error("connection reset");
    }
  }

  std::atomic<int> downloads{0};
  std::string lastDestination;
  bool failDownload = false;
  bool cancelDuringDownload = false;
  std::function<void()> onDownload;

private:
  std::string id_;
  ChunkLayout layout_;
  InfrastructureVersion version_;
  std::vector<OrderEntry> entries_;
};

} // namespace test
} // namespace sharedidx
