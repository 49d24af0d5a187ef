#include "storage/chunk_metadata.hpp"
#include "storage/chunk_archive.hpp"
#include "utilities/errors.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace sharedidx {

namespace {

std::string asText(const std::vector<std::byte> &bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()),
                     bytes.size());
}

std::vector<std::byte> asBytes(const std::string &text) {
  const auto *p = reinterpret_cast<const std::byte *>(text.data());
  return std::vector<std::byte>(p, p + text.size());
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::set<std::string> readNameList(const ArchiveFileSystem &view,
                                   const std::string &entry) {
  std::set<std::string> names;
  auto data = view.tryRead(entry);
  if (!data)
    return names;
  std::istringstream in(asText(*data));
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty())
      names.insert(line);
  }
  return names;
}

void emitMap(YAML::Emitter &out, const char *key,
             const std::map<std::string, std::string> &values) {
  out << YAML::Key << key << YAML::Value << YAML::BeginMap;
  for (const auto &kv : values) {
    out << YAML::Key << kv.first << YAML::Value << kv.second;
  }
  out << YAML::EndMap;
}

void readMap(const YAML::Node &node, std::map<std::string, std::string> &out) {
  if (!node || node.IsNull())
    return;
  if (!node.IsMap())
    throw CorruptedIndexError("Infrastructure version section is not a map");
  for (const auto &kv : node) {
    out[kv.first.as<std::string>()] = kv.second.as<std::string>();
  }
}

} // namespace

int64_t readTimestamp(const ArchiveFileSystem &view,
                      const std::string &chunkRoot) {
  auto data = view.tryRead(joinArchivePath(chunkRoot, kTimestampEntry));
  if (!data)
    return 0;
  std::string text = trim(asText(*data));
  if (text.empty())
    return 0;
  try {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size())
      return 0;
    return static_cast<int64_t>(value);
  } catch (const std::logic_error &) {
    return 0;
  }
}

std::vector<std::byte> timestampEntry(int64_t millis) {
  return asBytes(std::to_string(millis));
}

int64_t currentTimeMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

std::set<std::string> readEmptyIndexes(const ArchiveFileSystem &view,
                                       const std::string &chunkRoot) {
  return readNameList(view, joinArchivePath(chunkRoot, kEmptyIndexesEntry));
}

std::set<std::string> readEmptyStubIndexes(const ArchiveFileSystem &view,
                                           const std::string &chunkRoot) {
  return readNameList(view, joinArchivePath(chunkRoot, kEmptyStubIndexesEntry));
}

std::vector<std::byte> nameListEntry(const std::set<std::string> &names) {
  std::string text;
  for (const auto &name : names) {
    text += name;
    text += '\n';
  }
  return asBytes(text);
}

std::string formatInfrastructureVersion(const InfrastructureVersion &version) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  emitMap(out, "base_indexes", version.baseIndexes);
  emitMap(out, "file_based_indexes", version.fileBasedIndexes);
  emitMap(out, "stub_indexes", version.stubIndexes);
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

InfrastructureVersion parseInfrastructureVersion(const std::string &text) {
  InfrastructureVersion version;
  try {
    YAML::Node node = YAML::Load(text);
    if (!node.IsMap()) {
      throw CorruptedIndexError("Infrastructure version is not a map");
    }
    readMap(node["base_indexes"], version.baseIndexes);
    readMap(node["file_based_indexes"], version.fileBasedIndexes);
    readMap(node["stub_indexes"], version.stubIndexes);
  } catch (const YAML::Exception &e) {
    throw CorruptedIndexError(std::string("Bad infrastructure version: ") +
                              e.what());
  }
  return version;
}

std::vector<std::byte>
infrastructureVersionEntry(const InfrastructureVersion &version) {
  return asBytes(formatInfrastructureVersion(version));
}

std::optional<InfrastructureVersion>
readInfrastructureVersion(const ArchiveFileSystem &view,
                          const std::string &chunkRoot) {
  auto data =
      view.tryRead(joinArchivePath(chunkRoot, kInfrastructureVersionEntry));
  if (!data)
    return std::nullopt;
  return parseInfrastructureVersion(asText(*data));
}

void packChunkDirectory(const std::string &dir, const std::string &fragment,
                        int compressionLevel, int64_t nowMillis) {
  if (!std::filesystem::is_directory(dir)) {
    throw StorageError("Not a chunk directory: " + dir);
  }
  ChunkArchiveWriter writer(fragment, compressionLevel);
  writer.addTree(dir);
  if (!writer.hasEntry(kTimestampEntry))
    writer.addFile(kTimestampEntry, timestampEntry(nowMillis));
  writer.finish();
}

} // namespace sharedidx
