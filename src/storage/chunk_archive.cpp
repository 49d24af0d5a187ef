#include "storage/chunk_archive.hpp"
#include "storage/byte_order.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace sharedidx {

const char ARCHIVE_MAGIC[9] = "SIDXARC1";

namespace {

constexpr size_t MAGIC_SIZE = 8;
constexpr size_t COPY_BLOCK = 64 * 1024;
// Fixed part of a record header: magic, path length, flags, sizes, digest.
constexpr size_t FIXED_HEADER = 4 + 2 + 1 + 8 + 8 + DIGEST_SIZE;

void validatePath(const std::string &path) {
  if (path.empty() || path.front() == '/' || path.size() > 0xffff) {
    throw StorageError("Invalid archive path: '" + path + "'");
  }
  for (const auto &part : splitArchivePath(path)) {
    if (part == "." || part == "..") {
      throw StorageError("Invalid archive path: '" + path + "'");
    }
  }
}

void encodeHeader(std::vector<std::byte> &out, const std::string &path,
                  uint8_t flags, uint64_t originalSize, uint64_t storedSize,
                  const DigestArray &digest) {
  le::put<uint32_t>(out, ARCHIVE_RECORD_MAGIC);
  le::put<uint16_t>(out, static_cast<uint16_t>(path.size()));
  const auto *p = reinterpret_cast<const std::byte *>(path.data());
  out.insert(out.end(), p, p + path.size());
  out.push_back(static_cast<std::byte>(flags));
  le::put<uint64_t>(out, originalSize);
  le::put<uint64_t>(out, storedSize);
  for (uint8_t b : digest) {
    out.push_back(static_cast<std::byte>(b));
  }
}

bool readExactly(std::istream &in, std::byte *dst, size_t size) {
  in.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(size));
  return static_cast<size_t>(in.gcount()) == size;
}

/**
 * Parse the record header at @p offset. Returns false if the record extends
 * past @p fileSize (torn write). Throws on a bad record magic.
 */
bool readHeader(std::istream &in, uint64_t offset, uint64_t fileSize,
                ArchiveEntry &entry, uint64_t &next) {
  if (offset + 6 > fileSize) {
    return false;
  }
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  std::byte prefix[6];
  if (!readExactly(in, prefix, sizeof(prefix))) {
    return false;
  }
  if (le::get<uint32_t>(prefix) != ARCHIVE_RECORD_MAGIC) {
    throw StorageError("Corrupted archive record at offset " +
                       std::to_string(offset));
  }
  uint16_t pathLen = le::get<uint16_t>(prefix + 4);
  uint64_t headerSize = FIXED_HEADER + pathLen;
  if (offset + headerSize > fileSize) {
    return false;
  }

  std::vector<std::byte> rest(headerSize - 6);
  if (!readExactly(in, rest.data(), rest.size())) {
    return false;
  }
  const std::byte *p = rest.data();
  std::string path(reinterpret_cast<const char *>(p), pathLen);
  p += pathLen;
  uint8_t flags = std::to_integer<uint8_t>(*p++);
  entry.originalSize = le::get<uint64_t>(p);
  p += 8;
  entry.storedSize = le::get<uint64_t>(p);
  p += 8;
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    entry.digest[i] = std::to_integer<uint8_t>(p[i]);
  }
  entry.compressed = (flags & ARCHIVE_FLAG_ZSTD) != 0;
  entry.directory = !path.empty() && path.back() == '/';
  if (entry.directory) {
    path.pop_back();
  }
  entry.path = path;
  entry.dataOffset = offset + headerSize;
  next = entry.dataOffset + entry.storedSize;
  return next <= fileSize;
}

void checkArchiveMagic(std::istream &in, const std::string &path) {
  char magic[MAGIC_SIZE];
  in.clear();
  in.seekg(0);
  in.read(magic, MAGIC_SIZE);
  if (in.gcount() != static_cast<std::streamsize>(MAGIC_SIZE) ||
      std::memcmp(magic, ARCHIVE_MAGIC, MAGIC_SIZE) != 0) {
    throw StorageError("Not a chunk archive: " + path);
  }
}

} // namespace

std::vector<std::string> splitArchivePath(const std::string &path) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos)
      end = path.size();
    if (end > start)
      parts.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}

std::string joinArchivePath(const std::string &parent,
                            const std::string &child) {
  if (parent.empty())
    return child;
  if (child.empty())
    return parent;
  std::string out = parent;
  if (out.back() != '/')
    out.push_back('/');
  out += child.front() == '/' ? child.substr(1) : child;
  return out;
}

void ensureArchiveExists(const std::string &path) {
  if (fs::exists(path)) {
    return;
  }
  fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary);
  out.write(ARCHIVE_MAGIC, MAGIC_SIZE);
  out.flush();
  if (!out) {
    throw StorageError("Cannot create archive " + path);
  }
}

// ---------------------------------------------------------------------------
// ChunkArchiveWriter

ChunkArchiveWriter::ChunkArchiveWriter(const std::string &path,
                                       int compressionLevel)
    : path_(path), compressionLevel_(compressionLevel) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    throw StorageError("Cannot create fragment " + path_);
  }
  out_.write(ARCHIVE_MAGIC, MAGIC_SIZE);
}

ChunkArchiveWriter::~ChunkArchiveWriter() {
  if (out_.is_open()) {
    out_.close();
  }
}

void ChunkArchiveWriter::writeRecord(const std::string &path, bool directory,
                                     const std::vector<std::byte> &data) {
  if (finished_) {
    throw std::logic_error("Fragment " + path_ + " is already finished");
  }
  validatePath(path);

  std::vector<std::byte> stored = data;
  uint8_t flags = 0;
  if (!directory && compressionLevel_ > 0 && !data.empty()) {
    BlockIO bio(compressionLevel_);
    std::vector<std::byte> compressed = bio.compress_data(data);
    if (compressed.size() < data.size()) {
      stored = std::move(compressed);
      flags |= ARCHIVE_FLAG_ZSTD;
    }
  }

  std::string recordPath = directory ? path + "/" : path;
  std::vector<std::byte> header;
  encodeHeader(header, recordPath, flags, data.size(), stored.size(),
               sha256Of(data));
  out_.write(reinterpret_cast<const char *>(header.data()),
             static_cast<std::streamsize>(header.size()));
  out_.write(reinterpret_cast<const char *>(stored.data()),
             static_cast<std::streamsize>(stored.size()));
  if (!out_) {
    throw StorageError("Failed to write " + path + " to " + path_);
  }
  written_.insert(path);
}

void ChunkArchiveWriter::addDirectory(const std::string &path) {
  std::string p = path;
  while (!p.empty() && p.back() == '/')
    p.pop_back();
  writeRecord(p, true, {});
}

void ChunkArchiveWriter::addFile(const std::string &path,
                                 const std::vector<std::byte> &data) {
  writeRecord(path, false, data);
}

void ChunkArchiveWriter::addFile(const std::string &path,
                                 const std::string &data) {
  const auto *p = reinterpret_cast<const std::byte *>(data.data());
  writeRecord(path, false, std::vector<std::byte>(p, p + data.size()));
}

void ChunkArchiveWriter::addTree(const std::string &dir,
                                 const std::string &prefix) {
  std::vector<fs::path> entries;
  for (const auto &e : fs::recursive_directory_iterator(dir)) {
    entries.push_back(e.path());
  }
  std::sort(entries.begin(), entries.end());

  for (const auto &p : entries) {
    std::string rel =
        joinArchivePath(prefix, fs::relative(p, dir).generic_string());
    if (fs::is_directory(p)) {
      addDirectory(rel);
    } else if (fs::is_regular_file(p)) {
      std::ifstream in(p, std::ios::binary);
      if (!in) {
        throw StorageError("Cannot read " + p.string());
      }
      std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
      std::vector<std::byte> data(tmp.size());
      std::memcpy(data.data(), tmp.data(), tmp.size());
      addFile(rel, data);
    }
  }
}

bool ChunkArchiveWriter::hasEntry(const std::string &path) const {
  return written_.count(path) > 0;
}

void ChunkArchiveWriter::finish() {
  if (finished_)
    return;
  finished_ = true;
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok) {
    throw StorageError("Failed to finish fragment " + path_);
  }
}

// ---------------------------------------------------------------------------
// ChunkArchiveAppender

ChunkArchiveAppender::ChunkArchiveAppender(std::string archivePath)
    : archivePath_(std::move(archivePath)) {}

size_t ChunkArchiveAppender::appendFragment(
    const std::string &fragmentPath, const std::string &prefix,
    const std::vector<PendingEntry> &extraEntries) {
  std::ifstream fragment(fragmentPath, std::ios::binary);
  if (!fragment) {
    throw StorageError("Cannot open fragment " + fragmentPath);
  }
  checkArchiveMagic(fragment, fragmentPath);

  std::error_code ec;
  uint64_t fragmentSize = fs::file_size(fragmentPath, ec);
  if (ec) {
    throw StorageError("Cannot stat fragment " + fragmentPath + ": " +
                       ec.message());
  }

  // Validate the whole fragment before touching the archive.
  std::vector<ArchiveEntry> records;
  std::set<std::string> present;
  uint64_t offset = MAGIC_SIZE;
  while (offset < fragmentSize) {
    ArchiveEntry e;
    uint64_t next = 0;
    if (!readHeader(fragment, offset, fragmentSize, e, next)) {
      throw StorageError("Incomplete fragment " + fragmentPath);
    }
    validatePath(e.path);
    present.insert(e.path);
    records.push_back(std::move(e));
    offset = next;
  }

  ensureArchiveExists(archivePath_);
  uint64_t originalSize = fs::file_size(archivePath_, ec);
  if (ec) {
    throw StorageError("Cannot stat archive " + archivePath_ + ": " +
                       ec.message());
  }

  size_t appended = 0;
  try {
    std::ofstream out(archivePath_, std::ios::binary | std::ios::app);
    if (!out) {
      throw StorageError("Cannot open archive for append " + archivePath_);
    }

    std::vector<char> block(COPY_BLOCK);
    for (const auto &e : records) {
      std::string path = joinArchivePath(prefix, e.path);
      validatePath(path);
      std::vector<std::byte> header;
      encodeHeader(header, e.directory ? path + "/" : path,
                   e.compressed ? ARCHIVE_FLAG_ZSTD : 0, e.originalSize,
                   e.storedSize, e.digest);
      out.write(reinterpret_cast<const char *>(header.data()),
                static_cast<std::streamsize>(header.size()));

      fragment.clear();
      fragment.seekg(static_cast<std::streamoff>(e.dataOffset));
      uint64_t remaining = e.storedSize;
      while (remaining > 0) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, COPY_BLOCK));
        fragment.read(block.data(), static_cast<std::streamsize>(n));
        if (static_cast<size_t>(fragment.gcount()) != n) {
          throw StorageError("Short read from fragment " + fragmentPath);
        }
        out.write(block.data(), static_cast<std::streamsize>(n));
        remaining -= n;
      }
      if (!out) {
        throw StorageError("Write to archive failed " + archivePath_);
      }
      ++appended;
    }

    for (const auto &extra : extraEntries) {
      if (extra.onlyIfMissing && present.count(extra.path)) {
        continue;
      }
      std::string path = joinArchivePath(prefix, extra.path);
      validatePath(path);
      std::vector<std::byte> header;
      encodeHeader(header, path, 0, extra.data.size(), extra.data.size(),
                   sha256Of(extra.data));
      out.write(reinterpret_cast<const char *>(header.data()),
                static_cast<std::streamsize>(header.size()));
      out.write(reinterpret_cast<const char *>(extra.data.data()),
                static_cast<std::streamsize>(extra.data.size()));
      ++appended;
    }

    out.flush();
    if (!out) {
      throw StorageError("Flush of archive failed " + archivePath_);
    }
  } catch (const StorageError &) {
    std::error_code rec;
    fs::resize_file(archivePath_, originalSize, rec);
    if (rec) {
      Logger::getInstance().log(LogLevel::ERROR, "archive",
                                "Failed to roll back " + archivePath_ + ": " +
                                    rec.message());
    }
    throw;
  }
  return appended;
}

// ---------------------------------------------------------------------------
// ArchiveFileSystem

ArchiveFileSystem::ArchiveFileSystem(const std::string &archivePath)
    : archivePath_(archivePath) {
  ensureArchiveExists(archivePath_);
  in_.open(archivePath_, std::ios::binary);
  if (!in_.is_open()) {
    throw StorageError("Cannot open archive " + archivePath_);
  }
  checkArchiveMagic(in_, archivePath_);
  scannedUpTo_ = MAGIC_SIZE;
  sync();
}

ArchiveFileSystem::~ArchiveFileSystem() {
  std::lock_guard<std::mutex> lock(ioMutex_);
  if (in_.is_open()) {
    in_.close();
  }
}

void ArchiveFileSystem::ensureOpen() const {
  if (closed_) {
    throw StorageError("Archive view " + archivePath_ + " is closed");
  }
}

void ArchiveFileSystem::sync() {
  std::unique_lock<std::shared_mutex> tree(treeMutex_);
  std::lock_guard<std::mutex> io(ioMutex_);
  ensureOpen();

  std::error_code ec;
  uint64_t fileSize = fs::file_size(archivePath_, ec);
  if (ec) {
    throw StorageError("Cannot stat archive " + archivePath_ + ": " +
                       ec.message());
  }

  uint64_t offset = scannedUpTo_;
  size_t added = 0;
  while (offset < fileSize) {
    ArchiveEntry e;
    uint64_t next = 0;
    if (!readHeader(in_, offset, fileSize, e, next)) {
      break;
    }
    insert(e);
    ++added;
    offset = next;
  }
  scannedUpTo_ = offset;
  if (added > 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "archive",
                              "Synced " + std::to_string(added) +
                                  " records from " + archivePath_);
  }
}

ArchiveFileSystem::DirNode &
ArchiveFileSystem::makeDirs(const std::vector<std::string> &parts,
                            size_t count) {
  DirNode *node = &root_;
  for (size_t i = 0; i < count; ++i) {
    auto &child = node->dirs[parts[i]];
    if (!child) {
      child = std::make_unique<DirNode>();
    }
    node = child.get();
  }
  return *node;
}

// Caller holds treeMutex_ exclusively.
void ArchiveFileSystem::insert(const ArchiveEntry &entry) {
  auto parts = splitArchivePath(entry.path);
  if (parts.empty()) {
    return;
  }
  if (entry.directory) {
    makeDirs(parts, parts.size());
  } else {
    DirNode &parent = makeDirs(parts, parts.size() - 1);
    parent.files[parts.back()] = entry;
  }
  ++entryCount_;
}

const ArchiveFileSystem::DirNode *
ArchiveFileSystem::findDir(const std::string &path) const {
  const DirNode *node = &root_;
  for (const auto &part : splitArchivePath(path)) {
    auto it = node->dirs.find(part);
    if (it == node->dirs.end()) {
      return nullptr;
    }
    node = it->second.get();
  }
  return node;
}

bool ArchiveFileSystem::exists(const std::string &path) const {
  return isDirectory(path) || isFile(path);
}

bool ArchiveFileSystem::isDirectory(const std::string &path) const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  return findDir(path) != nullptr;
}

bool ArchiveFileSystem::isFile(const std::string &path) const {
  return entry(path).has_value();
}

std::optional<ArchiveEntry>
ArchiveFileSystem::entry(const std::string &path) const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  auto parts = splitArchivePath(path);
  if (parts.empty()) {
    return std::nullopt;
  }
  const DirNode *node = &root_;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    auto it = node->dirs.find(parts[i]);
    if (it == node->dirs.end()) {
      return std::nullopt;
    }
    node = it->second.get();
  }
  auto it = node->files.find(parts.back());
  if (it == node->files.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> ArchiveFileSystem::list(const std::string &dir) const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  std::vector<std::string> names;
  const DirNode *node = findDir(dir);
  if (!node) {
    return names;
  }
  for (const auto &kv : node->dirs)
    names.push_back(kv.first);
  for (const auto &kv : node->files)
    names.push_back(kv.first);
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

std::vector<std::string>
ArchiveFileSystem::listDirectories(const std::string &dir) const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  std::vector<std::string> names;
  if (const DirNode *node = findDir(dir)) {
    for (const auto &kv : node->dirs)
      names.push_back(kv.first);
  }
  return names;
}

std::vector<std::string>
ArchiveFileSystem::listFiles(const std::string &dir) const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  std::vector<std::string> names;
  if (const DirNode *node = findDir(dir)) {
    for (const auto &kv : node->files)
      names.push_back(kv.first);
  }
  return names;
}

std::optional<std::vector<std::byte>>
ArchiveFileSystem::tryRead(const std::string &path) const {
  auto e = entry(path);
  if (!e) {
    return std::nullopt;
  }

  std::vector<std::byte> stored(e->storedSize);
  {
    std::lock_guard<std::mutex> io(ioMutex_);
    ensureOpen();
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(e->dataOffset));
    if (!readExactly(in_, stored.data(), stored.size())) {
      throw StorageError("Short read of " + path + " from " + archivePath_);
    }
  }

  std::vector<std::byte> data;
  if (e->compressed) {
    try {
      BlockIO bio;
      data = bio.decompress_data(stored, e->originalSize);
    } catch (const std::runtime_error &ex) {
      throw StorageError("Cannot decompress " + path + ": " + ex.what());
    }
  } else {
    data = std::move(stored);
  }
  if (data.size() != e->originalSize || sha256Of(data) != e->digest) {
    throw StorageError("Checksum mismatch for " + path + " in " +
                       archivePath_);
  }
  return data;
}

std::vector<std::byte> ArchiveFileSystem::read(const std::string &path) const {
  auto data = tryRead(path);
  if (!data) {
    throw StorageError("No such entry " + path + " in " + archivePath_);
  }
  return std::move(*data);
}

size_t ArchiveFileSystem::entryCount() const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  return entryCount_;
}

uint64_t ArchiveFileSystem::syncedSize() const {
  std::shared_lock<std::shared_mutex> lock(treeMutex_);
  return scannedUpTo_;
}

void ArchiveFileSystem::close() {
  std::unique_lock<std::shared_mutex> tree(treeMutex_);
  std::lock_guard<std::mutex> io(ioMutex_);
  if (closed_)
    return;
  closed_ = true;
  if (in_.is_open()) {
    in_.close();
  }
}

bool ArchiveFileSystem::isClosed() const {
  std::lock_guard<std::mutex> io(ioMutex_);
  return closed_;
}

} // namespace sharedidx
