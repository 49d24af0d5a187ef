#ifndef SHAREDIDX_CHUNK_ARCHIVE_HPP
#define SHAREDIDX_CHUNK_ARCHIVE_HPP

#include "utilities/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sharedidx {

/**
 * @file chunk_archive.hpp
 * @brief Append-only archive holding every downloaded chunk.
 *
 * Layout: the 8 byte magic "SIDXARC1" followed by records
 *
 *     u32  'SIDR'
 *     u16  path length, path bytes ('/' separated, trailing '/' = directory)
 *     u8   flags (bit 0: zstd compressed)
 *     u64  original size
 *     u64  stored size
 *     32   SHA-256 of the original bytes
 *     ...  stored bytes
 *
 * All integers are little-endian. Parent directories are implicit. When a
 * path occurs more than once the last record wins. Downloaded fragments use
 * the same format with paths relative to the chunk root.
 */

inline constexpr uint32_t ARCHIVE_RECORD_MAGIC = 0x52444953; // "SIDR"
inline constexpr uint8_t ARCHIVE_FLAG_ZSTD = 0x01;
extern const char ARCHIVE_MAGIC[9];

struct ArchiveEntry {
  std::string path;
  bool directory{false};
  bool compressed{false};
  uint64_t originalSize{0};
  uint64_t storedSize{0};
  DigestArray digest{};
  uint64_t dataOffset{0}; ///< Absolute file offset of the stored bytes
};

/// Write the archive header to a new file at @p path if it does not exist.
void ensureArchiveExists(const std::string &path);

/**
 * @brief Streams a fragment archive to disk.
 *
 * Used to package a prebuilt chunk directory for distribution and by tests.
 */
class ChunkArchiveWriter {
public:
  /**
   * @param path             Destination, truncated if it exists.
   * @param compressionLevel zstd level for file entries; 0 stores them.
   * @throws StorageError if the file cannot be created.
   */
  explicit ChunkArchiveWriter(const std::string &path, int compressionLevel = 0);
  ~ChunkArchiveWriter();

  ChunkArchiveWriter(const ChunkArchiveWriter &) = delete;
  ChunkArchiveWriter &operator=(const ChunkArchiveWriter &) = delete;

  void addDirectory(const std::string &path);
  void addFile(const std::string &path, const std::vector<std::byte> &data);
  void addFile(const std::string &path, const std::string &data);

  /// Recursively add the contents of @p dir, sorted, under @p prefix.
  void addTree(const std::string &dir, const std::string &prefix = "");

  bool hasEntry(const std::string &path) const;

  /** Flush and close. @throws StorageError on a write failure. */
  void finish();

private:
  void writeRecord(const std::string &path, bool directory,
                   const std::vector<std::byte> &data);

  std::string path_;
  int compressionLevel_;
  std::ofstream out_;
  std::set<std::string> written_;
  bool finished_{false};
};

/// Extra entry written by ChunkArchiveAppender after a fragment's records.
struct PendingEntry {
  std::string path; ///< Relative to the fragment root
  std::vector<std::byte> data;
  bool onlyIfMissing{false}; ///< Skip if the fragment already has this path
};

/**
 * @brief Appends fragments to the shared archive, all or nothing.
 *
 * On any failure the archive is truncated back to its previous size before
 * the StorageError is thrown, so a reader never sees part of a fragment.
 */
class ChunkArchiveAppender {
public:
  explicit ChunkArchiveAppender(std::string archivePath);

  /**
   * @brief Append every record of @p fragmentPath under @p prefix.
   * @return Number of records appended.
   * @throws StorageError on a malformed fragment or an I/O failure.
   */
  size_t appendFragment(const std::string &fragmentPath,
                        const std::string &prefix,
                        const std::vector<PendingEntry> &extraEntries = {});

private:
  std::string archivePath_;
};

/**
 * @brief Read-only directory view over the shared archive.
 *
 * Built by scanning the archive's records. New records appended after the
 * last scan stay invisible until sync() is called. All methods are
 * thread-safe.
 */
class ArchiveFileSystem {
public:
  /// Opens @p archivePath, creating an empty archive if it is missing.
  explicit ArchiveFileSystem(const std::string &archivePath);
  ~ArchiveFileSystem();

  ArchiveFileSystem(const ArchiveFileSystem &) = delete;
  ArchiveFileSystem &operator=(const ArchiveFileSystem &) = delete;

  /**
   * @brief Index records appended since the last scan.
   *
   * A torn trailing record is left for a later sync.
   * @throws StorageError if the archive cannot be read.
   */
  void sync();

  bool exists(const std::string &path) const;
  bool isDirectory(const std::string &path) const;
  bool isFile(const std::string &path) const;

  /// Names of files and subdirectories directly under @p dir, sorted.
  std::vector<std::string> list(const std::string &dir) const;
  std::vector<std::string> listDirectories(const std::string &dir) const;
  std::vector<std::string> listFiles(const std::string &dir) const;

  /**
   * @brief Contents of the file at @p path.
   * @throws StorageError if missing, unreadable or failing its checksum.
   */
  std::vector<std::byte> read(const std::string &path) const;

  /// Like read() but returns nullopt for a missing file.
  std::optional<std::vector<std::byte>> tryRead(const std::string &path) const;

  std::optional<ArchiveEntry> entry(const std::string &path) const;

  size_t entryCount() const;
  uint64_t syncedSize() const;
  const std::string &archivePath() const { return archivePath_; }

  /** Release the file handle. Idempotent. */
  void close();
  bool isClosed() const;

private:
  struct DirNode {
    std::map<std::string, std::unique_ptr<DirNode>> dirs;
    std::map<std::string, ArchiveEntry> files;
  };

  const DirNode *findDir(const std::string &path) const;
  DirNode &makeDirs(const std::vector<std::string> &parts, size_t count);
  void insert(const ArchiveEntry &entry);
  void ensureOpen() const;

  std::string archivePath_;
  mutable std::shared_mutex treeMutex_;
  mutable std::mutex ioMutex_;
  mutable std::ifstream in_;
  DirNode root_;
  uint64_t scannedUpTo_{0};
  size_t entryCount_{0};
  bool closed_{false};
};

/// Split a '/' separated path into non-empty components.
std::vector<std::string> splitArchivePath(const std::string &path);

/// Join two archive path fragments with a single '/'.
std::string joinArchivePath(const std::string &parent, const std::string &child);

} // namespace sharedidx

#endif // SHAREDIDX_CHUNK_ARCHIVE_HPP
