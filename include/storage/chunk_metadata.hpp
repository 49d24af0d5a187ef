#ifndef SHAREDIDX_CHUNK_METADATA_HPP
#define SHAREDIDX_CHUNK_METADATA_HPP

#include "index/index_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sharedidx {

class ArchiveFileSystem;

// Per-chunk metadata entries, relative to the chunk root.
inline constexpr const char *kHashesEntry = "hashes";
inline constexpr const char *kTimestampEntry = "timestamp";
inline constexpr const char *kEmptyIndexesEntry = "empty-indices";
inline constexpr const char *kEmptyStubIndexesEntry = "empty-stub-indices";
inline constexpr const char *kInfrastructureVersionEntry =
    "infrastructure-version";

/**
 * @brief Creation time of the chunk in milliseconds since the epoch.
 *
 * The entry holds a decimal ASCII integer. Returns 0 if the entry is
 * missing or does not parse.
 * @throws StorageError if the entry exists but cannot be read.
 */
int64_t readTimestamp(const ArchiveFileSystem &view,
                      const std::string &chunkRoot);

/// Bytes of a `timestamp` entry holding @p millis.
std::vector<std::byte> timestampEntry(int64_t millis);

/// Milliseconds since the epoch, now.
int64_t currentTimeMillis();

/// Index names listed in `empty-indices`, empty if the entry is missing.
std::set<std::string> readEmptyIndexes(const ArchiveFileSystem &view,
                                       const std::string &chunkRoot);

/// Stub index keys listed in `empty-stub-indices`.
std::set<std::string> readEmptyStubIndexes(const ArchiveFileSystem &view,
                                           const std::string &chunkRoot);

/// Newline separated list of @p names.
std::vector<std::byte> nameListEntry(const std::set<std::string> &names);

std::string formatInfrastructureVersion(const InfrastructureVersion &version);

/// @throws CorruptedIndexError if @p text is not a version document.
InfrastructureVersion parseInfrastructureVersion(const std::string &text);

std::vector<std::byte>
infrastructureVersionEntry(const InfrastructureVersion &version);

/**
 * @brief Version stored with the chunk, nullopt for chunks appended without
 * one.
 * @throws CorruptedIndexError if the entry does not parse.
 */
std::optional<InfrastructureVersion>
readInfrastructureVersion(const ArchiveFileSystem &view,
                          const std::string &chunkRoot);

/**
 * @brief Pack a prebuilt chunk directory into the downloadable fragment
 * @p fragment.
 *
 * A `timestamp` entry holding @p nowMillis is added when the directory has
 * none.
 * @throws StorageError if @p dir is not a directory or the fragment cannot
 * be written.
 */
void packChunkDirectory(const std::string &dir, const std::string &fragment,
                        int compressionLevel, int64_t nowMillis);

} // namespace sharedidx

#endif // SHAREDIDX_CHUNK_METADATA_HPP
