#ifndef SHAREDIDX_CONFIG_HPP
#define SHAREDIDX_CONFIG_HPP

#include "utilities/logger.h"

#include <string>
#include <vector>

namespace sharedidx {

/// One index declared in the configuration file.
struct IndexDeclaration {
  std::string name;
  std::string kind = "file"; ///< "file" or "stub"
  std::string version = "1";
  bool base = false;
};

/**
 * @brief Runtime options of the shared index storage.
 *
 * Loaded from YAML, then overridden by environment variables.
 */
struct StorageOptions {
  std::string rootDir;          ///< Configuration root (descriptors, archive)
  int compressionLevel = 3;     ///< zstd level for packed fragments, 0 stores
  bool sameThreadExecutor = false;
  std::string logFile;          ///< Empty means logs/sharedidx.log
  LogLevel logLevel = LogLevel::INFO;
  std::string manifest;         ///< Local mirror manifest for the locator
  std::vector<IndexDeclaration> indexes;
};

/**
 * @brief Read options from @p path.
 *
 * A missing file yields the defaults. A file that exists but does not parse
 * is reported on the log and defaults are used. Environment overrides:
 * SHAREDIDX_ROOT, SHAREDIDX_COMPRESSION_LEVEL, SHAREDIDX_LOG_LEVEL.
 */
StorageOptions loadStorageOptions(const std::string &path);

/// Path from SHAREDIDX_CONFIG, or "sharedidx_config.yaml".
std::string defaultConfigPath();

} // namespace sharedidx

#endif // SHAREDIDX_CONFIG_HPP
