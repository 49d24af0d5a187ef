#ifndef SHAREDIDX_ERRORS_HPP
#define SHAREDIDX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sharedidx {

/**
 * @brief I/O failure on the archive, an enumerator or a temp file.
 *
 * The operation in progress is aborted; nothing is committed to the chunk
 * registry.
 */
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Persisted chunk state that cannot be interpreted (bad timestamp,
 * missing descriptor). Fatal to one registration attempt only.
 */
class CorruptedIndexError : public std::runtime_error {
public:
  explicit CorruptedIndexError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * @brief Cooperative cancellation raised through a ProgressIndicator.
 *
 * Never logged as an error and always rethrown to the caller.
 */
class CancellationError : public std::runtime_error {
public:
  CancellationError() : std::runtime_error("operation canceled") {}
  explicit CancellationError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace sharedidx

#endif // SHAREDIDX_ERRORS_HPP
