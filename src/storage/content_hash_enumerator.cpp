#include "storage/content_hash_enumerator.hpp"
#include "storage/persistent_enumerator.hpp"
#include "utilities/errors.hpp"

#include <stdexcept>

namespace sharedidx {

const char ContentHashEnumerator::MAGIC[9] = "SIDXHSH1";

static std::string hashKey(const ContentHash &hash) {
  return std::string(reinterpret_cast<const char *>(hash.data()), hash.size());
}

ContentHashEnumerator::ContentHashEnumerator() = default;

ContentHashEnumerator::ContentHashEnumerator(
    ContentHashEnumerator &&other) noexcept {
  std::lock_guard<std::mutex> lock(other.mutex_);
  readOnly_ = other.readOnly_;
  closed_ = other.closed_;
  ids_ = std::move(other.ids_);
  hashes_ = std::move(other.hashes_);
}

ContentHashEnumerator &
ContentHashEnumerator::operator=(ContentHashEnumerator &&other) noexcept {
  if (this != &other) {
    std::scoped_lock lock(mutex_, other.mutex_);
    readOnly_ = other.readOnly_;
    closed_ = other.closed_;
    ids_ = std::move(other.ids_);
    hashes_ = std::move(other.hashes_);
  }
  return *this;
}

ContentHashEnumerator
ContentHashEnumerator::load(const std::vector<std::byte> &bytes) {
  size_t consumed = 0;
  std::vector<std::string> records =
      enumerator_format::decodeRecords(bytes.data(), bytes.size(), MAGIC,
                                       consumed);
  if (consumed != bytes.size()) {
    throw StorageError("Truncated content hash table");
  }

  ContentHashEnumerator table;
  table.readOnly_ = true;
  table.hashes_.reserve(records.size());
  for (auto &record : records) {
    if (record.size() != DIGEST_SIZE) {
      throw StorageError("Content hash record of size " +
                         std::to_string(record.size()) + ", expected " +
                         std::to_string(DIGEST_SIZE));
    }
    table.ids_.emplace(record, static_cast<int>(table.hashes_.size() + 1));
    table.hashes_.push_back(std::move(record));
  }
  return table;
}

int ContentHashEnumerator::enumerate(const ContentHash &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (readOnly_ || closed_) {
    throw std::logic_error("Content hash table is not writable");
  }
  std::string key = hashKey(hash);
  auto it = ids_.find(key);
  if (it != ids_.end()) {
    return it->second;
  }
  hashes_.push_back(key);
  int id = static_cast<int>(hashes_.size());
  ids_.emplace(std::move(key), id);
  return id;
}

int ContentHashEnumerator::tryEnumerate(const ContentHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return 0;
  }
  auto it = ids_.find(hashKey(hash));
  return it == ids_.end() ? 0 : it->second;
}

std::vector<std::byte> ContentHashEnumerator::serialize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::byte> out;
  const auto *magic = reinterpret_cast<const std::byte *>(MAGIC);
  out.insert(out.end(), magic, magic + enumerator_format::MAGIC_SIZE);
  for (const auto &hash : hashes_) {
    enumerator_format::appendRecord(out, hash);
  }
  return out;
}

size_t ContentHashEnumerator::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hashes_.size();
}

void ContentHashEnumerator::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  ids_.clear();
  hashes_.clear();
}

bool ContentHashEnumerator::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace sharedidx
