#include "storage/persistent_enumerator.hpp"
#include "storage/byte_order.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <cstring>
#include <filesystem>
#include <iterator>

namespace sharedidx {

namespace enumerator_format {

void appendRecord(std::vector<std::byte> &out, const std::string &value) {
  le::put<uint32_t>(out, static_cast<uint32_t>(value.size()));
  const auto *p = reinterpret_cast<const std::byte *>(value.data());
  out.insert(out.end(), p, p + value.size());
}

std::vector<std::string> decodeRecords(const std::byte *data, size_t size,
                                       const char *magic, size_t &consumed) {
  if (size < MAGIC_SIZE || std::memcmp(data, magic, MAGIC_SIZE) != 0) {
    throw StorageError(std::string("Bad enumerator header, expected ") +
                       std::string(magic, MAGIC_SIZE));
  }
  std::vector<std::string> values;
  size_t pos = MAGIC_SIZE;
  while (pos + sizeof(uint32_t) <= size) {
    uint32_t len = le::get<uint32_t>(data + pos);
    if (pos + sizeof(uint32_t) + len > size) {
      break; // torn record
    }
    const char *s = reinterpret_cast<const char *>(data + pos + sizeof(uint32_t));
    values.emplace_back(s, len);
    pos += sizeof(uint32_t) + len;
  }
  consumed = pos;
  return values;
}

} // namespace enumerator_format

const char PersistentStringEnumerator::MAGIC[enumerator_format::MAGIC_SIZE + 1] =
    "SIDXENU1";

PersistentStringEnumerator::PersistentStringEnumerator(const std::string &path)
    : path_(path) {
  load();
}

PersistentStringEnumerator::~PersistentStringEnumerator() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
}

void PersistentStringEnumerator::load() {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path p(path_);
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }

  if (!fs::exists(p)) {
    std::ofstream init(path_, std::ios::binary);
    init.write(MAGIC, enumerator_format::MAGIC_SIZE);
    if (!init) {
      throw StorageError("Cannot create enumerator " + path_);
    }
  }

  std::vector<std::byte> bytes;
  {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
      throw StorageError("Cannot open enumerator " + path_);
    }
    std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    bytes.resize(tmp.size());
    std::memcpy(bytes.data(), tmp.data(), tmp.size());
  }

  size_t consumed = 0;
  values_ = enumerator_format::decodeRecords(bytes.data(), bytes.size(), MAGIC,
                                             consumed);
  for (size_t i = 0; i < values_.size(); ++i) {
    ids_.emplace(values_[i], static_cast<int>(i + 1));
  }

  if (consumed < bytes.size()) {
    Logger::getInstance().log(LogLevel::WARN, "enumerator",
                              "Dropping torn record in " + path_ + " (" +
                                  std::to_string(bytes.size() - consumed) +
                                  " bytes)");
    fs::resize_file(p, consumed, ec);
    if (ec) {
      throw StorageError("Cannot truncate " + path_ + ": " + ec.message());
    }
  }

  file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
  if (!file_.is_open()) {
    throw StorageError("Cannot open enumerator for writing " + path_);
  }
  file_.seekp(0, std::ios::end);
}

void PersistentStringEnumerator::ensureOpen() const {
  if (closed_) {
    throw StorageError("Enumerator " + path_ + " is closed");
  }
}

int PersistentStringEnumerator::enumerate(const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensureOpen();
  auto it = ids_.find(value);
  if (it != ids_.end()) {
    return it->second;
  }

  std::vector<std::byte> record;
  enumerator_format::appendRecord(record, value);
  file_.seekp(0, std::ios::end);
  file_.write(reinterpret_cast<const char *>(record.data()),
              static_cast<std::streamsize>(record.size()));
  file_.flush();
  if (!file_) {
    file_.clear();
    throw StorageError("Failed to append to enumerator " + path_);
  }

  values_.push_back(value);
  int id = static_cast<int>(values_.size());
  ids_.emplace(value, id);
  return id;
}

int PersistentStringEnumerator::tryEnumerate(const std::string &value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ensureOpen();
  auto it = ids_.find(value);
  return it == ids_.end() ? 0 : it->second;
}

std::optional<std::string> PersistentStringEnumerator::valueOf(int id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ensureOpen();
  if (id <= 0 || static_cast<size_t>(id) > values_.size()) {
    return std::nullopt;
  }
  return values_[static_cast<size_t>(id) - 1];
}

size_t PersistentStringEnumerator::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

void PersistentStringEnumerator::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
    return;
  closed_ = true;
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool PersistentStringEnumerator::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace sharedidx
