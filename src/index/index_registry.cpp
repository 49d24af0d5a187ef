#include "index/index_registry.hpp"
#include "index/archive_index_engine.hpp"
#include "utilities/logger.h"

#include <mutex>
#include <stdexcept>

namespace sharedidx {

std::string InfrastructureVersion::describe() const {
  std::string out;
  for (const auto &kv : baseIndexes) {
    if (!out.empty())
      out += ",";
    out += kv.first + ":" + kv.second;
  }
  return out.empty() ? "<none>" : out;
}

void IndexRegistry::registerExtension(IndexExtension extension) {
  if (extension.name.empty()) {
    throw std::invalid_argument("Index extension without a name");
  }
  if (!extension.factory) {
    throw std::invalid_argument("Index extension '" + extension.name +
                                "' has no engine factory");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string name = extension.name;
  extensions_[name] = std::move(extension);
}

std::optional<IndexExtension>
IndexRegistry::find(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = extensions_.find(name);
  if (it == extensions_.end())
    return std::nullopt;
  return it->second;
}

bool IndexRegistry::isFileBasedIndex(const std::string &name) const {
  auto ext = find(name);
  return ext && ext->kind == IndexKind::FileBased;
}

bool IndexRegistry::isStubIndex(const std::string &name) const {
  auto ext = find(name);
  return ext && ext->kind == IndexKind::Stub;
}

std::vector<IndexExtension> IndexRegistry::extensions() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<IndexExtension> out;
  out.reserve(extensions_.size());
  for (const auto &kv : extensions_)
    out.push_back(kv.second);
  return out;
}

size_t IndexRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return extensions_.size();
}

InfrastructureVersion IndexRegistry::currentVersion() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  InfrastructureVersion version;
  for (const auto &kv : extensions_) {
    const IndexExtension &ext = kv.second;
    if (ext.baseIndex) {
      version.baseIndexes[ext.name] = ext.version;
    }
    if (ext.kind == IndexKind::Stub) {
      version.stubIndexes[ext.name] = ext.version;
    } else {
      version.fileBasedIndexes[ext.name] = ext.version;
    }
  }
  return version;
}

void registerDeclaredIndexes(
    IndexRegistry &registry,
    const std::vector<IndexDeclaration> &declarations) {
  for (const auto &decl : declarations) {
    IndexExtension ext;
    ext.name = decl.name;
    ext.version = decl.version;
    ext.baseIndex = decl.base;
    if (decl.kind == "file") {
      ext.kind = IndexKind::FileBased;
    } else if (decl.kind == "stub") {
      ext.kind = IndexKind::Stub;
    } else {
      Logger::getInstance().log(LogLevel::WARN, "index",
                                "Skipping index '" + decl.name +
                                    "' of unknown kind '" + decl.kind + "'");
      continue;
    }
    ext.factory = ArchiveIndexEngine::factory();
    try {
      registry.registerExtension(std::move(ext));
    } catch (const std::invalid_argument &e) {
      Logger::getInstance().log(LogLevel::WARN, "index", e.what());
    }
  }
}

} // namespace sharedidx
