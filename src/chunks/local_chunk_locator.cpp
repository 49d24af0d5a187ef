#include "chunks/local_chunk_locator.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace sharedidx {

LocalChunkDescriptor::LocalChunkDescriptor(std::string id,
                                           std::string fragmentPath,
                                           std::vector<OrderEntry> entries,
                                           InfrastructureVersion version)
    : id_(std::move(id)), fragmentPath_(std::move(fragmentPath)),
      entries_(std::move(entries)), version_(std::move(version)) {}

void LocalChunkDescriptor::downloadChunk(const std::string &destination,
                                         ProgressIndicator &progress) {
  progress.setText("Downloading shared index " + id_);
  std::error_code ec;
  uint64_t total = fs::file_size(fragmentPath_, ec);
  if (ec) {
    throw StorageError("Fragment " + fragmentPath_ + " unavailable: " +
                       ec.message());
  }

  std::ifstream in(fragmentPath_, std::ios::binary);
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!in || !out) {
    throw StorageError("Cannot copy " + fragmentPath_ + " to " + destination);
  }

  std::vector<char> buffer(64 * 1024);
  uint64_t copied = 0;
  while (in) {
    progress.checkCanceled();
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = in.gcount();
    if (n <= 0)
      break;
    out.write(buffer.data(), n);
    if (!out) {
      throw StorageError("Write failed for " + destination);
    }
    copied += static_cast<uint64_t>(n);
    if (total > 0)
      progress.setFraction(static_cast<double>(copied) / total);
  }
  out.flush();
  if (!out || copied != total) {
    throw StorageError("Incomplete copy of " + fragmentPath_);
  }
  progress.setFraction(1.0);
}

LocalChunkLocator::LocalChunkLocator(const std::string &manifestPath)
    : manifestPath_(manifestPath) {
  fs::path base = fs::path(manifestPath).parent_path();
  try {
    YAML::Node node = YAML::LoadFile(manifestPath);
    for (const auto &item : node["chunks"]) {
      std::string id = item["id"].as<std::string>();
      fs::path fragment = item["fragment"].as<std::string>();
      if (fragment.is_relative())
        fragment = base / fragment;

      std::vector<OrderEntry> entries;
      for (const auto &e : item["order_entries"]) {
        entries.push_back(OrderEntry{e.as<std::string>()});
      }
      InfrastructureVersion version;
      if (item["base_indexes"]) {
        for (const auto &kv : item["base_indexes"]) {
          version.baseIndexes[kv.first.as<std::string>()] =
              kv.second.as<std::string>();
        }
      }
      descriptors_.push_back(std::make_shared<LocalChunkDescriptor>(
          id, fragment.string(), std::move(entries), std::move(version)));
    }
  } catch (const YAML::Exception &e) {
    throw StorageError("Cannot load manifest " + manifestPath + ": " +
                       e.what());
  }
  Logger::getInstance().log(LogLevel::DEBUG, "locator",
                            "Loaded " + std::to_string(descriptors_.size()) +
                                " chunk(s) from " + manifestPath);
}

std::vector<ChunkDescriptorPtr>
LocalChunkLocator::locateIndex(const Project &project,
                               const std::vector<OrderEntry> &entries,
                               ProgressIndicator &progress) {
  progress.checkCanceled();
  std::vector<ChunkDescriptorPtr> found;
  for (const auto &descriptor : descriptors_) {
    const auto &offered = descriptor->orderEntries();
    bool matches = std::any_of(entries.begin(), entries.end(),
                               [&offered](const OrderEntry &e) {
                                 return std::find(offered.begin(), offered.end(),
                                                  e) != offered.end();
                               });
    if (matches)
      found.push_back(descriptor);
  }
  Logger::getInstance().log(LogLevel::DEBUG, "locator",
                            name() + " offers " + std::to_string(found.size()) +
                                " chunk(s) for " + project.name());
  return found;
}

} // namespace sharedidx
