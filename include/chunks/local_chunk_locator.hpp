#ifndef SHAREDIDX_LOCAL_CHUNK_LOCATOR_HPP
#define SHAREDIDX_LOCAL_CHUNK_LOCATOR_HPP

#include "chunks/chunk_descriptor.hpp"

#include <string>
#include <vector>

namespace sharedidx {

/**
 * @brief Descriptor of a chunk fragment already present on the local disk.
 *
 * "Downloading" copies the fragment file to the destination.
 */
class LocalChunkDescriptor : public ChunkDescriptor {
public:
  LocalChunkDescriptor(std::string id, std::string fragmentPath,
                       std::vector<OrderEntry> entries,
                       InfrastructureVersion version);

  std::string uniqueId() const override { return id_; }
  InfrastructureVersion supportedInfrastructureVersion() const override {
    return version_;
  }
  std::vector<OrderEntry> orderEntries() const override { return entries_; }

  void downloadChunk(const std::string &destination,
                     ProgressIndicator &progress) override;

  const std::string &fragmentPath() const { return fragmentPath_; }

private:
  std::string id_;
  std::string fragmentPath_;
  std::vector<OrderEntry> entries_;
  InfrastructureVersion version_;
};

/**
 * @brief Locator backed by a YAML manifest of local fragments.
 *
 * Manifest layout:
 *
 *     chunks:
 *       - id: jdk-17
 *         fragment: fragments/jdk-17.sidx   # relative to the manifest
 *         order_entries: [jdk-17]
 *         base_indexes: {FileTypes: "1"}
 *
 * A chunk is offered for a project when it shares at least one order entry
 * with the request.
 */
class LocalChunkLocator : public ChunkLocator {
public:
  /// @throws StorageError if the manifest cannot be read or parsed.
  explicit LocalChunkLocator(const std::string &manifestPath);

  std::string name() const override { return "local:" + manifestPath_; }

  std::vector<ChunkDescriptorPtr>
  locateIndex(const Project &project, const std::vector<OrderEntry> &entries,
              ProgressIndicator &progress) override;

  const std::vector<std::shared_ptr<LocalChunkDescriptor>> &descriptors() const {
    return descriptors_;
  }

private:
  std::string manifestPath_;
  std::vector<std::shared_ptr<LocalChunkDescriptor>> descriptors_;
};

} // namespace sharedidx

#endif // SHAREDIDX_LOCAL_CHUNK_LOCATOR_HPP
