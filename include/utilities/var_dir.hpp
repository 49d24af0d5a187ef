#pragma once

#include <string>

namespace sharedidx {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();

/// Default configuration root for the shared index storage.
std::string sharedIndexRoot();

/// Path of the persistent chunk descriptor enumerator inside @p root.
std::string descriptorsPath(const std::string &root);

/// Path of the append-only chunk archive inside @p root.
std::string chunkStoragePath(const std::string &root);

/// Temporary download target for a chunk with unique id @p chunkId.
std::string tempChunkPath(const std::string &root, const std::string &chunkId);

} // namespace sharedidx
