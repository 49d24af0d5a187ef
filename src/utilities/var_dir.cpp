#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace sharedidx {

static std::string varDir = [] {
  const char *env = std::getenv("SHAREDIDX_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/sharedidx"))
    return std::string("/var/sharedidx");
  return std::string("var/sharedidx");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string sharedIndexRoot() { return getVarDir() + "/shared_indexes"; }

std::string descriptorsPath(const std::string &root) {
  return root + "/descriptors";
}

std::string chunkStoragePath(const std::string &root) {
  return root + "/chunks.sidx";
}

std::string tempChunkPath(const std::string &root, const std::string &chunkId) {
  return root + "/" + chunkId + "_temp.sidx";
}

} // namespace sharedidx
