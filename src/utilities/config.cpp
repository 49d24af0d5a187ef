#include "utilities/config.hpp"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace sharedidx {

std::string defaultConfigPath() {
  const char *cfg = std::getenv("SHAREDIDX_CONFIG");
  if (cfg && cfg[0] != '\0')
    return cfg;
  return "sharedidx_config.yaml";
}

static void readIndexes(const YAML::Node &node, StorageOptions &opts) {
  if (!node || !node.IsSequence())
    return;
  for (const auto &item : node) {
    IndexDeclaration decl;
    decl.name = item["name"].as<std::string>();
    if (item["kind"])
      decl.kind = item["kind"].as<std::string>();
    if (item["version"])
      decl.version = item["version"].as<std::string>();
    if (item["base"])
      decl.base = item["base"].as<bool>();
    opts.indexes.push_back(decl);
  }
}

StorageOptions loadStorageOptions(const std::string &path) {
  StorageOptions opts;
  opts.rootDir = sharedIndexRoot();

  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["root_dir"])
        opts.rootDir = node["root_dir"].as<std::string>();
      if (node["compression_level"])
        opts.compressionLevel = node["compression_level"].as<int>();
      if (node["same_thread_executor"])
        opts.sameThreadExecutor = node["same_thread_executor"].as<bool>();
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        opts.logLevel =
            Logger::levelFromString(node["log_level"].as<std::string>());
      if (node["manifest"])
        opts.manifest = node["manifest"].as<std::string>();
      readIndexes(node["indexes"], opts);
    } catch (const YAML::Exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, "config",
                                "Failed to parse " + path + ": " + e.what() +
                                    ". Using defaults.");
      opts = StorageOptions{};
      opts.rootDir = sharedIndexRoot();
    }
  }

  if (const char *env = std::getenv("SHAREDIDX_ROOT"))
    opts.rootDir = env;
  if (const char *env = std::getenv("SHAREDIDX_COMPRESSION_LEVEL"))
    opts.compressionLevel = std::atoi(env);
  if (const char *env = std::getenv("SHAREDIDX_LOG_LEVEL"))
    opts.logLevel = Logger::levelFromString(env, opts.logLevel);
  if (opts.logFile.empty())
    opts.logFile = logsDir() + "/sharedidx.log";
  return opts;
}

} // namespace sharedidx
