#include "chunks/local_chunk_locator.hpp"
#include "chunks/shared_index_chunk_configuration.hpp"
#include "storage/chunk_metadata.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sharedidx;

static void usage() {
  std::cout << "Usage: sharedidx pack <chunk_dir> <fragment>\n"
            << "       sharedidx list\n"
            << "       sharedidx load <project> [order_entry...]\n"
            << "       sharedidx lookup <sha256-hex>\n"
            << "       sharedidx metrics\n";
}

static std::unique_ptr<SharedIndexChunkConfiguration>
openConfiguration(const StorageOptions &opts) {
  auto indexes = std::make_shared<IndexRegistry>();
  registerDeclaredIndexes(*indexes, opts.indexes);
  return std::make_unique<SharedIndexChunkConfiguration>(opts, indexes);
}

static int pack_command(const StorageOptions &opts, const std::string &dir,
                        const std::string &fragment) {
  if (!std::filesystem::is_directory(dir)) {
    std::cout << "Not a directory: " << dir << std::endl;
    return 1;
  }
  packChunkDirectory(dir, fragment, opts.compressionLevel, currentTimeMillis());
  std::cout << "Packed " << dir << " into " << fragment << std::endl;
  return 0;
}

static int list_command(const StorageOptions &opts) {
  auto config = openConfiguration(opts);
  std::cout << "Id\tChunk" << std::endl;
  for (const auto &kv : config->registeredChunks())
    std::cout << kv.first << '\t' << kv.second << std::endl;
  return 0;
}

static int load_command(const StorageOptions &opts, const std::string &name,
                        const std::vector<std::string> &entryNames) {
  if (opts.manifest.empty()) {
    std::cout << "No manifest configured (set 'manifest' in the config)"
              << std::endl;
    return 1;
  }
  auto config = openConfiguration(opts);
  config->addLocator(std::make_shared<LocalChunkLocator>(opts.manifest));

  auto project = std::make_shared<Project>(name);
  std::vector<OrderEntry> entries;
  for (const auto &e : entryNames)
    entries.push_back(OrderEntry{e});
  auto progress = std::make_shared<ProgressIndicator>();
  config->locateIndexes(project, entries, progress).get();

  std::cout << "Chunk\tIndexes" << std::endl;
  for (int chunkId : config->chunkRegistry().attachedChunkIds()) {
    std::cout << chunkId << '\t'
              << config->chunkRegistry().chunksOf(chunkId).size() << std::endl;
  }
  config->projectClosed(*project);
  return 0;
}

static int lookup_command(const StorageOptions &opts, const std::string &hex) {
  ContentHash hash = digestFromHex(hex);
  auto config = openConfiguration(opts);
  Project session("sharedidx-lookup");
  for (const auto &kv : config->registeredChunks())
    config->attachExistingChunk(kv.first, session);

  int64_t id = config->tryEnumerateContentHash(hash);
  if (id == kNullHashId) {
    std::cout << "Not found" << std::endl;
  } else {
    std::cout << "chunk=" << chunkIdOf(id) << " local=" << localIdOf(id)
              << " global=" << id << std::endl;
  }
  config->projectClosed(session);
  return id == kNullHashId ? 1 : 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  StorageOptions opts = loadStorageOptions(defaultConfigPath());
  try {
    std::filesystem::create_directories(
        std::filesystem::path(opts.logFile).parent_path());
    Logger::init(opts.logFile, opts.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  std::string cmd = argv[1];
  try {
    if (cmd == "pack" && argc >= 4) {
      return pack_command(opts, argv[2], argv[3]);
    } else if (cmd == "list") {
      return list_command(opts);
    } else if (cmd == "load" && argc >= 3) {
      return load_command(opts, argv[2],
                          std::vector<std::string>(argv + 3, argv + argc));
    } else if (cmd == "lookup" && argc >= 3) {
      return lookup_command(opts, argv[2]);
    } else if (cmd == "metrics") {
      auto config = openConfiguration(opts);
      config->dispose();
      std::cout << MetricsRegistry::instance().toPrometheus();
      return 0;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    Logger::getInstance().log(LogLevel::ERROR, "ctl", e.what());
    return 1;
  }
  usage();
  return 1;
}
