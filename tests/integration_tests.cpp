#include "gtest/gtest.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "chunk_test_utils.hpp"
#include "chunks/local_chunk_locator.hpp"
#include "chunks/shared_index_chunk_configuration.hpp"
#include "storage/chunk_archive.hpp"
#include "storage/chunk_metadata.hpp"
#include "utilities/logger.h"

using namespace sharedidx;
namespace fs = std::filesystem;

// Packs prebuilt chunk directories into a local mirror, then drives the
// configuration through the manifest locator on a background worker.
class IntegrationTest : public ::testing::Test {
protected:
    std::string base_;
    std::string manifest_;

    void packChunk(const std::string& name, const std::vector<std::string>& contents,
                   const std::string& extraFile) {
        fs::path dir = fs::path(base_) / "build" / name;
        fs::create_directories(dir / "IdIndex");
        fs::create_directories(dir / "Stubs" / "java.class.shortName");
        std::ofstream(dir / "IdIndex" / "data") << name << " ids";
        std::ofstream(dir / "Stubs" / "java.class.shortName" / "data") << name << " classes";
        std::ofstream(dir / "IdIndex" / extraFile) << "extra";

        ContentHashEnumerator hashes;
        for (const auto& c : contents) hashes.enumerate(sha256Of(c));
        std::vector<std::byte> table = hashes.serialize();
        std::ofstream(dir / kHashesEntry, std::ios::binary)
            .write(reinterpret_cast<const char*>(table.data()),
                   static_cast<std::streamsize>(table.size()));

        fs::create_directories(fs::path(base_) / "mirror");
        ChunkArchiveWriter writer((fs::path(base_) / "mirror" / (name + ".sidx")).string(), 3);
        writer.addTree(dir.string());
        writer.finish();
    }

    void SetUp() override {
        base_ = test::freshDir("integration");
        packChunk("jdk-17", {"java/lang/String.java", "java/util/List.java"}, "jdk");
        packChunk("guava-31", {"com/google/common/collect/Lists.java"}, "guava");

        manifest_ = base_ + "/manifest.yaml";
        std::ofstream(manifest_) <<
            "chunks:\n"
            "  - id: jdk-17\n"
            "    fragment: mirror/jdk-17.sidx\n"
            "    order_entries: [jdk]\n"
            "    base_indexes: {FileTypes: \"1\"}\n"
            "  - id: guava-31\n"
            "    fragment: mirror/guava-31.sidx\n"
            "    order_entries: [guava]\n"
            "    base_indexes: {FileTypes: \"1\"}\n"
            "  - id: legacy\n"
            "    fragment: mirror/missing.sidx\n"
            "    order_entries: [jdk]\n"
            "    base_indexes: {FileTypes: \"0\"}\n";
        Logger::getInstance().log(LogLevel::INFO, "integration", "Mirror ready at " + base_);
    }
};

TEST_F(IntegrationTest, LocateLoadAndLookupAcrossProjects) {
    StorageOptions opts = test::testOptions(base_ + "/root");
    opts.sameThreadExecutor = false;
    opts.manifest = manifest_;
    SharedIndexChunkConfiguration config(opts, test::makeIndexes());
    config.addLocator(std::make_shared<LocalChunkLocator>(opts.manifest));

    auto app = std::make_shared<Project>("app");
    auto lib = std::make_shared<Project>("lib");
    auto progress = std::make_shared<ProgressIndicator>();
    auto appDone = config.locateIndexes(app, {OrderEntry{"jdk"}, OrderEntry{"guava"}}, progress);
    auto libDone = config.locateIndexes(lib, {OrderEntry{"jdk"}}, progress);
    appDone.get();
    libDone.get();

    int jdk = config.chunkIdOf("jdk-17");
    int guava = config.chunkIdOf("guava-31");
    ASSERT_NE(jdk, 0);
    ASSERT_NE(guava, 0);
    EXPECT_EQ(config.chunkIdOf("legacy"), 0);
    EXPECT_FALSE(fs::exists(tempChunkPath(opts.rootDir, "jdk-17")));

    int64_t list = config.tryEnumerateContentHash(sha256Of(std::string("java/util/List.java")));
    EXPECT_EQ(chunkIdOf(list), jdk);
    EXPECT_EQ(localIdOf(list), 2);

    IndexEngine* ids = config.getChunk("IdIndex", guava);
    ASSERT_NE(ids, nullptr);
    EXPECT_EQ(ids->keys(), (std::vector<std::string>{"data", "guava"}));
    EXPECT_EQ(test::textOf(*ids->value("data")), "guava-31 ids");

    std::vector<std::string> classes;
    config.processChunks("java.class.shortName", [&](const SharedIndexChunkPtr& chunk) {
        classes.push_back(test::textOf(*chunk->engine()->value("data")));
        return true;
    });
    std::sort(classes.begin(), classes.end());
    EXPECT_EQ(classes, (std::vector<std::string>{"guava-31 classes", "jdk-17 classes"}));

    // guava is only used by app.
    config.projectClosed(*app);
    EXPECT_EQ(config.getChunk("IdIndex", guava), nullptr);
    EXPECT_NE(config.getChunk("IdIndex", jdk), nullptr);
    EXPECT_EQ(config.tryEnumerateContentHash(
                  sha256Of(std::string("com/google/common/collect/Lists.java"))),
              kNullHashId);

    config.projectClosed(*lib);
    EXPECT_EQ(config.chunkRegistry().size(), 0u);
    config.dispose();
}

TEST_F(IntegrationTest, RestartReusesDownloadedChunks) {
    StorageOptions opts = test::testOptions(base_ + "/root");
    opts.manifest = manifest_;
    auto progress = std::make_shared<ProgressIndicator>();
    uint64_t archiveSize = 0;
    {
        SharedIndexChunkConfiguration config(opts, test::makeIndexes());
        config.addLocator(std::make_shared<LocalChunkLocator>(opts.manifest));
        config.locateIndexes(std::make_shared<Project>("app"), {OrderEntry{"jdk"}}, progress).get();
        archiveSize = fs::file_size(chunkStoragePath(opts.rootDir));
    }

    // Mirror gone: everything must come from the archive.
    fs::remove_all(fs::path(base_) / "mirror");
    SharedIndexChunkConfiguration config(opts, test::makeIndexes());
    config.addLocator(std::make_shared<LocalChunkLocator>(opts.manifest));
    auto app = std::make_shared<Project>("app");
    config.locateIndexes(app, {OrderEntry{"jdk"}}, progress).get();

    EXPECT_EQ(fs::file_size(chunkStoragePath(opts.rootDir)), archiveSize);
    EXPECT_NE(config.getChunk("IdIndex", config.chunkIdOf("jdk-17")), nullptr);
    EXPECT_NE(config.tryEnumerateContentHash(sha256Of(std::string("java/lang/String.java"))),
              kNullHashId);
}
