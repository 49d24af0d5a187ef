#include "gtest/gtest.h"
#include "chunk_test_utils.hpp"
#include "storage/chunk_archive.hpp"
#include "storage/chunk_metadata.hpp"
#include "utilities/errors.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

using namespace sharedidx;

class ChunkMetadataTest : public ::testing::Test {
protected:
    std::string dir_;

    std::unique_ptr<ArchiveFileSystem> archiveWith(const std::map<std::string, std::string>& files) {
        dir_ = test::freshDir("metadata");
        std::string frag = dir_ + "/frag.sidx";
        ChunkArchiveWriter writer(frag);
        for (const auto& kv : files) writer.addFile(kv.first, kv.second);
        writer.finish();
        std::string archive = dir_ + "/chunks.sidx";
        ChunkArchiveAppender(archive).appendFragment(frag, "1");
        return std::make_unique<ArchiveFileSystem>(archive);
    }
};

TEST_F(ChunkMetadataTest, TimestampParsing) {
    auto view = archiveWith({{"timestamp", " 1600000000000\n"}});
    EXPECT_EQ(readTimestamp(*view, "1"), 1600000000000LL);
    EXPECT_EQ(readTimestamp(*view, "2"), 0);

    view = archiveWith({{"timestamp", "yesterday"}});
    EXPECT_EQ(readTimestamp(*view, "1"), 0);
    view = archiveWith({{"timestamp", "12abc"}});
    EXPECT_EQ(readTimestamp(*view, "1"), 0);
    view = archiveWith({{"timestamp", ""}});
    EXPECT_EQ(readTimestamp(*view, "1"), 0);
    view = archiveWith({{"timestamp", "-5"}});
    EXPECT_EQ(readTimestamp(*view, "1"), -5);
}

TEST_F(ChunkMetadataTest, TimestampEntryIsDecimalMillis) {
    EXPECT_EQ(test::textOf(timestampEntry(1234)), "1234");
    EXPECT_GT(currentTimeMillis(), 1600000000000LL);
}

TEST_F(ChunkMetadataTest, EmptyIndexLists) {
    auto view = archiveWith({{"empty-indices", "IdIndex\n\n  FileTypes \r\n"},
                             {"empty-stub-indices", "java.method.name"}});
    EXPECT_EQ(readEmptyIndexes(*view, "1"), (std::set<std::string>{"FileTypes", "IdIndex"}));
    EXPECT_EQ(readEmptyStubIndexes(*view, "1"), std::set<std::string>{"java.method.name"});
    EXPECT_TRUE(readEmptyIndexes(*view, "9").empty());
    EXPECT_EQ(test::textOf(nameListEntry({"b", "a"})), "a\nb\n");
}

TEST(InfrastructureVersionFormat, RoundTripsThroughYaml) {
    InfrastructureVersion v;
    v.baseIndexes = {{"FileTypes", "4"}};
    v.fileBasedIndexes = {{"FileTypes", "4"}, {"IdIndex", "3"}};
    v.stubIndexes = {{"java.class.shortName", "2"}};
    std::string text = formatInfrastructureVersion(v);
    EXPECT_NE(text.find("base_indexes"), std::string::npos);
    EXPECT_EQ(parseInfrastructureVersion(text), v);

    InfrastructureVersion empty;
    EXPECT_EQ(parseInfrastructureVersion(formatInfrastructureVersion(empty)), empty);
}

TEST(InfrastructureVersionFormat, MissingSectionsAreEmpty) {
    InfrastructureVersion v = parseInfrastructureVersion("base_indexes:\n  FileTypes: \"1\"\n");
    EXPECT_EQ(v.baseIndexes.at("FileTypes"), "1");
    EXPECT_TRUE(v.fileBasedIndexes.empty());
    EXPECT_TRUE(v.stubIndexes.empty());
}

TEST(InfrastructureVersionFormat, MalformedDocumentsAreCorruption) {
    EXPECT_THROW(parseInfrastructureVersion("just a scalar"), CorruptedIndexError);
    EXPECT_THROW(parseInfrastructureVersion("base_indexes: [1, 2]"), CorruptedIndexError);
    EXPECT_THROW(parseInfrastructureVersion("base_indexes: {a: 1"), CorruptedIndexError);
}

TEST_F(ChunkMetadataTest, VersionEntryIsOptional) {
    InfrastructureVersion v = test::baseVersion("2");
    auto view = archiveWith({{"infrastructure-version",
                              test::textOf(infrastructureVersionEntry(v))}});
    auto stored = readInfrastructureVersion(*view, "1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->isCompatibleWith(v));
    EXPECT_FALSE(readInfrastructureVersion(*view, "2").has_value());
}

TEST(PackChunkDirectoryTest, PacksTreeAndFillsTimestamp) {
    namespace fs = std::filesystem;
    std::string dir = test::freshDir("pack");
    fs::create_directories(dir + "/chunk/IdIndex");
    fs::create_directories(dir + "/chunk/Stubs/java.method.name");
    std::ofstream(dir + "/chunk/IdIndex/data") << "ids";
    std::ofstream(dir + "/chunk/Stubs/java.method.name/data") << "methods";

    std::string fragment = dir + "/chunk.sidx";
    packChunkDirectory(dir + "/chunk", fragment, 3, 1700000000000LL);
    std::string archive = dir + "/chunks.sidx";
    ChunkArchiveAppender(archive).appendFragment(fragment, "jdk-17");
    ArchiveFileSystem view(archive);

    EXPECT_EQ(test::textOf(view.read("jdk-17/IdIndex/data")), "ids");
    EXPECT_EQ(test::textOf(view.read("jdk-17/Stubs/java.method.name/data")), "methods");
    EXPECT_EQ(readTimestamp(view, "jdk-17"), 1700000000000LL);
}

TEST(PackChunkDirectoryTest, KeepsExistingTimestamp) {
    namespace fs = std::filesystem;
    std::string dir = test::freshDir("pack-timestamp");
    fs::create_directories(dir + "/chunk/IdIndex");
    std::ofstream(dir + "/chunk/IdIndex/data") << "ids";
    std::ofstream(dir + "/chunk/timestamp") << "1600000000000";

    std::string fragment = dir + "/chunk.sidx";
    packChunkDirectory(dir + "/chunk", fragment, 0, 1700000000000LL);
    std::string archive = dir + "/chunks.sidx";
    ChunkArchiveAppender(archive).appendFragment(fragment, "guava");
    ArchiveFileSystem view(archive);
    EXPECT_EQ(readTimestamp(view, "guava"), 1600000000000LL);

    EXPECT_THROW(packChunkDirectory(dir + "/missing", dir + "/none.sidx", 0, 1),
                 StorageError);
    EXPECT_FALSE(fs::exists(dir + "/none.sidx"));
}
