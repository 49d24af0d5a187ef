#include "gtest/gtest.h"
#include "chunk_test_utils.hpp"
#include "storage/persistent_enumerator.hpp"
#include "utilities/errors.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace sharedidx;

class PersistentEnumeratorTest : public ::testing::Test {
protected:
    std::string path_;
    void SetUp() override {
        path_ = test::freshDir("enumerator") + "/descriptors";
    }
};

TEST_F(PersistentEnumeratorTest, EnumerateIsIdempotent) {
    PersistentStringEnumerator e(path_);
    int a = e.enumerate("chunk-A");
    int b = e.enumerate("chunk-B");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(e.enumerate("chunk-A"), a);
    EXPECT_EQ(e.size(), 2u);
}

TEST_F(PersistentEnumeratorTest, LookupsDoNotAssignIds) {
    PersistentStringEnumerator e(path_);
    EXPECT_EQ(e.tryEnumerate("missing"), 0);
    EXPECT_EQ(e.size(), 0u);
    int id = e.enumerate("chunk-A");
    EXPECT_EQ(e.tryEnumerate("chunk-A"), id);
    EXPECT_EQ(e.valueOf(id), std::optional<std::string>("chunk-A"));
    EXPECT_FALSE(e.valueOf(0).has_value());
    EXPECT_FALSE(e.valueOf(42).has_value());
}

TEST_F(PersistentEnumeratorTest, IdsSurviveReopen) {
    {
        PersistentStringEnumerator e(path_);
        e.enumerate("jdk-17");
        e.enumerate("kotlin-stdlib");
        e.close();
    }
    PersistentStringEnumerator reopened(path_);
    EXPECT_EQ(reopened.tryEnumerate("jdk-17"), 1);
    EXPECT_EQ(reopened.tryEnumerate("kotlin-stdlib"), 2);
    EXPECT_EQ(reopened.enumerate("guava"), 3);
}

TEST_F(PersistentEnumeratorTest, TornTrailingRecordIsDropped) {
    {
        PersistentStringEnumerator e(path_);
        e.enumerate("complete");
    }
    auto sizeBefore = std::filesystem::file_size(path_);
    {
        // Length prefix promising 100 bytes followed by only 3.
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        const char torn[] = {100, 0, 0, 0, 'a', 'b', 'c'};
        out.write(torn, sizeof(torn));
    }
    PersistentStringEnumerator e(path_);
    EXPECT_EQ(e.size(), 1u);
    EXPECT_EQ(std::filesystem::file_size(path_), sizeBefore);
    EXPECT_EQ(e.enumerate("next"), 2);
}

TEST_F(PersistentEnumeratorTest, RejectsForeignFile) {
    std::ofstream(path_) << "not an enumerator";
    EXPECT_THROW(PersistentStringEnumerator e(path_), StorageError);
}

TEST_F(PersistentEnumeratorTest, OperationsAfterCloseFail) {
    PersistentStringEnumerator e(path_);
    e.enumerate("chunk-A");
    e.close();
    EXPECT_TRUE(e.isClosed());
    EXPECT_NO_THROW(e.close());
    EXPECT_THROW(e.enumerate("chunk-B"), StorageError);
    EXPECT_THROW(e.tryEnumerate("chunk-A"), StorageError);
    EXPECT_THROW(e.valueOf(1), StorageError);
}
