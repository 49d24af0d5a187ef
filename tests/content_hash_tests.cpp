#include "gtest/gtest.h"
#include "chunk_test_utils.hpp"
#include "chunks/content_hash_registry.hpp"
#include "storage/content_hash_enumerator.hpp"
#include "utilities/errors.hpp"
#include "utilities/metrics.h"
#include <stdexcept>

using namespace sharedidx;

static ContentHashEnumerator tableOf(const std::vector<std::string>& contents) {
    ContentHashEnumerator builder;
    for (const auto& c : contents) builder.enumerate(sha256Of(c));
    return ContentHashEnumerator::load(builder.serialize());
}

TEST(ContentHashEnumerator, BuilderAssignsStableIds) {
    ContentHashEnumerator builder;
    EXPECT_EQ(builder.enumerate(sha256Of(std::string("a"))), 1);
    EXPECT_EQ(builder.enumerate(sha256Of(std::string("b"))), 2);
    EXPECT_EQ(builder.enumerate(sha256Of(std::string("a"))), 1);
    EXPECT_EQ(builder.size(), 2u);
    EXPECT_FALSE(builder.isReadOnly());
}

TEST(ContentHashEnumerator, LoadedTableIsReadOnly) {
    ContentHashEnumerator table = tableOf({"x", "y"});
    EXPECT_TRUE(table.isReadOnly());
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.tryEnumerate(sha256Of(std::string("y"))), 2);
    EXPECT_EQ(table.tryEnumerate(sha256Of(std::string("z"))), 0);
    EXPECT_THROW(table.enumerate(sha256Of(std::string("z"))), std::logic_error);
}

TEST(ContentHashEnumerator, LoadRejectsBadInput) {
    EXPECT_THROW(ContentHashEnumerator::load(test::bytesOf("garbage!")), StorageError);

    // Valid header, record of the wrong width.
    std::vector<std::byte> bytes = test::bytesOf(std::string(ContentHashEnumerator::MAGIC, 8));
    std::vector<std::byte> record = {std::byte{3}, std::byte{0}, std::byte{0}, std::byte{0},
                                     std::byte{'a'}, std::byte{'b'}, std::byte{'c'}};
    bytes.insert(bytes.end(), record.begin(), record.end());
    EXPECT_THROW(ContentHashEnumerator::load(bytes), StorageError);

    // Torn table.
    ContentHashEnumerator builder;
    builder.enumerate(sha256Of(std::string("a")));
    std::vector<std::byte> full = builder.serialize();
    full.pop_back();
    EXPECT_THROW(ContentHashEnumerator::load(full), StorageError);
}

TEST(ContentHashEnumerator, ClosedTableFindsNothing) {
    ContentHashEnumerator table = tableOf({"x"});
    table.close();
    EXPECT_TRUE(table.isClosed());
    EXPECT_EQ(table.tryEnumerate(sha256Of(std::string("x"))), 0);
}

TEST(ContentHashIds, EncodeChunkAndLocalId) {
    int64_t id = makeHashId(7, 42);
    EXPECT_GT(id, 0);
    EXPECT_EQ(chunkIdOf(id), 7);
    EXPECT_EQ(localIdOf(id), 42);
    EXPECT_NE(makeHashId(1, 1), kNullHashId);
    int64_t big = makeHashId(0x7fffffff, 0x7fffffff);
    EXPECT_GT(big, 0);
    EXPECT_EQ(chunkIdOf(big), 0x7fffffff);
    EXPECT_EQ(localIdOf(big), 0x7fffffff);
}

TEST(ContentHashRegistry, FirstChunkInIdOrderWins) {
    MetricsRegistry::instance().reset();
    ContentHashRegistry registry;
    EXPECT_TRUE(registry.openIfAbsent(5, [] { return tableOf({"shared", "only-five"}); }));
    EXPECT_TRUE(registry.openIfAbsent(2, [] { return tableOf({"only-two", "shared"}); }));

    int64_t shared = registry.tryEnumerateContentHash(sha256Of(std::string("shared")));
    EXPECT_EQ(chunkIdOf(shared), 2);
    EXPECT_EQ(localIdOf(shared), 2);

    int64_t five = registry.tryEnumerateContentHash(sha256Of(std::string("only-five")));
    EXPECT_EQ(chunkIdOf(five), 5);
    EXPECT_EQ(localIdOf(five), 2);

    EXPECT_EQ(registry.tryEnumerateContentHash(sha256Of(std::string("nowhere"))), kNullHashId);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().counter(
        "sharedidx_content_hash_lookups_total", {{"result", "hit"}}), 2);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().counter(
        "sharedidx_content_hash_lookups_total", {{"result", "miss"}}), 1);
}

TEST(ContentHashRegistry, OpenIfAbsentLoadsOnce) {
    ContentHashRegistry registry;
    int loads = 0;
    auto loader = [&] { ++loads; return tableOf({"a"}); };
    EXPECT_TRUE(registry.openIfAbsent(1, loader));
    EXPECT_FALSE(registry.openIfAbsent(1, loader));
    EXPECT_EQ(loads, 1);
    EXPECT_TRUE(registry.contains(1));
}

TEST(ContentHashRegistry, FailedLoadLeavesRegistryUnchanged) {
    ContentHashRegistry registry;
    EXPECT_THROW(registry.openIfAbsent(3, []() -> ContentHashEnumerator {
        throw StorageError("unreadable");
    }), StorageError);
    EXPECT_FALSE(registry.contains(3));
}

TEST(ContentHashRegistry, RemoveClosesTables) {
    ContentHashRegistry registry;
    registry.openIfAbsent(1, [] { return tableOf({"a"}); });
    registry.openIfAbsent(2, [] { return tableOf({"b"}); });
    EXPECT_EQ(registry.remove({1, 9}), 1u);
    EXPECT_EQ(registry.loadedChunkIds(), std::vector<int>({2}));
    EXPECT_EQ(registry.tryEnumerateContentHash(sha256Of(std::string("a"))), kNullHashId);
    registry.clear();
    EXPECT_TRUE(registry.loadedChunkIds().empty());
}
