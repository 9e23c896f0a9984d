#include <gtest/gtest.h>
#include <docseek/vector/sqlite_vector_store.h>

#include "../../common/test_helpers.h"

#include <stop_token>

using namespace docseek;
using namespace docseek::vector;

namespace {

VectorRecord makeRecord(const std::string& doc, size_t index, Embedding embedding,
                        MetadataMap metadata = {}) {
    VectorRecord r;
    r.document_id = doc;
    r.chunk_index = index;
    r.chunk_id = doc + "#" + std::to_string(index);
    r.content = "chunk " + std::to_string(index) + " of " + doc;
    r.embedding = std::move(embedding);
    r.source = doc;
    r.location = "Section " + std::to_string(index);
    r.metadata = std::move(metadata);
    r.metadata["source"] = doc;
    return r;
}

} // namespace

class SqliteVectorStoreTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(store_.open(":memory:")); }

    SqliteVectorStore store_;
};

TEST_F(SqliteVectorStoreTest, EmptyStore) {
    EXPECT_TRUE(store_.isOpen());
    EXPECT_EQ(store_.count().value(), 0u);
    EXPECT_EQ(store_.dimension().value(), 0u);
    EXPECT_TRUE(store_.listDocuments().value().empty());

    auto results = store_.searchSimilar({1.0f, 0.0f, 0.0f}, 5);
    ASSERT_TRUE(results);
    EXPECT_TRUE(results.value().empty());
}

TEST_F(SqliteVectorStoreTest, StoresAndRanksByCosine) {
    ASSERT_TRUE(store_.replaceDocument(
        "gpio.md", {makeRecord("gpio.md", 0, {1.0f, 0.0f, 0.0f}, {{"kind", "regular"}}),
                    makeRecord("gpio.md", 1, {0.6f, 0.8f, 0.0f}, {{"kind", "overview"}}),
                    makeRecord("gpio.md", 2, {0.0f, 0.0f, 1.0f})}));

    EXPECT_EQ(store_.count().value(), 3u);
    EXPECT_EQ(store_.dimension().value(), 3u);

    auto results = store_.searchSimilar({1.0f, 0.0f, 0.0f}, 2);
    ASSERT_TRUE(results) << results.error().message;
    ASSERT_EQ(results.value().size(), 2u);

    const auto& best = results.value()[0];
    EXPECT_EQ(best.chunk_id, "gpio.md#0");
    EXPECT_NEAR(best.relevance_score, 1.0f, 1e-5f);
    EXPECT_EQ(best.content, "chunk 0 of gpio.md");
    EXPECT_EQ(best.location, "Section 0");
    EXPECT_EQ(best.metadata.at("kind"), "regular");

    EXPECT_EQ(results.value()[1].chunk_id, "gpio.md#1");
    EXPECT_NEAR(results.value()[1].relevance_score, 0.6f, 1e-5f);
}

TEST_F(SqliteVectorStoreTest, FiltersOnMetadata) {
    ASSERT_TRUE(store_.replaceDocument(
        "a.md", {makeRecord("a.md", 0, {1.0f, 0.0f}, {{"vendor", "st"}, {"family", "f1"}}),
                 makeRecord("a.md", 1, {1.0f, 0.1f}, {{"vendor", "nxp"}})}));
    ASSERT_TRUE(
        store_.replaceDocument("b.md", {makeRecord("b.md", 0, {0.9f, 0.2f}, {{"vendor", "st"}})}));

    auto st = store_.searchSimilar({1.0f, 0.0f}, 10, {{"vendor", "st"}});
    ASSERT_TRUE(st);
    ASSERT_EQ(st.value().size(), 2u);
    for (const auto& r : st.value()) {
        EXPECT_EQ(r.metadata.at("vendor"), "st");
    }

    auto both = store_.searchSimilar({1.0f, 0.0f}, 10, {{"vendor", "st"}, {"family", "f1"}});
    ASSERT_TRUE(both);
    ASSERT_EQ(both.value().size(), 1u);
    EXPECT_EQ(both.value()[0].chunk_id, "a.md#0");

    auto none = store_.searchSimilar({1.0f, 0.0f}, 10, {{"vendor", "ti"}});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());

    auto bySource = store_.searchSimilar({1.0f, 0.0f}, 10, {{"source", "b.md"}});
    ASSERT_TRUE(bySource);
    ASSERT_EQ(bySource.value().size(), 1u);
}

TEST_F(SqliteVectorStoreTest, ReplaceDocumentIsIdempotent) {
    auto records = std::vector<VectorRecord>{makeRecord("rm.md", 0, {1.0f, 0.0f}),
                                             makeRecord("rm.md", 1, {0.0f, 1.0f})};
    ASSERT_TRUE(store_.replaceDocument("rm.md", records));
    ASSERT_TRUE(store_.replaceDocument("rm.md", records));
    EXPECT_EQ(store_.count().value(), 2u);

    // A shorter re-ingest removes the stale tail
    ASSERT_TRUE(store_.replaceDocument("rm.md", {makeRecord("rm.md", 0, {1.0f, 0.0f})}));
    EXPECT_EQ(store_.count().value(), 1u);

    // Other documents are untouched
    ASSERT_TRUE(store_.replaceDocument("other.md", {makeRecord("other.md", 0, {0.5f, 0.5f})}));
    ASSERT_TRUE(store_.replaceDocument("rm.md", {}));
    EXPECT_EQ(store_.count().value(), 1u);
    EXPECT_EQ(store_.listDocuments().value(), std::vector<std::string>{"other.md"});
}

TEST_F(SqliteVectorStoreTest, RejectsDimensionChanges) {
    ASSERT_TRUE(store_.replaceDocument("a.md", {makeRecord("a.md", 0, {1.0f, 0.0f, 0.0f})}));

    auto write = store_.replaceDocument("b.md", {makeRecord("b.md", 0, {1.0f, 0.0f})});
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, ErrorCode::DimensionMismatch);
    EXPECT_EQ(store_.count().value(), 1u);

    auto mixed = store_.replaceDocument(
        "c.md", {makeRecord("c.md", 0, {1.0f, 0.0f, 0.0f}), makeRecord("c.md", 1, {1.0f})});
    ASSERT_FALSE(mixed);
    EXPECT_EQ(mixed.error().code, ErrorCode::DimensionMismatch);

    auto query = store_.searchSimilar({1.0f, 0.0f}, 3);
    ASSERT_FALSE(query);
    EXPECT_EQ(query.error().code, ErrorCode::DimensionMismatch);
}

TEST_F(SqliteVectorStoreTest, RejectsForeignRecords) {
    auto result = store_.replaceDocument("a.md", {makeRecord("b.md", 0, {1.0f})});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SqliteVectorStoreTest, DeleteDocumentReportsCount) {
    ASSERT_TRUE(store_.replaceDocument(
        "a.md", {makeRecord("a.md", 0, {1.0f, 0.0f}), makeRecord("a.md", 1, {0.0f, 1.0f})}));
    EXPECT_EQ(store_.deleteDocument("a.md").value(), 2u);
    EXPECT_EQ(store_.deleteDocument("a.md").value(), 0u);
    EXPECT_EQ(store_.count().value(), 0u);
}

TEST_F(SqliteVectorStoreTest, HonoursStopToken) {
    std::stop_source source;
    source.request_stop();
    auto write =
        store_.replaceDocument("a.md", {makeRecord("a.md", 0, {1.0f})}, source.get_token());
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, ErrorCode::OperationCancelled);

    auto search = store_.searchSimilar({1.0f}, 1, {}, source.get_token());
    ASSERT_FALSE(search);
    EXPECT_EQ(search.error().code, ErrorCode::OperationCancelled);
}

TEST(SqliteVectorStorePersistenceTest, ReopenKeepsChunksAndDimension) {
    docseek::tests::TempDir dir;
    const auto path = (dir.path() / "vectors.db").string();
    {
        SqliteVectorStore store;
        ASSERT_TRUE(store.open(path));
        ASSERT_TRUE(store.replaceDocument(
            "rm.md", {makeRecord("rm.md", 0, {0.0f, 1.0f, 0.0f, 0.0f}, {{"page", "4"}})}));
    }

    SqliteVectorStore reopened;
    ASSERT_TRUE(reopened.open(path));
    EXPECT_EQ(reopened.count().value(), 1u);
    EXPECT_EQ(reopened.dimension().value(), 4u);
    auto results = reopened.searchSimilar({0.0f, 1.0f, 0.0f, 0.0f}, 1);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].metadata.at("page"), "4");
}

TEST(SqliteVectorStoreClosedTest, OperationsFailWhenClosed) {
    SqliteVectorStore store;
    EXPECT_FALSE(store.isOpen());
    auto count = store.count();
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code, ErrorCode::StoreFailure);
}

TEST_F(SqliteVectorStoreTest, InvalidUtf8MetadataIsStoredNotThrown) {
    auto record = makeRecord("rm.md", 0, {1.0f, 0.0f},
                             {{"section", std::string(99, 'a') + "\xC3"}, {"note", "\xFF ok"}});
    Result<void> stored;
    EXPECT_NO_THROW(stored = store_.replaceDocument("rm.md", {record}));
    ASSERT_TRUE(stored) << stored.error().message;

    auto results = store_.searchSimilar({1.0f, 0.0f}, 1);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].metadata.at("section"), std::string(99, 'a') + "\xEF\xBF\xBD");
    EXPECT_EQ(results.value()[0].metadata.at("note"), "\xEF\xBF\xBD ok");
}
