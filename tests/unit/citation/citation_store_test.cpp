#include <gtest/gtest.h>
#include <citestream/citation/citation_store.h>

#include <filesystem>
#include <memory>
#include <random>

using namespace citestream;
using namespace citestream::citation;

namespace {

Citation makeCitation(int rank, const std::string& documentId) {
    Citation c;
    c.rank = rank;
    c.documentId = documentId;
    c.documentName = documentId + ".pdf";
    c.pageNumber = rank * 10;
    c.snippet = "snippet " + documentId;
    c.relevanceScore = 1.0f - 0.1f * static_cast<float>(rank);
    return c;
}

} // namespace

class CitationStoreTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        auto store = createCitationStore(GetParam(), ":memory:");
        ASSERT_TRUE(store) << store.error().message;
        store_ = store.value();
    }

    std::shared_ptr<ICitationStore> store_;
};

TEST_P(CitationStoreTest, AppendAssignsIdsInInputOrder) {
    auto ids = store_->append("session-1", 0, {makeCitation(1, "a"), makeCitation(2, "b")});
    ASSERT_TRUE(ids);
    ASSERT_EQ(ids.value().size(), 2u);
    EXPECT_NE(ids.value()[0], ids.value()[1]);
}

TEST_P(CitationStoreTest, ListOrdersByWindowThenRank) {
    ASSERT_TRUE(store_->append("session-1", 2, {makeCitation(1, "c")}));
    ASSERT_TRUE(store_->append("session-1", 0, {makeCitation(2, "b"), makeCitation(1, "a")}));
    ASSERT_TRUE(store_->append("session-2", 1, {makeCitation(1, "z")}));

    auto rows = store_->list("session-1");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[0].citation.documentId, "a");
    EXPECT_EQ(rows.value()[0].citation.windowIndex, 0);
    EXPECT_EQ(rows.value()[1].citation.documentId, "b");
    EXPECT_EQ(rows.value()[2].citation.documentId, "c");
    EXPECT_EQ(rows.value()[2].citation.windowIndex, 2);
    for (const auto& row : rows.value()) {
        EXPECT_EQ(row.citation.sessionId, "session-1");
        EXPECT_GT(row.createdAtMs, 0);
    }
}

TEST_P(CitationStoreTest, PreservesOptionalFields) {
    auto withExtras = makeCitation(1, "a");
    withExtras.sectionHeading = "Chapter 2";
    withExtras.transcriptFragmentId = "frag-9";
    ASSERT_TRUE(store_->append("session-1", 0, {withExtras, makeCitation(2, "b")}));

    auto rows = store_->list("session-1");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 2u);
    const auto& first = rows.value()[0].citation;
    EXPECT_EQ(first.sectionHeading, "Chapter 2");
    EXPECT_EQ(first.transcriptFragmentId, "frag-9");
    EXPECT_EQ(first.pageNumber, 10);
    EXPECT_EQ(first.documentName, "a.pdf");
    EXPECT_NEAR(first.relevanceScore, 0.9f, 1e-6f);
    EXPECT_FALSE(rows.value()[1].citation.sectionHeading.has_value());
    EXPECT_FALSE(rows.value()[1].citation.transcriptFragmentId.has_value());
}

TEST_P(CitationStoreTest, UnknownSessionIsEmpty) {
    auto rows = store_->list("nobody");
    ASSERT_TRUE(rows);
    EXPECT_TRUE(rows.value().empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, CitationStoreTest, ::testing::Values("memory", "sqlite"));

TEST(CitationStoreFactoryTest, UnknownBackendIsInvalidArgument) {
    auto store = createCitationStore("postgres", "");
    ASSERT_FALSE(store);
    EXPECT_EQ(store.error().code, ErrorCode::InvalidArgument);
}

class SqliteCitationStoreFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() /
               ("citestream_store_test_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(SqliteCitationStoreFileTest, CreatesParentDirectoryAndPersistsAcrossReopen) {
    const auto path = dir_ / "nested" / "citations.db";
    {
        auto store = SqliteCitationStore::open(path);
        ASSERT_TRUE(store) << store.error().message;
        ASSERT_TRUE(store.value()->append("session-1", 1, {makeCitation(1, "a")}));
    }
    EXPECT_TRUE(std::filesystem::exists(path));

    auto reopened = SqliteCitationStore::open(path);
    ASSERT_TRUE(reopened);
    auto rows = reopened.value()->list("session-1");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].citation.documentId, "a");
    EXPECT_EQ(rows.value()[0].citation.windowIndex, 1);
}
