#include <gtest/gtest.h>
#include <citestream/search/candidate_retriever.h>

#include "../../common/fakes.h"

#include <stdexcept>

using namespace citestream;
using namespace citestream::search;

class CandidateRetrieverTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<test::FakeEmbeddingProvider>(8);
        embedder_ = ModelService<vector::IEmbeddingProvider>::fromInstance("embedder", provider_);
        index_ = std::make_shared<test::FakeVectorIndex>(8);
    }

    std::shared_ptr<test::FakeEmbeddingProvider> provider_;
    std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedder_;
    std::shared_ptr<test::FakeVectorIndex> index_;
};

TEST_F(CandidateRetrieverTest, QueriesSessionFilteredNamespace) {
    index_->setMatches({test::makeMatch("p1", 0.2f), test::makeMatch("p2", 0.4f)});
    RetrieverConfig config;
    config.indexNamespace = "lectures";
    config.topKCandidates = 7;
    CandidateRetriever retriever(embedder_, index_, config);

    auto candidates = retriever.retrieve("enriched query", "session-1");
    ASSERT_TRUE(candidates);
    ASSERT_EQ(candidates.value().size(), 2u);
    EXPECT_EQ(candidates.value()[0].id, "p1");
    EXPECT_FLOAT_EQ(candidates.value()[0].distance, 0.2f);
    EXPECT_EQ(candidates.value()[0].metadata.documentId, "doc-1");
    EXPECT_EQ(candidates.value()[0].metadata.pageNumber, 4);

    EXPECT_EQ(provider_->lastText(), "enriched query");
    EXPECT_EQ(index_->lastNamespace(), "lectures");
    EXPECT_EQ(index_->lastTopK(), 7u);
    EXPECT_EQ(index_->lastFilter(), (vector::MetadataFilter{{"session_id", "session-1"}}));
}

TEST_F(CandidateRetrieverTest, NoMatchesIsEmptyNotError) {
    CandidateRetriever retriever(embedder_, index_);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_TRUE(candidates);
    EXPECT_TRUE(candidates.value().empty());
}

TEST_F(CandidateRetrieverTest, EmbeddingFailureIsEmbeddingFailed) {
    provider_->setFail(true);
    CandidateRetriever retriever(embedder_, index_);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_FALSE(candidates);
    EXPECT_EQ(candidates.error().code, ErrorCode::EmbeddingFailed);
    EXPECT_EQ(index_->callCount(), 0);
}

TEST_F(CandidateRetrieverTest, UnloadableModelIsModelUnavailable) {
    auto broken = std::make_shared<ModelService<vector::IEmbeddingProvider>>(
        "embedder", []() -> Result<std::shared_ptr<vector::IEmbeddingProvider>> {
            throw std::runtime_error("weights missing");
        });
    CandidateRetriever retriever(broken, index_);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_FALSE(candidates);
    EXPECT_EQ(candidates.error().code, ErrorCode::ModelUnavailable);
}

TEST_F(CandidateRetrieverTest, DimensionMismatchIsReportedWithoutQuerying) {
    auto wideIndex = std::make_shared<test::FakeVectorIndex>(16);
    CandidateRetriever retriever(embedder_, wideIndex);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_FALSE(candidates);
    EXPECT_EQ(candidates.error().code, ErrorCode::DimensionMismatch);
    EXPECT_EQ(wideIndex->callCount(), 0);
}

TEST_F(CandidateRetrieverTest, IndexFailureIsVectorIndexError) {
    index_->setFail(true);
    CandidateRetriever retriever(embedder_, index_);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_FALSE(candidates);
    EXPECT_EQ(candidates.error().code, ErrorCode::VectorIndexError);
}

TEST_F(CandidateRetrieverTest, MissingIndexIsNotInitialized) {
    CandidateRetriever retriever(embedder_, nullptr);
    auto candidates = retriever.retrieve("query", "session-1");
    ASSERT_FALSE(candidates);
    EXPECT_EQ(candidates.error().code, ErrorCode::NotInitialized);
}

TEST(CandidateMetadataTest, ParsesAttributes) {
    auto meta = CandidateMetadata::fromAttributes(
        {{"document_id", "d"}, {"page_number", "x12"}, {"section_heading", ""}});
    EXPECT_EQ(meta.documentId, "d");
    EXPECT_EQ(meta.documentName, "Unknown");
    EXPECT_EQ(meta.pageNumber, 0);
    EXPECT_FALSE(meta.sectionHeading.has_value());

    auto none = CandidateMetadata::fromAttributes({{"document_id", ""}});
    EXPECT_FALSE(none.documentId.has_value());
}
