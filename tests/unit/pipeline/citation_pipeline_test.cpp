#include <gtest/gtest.h>
#include <citestream/pipeline/citation_pipeline.h>

#include "../../common/pipeline_fixture.h"

using namespace citestream;
using namespace citestream::pipeline;

class CitationPipelineTest : public test::PipelineFixture {};

TEST_F(CitationPipelineTest, RanksAndThresholdsCitations) {
    useStandardCandidates();
    auto pipeline = makePipeline();

    const std::string text = "The mitochondria is the powerhouse of the cell.";
    auto response = pipeline->query("session-1", text, 3, std::string("frag-1"));
    ASSERT_TRUE(response) << response.error().message;

    const auto& r = response.value();
    EXPECT_EQ(r.windowIndex, 3);
    ASSERT_EQ(r.citations.size(), 1u);
    const auto& c = r.citations[0];
    EXPECT_EQ(c.rank, 1);
    EXPECT_EQ(c.documentId, "doc-a");
    EXPECT_FLOAT_EQ(c.relevanceScore, 0.9f);
    EXPECT_EQ(c.snippet, "Mitochondria produce ATP.");
    EXPECT_EQ(c.transcriptFragmentId, "frag-1");
    EXPECT_EQ(r.queryMetadata.keywords, (std::vector<std::string>{"mitochondria", "energy"}));
    EXPECT_GE(r.queryMetadata.processingTimeMs, 0);
}

TEST_F(CitationPipelineTest, RetrievalUsesEnrichedQueryAndRerankUsesOriginal) {
    useStandardCandidates();
    auto pipeline = makePipeline();
    const std::string text = "The mitochondria is the powerhouse of the cell.";
    ASSERT_TRUE(pipeline->query("session-1", text, 0));

    EXPECT_EQ(provider_->lastText(), text + " mitochondria energy");
    EXPECT_EQ(reranker_->lastQuery(), text);
    EXPECT_EQ(index_->lastFilter().at("session_id"), "session-1");
    EXPECT_EQ(index_->lastTopK(), 5u);
}

TEST_F(CitationPipelineTest, PersistsCitations) {
    useStandardCandidates();
    auto pipeline = makePipeline();
    ASSERT_TRUE(pipeline->query("session-1", "The mitochondria is the powerhouse.", 2));

    auto appends = store_->appends();
    ASSERT_EQ(appends.size(), 1u);
    EXPECT_EQ(appends[0].sessionId, "session-1");
    EXPECT_EQ(appends[0].windowIndex, 2);
    ASSERT_EQ(appends[0].citations.size(), 1u);
    EXPECT_EQ(appends[0].citations[0].documentId, "doc-a");
}

TEST_F(CitationPipelineTest, EarlyExitSkipsReranker) {
    index_->setMatches({test::makeMatch("p1", 1.7f), test::makeMatch("p2", 1.9f)});
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "Something unrelated to the documents.", 1);
    ASSERT_TRUE(response);
    EXPECT_TRUE(response.value().citations.empty());
    EXPECT_EQ(response.value().queryMetadata.keywords.size(), 2u);
    EXPECT_EQ(reranker_->callCount(), 0);
    EXPECT_EQ(store_->callCount(), 0);
}

TEST_F(CitationPipelineTest, NoCandidatesIsEmptyResult) {
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "A question about nothing indexed.", 0);
    ASSERT_TRUE(response);
    EXPECT_TRUE(response.value().citations.empty());
    EXPECT_EQ(reranker_->callCount(), 0);
}

TEST_F(CitationPipelineTest, BlankTextTouchesNoModel) {
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "  \n\t ", 5);
    ASSERT_TRUE(response);
    EXPECT_EQ(response.value().windowIndex, 5);
    EXPECT_TRUE(response.value().citations.empty());
    EXPECT_TRUE(response.value().queryMetadata.keywords.empty());
    EXPECT_EQ(provider_->callCount(), 0);
    EXPECT_EQ(keywords_->callCount(), 0);
    EXPECT_EQ(index_->callCount(), 0);
}

TEST_F(CitationPipelineTest, EmptySessionIdIsInvalidArgument) {
    auto pipeline = makePipeline();
    auto response = pipeline->query("", "Some transcript text.", 0);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::InvalidArgument);
}

TEST_F(CitationPipelineTest, EmbeddingFailurePropagates) {
    provider_->setFail(true);
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "Some transcript text.", 0);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::EmbeddingFailed);
}

TEST_F(CitationPipelineTest, IndexFailurePropagates) {
    index_->setFail(true);
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "Some transcript text.", 0);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::VectorIndexError);
}

TEST_F(CitationPipelineTest, KeywordFailureDegradesToPlainQuery) {
    useStandardCandidates();
    keywords_->setThrow(true);
    auto pipeline = makePipeline();
    const std::string text = "The mitochondria is the powerhouse.";
    auto response = pipeline->query("session-1", text, 0);
    ASSERT_TRUE(response);
    EXPECT_TRUE(response.value().queryMetadata.keywords.empty());
    EXPECT_EQ(provider_->lastText(), text);
    EXPECT_EQ(response.value().citations.size(), 1u);
}

TEST_F(CitationPipelineTest, RerankerFailureUsesDistanceFallback) {
    useStandardCandidates();
    reranker_->setFailOnCall(true);
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "The mitochondria is the powerhouse.", 0);
    ASSERT_TRUE(response);
    ASSERT_EQ(response.value().citations.size(), 2u);
    EXPECT_NEAR(response.value().citations[0].relevanceScore, 0.85f, 1e-6f);
    EXPECT_NEAR(response.value().citations[1].relevanceScore, 0.7f, 1e-6f);
}

TEST_F(CitationPipelineTest, PersistenceFailureDoesNotAffectResponse) {
    useStandardCandidates();
    store_->setThrow(true);
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "The mitochondria is the powerhouse.", 0);
    ASSERT_TRUE(response);
    EXPECT_EQ(response.value().citations.size(), 1u);
    EXPECT_EQ(store_->callCount(), 1);
}

TEST_F(CitationPipelineTest, MissingDocumentIdKeepsDenseRanks) {
    index_->setMatches({test::makeMatch("p1", 0.2f, ""), test::makeMatch("p2", 0.3f, "doc-b")});
    reranker_->setScores({0.95f, 0.8f});
    auto pipeline = makePipeline();
    auto response = pipeline->query("session-1", "Question about cells.", 0);
    ASSERT_TRUE(response);
    ASSERT_EQ(response.value().citations.size(), 1u);
    EXPECT_EQ(response.value().citations[0].documentId, "doc-b");
    EXPECT_EQ(response.value().citations[0].rank, 1);
}

TEST_F(CitationPipelineTest, NullRerankerFallsBackWithThreshold) {
    useStandardCandidates();
    auto c = components();
    c.reranker.reset();
    c.enricher.reset();
    CitationPipeline pipeline(std::move(c));
    auto response = pipeline.query("session-1", "The mitochondria is the powerhouse.", 0);
    ASSERT_TRUE(response);
    ASSERT_EQ(response.value().citations.size(), 2u);
    EXPECT_TRUE(response.value().queryMetadata.keywords.empty());
}

TEST_F(CitationPipelineTest, MissingRetrieverIsNotInitialized) {
    auto c = components();
    c.retriever.reset();
    CitationPipeline pipeline(std::move(c));
    auto response = pipeline.query("session-1", "text", 0);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::NotInitialized);
}
