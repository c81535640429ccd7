#pragma once

#include <citestream/pipeline/citation_pipeline.h>

#include "fakes.h"

#include <gtest/gtest.h>
#include <memory>

namespace citestream::test {

/**
 * @brief Pipeline wired to fakes: fixed keywords, canned index matches, mock reranker scores.
 */
class PipelineFixture : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeEmbeddingProvider>(8);
        keywords_ = std::make_shared<FakeKeywordExtractor>(
            std::vector<std::string>{"mitochondria", "energy"});
        index_ = std::make_shared<FakeVectorIndex>(8);
        reranker_ = std::make_shared<MockRerankerModel>();
        store_ = std::make_shared<FakeCitationStore>();

        embedderService_ = ModelService<vector::IEmbeddingProvider>::fromInstance("embedder",
                                                                                  provider_);
        keywordService_ = ModelService<search::IKeywordExtractor>::fromInstance("keywords",
                                                                                keywords_);
        rerankerService_ =
            ModelService<search::IRerankerModel>::fromInstance("reranker", reranker_);
    }

    pipeline::PipelineComponents components() const {
        pipeline::PipelineComponents c;
        c.enricher = std::make_shared<search::QueryEnricher>(keywordService_);
        c.retriever = std::make_shared<search::CandidateRetriever>(embedderService_, index_);
        c.gate = search::EarlyExitGate(1.5f);
        c.reranker = std::make_shared<search::Reranker>(rerankerService_);
        c.assembler = std::make_shared<citation::CitationAssembler>();
        c.store = store_;
        return c;
    }

    std::shared_ptr<pipeline::CitationPipeline> makePipeline() const {
        return std::make_shared<pipeline::CitationPipeline>(components());
    }

    /// Three passages at distances 0.3, 0.6, 1.9 with reranker scores 0.9, 0.3, 0.1
    void useStandardCandidates() {
        index_->setMatches({makeMatch("p1", 0.3f, "doc-a", "Mitochondria produce ATP."),
                            makeMatch("p2", 0.6f, "doc-b", "Cells divide by mitosis."),
                            makeMatch("p3", 1.9f, "doc-c", "Castles have moats.")});
        reranker_->setScores({0.9f, 0.3f, 0.1f});
    }

    std::shared_ptr<FakeEmbeddingProvider> provider_;
    std::shared_ptr<FakeKeywordExtractor> keywords_;
    std::shared_ptr<FakeVectorIndex> index_;
    std::shared_ptr<MockRerankerModel> reranker_;
    std::shared_ptr<FakeCitationStore> store_;

    std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedderService_;
    std::shared_ptr<ModelService<search::IKeywordExtractor>> keywordService_;
    std::shared_ptr<ModelService<search::IRerankerModel>> rerankerService_;
};

} // namespace citestream::test
