#include <gtest/gtest.h>
#include <citestream/search/query_enrichment.h>

#include "../../common/fakes.h"

using namespace citestream;
using namespace citestream::search;

class QueryEnricherTest : public ::testing::Test {
protected:
    void SetUp() override {
        extractor_ = std::make_shared<test::FakeKeywordExtractor>(
            std::vector<std::string>{"photosynthesis", "chlorophyll", "light"});
        service_ = ModelService<IKeywordExtractor>::fromInstance("keywords", extractor_);
    }

    std::shared_ptr<test::FakeKeywordExtractor> extractor_;
    std::shared_ptr<ModelService<IKeywordExtractor>> service_;
};

TEST_F(QueryEnricherTest, AppendsKeywordsToText) {
    QueryEnricher enricher(service_, 2);
    auto result = enricher.enrich("Plants use photosynthesis to make food.");
    EXPECT_EQ(result.keywords, (std::vector<std::string>{"photosynthesis", "chlorophyll"}));
    EXPECT_EQ(result.enrichedQuery,
              "Plants use photosynthesis to make food. photosynthesis chlorophyll");
}

TEST_F(QueryEnricherTest, ShortTextIsNotEnriched) {
    QueryEnricher enricher(service_);
    auto result = enricher.enrich("   too short   ");
    EXPECT_TRUE(result.keywords.empty());
    EXPECT_EQ(result.enrichedQuery, "   too short   ");
    EXPECT_EQ(extractor_->callCount(), 0);
}

TEST_F(QueryEnricherTest, ExtractionFailureFallsBackToText) {
    extractor_->setFail(true);
    QueryEnricher enricher(service_);
    auto result = enricher.enrich("long enough transcript text");
    EXPECT_TRUE(result.keywords.empty());
    EXPECT_EQ(result.enrichedQuery, "long enough transcript text");
}

TEST_F(QueryEnricherTest, ExtractionExceptionFallsBackToText) {
    extractor_->setThrow(true);
    QueryEnricher enricher(service_);
    auto result = enricher.enrich("long enough transcript text");
    EXPECT_TRUE(result.keywords.empty());
    EXPECT_EQ(result.enrichedQuery, "long enough transcript text");
}

TEST(QueryEnricherNoModelTest, MissingModelFallsBackToText) {
    auto failing = std::make_shared<ModelService<IKeywordExtractor>>(
        "keywords", []() -> Result<std::shared_ptr<IKeywordExtractor>> {
            return Error{ErrorCode::ModelUnavailable, "not installed"};
        });
    QueryEnricher withFailingModel(failing);
    EXPECT_EQ(withFailingModel.enrich("long enough transcript text").enrichedQuery,
              "long enough transcript text");

    QueryEnricher withoutModel(nullptr);
    EXPECT_TRUE(withoutModel.enrich("long enough transcript text").keywords.empty());
}

TEST(QueryEnricherBuildTest, EmptyKeywordsLeaveTextUnchanged) {
    EXPECT_EQ(QueryEnricher::buildEnrichedQuery("text", {}), "text");
    EXPECT_EQ(QueryEnricher::buildEnrichedQuery("text", {"a", "b c"}), "text a b c");
}
