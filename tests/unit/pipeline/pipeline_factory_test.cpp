#include <gtest/gtest.h>
#include <citestream/pipeline/pipeline_factory.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>

#include <citestream/pipeline/worker_pool.h>
#include <citestream/vector/corpus_loader.h>

using namespace citestream;
using namespace citestream::pipeline;

namespace {

// Store whose append blocks until release() (or a timeout) so tests can observe
// whether the caller waited for the write.
class GatedCitationStore : public citation::ICitationStore {
public:
    Result<std::vector<std::string>> append(const std::string&, WindowIndex,
                                            const std::vector<citation::Citation>& citations) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(5), [this] { return released_; });
        written_ += citations.size();
        completed_ = true;
        return std::vector<std::string>(citations.size(), "row");
    }

    Result<std::vector<citation::StoredCitation>> list(const std::string&) override {
        return std::vector<citation::StoredCitation>{};
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    size_t written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    bool completed_ = false;
    size_t written_ = 0;
};

} // namespace

TEST(PipelineFactoryTest, InvalidConfigIsRejected) {
    config::CitestreamConfig cfg;
    cfg.rag.topKResults = 0;
    auto services = createServices(cfg);
    ASSERT_FALSE(services);
    EXPECT_EQ(services.error().code, ErrorCode::InvalidArgument);
}

TEST(PipelineFactoryTest, ModelsLoadLazily) {
    config::CitestreamConfig cfg;
    auto services = createServices(cfg);
    ASSERT_TRUE(services);
    EXPECT_FALSE(services.value().embedder->attempted());
    EXPECT_FALSE(services.value().reranker->attempted());
    ASSERT_TRUE(services.value().warmUp());
    EXPECT_TRUE(services.value().embedder->attempted());
    EXPECT_TRUE(services.value().keywordExtractor->attempted());
    EXPECT_EQ(services.value().index->dimension(), 384u);
}

TEST(PipelineFactoryTest, DisabledRerankerStillWarmsUp) {
    config::CitestreamConfig cfg;
    cfg.models.reranker = "none";
    auto services = createServices(cfg);
    ASSERT_TRUE(services);
    EXPECT_TRUE(services.value().warmUp());
    EXPECT_FALSE(services.value().reranker->get());
}

TEST(PipelineFactoryTest, EndToEndOverLoadedCorpus) {
    config::CitestreamConfig cfg;
    cfg.models.embeddingDim = 256;
    cfg.rag.relevanceThreshold = 0.1f;
    auto services = createServices(cfg);
    ASSERT_TRUE(services) << services.error().message;

    std::istringstream corpus(
        R"({"id":"p1","session_id":"s1","document_id":"bio","document_name":"Biology.pdf","page_number":3,"text":"Mitochondria produce ATP, the energy currency of the cell."})"
        "\n"
        R"({"id":"p2","session_id":"s1","document_id":"hist","document_name":"History.pdf","page_number":9,"text":"The Roman empire built roads across Europe."})"
        "\n"
        R"({"id":"p3","session_id":"s2","document_id":"other","text":"Mitochondria produce ATP for another session."})"
        "\n");
    auto provider = services.value().embedder->get();
    ASSERT_TRUE(provider);
    ASSERT_TRUE(vector::loadCorpus(corpus, *provider.value(), *services.value().index));

    auto pipeline = createPipeline(cfg, services.value());
    auto response =
        pipeline->query("s1", "Today we discuss how mitochondria produce ATP energy.", 0);
    ASSERT_TRUE(response) << response.error().message;
    ASSERT_FALSE(response.value().citations.empty());
    EXPECT_EQ(response.value().citations[0].documentId, "bio");
    EXPECT_EQ(response.value().citations[0].pageNumber, 3);
    for (const auto& c : response.value().citations) {
        EXPECT_NE(c.documentId, "other");
    }

    auto stored = services.value().store->list("s1");
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.value().size(), response.value().citations.size());
}

TEST(PipelineFactoryTest, QueryDoesNotWaitForCitationWrite) {
    config::CitestreamConfig cfg;
    cfg.models.embeddingDim = 256;
    cfg.rag.relevanceThreshold = 0.1f;
    auto services = createServices(cfg);
    ASSERT_TRUE(services) << services.error().message;

    PipelineServices svc = std::move(services).value();
    auto store = std::make_shared<GatedCitationStore>();
    svc.store = store;

    std::istringstream corpus(
        R"({"id":"p1","session_id":"s1","document_id":"bio","document_name":"Biology.pdf","page_number":3,"text":"Mitochondria produce ATP, the energy currency of the cell."})"
        "\n");
    auto provider = svc.embedder->get();
    ASSERT_TRUE(provider);
    ASSERT_TRUE(vector::loadCorpus(corpus, *provider.value(), *svc.index));

    WorkerPool pool(1);
    auto pipeline = createPipeline(cfg, svc, pool.executor());

    const auto start = std::chrono::steady_clock::now();
    auto response =
        pipeline->query("s1", "Today we discuss how mitochondria produce ATP energy.", 0);
    const auto wall = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(response) << response.error().message;
    ASSERT_FALSE(response.value().citations.empty());
    EXPECT_FALSE(store->completed());
    EXPECT_LT(wall, std::chrono::seconds(2));
    EXPECT_LT(response.value().queryMetadata.processingTimeMs, 2000);

    store->release();
    pool.drain();
    EXPECT_TRUE(store->completed());
    EXPECT_EQ(store->written(), response.value().citations.size());
}
