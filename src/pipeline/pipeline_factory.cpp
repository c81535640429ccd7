#include <citestream/pipeline/pipeline_factory.h>
#include <citestream/search/lexical_reranker_model.h>

#include <spdlog/spdlog.h>

namespace citestream::pipeline {

Result<void> PipelineServices::warmUp() const {
    if (keywordExtractor) {
        if (auto r = keywordExtractor->warmUp(); !r) {
            spdlog::warn("[Pipeline] keyword model unavailable, enrichment disabled: {}",
                         r.error().message);
        }
    }
    if (reranker) {
        if (auto r = reranker->warmUp(); !r) {
            spdlog::warn("[Pipeline] reranker unavailable, using distance fallback: {}",
                         r.error().message);
        }
    }
    if (!embedder) {
        return Error{ErrorCode::NotInitialized, "No embedding service"};
    }
    return embedder->warmUp();
}

Result<PipelineServices> createServices(const config::CitestreamConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    PipelineServices services;

    const auto embeddingName = config.models.embedding;
    const auto dim = config.models.embeddingDim;
    services.embedder = std::make_shared<ModelService<vector::IEmbeddingProvider>>(
        "embedding:" + embeddingName,
        [embeddingName, dim]() -> Result<std::shared_ptr<vector::IEmbeddingProvider>> {
            std::shared_ptr<vector::IEmbeddingProvider> provider =
                vector::createEmbeddingProvider(embeddingName, dim);
            if (!provider) {
                return Error{ErrorCode::ModelUnavailable,
                             "Unknown embedding provider: " + embeddingName};
            }
            return provider;
        });

    auto embedder = services.embedder;
    const auto keywordConfig = config.keywords;
    services.keywordExtractor = std::make_shared<ModelService<search::IKeywordExtractor>>(
        "keywords", [embedder, keywordConfig]() -> Result<std::shared_ptr<search::IKeywordExtractor>> {
            auto provider = embedder->get();
            if (!provider) {
                return provider.error();
            }
            return std::shared_ptr<search::IKeywordExtractor>(
                std::make_shared<search::EmbeddingKeywordExtractor>(provider.value(),
                                                                    keywordConfig));
        });

    const auto rerankerName = config.models.reranker;
    services.reranker = std::make_shared<ModelService<search::IRerankerModel>>(
        "reranker:" + rerankerName,
        [rerankerName]() -> Result<std::shared_ptr<search::IRerankerModel>> {
            if (rerankerName == "lexical") {
                return std::shared_ptr<search::IRerankerModel>(
                    std::make_shared<search::LexicalRerankerModel>());
            }
            return Error{ErrorCode::ModelUnavailable, "Reranker disabled"};
        });

    auto metric = vector::parseDistanceMetric(config.rag.distanceMetric);
    services.index = std::make_shared<vector::InMemoryVectorIndex>(
        dim, metric.value_or(vector::DistanceMetric::Cosine));

    auto store = citation::createCitationStore(config.store.backend, config.resolvedStorePath());
    if (!store) {
        return store.error();
    }
    services.store = std::move(store).value();

    spdlog::debug("[Pipeline] services created (embedding={} dim={} reranker={} store={})",
                  embeddingName, dim, rerankerName, config.store.backend);
    return services;
}

namespace {

PipelineComponents makeComponents(const config::CitestreamConfig& config,
                                  const PipelineServices& services) {
    PipelineComponents components;
    components.enricher = std::make_shared<search::QueryEnricher>(
        services.keywordExtractor, config.keywords.topN, config.keywords.minTextLength);
    components.retriever = std::make_shared<search::CandidateRetriever>(
        services.embedder, services.index, config.retrieverConfig());
    components.gate = search::EarlyExitGate(config.rag.distanceThreshold);
    components.reranker =
        std::make_shared<search::Reranker>(services.reranker, config.rerankerConfig());
    components.assembler = std::make_shared<citation::CitationAssembler>(config.rag.snippetLength);
    components.store = services.store;
    return components;
}

} // namespace

std::shared_ptr<CitationPipeline> createPipeline(const config::CitestreamConfig& config,
                                                 const PipelineServices& services,
                                                 boost::asio::any_io_executor persistExecutor) {
    auto components = makeComponents(config, services);
    components.assembler->setExecutor(std::move(persistExecutor));
    return std::make_shared<CitationPipeline>(std::move(components));
}

std::shared_ptr<CitationPipeline> createPipeline(const config::CitestreamConfig& config,
                                                 const PipelineServices& services) {
    return std::make_shared<CitationPipeline>(makeComponents(config, services));
}

} // namespace citestream::pipeline
