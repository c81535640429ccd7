#pragma once

#include <citestream/citation/citation_store.h>
#include <citestream/config/citestream_config.h>
#include <citestream/core/model_service.h>
#include <citestream/pipeline/citation_pipeline.h>
#include <citestream/search/keyword_extractor.h>
#include <citestream/search/reranker.h>
#include <citestream/vector/embedding_provider.h>
#include <citestream/vector/vector_index.h>

#include <boost/asio/any_io_executor.hpp>
#include <memory>

namespace citestream::pipeline {

/**
 * @brief Process-wide shared resources. Models load on first use (or warmUp()).
 */
struct PipelineServices {
    std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedder;
    std::shared_ptr<ModelService<search::IKeywordExtractor>> keywordExtractor;
    std::shared_ptr<ModelService<search::IRerankerModel>> reranker;
    std::shared_ptr<vector::IVectorIndex> index;
    std::shared_ptr<citation::ICitationStore> store;

    /// Load every model now; returns the first failure of the embedder only
    Result<void> warmUp() const;
};

/**
 * @brief Build services from configuration.
 *
 * Model factories are registered but not run. The index is an in-process index of the
 * configured dimension and metric; the store follows `store.backend`.
 */
Result<PipelineServices> createServices(const config::CitestreamConfig& config);

/**
 * @brief Build a pipeline whose citation writes are posted to `persistExecutor`.
 *
 * The query returns once citations are assembled; the store write runs on the executor.
 */
std::shared_ptr<CitationPipeline> createPipeline(const config::CitestreamConfig& config,
                                                 const PipelineServices& services,
                                                 boost::asio::any_io_executor persistExecutor);

/// Same pipeline, writing citations inline on the querying thread
std::shared_ptr<CitationPipeline> createPipeline(const config::CitestreamConfig& config,
                                                 const PipelineServices& services);

} // namespace citestream::pipeline
