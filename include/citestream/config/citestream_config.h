#pragma once

#include <citestream/config/config_helpers.h>
#include <citestream/core/types.h>
#include <citestream/search/candidate_retriever.h>
#include <citestream/search/keyword_extractor.h>
#include <citestream/search/reranker.h>
#include <citestream/transcript/segment_buffer.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace citestream::config {

struct RagConfig {
    size_t topKCandidates = 5;
    size_t topKResults = 3;
    float relevanceThreshold = 0.4f;
    float distanceThreshold = 1.5f;
    std::string indexNamespace = "documents";
    size_t snippetLength = 200;
    std::string distanceMetric = "cosine"; ///< In-process index only
};

struct ModelsConfig {
    std::string embedding = "hashing";
    size_t embeddingDim = 384;
    std::string reranker = "lexical"; ///< "lexical" or "none" (distance fallback only)
};

struct StoreConfig {
    std::string backend = "memory"; ///< "memory" or "sqlite"
    std::string path;               ///< Empty: <data dir>/citations.db
};

struct LoggingConfig {
    std::string level = "info";
};

struct RuntimeConfig {
    size_t workerThreads = 0; ///< 0 = hardware concurrency
};

/**
 * @brief Complete runtime configuration.
 *
 * Layered as defaults < config file < CITESTREAM_<SECTION>_<KEY> environment < explicit
 * set() calls (command-line flags). Unknown keys are ignored with a warning; malformed
 * values are InvalidArgument.
 */
struct CitestreamConfig {
    RagConfig rag;
    transcript::BufferConfig buffer;
    search::KeywordExtractorConfig keywords;
    ModelsConfig models;
    StoreConfig store;
    LoggingConfig logging;
    RuntimeConfig runtime;

    /**
     * @brief Defaults, then the config file, then the environment.
     *
     * A missing file is fine unless `overridePath` names it explicitly.
     */
    static Result<CitestreamConfig> load(const std::string& overridePath = "");

    /// Apply one "section.key" value
    Result<void> set(const std::string& section, const std::string& key, const std::string& value);

    Result<void> applyFlat(const FlatConfig& flat);
    Result<void> applyEnvironment();

    Result<void> validate() const;

    /// All recognised (section, key) pairs
    static const std::vector<std::pair<std::string, std::string>>& knownKeys();

    search::RetrieverConfig retrieverConfig() const;
    search::RerankerConfig rerankerConfig() const;
    std::string resolvedStorePath() const;
};

} // namespace citestream::config
