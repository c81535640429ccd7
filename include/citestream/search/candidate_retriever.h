#pragma once

#include <citestream/core/model_service.h>
#include <citestream/search/candidate.h>
#include <citestream/vector/embedding_provider.h>
#include <citestream/vector/vector_index.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace citestream::search {

struct RetrieverConfig {
    std::string indexNamespace = "documents";
    std::string sessionKey = "session_id"; ///< Attribute the session filter matches on
    size_t topKCandidates = 5;
};

/**
 * @brief Embeds an (enriched) query and fetches nearest passages of the caller's session.
 *
 * Only documents tagged with the session id are eligible. A query embedding whose size
 * differs from the index dimension is a configuration error and reported as
 * DimensionMismatch rather than queried.
 */
class CandidateRetriever {
public:
    CandidateRetriever(std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedder,
                       std::shared_ptr<vector::IVectorIndex> index, RetrieverConfig config = {});

    Result<std::vector<Candidate>> retrieve(const std::string& query,
                                            const std::string& sessionId) const;

    Result<Embedding> embed(const std::string& text) const;

    const RetrieverConfig& config() const { return config_; }

private:
    std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedder_;
    std::shared_ptr<vector::IVectorIndex> index_;
    RetrieverConfig config_;
};

} // namespace citestream::search
