#include <citestream/search/candidate_retriever.h>

#include <spdlog/spdlog.h>
#include <exception>

namespace citestream::search {

CandidateRetriever::CandidateRetriever(
    std::shared_ptr<ModelService<vector::IEmbeddingProvider>> embedder,
    std::shared_ptr<vector::IVectorIndex> index, RetrieverConfig config)
    : embedder_(std::move(embedder)), index_(std::move(index)), config_(std::move(config)) {}

Result<Embedding> CandidateRetriever::embed(const std::string& text) const {
    if (!embedder_) {
        return Error{ErrorCode::ModelUnavailable, "No embedding provider configured"};
    }
    auto provider = embedder_->get();
    if (!provider) {
        return provider.error();
    }
    if (!provider.value()->isAvailable()) {
        return Error{ErrorCode::ModelUnavailable,
                     provider.value()->getProviderName() + " embedding provider not available"};
    }

    try {
        auto embedding = provider.value()->generateEmbedding(text);
        if (!embedding) {
            return Error{ErrorCode::EmbeddingFailed, embedding.error().message};
        }
        return embedding;
    } catch (const std::exception& e) {
        return Error{ErrorCode::EmbeddingFailed, e.what()};
    }
}

Result<std::vector<Candidate>> CandidateRetriever::retrieve(const std::string& query,
                                                            const std::string& sessionId) const {
    if (!index_) {
        return Error{ErrorCode::NotInitialized, "No vector index configured"};
    }

    auto embedding = embed(query);
    if (!embedding) {
        spdlog::error("[Retriever] embedding failed: {}", embedding.error().message);
        return embedding.error();
    }

    const size_t expected = index_->dimension();
    if (embedding.value().size() != expected) {
        spdlog::error("[Retriever] configuration error: embedding dimension {} != index "
                      "dimension {}",
                      embedding.value().size(), expected);
        return Error{ErrorCode::DimensionMismatch,
                     "Embedding dimension " + std::to_string(embedding.value().size()) +
                         " does not match index dimension " + std::to_string(expected)};
    }

    vector::MetadataFilter filter{{config_.sessionKey, sessionId}};
    Result<std::vector<vector::VectorMatch>> matches =
        Error{ErrorCode::VectorIndexError, "query not executed"};
    try {
        matches = index_->query(config_.indexNamespace, embedding.value(),
                                config_.topKCandidates, filter);
    } catch (const std::exception& e) {
        matches = Error{ErrorCode::VectorIndexError, e.what()};
    }
    if (!matches) {
        spdlog::error("[Retriever] vector query failed: {}", matches.error().message);
        return Error{ErrorCode::VectorIndexError, matches.error().message};
    }

    std::vector<Candidate> candidates;
    candidates.reserve(matches.value().size());
    for (const auto& match : matches.value()) {
        candidates.push_back(Candidate::fromMatch(match));
    }
    spdlog::debug("[Retriever] {} candidates for session {}", candidates.size(), sessionId);
    return candidates;
}

} // namespace citestream::search
