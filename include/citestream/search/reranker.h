#pragma once

#include <citestream/core/model_service.h>
#include <citestream/search/candidate.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace citestream::search {

/**
 * @brief Pairwise (query, passage) relevance scorer, e.g. a cross-encoder
 */
class IRerankerModel {
public:
    virtual ~IRerankerModel() = default;

    /**
     * @brief Score documents against a query
     *
     * @param query The query text
     * @param documents The passage texts to score
     * @return One relevance score per document (higher = more relevant), or error
     */
    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the model is ready to accept requests
     */
    virtual bool isReady() const = 0;

    virtual std::string name() const = 0;
};

struct RerankerConfig {
    size_t topK = 3;                 ///< Passages kept after sorting
    float relevanceThreshold = 0.4f; ///< Applied after truncation to topK
};

/**
 * @brief Orders retrieved candidates by pairwise relevance and keeps the best few.
 *
 * Scores are sorted descending (ties keep retrieval order), truncated to topK and then
 * filtered by the relevance threshold, so fewer than topK results may remain. When the
 * model cannot produce scores the candidates are ranked by `max(0, 1 - distance / 2)` in
 * retrieval order instead; the same truncation and threshold apply.
 */
class Reranker {
public:
    explicit Reranker(std::shared_ptr<ModelService<IRerankerModel>> model,
                      RerankerConfig config = {});

    std::vector<RerankedCandidate> rerank(const std::string& query,
                                          const std::vector<Candidate>& candidates) const {
        return rerank(query, candidates, config_.topK);
    }

    std::vector<RerankedCandidate> rerank(const std::string& query,
                                          const std::vector<Candidate>& candidates,
                                          size_t topK) const;

    const RerankerConfig& config() const { return config_; }

    static float fallbackScore(float distance);

    /// Distance-derived ranking in input order, truncated to topK (no threshold)
    static std::vector<RerankedCandidate> fallbackRanking(const std::vector<Candidate>& candidates,
                                                          size_t topK);

private:
    Result<std::vector<float>> score(const std::string& query,
                                     const std::vector<Candidate>& candidates) const;
    std::vector<RerankedCandidate> applyThreshold(std::vector<RerankedCandidate> ranked) const;

    std::shared_ptr<ModelService<IRerankerModel>> model_;
    RerankerConfig config_;
};

} // namespace citestream::search
