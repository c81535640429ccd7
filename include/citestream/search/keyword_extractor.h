#pragma once

#include <citestream/core/types.h>
#include <citestream/vector/embedding_provider.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace citestream::search {

enum class DiversityMethod {
    MaxSum, ///< Least-similar combination of top_n among the candidate pool
    Mmr     ///< Maximal marginal relevance
};

std::optional<DiversityMethod> parseDiversityMethod(std::string_view name);

struct KeywordExtractorConfig {
    size_t topN = 5;
    size_t candidatePool = 20;  ///< Candidates kept after similarity ranking
    size_t minTextLength = 10;  ///< Shorter (trimmed) texts yield no keywords
    size_t maxNgram = 2;        ///< Keyphrases are 1..maxNgram tokens
    DiversityMethod diversity = DiversityMethod::MaxSum;
    float mmrLambda = 0.5f;     ///< Relevance weight for MMR (1 = pure relevance)
    /// Above this many combinations MaxSum degrades to MMR
    size_t maxSumCombinationLimit = 250000;
};

/**
 * @brief Text -> ranked list of salient terms
 */
class IKeywordExtractor {
public:
    virtual ~IKeywordExtractor() = default;

    virtual Result<std::vector<std::string>> extract(const std::string& text, size_t topN) = 0;

    virtual bool isAvailable() const = 0;
};

/**
 * @brief Keyphrase extraction by embedding similarity with a diversity constraint.
 *
 * Candidate 1..maxNgram-grams are built from the stop-word-filtered token sequence, embedded
 * together with the whole text, ranked by cosine similarity to the text, cut to the candidate
 * pool, and diversified down to topN. Results are ordered by similarity to the text.
 *
 * Thread-safe if the embedding provider is.
 */
class EmbeddingKeywordExtractor final : public IKeywordExtractor {
public:
    EmbeddingKeywordExtractor(std::shared_ptr<vector::IEmbeddingProvider> embedder,
                              KeywordExtractorConfig config = {});

    Result<std::vector<std::string>> extract(const std::string& text, size_t topN) override;

    bool isAvailable() const override { return embedder_ && embedder_->isAvailable(); }

    const KeywordExtractorConfig& config() const { return config_; }

    /// Unique candidate phrases in first-occurrence order
    static std::vector<std::string> candidatePhrases(std::string_view text, size_t maxNgram);

    static bool isStopWord(std::string_view lowerToken);

    /// Indices (into `docSimilarity`) of the chosen keyphrases, best first
    static std::vector<size_t> selectMaxSum(const std::vector<float>& docSimilarity,
                                            const std::vector<std::vector<float>>& pairwise,
                                            size_t topN);
    static std::vector<size_t> selectMmr(const std::vector<float>& docSimilarity,
                                         const std::vector<std::vector<float>>& pairwise,
                                         size_t topN, float lambda);

private:
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    KeywordExtractorConfig config_;
};

} // namespace citestream::search
