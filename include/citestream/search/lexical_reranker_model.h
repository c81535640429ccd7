#pragma once

#include <citestream/search/reranker.h>

namespace citestream::search {

/**
 * @brief Deterministic term-overlap scorer usable where no cross-encoder is deployed.
 *
 * Query terms (stop words removed) are weighted by how rare they are within the scored
 * batch. A passage scores the weighted fraction of query terms it contains, plus a bonus
 * for matching query bigrams, clamped to [0, 1].
 */
class LexicalRerankerModel final : public IRerankerModel {
public:
    explicit LexicalRerankerModel(float bigramWeight = 0.2f) : bigramWeight_(bigramWeight) {}

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    bool isReady() const override { return true; }
    std::string name() const override { return "lexical"; }

private:
    float bigramWeight_;
};

} // namespace citestream::search
