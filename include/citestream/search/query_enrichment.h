#pragma once

#include <citestream/core/model_service.h>
#include <citestream/search/keyword_extractor.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace citestream::search {

struct EnrichmentResult {
    std::vector<std::string> keywords;
    std::string enrichedQuery; ///< Original text, then the keywords, single-space separated
};

/**
 * @brief Appends extracted keywords to a transcript window before embedding.
 *
 * Enrichment is an optimisation only: every failure (model missing, extraction error,
 * exception) degrades to the unenriched text and is logged, never propagated.
 */
class QueryEnricher {
public:
    QueryEnricher(std::shared_ptr<ModelService<IKeywordExtractor>> extractor, size_t topN = 5,
                  size_t minTextLength = 10);

    EnrichmentResult enrich(const std::string& text) const;

    static std::string buildEnrichedQuery(const std::string& text,
                                          const std::vector<std::string>& keywords);

private:
    std::vector<std::string> extractKeywords(const std::string& text) const;

    std::shared_ptr<ModelService<IKeywordExtractor>> extractor_;
    size_t topN_;
    size_t minTextLength_;
};

} // namespace citestream::search
