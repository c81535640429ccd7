#include <citestream/config/config_helpers.h>
#include <citestream/search/query_enrichment.h>

#include <spdlog/spdlog.h>
#include <exception>

namespace citestream::search {

QueryEnricher::QueryEnricher(std::shared_ptr<ModelService<IKeywordExtractor>> extractor,
                             size_t topN, size_t minTextLength)
    : extractor_(std::move(extractor)), topN_(topN), minTextLength_(minTextLength) {}

std::string QueryEnricher::buildEnrichedQuery(const std::string& text,
                                              const std::vector<std::string>& keywords) {
    if (keywords.empty()) {
        return text;
    }
    std::string out = text;
    for (const auto& kw : keywords) {
        out.push_back(' ');
        out += kw;
    }
    return out;
}

std::vector<std::string> QueryEnricher::extractKeywords(const std::string& text) const {
    std::string trimmed = text;
    config::trim(trimmed);
    if (trimmed.size() < minTextLength_) {
        return {};
    }
    if (!extractor_) {
        spdlog::warn("[Enrich] no keyword extractor configured");
        return {};
    }

    auto model = extractor_->get();
    if (!model) {
        spdlog::warn("[Enrich] keyword model unavailable: {}", model.error().message);
        return {};
    }

    try {
        auto keywords = model.value()->extract(text, topN_);
        if (!keywords) {
            spdlog::warn("[Enrich] keyword extraction failed: {}", keywords.error().message);
            return {};
        }
        return std::move(keywords).value();
    } catch (const std::exception& e) {
        spdlog::error("[Enrich] keyword extraction threw: {}", e.what());
        return {};
    }
}

EnrichmentResult QueryEnricher::enrich(const std::string& text) const {
    EnrichmentResult result;
    result.keywords = extractKeywords(text);
    result.enrichedQuery = buildEnrichedQuery(text, result.keywords);
    spdlog::debug("[Enrich] keywords: {}", result.keywords.size());
    return result;
}

} // namespace citestream::search
