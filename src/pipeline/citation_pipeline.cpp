#include <citestream/pipeline/citation_pipeline.h>

#include <spdlog/spdlog.h>
#include <chrono>

namespace citestream::pipeline {

namespace {

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

int64_t elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start)
        .count();
}

} // namespace

CitationPipeline::CitationPipeline(PipelineComponents components)
    : components_(std::move(components)) {
    if (!components_.assembler) {
        components_.assembler = std::make_shared<citation::CitationAssembler>();
    }
    if (!components_.reranker) {
        // No model: every query takes the distance fallback
        components_.reranker = std::make_shared<search::Reranker>(nullptr);
    }
}

Result<citation::QueryResponse>
CitationPipeline::query(const std::string& sessionId, const std::string& transcriptText,
                        WindowIndex windowIndex, const std::optional<std::string>& fragmentId) const {
    const auto start = std::chrono::steady_clock::now();

    citation::QueryResponse response;
    response.windowIndex = windowIndex;

    if (sessionId.empty()) {
        return Error{ErrorCode::InvalidArgument, "session_id must not be empty"};
    }
    if (!components_.retriever) {
        return Error{ErrorCode::NotInitialized, "Pipeline has no candidate retriever"};
    }
    if (isBlank(transcriptText)) {
        spdlog::debug("[RAG] session {} window {}: blank text, nothing to cite", sessionId,
                      windowIndex);
        response.queryMetadata.processingTimeMs = elapsedMs(start);
        return response;
    }

    // 1. Enrichment
    search::EnrichmentResult enrichment;
    if (components_.enricher) {
        enrichment = components_.enricher->enrich(transcriptText);
    } else {
        enrichment.enrichedQuery = transcriptText;
    }
    response.queryMetadata.keywords = enrichment.keywords;

    // 2. Retrieval
    auto candidates = components_.retriever->retrieve(enrichment.enrichedQuery, sessionId);
    if (!candidates) {
        spdlog::error("[RAG] session {} window {}: retrieval failed: {}", sessionId, windowIndex,
                      candidates.error().message);
        return candidates.error();
    }

    // 3. Early exit
    const auto decision = components_.gate.evaluate(candidates.value());
    if (decision.exit) {
        response.queryMetadata.processingTimeMs = elapsedMs(start);
        spdlog::info("[RAG] session {} window {}: early exit ({} candidates) in {} ms", sessionId,
                     windowIndex, candidates.value().size(),
                     response.queryMetadata.processingTimeMs);
        return response;
    }

    // 4. Rerank against the original window text
    auto reranked = components_.reranker->rerank(transcriptText, candidates.value());

    // 5. Citations
    response.citations =
        components_.assembler->assemble(reranked, sessionId, windowIndex, fragmentId);
    response.queryMetadata.processingTimeMs = elapsedMs(start);
    components_.assembler->persist(components_.store, sessionId, windowIndex, response.citations);

    spdlog::info("[RAG] session {} window {}: {} citations in {} ms", sessionId, windowIndex,
                 response.citations.size(), response.queryMetadata.processingTimeMs);
    return response;
}

} // namespace citestream::pipeline
