#pragma once

#include <citestream/citation/citation.h>
#include <citestream/citation/citation_assembler.h>
#include <citestream/citation/citation_store.h>
#include <citestream/core/types.h>
#include <citestream/search/candidate_retriever.h>
#include <citestream/search/early_exit_gate.h>
#include <citestream/search/query_enrichment.h>
#include <citestream/search/reranker.h>

#include <memory>
#include <optional>
#include <string>

namespace citestream::pipeline {

/**
 * @brief Collaborators of one pipeline. Only the retriever is mandatory; the store may be
 *        null when citations are not persisted.
 */
struct PipelineComponents {
    std::shared_ptr<search::QueryEnricher> enricher;
    std::shared_ptr<search::CandidateRetriever> retriever;
    search::EarlyExitGate gate;
    std::shared_ptr<search::Reranker> reranker;
    std::shared_ptr<citation::CitationAssembler> assembler;
    std::shared_ptr<citation::ICitationStore> store;
};

/**
 * @brief Transcript window -> ranked document citations.
 *
 * Stages: enrich, embed and retrieve, early-exit gate, rerank (against the original window
 * text), assemble, persist. Stateless apart from its shared collaborators, so one instance
 * serves every session concurrently.
 */
class CitationPipeline {
public:
    explicit CitationPipeline(PipelineComponents components);

    /**
     * @brief Run one query.
     *
     * Whitespace-only text returns an empty result without touching any model. Embedding
     * and vector-index failures are returned as errors; keyword, reranker and persistence
     * failures degrade and are only logged.
     */
    Result<citation::QueryResponse> query(const std::string& sessionId,
                                          const std::string& transcriptText,
                                          WindowIndex windowIndex,
                                          const std::optional<std::string>& fragmentId = {}) const;

    const PipelineComponents& components() const { return components_; }

private:
    PipelineComponents components_;
};

} // namespace citestream::pipeline
