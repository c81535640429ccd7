#pragma once

#include <citestream/vector/vector_index.h>

#include <optional>
#include <string>
#include <vector>

namespace citestream::search {

/**
 * @brief Document provenance of a retrieved passage.
 *
 * `documentId` is optional here because the index may hold passages written without one;
 * such candidates cannot be cited and are dropped by the citation assembler.
 */
struct CandidateMetadata {
    std::optional<std::string> documentId;
    std::string documentName = "Unknown";
    int pageNumber = 0;
    std::optional<std::string> sectionHeading;

    /// Build typed metadata from vector-index attributes. Malformed page numbers become 0.
    static CandidateMetadata fromAttributes(const vector::Attributes& attributes);
};

/**
 * @brief A passage returned by the vector index for one query, before reranking.
 */
struct Candidate {
    std::string id;
    std::string text;
    CandidateMetadata metadata;
    float distance = 0.0f; ///< Lower = more similar

    static Candidate fromMatch(const vector::VectorMatch& match);
};

/**
 * @brief Candidate with a pairwise relevance score (higher = more relevant)
 */
struct RerankedCandidate {
    Candidate candidate;
    float relevanceScore = 0.0f;
};

} // namespace citestream::search
