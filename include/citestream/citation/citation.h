#pragma once

#include <citestream/core/types.h>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace citestream::citation {

/**
 * @brief A ranked reference from a transcript window to a document passage.
 *
 * Immutable once produced. Within one query result ranks run 1..n without gaps.
 */
struct Citation {
    int rank = 0;
    std::string documentId;
    std::string documentName;
    int pageNumber = 0;
    std::optional<std::string> sectionHeading;
    std::string snippet; ///< At most the configured snippet length, in characters
    float relevanceScore = 0.0f;
    WindowIndex windowIndex = 0;
    std::string sessionId;
    std::optional<std::string> transcriptFragmentId;

    /// Client-facing fields only (rank, document, page, section, snippet, score)
    [[nodiscard]] nlohmann::json toJson() const;
    static Citation fromJson(const nlohmann::json& j);
};

struct QueryMetadata {
    std::vector<std::string> keywords;
    int64_t processingTimeMs = 0;

    [[nodiscard]] nlohmann::json toJson() const;
    static QueryMetadata fromJson(const nlohmann::json& j);
};

/**
 * @brief Result of one citation query for one transcript window
 */
struct QueryResponse {
    WindowIndex windowIndex = 0;
    std::vector<Citation> citations;
    QueryMetadata queryMetadata;

    [[nodiscard]] nlohmann::json toJson() const;
    static QueryResponse fromJson(const nlohmann::json& j);
};

/**
 * @brief A persisted citation as read back from a citation store
 */
struct StoredCitation {
    std::string id;
    Citation citation;
    int64_t createdAtMs = 0; ///< Unix epoch milliseconds

    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace citestream::citation
