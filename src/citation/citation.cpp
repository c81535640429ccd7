#include <citestream/citation/citation.h>

namespace citestream::citation {

nlohmann::json Citation::toJson() const {
    nlohmann::json j;
    j["rank"] = rank;
    j["document_id"] = documentId;
    j["document_name"] = documentName;
    j["page_number"] = pageNumber;
    j["section_heading"] = sectionHeading ? nlohmann::json(*sectionHeading) : nlohmann::json();
    j["snippet"] = snippet;
    j["relevance_score"] = relevanceScore;
    return j;
}

Citation Citation::fromJson(const nlohmann::json& j) {
    Citation c;
    if (j.contains("rank"))
        c.rank = j["rank"].get<int>();
    if (j.contains("document_id"))
        c.documentId = j["document_id"].get<std::string>();
    if (j.contains("document_name"))
        c.documentName = j["document_name"].get<std::string>();
    if (j.contains("page_number"))
        c.pageNumber = j["page_number"].get<int>();
    if (j.contains("section_heading") && j["section_heading"].is_string())
        c.sectionHeading = j["section_heading"].get<std::string>();
    if (j.contains("snippet"))
        c.snippet = j["snippet"].get<std::string>();
    if (j.contains("relevance_score"))
        c.relevanceScore = j["relevance_score"].get<float>();
    if (j.contains("window_index"))
        c.windowIndex = j["window_index"].get<WindowIndex>();
    if (j.contains("session_id"))
        c.sessionId = j["session_id"].get<std::string>();
    if (j.contains("transcript_fragment_id") && j["transcript_fragment_id"].is_string())
        c.transcriptFragmentId = j["transcript_fragment_id"].get<std::string>();
    return c;
}

nlohmann::json QueryMetadata::toJson() const {
    nlohmann::json j;
    j["keywords"] = keywords;
    j["processing_time_ms"] = processingTimeMs;
    return j;
}

QueryMetadata QueryMetadata::fromJson(const nlohmann::json& j) {
    QueryMetadata m;
    if (j.contains("keywords") && j["keywords"].is_array())
        m.keywords = j["keywords"].get<std::vector<std::string>>();
    if (j.contains("processing_time_ms"))
        m.processingTimeMs = j["processing_time_ms"].get<int64_t>();
    return m;
}

nlohmann::json QueryResponse::toJson() const {
    nlohmann::json j;
    j["window_index"] = windowIndex;
    j["citations"] = nlohmann::json::array();
    for (const auto& c : citations) {
        j["citations"].push_back(c.toJson());
    }
    j["query_metadata"] = queryMetadata.toJson();
    return j;
}

QueryResponse QueryResponse::fromJson(const nlohmann::json& j) {
    QueryResponse r;
    if (j.contains("window_index"))
        r.windowIndex = j["window_index"].get<WindowIndex>();
    if (j.contains("citations") && j["citations"].is_array()) {
        for (const auto& cj : j["citations"]) {
            auto c = Citation::fromJson(cj);
            c.windowIndex = r.windowIndex;
            r.citations.push_back(std::move(c));
        }
    }
    if (j.contains("query_metadata"))
        r.queryMetadata = QueryMetadata::fromJson(j["query_metadata"]);
    return r;
}

nlohmann::json StoredCitation::toJson() const {
    nlohmann::json j = citation.toJson();
    j["id"] = id;
    j["session_id"] = citation.sessionId;
    j["window_index"] = citation.windowIndex;
    j["transcript_fragment_id"] = citation.transcriptFragmentId
                                      ? nlohmann::json(*citation.transcriptFragmentId)
                                      : nlohmann::json();
    j["created_at_ms"] = createdAtMs;
    return j;
}

} // namespace citestream::citation
