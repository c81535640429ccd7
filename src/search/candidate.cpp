#include <citestream/search/candidate.h>

#include <charconv>

namespace citestream::search {

CandidateMetadata CandidateMetadata::fromAttributes(const vector::Attributes& attributes) {
    CandidateMetadata meta;

    if (auto it = attributes.find("document_id"); it != attributes.end() && !it->second.empty()) {
        meta.documentId = it->second;
    }
    if (auto it = attributes.find("document_name");
        it != attributes.end() && !it->second.empty()) {
        meta.documentName = it->second;
    }
    if (auto it = attributes.find("page_number"); it != attributes.end()) {
        int page = 0;
        const auto& s = it->second;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), page);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            meta.pageNumber = page;
        }
    }
    if (auto it = attributes.find("section_heading");
        it != attributes.end() && !it->second.empty()) {
        meta.sectionHeading = it->second;
    }
    return meta;
}

Candidate Candidate::fromMatch(const vector::VectorMatch& match) {
    return Candidate{match.id, match.text, CandidateMetadata::fromAttributes(match.attributes),
                     match.distance};
}

} // namespace citestream::search
