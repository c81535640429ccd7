#include <citestream/citation/citation_assembler.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace citestream::citation {

namespace {

void writeCitations(const std::shared_ptr<ICitationStore>& store, const std::string& sessionId,
                    WindowIndex windowIndex, const std::vector<Citation>& citations) {
    try {
        auto ids = store->append(sessionId, windowIndex, citations);
        if (!ids) {
            spdlog::error("[CitationStore] failed to store {} citations for session {} window {}: "
                          "{}",
                          citations.size(), sessionId, windowIndex, ids.error().message);
            return;
        }
        spdlog::debug("[CitationStore] stored {} citations for session {} window {}",
                      ids.value().size(), sessionId, windowIndex);
    } catch (const std::exception& e) {
        spdlog::error("[CitationStore] store threw for session {} window {}: {}", sessionId,
                      windowIndex, e.what());
    }
}

} // namespace

std::string CitationAssembler::makeSnippet(std::string_view text, size_t maxChars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        size_t len = 1;
        if (lead >= 0xF0) {
            len = 4;
        } else if (lead >= 0xE0) {
            len = 3;
        } else if (lead >= 0xC0) {
            len = 2;
        }
        if (chars == maxChars) {
            break;
        }
        if (pos + len > text.size()) {
            // Truncated sequence at the end of the input
            break;
        }
        pos += len;
        ++chars;
    }
    return std::string(text.substr(0, pos));
}

std::vector<Citation>
CitationAssembler::assemble(const std::vector<search::RerankedCandidate>& reranked,
                            const std::string& sessionId, WindowIndex windowIndex,
                            const std::optional<std::string>& fragmentId) const {
    std::vector<Citation> citations;
    citations.reserve(reranked.size());

    for (const auto& rc : reranked) {
        const auto& meta = rc.candidate.metadata;
        if (!meta.documentId || meta.documentId->empty()) {
            spdlog::warn("[Citations] passage {} has no document_id, skipped", rc.candidate.id);
            continue;
        }

        Citation c;
        c.rank = static_cast<int>(citations.size()) + 1;
        c.documentId = *meta.documentId;
        c.documentName = meta.documentName;
        c.pageNumber = meta.pageNumber;
        c.sectionHeading = meta.sectionHeading;
        c.snippet = makeSnippet(rc.candidate.text, snippetLength_);
        c.relevanceScore = rc.relevanceScore;
        c.windowIndex = windowIndex;
        c.sessionId = sessionId;
        c.transcriptFragmentId = fragmentId;
        citations.push_back(std::move(c));
    }
    return citations;
}

void CitationAssembler::persist(std::shared_ptr<ICitationStore> store,
                                const std::string& sessionId, WindowIndex windowIndex,
                                std::vector<Citation> citations) const {
    if (citations.empty() || !store) {
        return;
    }
    if (executor_) {
        boost::asio::post(*executor_, [store = std::move(store), sessionId, windowIndex,
                                       citations = std::move(citations)]() {
            writeCitations(store, sessionId, windowIndex, citations);
        });
        return;
    }
    writeCitations(store, sessionId, windowIndex, citations);
}

} // namespace citestream::citation
