#pragma once

#include <citestream/citation/citation.h>
#include <citestream/citation/citation_store.h>
#include <citestream/search/candidate.h>

#include <boost/asio/any_io_executor.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace citestream::citation {

/**
 * @brief Turns reranked passages into ranked citations and hands them to the store.
 *
 * Passages with no document id are dropped (logged) and do not take a rank, so ranks stay
 * dense. Persistence is best-effort: failures are logged and never reach the caller.
 */
class CitationAssembler {
public:
    explicit CitationAssembler(size_t snippetLength = 200) : snippetLength_(snippetLength) {}

    std::vector<Citation> assemble(const std::vector<search::RerankedCandidate>& reranked,
                                   const std::string& sessionId, WindowIndex windowIndex,
                                   const std::optional<std::string>& fragmentId = {}) const;

    /**
     * @brief Store citations of one window. No-op for an empty list or null store.
     *
     * With an executor set the write is posted and this returns immediately.
     */
    void persist(std::shared_ptr<ICitationStore> store, const std::string& sessionId,
                 WindowIndex windowIndex, std::vector<Citation> citations) const;

    void setExecutor(boost::asio::any_io_executor executor) { executor_ = std::move(executor); }

    size_t snippetLength() const { return snippetLength_; }

    /// First `maxChars` code points of `text`; never splits a UTF-8 sequence
    static std::string makeSnippet(std::string_view text, size_t maxChars);

private:
    size_t snippetLength_;
    std::optional<boost::asio::any_io_executor> executor_;
};

} // namespace citestream::citation
