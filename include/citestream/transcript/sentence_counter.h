#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace citestream::transcript {

/**
 * @brief Abbreviation-aware sentence and word counting for transcript text.
 *
 * A sentence terminator is a run of '.', '!' or '?' that
 *  - is at most two characters long (longer runs are ellipses),
 *  - is not glued to a following letter or digit ("e.g", "3.14"),
 *  - when it is a single '.', does not close a known abbreviation ("Dr.", "etc.").
 *
 * Thread-safe: instances are immutable after construction.
 */
class SentenceCounter {
public:
    SentenceCounter();
    explicit SentenceCounter(std::unordered_set<std::string> abbreviations);

    [[nodiscard]] std::size_t countSentences(std::string_view text) const;

    [[nodiscard]] static std::size_t countWords(std::string_view text);

    [[nodiscard]] bool isAbbreviation(std::string_view lowerToken) const;

    /// Default English abbreviation list (lower-case, with trailing period)
    static const std::unordered_set<std::string>& defaultAbbreviations();

private:
    std::unordered_set<std::string> abbreviations_;
};

} // namespace citestream::transcript
