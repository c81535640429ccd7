#include <citestream/transcript/sentence_counter.h>

#include <cctype>

namespace citestream::transcript {

namespace {

bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

SentenceCounter::SentenceCounter() : abbreviations_(defaultAbbreviations()) {}

SentenceCounter::SentenceCounter(std::unordered_set<std::string> abbreviations)
    : abbreviations_(std::move(abbreviations)) {}

const std::unordered_set<std::string>& SentenceCounter::defaultAbbreviations() {
    static const std::unordered_set<std::string> kAbbreviations = {
        "dr.",  "prof.", "mr.", "mrs.", "ms.", "jr.", "sr.", "etc.", "e.g.", "i.e.",
        "vs.",  "fig.",  "eq.", "ch.",  "vol.", "no.", "p.",  "pp.",  "ed.",  "eds."};
    return kAbbreviations;
}

bool SentenceCounter::isAbbreviation(std::string_view lowerToken) const {
    return abbreviations_.find(std::string(lowerToken)) != abbreviations_.end();
}

std::size_t SentenceCounter::countWords(std::string_view text) {
    std::size_t words = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

std::size_t SentenceCounter::countSentences(std::string_view text) const {
    std::size_t sentences = 0;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        if (!isTerminal(text[i])) {
            ++i;
            continue;
        }

        const std::size_t runStart = i;
        while (i < n && isTerminal(text[i])) {
            ++i;
        }
        const std::size_t runLength = i - runStart;

        // "..." and longer runs are trailing-off, not sentence ends
        if (runLength > 2) {
            continue;
        }

        // Glued to a following word character: "e.g", "3.14", "v1.2"
        if (i < n && std::isalnum(static_cast<unsigned char>(text[i]))) {
            continue;
        }

        if (runLength == 1 && text[runStart] == '.') {
            std::size_t tokenStart = runStart;
            while (tokenStart > 0 && !isSpace(text[tokenStart - 1])) {
                --tokenStart;
            }
            std::string token;
            token.reserve(runStart + 1 - tokenStart);
            for (std::size_t k = tokenStart; k <= runStart; ++k) {
                token.push_back(
                    static_cast<char>(std::tolower(static_cast<unsigned char>(text[k]))));
            }
            // Strip opening quotes/brackets so "(Dr." still matches
            std::size_t skip = 0;
            while (skip < token.size() &&
                   (token[skip] == '(' || token[skip] == '"' || token[skip] == '\'')) {
                ++skip;
            }
            if (isAbbreviation(std::string_view(token).substr(skip))) {
                continue;
            }
        }

        ++sentences;
    }

    return sentences;
}

} // namespace citestream::transcript
