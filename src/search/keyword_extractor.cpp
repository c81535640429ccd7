#include <citestream/search/keyword_extractor.h>
#include <citestream/vector/similarity.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <numeric>
#include <unordered_set>

namespace citestream::search {

namespace {

const std::unordered_set<std::string>& englishStopWords() {
    static const std::unordered_set<std::string> kStopWords = {
        "a",          "about",   "above",    "across",   "after",     "afterwards", "again",
        "against",    "all",     "almost",   "alone",    "along",     "already",    "also",
        "although",   "always",  "am",       "among",    "amongst",   "an",         "and",
        "another",    "any",     "anyhow",   "anyone",   "anything",  "anyway",     "anywhere",
        "are",        "around",  "as",       "at",       "back",      "be",         "became",
        "because",    "become",  "becomes",  "been",     "before",    "beforehand", "behind",
        "being",      "below",   "beside",   "besides",  "between",   "beyond",     "both",
        "but",        "by",      "can",      "cannot",   "could",     "did",        "do",
        "does",       "doing",   "done",     "down",     "due",       "during",     "each",
        "either",     "else",    "elsewhere", "enough",  "etc",       "even",       "ever",
        "every",      "everyone", "everything", "everywhere", "except", "few",      "for",
        "former",     "formerly", "from",    "further",  "had",       "has",        "have",
        "having",     "he",      "hence",    "her",      "here",      "hereby",     "herein",
        "hers",       "herself", "him",      "himself",  "his",       "how",        "however",
        "i",          "ie",      "if",       "in",       "indeed",    "into",       "is",
        "it",         "its",     "itself",   "just",     "keep",      "last",       "latter",
        "least",      "less",    "let",      "like",     "made",      "many",       "may",
        "me",         "meanwhile", "might",  "more",     "moreover",  "most",       "mostly",
        "much",       "must",    "my",       "myself",   "namely",    "neither",    "never",
        "nevertheless", "next",  "no",       "nobody",   "none",      "nor",        "not",
        "nothing",    "now",     "nowhere",  "of",       "off",       "often",      "on",
        "once",       "one",     "only",     "onto",     "or",        "other",      "others",
        "otherwise",  "our",     "ours",     "ourselves", "out",      "over",       "own",
        "per",        "perhaps", "please",   "quite",    "rather",    "really",     "same",
        "say",        "says",    "see",      "seem",     "seemed",    "seems",      "several",
        "she",        "should",  "since",    "so",       "some",      "somehow",    "someone",
        "something",  "sometime", "sometimes", "somewhere", "still",  "such",       "than",
        "that",       "the",     "their",    "theirs",   "them",      "themselves", "then",
        "there",      "thereby", "therefore", "therein", "these",     "they",       "this",
        "those",      "though",  "through",  "throughout", "thus",    "to",         "together",
        "too",        "toward",  "towards",  "under",    "until",     "up",         "upon",
        "us",         "very",    "via",      "was",      "we",        "well",       "were",
        "what",       "whatever", "when",    "whence",   "whenever",  "where",      "whereas",
        "whereby",    "wherein", "whether",  "which",    "while",     "who",        "whoever",
        "whole",      "whom",    "whose",    "why",      "will",      "with",       "within",
        "without",    "would",   "yet",      "you",      "your",      "yours",      "yourself",
        "yourselves", "okay",    "ok",       "um",       "uh",        "yeah",       "gonna",
        "kind",       "sort",    "thing",    "things",   "going",     "get",        "got",
        "don't",      "it's",    "i'm",      "that's",   "we're",     "you're",     "let's"};
    return kStopWords;
}

bool isNumeric(std::string_view token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == ',';
    });
}

} // namespace

std::optional<DiversityMethod> parseDiversityMethod(std::string_view name) {
    if (name == "max_sum" || name == "maxsum") {
        return DiversityMethod::MaxSum;
    }
    if (name == "mmr") {
        return DiversityMethod::Mmr;
    }
    return std::nullopt;
}

EmbeddingKeywordExtractor::EmbeddingKeywordExtractor(
    std::shared_ptr<vector::IEmbeddingProvider> embedder, KeywordExtractorConfig config)
    : embedder_(std::move(embedder)), config_(config) {}

bool EmbeddingKeywordExtractor::isStopWord(std::string_view lowerToken) {
    return englishStopWords().count(std::string(lowerToken)) > 0;
}

std::vector<std::string> EmbeddingKeywordExtractor::candidatePhrases(std::string_view text,
                                                                     size_t maxNgram) {
    // Stop words are removed before n-grams are formed
    std::vector<std::string> tokens;
    for (auto& token : vector::tokenizeWords(text)) {
        if (token.size() < 2 || isStopWord(token) || isNumeric(token)) {
            continue;
        }
        tokens.push_back(std::move(token));
    }

    std::vector<std::string> phrases;
    std::unordered_set<std::string> seen;
    const size_t maxN = std::max<size_t>(1, maxNgram);
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string phrase;
        for (size_t n = 1; n <= maxN && i + n <= tokens.size(); ++n) {
            if (n > 1) {
                phrase.push_back(' ');
            }
            phrase += tokens[i + n - 1];
            if (seen.insert(phrase).second) {
                phrases.push_back(phrase);
            }
        }
    }
    return phrases;
}

std::vector<size_t>
EmbeddingKeywordExtractor::selectMaxSum(const std::vector<float>& docSimilarity,
                                        const std::vector<std::vector<float>>& pairwise,
                                        size_t topN) {
    const size_t n = docSimilarity.size();
    const size_t k = std::min(topN, n);
    if (k == 0) {
        return {};
    }

    std::vector<size_t> current;
    std::vector<size_t> best;
    float bestSum = std::numeric_limits<float>::max();
    current.reserve(k);

    // Depth-first enumeration of all k-combinations, tracking the partial pair sum
    auto recurse = [&](auto&& self, size_t start, float partial) -> void {
        if (current.size() == k) {
            if (partial < bestSum) {
                bestSum = partial;
                best = current;
            }
            return;
        }
        const size_t remaining = k - current.size();
        for (size_t i = start; i + remaining <= n; ++i) {
            float added = 0.0f;
            for (size_t j : current) {
                added += pairwise[i][j];
            }
            current.push_back(i);
            self(self, i + 1, partial + added);
            current.pop_back();
        }
    };
    recurse(recurse, 0, 0.0f);

    std::sort(best.begin(), best.end(),
              [&](size_t a, size_t b) { return docSimilarity[a] > docSimilarity[b]; });
    return best;
}

std::vector<size_t>
EmbeddingKeywordExtractor::selectMmr(const std::vector<float>& docSimilarity,
                                     const std::vector<std::vector<float>>& pairwise, size_t topN,
                                     float lambda) {
    const size_t n = docSimilarity.size();
    const size_t k = std::min(topN, n);
    std::vector<size_t> selected;
    if (k == 0) {
        return selected;
    }

    std::vector<bool> used(n, false);
    const size_t first = static_cast<size_t>(
        std::max_element(docSimilarity.begin(), docSimilarity.end()) - docSimilarity.begin());
    selected.push_back(first);
    used[first] = true;

    while (selected.size() < k) {
        float bestScore = -std::numeric_limits<float>::max();
        size_t bestIdx = n;
        for (size_t i = 0; i < n; ++i) {
            if (used[i]) {
                continue;
            }
            float maxSim = -1.0f;
            for (size_t j : selected) {
                maxSim = std::max(maxSim, pairwise[i][j]);
            }
            const float score = lambda * docSimilarity[i] - (1.0f - lambda) * maxSim;
            if (score > bestScore) {
                bestScore = score;
                bestIdx = i;
            }
        }
        if (bestIdx == n) {
            break;
        }
        used[bestIdx] = true;
        selected.push_back(bestIdx);
    }

    std::sort(selected.begin(), selected.end(),
              [&](size_t a, size_t b) { return docSimilarity[a] > docSimilarity[b]; });
    return selected;
}

Result<std::vector<std::string>> EmbeddingKeywordExtractor::extract(const std::string& text,
                                                                    size_t topN) {
    if (!isAvailable()) {
        return Error{ErrorCode::ModelUnavailable, "Keyword embedding model not available"};
    }

    std::vector<std::string> keywords;
    if (topN == 0) {
        return keywords;
    }

    auto phrases = candidatePhrases(text, config_.maxNgram);
    if (phrases.empty()) {
        return keywords;
    }

    auto docEmbedding = embedder_->generateEmbedding(text);
    if (!docEmbedding) {
        return docEmbedding.error();
    }
    auto phraseEmbeddings = embedder_->generateBatchEmbeddings(phrases);
    if (!phraseEmbeddings) {
        return phraseEmbeddings.error();
    }
    const auto& embeddings = phraseEmbeddings.value();
    if (embeddings.size() != phrases.size()) {
        return Error{ErrorCode::InternalError, "Embedding batch size mismatch"};
    }

    // Rank all candidates by similarity to the document and keep the pool
    std::vector<size_t> order(phrases.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::vector<float> docSim(phrases.size());
    for (size_t i = 0; i < phrases.size(); ++i) {
        docSim[i] = vector::cosineSimilarity(docEmbedding.value(), embeddings[i]);
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return docSim[a] > docSim[b]; });
    const size_t poolSize = std::min(order.size(), std::max(config_.candidatePool, topN));
    order.resize(poolSize);

    std::vector<float> poolDocSim(poolSize);
    std::vector<std::vector<float>> pairwise(poolSize, std::vector<float>(poolSize, 0.0f));
    for (size_t i = 0; i < poolSize; ++i) {
        poolDocSim[i] = docSim[order[i]];
        for (size_t j = i + 1; j < poolSize; ++j) {
            const float s = vector::cosineSimilarity(embeddings[order[i]], embeddings[order[j]]);
            pairwise[i][j] = s;
            pairwise[j][i] = s;
        }
    }

    const size_t k = std::min(topN, poolSize);
    double combinations = 1.0;
    for (size_t i = 0; i < k; ++i) {
        combinations = combinations * static_cast<double>(poolSize - i) / static_cast<double>(i + 1);
    }

    std::vector<size_t> chosen;
    if (config_.diversity == DiversityMethod::MaxSum &&
        combinations <= static_cast<double>(config_.maxSumCombinationLimit)) {
        chosen = selectMaxSum(poolDocSim, pairwise, k);
    } else {
        chosen = selectMmr(poolDocSim, pairwise, k, config_.mmrLambda);
    }

    keywords.reserve(chosen.size());
    for (size_t idx : chosen) {
        keywords.push_back(phrases[order[idx]]);
    }
    spdlog::debug("[Keywords] extracted {} from {} candidates", keywords.size(), phrases.size());
    return keywords;
}

} // namespace citestream::search
