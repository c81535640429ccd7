#include <citestream/search/keyword_extractor.h>
#include <citestream/search/lexical_reranker_model.h>
#include <citestream/vector/similarity.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace citestream::search {

namespace {

std::vector<std::string> contentTerms(const std::string& text) {
    std::vector<std::string> terms;
    for (auto& token : vector::tokenizeWords(text)) {
        if (!EmbeddingKeywordExtractor::isStopWord(token)) {
            terms.push_back(std::move(token));
        }
    }
    return terms;
}

std::set<std::string> bigramsOf(const std::vector<std::string>& terms) {
    std::set<std::string> out;
    for (size_t i = 0; i + 1 < terms.size(); ++i) {
        out.insert(terms[i] + " " + terms[i + 1]);
    }
    return out;
}

} // namespace

Result<std::vector<float>>
LexicalRerankerModel::scoreDocuments(const std::string& query,
                                     const std::vector<std::string>& documents) {
    std::vector<float> scores(documents.size(), 0.0f);
    const auto queryTerms = contentTerms(query);
    const std::set<std::string> uniqueQuery(queryTerms.begin(), queryTerms.end());
    if (uniqueQuery.empty() || documents.empty()) {
        return scores;
    }
    const auto queryBigrams = bigramsOf(queryTerms);

    std::vector<std::unordered_set<std::string>> docTerms;
    std::vector<std::set<std::string>> docBigrams;
    docTerms.reserve(documents.size());
    docBigrams.reserve(documents.size());
    std::unordered_map<std::string, size_t> docFreq;
    for (const auto& doc : documents) {
        auto terms = contentTerms(doc);
        docBigrams.push_back(bigramsOf(terms));
        docTerms.emplace_back(terms.begin(), terms.end());
        for (const auto& q : uniqueQuery) {
            if (docTerms.back().count(q)) {
                ++docFreq[q];
            }
        }
    }

    const double n = static_cast<double>(documents.size());
    std::unordered_map<std::string, double> weight;
    double totalWeight = 0.0;
    for (const auto& q : uniqueQuery) {
        const double w = std::log(1.0 + (n + 1.0) / (static_cast<double>(docFreq[q]) + 1.0));
        weight[q] = w;
        totalWeight += w;
    }

    for (size_t i = 0; i < documents.size(); ++i) {
        double covered = 0.0;
        for (const auto& q : uniqueQuery) {
            if (docTerms[i].count(q)) {
                covered += weight[q];
            }
        }
        double coverage = totalWeight > 0.0 ? covered / totalWeight : 0.0;

        double bigramCoverage = 0.0;
        if (!queryBigrams.empty()) {
            size_t hits = 0;
            for (const auto& bg : queryBigrams) {
                hits += docBigrams[i].count(bg);
            }
            bigramCoverage = static_cast<double>(hits) / static_cast<double>(queryBigrams.size());
        }

        const double raw = (1.0 - bigramWeight_) * coverage + bigramWeight_ * bigramCoverage;
        scores[i] = static_cast<float>(std::clamp(raw, 0.0, 1.0));
    }
    return scores;
}

} // namespace citestream::search
