#include <citestream/search/reranker.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace citestream::search {

Reranker::Reranker(std::shared_ptr<ModelService<IRerankerModel>> model, RerankerConfig config)
    : model_(std::move(model)), config_(config) {}

float Reranker::fallbackScore(float distance) {
    return std::max(0.0f, 1.0f - distance / 2.0f);
}

std::vector<RerankedCandidate> Reranker::fallbackRanking(const std::vector<Candidate>& candidates,
                                                         size_t topK) {
    std::vector<RerankedCandidate> out;
    const size_t n = std::min(topK, candidates.size());
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(RerankedCandidate{candidates[i], fallbackScore(candidates[i].distance)});
    }
    return out;
}

Result<std::vector<float>> Reranker::score(const std::string& query,
                                           const std::vector<Candidate>& candidates) const {
    if (!model_) {
        return Error{ErrorCode::ModelUnavailable, "No reranker model configured"};
    }
    auto model = model_->get();
    if (!model) {
        return model.error();
    }
    if (!model.value()->isReady()) {
        return Error{ErrorCode::ModelUnavailable, model.value()->name() + " not ready"};
    }

    std::vector<std::string> documents;
    documents.reserve(candidates.size());
    for (const auto& c : candidates) {
        documents.push_back(c.text);
    }

    try {
        auto scores = model.value()->scoreDocuments(query, documents);
        if (!scores) {
            return scores.error();
        }
        if (scores.value().size() != candidates.size()) {
            return Error{ErrorCode::InternalError,
                         "Reranker returned " + std::to_string(scores.value().size()) +
                             " scores for " + std::to_string(candidates.size()) + " documents"};
        }
        return scores;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Reranker threw: ") + e.what()};
    }
}

std::vector<RerankedCandidate>
Reranker::applyThreshold(std::vector<RerankedCandidate> ranked) const {
    ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                [this](const RerankedCandidate& rc) {
                                    return rc.relevanceScore < config_.relevanceThreshold;
                                }),
                 ranked.end());
    return ranked;
}

std::vector<RerankedCandidate> Reranker::rerank(const std::string& query,
                                                const std::vector<Candidate>& candidates,
                                                size_t topK) const {
    if (candidates.empty()) {
        return {};
    }

    auto scores = score(query, candidates);
    if (!scores) {
        spdlog::warn("[Reranker] scoring unavailable ({}), using distance fallback",
                     scores.error().message);
        return applyThreshold(fallbackRanking(candidates, topK));
    }

    std::vector<RerankedCandidate> ranked;
    ranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        ranked.push_back(RerankedCandidate{candidates[i], scores.value()[i]});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RerankedCandidate& a, const RerankedCandidate& b) {
                         return a.relevanceScore > b.relevanceScore;
                     });
    if (ranked.size() > topK) {
        ranked.resize(topK);
    }

    auto kept = applyThreshold(std::move(ranked));
    spdlog::debug("[Reranker] kept {} of {} candidates", kept.size(), candidates.size());
    return kept;
}

} // namespace citestream::search
