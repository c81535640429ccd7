#include <citestream/search/early_exit_gate.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace citestream::search {

GateDecision EarlyExitGate::evaluate(const std::vector<Candidate>& candidates) const {
    GateDecision decision;
    if (candidates.empty()) {
        decision.exit = true;
        spdlog::debug("[Gate] no candidates, skipping rerank");
        return decision;
    }

    auto it = std::min_element(
        candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.distance < b.distance; });
    decision.minDistance = it->distance;
    decision.exit = it->distance > threshold_;
    if (decision.exit) {
        spdlog::debug("[Gate] min distance {:.3f} > {:.3f}, skipping rerank", it->distance,
                      threshold_);
    }
    return decision;
}

} // namespace citestream::search
