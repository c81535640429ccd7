#pragma once

#include <citestream/search/candidate.h>

#include <optional>
#include <vector>

namespace citestream::search {

struct GateDecision {
    bool exit = false;
    std::optional<float> minDistance; ///< Unset when there were no candidates
};

/**
 * @brief Skips reranking when even the closest candidate is too far away.
 *
 * Cut-off is strict: a minimum distance equal to the threshold proceeds.
 */
class EarlyExitGate {
public:
    explicit EarlyExitGate(float distanceThreshold = 1.5f) : threshold_(distanceThreshold) {}

    GateDecision evaluate(const std::vector<Candidate>& candidates) const;

    bool shouldExit(const std::vector<Candidate>& candidates) const {
        return evaluate(candidates).exit;
    }

    float threshold() const { return threshold_; }

private:
    float threshold_;
};

} // namespace citestream::search
