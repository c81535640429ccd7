#pragma once

#include <citestream/core/types.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace citestream::vector {

inline float dotProduct(const Embedding& a, const Embedding& b) {
    const size_t n = std::min(a.size(), b.size());
    float sum = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

inline float l2Norm(const Embedding& a) {
    return std::sqrt(dotProduct(a, a));
}

/// Cosine similarity in [-1, 1]; 0 when either vector is all zeros.
inline float cosineSimilarity(const Embedding& a, const Embedding& b) {
    const float na = l2Norm(a);
    const float nb = l2Norm(b);
    if (na == 0.0f || nb == 0.0f) {
        return 0.0f;
    }
    return dotProduct(a, b) / (na * nb);
}

inline float euclideanDistance(const Embedding& a, const Embedding& b) {
    const size_t n = std::min(a.size(), b.size());
    float sum = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        const float d = a[i] - b[i];
        sum += d * d;
    }
    return std::sqrt(sum);
}

inline void normalizeInPlace(Embedding& v) {
    const float norm = l2Norm(v);
    if (norm > 0.0f) {
        for (float& x : v) {
            x /= norm;
        }
    }
}

/// Lower-cased alphanumeric word tokens; apostrophes inside words are kept ("don't").
std::vector<std::string> tokenizeWords(std::string_view text);

} // namespace citestream::vector
