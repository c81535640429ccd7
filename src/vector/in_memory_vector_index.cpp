#include <citestream/vector/similarity.h>
#include <citestream/vector/vector_index.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace citestream::vector {

std::optional<DistanceMetric> parseDistanceMetric(std::string_view name) {
    if (name == "cosine") {
        return DistanceMetric::Cosine;
    }
    if (name == "l2" || name == "euclidean") {
        return DistanceMetric::L2;
    }
    return std::nullopt;
}

InMemoryVectorIndex::InMemoryVectorIndex(size_t dimension, DistanceMetric metric)
    : dimension_(dimension), metric_(metric) {}

float InMemoryVectorIndex::distance(const Embedding& a, const Embedding& b) const {
    switch (metric_) {
        case DistanceMetric::Cosine:
            return 1.0f - cosineSimilarity(a, b);
        case DistanceMetric::L2:
            return euclideanDistance(a, b);
    }
    return 1.0f - cosineSimilarity(a, b);
}

Result<std::vector<VectorMatch>> InMemoryVectorIndex::query(const std::string& ns,
                                                            const Embedding& vector, size_t topK,
                                                            const MetadataFilter& filter) {
    if (vector.size() != dimension_) {
        return Error{ErrorCode::DimensionMismatch,
                     "Query vector has dimension " + std::to_string(vector.size()) +
                         ", index expects " + std::to_string(dimension_)};
    }

    std::vector<VectorMatch> matches;
    if (topK == 0) {
        return matches;
    }

    {
        std::shared_lock lock(mutex_);
        auto nsIt = namespaces_.find(ns);
        if (nsIt == namespaces_.end()) {
            spdlog::debug("[VectorIndex] namespace '{}' is empty", ns);
            return matches;
        }

        for (const auto& [id, record] : nsIt->second) {
            bool passes = true;
            for (const auto& [key, expected] : filter) {
                auto attr = record.attributes.find(key);
                if (attr == record.attributes.end() || attr->second != expected) {
                    passes = false;
                    break;
                }
            }
            if (!passes) {
                continue;
            }
            matches.push_back(
                VectorMatch{record.id, record.text, record.attributes,
                            distance(vector, record.embedding)});
        }
    }

    // Deterministic order on ties: by id
    auto byDistance = [](const VectorMatch& a, const VectorMatch& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.id < b.id;
    };
    if (matches.size() > topK) {
        std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(topK),
                          matches.end(), byDistance);
        matches.resize(topK);
    } else {
        std::sort(matches.begin(), matches.end(), byDistance);
    }
    return matches;
}

Result<void> InMemoryVectorIndex::upsert(const std::string& ns, std::vector<VectorRecord> records) {
    for (const auto& record : records) {
        if (record.id.empty()) {
            return Error{ErrorCode::InvalidArgument, "Vector record without id"};
        }
        if (record.embedding.size() != dimension_) {
            return Error{ErrorCode::DimensionMismatch,
                         "Record '" + record.id + "' has dimension " +
                             std::to_string(record.embedding.size()) + ", index expects " +
                             std::to_string(dimension_)};
        }
    }

    std::unique_lock lock(mutex_);
    auto& bucket = namespaces_[ns];
    for (auto& record : records) {
        std::string id = record.id;
        bucket.insert_or_assign(std::move(id), std::move(record));
    }
    return {};
}

size_t InMemoryVectorIndex::size(const std::string& ns) const {
    std::shared_lock lock(mutex_);
    auto it = namespaces_.find(ns);
    return it == namespaces_.end() ? 0 : it->second.size();
}

size_t InMemoryVectorIndex::removeWhere(const std::string& ns, const std::string& key,
                                        const std::string& value) {
    std::unique_lock lock(mutex_);
    auto nsIt = namespaces_.find(ns);
    if (nsIt == namespaces_.end()) {
        return 0;
    }
    return std::erase_if(nsIt->second, [&](const auto& entry) {
        auto attr = entry.second.attributes.find(key);
        return attr != entry.second.attributes.end() && attr->second == value;
    });
}

} // namespace citestream::vector
