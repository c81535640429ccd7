#pragma once

#include <citestream/core/types.h>

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace citestream::vector {

/// Exact-match attribute filter, e.g. {"session_id": "abc"}
using MetadataFilter = std::map<std::string, std::string>;
using Attributes = std::map<std::string, std::string>;

/**
 * @brief A stored passage: one chunk of an uploaded document
 */
struct VectorRecord {
    std::string id;
    Embedding embedding;
    std::string text;
    Attributes attributes; ///< session_id, document_id, document_name, page_number, ...
};

/**
 * @brief One nearest-neighbour hit. Lower distance = more similar.
 */
struct VectorMatch {
    std::string id;
    std::string text;
    Attributes attributes;
    float distance = 0.0f;
};

enum class DistanceMetric {
    Cosine, ///< 1 - cosine similarity, in [0, 2]
    L2      ///< Euclidean distance
};

std::optional<DistanceMetric> parseDistanceMetric(std::string_view name);

/**
 * @brief Namespace-scoped nearest-neighbour search over document passages.
 *
 * Writes (upsert) belong to the indexing collaborator; the retrieval core only queries.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    /**
     * @brief Return up to topK matches in `ns` whose attributes satisfy `filter`,
     *        sorted by ascending distance.
     */
    virtual Result<std::vector<VectorMatch>> query(const std::string& ns, const Embedding& vector,
                                                   size_t topK, const MetadataFilter& filter) = 0;

    /**
     * @brief Insert or replace records (by id) in `ns`
     */
    virtual Result<void> upsert(const std::string& ns, std::vector<VectorRecord> records) = 0;

    /// Embedding dimension the index was built with
    virtual size_t dimension() const = 0;

    virtual size_t size(const std::string& ns) const = 0;
};

/**
 * @brief Brute-force in-process index. Thread-safe (shared reads, exclusive writes).
 */
class InMemoryVectorIndex final : public IVectorIndex {
public:
    explicit InMemoryVectorIndex(size_t dimension, DistanceMetric metric = DistanceMetric::Cosine);

    Result<std::vector<VectorMatch>> query(const std::string& ns, const Embedding& vector,
                                           size_t topK, const MetadataFilter& filter) override;
    Result<void> upsert(const std::string& ns, std::vector<VectorRecord> records) override;
    size_t dimension() const override { return dimension_; }
    size_t size(const std::string& ns) const override;

    DistanceMetric metric() const { return metric_; }

    /// Remove every record of `ns` whose attribute `key` equals `value`; returns count removed
    size_t removeWhere(const std::string& ns, const std::string& key, const std::string& value);

private:
    float distance(const Embedding& a, const Embedding& b) const;

    size_t dimension_;
    DistanceMetric metric_;
    mutable std::shared_mutex mutex_;
    // ns -> (id -> record); insertion order is irrelevant since results are sorted
    std::unordered_map<std::string, std::unordered_map<std::string, VectorRecord>> namespaces_;
};

} // namespace citestream::vector
