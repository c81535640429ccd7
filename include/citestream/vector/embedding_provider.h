#pragma once

#include <citestream/core/types.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace citestream::vector {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * The dimension is fixed at deploy time and must equal the dimension the document
 * index was built with.
 *
 * Implementations must be safe to call concurrently once initialized.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<Embedding> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts
     */
    virtual Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) {
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            auto r = generateEmbedding(text);
            if (!r) {
                return r.error();
            }
            out.push_back(std::move(r).value());
        }
        return out;
    }

    /**
     * Check if the provider is available and functional
     */
    virtual bool isAvailable() const = 0;

    /**
     * Get the name of this provider (e.g., "Hashing", "ONNX")
     */
    virtual std::string getProviderName() const = 0;

    /**
     * Get embedding dimension, 0 if not available
     */
    virtual size_t getEmbeddingDimension() const = 0;
};

// ============================================================================
// Hashing provider
// ============================================================================

/**
 * Deterministic feature-hashing embedder.
 *
 * Lower-cased word tokens and adjacent-token bigrams are hashed into `dimension`
 * buckets with a sign bit taken from a second hash, then the vector is L2-normalised.
 * Texts sharing vocabulary end up close in cosine distance, which is enough for a
 * self-contained demo corpus and for tests. Empty text yields a zero vector.
 */
class HashingEmbeddingProvider final : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384, float bigramWeight = 0.5f);

    Result<Embedding> generateEmbedding(const std::string& text) override;
    bool isAvailable() const override { return dimension_ > 0; }
    std::string getProviderName() const override { return "Hashing"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    size_t dimension_;
    float bigramWeight_;
};

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension);

} // namespace citestream::vector
