#include <citestream/vector/embedding_provider.h>
#include <citestream/vector/similarity.h>

#include <spdlog/spdlog.h>
#include <cctype>
#include <functional>

namespace citestream::vector {

std::vector<std::string> tokenizeWords(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    const size_t n = text.size();
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == '\'' && !current.empty() && i + 1 < n &&
                   std::isalnum(static_cast<unsigned char>(text[i + 1]))) {
            current.push_back('\'');
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension, float bigramWeight)
    : dimension_(dimension), bigramWeight_(bigramWeight) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
}

Result<Embedding> HashingEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (dimension_ == 0) {
        return Error{ErrorCode::NotInitialized, "Hashing provider has zero dimension"};
    }

    Embedding embedding(dimension_, 0.0f);
    const auto tokens = tokenizeWords(text);
    std::hash<std::string> hasher;

    auto accumulate = [&](const std::string& feature, float weight) {
        const size_t h = hasher(feature);
        const size_t bucket = h % dimension_;
        // Second, independent bit decides the sign to reduce collision bias
        const size_t signHash = hasher(feature + "#");
        embedding[bucket] += (signHash & 1u) ? weight : -weight;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        accumulate(tokens[i], 1.0f);
        if (i + 1 < tokens.size() && bigramWeight_ > 0.0f) {
            accumulate(tokens[i] + " " + tokens[i + 1], bigramWeight_);
        }
    }

    normalizeInPlace(embedding);
    return embedding;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension) {
    if (name.empty() || name == "hashing") {
        return std::make_unique<HashingEmbeddingProvider>(dimension);
    }
    spdlog::warn("Unknown embedding provider '{}'", name);
    return nullptr;
}

} // namespace citestream::vector
