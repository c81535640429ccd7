#include <citestream/config/citestream_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>

namespace citestream::config {

namespace {

template <typename T> Result<void> parseNumber(const std::string& value, T& out) {
    std::string v = value;
    trim(v);
    T parsed{};
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
    if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) {
        return Error{ErrorCode::InvalidArgument, "not a number: '" + value + "'"};
    }
    out = parsed;
    return {};
}

Result<void> parseSize(const std::string& value, size_t& out) {
    long long parsed = 0;
    if (auto r = parseNumber(value, parsed); !r) {
        return r;
    }
    if (parsed < 0) {
        return Error{ErrorCode::InvalidArgument, "must not be negative: '" + value + "'"};
    }
    out = static_cast<size_t>(parsed);
    return {};
}

} // namespace

const std::vector<std::pair<std::string, std::string>>& CitestreamConfig::knownKeys() {
    static const std::vector<std::pair<std::string, std::string>> kKeys = {
        {"rag", "top_k_candidates"},
        {"rag", "top_k_results"},
        {"rag", "relevance_threshold"},
        {"rag", "distance_threshold"},
        {"rag", "namespace"},
        {"rag", "snippet_length"},
        {"rag", "distance_metric"},
        {"buffer", "policy"},
        {"buffer", "min_words"},
        {"buffer", "max_words"},
        {"buffer", "min_segments"},
        {"buffer", "target_sentences"},
        {"keywords", "top_n"},
        {"keywords", "candidate_pool"},
        {"keywords", "min_text_length"},
        {"keywords", "diversity"},
        {"keywords", "mmr_lambda"},
        {"keywords", "max_ngram"},
        {"models", "embedding"},
        {"models", "embedding_dim"},
        {"models", "reranker"},
        {"store", "backend"},
        {"store", "path"},
        {"logging", "level"},
        {"runtime", "worker_threads"},
    };
    return kKeys;
}

Result<void> CitestreamConfig::set(const std::string& section, const std::string& key,
                                   const std::string& value) {
    auto wrap = [&](Result<void> r) -> Result<void> {
        if (!r) {
            return Error{ErrorCode::InvalidArgument,
                         section + "." + key + ": " + r.error().message};
        }
        return r;
    };

    if (section == "rag") {
        if (key == "top_k_candidates")
            return wrap(parseSize(value, rag.topKCandidates));
        if (key == "top_k_results")
            return wrap(parseSize(value, rag.topKResults));
        if (key == "relevance_threshold")
            return wrap(parseNumber(value, rag.relevanceThreshold));
        if (key == "distance_threshold")
            return wrap(parseNumber(value, rag.distanceThreshold));
        if (key == "namespace") {
            rag.indexNamespace = value;
            return {};
        }
        if (key == "snippet_length")
            return wrap(parseSize(value, rag.snippetLength));
        if (key == "distance_metric") {
            rag.distanceMetric = to_lower(value);
            return {};
        }
    } else if (section == "buffer") {
        if (key == "policy") {
            auto policy = transcript::parseBufferPolicy(to_lower(value));
            if (!policy) {
                return Error{ErrorCode::InvalidArgument, "buffer.policy: unknown policy '" +
                                                             value + "'"};
            }
            buffer.policy = *policy;
            return {};
        }
        if (key == "min_words")
            return wrap(parseSize(value, buffer.minWords));
        if (key == "max_words")
            return wrap(parseSize(value, buffer.maxWords));
        if (key == "min_segments")
            return wrap(parseSize(value, buffer.minSegments));
        if (key == "target_sentences")
            return wrap(parseSize(value, buffer.targetSentences));
    } else if (section == "keywords") {
        if (key == "top_n")
            return wrap(parseSize(value, keywords.topN));
        if (key == "candidate_pool")
            return wrap(parseSize(value, keywords.candidatePool));
        if (key == "min_text_length")
            return wrap(parseSize(value, keywords.minTextLength));
        if (key == "diversity") {
            auto method = search::parseDiversityMethod(to_lower(value));
            if (!method) {
                return Error{ErrorCode::InvalidArgument,
                             "keywords.diversity: unknown method '" + value + "'"};
            }
            keywords.diversity = *method;
            return {};
        }
        if (key == "mmr_lambda")
            return wrap(parseNumber(value, keywords.mmrLambda));
        if (key == "max_ngram")
            return wrap(parseSize(value, keywords.maxNgram));
    } else if (section == "models") {
        if (key == "embedding") {
            models.embedding = to_lower(value);
            return {};
        }
        if (key == "embedding_dim")
            return wrap(parseSize(value, models.embeddingDim));
        if (key == "reranker") {
            models.reranker = to_lower(value);
            return {};
        }
    } else if (section == "store") {
        if (key == "backend") {
            store.backend = to_lower(value);
            return {};
        }
        if (key == "path") {
            store.path = value;
            return {};
        }
    } else if (section == "logging") {
        if (key == "level") {
            logging.level = to_lower(value);
            return {};
        }
    } else if (section == "runtime") {
        if (key == "worker_threads")
            return wrap(parseSize(value, runtime.workerThreads));
    }

    spdlog::warn("[Config] ignoring unknown key {}.{}", section, key);
    return {};
}

Result<void> CitestreamConfig::applyFlat(const FlatConfig& flat) {
    for (const auto& [fullKey, value] : flat) {
        const auto dot = fullKey.find('.');
        if (dot == std::string::npos) {
            spdlog::warn("[Config] ignoring key outside a section: {}", fullKey);
            continue;
        }
        auto r = set(fullKey.substr(0, dot), fullKey.substr(dot + 1), value);
        if (!r) {
            return r;
        }
    }
    return {};
}

Result<void> CitestreamConfig::applyEnvironment() {
    for (const auto& [section, key] : knownKeys()) {
        const auto name = env_var_name(section, key);
        if (const char* v = std::getenv(name.c_str()); v && *v) {
            auto r = set(section, key, v);
            if (!r) {
                return Error{ErrorCode::InvalidArgument, name + ": " + r.error().message};
            }
        }
    }
    if (const char* level = std::getenv("CITESTREAM_LOG_LEVEL"); level && *level) {
        logging.level = to_lower(level);
    }
    return {};
}

Result<CitestreamConfig> CitestreamConfig::load(const std::string& overridePath) {
    CitestreamConfig cfg;
    const auto path = get_config_path(overridePath);

    auto flat = parse_config_file(path);
    if (flat) {
        spdlog::debug("[Config] loaded {}", path.string());
        if (auto r = cfg.applyFlat(*flat); !r) {
            return r.error();
        }
    } else if (!overridePath.empty()) {
        return Error{ErrorCode::NotFound, "Cannot read config file: " + path.string()};
    }

    if (auto r = cfg.applyEnvironment(); !r) {
        return r.error();
    }
    return cfg;
}

Result<void> CitestreamConfig::validate() const {
    auto invalid = [](const std::string& msg) { return Error{ErrorCode::InvalidArgument, msg}; };

    if (rag.topKCandidates == 0)
        return invalid("rag.top_k_candidates must be > 0");
    if (rag.topKResults == 0)
        return invalid("rag.top_k_results must be > 0");
    if (!std::isfinite(rag.relevanceThreshold))
        return invalid("rag.relevance_threshold must be a finite number");
    if (!std::isfinite(rag.distanceThreshold) || rag.distanceThreshold < 0.0f)
        return invalid("rag.distance_threshold must be a non-negative number");
    if (rag.indexNamespace.empty())
        return invalid("rag.namespace must not be empty");
    if (rag.snippetLength == 0)
        return invalid("rag.snippet_length must be > 0");
    if (!vector::parseDistanceMetric(rag.distanceMetric))
        return invalid("rag.distance_metric must be 'cosine' or 'l2'");

    if (!buffer.isValid())
        return invalid("buffer thresholds are inconsistent (min_words <= max_words, "
                       "counts > 0)");

    if (keywords.topN == 0)
        return invalid("keywords.top_n must be > 0");
    if (keywords.candidatePool < keywords.topN)
        return invalid("keywords.candidate_pool must be >= keywords.top_n");
    if (keywords.maxNgram == 0)
        return invalid("keywords.max_ngram must be > 0");
    if (!std::isfinite(keywords.mmrLambda) || keywords.mmrLambda < 0.0f ||
        keywords.mmrLambda > 1.0f)
        return invalid("keywords.mmr_lambda must be in [0, 1]");

    if (models.embeddingDim == 0)
        return invalid("models.embedding_dim must be > 0");
    if (models.embedding != "hashing")
        return invalid("models.embedding: unknown provider '" + models.embedding + "'");
    if (models.reranker != "lexical" && models.reranker != "none")
        return invalid("models.reranker must be 'lexical' or 'none'");

    if (store.backend != "memory" && store.backend != "sqlite")
        return invalid("store.backend must be 'memory' or 'sqlite'");

    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off")
        return invalid("logging.level: unknown level '" + logging.level + "'");

    return {};
}

search::RetrieverConfig CitestreamConfig::retrieverConfig() const {
    search::RetrieverConfig rc;
    rc.indexNamespace = rag.indexNamespace;
    rc.topKCandidates = rag.topKCandidates;
    return rc;
}

search::RerankerConfig CitestreamConfig::rerankerConfig() const {
    return search::RerankerConfig{rag.topKResults, rag.relevanceThreshold};
}

std::string CitestreamConfig::resolvedStorePath() const {
    if (!store.path.empty()) {
        return expand_tilde(store.path).string();
    }
    return (get_data_dir() / "citations.db").string();
}

} // namespace citestream::config
