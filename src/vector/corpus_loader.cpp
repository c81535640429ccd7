#include <citestream/vector/corpus_loader.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace citestream::vector {

namespace {

constexpr const char* kAttributeKeys[] = {"session_id", "document_id", "document_name",
                                          "page_number", "section_heading"};

std::string scalarToString(const nlohmann::json& v) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number_integer()) {
        return std::to_string(v.get<long long>());
    }
    if (v.is_number()) {
        return v.dump();
    }
    if (v.is_boolean()) {
        return v.get<bool>() ? "true" : "false";
    }
    return {};
}

} // namespace

Result<CorpusLoadStats> loadCorpus(std::istream& in, IEmbeddingProvider& provider,
                                   IVectorIndex& index, const std::string& ns) {
    CorpusLoadStats stats;
    std::vector<VectorRecord> batch;
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            spdlog::warn("[Corpus] line {}: not a JSON object, skipped", lineNo);
            ++stats.skipped;
            continue;
        }
        auto textIt = j.find("text");
        if (textIt == j.end() || !textIt->is_string() || textIt->get<std::string>().empty()) {
            spdlog::warn("[Corpus] line {}: missing text, skipped", lineNo);
            ++stats.skipped;
            continue;
        }

        VectorRecord record;
        record.text = textIt->get<std::string>();
        if (auto idIt = j.find("id"); idIt != j.end() && !scalarToString(*idIt).empty()) {
            record.id = scalarToString(*idIt);
        } else {
            record.id = "passage-" + std::to_string(lineNo);
        }
        for (const char* key : kAttributeKeys) {
            if (auto it = j.find(key); it != j.end() && !it->is_null()) {
                auto value = scalarToString(*it);
                if (!value.empty()) {
                    record.attributes[key] = std::move(value);
                }
            }
        }

        auto embedding = provider.generateEmbedding(record.text);
        if (!embedding) {
            return Error{ErrorCode::EmbeddingFailed,
                         "line " + std::to_string(lineNo) + ": " + embedding.error().message};
        }
        record.embedding = std::move(embedding).value();
        batch.push_back(std::move(record));
    }

    if (!batch.empty()) {
        stats.loaded = batch.size();
        auto r = index.upsert(ns, std::move(batch));
        if (!r) {
            return r.error();
        }
    }
    spdlog::info("[Corpus] loaded {} passages into '{}' ({} skipped)", stats.loaded, ns,
                 stats.skipped);
    return stats;
}

Result<CorpusLoadStats> loadCorpusJsonl(const std::filesystem::path& path,
                                        IEmbeddingProvider& provider, IVectorIndex& index,
                                        const std::string& ns) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open corpus file: " + path.string()};
    }
    return loadCorpus(in, provider, index, ns);
}

} // namespace citestream::vector
