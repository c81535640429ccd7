#include <citestream/citation/citation_store.h>

#include <algorithm>
#include <chrono>

namespace citestream::citation {

Result<std::vector<std::string>>
InMemoryCitationStore::append(const std::string& sessionId, WindowIndex windowIndex,
                              const std::vector<Citation>& citations) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(citations.size());
    for (const auto& c : citations) {
        StoredCitation row;
        row.id = std::to_string(nextId_++);
        row.citation = c;
        row.citation.sessionId = sessionId;
        row.citation.windowIndex = windowIndex;
        row.createdAtMs = now;
        ids.push_back(row.id);
        rows_.push_back(std::move(row));
    }
    return ids;
}

Result<std::vector<StoredCitation>> InMemoryCitationStore::list(const std::string& sessionId) {
    std::vector<StoredCitation> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& row : rows_) {
            if (row.citation.sessionId == sessionId) {
                out.push_back(row);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const StoredCitation& a, const StoredCitation& b) {
        if (a.citation.windowIndex != b.citation.windowIndex) {
            return a.citation.windowIndex < b.citation.windowIndex;
        }
        return a.citation.rank < b.citation.rank;
    });
    return out;
}

size_t InMemoryCitationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

Result<std::shared_ptr<ICitationStore>> createCitationStore(const std::string& backend,
                                                            const std::filesystem::path& path) {
    if (backend.empty() || backend == "memory") {
        return std::shared_ptr<ICitationStore>(std::make_shared<InMemoryCitationStore>());
    }
    if (backend == "sqlite") {
        auto store = SqliteCitationStore::open(path);
        if (!store) {
            return store.error();
        }
        return std::shared_ptr<ICitationStore>(std::move(store).value());
    }
    return Error{ErrorCode::InvalidArgument, "Unknown citation store backend: " + backend};
}

} // namespace citestream::citation
