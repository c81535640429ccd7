#pragma once

#include <citestream/citation/citation.h>
#include <citestream/core/types.h>
#include <citestream/storage/database.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace citestream::citation {

/**
 * @brief Durable record of the citations shown during a session.
 *
 * Append-only. Implementations must be safe to call from several session strands at once.
 */
class ICitationStore {
public:
    virtual ~ICitationStore() = default;

    /**
     * @brief Persist one query's citations
     * @return Ids assigned to the stored citations, in input order
     */
    virtual Result<std::vector<std::string>> append(const std::string& sessionId,
                                                    WindowIndex windowIndex,
                                                    const std::vector<Citation>& citations) = 0;

    /**
     * @brief All citations of a session ordered by window index, then rank
     */
    virtual Result<std::vector<StoredCitation>> list(const std::string& sessionId) = 0;
};

class InMemoryCitationStore final : public ICitationStore {
public:
    Result<std::vector<std::string>> append(const std::string& sessionId, WindowIndex windowIndex,
                                            const std::vector<Citation>& citations) override;
    Result<std::vector<StoredCitation>> list(const std::string& sessionId) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<StoredCitation> rows_;
    int64_t nextId_ = 1;
};

/**
 * @brief SQLite-backed citation store (one `citations` table)
 */
class SqliteCitationStore final : public ICitationStore {
public:
    /// Opens (creating if needed) the database and its schema. ":memory:" is accepted.
    static Result<std::unique_ptr<SqliteCitationStore>> open(const std::filesystem::path& path);

    Result<std::vector<std::string>> append(const std::string& sessionId, WindowIndex windowIndex,
                                            const std::vector<Citation>& citations) override;
    Result<std::vector<StoredCitation>> list(const std::string& sessionId) override;

private:
    SqliteCitationStore() = default;
    Result<void> initSchema();

    std::mutex mutex_;
    storage::Database db_;
};

/**
 * @brief Build the store named by `backend` ("memory" or "sqlite")
 */
Result<std::shared_ptr<ICitationStore>> createCitationStore(const std::string& backend,
                                                            const std::filesystem::path& path);

} // namespace citestream::citation
