#include <citestream/citation/citation_store.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <system_error>

namespace citestream::citation {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS citations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT NOT NULL,
    window_index INTEGER NOT NULL,
    rank INTEGER NOT NULL,
    document_id TEXT NOT NULL,
    document_name TEXT NOT NULL,
    page_number INTEGER NOT NULL DEFAULT 0,
    section_heading TEXT,
    snippet TEXT NOT NULL,
    relevance_score REAL NOT NULL,
    transcript_fragment_id TEXT,
    created_at_ms INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_citations_session
    ON citations(session_id, window_index, rank);
)sql";

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

Result<std::unique_ptr<SqliteCitationStore>>
SqliteCitationStore::open(const std::filesystem::path& path) {
    std::unique_ptr<SqliteCitationStore> store(new SqliteCitationStore());
    const bool inMemory = path.empty() || path == ":memory:";

    if (!inMemory && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot create directory " +
                                                 path.parent_path().string() + ": " +
                                                 ec.message()};
        }
    }

    auto opened = storage::Database::open(inMemory ? std::string(":memory:") : path.string());
    if (!opened) {
        return opened.error();
    }
    store->db_ = std::move(opened).value();
    if (auto schema = store->initSchema(); !schema) {
        return schema.error();
    }
    spdlog::debug("[CitationStore] opened {}", inMemory ? ":memory:" : path.string());
    return store;
}

Result<void> SqliteCitationStore::initSchema() {
    return db_.executeScript(kSchema);
}

Result<std::vector<std::string>>
SqliteCitationStore::append(const std::string& sessionId, WindowIndex windowIndex,
                            const std::vector<Citation>& citations) {
    std::vector<std::string> ids;
    if (citations.empty()) {
        return ids;
    }
    const int64_t createdAt = nowMs();

    std::lock_guard<std::mutex> lock(mutex_);
    auto txn = db_.transaction([&]() -> Result<void> {
        auto stmtResult =
            db_.prepare("INSERT INTO citations (session_id, window_index, rank, document_id, "
                        "document_name, page_number, section_heading, snippet, relevance_score, "
                        "transcript_fragment_id, created_at_ms) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        for (const auto& c : citations) {
            auto bound = stmt.bindAll(sessionId, windowIndex, c.rank, c.documentId,
                                      c.documentName, c.pageNumber, c.sectionHeading, c.snippet,
                                      static_cast<double>(c.relevanceScore),
                                      c.transcriptFragmentId, createdAt);
            if (!bound)
                return bound;
            if (auto r = stmt.run(); !r)
                return r;
            ids.push_back(std::to_string(db_.lastInsertRowId()));
            if (auto r = stmt.rewind(); !r)
                return r;
        }
        return {};
    });

    if (!txn) {
        return Error{ErrorCode::PersistenceError, txn.error().message};
    }
    return ids;
}

Result<std::vector<StoredCitation>> SqliteCitationStore::list(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult =
        db_.prepare("SELECT id, window_index, rank, document_id, document_name, page_number, "
                    "section_heading, snippet, relevance_score, transcript_fragment_id, "
                    "created_at_ms FROM citations WHERE session_id = ? "
                    "ORDER BY window_index ASC, rank ASC, id ASC");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, sessionId); !r)
        return r.error();

    std::vector<StoredCitation> out;
    while (true) {
        auto row = stmt.next();
        if (!row)
            return row.error();
        if (!row.value())
            break;

        StoredCitation sc;
        sc.id = std::to_string(stmt.columnInt(0));
        sc.citation.sessionId = sessionId;
        sc.citation.windowIndex = stmt.columnInt(1);
        sc.citation.rank = static_cast<int>(stmt.columnInt(2));
        sc.citation.documentId = stmt.columnText(3);
        sc.citation.documentName = stmt.columnText(4);
        sc.citation.pageNumber = static_cast<int>(stmt.columnInt(5));
        sc.citation.sectionHeading = stmt.columnOptionalText(6);
        sc.citation.snippet = stmt.columnText(7);
        sc.citation.relevanceScore = static_cast<float>(stmt.columnDouble(8));
        sc.citation.transcriptFragmentId = stmt.columnOptionalText(9);
        sc.createdAtMs = stmt.columnInt(10);
        out.push_back(std::move(sc));
    }
    return out;
}

} // namespace citestream::citation
