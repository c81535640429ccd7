#include <citestream/pipeline/session_registry.h>

namespace citestream::pipeline {

SessionRegistry::SessionRegistry(std::shared_ptr<CitationPipeline> pipeline,
                                 transcript::BufferConfig bufferConfig,
                                 boost::asio::any_io_executor executor)
    : pipeline_(std::move(pipeline)), bufferConfig_(bufferConfig), executor_(std::move(executor)) {}

Result<std::shared_ptr<SessionProcessor>> SessionRegistry::open(const std::string& sessionId) {
    if (sessionId.empty()) {
        return Error{ErrorCode::InvalidArgument, "session_id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(sessionId)) {
        return Error{ErrorCode::InvalidState, "Session already open: " + sessionId};
    }
    auto processor =
        std::make_shared<SessionProcessor>(sessionId, bufferConfig_, pipeline_, executor_);
    sessions_.emplace(sessionId, processor);
    return processor;
}

std::shared_ptr<SessionProcessor> SessionRegistry::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::close(const std::string& sessionId) {
    std::shared_ptr<SessionProcessor> processor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        processor = std::move(it->second);
        sessions_.erase(it);
    }
    processor->close();
    return true;
}

void SessionRegistry::closeAll() {
    std::map<std::string, std::shared_ptr<SessionProcessor>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, processor] : sessions) {
        processor->close();
    }
}

std::optional<SessionStatus> SessionRegistry::status(const std::string& sessionId) const {
    auto processor = find(sessionId);
    if (!processor) {
        return std::nullopt;
    }
    return processor->status();
}

std::vector<std::string> SessionRegistry::sessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, processor] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace citestream::pipeline
