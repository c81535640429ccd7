#include <citestream/pipeline/session_processor.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace citestream::pipeline {

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Active:
            return "active";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

SessionProcessor::SessionProcessor(std::string sessionId, transcript::BufferConfig bufferConfig,
                                   std::shared_ptr<CitationPipeline> pipeline,
                                   boost::asio::any_io_executor executor)
    : sessionId_(std::move(sessionId)), pipeline_(std::move(pipeline)),
      strand_(boost::asio::make_strand(executor)),
      buffer_(transcript::createSegmentBuffer(bufferConfig)) {
    status_.sessionId = sessionId_;
    spdlog::info("[Session] {} opened ({} buffer)", sessionId_,
                 transcript::bufferPolicyName(bufferConfig.policy));
}

void SessionProcessor::submit(transcript::TranscriptFragment fragment, WindowCallback callback) {
    boost::asio::post(strand_, [self = shared_from_this(), fragment = std::move(fragment),
                                callback = std::move(callback)]() mutable {
        self->process(std::move(fragment), callback);
    });
}

std::future<void> SessionProcessor::flush() {
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    boost::asio::post(strand_, [done]() { done->set_value(); });
    return future;
}

void SessionProcessor::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.state = SessionState::Closed;
    }
    spdlog::info("[Session] {} closed, pending results will be discarded", sessionId_);
}

SessionStatus SessionProcessor::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

Result<citation::QueryResponse>
SessionProcessor::runQuery(const std::string& text, WindowIndex windowIndex,
                           const std::optional<std::string>& fragmentId) {
    if (!pipeline_) {
        return Error{ErrorCode::NotInitialized, "Session has no pipeline"};
    }
    try {
        return pipeline_->query(sessionId_, text, windowIndex, fragmentId);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

void SessionProcessor::deliver(const WindowCallback& callback, const WindowResult& result) {
    if (!callback || isClosed()) {
        return;
    }
    try {
        callback(result);
    } catch (const std::exception& e) {
        spdlog::error("[Session] {} window {} callback threw: {}", sessionId_, result.windowIndex,
                      e.what());
    }
}

void SessionProcessor::process(transcript::TranscriptFragment fragment,
                               const WindowCallback& callback) {
    const std::string fragmentId = fragment.id;
    buffer_->add(std::move(fragment));
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        ++status_.fragmentsReceived;
    }

    if (!buffer_->isReady()) {
        return;
    }

    WindowResult result;
    result.sessionId = sessionId_;
    result.windowIndex = buffer_->windowIndex();
    result.fragmentId = fragmentId;
    const std::string text = buffer_->getText();
    spdlog::debug("[Session] {} window {} ready ({} fragments)", sessionId_, result.windowIndex,
                  buffer_->fragmentCount());

    result.response = runQuery(text, result.windowIndex, result.fragmentId);

    // The window is consumed whether or not the query succeeded
    buffer_->advance();

    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        ++status_.windowsProcessed;
        status_.currentWindow = buffer_->windowIndex();
        if (result.response) {
            status_.citationsEmitted += result.response.value().citations.size();
        } else {
            ++status_.failures;
            status_.lastError = result.response.error().message;
        }
    }
    if (!result.response) {
        spdlog::warn("[Session] {} window {} failed: {}", sessionId_, result.windowIndex,
                     result.response.error().message);
    }

    deliver(callback, result);
}

} // namespace citestream::pipeline
