#pragma once

#include <citestream/citation/citation.h>
#include <citestream/pipeline/citation_pipeline.h>
#include <citestream/transcript/segment_buffer.h>
#include <citestream/transcript/transcript_fragment.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace citestream::pipeline {

enum class SessionState { Active, Closed };

const char* sessionStateName(SessionState state);

/**
 * @brief Counters for one live session
 */
struct SessionStatus {
    std::string sessionId;
    SessionState state = SessionState::Active;
    uint64_t fragmentsReceived = 0;
    uint64_t windowsProcessed = 0;
    uint64_t citationsEmitted = 0;
    uint64_t failures = 0;
    WindowIndex currentWindow = 0;
    std::optional<std::string> lastError;
};

/**
 * @brief Outcome of one ready window
 */
struct WindowResult {
    std::string sessionId;
    WindowIndex windowIndex = 0;
    std::optional<std::string> fragmentId; ///< Fragment that completed the window
    Result<citation::QueryResponse> response = Error{ErrorCode::InvalidState, "not run"};
};

using WindowCallback = std::function<void(const WindowResult&)>;

/**
 * @brief Sequential processing path of one session.
 *
 * All buffer mutation and queries run on a strand, so windows of a session are produced in
 * order and never overlap, while different sessions share the pool in parallel. A failed
 * query still advances the window. After close() remaining work completes but no callback
 * is invoked.
 */
class SessionProcessor : public std::enable_shared_from_this<SessionProcessor> {
public:
    SessionProcessor(std::string sessionId, transcript::BufferConfig bufferConfig,
                     std::shared_ptr<CitationPipeline> pipeline,
                     boost::asio::any_io_executor executor);

    SessionProcessor(const SessionProcessor&) = delete;
    SessionProcessor& operator=(const SessionProcessor&) = delete;

    /// Queue a fragment. The callback runs on the session strand for each ready window.
    void submit(transcript::TranscriptFragment fragment, WindowCallback callback);

    /// Completes once everything submitted before the call has been processed
    std::future<void> flush();

    void close();

    bool isClosed() const { return closed_.load(std::memory_order_acquire); }

    SessionStatus status() const;

    const std::string& sessionId() const { return sessionId_; }

private:
    void process(transcript::TranscriptFragment fragment, const WindowCallback& callback);
    Result<citation::QueryResponse> runQuery(const std::string& text, WindowIndex windowIndex,
                                             const std::optional<std::string>& fragmentId);
    void deliver(const WindowCallback& callback, const WindowResult& result);

    std::string sessionId_;
    std::shared_ptr<CitationPipeline> pipeline_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    std::unique_ptr<transcript::ISegmentBuffer> buffer_; // strand only
    std::atomic<bool> closed_{false};
    mutable std::mutex statusMutex_;
    SessionStatus status_;
};

} // namespace citestream::pipeline
