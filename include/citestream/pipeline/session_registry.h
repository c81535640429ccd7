#pragma once

#include <citestream/pipeline/citation_pipeline.h>
#include <citestream/pipeline/session_processor.h>
#include <citestream/transcript/segment_buffer.h>

#include <boost/asio/any_io_executor.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace citestream::pipeline {

/**
 * @brief Live sessions keyed by session id.
 *
 * open() creates a processor, close() marks it closed and forgets it. All sessions share
 * one pipeline and one executor.
 */
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<CitationPipeline> pipeline,
                    transcript::BufferConfig bufferConfig, boost::asio::any_io_executor executor);

    /// InvalidState if the session is already open
    Result<std::shared_ptr<SessionProcessor>> open(const std::string& sessionId);

    std::shared_ptr<SessionProcessor> find(const std::string& sessionId) const;

    /// Returns false if no such session was open
    bool close(const std::string& sessionId);

    void closeAll();

    std::optional<SessionStatus> status(const std::string& sessionId) const;

    std::vector<std::string> sessionIds() const;

    size_t size() const;

private:
    std::shared_ptr<CitationPipeline> pipeline_;
    transcript::BufferConfig bufferConfig_;
    boost::asio::any_io_executor executor_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionProcessor>> sessions_;
};

} // namespace citestream::pipeline
