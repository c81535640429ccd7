#pragma once

#include <citestream/citation/citation.h>
#include <citestream/core/types.h>
#include <citestream/pipeline/session_processor.h>
#include <citestream/transcript/transcript_fragment.h>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace citestream::stream {

inline constexpr const char* kInvalidMessage = "INVALID_MESSAGE";
inline constexpr const char* kProcessingError = "PROCESSING_ERROR";

enum class MessageType { Segment, Ping };

struct InboundMessage {
    MessageType type = MessageType::Ping;
    std::optional<transcript::TranscriptFragment> fragment; ///< Set for Segment
};

/**
 * @brief Decode one NDJSON line.
 *
 *   {"type":"segment","segment":{"id","text","start_time","end_time","confidence","is_final"}}
 *   {"type":"ping"}
 *
 * Malformed JSON is ParseError; an unknown type or a segment without an object payload is
 * InvalidData. A segment without an id gets `fallbackId`.
 */
Result<InboundMessage> parseInbound(std::string_view line, const std::string& fallbackId = "");

nlohmann::json encodeCitations(const citation::QueryResponse& response,
                               const std::optional<std::string>& segmentId);
nlohmann::json encodePong();
nlohmann::json encodeError(std::string_view code, std::string_view message);

/**
 * @brief Serialised writes of one JSON document per line
 */
class NdjsonWriter {
public:
    explicit NdjsonWriter(std::ostream& out) : out_(out) {}

    void write(const nlohmann::json& message);

    uint64_t messagesWritten() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    uint64_t written_ = 0;
};

/**
 * @brief Feeds NDJSON input lines into one session and writes replies.
 *
 * Pings are answered immediately; segments are queued on the session and their windows
 * reported asynchronously through the writer.
 */
class StreamHandler {
public:
    StreamHandler(std::shared_ptr<pipeline::SessionProcessor> session,
                  std::shared_ptr<NdjsonWriter> writer);

    void handleLine(std::string_view line);

    /// Handle every line of `in`; returns the number of non-blank lines
    uint64_t run(std::istream& in);

private:
    static void onWindow(NdjsonWriter& writer, const pipeline::WindowResult& result);

    std::shared_ptr<pipeline::SessionProcessor> session_;
    std::shared_ptr<NdjsonWriter> writer_;
    uint64_t segmentsSeen_ = 0;
};

} // namespace citestream::stream
