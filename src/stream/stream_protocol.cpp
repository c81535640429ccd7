#include <citestream/stream/stream_protocol.h>

#include <spdlog/spdlog.h>

namespace citestream::stream {

namespace {

std::string idToString(const nlohmann::json& v) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number_integer()) {
        return std::to_string(v.get<long long>());
    }
    return {};
}

} // namespace

Result<InboundMessage> parseInbound(std::string_view line, const std::string& fallbackId) {
    nlohmann::json j = nlohmann::json::parse(std::string(line), nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::ParseError, "Invalid JSON message"};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }

    auto typeIt = j.find("type");
    const std::string type =
        typeIt != j.end() && typeIt->is_string() ? typeIt->get<std::string>() : std::string{};
    InboundMessage msg;
    if (type == "ping") {
        msg.type = MessageType::Ping;
        return msg;
    }
    if (type != "segment") {
        return Error{ErrorCode::InvalidData, "Unknown message type: '" + type + "'"};
    }

    auto seg = j.find("segment");
    if (seg == j.end() || !seg->is_object()) {
        return Error{ErrorCode::InvalidData, "segment message without a segment object"};
    }

    try {
        transcript::TranscriptFragment fragment;
        if (auto id = seg->find("id"); id != seg->end()) {
            fragment.id = idToString(*id);
        }
        if (fragment.id.empty()) {
            fragment.id = fallbackId;
        }
        fragment.text = seg->value("text", std::string{});
        fragment.startTime = seg->value("start_time", 0.0);
        fragment.endTime = seg->value("end_time", fragment.startTime);
        fragment.confidence = seg->value("confidence", 1.0f);
        fragment.isFinal = seg->value("is_final", true);

        msg.type = MessageType::Segment;
        msg.fragment = std::move(fragment);
        return msg;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed segment: ") + e.what()};
    }
}

nlohmann::json encodeCitations(const citation::QueryResponse& response,
                               const std::optional<std::string>& segmentId) {
    nlohmann::json j = response.toJson();
    j["type"] = "citations";
    j["segment_id"] = segmentId ? nlohmann::json(*segmentId) : nlohmann::json();
    return j;
}

nlohmann::json encodePong() {
    return nlohmann::json{{"type", "pong"}};
}

nlohmann::json encodeError(std::string_view code, std::string_view message) {
    return nlohmann::json{
        {"type", "error"}, {"code", std::string(code)}, {"message", std::string(message)}};
}

void NdjsonWriter::write(const nlohmann::json& message) {
    // Replace invalid UTF-8 rather than throwing from dump()
    const auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    ++written_;
}

uint64_t NdjsonWriter::messagesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

StreamHandler::StreamHandler(std::shared_ptr<pipeline::SessionProcessor> session,
                             std::shared_ptr<NdjsonWriter> writer)
    : session_(std::move(session)), writer_(std::move(writer)) {}

void StreamHandler::onWindow(NdjsonWriter& writer, const pipeline::WindowResult& result) {
    if (result.response) {
        writer.write(encodeCitations(result.response.value(), result.fragmentId));
        return;
    }
    writer.write(encodeError(kProcessingError, result.response.error().message));
}

void StreamHandler::handleLine(std::string_view line) {
    auto msg = parseInbound(line, "segment-" + std::to_string(segmentsSeen_ + 1));
    if (!msg) {
        spdlog::warn("[Stream] rejected message: {}", msg.error().message);
        writer_->write(encodeError(kInvalidMessage, msg.error().message));
        return;
    }

    switch (msg.value().type) {
        case MessageType::Ping:
            writer_->write(encodePong());
            return;
        case MessageType::Segment: {
            ++segmentsSeen_;
            auto fragment = *msg.value().fragment;
            session_->submit(std::move(fragment),
                             [writer = writer_](const pipeline::WindowResult& result) {
                                 onWindow(*writer, result);
                             });
            return;
        }
    }
}

uint64_t StreamHandler::run(std::istream& in) {
    uint64_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        handleLine(line);
        ++handled;
    }
    return handled;
}

} // namespace citestream::stream
