#include <gtest/gtest.h>
#include <citestream/pipeline/worker_pool.h>
#include <citestream/stream/stream_protocol.h>

#include "../../common/pipeline_fixture.h"

#include <sstream>
#include <string>
#include <vector>

using namespace citestream;
using namespace citestream::stream;

namespace {

std::vector<nlohmann::json> readLines(const std::string& text) {
    std::vector<nlohmann::json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

} // namespace

TEST(StreamParseTest, SegmentMessage) {
    auto msg = parseInbound(
        R"({"type":"segment","segment":{"id":"s-1","text":"Hello there.","start_time":1.5,"end_time":2.5,"confidence":0.9,"is_final":false}})");
    ASSERT_TRUE(msg) << msg.error().message;
    EXPECT_EQ(msg.value().type, MessageType::Segment);
    ASSERT_TRUE(msg.value().fragment.has_value());
    const auto& f = *msg.value().fragment;
    EXPECT_EQ(f.id, "s-1");
    EXPECT_EQ(f.text, "Hello there.");
    EXPECT_DOUBLE_EQ(f.startTime, 1.5);
    EXPECT_DOUBLE_EQ(f.endTime, 2.5);
    EXPECT_FLOAT_EQ(f.confidence, 0.9f);
    EXPECT_FALSE(f.isFinal);
}

TEST(StreamParseTest, SegmentDefaultsAndFallbackId) {
    auto msg = parseInbound(R"({"type":"segment","segment":{"text":"hi","id":42}})", "fb");
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg.value().fragment->id, "42");
    EXPECT_TRUE(msg.value().fragment->isFinal);
    EXPECT_FLOAT_EQ(msg.value().fragment->confidence, 1.0f);

    auto noId = parseInbound(R"({"type":"segment","segment":{"text":"hi"}})", "fb");
    ASSERT_TRUE(noId);
    EXPECT_EQ(noId.value().fragment->id, "fb");
}

TEST(StreamParseTest, Ping) {
    auto msg = parseInbound(R"({"type":"ping"})");
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg.value().type, MessageType::Ping);
    EXPECT_FALSE(msg.value().fragment.has_value());
}

TEST(StreamParseTest, Rejections) {
    auto bad = parseInbound("{not json");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ParseError);

    EXPECT_EQ(parseInbound("[1,2]").error().code, ErrorCode::InvalidData);
    EXPECT_EQ(parseInbound(R"({"type":"shout"})").error().code, ErrorCode::InvalidData);
    EXPECT_EQ(parseInbound(R"({"type":7})").error().code, ErrorCode::InvalidData);
    EXPECT_EQ(parseInbound(R"({"type":"segment"})").error().code, ErrorCode::InvalidData);
    EXPECT_EQ(parseInbound(R"({"type":"segment","segment":{"text":5}})").error().code,
              ErrorCode::InvalidData);
}

TEST(StreamEncodeTest, Messages) {
    citation::QueryResponse r;
    r.windowIndex = 4;
    auto j = encodeCitations(r, std::string("seg-9"));
    EXPECT_EQ(j["type"], "citations");
    EXPECT_EQ(j["segment_id"], "seg-9");
    EXPECT_EQ(j["window_index"], 4);
    EXPECT_TRUE(j["citations"].is_array());
    EXPECT_TRUE(encodeCitations(r, std::nullopt)["segment_id"].is_null());

    EXPECT_EQ(encodePong(), nlohmann::json({{"type", "pong"}}));
    auto err = encodeError(kInvalidMessage, "bad");
    EXPECT_EQ(err["type"], "error");
    EXPECT_EQ(err["code"], "INVALID_MESSAGE");
    EXPECT_EQ(err["message"], "bad");
}

TEST(NdjsonWriterTest, OneDocumentPerLine) {
    std::ostringstream out;
    NdjsonWriter writer(out);
    writer.write(encodePong());
    writer.write(nlohmann::json{{"text", std::string("bad \xFF byte")}});
    EXPECT_EQ(writer.messagesWritten(), 2u);

    auto lines = readLines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["type"], "pong");
}

class StreamHandlerTest : public test::PipelineFixture {
protected:
    void SetUp() override {
        PipelineFixture::SetUp();
        useStandardCandidates();
        pool_ = std::make_unique<pipeline::WorkerPool>(2);
        transcript::BufferConfig config;
        config.policy = transcript::BufferPolicy::PerFragment;
        session_ = std::make_shared<pipeline::SessionProcessor>("session-1", config,
                                                                makePipeline(), pool_->executor());
        writer_ = std::make_shared<NdjsonWriter>(out_);
    }

    void TearDown() override { pool_->drain(); }

    std::ostringstream out_;
    std::unique_ptr<pipeline::WorkerPool> pool_;
    std::shared_ptr<pipeline::SessionProcessor> session_;
    std::shared_ptr<NdjsonWriter> writer_;
};

TEST_F(StreamHandlerTest, RunAnswersEveryLine) {
    StreamHandler handler(session_, writer_);
    std::istringstream in(
        R"({"type":"ping"})"
        "\n\n"
        R"({"type":"segment","segment":{"id":"s1","text":"The mitochondria is the powerhouse."}})"
        "\n"
        "garbage\n");
    EXPECT_EQ(handler.run(in), 3u);
    session_->flush().wait();

    auto lines = readLines(out_.str());
    ASSERT_EQ(lines.size(), 3u);

    int pongs = 0;
    int errors = 0;
    int citations = 0;
    for (const auto& line : lines) {
        const auto type = line["type"].get<std::string>();
        if (type == "pong") {
            ++pongs;
        } else if (type == "error") {
            ++errors;
            EXPECT_EQ(line["code"], kInvalidMessage);
        } else if (type == "citations") {
            ++citations;
            EXPECT_EQ(line["segment_id"], "s1");
            EXPECT_EQ(line["window_index"], 0);
            ASSERT_EQ(line["citations"].size(), 1u);
            EXPECT_EQ(line["citations"][0]["document_id"], "doc-a");
            EXPECT_EQ(line["citations"][0]["rank"], 1);
        }
    }
    EXPECT_EQ(pongs, 1);
    EXPECT_EQ(errors, 1);
    EXPECT_EQ(citations, 1);
}

TEST_F(StreamHandlerTest, FailedWindowBecomesProcessingError) {
    index_->setFail(true);
    StreamHandler handler(session_, writer_);
    handler.handleLine(R"({"type":"segment","segment":{"id":"s1","text":"Any window text."}})");
    session_->flush().wait();

    auto lines = readLines(out_.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["type"], "error");
    EXPECT_EQ(lines[0]["code"], kProcessingError);
}

TEST_F(StreamHandlerTest, EarlyExitStillEmitsEmptyCitations) {
    index_->setMatches({test::makeMatch("far", 1.8f)});
    StreamHandler handler(session_, writer_);
    handler.handleLine(R"({"type":"segment","segment":{"text":"Unrelated chatter here."}})");
    session_->flush().wait();

    auto lines = readLines(out_.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["type"], "citations");
    EXPECT_TRUE(lines[0]["citations"].empty());
    EXPECT_EQ(lines[0]["segment_id"], "segment-1");
}
