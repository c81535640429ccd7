#include <citestream/transcript/segment_buffer.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace citestream::transcript {

namespace {

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* bufferPolicyName(BufferPolicy policy) {
    switch (policy) {
        case BufferPolicy::PerFragment:
            return "per_fragment";
        case BufferPolicy::Windowed:
            return "windowed";
    }
    return "windowed";
}

std::optional<BufferPolicy> parseBufferPolicy(std::string_view name) {
    if (name == "windowed" || name == "window" || name == "sliding") {
        return BufferPolicy::Windowed;
    }
    if (name == "per_fragment" || name == "per-fragment" || name == "fragment") {
        return BufferPolicy::PerFragment;
    }
    return std::nullopt;
}

const char* bufferStateName(BufferState state) {
    switch (state) {
        case BufferState::Empty:
            return "empty";
        case BufferState::Accumulating:
            return "accumulating";
        case BufferState::Ready:
            return "ready";
    }
    return "empty";
}

// PerFragmentBuffer

void PerFragmentBuffer::add(TranscriptFragment fragment) {
    current_ = std::move(fragment);
}

bool PerFragmentBuffer::isReady() const {
    return current_.has_value() && !isBlank(current_->text);
}

std::string PerFragmentBuffer::getText() const {
    return current_ ? current_->text : std::string{};
}

void PerFragmentBuffer::advance() {
    current_.reset();
    ++windowIndex_;
}

void PerFragmentBuffer::clear() {
    current_.reset();
}

std::optional<std::string> PerFragmentBuffer::lastFragmentId() const {
    if (!current_) {
        return std::nullopt;
    }
    return current_->id;
}

// WindowedBuffer

WindowedBuffer::WindowedBuffer(BufferConfig config) : config_(config) {}

void WindowedBuffer::add(TranscriptFragment fragment) {
    fragments_.push_back(std::move(fragment));
}

bool WindowedBuffer::isReady() const {
    if (fragments_.empty()) {
        return false;
    }

    const std::string text = getText();
    const std::size_t words = SentenceCounter::countWords(text);

    if (words >= config_.maxWords) {
        spdlog::debug("[SegmentBuffer] window {} ready: max words ({} >= {})", windowIndex_,
                      words, config_.maxWords);
        return true;
    }

    if (words < config_.minWords) {
        return false;
    }

    const std::size_t sentences = counter_.countSentences(text);
    if (sentences >= config_.targetSentences) {
        spdlog::debug("[SegmentBuffer] window {} ready: sentences={}, words={}", windowIndex_,
                      sentences, words);
        return true;
    }

    if (fragments_.size() >= config_.minSegments) {
        spdlog::debug("[SegmentBuffer] window {} ready: segments={}, words={}", windowIndex_,
                      fragments_.size(), words);
        return true;
    }

    return false;
}

std::string WindowedBuffer::getText() const {
    std::string out;
    for (const auto& fragment : fragments_) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += fragment.text;
    }
    return out;
}

void WindowedBuffer::advance() {
    if (!fragments_.empty()) {
        TranscriptFragment last = std::move(fragments_.back());
        fragments_.clear();
        fragments_.push_back(std::move(last));
    }
    ++windowIndex_;
}

void WindowedBuffer::clear() {
    fragments_.clear();
}

std::optional<std::string> WindowedBuffer::lastFragmentId() const {
    if (fragments_.empty()) {
        return std::nullopt;
    }
    return fragments_.back().id;
}

std::unique_ptr<ISegmentBuffer> createSegmentBuffer(const BufferConfig& config) {
    switch (config.policy) {
        case BufferPolicy::PerFragment:
            return std::make_unique<PerFragmentBuffer>();
        case BufferPolicy::Windowed:
            return std::make_unique<WindowedBuffer>(config);
    }
    return std::make_unique<WindowedBuffer>(config);
}

} // namespace citestream::transcript
