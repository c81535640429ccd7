#pragma once

#include <citestream/core/types.h>
#include <citestream/transcript/sentence_counter.h>
#include <citestream/transcript/transcript_fragment.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace citestream::transcript {

/**
 * @brief Buffering policy selector
 */
enum class BufferPolicy {
    PerFragment, ///< Every non-empty fragment triggers a query, no overlap
    Windowed     ///< Accumulate until a word/sentence/segment trigger, keep last fragment
};

const char* bufferPolicyName(BufferPolicy policy);
std::optional<BufferPolicy> parseBufferPolicy(std::string_view name);

/**
 * @brief Trigger thresholds for the windowed policy
 */
struct BufferConfig {
    BufferPolicy policy = BufferPolicy::Windowed;
    std::size_t minWords = 15;   ///< Required by the sentence and segment triggers
    std::size_t maxWords = 150;  ///< Hard cap; forces a trigger on its own
    std::size_t minSegments = 2; ///< Fallback for sources without punctuation
    std::size_t targetSentences = 3;

    bool isValid() const {
        return minWords <= maxWords && maxWords > 0 && minSegments > 0 && targetSentences > 0;
    }
};

enum class BufferState { Empty, Accumulating, Ready };

const char* bufferStateName(BufferState state);

/**
 * @brief Per-session accumulation of transcript fragments into query windows.
 *
 * One instance belongs to exactly one session and is driven by that session's single
 * processing path; it is not thread-safe.
 */
class ISegmentBuffer {
public:
    virtual ~ISegmentBuffer() = default;

    /// Append (windowed) or replace (per-fragment) the current accumulation.
    virtual void add(TranscriptFragment fragment) = 0;

    /// Pure readiness check; may be called repeatedly.
    [[nodiscard]] virtual bool isReady() const = 0;

    /// Buffered fragment texts, single-space joined in arrival order.
    [[nodiscard]] virtual std::string getText() const = 0;

    /// Start the next window and increment the window index.
    virtual void advance() = 0;

    /// Drop buffered fragments without consuming a window index.
    virtual void clear() = 0;

    [[nodiscard]] virtual std::size_t fragmentCount() const = 0;
    [[nodiscard]] virtual BufferPolicy policy() const = 0;

    [[nodiscard]] WindowIndex windowIndex() const { return windowIndex_; }

    /// Id of the most recently added fragment still in the buffer
    [[nodiscard]] virtual std::optional<std::string> lastFragmentId() const = 0;

    [[nodiscard]] BufferState state() const {
        if (fragmentCount() == 0) {
            return BufferState::Empty;
        }
        return isReady() ? BufferState::Ready : BufferState::Accumulating;
    }

protected:
    WindowIndex windowIndex_ = 0;
};

/**
 * @brief Trigger-every-fragment policy
 */
class PerFragmentBuffer final : public ISegmentBuffer {
public:
    PerFragmentBuffer() = default;

    void add(TranscriptFragment fragment) override;
    [[nodiscard]] bool isReady() const override;
    [[nodiscard]] std::string getText() const override;
    void advance() override;
    void clear() override;
    [[nodiscard]] std::size_t fragmentCount() const override { return current_ ? 1 : 0; }
    [[nodiscard]] BufferPolicy policy() const override { return BufferPolicy::PerFragment; }
    [[nodiscard]] std::optional<std::string> lastFragmentId() const override;

private:
    std::optional<TranscriptFragment> current_;
};

/**
 * @brief Sliding-window policy with one fragment of overlap between windows.
 *
 * Ready when any of the following holds:
 *  1. words >= maxWords
 *  2. sentences >= targetSentences and words >= minWords
 *  3. fragments >= minSegments and words >= minWords
 */
class WindowedBuffer final : public ISegmentBuffer {
public:
    explicit WindowedBuffer(BufferConfig config = {});

    void add(TranscriptFragment fragment) override;
    [[nodiscard]] bool isReady() const override;
    [[nodiscard]] std::string getText() const override;
    void advance() override;
    void clear() override;
    [[nodiscard]] std::size_t fragmentCount() const override { return fragments_.size(); }
    [[nodiscard]] BufferPolicy policy() const override { return BufferPolicy::Windowed; }
    [[nodiscard]] std::optional<std::string> lastFragmentId() const override;

    [[nodiscard]] const std::vector<TranscriptFragment>& fragments() const { return fragments_; }
    [[nodiscard]] const BufferConfig& config() const { return config_; }

private:
    BufferConfig config_;
    SentenceCounter counter_;
    std::vector<TranscriptFragment> fragments_;
};

std::unique_ptr<ISegmentBuffer> createSegmentBuffer(const BufferConfig& config);

} // namespace citestream::transcript
