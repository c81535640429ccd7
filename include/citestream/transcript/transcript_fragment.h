#pragma once

#include <string>

namespace citestream::transcript {

/**
 * @brief One piece of recognised speech as delivered by the speech-recognition collaborator.
 *
 * Fragments are immutable once created; buffers copy them.
 */
struct TranscriptFragment {
    std::string id;
    std::string text;
    double startTime = 0.0; ///< Seconds from session start
    double endTime = 0.0;
    float confidence = 1.0f;
    bool isFinal = true;
};

} // namespace citestream::transcript
