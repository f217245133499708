/**
 * @file stream_info.hpp
 * @brief Static description of one loaded video stream
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <filesystem>
#include <cmath>

namespace reelsync::media {

/**
 * @brief Probed properties of a video file
 *
 * Immutable once a stream is loaded.
 */
struct StreamInfo {
    std::filesystem::path path;
    Rational frameRate;             // Average frame rate of the video stream
    FrameIndex frameCount = 0;      // Native number of frames
    Duration duration = 0;          // Microseconds
    Size resolution;
    bool hasAudio = false;

    [[nodiscard]] double fps() const { return frameRate.toDouble(); }

    [[nodiscard]] double durationMs() const {
        return static_cast<double>(duration) / 1000.0;
    }

    /// Microsecond timestamp of a native frame index
    [[nodiscard]] Timestamp frameToTime(FrameIndex frame) const {
        if (!frameRate.valid()) return kNoTimestamp;
        return static_cast<Timestamp>(std::llround(
            static_cast<double>(frame) * kTimeBaseUs * frameRate.den / frameRate.num));
    }

    /// Native frame index containing a microsecond timestamp
    [[nodiscard]] FrameIndex timeToFrame(Timestamp time) const {
        if (!frameRate.valid() || time == kNoTimestamp) return kNoFrame;
        return static_cast<FrameIndex>(std::floor(
            static_cast<double>(time) * frameRate.num / (static_cast<double>(kTimeBaseUs) * frameRate.den)
            + 1e-6));
    }

    [[nodiscard]] bool containsFrame(FrameIndex frame) const {
        return frame >= 0 && frame < frameCount;
    }
};

} // namespace reelsync::media
