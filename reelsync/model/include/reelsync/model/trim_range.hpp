/**
 * @file trim_range.hpp
 * @brief Inclusive export range on the global timeline
 */

#pragma once

#include <reelsync/core/types.hpp>

namespace reelsync::model {

struct TrimRange {
    FrameIndex start = 0;
    FrameIndex end = kNoFrame;  // Inclusive

    /// Whole timeline of a given length; empty when totalFrames is 0
    static TrimRange full(FrameIndex totalFrames) {
        return {0, totalFrames > 0 ? totalFrames - 1 : kNoFrame};
    }

    [[nodiscard]] bool isEmpty() const { return end < start; }

    [[nodiscard]] FrameIndex length() const {
        return isEmpty() ? 0 : end - start + 1;
    }

    [[nodiscard]] bool contains(FrameIndex frame) const {
        return frame >= start && frame <= end;
    }

    bool operator==(const TrimRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TrimRange& other) const { return !(*this == other); }
};

} // namespace reelsync::model
