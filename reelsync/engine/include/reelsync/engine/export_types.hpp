/**
 * @file export_types.hpp
 * @brief Export request and job descriptions
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/media/stream_info.hpp>
#include <reelsync/media/frame_sink.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace reelsync::engine {

using media::ExportMode;

/**
 * @brief What to write for output slots where a stream has no content
 */
enum class BoundaryPolicy {
    Pad,            ///< Video: black frame. Sequence: no file for that index.
    ClampToOverlap, ///< Narrow the range to frames every stream covers
};

const char* boundaryPolicyName(BoundaryPolicy policy);

/// "pad" / "overlap" (also "clamp"); InvalidArgument otherwise
Result<BoundaryPolicy, Error> parseBoundaryPolicy(const std::string& name);

enum class ExportStatus {
    Idle,
    Running,
    Succeeded,
    Failed,
};

using JobId = uint64_t;

struct ExportRequest {
    std::vector<media::StreamInfo> streams;     // Index 0 is the reference stream
    std::vector<int> offsets;                   // One per stream
    double frameRate = 0.0;                     // Timeline frame rate
    FrameIndex trimStart = 0;                   // Inclusive
    FrameIndex trimEnd = 0;                     // Inclusive
    std::filesystem::path outputDirectory;      // Empty = next to each input
    BoundaryPolicy policy = BoundaryPolicy::Pad;
};

/**
 * @brief Global frames for which a stream has source content
 *
 * offset + global must land in [0, frameCount). Empty when
 * lastContent < firstContent.
 */
struct ContentRange {
    FrameIndex firstContent = 0;
    FrameIndex lastContent = -1;

    static ContentRange of(const media::StreamInfo& stream, int offset) {
        return {-static_cast<FrameIndex>(offset), stream.frameCount - 1 - offset};
    }

    [[nodiscard]] bool contains(FrameIndex globalFrame) const {
        return globalFrame >= firstContent && globalFrame <= lastContent;
    }
};

} // namespace reelsync::engine
