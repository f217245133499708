/**
 * @file frame_sink.hpp
 * @brief Export output interface
 *
 * A sink receives the frames of one stream in output order and
 * owns everything written for that stream.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/media/frame.hpp>
#include <reelsync/media/stream_info.hpp>
#include <memory>
#include <functional>
#include <filesystem>
#include <string>

namespace reelsync::media {

/// Kind of artifact written per input stream
enum class ExportMode {
    Video,          // One re-encoded video file
    ImageSequence,  // One numbered image per frame
};

const char* exportModeName(ExportMode mode);

class FrameSink {
public:
    virtual ~FrameSink() = default;

    /**
     * @brief Write a decoded frame
     * @param frame Source frame (any packed format)
     * @param outputIndex Global timeline frame the output slot belongs to
     */
    virtual Result<void, Error> writeFrame(const VideoFrame& frame, FrameIndex outputIndex) = 0;

    /// Write a black frame for a slot with no source content
    virtual Result<void, Error> writeBlank(FrameIndex outputIndex) = 0;

    /// Flush pending output and release the file(s)
    virtual Result<void, Error> close() = 0;

    /// File or directory this sink writes to
    [[nodiscard]] virtual std::filesystem::path location() const = 0;

    [[nodiscard]] virtual FrameIndex framesWritten() const = 0;
};

using FrameSinkPtr = std::unique_ptr<FrameSink>;

/**
 * @brief Everything a sink needs to open its output
 */
struct SinkRequest {
    ExportMode mode = ExportMode::Video;
    StreamInfo source;
    std::filesystem::path location;     // From outputLocation()
    Rational frameRate;                 // Timeline rate of the export
};

using FrameSinkFactory = std::function<Result<FrameSinkPtr, Error>(const SinkRequest&)>;

/**
 * @brief Output location for one input stream
 *
 * Video: <dir>/synced/<file name>. Image sequence: <dir>/<file stem>.
 * <dir> is the input's directory unless outputDirectory is given.
 */
std::filesystem::path outputLocation(ExportMode mode,
                                     const std::filesystem::path& input,
                                     const std::filesystem::path& outputDirectory = {});

/// "000042.jpg"
std::string sequenceFileName(FrameIndex outputIndex);

} // namespace reelsync::media
