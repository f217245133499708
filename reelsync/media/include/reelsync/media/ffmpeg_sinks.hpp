/**
 * @file ffmpeg_sinks.hpp
 * @brief FFmpeg-backed FrameSink implementations
 */

#pragma once

#include <reelsync/media/frame_sink.hpp>
#include <reelsync/core/settings.hpp>
#include <memory>
#include <filesystem>

namespace reelsync::media {

/**
 * @brief Re-encodes one stream into an MP4 file
 *
 * Codec, CRF and preset come from ExportSettings (libx264, 18,
 * medium by default). The moov atom is moved to the front.
 * Frames get consecutive timestamps at the export frame rate.
 */
class FfmpegVideoSink : public FrameSink {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use create()
    explicit FfmpegVideoSink(PrivateTag);
    ~FfmpegVideoSink() override;

    FfmpegVideoSink(const FfmpegVideoSink&) = delete;
    FfmpegVideoSink& operator=(const FfmpegVideoSink&) = delete;

    /**
     * @brief Create the output file and write its header
     *
     * @param location Output file, parent directories are created
     * @param resolution Frame size of the source stream
     * @param frameRate Output frame rate
     * @param settings Encoder options
     */
    static Result<FrameSinkPtr, Error> create(const std::filesystem::path& location,
                                              Size resolution,
                                              Rational frameRate,
                                              const ExportSettings& settings);

    Result<void, Error> writeFrame(const VideoFrame& frame, FrameIndex outputIndex) override;
    Result<void, Error> writeBlank(FrameIndex outputIndex) override;
    Result<void, Error> close() override;

    [[nodiscard]] std::filesystem::path location() const override;
    [[nodiscard]] FrameIndex framesWritten() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Writes one JPEG per frame into a directory
 *
 * Files are named after the output index (000042.jpg) so that
 * sequences of different streams line up by name.
 */
class FfmpegImageSequenceSink : public FrameSink {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use create()
    explicit FfmpegImageSequenceSink(PrivateTag);
    ~FfmpegImageSequenceSink() override;

    FfmpegImageSequenceSink(const FfmpegImageSequenceSink&) = delete;
    FfmpegImageSequenceSink& operator=(const FfmpegImageSequenceSink&) = delete;

    static Result<FrameSinkPtr, Error> create(const std::filesystem::path& directory,
                                              Size resolution,
                                              const ExportSettings& settings);

    Result<void, Error> writeFrame(const VideoFrame& frame, FrameIndex outputIndex) override;
    Result<void, Error> writeBlank(FrameIndex outputIndex) override;
    Result<void, Error> close() override;

    [[nodiscard]] std::filesystem::path location() const override;
    [[nodiscard]] FrameIndex framesWritten() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Sink factory for SyncExporter, dispatching on SinkRequest::mode
FrameSinkFactory ffmpegSinkFactory(const ExportSettings& settings);

} // namespace reelsync::media
