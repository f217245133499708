/**
 * @file ffmpeg_decoder.hpp
 * @brief FFmpeg-backed StreamDecoder (PIMPL)
 */

#pragma once

#include <reelsync/media/stream_decoder.hpp>
#include <memory>
#include <filesystem>

namespace reelsync::media {

/**
 * @brief Frame-accurate random access over one video file
 *
 * Seeks backward to the nearest keyframe and decodes forward until
 * the frame number reaches the target. Short forward steps (playback)
 * continue decoding without a seek. Output is packed RGBA.
 *
 * Not thread-safe; use one instance per thread.
 */
class FfmpegStreamDecoder : public StreamDecoder {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use open()
    explicit FfmpegStreamDecoder(PrivateTag);
    ~FfmpegStreamDecoder() override;

    FfmpegStreamDecoder(const FfmpegStreamDecoder&) = delete;
    FfmpegStreamDecoder& operator=(const FfmpegStreamDecoder&) = delete;

    /**
     * @brief Probe and open a file
     * @param path Video file
     * @return Ready decoder or error
     */
    static Result<StreamDecoderPtr, Error> open(const std::filesystem::path& path);

    [[nodiscard]] const StreamInfo& info() const override;
    Result<VideoFrame, Error> decodeFrame(FrameIndex frame) override;
    [[nodiscard]] FrameIndex position() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Factory for SyncSession / SyncExporter
StreamDecoderFactory ffmpegDecoderFactory();

} // namespace reelsync::media
