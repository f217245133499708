/**
 * @file media_info.hpp
 * @brief Video file probing
 *
 * Extracts the StreamInfo of a file without keeping it open.
 * Implemented in reelsync_media_ffmpeg.
 */

#pragma once

#include <reelsync/core/result.hpp>
#include <reelsync/media/stream_info.hpp>
#include <filesystem>

namespace reelsync::media {

class MediaInfo {
public:
    /**
     * @brief Probe the first video stream of a file
     *
     * Frame count comes from the container, falling back to
     * duration x frame rate, then to decoding every frame.
     *
     * @param path Path to media file
     * @return StreamInfo, or an error if the file has no video stream,
     *         no usable frame rate or no frames
     */
    static Result<StreamInfo, Error> probe(const std::filesystem::path& path);
};

} // namespace reelsync::media
