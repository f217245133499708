/**
 * @file stream_decoder.hpp
 * @brief Random-access frame decoder interface
 *
 * One decoder owns one read cursor over one file. The playback
 * clock and the exporter each open their own, so cursors are
 * never shared between threads.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/media/frame.hpp>
#include <reelsync/media/stream_info.hpp>
#include <memory>
#include <functional>
#include <filesystem>

namespace reelsync::media {

class StreamDecoder {
public:
    virtual ~StreamDecoder() = default;

    /// Probed properties of the opened file
    [[nodiscard]] virtual const StreamInfo& info() const = 0;

    /**
     * @brief Decode one frame by native index
     *
     * @param frame Native frame index, 0 <= frame < info().frameCount
     * @return Packed RGBA frame, or RangeError / DecodeFailure
     */
    virtual Result<VideoFrame, Error> decodeFrame(FrameIndex frame) = 0;

    /// Native index of the last frame returned, kNoFrame before the first decode
    [[nodiscard]] virtual FrameIndex position() const = 0;
};

using StreamDecoderPtr = std::unique_ptr<StreamDecoder>;

/// Opens a decoder for a path
using StreamDecoderFactory =
    std::function<Result<StreamDecoderPtr, Error>(const std::filesystem::path&)>;

} // namespace reelsync::media
