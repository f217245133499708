/**
 * @file frame.hpp
 * @brief Decoded video frame in CPU memory
 *
 * Decoders hand out packed RGB(A) frames ready for display;
 * sinks convert back to their encoder's pixel format.
 * Copies share the pixel buffer.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <memory>
#include <cstdint>
#include <cstddef>

namespace reelsync::media {

class VideoFrame {
public:
    /// Invalid (empty) frame
    VideoFrame();
    ~VideoFrame();

    VideoFrame(const VideoFrame& other);
    VideoFrame& operator=(const VideoFrame& other);
    VideoFrame(VideoFrame&& other) noexcept;
    VideoFrame& operator=(VideoFrame&& other) noexcept;

    // ========== Properties ==========

    [[nodiscard]] int width() const;
    [[nodiscard]] int height() const;
    [[nodiscard]] Size size() const { return {width(), height()}; }
    [[nodiscard]] PixelFormat format() const;

    /// Presentation timestamp (microseconds)
    [[nodiscard]] Timestamp pts() const;
    void setPts(Timestamp pts);

    /// Native frame index inside the source stream
    [[nodiscard]] FrameIndex frameNumber() const;
    void setFrameNumber(FrameIndex frame);

    // ========== Data Access ==========

    [[nodiscard]] const uint8_t* data() const;
    [[nodiscard]] uint8_t* data();

    /// Bytes per row
    [[nodiscard]] int linesize() const;

    [[nodiscard]] size_t dataSize() const;

    /// Set every pixel to one color (alpha ignored for RGB24)
    void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

    // ========== Validity ==========

    [[nodiscard]] bool isValid() const;
    explicit operator bool() const { return isValid(); }

    // ========== Factory ==========

    /**
     * @brief Allocate a zeroed frame
     *
     * @param width Frame width
     * @param height Frame height
     * @param format Packed pixel format
     * @return Allocated frame or error
     */
    static Result<VideoFrame, Error> create(int width, int height,
                                            PixelFormat format = PixelFormat::RGBA);

    /// Opaque black frame
    static Result<VideoFrame, Error> black(int width, int height,
                                           PixelFormat format = PixelFormat::RGBA);

private:
    struct Impl;
    std::shared_ptr<Impl> m_impl;
};

} // namespace reelsync::media
