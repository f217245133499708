/**
 * @file frame.cpp
 * @brief VideoFrame implementation
 */

#include <reelsync/media/frame.hpp>
#include <vector>
#include <cstring>

namespace reelsync::media {

struct VideoFrame::Impl {
    int width = 0;
    int height = 0;
    int linesize = 0;
    PixelFormat format = PixelFormat::Unknown;
    Timestamp pts = kNoTimestamp;
    FrameIndex frameNumber = kNoFrame;
    std::shared_ptr<std::vector<uint8_t>> buffer;
};

VideoFrame::VideoFrame() : m_impl(std::make_shared<Impl>()) {}
VideoFrame::~VideoFrame() = default;

VideoFrame::VideoFrame(const VideoFrame& other) = default;
VideoFrame& VideoFrame::operator=(const VideoFrame& other) = default;
VideoFrame::VideoFrame(VideoFrame&& other) noexcept = default;
VideoFrame& VideoFrame::operator=(VideoFrame&& other) noexcept = default;

int VideoFrame::width() const {
    return m_impl ? m_impl->width : 0;
}

int VideoFrame::height() const {
    return m_impl ? m_impl->height : 0;
}

PixelFormat VideoFrame::format() const {
    return m_impl ? m_impl->format : PixelFormat::Unknown;
}

Timestamp VideoFrame::pts() const {
    return m_impl ? m_impl->pts : kNoTimestamp;
}

void VideoFrame::setPts(Timestamp pts) {
    if (m_impl) m_impl->pts = pts;
}

FrameIndex VideoFrame::frameNumber() const {
    return m_impl ? m_impl->frameNumber : kNoFrame;
}

void VideoFrame::setFrameNumber(FrameIndex frame) {
    if (m_impl) m_impl->frameNumber = frame;
}

const uint8_t* VideoFrame::data() const {
    if (!m_impl || !m_impl->buffer) return nullptr;
    return m_impl->buffer->data();
}

uint8_t* VideoFrame::data() {
    if (!m_impl || !m_impl->buffer) return nullptr;
    return m_impl->buffer->data();
}

int VideoFrame::linesize() const {
    return m_impl ? m_impl->linesize : 0;
}

size_t VideoFrame::dataSize() const {
    if (!m_impl || !m_impl->buffer) return 0;
    return m_impl->buffer->size();
}

void VideoFrame::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    if (!isValid()) return;

    const int bpp = bytesPerPixel(m_impl->format);
    uint8_t pixel[4] = {r, g, b, a};
    if (m_impl->format == PixelFormat::BGRA) {
        pixel[0] = b;
        pixel[2] = r;
    }

    uint8_t* row = m_impl->buffer->data();
    for (int y = 0; y < m_impl->height; ++y) {
        uint8_t* px = row;
        for (int x = 0; x < m_impl->width; ++x) {
            std::memcpy(px, pixel, bpp);
            px += bpp;
        }
        row += m_impl->linesize;
    }
}

bool VideoFrame::isValid() const {
    return m_impl && m_impl->buffer && m_impl->width > 0 && m_impl->height > 0;
}

Result<VideoFrame, Error> VideoFrame::create(int width, int height, PixelFormat format) {
    if (width <= 0 || height <= 0) {
        return Error(ErrorCode::InvalidArgument, "Invalid dimensions");
    }

    const int bpp = bytesPerPixel(format);
    if (bpp == 0) {
        return Error(ErrorCode::NotSupported, "Unsupported pixel format");
    }

    VideoFrame frame;
    frame.m_impl->width = width;
    frame.m_impl->height = height;
    frame.m_impl->format = format;
    frame.m_impl->linesize = width * bpp;
    try {
        frame.m_impl->buffer = std::make_shared<std::vector<uint8_t>>(
            static_cast<size_t>(frame.m_impl->linesize) * height, uint8_t{0});
    } catch (const std::bad_alloc&) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate frame buffer");
    }
    return frame;
}

Result<VideoFrame, Error> VideoFrame::black(int width, int height, PixelFormat format) {
    auto frame = create(width, height, format);
    if (!frame.ok()) {
        return frame.error();
    }
    frame.value().fill(0, 0, 0, 255);
    return frame;
}

} // namespace reelsync::media
