/**
 * @file ffmpeg_sinks.cpp
 * @brief FFmpeg video and image sequence writers
 */

#include <reelsync/media/ffmpeg_sinks.hpp>
#include <reelsync/core/logger.hpp>
#include "ffmpeg/ff_common.hpp"
#include "ffmpeg/av_handles.hpp"
#include <fstream>
#include <system_error>

namespace reelsync::media {

namespace {

Result<void, Error> ensureDirectory(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return Ok();
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error(ErrorCode::WriteError,
                     "Cannot create directory " + dir.string() + ": " + ec.message());
    }
    return Ok();
}

/**
 * @brief Converts packed VideoFrames into encoder-ready AVFrames
 *
 * Scales to the encoder size when a source frame differs from it.
 */
class FrameConverter {
public:
    Result<void, Error> init(int width, int height, AVPixelFormat format) {
        m_frame = ff::allocFrame();
        if (!m_frame) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate frame");
        }
        m_frame->width = width;
        m_frame->height = height;
        m_frame->format = format;
        int ret = av_frame_get_buffer(m_frame.get(), 0);
        if (ret < 0) {
            return ff::avError(ret, "Failed to allocate frame buffer");
        }
        return Ok();
    }

    Result<AVFrame*, Error> convert(const VideoFrame& src) {
        AVPixelFormat srcFormat = ff::avPixelFormat(src.format());
        if (!src.isValid() || srcFormat == AV_PIX_FMT_NONE) {
            return Error(ErrorCode::InvalidArgument, "Frame is empty or has no packed format");
        }

        int ret = av_frame_make_writable(m_frame.get());
        if (ret < 0) {
            return ff::avError(ret, "Frame not writable");
        }

        m_sws.reset(sws_getCachedContext(m_sws.release(),
            src.width(), src.height(), srcFormat,
            m_frame->width, m_frame->height, static_cast<AVPixelFormat>(m_frame->format),
            SWS_BICUBIC, nullptr, nullptr, nullptr));
        if (!m_sws) {
            return Error(ErrorCode::EncoderError, "Failed to create scaler");
        }

        const uint8_t* srcData[4] = {src.data(), nullptr, nullptr, nullptr};
        int srcLinesize[4] = {src.linesize(), 0, 0, 0};
        sws_scale(m_sws.get(), srcData, srcLinesize, 0, src.height(),
                  m_frame->data, m_frame->linesize);
        return m_frame.get();
    }

private:
    ff::FramePtr m_frame;
    ff::SwsContextPtr m_sws;
};

/// Even dimensions for 4:2:0 encoders
int evenDown(int value) {
    return value > 1 ? value & ~1 : 2;
}

} // anonymous namespace

// ============================================================================
// FfmpegVideoSink
// ============================================================================

struct FfmpegVideoSink::Impl {
    std::filesystem::path location;
    ff::OutputFormatPtr formatCtx;
    ff::CodecContextPtr encoderCtx;
    ff::PacketPtr packet;
    AVStream* stream = nullptr;
    FrameConverter converter;
    VideoFrame blank;
    int64_t nextPts = 0;
    FrameIndex written = 0;
    bool headerWritten = false;
    bool closed = false;

    Result<void, Error> open(Size resolution, Rational frameRate, const ExportSettings& settings) {
        if (resolution.isEmpty() || !frameRate.valid()) {
            return Error(ErrorCode::InvalidArgument, "Invalid output size or frame rate");
        }

        auto dir = ensureDirectory(location.parent_path());
        if (!dir.ok()) {
            return dir.error();
        }

        const std::string path = location.string();
        AVFormatContext* rawCtx = nullptr;
        int ret = avformat_alloc_output_context2(&rawCtx, nullptr, nullptr, path.c_str());
        if (ret < 0 || !rawCtx) {
            ret = avformat_alloc_output_context2(&rawCtx, nullptr, "mp4", path.c_str());
        }
        if (ret < 0 || !rawCtx) {
            return ff::avError(ret, "Failed to create output context", ErrorCode::FileOpenFailed);
        }
        formatCtx.reset(rawCtx);

        const AVCodec* encoder = avcodec_find_encoder_by_name(settings.videoCodec.c_str());
        if (!encoder) {
            return Error(ErrorCode::CodecNotFound, "Encoder not found: " + settings.videoCodec);
        }

        encoderCtx.reset(avcodec_alloc_context3(encoder));
        if (!encoderCtx) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate encoder context");
        }

        encoderCtx->width = evenDown(resolution.width);
        encoderCtx->height = evenDown(resolution.height);
        encoderCtx->time_base = av_inv_q(ff::avRational(frameRate));
        encoderCtx->framerate = ff::avRational(frameRate);
        encoderCtx->pix_fmt = AV_PIX_FMT_YUV420P;
        encoderCtx->gop_size = 2 * static_cast<int>(frameRate.toDouble() + 0.5);
        if (formatCtx->oformat->flags & AVFMT_GLOBALHEADER) {
            encoderCtx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        av_opt_set(encoderCtx->priv_data, "crf", std::to_string(settings.crf).c_str(), 0);
        av_opt_set(encoderCtx->priv_data, "preset", settings.preset.c_str(), 0);

        ret = avcodec_open2(encoderCtx.get(), encoder, nullptr);
        if (ret < 0) {
            return ff::avError(ret, "Failed to open encoder", ErrorCode::CodecOpenFailed);
        }

        stream = avformat_new_stream(formatCtx.get(), nullptr);
        if (!stream) {
            return Error(ErrorCode::OutOfMemory, "Failed to create output stream");
        }
        stream->time_base = encoderCtx->time_base;
        stream->avg_frame_rate = encoderCtx->framerate;
        ret = avcodec_parameters_from_context(stream->codecpar, encoderCtx.get());
        if (ret < 0) {
            return ff::avError(ret, "Failed to copy encoder parameters", ErrorCode::EncoderError);
        }

        if (!(formatCtx->oformat->flags & AVFMT_NOFILE)) {
            ret = avio_open(&formatCtx->pb, path.c_str(), AVIO_FLAG_WRITE);
            if (ret < 0) {
                return ff::avError(ret, "Failed to open " + path, ErrorCode::FileOpenFailed);
            }
        }

        AVDictionary* options = nullptr;
        av_dict_set(&options, "movflags", "+faststart", 0);
        ret = avformat_write_header(formatCtx.get(), &options);
        av_dict_free(&options);
        if (ret < 0) {
            return ff::avError(ret, "Failed to write header", ErrorCode::WriteError);
        }
        headerWritten = true;

        packet = ff::allocPacket();
        if (!packet) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate packet");
        }

        auto conv = converter.init(encoderCtx->width, encoderCtx->height, encoderCtx->pix_fmt);
        if (!conv.ok()) {
            return conv.error();
        }

        LOG_INFO("Video sink {}: {}x{} @ {}/{} fps, {} crf {} preset {}",
                 path, encoderCtx->width, encoderCtx->height, frameRate.num, frameRate.den,
                 settings.videoCodec, settings.crf, settings.preset);
        return Ok();
    }

    /// Send one frame (nullptr flushes) and mux every packet the encoder returns
    Result<void, Error> encode(AVFrame* frame) {
        int ret = avcodec_send_frame(encoderCtx.get(), frame);
        if (ret < 0) {
            return ff::avError(ret, "Error sending frame to encoder", ErrorCode::EncoderError);
        }

        while (true) {
            ret = avcodec_receive_packet(encoderCtx.get(), packet.get());
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                return Ok();
            }
            if (ret < 0) {
                return ff::avError(ret, "Error receiving packet from encoder",
                                   ErrorCode::EncoderError);
            }

            av_packet_rescale_ts(packet.get(), encoderCtx->time_base, stream->time_base);
            packet->stream_index = stream->index;
            ret = av_interleaved_write_frame(formatCtx.get(), packet.get());
            av_packet_unref(packet.get());
            if (ret < 0) {
                return ff::avError(ret, "Failed to write packet", ErrorCode::WriteError);
            }
        }
    }

    Result<void, Error> write(const VideoFrame& src) {
        if (closed) {
            return Error(ErrorCode::NotReady, "Sink is closed");
        }
        auto converted = converter.convert(src);
        if (!converted.ok()) {
            return converted.error();
        }
        AVFrame* frame = converted.value();
        frame->pts = nextPts++;

        auto result = encode(frame);
        if (!result.ok()) {
            return result.error();
        }
        ++written;
        return Ok();
    }

    Result<void, Error> finish() {
        if (closed) {
            return Ok();
        }
        closed = true;

        Result<void, Error> result;
        if (encoderCtx && headerWritten) {
            result = encode(nullptr);
            int ret = av_write_trailer(formatCtx.get());
            if (ret < 0 && result.ok()) {
                result = ff::avError(ret, "Failed to write trailer", ErrorCode::WriteError);
            }
        }

        encoderCtx.reset();
        formatCtx.reset();

        if (result.ok()) {
            LOG_INFO("Video sink {} closed, {} frames", location.string(), written);
        }
        return result;
    }
};

FfmpegVideoSink::FfmpegVideoSink(PrivateTag)
    : m_impl(std::make_unique<Impl>()) {}

FfmpegVideoSink::~FfmpegVideoSink() {
    if (m_impl && !m_impl->closed) {
        auto result = m_impl->finish();
        if (!result.ok()) {
            LOG_ERROR("Closing {} failed: {}", m_impl->location.string(), result.error().what());
        }
    }
}

Result<FrameSinkPtr, Error> FfmpegVideoSink::create(const std::filesystem::path& location,
                                                    Size resolution,
                                                    Rational frameRate,
                                                    const ExportSettings& settings) {
    auto sink = std::make_unique<FfmpegVideoSink>(PrivateTag{});
    sink->m_impl->location = location;
    auto result = sink->m_impl->open(resolution, frameRate, settings);
    if (!result.ok()) {
        // Nothing useful was written; drop the partial file
        sink->m_impl->closed = true;
        sink->m_impl->encoderCtx.reset();
        sink->m_impl->formatCtx.reset();
        std::error_code ec;
        std::filesystem::remove(location, ec);
        return result.error();
    }
    return FrameSinkPtr(std::move(sink));
}

Result<void, Error> FfmpegVideoSink::writeFrame(const VideoFrame& frame, FrameIndex) {
    return m_impl->write(frame);
}

Result<void, Error> FfmpegVideoSink::writeBlank(FrameIndex) {
    if (!m_impl->blank) {
        auto black = VideoFrame::black(m_impl->encoderCtx ? m_impl->encoderCtx->width : 2,
                                       m_impl->encoderCtx ? m_impl->encoderCtx->height : 2);
        if (!black.ok()) {
            return black.error();
        }
        m_impl->blank = black.value();
    }
    return m_impl->write(m_impl->blank);
}

Result<void, Error> FfmpegVideoSink::close() {
    return m_impl->finish();
}

std::filesystem::path FfmpegVideoSink::location() const {
    return m_impl->location;
}

FrameIndex FfmpegVideoSink::framesWritten() const {
    return m_impl->written;
}

// ============================================================================
// FfmpegImageSequenceSink
// ============================================================================

struct FfmpegImageSequenceSink::Impl {
    std::filesystem::path directory;
    ff::CodecContextPtr encoderCtx;
    ff::PacketPtr packet;
    FrameConverter converter;
    VideoFrame blank;
    FrameIndex written = 0;
    bool closed = false;

    Result<void, Error> open(Size resolution, const ExportSettings& settings) {
        if (resolution.isEmpty()) {
            return Error(ErrorCode::InvalidArgument, "Invalid output size");
        }

        auto dir = ensureDirectory(directory);
        if (!dir.ok()) {
            return dir.error();
        }

        const AVCodec* encoder = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
        if (!encoder) {
            return Error(ErrorCode::CodecNotFound, "MJPEG encoder not found");
        }

        encoderCtx.reset(avcodec_alloc_context3(encoder));
        if (!encoderCtx) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate encoder context");
        }

        encoderCtx->width = evenDown(resolution.width);
        encoderCtx->height = evenDown(resolution.height);
        encoderCtx->time_base = {1, 25};
        encoderCtx->pix_fmt = AV_PIX_FMT_YUVJ420P;
        encoderCtx->thread_count = 1;   // One packet out per frame in
        encoderCtx->flags |= AV_CODEC_FLAG_QSCALE;
        encoderCtx->global_quality = FF_QP2LAMBDA * settings.jpegQScale;
        encoderCtx->qmin = settings.jpegQScale;
        encoderCtx->qmax = settings.jpegQScale;

        int ret = avcodec_open2(encoderCtx.get(), encoder, nullptr);
        if (ret < 0) {
            return ff::avError(ret, "Failed to open JPEG encoder", ErrorCode::CodecOpenFailed);
        }

        packet = ff::allocPacket();
        if (!packet) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate packet");
        }

        auto conv = converter.init(encoderCtx->width, encoderCtx->height, encoderCtx->pix_fmt);
        if (!conv.ok()) {
            return conv.error();
        }

        LOG_INFO("Image sequence sink {}: {}x{}, qscale {}", directory.string(),
                 encoderCtx->width, encoderCtx->height, settings.jpegQScale);
        return Ok();
    }

    Result<void, Error> write(const VideoFrame& src, FrameIndex outputIndex) {
        if (closed) {
            return Error(ErrorCode::NotReady, "Sink is closed");
        }
        auto converted = converter.convert(src);
        if (!converted.ok()) {
            return converted.error();
        }
        AVFrame* frame = converted.value();
        frame->pts = outputIndex;

        int ret = avcodec_send_frame(encoderCtx.get(), frame);
        if (ret < 0) {
            return ff::avError(ret, "Error sending frame to encoder", ErrorCode::EncoderError);
        }

        ret = avcodec_receive_packet(encoderCtx.get(), packet.get());
        if (ret < 0) {
            return ff::avError(ret, "Error receiving packet from encoder", ErrorCode::EncoderError);
        }

        const std::filesystem::path file = directory / sequenceFileName(outputIndex);
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(packet->data), packet->size);
        out.close();
        av_packet_unref(packet.get());
        if (!out) {
            return Error(ErrorCode::WriteError, "Failed to write " + file.string());
        }

        ++written;
        return Ok();
    }
};

FfmpegImageSequenceSink::FfmpegImageSequenceSink(PrivateTag)
    : m_impl(std::make_unique<Impl>()) {}

FfmpegImageSequenceSink::~FfmpegImageSequenceSink() = default;

Result<FrameSinkPtr, Error> FfmpegImageSequenceSink::create(const std::filesystem::path& directory,
                                                            Size resolution,
                                                            const ExportSettings& settings) {
    auto sink = std::make_unique<FfmpegImageSequenceSink>(PrivateTag{});
    sink->m_impl->directory = directory;
    auto result = sink->m_impl->open(resolution, settings);
    if (!result.ok()) {
        return result.error();
    }
    return FrameSinkPtr(std::move(sink));
}

Result<void, Error> FfmpegImageSequenceSink::writeFrame(const VideoFrame& frame,
                                                        FrameIndex outputIndex) {
    return m_impl->write(frame, outputIndex);
}

Result<void, Error> FfmpegImageSequenceSink::writeBlank(FrameIndex outputIndex) {
    if (!m_impl->blank) {
        auto black = VideoFrame::black(m_impl->encoderCtx ? m_impl->encoderCtx->width : 2,
                                       m_impl->encoderCtx ? m_impl->encoderCtx->height : 2);
        if (!black.ok()) {
            return black.error();
        }
        m_impl->blank = black.value();
    }
    return m_impl->write(m_impl->blank, outputIndex);
}

Result<void, Error> FfmpegImageSequenceSink::close() {
    if (!m_impl->closed) {
        m_impl->closed = true;
        m_impl->encoderCtx.reset();
        LOG_INFO("Image sequence sink {} closed, {} files", m_impl->directory.string(),
                 m_impl->written);
    }
    return Ok();
}

std::filesystem::path FfmpegImageSequenceSink::location() const {
    return m_impl->directory;
}

FrameIndex FfmpegImageSequenceSink::framesWritten() const {
    return m_impl->written;
}

// ============================================================================
// Factory
// ============================================================================

FrameSinkFactory ffmpegSinkFactory(const ExportSettings& settings) {
    return [settings](const SinkRequest& request) -> Result<FrameSinkPtr, Error> {
        switch (request.mode) {
            case ExportMode::Video:
                return FfmpegVideoSink::create(request.location, request.source.resolution,
                                               request.frameRate, settings);
            case ExportMode::ImageSequence:
                return FfmpegImageSequenceSink::create(request.location,
                                                       request.source.resolution, settings);
        }
        return Error(ErrorCode::NotSupported, "Unknown export mode");
    };
}

} // namespace reelsync::media
