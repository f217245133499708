/**
 * @file ffmpeg_decoder.cpp
 * @brief FfmpegStreamDecoder implementation
 */

#include <reelsync/media/ffmpeg_decoder.hpp>
#include <reelsync/media/media_info.hpp>
#include <reelsync/core/logger.hpp>
#include "ffmpeg/ff_common.hpp"
#include "ffmpeg/av_handles.hpp"
#include <cstring>

namespace reelsync::media {

namespace {

/// Frames ahead of the cursor still reached by decoding forward
constexpr FrameIndex kMaxForwardDecode = 10;

} // anonymous namespace

// ============================================================================
// FfmpegStreamDecoder Implementation
// ============================================================================

struct FfmpegStreamDecoder::Impl {
    StreamInfo info;

    ff::InputFormatPtr formatCtx;
    ff::CodecContextPtr codecCtx;
    ff::SwsContextPtr swsCtx;
    ff::PacketPtr packet;
    ff::FramePtr decodedFrame;

    int streamIdx = -1;
    AVStream* stream = nullptr;
    Timestamp startTime = 0;    // Stream start_time in microseconds

    FrameIndex position = kNoFrame;
    bool eof = false;

    Result<void, Error> open(const std::filesystem::path& path) {
        auto probed = MediaInfo::probe(path);
        if (!probed.ok()) {
            return probed.error();
        }
        info = probed.value();

        auto input = ff::openInput(path.string());
        if (!input.ok()) {
            return input.error();
        }
        formatCtx = std::move(input.value());

        streamIdx = av_find_best_stream(formatCtx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (streamIdx < 0) {
            return ff::avError(streamIdx, "No video stream", ErrorCode::NotFound);
        }
        stream = formatCtx->streams[streamIdx];

        auto codec = ff::openDecoder(stream);
        if (!codec.ok()) {
            return codec.error();
        }
        codecCtx = std::move(codec.value());

        packet = ff::allocPacket();
        decodedFrame = ff::allocFrame();
        if (!packet || !decodedFrame) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate packet/frame");
        }

        if (stream->start_time != AV_NOPTS_VALUE) {
            startTime = ff::streamToUs(stream->start_time, stream);
        }

        LOG_DEBUG("Opened decoder for {} ({})", path.string(),
                  avcodec_get_name(stream->codecpar->codec_id));
        return Ok();
    }

    /// Native frame index of a decoded frame
    FrameIndex frameNumberOf(const AVFrame* frame) const {
        int64_t ts = frame->best_effort_timestamp;
        if (ts == AV_NOPTS_VALUE) {
            ts = frame->pts;
        }
        if (ts == AV_NOPTS_VALUE) {
            return position + 1;
        }
        return info.timeToFrame(ff::streamToUs(ts, stream) - startTime);
    }

    Result<void, Error> seekTo(FrameIndex target) {
        Timestamp targetTime = info.frameToTime(target) + startTime;
        int64_t seekTs = ff::usToStream(targetTime, stream);

        int ret = av_seek_frame(formatCtx.get(), streamIdx, seekTs, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            return ff::avError(ret, "Seek failed", ErrorCode::DecodeFailure);
        }
        avcodec_flush_buffers(codecCtx.get());
        eof = false;
        position = kNoFrame;
        return Ok();
    }

    Result<VideoFrame, Error> convert(const AVFrame* src, FrameIndex frameNumber) {
        auto out = VideoFrame::create(src->width, src->height, PixelFormat::RGBA);
        if (!out.ok()) {
            return out.error();
        }

        swsCtx.reset(sws_getCachedContext(swsCtx.release(),
            src->width, src->height, static_cast<AVPixelFormat>(src->format),
            src->width, src->height, AV_PIX_FMT_RGBA,
            SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!swsCtx) {
            return Error(ErrorCode::DecodeFailure, "Failed to create scaler");
        }

        VideoFrame& frame = out.value();
        uint8_t* dstData[4] = {frame.data(), nullptr, nullptr, nullptr};
        int dstLinesize[4] = {frame.linesize(), 0, 0, 0};
        sws_scale(swsCtx.get(), src->data, src->linesize, 0, src->height,
                  dstData, dstLinesize);

        frame.setFrameNumber(frameNumber);
        frame.setPts(info.frameToTime(frameNumber));
        return out;
    }

    Result<VideoFrame, Error> decode(FrameIndex target) {
        if (!info.containsFrame(target)) {
            return Error(ErrorCode::RangeError,
                         "Frame " + std::to_string(target) + " outside [0, " +
                         std::to_string(info.frameCount) + ")");
        }

        bool forward = position != kNoFrame && !eof &&
                       target > position && target - position <= kMaxForwardDecode;
        if (!forward) {
            auto seeked = seekTo(target);
            if (!seeked.ok()) {
                return seeked.error();
            }
        }

        while (true) {
            av_frame_unref(decodedFrame.get());
            int ret = avcodec_receive_frame(codecCtx.get(), decodedFrame.get());

            if (ret == 0) {
                FrameIndex current = frameNumberOf(decodedFrame.get());
                position = current;
                if (current < target) {
                    continue;
                }
                return convert(decodedFrame.get(), current);
            }

            if (ret == AVERROR(EAGAIN)) {
                if (eof) {
                    break;
                }
                av_packet_unref(packet.get());
                ret = av_read_frame(formatCtx.get(), packet.get());

                if (ret == AVERROR_EOF) {
                    avcodec_send_packet(codecCtx.get(), nullptr);
                    eof = true;
                    continue;
                }
                if (ret < 0) {
                    return ff::avError(ret, "Failed to read frame", ErrorCode::DecodeFailure);
                }
                if (packet->stream_index != streamIdx) {
                    continue;
                }

                ret = avcodec_send_packet(codecCtx.get(), packet.get());
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    return ff::avError(ret, "Failed to send packet", ErrorCode::DecodeFailure);
                }
                continue;
            }

            if (ret == AVERROR_EOF) {
                break;
            }
            return ff::avError(ret, "Decode error", ErrorCode::DecodeFailure);
        }

        return Error(ErrorCode::DecodeFailure,
                     "End of stream before frame " + std::to_string(target));
    }
};

FfmpegStreamDecoder::FfmpegStreamDecoder(PrivateTag)
    : m_impl(std::make_unique<Impl>()) {}

FfmpegStreamDecoder::~FfmpegStreamDecoder() = default;

Result<StreamDecoderPtr, Error> FfmpegStreamDecoder::open(const std::filesystem::path& path) {
    auto decoder = std::make_unique<FfmpegStreamDecoder>(PrivateTag{});
    auto result = decoder->m_impl->open(path);
    if (!result.ok()) {
        return result.error();
    }
    return StreamDecoderPtr(std::move(decoder));
}

const StreamInfo& FfmpegStreamDecoder::info() const {
    return m_impl->info;
}

Result<VideoFrame, Error> FfmpegStreamDecoder::decodeFrame(FrameIndex frame) {
    return m_impl->decode(frame);
}

FrameIndex FfmpegStreamDecoder::position() const {
    return m_impl->position;
}

StreamDecoderFactory ffmpegDecoderFactory() {
    return [](const std::filesystem::path& path) {
        return FfmpegStreamDecoder::open(path);
    };
}

} // namespace reelsync::media
