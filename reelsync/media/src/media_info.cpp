/**
 * @file media_info.cpp
 * @brief Video file probing implementation
 */

#include <reelsync/media/media_info.hpp>
#include <reelsync/core/logger.hpp>
#include "ffmpeg/ff_common.hpp"
#include "ffmpeg/av_handles.hpp"
#include <cmath>

namespace reelsync::media {

namespace {

/// Last resort for containers that store neither a count nor a duration
Result<FrameIndex, Error> countFramesByDecoding(AVFormatContext* fmtCtx, int streamIdx) {
    auto codecCtx = ff::openDecoder(fmtCtx->streams[streamIdx]);
    if (!codecCtx.ok()) {
        return codecCtx.error();
    }

    auto packet = ff::allocPacket();
    auto frame = ff::allocFrame();
    if (!packet || !frame) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate frame");
    }

    AVCodecContext* ctx = codecCtx.value().get();
    FrameIndex count = 0;
    bool draining = false;

    while (true) {
        int ret = avcodec_receive_frame(ctx, frame.get());
        if (ret == 0) {
            ++count;
            av_frame_unref(frame.get());
            continue;
        }
        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret != AVERROR(EAGAIN)) {
            return ff::avError(ret, "Decode error while counting frames", ErrorCode::DecoderError);
        }
        if (draining) {
            break;
        }

        ret = av_read_frame(fmtCtx, packet.get());
        if (ret == AVERROR_EOF) {
            avcodec_send_packet(ctx, nullptr);
            draining = true;
            continue;
        }
        if (ret < 0) {
            return ff::avError(ret, "Failed to read frame", ErrorCode::ReadError);
        }
        if (packet->stream_index == streamIdx) {
            ret = avcodec_send_packet(ctx, packet.get());
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                av_packet_unref(packet.get());
                return ff::avError(ret, "Failed to send packet", ErrorCode::DecoderError);
            }
        }
        av_packet_unref(packet.get());
    }

    return count;
}

} // anonymous namespace

Result<StreamInfo, Error> MediaInfo::probe(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error(ErrorCode::FileNotFound, "File not found: " + path.string());
    }

    auto input = ff::openInput(path.string());
    if (!input.ok()) {
        return input.error();
    }
    AVFormatContext* fmtCtx = input.value().get();

    int videoStreamIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoStreamIdx < 0) {
        return Error(ErrorCode::NotFound, "No video stream found in " + path.string());
    }

    AVStream* stream = fmtCtx->streams[videoStreamIdx];

    StreamInfo info;
    info.path = path;
    info.frameRate = ff::rational(stream->avg_frame_rate);
    if (!info.frameRate.valid()) {
        return Error(ErrorCode::InvalidData,
                     "Could not determine frame rate for " + path.string());
    }

    info.resolution = {stream->codecpar->width, stream->codecpar->height};
    info.hasAudio = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;

    if (stream->duration != AV_NOPTS_VALUE) {
        info.duration = ff::streamToUs(stream->duration, stream);
    } else if (fmtCtx->duration != AV_NOPTS_VALUE) {
        info.duration = av_rescale_q(fmtCtx->duration, AV_TIME_BASE_Q, {1, 1000000});
    }

    info.frameCount = stream->nb_frames;
    if (info.frameCount <= 0 && info.duration > 0) {
        info.frameCount = static_cast<FrameIndex>(
            static_cast<double>(info.duration) / kTimeBaseUs * info.fps());
    }
    if (info.frameCount <= 0) {
        LOG_DEBUG("{}: no frame count in container, decoding to count", path.string());
        auto counted = countFramesByDecoding(fmtCtx, videoStreamIdx);
        if (!counted.ok()) {
            return counted.error();
        }
        info.frameCount = counted.value();
    }
    if (info.frameCount <= 0) {
        return Error(ErrorCode::InvalidData,
                     "Could not determine frame count for " + path.string());
    }

    if (info.duration <= 0) {
        info.duration = static_cast<Duration>(std::llround(
            static_cast<double>(info.frameCount) / info.fps() * kTimeBaseUs));
    }

    LOG_DEBUG("Probed {}: {}x{} @ {}/{} fps, {} frames, {} us, audio={}",
              path.string(), info.resolution.width, info.resolution.height,
              info.frameRate.num, info.frameRate.den, info.frameCount,
              info.duration, info.hasAudio);

    return info;
}

} // namespace reelsync::media
