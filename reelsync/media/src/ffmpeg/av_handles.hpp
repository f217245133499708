/**
 * @file av_handles.hpp
 * @brief RAII owners for FFmpeg objects
 */

#pragma once

#include "ff_common.hpp"
#include <memory>

namespace reelsync::media::ff {

/// Deleter for the av*_free(T**) family, all of which accept null
template<typename T, void (*Free)(T**)>
struct FreeThrough {
    void operator()(T* ptr) const { Free(&ptr); }
};

/// Muxer from avformat_alloc_output_context2; closes its file first
struct OutputFormatDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (!ctx) return;
        if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
};

using FramePtr = std::unique_ptr<AVFrame, FreeThrough<AVFrame, av_frame_free>>;
using PacketPtr = std::unique_ptr<AVPacket, FreeThrough<AVPacket, av_packet_free>>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, FreeThrough<AVCodecContext, avcodec_free_context>>;
using InputFormatPtr = std::unique_ptr<AVFormatContext, FreeThrough<AVFormatContext, avformat_close_input>>;
using OutputFormatPtr = std::unique_ptr<AVFormatContext, OutputFormatDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;

inline FramePtr allocFrame() {
    return FramePtr(av_frame_alloc());
}

inline PacketPtr allocPacket() {
    return PacketPtr(av_packet_alloc());
}

/// Demuxer with stream info already read
inline Result<InputFormatPtr, Error> openInput(const std::string& path) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return avError(ret, "Cannot open " + path, ErrorCode::FileOpenFailed);
    }
    InputFormatPtr ctx(raw);

    ret = avformat_find_stream_info(ctx.get(), nullptr);
    if (ret < 0) {
        return avError(ret, "No stream info in " + path, ErrorCode::ReadError);
    }
    return ctx;
}

/// Frame-and-slice threaded decoder for @p stream, thread count chosen by FFmpeg
inline Result<CodecContextPtr, Error> openDecoder(AVStream* stream) {
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        return Error(ErrorCode::CodecNotFound, std::string("No decoder for ") + avcodec_get_name(stream->codecpar->codec_id));
    }

    CodecContextPtr ctx(avcodec_alloc_context3(codec));
    if (!ctx) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(ctx.get(), stream->codecpar);
    if (ret < 0) {
        return avError(ret, "Failed to copy codec parameters");
    }

    ctx->thread_count = 0;
    ctx->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;
    ctx->pkt_timebase = stream->time_base;

    ret = avcodec_open2(ctx.get(), codec, nullptr);
    if (ret < 0) {
        return avError(ret, "Failed to open codec", ErrorCode::CodecOpenFailed);
    }
    return ctx;
}

} // namespace reelsync::media::ff
