/**
 * @file ff_common.hpp
 * @brief FFmpeg headers and conversions shared by probe, decoder and sinks
 *
 * Only files under reelsync/media/src include this; public headers
 * expose StreamInfo, VideoFrame and the decoder/sink interfaces.
 */

#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <string>
#include <utility>

namespace reelsync::media::ff {

/**
 * @brief Wrap an AVERROR as an Error
 *
 * Well-known AVERRORs map to their own code; anything else gets
 * @p fallback (DecodeFailure in the decoder, WriteError in sinks, ...).
 */
inline Error avError(int errnum, const std::string& context,
                     ErrorCode fallback = ErrorCode::Unknown) {
    static const std::pair<int, ErrorCode> kKnown[] = {
        {AVERROR(ENOMEM), ErrorCode::OutOfMemory},
        {AVERROR(ENOENT), ErrorCode::FileNotFound},
        {AVERROR_STREAM_NOT_FOUND, ErrorCode::NotFound},
        {AVERROR_EOF, ErrorCode::EndOfFile},
        {AVERROR_DECODER_NOT_FOUND, ErrorCode::CodecNotFound},
        {AVERROR_ENCODER_NOT_FOUND, ErrorCode::CodecNotFound},
        {AVERROR_INVALIDDATA, ErrorCode::InvalidData},
    };

    ErrorCode code = fallback;
    for (const auto& [value, mapped] : kKnown) {
        if (value == errnum) {
            code = mapped;
            break;
        }
    }

    char reason[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, reason, sizeof(reason));
    return Error(code, context + ": " + reason);
}

/// AV_PIX_FMT_NONE for formats VideoFrame cannot hold
inline AVPixelFormat avPixelFormat(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA: return AV_PIX_FMT_RGBA;
        case PixelFormat::BGRA: return AV_PIX_FMT_BGRA;
        case PixelFormat::RGB24: return AV_PIX_FMT_RGB24;
        default: return AV_PIX_FMT_NONE;
    }
}

inline Rational rational(AVRational r) { return {r.num, r.den}; }
inline AVRational avRational(Rational r) { return {r.num, r.den}; }

/// Stream time_base units to microseconds; kNoTimestamp for AV_NOPTS_VALUE
inline Timestamp streamToUs(int64_t ts, const AVStream* stream) {
    if (ts == AV_NOPTS_VALUE) return kNoTimestamp;
    return av_rescale_q(ts, stream->time_base, AVRational{1, static_cast<int>(kTimeBaseUs)});
}

/// Microseconds to stream time_base units
inline int64_t usToStream(Timestamp us, const AVStream* stream) {
    if (us == kNoTimestamp) return AV_NOPTS_VALUE;
    return av_rescale_q(us, AVRational{1, static_cast<int>(kTimeBaseUs)}, stream->time_base);
}

} // namespace reelsync::media::ff
