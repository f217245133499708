/**
 * @file types.hpp
 * @brief Core type definitions for ReelSync
 *
 * Timestamps are int64_t microseconds. Timeline positions are
 * integer frame indices on the reference stream's grid.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <climits>
#include <cmath>
#include <string>

namespace reelsync {

// ============================================================================
// Time and frame positions
// ============================================================================

using Timestamp = int64_t;   // microseconds from media start
using Duration = int64_t;    // microseconds
using FrameIndex = int64_t;  // timeline or stream frame number

constexpr Timestamp kTimeBaseUs = 1'000'000;
constexpr Timestamp kNoTimestamp = INT64_MIN;
constexpr FrameIndex kNoFrame = -1;

using Microseconds = std::chrono::microseconds;
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Media Types
// ============================================================================

/// Rational number (frame rates, time bases)
struct Rational {
    int num = 0;
    int den = 1;

    [[nodiscard]] bool valid() const { return num > 0 && den > 0; }

    [[nodiscard]] double toDouble() const {
        return den != 0 ? static_cast<double>(num) / den : 0.0;
    }

    bool operator==(const Rational& other) const {
        return num == other.num && den == other.den;
    }

    /// Nearest of n/1, n/1001 (NTSC) or n/1000 to a floating frame rate
    static Rational fromFrameRate(double fps) {
        if (!(fps > 0.0)) return {0, 1};
        const int whole = static_cast<int>(fps + 0.5);
        if (std::abs(fps - whole) < 1e-3) return {whole, 1};
        const int ntsc = static_cast<int>(fps * 1001.0 + 0.5);
        if (std::abs(static_cast<double>(ntsc) / 1001.0 - fps) < 1e-4) return {ntsc, 1001};
        return {static_cast<int>(fps * 1000.0 + 0.5), 1000};
    }
};

/// Frame dimensions in pixels
struct Size {
    int width = 0;
    int height = 0;

    [[nodiscard]] bool isEmpty() const { return width <= 0 || height <= 0; }
};

/// Pixel layouts a VideoFrame can carry (packed, single plane)
enum class PixelFormat {
    Unknown = 0,
    RGBA,   // 4 bytes per pixel
    BGRA,   // 4 bytes per pixel
    RGB24,  // 3 bytes per pixel
};

/// Bytes per pixel for packed formats
inline int bytesPerPixel(PixelFormat fmt) {
    switch (fmt) {
        case PixelFormat::RGBA:
        case PixelFormat::BGRA: return 4;
        case PixelFormat::RGB24: return 3;
        default: return 0;
    }
}

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    Unknown,
    InvalidArgument,
    NotFound,
    NotSupported,
    OutOfMemory,

    // File and container
    FileNotFound,
    FileOpenFailed,
    ReadError,
    WriteError,
    EndOfFile,

    // Codecs
    CodecNotFound,
    CodecOpenFailed,
    DecoderError,
    EncoderError,
    InvalidData,

    // Timeline, playback and export
    RangeError,
    InvalidExportRequest,
    ExportBusy,
    DecodeFailure,
    NotReady,
};

/// Message used when an Error carries none
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "no error";
        case ErrorCode::Unknown: return "unknown error";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::NotSupported: return "not supported";
        case ErrorCode::OutOfMemory: return "out of memory";
        case ErrorCode::FileNotFound: return "file not found";
        case ErrorCode::FileOpenFailed: return "cannot open file";
        case ErrorCode::ReadError: return "read failed";
        case ErrorCode::WriteError: return "write failed";
        case ErrorCode::EndOfFile: return "end of file";
        case ErrorCode::CodecNotFound: return "codec not available";
        case ErrorCode::CodecOpenFailed: return "cannot open codec";
        case ErrorCode::DecoderError: return "decoder failed";
        case ErrorCode::EncoderError: return "encoder failed";
        case ErrorCode::InvalidData: return "invalid data";
        case ErrorCode::RangeError: return "value out of range";
        case ErrorCode::InvalidExportRequest: return "invalid export request";
        case ErrorCode::ExportBusy: return "an export is already running";
        case ErrorCode::DecodeFailure: return "frame decode failed";
        case ErrorCode::NotReady: return "not ready";
    }
    return "unrecognised error code";
}

} // namespace reelsync
