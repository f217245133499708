/**
 * @file settings.hpp
 * @brief Typed view over Config
 */

#pragma once

#include <reelsync/core/config.hpp>
#include <string>

namespace reelsync {

/// Default bound for |offset| of a non-reference stream
constexpr int kDefaultMaxOffset = 60;

struct TimelineSettings {
    int maxOffset = kDefaultMaxOffset;
};

struct PlaybackSettings {
    bool parallelDecode = true;     // Decode streams of one tick concurrently
};

struct ExportSettings {
    std::string videoCodec = "libx264";
    int crf = 18;
    std::string preset = "medium";
    int jpegQScale = 2;             // mjpeg qscale, 2 = near-lossless
    std::string boundaryPolicy = "pad";
    std::string outputDirectory;    // Empty = next to each input
};

struct LogSettings {
    std::string level = "info";
    std::string file;
};

struct ReelSyncSettings {
    TimelineSettings timeline;
    PlaybackSettings playback;
    ExportSettings exporting;
    LogSettings log;

    /// Read every known key, falling back to the built-in defaults
    static ReelSyncSettings fromConfig(const Config& config);
};

} // namespace reelsync
