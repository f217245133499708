#include <reelsync/core/settings.hpp>
#include <reelsync/core/logger.hpp>

namespace reelsync {

ReelSyncSettings ReelSyncSettings::fromConfig(const Config& config) {
    ReelSyncSettings s;

    s.timeline.maxOffset = config.get<int>("timeline.maxOffset", kDefaultMaxOffset);
    if (s.timeline.maxOffset < 0) {
        LOG_WARN("timeline.maxOffset must not be negative ({}), using {}",
                 s.timeline.maxOffset, kDefaultMaxOffset);
        s.timeline.maxOffset = kDefaultMaxOffset;
    }

    s.playback.parallelDecode = config.get<bool>("playback.parallelDecode", true);

    s.exporting.videoCodec = config.get<std::string>("export.videoCodec", s.exporting.videoCodec);
    s.exporting.crf = config.get<int>("export.crf", s.exporting.crf);
    s.exporting.preset = config.get<std::string>("export.preset", s.exporting.preset);
    s.exporting.jpegQScale = config.get<int>("export.jpegQScale", s.exporting.jpegQScale);
    s.exporting.boundaryPolicy =
        config.get<std::string>("export.boundaryPolicy", s.exporting.boundaryPolicy);
    s.exporting.outputDirectory =
        config.get<std::string>("export.outputDirectory", s.exporting.outputDirectory);

    s.log.level = config.get<std::string>("log.level", s.log.level);
    s.log.file = config.get<std::string>("log.file", s.log.file);

    return s;
}

} // namespace reelsync
