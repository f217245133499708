#include <reelsync/media/frame_sink.hpp>
#include <fmt/format.h>

namespace reelsync::media {

const char* exportModeName(ExportMode mode) {
    switch (mode) {
        case ExportMode::Video: return "video";
        case ExportMode::ImageSequence: return "sequence";
        default: return "unknown";
    }
}

std::filesystem::path outputLocation(ExportMode mode,
                                     const std::filesystem::path& input,
                                     const std::filesystem::path& outputDirectory) {
    std::filesystem::path dir = outputDirectory.empty() ? input.parent_path() : outputDirectory;

    if (mode == ExportMode::Video) {
        return dir / "synced" / input.filename();
    }
    return dir / input.stem();
}

std::string sequenceFileName(FrameIndex outputIndex) {
    return fmt::format("{:06d}.jpg", outputIndex);
}

} // namespace reelsync::media
