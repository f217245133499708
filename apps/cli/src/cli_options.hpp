/**
 * @file cli_options.hpp
 * @brief Argument parsing for the export command
 */

#pragma once

#include <reelsync/media/frame_sink.hpp>

#include <string>
#include <vector>

namespace reelsync::cli {

struct ExportOptions {
    media::ExportMode mode = media::ExportMode::Video;
    std::vector<int> offsets;
    std::vector<long long> trim;
    double fps = 0.0;
    std::string outputDirectory;
    std::string policy;
    std::string configFile;
    std::string logLevel;
    std::vector<std::string> files;
};

/// Comma-separated integers; false on any malformed item or an empty list
bool parseIntList(const std::string& text, std::vector<long long>& out);

/// Like parseIntList, but every value must also fit an int
bool parseOffsetList(const std::string& text, std::vector<int>& out);

/// Fills @p opts from the arguments after "export"; problems go to stderr
bool parseExportOptions(const std::vector<std::string>& args, ExportOptions& opts);

} // namespace reelsync::cli
