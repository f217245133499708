/**
 * @file main.cpp
 * @brief Headless front-end: probe, synced export and single-file trim
 */

#include <reelsync/core/config.hpp>
#include <reelsync/core/logger.hpp>
#include <reelsync/core/settings.hpp>
#include <reelsync/media/ffmpeg_decoder.hpp>
#include <reelsync/media/ffmpeg_sinks.hpp>
#include <reelsync/media/media_info.hpp>
#include <reelsync/engine/sync_session.hpp>
#include "cli_options.hpp"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace reelsync;

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " probe <file>...\n"
              << "  " << argv0 << " export --mode video|sequence --offsets a,b,... --trim start,end\n"
              << "        [--fps N] [--out DIR] [--policy pad|overlap] [--config FILE]\n"
              << "        [--log-level LEVEL] <file>...\n"
              << "  " << argv0 << " trim <in> <out> <start> <end>\n";
}

int runProbe(const std::vector<std::string>& files) {
    if (files.empty()) {
        std::cerr << "probe: no files given" << std::endl;
        return 1;
    }

    int status = 0;
    for (const auto& file : files) {
        auto info = media::MediaInfo::probe(file);
        if (!info.ok()) {
            std::cerr << file << ": " << info.error().what() << std::endl;
            status = 1;
            continue;
        }

        const auto& s = info.value();
        std::cout << file << "\n"
                  << "  resolution: " << s.resolution.width << "x" << s.resolution.height << "\n"
                  << "  frame rate: " << s.frameRate.num << "/" << s.frameRate.den
                  << " (" << std::fixed << std::setprecision(3) << s.fps() << " fps)\n"
                  << "  frames:     " << s.frameCount << "\n"
                  << "  duration:   " << std::setprecision(1) << s.durationMs() << " ms\n"
                  << "  audio:      " << (s.hasAudio ? "yes" : "no") << std::endl;
    }
    return status;
}

int runExport(const std::vector<std::string>& args) {
    cli::ExportOptions opts;
    if (!cli::parseExportOptions(args, opts)) {
        return 1;
    }

    Config& config = Config::getInstance();
    if (!opts.configFile.empty()) {
        try {
            config.loadFromFile(opts.configFile);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }
    if (!opts.outputDirectory.empty()) {
        config.set<std::string>("export.outputDirectory", opts.outputDirectory);
    }
    if (!opts.policy.empty()) {
        if (!engine::parseBoundaryPolicy(opts.policy).ok()) {
            std::cerr << "Unknown policy: " << opts.policy << std::endl;
            return 1;
        }
        config.set<std::string>("export.boundaryPolicy", opts.policy);
    }
    if (!opts.logLevel.empty()) {
        config.set<std::string>("log.level", opts.logLevel);
    }

    const ReelSyncSettings settings = ReelSyncSettings::fromConfig(config);
    initLogging("reelsync", parseLogLevel(settings.log.level), settings.log.file);

    engine::SyncSession session(media::ffmpegDecoderFactory(),
                                media::ffmpegSinkFactory(settings.exporting), settings);

    std::vector<std::filesystem::path> paths(opts.files.begin(), opts.files.end());
    auto loaded = session.loadStreams(paths);
    if (!loaded.ok()) {
        std::cerr << loaded.error().what() << std::endl;
        return 1;
    }

    // Offsets may omit the reference stream's implicit 0
    if (opts.offsets.size() + 1 == paths.size()) {
        opts.offsets.insert(opts.offsets.begin(), 0);
    }
    if (!opts.offsets.empty() && opts.offsets.size() != paths.size()) {
        std::cerr << "Expected " << paths.size() << " offsets, got " << opts.offsets.size()
                  << std::endl;
        return 1;
    }
    for (size_t i = 1; i < opts.offsets.size(); ++i) {
        auto set = session.setFrameOffset(static_cast<int>(i), opts.offsets[i]);
        if (!set.ok()) {
            std::cerr << set.error().what() << std::endl;
            return 1;
        }
    }

    if (opts.fps > 0.0) {
        session.setFrameRate(opts.fps);
    }
    if (opts.trim.size() == 2) {
        auto trimmed = session.setTrimRange(opts.trim[0], opts.trim[1]);
        if (!trimmed.ok()) {
            std::cerr << trimmed.error().what() << std::endl;
            return 1;
        }
    }

    std::atomic<bool> success{false};
    std::atomic<int> lastPercent{-1};
    auto& reporter = session.exporter().reporter();
    auto progressConn = reporter.exportProgress.connectScoped(
        [&lastPercent](FrameIndex done, FrameIndex total) {
            const int percent = total > 0 ? static_cast<int>(done * 100 / total) : 100;
            if (percent / 10 != lastPercent.exchange(percent) / 10) {
                std::cout << "  " << percent << "%" << std::endl;
            }
        });
    auto finishedConn = reporter.exportFinished.connectScoped(
        [&success](bool ok, const std::string& message) {
            success = ok;
            (ok ? std::cout : std::cerr) << message << std::endl;
        });

    auto job = opts.mode == media::ExportMode::Video ? session.exportSyncedVideos()
                                                     : session.exportSyncedImageSequence();
    if (!job.ok()) {
        std::cerr << job.error().what() << std::endl;
        return 1;
    }

    session.exporter().waitForIdle();
    return success ? 0 : 1;
}

int runTrim(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        std::cerr << "trim expects <in> <out> <start> <end>" << std::endl;
        return 1;
    }

    FrameIndex start = 0;
    FrameIndex end = 0;
    try {
        start = std::stoll(args[2]);
        end = std::stoll(args[3]);
    } catch (const std::exception&) {
        std::cerr << "Bad frame range" << std::endl;
        return 1;
    }

    auto decoder = media::FfmpegStreamDecoder::open(args[0]);
    if (!decoder.ok()) {
        std::cerr << "Error: " << decoder.error().what() << std::endl;
        return 1;
    }
    const media::StreamInfo& info = decoder.value()->info();
    if (start < 0 || start > end || end >= info.frameCount) {
        std::cerr << "Error: range [" << start << ", " << end << "] outside [0, "
                  << info.frameCount << ")" << std::endl;
        return 1;
    }

    const ReelSyncSettings settings = ReelSyncSettings::fromConfig(Config::getInstance());
    auto sink = media::FfmpegVideoSink::create(args[1], info.resolution, info.frameRate,
                                               settings.exporting);
    if (!sink.ok()) {
        std::cerr << "Error: " << sink.error().what() << std::endl;
        return 1;
    }

    std::cout << "Trimming " << args[0] << " from frame " << start << " to " << end << "..."
              << std::endl;

    for (FrameIndex frame = start; frame <= end; ++frame) {
        auto decoded = decoder.value()->decodeFrame(frame);
        if (!decoded.ok()) {
            std::cerr << "Error: " << decoded.error().what() << std::endl;
            return 1;
        }
        auto written = sink.value()->writeFrame(decoded.value(), frame - start);
        if (!written.ok()) {
            std::cerr << "Error: " << written.error().what() << std::endl;
            return 1;
        }
    }

    auto closed = sink.value()->close();
    if (!closed.ok()) {
        std::cerr << "Error: " << closed.error().what() << std::endl;
        return 1;
    }

    std::cout << "Successfully trimmed video and saved to " << args[1] << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    initLogging("reelsync", spdlog::level::warn);

    const std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "probe") {
        return runProbe(args);
    }
    if (command == "export") {
        return runExport(args);
    }
    if (command == "trim") {
        return runTrim(args);
    }
    if (command == "-h" || command == "--help" || command == "help") {
        printUsage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
