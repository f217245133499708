#include "cli_options.hpp"

#include <exception>
#include <iostream>
#include <limits>
#include <sstream>

namespace reelsync::cli {

bool parseIntList(const std::string& text, std::vector<long long>& out) {
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            size_t used = 0;
            long long value = std::stoll(item, &used);
            if (used != item.size()) return false;
            out.push_back(value);
        } catch (const std::exception&) {
            return false;
        }
    }
    return !out.empty();
}

bool parseOffsetList(const std::string& text, std::vector<int>& out) {
    std::vector<long long> values;
    if (!parseIntList(text, values)) {
        return false;
    }
    for (long long value : values) {
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return false;
        }
        out.push_back(static_cast<int>(value));
    }
    return true;
}

bool parseExportOptions(const std::vector<std::string>& args, ExportOptions& opts) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= args.size()) {
                std::cerr << arg << " needs a value" << std::endl;
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--mode") {
            if (!next(value)) return false;
            if (value == "video") {
                opts.mode = media::ExportMode::Video;
            } else if (value == "sequence") {
                opts.mode = media::ExportMode::ImageSequence;
            } else {
                std::cerr << "Unknown mode: " << value << std::endl;
                return false;
            }
        } else if (arg == "--offsets") {
            if (!next(value)) return false;
            if (!parseOffsetList(value, opts.offsets)) {
                std::cerr << "Bad offset list: " << value << std::endl;
                return false;
            }
        } else if (arg == "--trim") {
            if (!next(value)) return false;
            if (!parseIntList(value, opts.trim) || opts.trim.size() != 2) {
                std::cerr << "--trim expects start,end" << std::endl;
                return false;
            }
        } else if (arg == "--fps") {
            if (!next(value)) return false;
            try {
                opts.fps = std::stod(value);
            } catch (const std::exception&) {
                std::cerr << "Bad frame rate: " << value << std::endl;
                return false;
            }
        } else if (arg == "--out") {
            if (!next(opts.outputDirectory)) return false;
        } else if (arg == "--policy") {
            if (!next(opts.policy)) return false;
        } else if (arg == "--config") {
            if (!next(opts.configFile)) return false;
        } else if (arg == "--log-level") {
            if (!next(opts.logLevel)) return false;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            opts.files.push_back(arg);
        }
    }

    if (opts.files.empty()) {
        std::cerr << "export: no files given" << std::endl;
        return false;
    }
    return true;
}

} // namespace reelsync::cli
