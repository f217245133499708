#include <reelsync/core/config.hpp>
#include <reelsync/core/logger.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace reelsync {

namespace {

nlohmann::json defaultDocument() {
    return {
        {"timeline", {{"maxOffset", 60}}},
        {"playback", {{"parallelDecode", true}}},
        {"export", {
            {"videoCodec", "libx264"},
            {"crf", 18},
            {"preset", "medium"},
            {"jpegQScale", 2},
            {"boundaryPolicy", "pad"},
            {"outputDirectory", ""},
        }},
        {"log", {{"level", "info"}, {"file", ""}}},
    };
}

/// "export.crf" -> {"export", "crf"}; empty segments are dropped
std::vector<std::string> keySegments(const std::string& key) {
    std::vector<std::string> segments;
    size_t begin = 0;
    while (begin <= key.size()) {
        size_t end = key.find('.', begin);
        if (end == std::string::npos) {
            end = key.size();
        }
        if (end > begin) {
            segments.push_back(key.substr(begin, end - begin));
        }
        begin = end + 1;
    }
    return segments;
}

nlohmann::json::json_pointer toPointer(const std::string& key) {
    nlohmann::json::json_pointer pointer;
    for (const auto& segment : keySegments(key)) {
        pointer /= segment;
    }
    return pointer;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() : config_(defaultDocument()) {}

void Config::loadFromFile(const std::string& configFile, bool merge) {
    std::ifstream in(configFile);
    if (!in) {
        LOG_ERROR("Cannot open config file {}", configFile);
        throw std::runtime_error("Cannot open config file " + configFile);
    }

    nlohmann::json parsed;
    try {
        in >> parsed;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config file {} is not valid JSON: {}", configFile, e.what());
        throw std::runtime_error("Config file " + configFile + " is not valid JSON: " + e.what());
    }

    loadFromJson(parsed, merge);
    LOG_INFO("Loaded configuration from {}", configFile);
}

void Config::loadFromJson(const nlohmann::json& json, bool merge) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (merge && config_.is_object()) {
        config_.merge_patch(json);
    } else {
        config_ = json;
    }
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = defaultDocument();
}

template<typename T>
T Config::get(const std::string& key, const T& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const nlohmann::json* node = lookup(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }
    try {
        return node->get<T>();
    } catch (const nlohmann::json::type_error& e) {
        LOG_WARN("Config key '{}' has type {}, using default ({})", key, node->type_name(), e.what());
        return defaultValue;
    }
}

template<typename T>
bool Config::set(const std::string& key, const T& value) {
    return store(key, nlohmann::json(value));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(key) != nullptr;
}

nlohmann::json Config::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

size_t Config::addChangeListener(ConfigChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void Config::removeChangeListener(size_t listenerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [listenerId](const auto& entry) { return entry.first == listenerId; }),
                     listeners_.end());
}

const nlohmann::json* Config::lookup(const std::string& key) const {
    // A path through a scalar reads as missing
    const nlohmann::json* node = &config_;
    for (const auto& segment : keySegments(key)) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

bool Config::store(const std::string& key, nlohmann::json value) {
    nlohmann::json previous;
    std::vector<std::pair<size_t, ConfigChangeListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const nlohmann::json* node = lookup(key)) {
            previous = *node;
        }
        try {
            config_[toPointer(key)] = value;
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("Cannot set config key '{}': {}", key, e.what());
            return false;
        }
        listeners = listeners_;
    }

    for (const auto& [id, listener] : listeners) {
        try {
            listener(key, previous, value);
        } catch (const std::exception& e) {
            LOG_ERROR("Config listener {} failed for '{}': {}", id, key, e.what());
        }
    }
    return true;
}

template int Config::get<int>(const std::string&, const int&) const;
template double Config::get<double>(const std::string&, const double&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;

template bool Config::set<int>(const std::string&, const int&);
template bool Config::set<double>(const std::string&, const double&);
template bool Config::set<bool>(const std::string&, const bool&);
template bool Config::set<std::string>(const std::string&, const std::string&);

} // namespace reelsync
