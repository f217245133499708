/**
 * @file config.hpp
 * @brief JSON-backed configuration store
 *
 * Keys are dotted paths into one JSON document ("export.crf").
 * Loaded files are merge-patched (RFC 7386) over the built-in defaults,
 * so a file only needs the keys it changes.
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace reelsync {

/// Called after set() with the key, the previous value (null if absent) and the new value
using ConfigChangeListener = std::function<void(const std::string& key,
                                                const nlohmann::json& oldValue,
                                                const nlohmann::json& newValue)>;

class Config {
public:
    /// Process-wide instance used by the CLI
    static Config& getInstance();

    /// Standalone store holding the defaults
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Read a JSON file into the store
     * @param merge Patch over the current document, or replace it
     * @throw std::runtime_error if the file cannot be read or parsed;
     *        the store is left unchanged
     */
    void loadFromFile(const std::string& configFile, bool merge = true);

    void loadFromJson(const nlohmann::json& json, bool merge = true);

    /// Reset to the built-in defaults
    void loadDefaults();

    /// Value at @p key, or @p defaultValue when missing or of another type
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const;

    /// Store @p value at @p key, creating parents; false if a parent is not an object
    template<typename T>
    bool set(const std::string& key, const T& value);

    bool has(const std::string& key) const;

    nlohmann::json toJson() const;

    size_t addChangeListener(ConfigChangeListener listener);
    void removeChangeListener(size_t listenerId);

private:
    const nlohmann::json* lookup(const std::string& key) const;
    bool store(const std::string& key, nlohmann::json value);

    nlohmann::json config_;
    mutable std::mutex mutex_;
    std::vector<std::pair<size_t, ConfigChangeListener>> listeners_;
    size_t next_listener_id_ = 1;
};

} // namespace reelsync
