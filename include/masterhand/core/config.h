#pragma once

#include "masterhand/core/types.hpp"
#include <string>
#include <map>
#include <variant>
#include <mutex>
#include <vector>

/**
 * @file config.h
 * @brief Configuration management system for MasterHand
 */

namespace masterhand {
namespace core {

/**
 * @brief Configuration value type variant
 */
using ConfigValue = std::variant<bool, int32_t, uint32_t, float, double, std::string>;

/**
 * @brief Thread-safe configuration management
 *
 * Flat key/value store with dot-separated keys. Files are YAML documents;
 * nested maps are flattened on load ("snap: {policy: x}" -> "snap.policy")
 * and re-nested on save.
 */
class Config {
public:
    /**
     * @brief Get the singleton configuration instance
     * @return Reference to the global configuration
     */
    static Config& getInstance();

    /**
     * @brief Load configuration from a YAML file
     *
     * Values from the file overwrite existing keys; other keys are kept.
     *
     * @param config_path Path to configuration file
     * @return SUCCESS, ERROR_FILE_NOT_FOUND or ERROR_INVALID_CONFIG
     */
    ResultCode loadFromFile(const std::string& config_path);

    /**
     * @brief Load configuration from YAML text
     */
    ResultCode loadFromString(const std::string& yaml_text);

    /**
     * @brief Save configuration to file
     * @param config_path Path to configuration file
     * @return ResultCode indicating success or failure
     */
    ResultCode saveToFile(const std::string& config_path) const;

    void setValue(const std::string& key, const ConfigValue& value);

    /**
     * @brief Get configuration value
     * @param key Configuration key
     * @param default_value Default value if key not found or of another type
     * @return Configuration value or default
     */
    template<typename T>
    T getValue(const std::string& key, const T& default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (const T* value = std::get_if<T>(&it->second)) {
                return *value;
            }
        }
        return default_value;
    }

    /**
     * @brief Get any numeric value as double
     *
     * YAML "1" loads as an integer and "1.0" as a double; this accessor
     * accepts either. Non-numeric values yield the default.
     */
    double getDouble(const std::string& key, double default_value = 0.0) const;

    /**
     * @brief Get any numeric value as int (doubles are truncated)
     */
    int64_t getInt(const std::string& key, int64_t default_value = 0) const;

    bool hasKey(const std::string& key) const;

    /**
     * @brief Check whether a key exists and holds a value of type T
     */
    template<typename T>
    bool holdsType(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return it != values_.end() && std::holds_alternative<T>(it->second);
    }

    /**
     * @brief Check whether a key exists and holds any numeric (non-bool) value
     */
    bool isNumeric(const std::string& key) const;

    void removeKey(const std::string& key);

    void clear();

    std::vector<std::string> getAllKeys() const;

    /**
     * @brief Initialize with default MasterHand configuration
     */
    void initializeDefaults();

private:
    Config() = default;
    ~Config() = default;

    // Non-copyable, non-movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, ConfigValue> values_;

    void setDefaultSystemConfig();
    void setDefaultGestureConfig();
    void setDefaultSinkConfig();
};

// Default configuration keys
namespace config_keys {
    // System configuration
    constexpr const char* SYSTEM_LOG_LEVEL = "system.log_level";
    constexpr const char* SYSTEM_LOG_DIRECTORY = "system.log_directory";

    // Gesture classification
    constexpr const char* GESTURE_CLASSIFY = "gesture.classify";

    // Snap detection
    constexpr const char* SNAP_ENABLED = "snap.enabled";
    constexpr const char* SNAP_POLICY = "snap.policy";
    constexpr const char* SNAP_PINCH_THRESHOLD_SQ = "snap.pinch_threshold_sq";
    constexpr const char* SNAP_VELOCITY_THRESHOLD = "snap.velocity_threshold";

    // Event sink
    constexpr const char* SINK_HOST = "sink.host";
    constexpr const char* SINK_PORT = "sink.port";
} // namespace config_keys

} // namespace core
} // namespace masterhand
