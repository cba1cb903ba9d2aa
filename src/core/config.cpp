#include "masterhand/core/config.h"
#include "masterhand/core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace masterhand {
namespace core {

namespace {

// Plain scalars: YAML booleans (true/False/yes/off...), then anything with a
// '.' or exponent as double, then integers, otherwise string. Quoted scalars
// always stay strings.
ConfigValue parseScalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return ConfigValue(text);
    }

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return ConfigValue(flag);
    }

    try {
        size_t consumed = 0;
        if (text.find('.') != std::string::npos || text.find('e') != std::string::npos ||
            text.find('E') != std::string::npos) {
            double value = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return ConfigValue(value);
            }
        } else {
            long long value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                if (value >= 0 && value <= static_cast<long long>(UINT32_MAX)) {
                    return ConfigValue(static_cast<uint32_t>(value));
                }
                if (value >= INT32_MIN && value < 0) {
                    return ConfigValue(static_cast<int32_t>(value));
                }
            }
        }
    } catch (const std::invalid_argument&) {
        // not a number
    } catch (const std::out_of_range&) {
        // too large for the numeric types, keep as text
    }
    return ConfigValue(text);
}

void flattenNode(const YAML::Node& node, const std::string& prefix,
                 std::map<std::string, ConfigValue>& out) {
    if (node.IsMap()) {
        for (const auto& entry : node) {
            std::string key = entry.first.as<std::string>();
            flattenNode(entry.second, prefix.empty() ? key : prefix + "." + key, out);
        }
    } else if (node.IsScalar()) {
        out[prefix] = parseScalar(node);
    } else if (node.IsNull()) {
        // "key:" with no value leaves the key unset
    } else {
        throw YAML::Exception(node.Mark(), "sequences are not supported for key '" + prefix + "'");
    }
}

ResultCode mergeDocument(const YAML::Node& root, std::map<std::string, ConfigValue>& values) {
    if (root.IsNull()) {
        return ResultCode::SUCCESS;
    }
    if (!root.IsMap()) {
        return ResultCode::ERROR_INVALID_CONFIG;
    }

    std::map<std::string, ConfigValue> parsed;
    flattenNode(root, "", parsed);
    for (auto& [key, value] : parsed) {
        values[key] = std::move(value);
    }
    return ResultCode::SUCCESS;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

ResultCode Config::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return ResultCode::ERROR_FILE_NOT_FOUND;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

ResultCode Config::loadFromString(const std::string& yaml_text) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        return mergeDocument(YAML::Load(yaml_text), values_);
    } catch (const YAML::Exception& e) {
        MASTERHAND_LOG_ERROR(std::string("Config: failed to parse YAML: ") + e.what());
        return ResultCode::ERROR_INVALID_CONFIG;
    }
}

ResultCode Config::saveToFile(const std::string& config_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Node root(YAML::NodeType::Map);
    for (const auto& [key, value] : values_) {
        // Walk/create the nested maps for each dotted segment
        std::vector<std::string> parts;
        std::stringstream ss(key);
        std::string part;
        while (std::getline(ss, part, '.')) {
            parts.push_back(part);
        }
        if (parts.empty()) {
            continue;
        }

        std::vector<YAML::Node> chain;
        chain.push_back(root);
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            YAML::Node child = chain.back()[parts[i]];
            chain.push_back(child);
        }

        YAML::Node leaf = chain.back()[parts.back()];
        std::visit([&leaf](const auto& v) { leaf = v; }, value);
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return ResultCode::ERROR_FILE_IO;
    }

    YAML::Emitter emitter;
    emitter << root;

    file << "# MasterHand configuration\n";
    file << emitter.c_str() << "\n";

    return file.good() ? ResultCode::SUCCESS : ResultCode::ERROR_FILE_IO;
}

void Config::setValue(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

double Config::getDouble(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    return std::visit([default_value](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            return static_cast<double>(v);
        } else {
            return default_value;
        }
    }, it->second);
}

int64_t Config::getInt(const std::string& key, int64_t default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    return std::visit([default_value](const auto& v) -> int64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v);
        } else {
            return default_value;
        }
    }, it->second);
}

bool Config::hasKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

bool Config::isNumeric(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return false;
    }
    return std::visit([](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        return std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;
    }, it->second);
}

void Config::removeKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

std::vector<std::string> Config::getAllKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(values_.size());

    for (const auto& [key, value] : values_) {
        keys.push_back(key);
    }

    return keys;
}

void Config::initializeDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);

    setDefaultSystemConfig();
    setDefaultGestureConfig();
    setDefaultSinkConfig();
}

void Config::setDefaultSystemConfig() {
    values_[config_keys::SYSTEM_LOG_LEVEL] = std::string("info");
    values_[config_keys::SYSTEM_LOG_DIRECTORY] = std::string("");
}

void Config::setDefaultGestureConfig() {
    values_[config_keys::GESTURE_CLASSIFY] = true;
    values_[config_keys::SNAP_ENABLED] = true;
    values_[config_keys::SNAP_POLICY] = std::string("velocity_gated");
    // snap.pinch_threshold_sq is left unset: each policy has its own default
    values_[config_keys::SNAP_VELOCITY_THRESHOLD] = 0.04;
}

void Config::setDefaultSinkConfig() {
    values_[config_keys::SINK_HOST] = std::string("127.0.0.1");
    values_[config_keys::SINK_PORT] = 5005u;
}

} // namespace core
} // namespace masterhand
