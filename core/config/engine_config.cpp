#include "config/engine_config.hpp"
#include "log/logging.hpp"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace keydr {

namespace {

void readDouble(const Json::Value& root, const char* key, double& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isNumeric()) {
        throw std::runtime_error(std::string("Config field '") + key + "' must be a number");
    }
    out = v.asDouble();
}

template <typename T>
void readUnsigned(const Json::Value& root, const char* key, T& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isUInt64() || v.asUInt64() > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::string("Config field '") + key +
                                 "' must be a non-negative integer");
    }
    out = static_cast<T>(v.asUInt64());
}

void readString(const Json::Value& root, const char* key, std::string& out) {
    if (!root.isMember(key)) return;
    const Json::Value& v = root[key];
    if (!v.isString()) {
        throw std::runtime_error(std::string("Config field '") + key + "' must be a string");
    }
    out = v.asString();
}

} // namespace

AnomalyThresholds EngineConfig::anomalyThresholds() const {
    AnomalyThresholds t;
    t.error_ratio = error_anomaly_ratio;
    t.speed_pct = speed_anomaly_pct;
    t.streak_required = static_cast<uint8_t>(streak_required);
    t.min_pair_samples = min_pair_samples;
    t.min_symbol_samples_for_speed = min_symbol_samples_for_speed;
    return t;
}

void EngineConfig::validate() const {
    if (target_wpm == 0) {
        throw std::runtime_error("target_wpm must be positive");
    }
    if (!(ema_alpha > 0.0 && ema_alpha <= 1.0)) {
        throw std::runtime_error("ema_alpha must be in (0, 1]");
    }
    if (error_anomaly_ratio <= 0.0) {
        throw std::runtime_error("error_anomaly_ratio must be positive");
    }
    if (streak_required == 0 || streak_required > std::numeric_limits<uint8_t>::max()) {
        throw std::runtime_error("streak_required must be in [1, 255]");
    }
    if (max_trigrams == 0) {
        throw std::runtime_error("max_trigrams must be positive");
    }
    if (hesitation_floor_ms < 0.0 || hesitation_multiplier < 0.0) {
        throw std::runtime_error("hesitation thresholds must be non-negative");
    }
    if (!isLogLevelName(log_level)) {
        throw std::runtime_error("log_level '" + log_level + "' is not a spdlog level");
    }
}

EngineConfig loadConfig(const std::string& path) {
    EngineConfig config;
    if (!std::filesystem::exists(path)) {
        spdlog::info("No config at {}, using defaults", path);
        return config;
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config: " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("Malformed config " + path + ": " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config root must be an object: " + path);
    }

    readUnsigned(root, "target_wpm", config.target_wpm);
    readDouble(root, "ema_alpha", config.ema_alpha);
    readDouble(root, "error_anomaly_ratio", config.error_anomaly_ratio);
    readDouble(root, "speed_anomaly_pct", config.speed_anomaly_pct);
    readUnsigned(root, "streak_required", config.streak_required);
    readUnsigned(root, "min_pair_samples", config.min_pair_samples);
    readUnsigned(root, "min_symbol_samples_for_speed", config.min_symbol_samples_for_speed);
    readUnsigned(root, "max_trigrams", config.max_trigrams);
    readDouble(root, "hesitation_floor_ms", config.hesitation_floor_ms);
    readDouble(root, "hesitation_multiplier", config.hesitation_multiplier);
    readUnsigned(root, "median_window", config.median_window);
    readString(root, "log_level", config.log_level);

    config.validate();
    return config;
}

void saveConfig(const std::string& path, const EngineConfig& config) {
    Json::Value root(Json::objectValue);
    root["target_wpm"] = config.target_wpm;
    root["ema_alpha"] = config.ema_alpha;
    root["error_anomaly_ratio"] = config.error_anomaly_ratio;
    root["speed_anomaly_pct"] = config.speed_anomaly_pct;
    root["streak_required"] = config.streak_required;
    root["min_pair_samples"] = static_cast<Json::UInt64>(config.min_pair_samples);
    root["min_symbol_samples_for_speed"] = static_cast<Json::UInt64>(config.min_symbol_samples_for_speed);
    root["max_trigrams"] = static_cast<Json::UInt64>(config.max_trigrams);
    root["hesitation_floor_ms"] = config.hesitation_floor_ms;
    root["hesitation_multiplier"] = config.hesitation_multiplier;
    root["median_window"] = static_cast<Json::UInt64>(config.median_window);
    root["log_level"] = config.log_level;

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write config: " + path);
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    out << Json::writeString(writer, root) << "\n";
}

} // namespace keydr
