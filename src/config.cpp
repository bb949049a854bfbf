/**
 * @file config.cpp
 * @brief Implementation of EngineConfig JSON handling
 */

#include "config.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace realty {

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level_to_string(log_level);
    j["log_timestamps"] = log_timestamps;
    j["reserve"] = reserve;
    return j;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Engine config must be a JSON object");
    }

    EngineConfig config;

    if (j.contains("log_level")) {
        const auto& value = j["log_level"];
        if (!value.is_string()) {
            throw std::runtime_error("Config key 'log_level' must be a string");
        }
        auto level = parse_log_level(value.get<std::string>());
        if (!level) {
            throw std::runtime_error("Unknown log level: " + value.get<std::string>());
        }
        config.log_level = *level;
    }

    if (j.contains("log_timestamps")) {
        const auto& value = j["log_timestamps"];
        if (!value.is_boolean()) {
            throw std::runtime_error("Config key 'log_timestamps' must be a boolean");
        }
        config.log_timestamps = value.get<bool>();
    }

    if (j.contains("reserve")) {
        const auto& value = j["reserve"];
        if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<long long>() < 0)) {
            throw std::runtime_error("Config key 'reserve' must be a non-negative integer");
        }
        if (value.get<uint64_t>() > MAX_RESERVE) {
            throw std::runtime_error("Config key 'reserve' must not exceed " + std::to_string(MAX_RESERVE));
        }
        config.reserve = value.get<size_t>();
    }

    return config;
}

EngineConfig EngineConfig::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed engine config: ") + e.what());
    }
    return from_json(j);
}

void EngineConfig::apply_logging() const {
    set_log_level(log_level);
    set_log_timestamp(log_timestamps);
}

} // namespace realty
