/**
 * @file config.hpp
 * @brief Catalog engine configuration
 */

#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "logging.hpp"

namespace realty {

// Largest accepted EngineConfig::reserve
constexpr size_t MAX_RESERVE = size_t{1} << 24;

/**
 * Engine settings.
 *
 * JSON form:
 *   {"log_level": "INFO", "log_timestamps": false, "reserve": 0}
 * Missing keys keep their defaults; unknown keys are ignored.
 * log_level defaults to REALTY_LOG_LEVEL when set, else INFO.
 */
struct EngineConfig {
    LogLevel log_level = default_log_level();
    bool log_timestamps = false;
    size_t reserve = 0;   // Capacity hint for the primary store, at most MAX_RESERVE

    nlohmann::json to_json() const;

    /**
     * @throws std::runtime_error on a wrongly typed key or unknown log level
     */
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * Parse JSON text, then from_json().
     * @throws std::runtime_error on malformed JSON or invalid values
     */
    static EngineConfig parse(const std::string& text);

    /**
     * Push log_level and log_timestamps into the process logger.
     */
    void apply_logging() const;
};

} // namespace realty
