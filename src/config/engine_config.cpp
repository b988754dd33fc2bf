#include "engine_config.hpp"

#include <cmath>
#include <fstream>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

void EngineConfig::validate() const {
    if (history_limit == 0)
        throw ConfigError("history_limit must be at least 1");
    if (!std::isfinite(merge_tolerance) || merge_tolerance < 0.0)
        throw ConfigError(fmt::format(
            "merge_tolerance must be a non-negative number, got {}",
            merge_tolerance));
    if (context_name.empty())
        throw ConfigError("context_name must not be empty");
    if (!Logger::level_from_string(log_level))
        throw ConfigError(fmt::format("unknown log_level '{}'", log_level));
}

json EngineConfig::to_json() const {
    return json{{"history_limit", history_limit},
                {"merge_tolerance", merge_tolerance},
                {"validate_on_caller", validate_on_caller},
                {"context_name", context_name},
                {"log_level", log_level}};
}

EngineConfig EngineConfig::from_json(const json &j) {
    if (!j.is_object())
        throw ConfigError("configuration must be a JSON object");

    EngineConfig config;
    try {
        if (j.contains("history_limit")) {
            const auto limit = j["history_limit"].get<long long>();
            if (limit < 1)
                throw ConfigError(fmt::format(
                    "history_limit must be at least 1, got {}", limit));
            config.history_limit = static_cast<std::size_t>(limit);
        }
        config.merge_tolerance =
            j.value("merge_tolerance", config.merge_tolerance);
        config.validate_on_caller =
            j.value("validate_on_caller", config.validate_on_caller);
        config.context_name = j.value("context_name", config.context_name);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception &e) {
        throw ConfigError(e.what());
    }

    config.validate();
    return config;
}

EngineConfig EngineConfig::load(const std::string &filepath) {
    LOG_INFO("Loading engine configuration from: " + filepath);

    json j;
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw IOError("Failed to open file for reading: " + filepath);
        }
        file >> j;
    } catch (const IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    return from_json(j);
}

void EngineConfig::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: " + filepath);
    }
    file << to_json().dump(2);
}

} // namespace geoedit
