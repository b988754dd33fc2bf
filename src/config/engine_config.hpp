#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace geoedit {

using json = nlohmann::json;

/**
 * @brief Tunables of an EditEngine.
 *
 * Stored as a flat JSON object; missing keys keep their defaults.
 */
struct EngineConfig {
    /** @brief Maximum number of transactions kept for undo */
    std::size_t history_limit = 500;

    /** @brief Distance under which line end points are joined by merge */
    double merge_tolerance = 1e-9;

    /**
     * @brief Validate asynchronous submissions on the calling thread. When
     * false, validation runs on the mutation context right before apply.
     */
    bool validate_on_caller = true;

    /** @brief Name of the mutation context in log lines */
    std::string context_name = "mutation-context";

    /** @brief Minimum level logged by debug builds: debug, info, warn, error */
    std::string log_level = "info";

    /**
     * @brief Checks value ranges.
     * @throws ConfigError describing the first invalid value
     */
    void validate() const;

    json to_json() const;

    /**
     * @throws ConfigError on wrong value types or invalid values
     */
    static EngineConfig from_json(const json &j);

    /**
     * @brief Load a configuration file.
     * @throws IOError if the file cannot be read or parsed
     * @throws ConfigError if a value is invalid
     */
    static EngineConfig load(const std::string &filepath);

    /**
     * @throws IOError if the file cannot be written
     */
    void save(const std::string &filepath) const;
};

} // namespace geoedit
