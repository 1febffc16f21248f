/**
 * @file settings.hpp
 * @brief Project settings manifest and environment overrides
 */

#ifndef GEMINISTREAM_SETTINGS_HPP
#define GEMINISTREAM_SETTINGS_HPP

#include "types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geministream {

constexpr const char* SETTINGS_PATH_ENV = "GEMINISTREAM_SETTINGS";
constexpr const char* DEFAULT_SETTINGS_PATH = "configs/project_settings.json";

// =============================================================================
// Manifest Types
// =============================================================================

struct BackoffSettings {
    double factor = 1.5;
    double max_delay_seconds = 60.0;
};

struct GeminiSettings {
    std::string model;
    std::string primary_endpoint;
    std::vector<std::string> fallback_endpoints;
    double request_timeout_seconds = 45.0;
    double heartbeat_interval_seconds = 10.0;
    int max_retries = 4;
    BackoffSettings backoff;
};

struct RuntimeSettings {
    std::string provider;
    std::string product;
    std::string region;
};

struct DeploymentSettings {
    std::string name;
    std::string slug;
    std::string environment;
    std::string description;
    RuntimeSettings runtime;
    std::vector<std::string> features;
    std::map<std::string, std::string> environment_variables;
};

/**
 * Parsed project_settings.json
 */
struct ProjectSettings {
    std::string version;
    std::string updated_at;
    json source = json::object();
    DeploymentSettings deployment;
    GeminiSettings gemini;
    json observability = json::object();

    /**
     * Build settings from a decoded manifest
     * @throws ValidationError naming the offending field
     */
    static ProjectSettings from_json(const json& j);

    /**
     * Load the manifest from `path`, else $GEMINISTREAM_SETTINGS, else
     * configs/project_settings.json
     * @throws ConfigurationError if the file is missing
     * @throws ValidationError if it is not valid JSON or fails validation
     */
    static ProjectSettings load(const std::optional<std::string>& path = std::nullopt);
};

// =============================================================================
// Environment Overrides
// =============================================================================

/**
 * GEMINI_* environment variables layered over the manifest defaults
 */
struct GeminiEnvironment {
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    std::string api_key;
    std::optional<std::string> model_override;
    std::optional<std::string> endpoint_override;
    std::optional<std::string> fallback_override;
    std::optional<double> request_timeout_override;
    std::optional<double> heartbeat_override;
    std::optional<int> max_retries_override;
    std::optional<double> backoff_base_override;
    std::optional<double> backoff_max_override;
    std::optional<std::string> log_level;

    /**
     * Read the process environment
     * @throws ConfigurationError if GEMINI_API_KEY is unset
     * @throws ValidationError if a numeric override does not parse
     */
    static GeminiEnvironment from_env();

    /**
     * Read variables through `lookup`
     */
    static GeminiEnvironment from_lookup(const Lookup& lookup);

    /**
     * Combine overrides with manifest defaults; overrides win
     */
    StreamConfig build_stream_config(const ProjectSettings& settings) const;
};

/**
 * Split a comma-separated list, trimming items and dropping empty ones
 */
std::vector<std::string> split_csv(const std::string& value);

} // namespace geministream

#endif // GEMINISTREAM_SETTINGS_HPP
