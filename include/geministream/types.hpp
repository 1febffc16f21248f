/**
 * @file types.hpp
 * @brief Type definitions for geministream
 */

#ifndef GEMINISTREAM_TYPES_HPP
#define GEMINISTREAM_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace geministream {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* GEMINI_DEFAULT_ENDPOINT = "https://generativelanguage.googleapis.com";
constexpr const char* GEMINI_API_VERSION = "v1beta";
constexpr const char* GEMINI_API_KEY_HEADER = "x-goog-api-key";
constexpr const char* GEMINI_DEFAULT_MODEL = "gemini-2.5-flash";
constexpr double DEFAULT_JOIN_TIMEOUT_SECONDS = 0.1;

/// Longest wait honoured for any configured interval (30 days)
constexpr double MAX_WAIT_SECONDS = 30.0 * 24.0 * 3600.0;

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class Role {
    User,
    Model,
    System
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string role_to_string(Role role);
LogLevel string_to_log_level(const std::string& str);

/**
 * Convert seconds to a steady_clock duration, clamped to
 * [0, MAX_WAIT_SECONDS]. NaN maps to zero.
 */
std::chrono::steady_clock::duration seconds_to_duration(double seconds);

// =============================================================================
// Content Types
// =============================================================================

struct Message {
    Role role = Role::User;
    std::string content;
};

struct Tool {
    std::string name;
    std::string description;
    std::optional<json> parameters;
};

struct SafetySetting {
    std::string category;
    std::string threshold;
};

// =============================================================================
// Configuration Types
// =============================================================================

struct GenerationConfig {
    std::optional<double> temperature;
    std::optional<int> max_output_tokens;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::optional<std::vector<std::string>> stop_sequences;
};

/**
 * Streaming client configuration. Read-only once handed to a StreamClient.
 */
struct StreamConfig {
    std::string api_key;
    std::string model = GEMINI_DEFAULT_MODEL;
    std::string endpoint = GEMINI_DEFAULT_ENDPOINT;
    std::vector<std::string> fallback_endpoints;
    double request_timeout = 30.0;
    double heartbeat_interval = 20.0;   // 0 disables heartbeats
    int max_retries = 3;
    double backoff_base = 1.0;
    double backoff_max = 30.0;
    double join_timeout = DEFAULT_JOIN_TIMEOUT_SECONDS;

    /// Primary endpoint followed by the fallbacks, never empty
    std::vector<std::string> endpoints() const;

    /// Copy of this config with `selected` as the primary endpoint
    StreamConfig with_endpoint(const std::string& selected) const;

    /// @throws ConfigurationError on empty model or endpoint, or on a
    ///         negative or non-finite number
    void validate() const;
};

/**
 * One streaming generation request
 */
struct GenerateRequest {
    std::vector<Message> contents;
    std::optional<std::string> system_instruction;
    std::vector<Tool> tools;
    std::optional<json> tool_config;
    std::optional<GenerationConfig> generation_config;
    std::vector<SafetySetting> safety_settings;
    std::optional<double> timeout;
};

} // namespace geministream

#endif // GEMINISTREAM_TYPES_HPP
