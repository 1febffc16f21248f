/**
 * @file settings.cpp
 * @brief Settings loading for geministream
 */

#include "geministream/settings.hpp"
#include "geministream/errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace geministream {

namespace {

const json& require_field(const json& object, const char* key, const std::string& path) {
    if (!object.is_object() || !object.contains(key) || object[key].is_null()) {
        throw ValidationError("Missing required field: " + path, path);
    }
    return object[key];
}

std::string require_string(const json& object, const char* key, const std::string& path) {
    const json& value = require_field(object, key, path);
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw ValidationError("Field must be a non-empty string: " + path, path, value.dump());
    }
    return value.get<std::string>();
}

template <typename T>
T optional_field(const json& object, const char* key, T fallback, const std::string& path) {
    if (!object.is_object() || !object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    try {
        return object[key].get<T>();
    } catch (const json::exception& e) {
        throw ValidationError("Invalid value for " + path + ": " + e.what(), path, object[key].dump());
    }
}

void check(bool ok, const std::string& path, const std::string& constraint, double value) {
    if (!ok || !std::isfinite(value)) {
        throw ValidationError(path + " must be " + constraint, path, std::to_string(value));
    }
}

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(const std::optional<std::string>& raw, const std::string& name) {
    if (!raw.has_value() || raw->empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        double value = std::stod(*raw, &consumed);
        if (consumed != raw->size()) {
            throw ValidationError("Trailing characters in " + name, name, *raw);
        }
        if (!std::isfinite(value)) {
            throw ValidationError("Expected a finite number for " + name, name, *raw);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ValidationError("Expected a number for " + name, name, *raw);
    }
}

std::optional<int> parse_int(const std::optional<std::string>& raw, const std::string& name) {
    if (!raw.has_value() || raw->empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        int value = std::stoi(*raw, &consumed);
        if (consumed != raw->size()) {
            throw ValidationError("Trailing characters in " + name, name, *raw);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ValidationError("Expected an integer for " + name, name, *raw);
    }
}

} // namespace

std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string segment;

    while (std::getline(stream, segment, ',')) {
        size_t start = segment.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        size_t end = segment.find_last_not_of(" \t\r\n");
        parts.push_back(segment.substr(start, end - start + 1));
    }

    return parts;
}

ProjectSettings ProjectSettings::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Project settings must be a JSON object");
    }

    ProjectSettings settings;
    settings.version = require_string(j, "version", "version");
    settings.updated_at = require_string(j, "updated_at", "updated_at");
    settings.source = optional_field<json>(j, "source", json::object(), "source");
    settings.observability = optional_field<json>(j, "observability", json::object(), "observability");

    const json& deployment = require_field(j, "deployment", "deployment");
    settings.deployment.name = require_string(deployment, "name", "deployment.name");
    settings.deployment.slug = require_string(deployment, "slug", "deployment.slug");
    settings.deployment.environment = require_string(deployment, "environment", "deployment.environment");
    settings.deployment.description = optional_field<std::string>(
        deployment, "description", "", "deployment.description");
    settings.deployment.features = optional_field<std::vector<std::string>>(
        deployment, "features", {}, "deployment.features");
    settings.deployment.environment_variables = optional_field<std::map<std::string, std::string>>(
        deployment, "environment_variables", {}, "deployment.environment_variables");

    const json& runtime = require_field(deployment, "runtime", "deployment.runtime");
    settings.deployment.runtime.provider = require_string(runtime, "provider", "deployment.runtime.provider");
    settings.deployment.runtime.product = require_string(runtime, "product", "deployment.runtime.product");
    settings.deployment.runtime.region = require_string(runtime, "region", "deployment.runtime.region");

    const json& gemini = require_field(j, "gemini", "gemini");
    GeminiSettings& g = settings.gemini;
    g.model = require_string(gemini, "model", "gemini.model");
    g.primary_endpoint = require_string(gemini, "primary_endpoint", "gemini.primary_endpoint");
    g.fallback_endpoints = optional_field<std::vector<std::string>>(
        gemini, "fallback_endpoints", {}, "gemini.fallback_endpoints");
    g.request_timeout_seconds = optional_field<double>(
        gemini, "request_timeout_seconds", g.request_timeout_seconds, "gemini.request_timeout_seconds");
    g.heartbeat_interval_seconds = optional_field<double>(
        gemini, "heartbeat_interval_seconds", g.heartbeat_interval_seconds, "gemini.heartbeat_interval_seconds");
    g.max_retries = optional_field<int>(gemini, "max_retries", g.max_retries, "gemini.max_retries");

    if (gemini.contains("backoff") && !gemini["backoff"].is_null()) {
        const json& backoff = gemini["backoff"];
        g.backoff.factor = optional_field<double>(
            backoff, "factor", g.backoff.factor, "gemini.backoff.factor");
        g.backoff.max_delay_seconds = optional_field<double>(
            backoff, "max_delay_seconds", g.backoff.max_delay_seconds, "gemini.backoff.max_delay_seconds");
    }

    check(g.request_timeout_seconds > 0, "gemini.request_timeout_seconds", "> 0", g.request_timeout_seconds);
    check(g.heartbeat_interval_seconds >= 0, "gemini.heartbeat_interval_seconds", ">= 0",
          g.heartbeat_interval_seconds);
    check(g.max_retries >= 0, "gemini.max_retries", ">= 0", g.max_retries);
    check(g.backoff.factor > 0, "gemini.backoff.factor", "> 0", g.backoff.factor);
    check(g.backoff.max_delay_seconds > 0, "gemini.backoff.max_delay_seconds", "> 0",
          g.backoff.max_delay_seconds);

    return settings;
}

ProjectSettings ProjectSettings::load(const std::optional<std::string>& path) {
    std::string resolved;
    if (path.has_value()) {
        resolved = *path;
    } else if (const char* env_path = std::getenv(SETTINGS_PATH_ENV); env_path && *env_path) {
        resolved = env_path;
    } else {
        resolved = DEFAULT_SETTINGS_PATH;
    }

    std::ifstream file(resolved);
    if (!file.is_open()) {
        throw ConfigurationError("Project settings file not found: " + resolved, "settings_path");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("Invalid JSON in project settings: " + resolved, "settings_path", resolved);
    }

    return from_json(j);
}

GeminiEnvironment GeminiEnvironment::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

GeminiEnvironment GeminiEnvironment::from_lookup(const Lookup& lookup) {
    GeminiEnvironment env;

    std::optional<std::string> api_key = lookup("GEMINI_API_KEY");
    if (!api_key.has_value() || api_key->empty()) {
        throw ConfigurationError("GEMINI_API_KEY is required", "GEMINI_API_KEY");
    }
    env.api_key = *api_key;

    env.model_override = non_empty(lookup("GEMINI_MODEL"));
    env.endpoint_override = non_empty(lookup("GEMINI_STREAM_ENDPOINT"));
    // An explicitly empty list clears the manifest fallbacks
    env.fallback_override = lookup("GEMINI_FALLBACK_ENDPOINTS");
    env.request_timeout_override = parse_double(lookup("GEMINI_REQUEST_TIMEOUT"), "GEMINI_REQUEST_TIMEOUT");
    env.heartbeat_override = parse_double(lookup("GEMINI_HEARTBEAT_INTERVAL"), "GEMINI_HEARTBEAT_INTERVAL");
    env.max_retries_override = parse_int(lookup("GEMINI_MAX_RETRIES"), "GEMINI_MAX_RETRIES");
    env.backoff_base_override = parse_double(lookup("GEMINI_BACKOFF_BASE"), "GEMINI_BACKOFF_BASE");
    env.backoff_max_override = parse_double(lookup("GEMINI_BACKOFF_MAX"), "GEMINI_BACKOFF_MAX");
    env.log_level = non_empty(lookup("GEMINISTREAM_LOG_LEVEL"));

    return env;
}

StreamConfig GeminiEnvironment::build_stream_config(const ProjectSettings& settings) const {
    const GeminiSettings& defaults = settings.gemini;

    StreamConfig config;
    config.api_key = api_key;
    config.model = model_override.value_or(defaults.model);
    config.endpoint = endpoint_override.value_or(defaults.primary_endpoint);
    config.fallback_endpoints = fallback_override.has_value()
        ? split_csv(*fallback_override)
        : defaults.fallback_endpoints;
    config.request_timeout = request_timeout_override.value_or(defaults.request_timeout_seconds);
    config.heartbeat_interval = heartbeat_override.value_or(defaults.heartbeat_interval_seconds);
    config.max_retries = max_retries_override.value_or(defaults.max_retries);
    config.backoff_base = backoff_base_override.value_or(defaults.backoff.factor);
    config.backoff_max = backoff_max_override.value_or(defaults.backoff.max_delay_seconds);
    return config;
}

} // namespace geministream
