/**
 * @file types.cpp
 * @brief Type implementations for geministream
 */

#include "geministream/types.hpp"
#include "geministream/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace geministream {

std::string role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Model: return "model";
        case Role::System: return "system";
        default: return "user";
    }
}

LogLevel string_to_log_level(const std::string& str) {
    std::string lowered = str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "error") return LogLevel::Error;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "all" || lowered == "trace") return LogLevel::All;
    return LogLevel::None;
}

std::chrono::steady_clock::duration seconds_to_duration(double seconds) {
    if (!(seconds > 0)) {
        return std::chrono::steady_clock::duration::zero();
    }
    double clamped = std::min(seconds, MAX_WAIT_SECONDS);
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(clamped));
}

namespace {

void require_non_negative(double value, const char* key) {
    if (!std::isfinite(value) || value < 0) {
        throw ConfigurationError(std::string(key) + " must be a finite number >= 0", key);
    }
}

} // namespace

std::vector<std::string> StreamConfig::endpoints() const {
    std::vector<std::string> result;
    result.reserve(fallback_endpoints.size() + 1);
    result.push_back(endpoint);
    result.insert(result.end(), fallback_endpoints.begin(), fallback_endpoints.end());
    return result;
}

StreamConfig StreamConfig::with_endpoint(const std::string& selected) const {
    StreamConfig copy = *this;
    copy.endpoint = selected;
    return copy;
}

void StreamConfig::validate() const {
    if (model.empty()) {
        throw ConfigurationError("Model identifier must not be empty", "model");
    }
    if (endpoint.empty()) {
        throw ConfigurationError("Primary endpoint must not be empty", "endpoint");
    }
    require_non_negative(request_timeout, "request_timeout");
    require_non_negative(heartbeat_interval, "heartbeat_interval");
    if (max_retries < 0) {
        throw ConfigurationError("max_retries must be >= 0", "max_retries");
    }
    require_non_negative(backoff_base, "backoff_base");
    require_non_negative(backoff_max, "backoff_max");
    require_non_negative(join_timeout, "join_timeout");
}

} // namespace geministream
