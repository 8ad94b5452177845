/**
 * @file security_config.cpp
 * @brief Implementation of protector configuration loading and validation
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/security_config.hpp"
#include "csrfguard/csrf_errors.hpp"
#include "csrfguard/utilities.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace csrfguard {
namespace security {

// ============================================================================
// Defaults
// ============================================================================

double system_time_seconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

std::set<std::string> default_safe_methods() {
    return {"GET", "HEAD", "OPTIONS"};
}

// ============================================================================
// JSON / File Loading
// ============================================================================

std::optional<ProtectorConfig> ProtectorConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_error("Config: Top-level JSON value must be an object");
            return std::nullopt;
        }

        ProtectorConfig config;

        if (j.contains("secret_key")) {
            config.secret_key = j.at("secret_key").get<std::string>();
        }

        if (j.contains("token_lifetime_seconds")) {
            if (!j.at("token_lifetime_seconds").is_number()) {
                utilities::log_error("Config: token_lifetime_seconds must be a number");
                return std::nullopt;
            }
            config.token_lifetime_seconds = j.at("token_lifetime_seconds").get<double>();
        }

        if (j.contains("safe_methods")) {
            config.safe_methods = j.at("safe_methods").get<std::set<std::string>>();
        }

        if (j.contains("strategy")) {
            config.strategy = j.at("strategy").get<std::string>();
        }

        if (j.contains("enable_replay_detection")) {
            config.enable_replay_detection = j.at("enable_replay_detection").get<bool>();
        }

        if (j.contains("rotation_overlap_seconds")) {
            if (!j.at("rotation_overlap_seconds").is_number()) {
                utilities::log_error("Config: rotation_overlap_seconds must be a number");
                return std::nullopt;
            }
            config.rotation_overlap_seconds = j.at("rotation_overlap_seconds").get<double>();
        }

        if (j.contains("enforce_origin")) {
            config.enforce_origin = j.at("enforce_origin").get<bool>();
        }

        return config;

    } catch (const json::exception& e) {
        utilities::log_error("Config: Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<ProtectorConfig> load_config_file(const std::string& path) {
    auto content = utilities::read_file(path);
    if (!content) {
        return std::nullopt;
    }

    auto config = ProtectorConfig::from_json(*content);
    if (!config) {
        utilities::log_error("Config: Invalid configuration file: " + path);
    }
    return config;
}

// ============================================================================
// Environment Overrides
// ============================================================================

namespace {
    std::optional<double> parse_seconds(const std::string& name, const std::string& value) {
        try {
            size_t consumed = 0;
            double seconds = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return seconds;
        } catch (const std::exception&) {
            utilities::log_warn("Config: Ignoring unparseable " + name + "='" + value + "'");
            return std::nullopt;
        }
    }

    void apply_flag(const std::string& name, bool& target) {
        std::string value = utilities::get_env(name);
        if (value.empty()) {
            return;
        }

        auto parsed = utilities::parse_bool(value);
        if (!parsed) {
            utilities::log_warn("Config: Ignoring unparseable " + name + "='" + value + "'");
            return;
        }
        target = *parsed;
    }
}

void apply_environment_overrides(ProtectorConfig& config) {
    std::string secret = utilities::get_env("CSRFGUARD_SECRET_KEY");
    if (!secret.empty()) {
        config.secret_key = secret;
    }

    std::string lifetime = utilities::trim_string(utilities::get_env("CSRFGUARD_TOKEN_LIFETIME"));
    if (!lifetime.empty()) {
        if (auto seconds = parse_seconds("CSRFGUARD_TOKEN_LIFETIME", lifetime)) {
            config.token_lifetime_seconds = *seconds;
        }
    }

    std::string strategy = utilities::trim_string(utilities::get_env("CSRFGUARD_STRATEGY"));
    if (!strategy.empty()) {
        config.strategy = strategy;
    }

    std::string safe_methods = utilities::get_env("CSRFGUARD_SAFE_METHODS");
    if (!safe_methods.empty()) {
        std::set<std::string> methods;
        for (const auto& method : utilities::split_string(safe_methods, ',')) {
            std::string trimmed = utilities::trim_string(method);
            if (!trimmed.empty()) {
                methods.insert(trimmed);
            }
        }
        config.safe_methods = methods;
    }

    apply_flag("CSRFGUARD_REPLAY_DETECTION", config.enable_replay_detection);
    apply_flag("CSRFGUARD_ENFORCE_ORIGIN", config.enforce_origin);

    std::string overlap = utilities::trim_string(utilities::get_env("CSRFGUARD_ROTATION_OVERLAP"));
    if (!overlap.empty()) {
        if (auto seconds = parse_seconds("CSRFGUARD_ROTATION_OVERLAP", overlap)) {
            config.rotation_overlap_seconds = *seconds;
        }
    }
}

// ============================================================================
// Validation
// ============================================================================

std::set<std::string> normalize_safe_methods(const std::set<std::string>& methods) {
    std::set<std::string> normalized;
    for (const auto& method : methods) {
        normalized.insert(utilities::to_uppercase(utilities::trim_string(method)));
    }
    return normalized;
}

void validate_config(const ProtectorConfig& config) {
    if (config.secret_key.empty()) {
        throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                            "secret_key must be non-empty string");
    }

    if (!std::isfinite(config.token_lifetime_seconds) || config.token_lifetime_seconds <= 0.0) {
        throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                            "token_lifetime_seconds must be positive number");
    }
    if (config.token_lifetime_seconds > MAX_TOKEN_LIFETIME_SECONDS) {
        throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                            "token_lifetime_seconds exceeds maximum of " +
                            std::to_string(static_cast<long long>(MAX_TOKEN_LIFETIME_SECONDS)));
    }

    if (!std::isfinite(config.rotation_overlap_seconds) || config.rotation_overlap_seconds < 0.0) {
        throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                            "rotation_overlap_seconds must be a non-negative number");
    }
    if (config.rotation_overlap_seconds > MAX_ROTATION_OVERLAP_SECONDS) {
        throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                            "rotation_overlap_seconds exceeds maximum of " +
                            std::to_string(static_cast<long long>(MAX_ROTATION_OVERLAP_SECONDS)));
    }

    for (const auto& method : config.safe_methods) {
        if (utilities::trim_string(method).empty()) {
            throw CsrfException(CsrfErrorKind::CONFIGURATION_ERROR,
                                "safe_methods must not contain empty entries");
        }
    }
}

} // namespace security
} // namespace csrfguard
