/**
 * @file security_config.hpp
 * @brief Security constants and protector configuration
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace csrfguard {
namespace security {

// ============================================================================
// Token Configuration
// ============================================================================

/// Default token lifetime (5 minutes)
constexpr double DEFAULT_TOKEN_LIFETIME_SECONDS = 300.0;

/// Grace period during which a rotated-out per-session token stays valid
constexpr double DEFAULT_ROTATION_OVERLAP_SECONDS = 5.0;

/// Upper bound on token lifetime (one year)
constexpr double MAX_TOKEN_LIFETIME_SECONDS = 365.0 * 24.0 * 3600.0;

/// Upper bound on rotation overlap (one day)
constexpr double MAX_ROTATION_OVERLAP_SECONDS = 24.0 * 3600.0;

/// Random bytes per token (128-bit entropy, 32 hex characters)
constexpr size_t TOKEN_ENTROPY_BYTES = 16;

/// Random bytes per generated session identifier
constexpr size_t SESSION_ID_ENTROPY_BYTES = 8;

/// Strategy used when none is configured
constexpr const char* DEFAULT_STRATEGY = "per_session";

// ============================================================================
// Token Transport Names
// ============================================================================

/// Form field carrying the token
constexpr const char* TOKEN_FORM_FIELD = "csrf_token";

/// Cookie carrying the token
constexpr const char* TOKEN_COOKIE_NAME = "csrf_token";

/// Primary token header
constexpr const char* TOKEN_HEADER = "X-CSRF-Token";

/// Alternate token header (AngularJS convention)
constexpr const char* TOKEN_HEADER_ALT = "X-XSRF-TOKEN";

// ============================================================================
// Session Record Keys
// ============================================================================

constexpr const char* SESSION_ID_KEY = "session_id";
constexpr const char* SESSION_TOKEN_KEY = "csrf_token";
constexpr const char* SESSION_TOKEN_CREATED_KEY = "csrf_token_created_at";
constexpr const char* SESSION_TOKEN_EXPIRES_KEY = "csrf_token_expires_at";
constexpr const char* SESSION_BOUND_ID_KEY = "csrf_token_bound_session_id";
constexpr const char* SESSION_OLD_TOKENS_KEY = "old_tokens";

// ============================================================================
// Protector Configuration
// ============================================================================

/// Clock returning seconds since the Unix epoch
using TimeSource = std::function<double()>;

/**
 * @brief Wall-clock time source used when none is injected
 */
double system_time_seconds();

/**
 * @brief Default safe (non state-changing) methods: GET, HEAD, OPTIONS
 */
std::set<std::string> default_safe_methods();

/**
 * @brief ProtectorConfig - Settings fixed at CsrfProtector construction
 */
struct ProtectorConfig {
    std::string secret_key;                                      ///< HMAC secret (non-empty)
    double token_lifetime_seconds = DEFAULT_TOKEN_LIFETIME_SECONDS; ///< Must be > 0
    std::set<std::string> safe_methods = default_safe_methods(); ///< Methods exempt from checks
    std::string strategy = DEFAULT_STRATEGY;                     ///< Active strategy name
    bool enable_replay_detection = true;                         ///< Make tokens single-use
    double rotation_overlap_seconds = DEFAULT_ROTATION_OVERLAP_SECONDS; ///< Old token grace window
    bool enforce_origin = true;                                  ///< Require an Origin header
    TimeSource time_source;                                      ///< Injectable clock (system if empty)

    /**
     * @brief Parse configuration from JSON
     *
     * Recognized keys: secret_key, token_lifetime_seconds, safe_methods,
     * strategy, enable_replay_detection, rotation_overlap_seconds,
     * enforce_origin. Missing keys keep their defaults.
     *
     * @param json JSON string
     * @return ProtectorConfig or std::nullopt if malformed
     */
    static std::optional<ProtectorConfig> from_json(const std::string& json);
};

/**
 * @brief Load configuration from a JSON file
 * @param path File path
 * @return ProtectorConfig or std::nullopt if unreadable or malformed
 */
std::optional<ProtectorConfig> load_config_file(const std::string& path);

/**
 * @brief Apply CSRFGUARD_* environment variables on top of a configuration
 *
 * CSRFGUARD_SECRET_KEY, CSRFGUARD_TOKEN_LIFETIME, CSRFGUARD_STRATEGY,
 * CSRFGUARD_SAFE_METHODS (comma separated), CSRFGUARD_REPLAY_DETECTION,
 * CSRFGUARD_ROTATION_OVERLAP, CSRFGUARD_ENFORCE_ORIGIN.
 * Unparseable values are logged and ignored.
 *
 * @param config Configuration to update in place
 */
void apply_environment_overrides(ProtectorConfig& config);

/**
 * @brief Upper-case and trim every safe method name
 */
std::set<std::string> normalize_safe_methods(const std::set<std::string>& methods);

/**
 * @brief Check configuration invariants
 * @throws CsrfException (CONFIGURATION_ERROR) describing the first violation
 */
void validate_config(const ProtectorConfig& config);

} // namespace security
} // namespace csrfguard
