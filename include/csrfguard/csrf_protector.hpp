/**
 * @file csrf_protector.hpp
 * @brief CSRF protection orchestrator
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Validation order for a request:
 * 1. Safe methods (GET/HEAD/OPTIONS by default) pass immediately
 * 2. Origin header must be present when origin enforcement is on
 * 3. The active strategy validates the token
 * 4. With replay detection, the winning token becomes single-use
 */

#pragma once

#include "csrfguard/replay_protection.hpp"
#include "csrfguard/request.hpp"
#include "csrfguard/security_config.hpp"
#include "csrfguard/token_strategy.hpp"
#include "csrfguard/validation_info.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csrfguard {

/**
 * @brief CsrfProtector - Issues, validates and rotates CSRF tokens
 *
 * Thread-safe: concurrent validations share only the replay cache, which is
 * guarded by a single lock. Session records belong to the caller.
 */
class CsrfProtector {
public:
    /**
     * @brief Construct protector
     *
     * The built-in strategies (per_session, stateless, double_submit) are always
     * registered; extra_strategies may add or replace entries before the active
     * strategy is selected.
     *
     * @param config Protector configuration (validated here)
     * @param extra_strategies Additional strategies to register
     * @throws CsrfException CONFIGURATION_ERROR for invalid settings,
     *         UNSUPPORTED_STRATEGY for an unknown strategy name
     */
    explicit CsrfProtector(
        security::ProtectorConfig config,
        std::vector<std::shared_ptr<TokenStrategy>> extra_strategies = {}
    );

    /**
     * @brief Destructor (wipes the secret key)
     */
    ~CsrfProtector();

    // Disable copy and move (owns replay cache and lock)
    CsrfProtector(const CsrfProtector&) = delete;
    CsrfProtector& operator=(const CsrfProtector&) = delete;
    CsrfProtector(CsrfProtector&&) = delete;
    CsrfProtector& operator=(CsrfProtector&&) = delete;

    // ========================================================================
    // Token API
    // ========================================================================

    /**
     * @brief Generate a token with the active strategy
     * @param request Request (per_session updates its session)
     * @return Token string
     */
    std::string generate_token(Request& request) const;

    /**
     * @brief Generate a token and its metadata with the active strategy
     */
    GeneratedToken generate_token_full(Request& request) const;

    /**
     * @brief Validate a request
     *
     * Failures are returned, never thrown, and leave no state behind.
     *
     * @param request Incoming request
     * @param token Explicitly supplied token (takes priority over form/cookie/header)
     * @return (valid, details)
     */
    std::pair<bool, ValidationInfo> validate_request(
        const Request& request,
        const std::optional<std::string>& token = std::nullopt
    );

    /**
     * @brief Rotate the token with the active strategy
     * @return New token and metadata
     */
    GeneratedToken rotate_token(Request& request) const;

    // ========================================================================
    // Strategy Registry
    // ========================================================================

    /**
     * @brief Register (or replace) a strategy under its name
     *
     * The active strategy chosen at construction is not changed.
     *
     * @throws CsrfException CONFIGURATION_ERROR for a null strategy or empty name
     */
    void register_strategy(std::shared_ptr<TokenStrategy> strategy);

    bool has_strategy(const std::string& name) const;
    std::vector<std::string> strategy_names() const;

    /// Registered strategy by name, nullptr if unknown
    std::shared_ptr<TokenStrategy> get_strategy(const std::string& name) const;

    const std::string& active_strategy_name() const;

    // ========================================================================
    // Configuration and State
    // ========================================================================

    const security::ProtectorConfig& config() const { return config_; }

    /// Current time from the configured clock (seconds since epoch)
    double now() const;

    bool is_safe_method(const std::string& method) const;

    /// Origin a stateless token for this request is bound to
    std::optional<std::string> get_bound_origin(const Request& request) const;

    size_t replay_cache_size() const;

private:
    /// Immutable after construction
    security::ProtectorConfig config_;

    /// Strategy name -> implementation
    std::map<std::string, std::shared_ptr<TokenStrategy>> strategies_;

    /// Guards strategies_
    mutable std::mutex strategies_mutex_;

    /// Strategy selected by config_.strategy
    std::shared_ptr<TokenStrategy> active_strategy_;

    /// Consumed tokens (replay detection)
    TokenReplayCache replay_cache_;

    /// Log and throw a configuration failure
    static void fail_configuration(CsrfErrorKind kind, const std::string& detail);
};

} // namespace csrfguard
