/**
 * @file token_strategy.hpp
 * @brief Pluggable CSRF token binding strategies
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A strategy decides how a token is minted and what proves it genuine:
 * - per_session: random token stored in the caller's session record
 * - stateless: timestamp + HMAC-SHA256 signature bound to the origin
 * - double_submit: random token echoed in both a cookie and the form
 */

#pragma once

#include "csrfguard/csrf_errors.hpp"
#include "csrfguard/request.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace csrfguard {

class CsrfProtector;

/**
 * @brief Token plus strategy-specific metadata (created_at, expires_at, ...)
 */
struct GeneratedToken {
    std::string token;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Result of TokenStrategy::validate
 */
struct StrategyVerdict {
    bool valid = false;                       ///< Token accepted
    std::optional<CsrfFailure> error;         ///< Set iff !valid
    double age_seconds = 0.0;                 ///< Token age (0 if unknown)
    nlohmann::json extra = nlohmann::json::object(); ///< Diagnostic details

    static StrategyVerdict accept(double age_seconds, nlohmann::json extra = nlohmann::json::object());
    static StrategyVerdict reject(
        CsrfFailure failure,
        double age_seconds = 0.0,
        nlohmann::json extra = nlohmann::json::object()
    );
};

/**
 * @brief A token found in one request channel
 */
struct TokenCandidate {
    std::string source;   ///< "explicit", "form", "cookie" or "header"
    std::string value;
};

/**
 * @brief Gather non-empty tokens in priority order: explicit, form, cookie, header
 *
 * The header candidate is X-CSRF-Token, falling back to X-XSRF-TOKEN.
 */
std::vector<TokenCandidate> collect_token_candidates(
    const Request& request,
    const std::optional<std::string>& explicit_token
);

/**
 * @brief Token header value (X-CSRF-Token, then X-XSRF-TOKEN), empty values ignored
 */
std::optional<std::string> token_header(const Request& request);

/**
 * @brief Outcome of reducing candidates to one token
 */
struct ReconciledToken {
    std::optional<std::string> token;          ///< Agreed token
    std::optional<StrategyVerdict> rejection;  ///< missing_token or conflicting sources
};

/**
 * @brief Require at least one candidate and agreement between all of them
 */
ReconciledToken reconcile_token_candidates(const std::vector<TokenCandidate>& candidates);

/**
 * @brief TokenStrategy - Token binding algorithm
 *
 * Implementations hold no per-request state. Anything that must persist
 * between generate and validate lives in the request's session record or is
 * derived from the protector's secret.
 */
class TokenStrategy {
public:
    virtual ~TokenStrategy() = default;

    /// Registry key (e.g. "per_session")
    virtual std::string name() const = 0;

    /**
     * @brief Mint a token for the request
     * @param request Request (session may be updated)
     * @param protector Owning protector (clock, secret, lifetimes)
     * @return Token and metadata
     */
    virtual GeneratedToken generate(Request& request, const CsrfProtector& protector) const = 0;

    /**
     * @brief Check the token presented with a request
     * @param request Incoming request
     * @param token Explicitly supplied token, if any
     * @param protector Owning protector
     * @return Verdict; never throws for request-level problems
     */
    virtual StrategyVerdict validate(
        const Request& request,
        const std::optional<std::string>& token,
        const CsrfProtector& protector
    ) const = 0;

    /**
     * @brief Replace the current token; re-generates by default
     */
    virtual GeneratedToken rotate(Request& request, const CsrfProtector& protector) const;
};

} // namespace csrfguard
