/**
 * @file stateless_strategy.hpp
 * @brief Self-verifying HMAC CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Token format: <hex unix timestamp>.<hex HMAC-SHA256("<timestamp>:<origin>")>
 */

#pragma once

#include "csrfguard/token_strategy.hpp"

#include <cstdint>

namespace csrfguard {

/**
 * @brief StatelessStrategy - Timestamp plus origin-bound signature
 *
 * Needs no server-side storage: the signature proves integrity and binds the
 * token to the Origin of the request it was issued for.
 */
class StatelessStrategy : public TokenStrategy {
public:
    static constexpr const char* NAME = "stateless";

    std::string name() const override;

    GeneratedToken generate(Request& request, const CsrfProtector& protector) const override;

    StrategyVerdict validate(
        const Request& request,
        const std::optional<std::string>& token,
        const CsrfProtector& protector
    ) const override;

    /**
     * @brief Signature for a timestamp/origin pair
     * @param secret_key HMAC key
     * @param timestamp Issue time (whole seconds since epoch)
     * @param origin Origin bound into the token (empty if none)
     * @return Lowercase hex HMAC-SHA256
     */
    static std::string sign(const std::string& secret_key, uint64_t timestamp, const std::string& origin);
};

} // namespace csrfguard
