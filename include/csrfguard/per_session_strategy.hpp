/**
 * @file per_session_strategy.hpp
 * @brief Session-bound CSRF tokens with rotation overlap
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "csrfguard/token_strategy.hpp"

namespace csrfguard {

/**
 * @brief PerSessionStrategy - Random token stored in the session record
 *
 * The token is bound to the session identifier current at generation time
 * (fixation guard). On rotation the previous token moves to old_tokens and
 * stays valid until its original expiry plus the rotation overlap.
 */
class PerSessionStrategy : public TokenStrategy {
public:
    static constexpr const char* NAME = "per_session";

    std::string name() const override;

    GeneratedToken generate(Request& request, const CsrfProtector& protector) const override;

    StrategyVerdict validate(
        const Request& request,
        const std::optional<std::string>& token,
        const CsrfProtector& protector
    ) const override;
};

} // namespace csrfguard
