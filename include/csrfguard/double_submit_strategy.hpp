/**
 * @file double_submit_strategy.hpp
 * @brief Double-submit cookie CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "csrfguard/token_strategy.hpp"

namespace csrfguard {

/**
 * @brief DoubleSubmitStrategy - Same random token in a cookie and the form
 *
 * The web layer places the generated token in both a cookie and a form
 * field (or header). The token carries no timestamp, so reported age is
 * always 0 and expiry is left to the cookie's max-age.
 */
class DoubleSubmitStrategy : public TokenStrategy {
public:
    static constexpr const char* NAME = "double_submit";

    std::string name() const override;

    GeneratedToken generate(Request& request, const CsrfProtector& protector) const override;

    /**
     * @brief Compare form (or header) token with cookie token
     *
     * The explicit token argument is not consulted; the header stands in for
     * the form only when neither form nor cookie carries a token.
     */
    StrategyVerdict validate(
        const Request& request,
        const std::optional<std::string>& token,
        const CsrfProtector& protector
    ) const override;
};

} // namespace csrfguard
