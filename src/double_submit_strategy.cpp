/**
 * @file double_submit_strategy.cpp
 * @brief Implementation of double-submit cookie CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/double_submit_strategy.hpp"
#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/token_crypto.hpp"
#include "csrfguard/utilities.hpp"

namespace csrfguard {

namespace {
    std::optional<std::string> non_empty(const std::optional<std::string>& value) {
        if (value && !value->empty()) {
            return value;
        }
        return std::nullopt;
    }
}

std::string DoubleSubmitStrategy::name() const {
    return NAME;
}

GeneratedToken DoubleSubmitStrategy::generate(Request& /*request*/, const CsrfProtector& protector) const {
    double now = protector.now();

    GeneratedToken generated;
    generated.token = TokenCrypto::generate_token_hex(security::TOKEN_ENTROPY_BYTES);
    generated.metadata = {
        {"created_at", utilities::format_timestamp(now)},
        {"expires_at", utilities::format_timestamp(now + protector.config().token_lifetime_seconds)},
        {"strategy", name()}
    };
    return generated;
}

StrategyVerdict DoubleSubmitStrategy::validate(
    const Request& request,
    const std::optional<std::string>& /*token*/,
    const CsrfProtector& /*protector*/
) const {
    auto form_token = non_empty(request.form_value(security::TOKEN_FORM_FIELD));
    auto cookie_token = non_empty(request.cookie(security::TOKEN_COOKIE_NAME));

    if (!form_token && !cookie_token) {
        form_token = token_header(request);
    }

    if (!form_token && !cookie_token) {
        return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::MISSING_TOKEN));
    }

    if (form_token && cookie_token &&
        !TokenCrypto::constant_time_compare(*form_token, *cookie_token)) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Double-submit mismatch"));
    }

    if (!form_token) {
        return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Form token missing"));
    }

    if (!cookie_token) {
        return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Cookie token missing"));
    }

    return StrategyVerdict::accept(0.0, {{"strategy", name()}});
}

} // namespace csrfguard
