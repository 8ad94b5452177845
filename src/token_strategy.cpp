/**
 * @file token_strategy.cpp
 * @brief Shared token-source handling for CSRF strategies
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/token_strategy.hpp"
#include "csrfguard/security_config.hpp"
#include "csrfguard/token_crypto.hpp"

#include <utility>

using json = nlohmann::json;

namespace csrfguard {

// ============================================================================
// StrategyVerdict
// ============================================================================

StrategyVerdict StrategyVerdict::accept(double age_seconds, json extra) {
    StrategyVerdict verdict;
    verdict.valid = true;
    verdict.age_seconds = age_seconds;
    verdict.extra = std::move(extra);
    return verdict;
}

StrategyVerdict StrategyVerdict::reject(CsrfFailure failure, double age_seconds, json extra) {
    StrategyVerdict verdict;
    verdict.valid = false;
    verdict.error = std::move(failure);
    verdict.age_seconds = age_seconds;
    verdict.extra = std::move(extra);
    return verdict;
}

// ============================================================================
// Token Sources
// ============================================================================

std::optional<std::string> token_header(const Request& request) {
    auto primary = request.header(security::TOKEN_HEADER);
    if (primary && !primary->empty()) {
        return primary;
    }

    auto alternate = request.header(security::TOKEN_HEADER_ALT);
    if (alternate && !alternate->empty()) {
        return alternate;
    }

    return std::nullopt;
}

std::vector<TokenCandidate> collect_token_candidates(
    const Request& request,
    const std::optional<std::string>& explicit_token
) {
    std::vector<TokenCandidate> candidates;

    auto add = [&candidates](const char* source, const std::optional<std::string>& value) {
        if (value && !value->empty()) {
            candidates.push_back({source, *value});
        }
    };

    add("explicit", explicit_token);
    add("form", request.form_value(security::TOKEN_FORM_FIELD));
    add("cookie", request.cookie(security::TOKEN_COOKIE_NAME));
    add("header", token_header(request));

    return candidates;
}

ReconciledToken reconcile_token_candidates(const std::vector<TokenCandidate>& candidates) {
    ReconciledToken result;

    if (candidates.empty()) {
        result.rejection = StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::MISSING_TOKEN), 0.0, {{"source", "none"}});
        return result;
    }

    const std::string& first = candidates.front().value;
    bool conflicting = false;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (!TokenCrypto::constant_time_compare(first, candidates[i].value)) {
            conflicting = true;
        }
    }

    if (conflicting) {
        json sources = json::array();
        for (const auto& candidate : candidates) {
            sources.push_back(candidate.source);
        }
        result.rejection = StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Conflicting token sources"),
            0.0,
            {{"sources", sources}});
        return result;
    }

    result.token = first;
    return result;
}

// ============================================================================
// TokenStrategy
// ============================================================================

GeneratedToken TokenStrategy::rotate(Request& request, const CsrfProtector& protector) const {
    return generate(request, protector);
}

} // namespace csrfguard
