/**
 * @file per_session_strategy.cpp
 * @brief Implementation of session-bound CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/per_session_strategy.hpp"
#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/token_crypto.hpp"
#include "csrfguard/utilities.hpp"

using json = nlohmann::json;

namespace csrfguard {

namespace {
    std::optional<std::string> session_string(const json& session, const char* key) {
        if (!session.is_object()) {
            return std::nullopt;
        }
        auto it = session.find(key);
        if (it == session.end() || !it->is_string()) {
            return std::nullopt;
        }
        std::string value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> session_number(const json& session, const char* key) {
        if (!session.is_object()) {
            return std::nullopt;
        }
        auto it = session.find(key);
        if (it == session.end() || !it->is_number()) {
            return std::nullopt;
        }
        return it->get<double>();
    }
}

std::string PerSessionStrategy::name() const {
    return NAME;
}

// ============================================================================
// Generation
// ============================================================================

GeneratedToken PerSessionStrategy::generate(Request& request, const CsrfProtector& protector) const {
    const auto& config = protector.config();
    double now = protector.now();
    double expires_at = now + config.token_lifetime_seconds;

    json& session = request.session();
    if (!session.is_object()) {
        session = json::object();
    }

    std::string token = TokenCrypto::generate_token_hex(security::TOKEN_ENTROPY_BYTES);

    auto session_id = session_string(session, security::SESSION_ID_KEY);
    if (!session_id) {
        session_id = TokenCrypto::generate_token_hex(security::SESSION_ID_ENTROPY_BYTES);
        session[security::SESSION_ID_KEY] = *session_id;
    }

    // Lazily drop old tokens whose grace window has elapsed
    auto old_it = session.find(security::SESSION_OLD_TOKENS_KEY);
    if (old_it != session.end() && old_it->is_object()) {
        for (auto it = old_it->begin(); it != old_it->end(); ) {
            if (!it->is_number() || it->get<double>() < now) {
                it = old_it->erase(it);
            } else {
                ++it;
            }
        }
    }

    // Keep the previous token valid through the overlap window
    auto previous = session_string(session, security::SESSION_TOKEN_KEY);
    auto previous_expires_at = session_number(session, security::SESSION_TOKEN_EXPIRES_KEY);
    if (previous && previous_expires_at) {
        json& old_tokens = session[security::SESSION_OLD_TOKENS_KEY];
        if (!old_tokens.is_object()) {
            old_tokens = json::object();
        }
        old_tokens[*previous] = *previous_expires_at + config.rotation_overlap_seconds;
    }

    session[security::SESSION_TOKEN_KEY] = token;
    session[security::SESSION_TOKEN_CREATED_KEY] = now;
    session[security::SESSION_TOKEN_EXPIRES_KEY] = expires_at;
    session[security::SESSION_BOUND_ID_KEY] = *session_id;

    GeneratedToken generated;
    generated.token = token;
    generated.metadata = {
        {"created_at", utilities::format_timestamp(now)},
        {"expires_at", utilities::format_timestamp(expires_at)},
        {"strategy", name()},
        {"session_id", *session_id}
    };
    return generated;
}

// ============================================================================
// Validation
// ============================================================================

StrategyVerdict PerSessionStrategy::validate(
    const Request& request,
    const std::optional<std::string>& token,
    const CsrfProtector& protector
) const {
    double now = protector.now();

    ReconciledToken reconciled = reconcile_token_candidates(collect_token_candidates(request, token));
    if (reconciled.rejection) {
        return *reconciled.rejection;
    }
    const std::string& provided = *reconciled.token;

    const json& session = request.session();
    auto session_token = session_string(session, security::SESSION_TOKEN_KEY);
    auto bound_session_id = session_string(session, security::SESSION_BOUND_ID_KEY);
    auto session_id = session_string(session, security::SESSION_ID_KEY);

    if (!session_token || !bound_session_id || !session_id) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "No CSRF token bound to session"));
    }

    if (!TokenCrypto::constant_time_compare(*session_id, *bound_session_id)) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Session fixation detected"),
            0.0,
            {{"session_id", *session_id}});
    }

    if (TokenCrypto::constant_time_compare(provided, *session_token)) {
        auto created_at = session_number(session, security::SESSION_TOKEN_CREATED_KEY);
        auto expires_at = session_number(session, security::SESSION_TOKEN_EXPIRES_KEY);
        if (!created_at || !expires_at) {
            return StrategyVerdict::reject(
                CsrfFailure(CsrfErrorKind::CONFIGURATION_ERROR,
                            "Session token timing metadata missing"));
        }

        double age = now - *created_at;
        if (now > *expires_at) {
            return StrategyVerdict::reject(
                CsrfFailure(CsrfErrorKind::TOKEN_EXPIRED),
                age,
                {{"expired_at", utilities::format_timestamp(*expires_at)}});
        }

        return StrategyVerdict::accept(age, {{"strategy", name()}});
    }

    // Previous tokens still inside their rotation overlap
    auto old_it = session.find(security::SESSION_OLD_TOKENS_KEY);
    if (old_it != session.end() && old_it->is_object()) {
        const double lifetime = protector.config().token_lifetime_seconds;
        const double overlap = protector.config().rotation_overlap_seconds;

        for (auto it = old_it->begin(); it != old_it->end(); ++it) {
            if (!it->is_number() || !TokenCrypto::constant_time_compare(provided, it.key())) {
                continue;
            }

            double valid_until = it->get<double>();
            if (now <= valid_until) {
                double age = now - (valid_until - overlap - lifetime);
                return StrategyVerdict::accept(age, {
                    {"strategy", name()},
                    {"used_old_token", true},
                    {"old_token_valid_until", utilities::format_timestamp(valid_until)}
                });
            }

            return StrategyVerdict::reject(
                CsrfFailure(CsrfErrorKind::TOKEN_EXPIRED),
                0.0,
                {{"old_token_expired_at", utilities::format_timestamp(valid_until)}});
        }
    }

    return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH), 0.0, {{"strategy", name()}});
}

} // namespace csrfguard
