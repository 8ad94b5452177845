/**
 * @file stateless_strategy.cpp
 * @brief Implementation of HMAC-signed stateless CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/stateless_strategy.hpp"
#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/token_crypto.hpp"
#include "csrfguard/utilities.hpp"

#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace csrfguard {

namespace {
    /// Longest accepted hex timestamp (64-bit)
    constexpr size_t MAX_TIMESTAMP_HEX_DIGITS = 16;

    std::optional<uint64_t> parse_hex_timestamp(const std::string& hex) {
        if (hex.empty() || hex.size() > MAX_TIMESTAMP_HEX_DIGITS) {
            return std::nullopt;
        }

        uint64_t value = 0;
        for (char c : hex) {
            int digit;
            if (c >= '0' && c <= '9') {
                digit = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                digit = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                digit = c - 'A' + 10;
            } else {
                return std::nullopt;
            }
            value = (value << 4) | static_cast<uint64_t>(digit);
        }
        return value;
    }

    std::string to_hex(uint64_t value) {
        std::ostringstream oss;
        oss << std::hex << value;
        return oss.str();
    }
}

std::string StatelessStrategy::name() const {
    return NAME;
}

std::string StatelessStrategy::sign(
    const std::string& secret_key,
    uint64_t timestamp,
    const std::string& origin
) {
    std::string payload = std::to_string(timestamp) + ":" + origin;
    return TokenCrypto::hmac_sha256_hex(secret_key, payload);
}

// ============================================================================
// Generation
// ============================================================================

GeneratedToken StatelessStrategy::generate(Request& request, const CsrfProtector& protector) const {
    const auto& config = protector.config();
    double now = protector.now();
    uint64_t timestamp = static_cast<uint64_t>(std::floor(now < 0.0 ? 0.0 : now));

    auto origin = request.origin();
    std::string origin_bind = origin.value_or("");

    GeneratedToken generated;
    generated.token = to_hex(timestamp) + "." + sign(config.secret_key, timestamp, origin_bind);
    generated.metadata = {
        {"created_at", utilities::format_timestamp(now)},
        {"expires_at", utilities::format_timestamp(now + config.token_lifetime_seconds)},
        {"strategy", name()},
        {"origin_bound", !origin_bind.empty()}
    };
    return generated;
}

// ============================================================================
// Validation
// ============================================================================

StrategyVerdict StatelessStrategy::validate(
    const Request& request,
    const std::optional<std::string>& token,
    const CsrfProtector& protector
) const {
    const auto& config = protector.config();
    double now = protector.now();

    ReconciledToken reconciled = reconcile_token_candidates(collect_token_candidates(request, token));
    if (reconciled.rejection) {
        return *reconciled.rejection;
    }
    const std::string& provided = *reconciled.token;

    // Exactly one separator: "<hex timestamp>.<hex signature>"
    auto separator = provided.find('.');
    if (separator == std::string::npos || provided.find('.', separator + 1) != std::string::npos) {
        return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Bad token format"));
    }

    std::string hex_timestamp = provided.substr(0, separator);
    std::string signature = provided.substr(separator + 1);

    // Only the lower-case, unpadded form emitted by generate() is accepted
    auto timestamp = parse_hex_timestamp(hex_timestamp);
    if (!timestamp || to_hex(*timestamp) != hex_timestamp) {
        return StrategyVerdict::reject(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Invalid timestamp"));
    }

    // Bound to the origin of the request presenting the token
    std::string origin_bind = request.origin().value_or("");
    std::string expected = sign(config.secret_key, *timestamp, origin_bind);
    if (!TokenCrypto::constant_time_compare(signature, expected)) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Signature mismatch"),
            0.0,
            {{"origin", origin_bind}});
    }

    double created_at = static_cast<double>(*timestamp);
    double age = now - created_at;
    if (age < 0.0) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH, "Token timestamp in future"), age);
    }

    if (age > config.token_lifetime_seconds) {
        return StrategyVerdict::reject(
            CsrfFailure(CsrfErrorKind::TOKEN_EXPIRED),
            age,
            {{"expired_at", utilities::format_timestamp(created_at + config.token_lifetime_seconds)}});
    }

    return StrategyVerdict::accept(age, {{"strategy", name()}});
}

} // namespace csrfguard
