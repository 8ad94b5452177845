/**
 * @file validation_info.hpp
 * @brief Immutable result of a CSRF validation
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "csrfguard/csrf_errors.hpp"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace csrfguard {

/**
 * @brief ValidationInfo - Outcome of CsrfProtector::validate_request
 *
 * A successful result never carries a failure reason. Failed results copy
 * their structured error into additional_details["error"].
 */
class ValidationInfo {
public:
    /**
     * @brief Build a successful result
     * @param timestamp Validation time (seconds since epoch)
     * @param token_age_seconds Age of the accepted token
     * @param details Diagnostic details (JSON object)
     */
    static ValidationInfo success(
        double timestamp,
        double token_age_seconds,
        nlohmann::json details = nlohmann::json::object()
    );

    /**
     * @brief Build a failed result
     * @param failure Typed failure reason
     * @param timestamp Validation time (seconds since epoch)
     * @param token_age_seconds Age of the rejected token (0 if unknown)
     * @param details Diagnostic details (JSON object)
     */
    static ValidationInfo failure(
        CsrfFailure failure,
        double timestamp,
        double token_age_seconds,
        nlohmann::json details = nlohmann::json::object()
    );

    bool valid() const { return valid_; }

    /// Failure message, empty when valid
    std::optional<std::string> reason() const;

    const std::optional<CsrfFailure>& error() const { return error_; }
    std::optional<CsrfErrorKind> error_kind() const;
    std::optional<std::string> error_code() const;

    double timestamp() const { return timestamp_; }
    double token_age_seconds() const { return token_age_seconds_; }
    const nlohmann::json& additional_details() const { return additional_details_; }

    /**
     * @brief Serialize to JSON
     * @return {valid, reason, timestamp (ISO-8601), token_age_seconds, additional_details}
     */
    nlohmann::json to_json() const;

    /**
     * @brief One-line audit record
     *
     * Format: time=<iso8601> | valid=<bool> | reason=<...> | age=<n>s | details=<json>
     * reason and details appear only when non-empty.
     */
    std::string format_attack_log() const;

private:
    ValidationInfo(
        bool valid,
        std::optional<CsrfFailure> error,
        double timestamp,
        double token_age_seconds,
        nlohmann::json details
    );

    bool valid_;
    std::optional<CsrfFailure> error_;
    double timestamp_;
    double token_age_seconds_;
    nlohmann::json additional_details_;
};

} // namespace csrfguard
