/**
 * @file csrf_errors.hpp
 * @brief Closed error taxonomy for CSRF validation and configuration
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Per-request failures are reported as CsrfFailure values inside a
 * ValidationInfo. Only configuration problems are thrown, as CsrfException.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace csrfguard {

/**
 * @brief Reasons a CSRF check or a protector configuration can fail
 */
enum class CsrfErrorKind {
    MISSING_TOKEN,           ///< No token supplied through any channel
    TOKEN_MISMATCH,          ///< Token does not match (conflicting sources, bad signature, ...)
    TOKEN_EXPIRED,           ///< Token lifetime (or rotation overlap) elapsed
    ORIGIN_MISMATCH,         ///< Origin header missing or not acceptable
    REPLAY_DETECTED,         ///< Token was already consumed
    UNSUPPORTED_STRATEGY,    ///< Requested strategy is not registered
    CONFIGURATION_ERROR      ///< Invalid protector configuration or session metadata
};

/**
 * @brief Stable machine-readable code for an error kind (e.g. "missing_token")
 */
std::string error_code(CsrfErrorKind kind);

/**
 * @brief Default human-readable message for an error kind
 */
std::string default_error_message(CsrfErrorKind kind);

/**
 * @brief Reverse lookup of error_code()
 * @return Matching kind, or std::nullopt for an unknown code
 */
std::optional<CsrfErrorKind> error_kind_from_code(const std::string& code);

/**
 * @brief A typed failure with an optional detail message
 */
struct CsrfFailure {
    CsrfErrorKind kind;     ///< Failure category
    std::string detail;     ///< Specific message (default message when empty)

    explicit CsrfFailure(CsrfErrorKind kind, std::string detail = "");

    std::string code() const;
    std::string message() const;

    /**
     * @brief Structured form for logging
     * @return JSON object string {"code": ..., "message": ...}
     */
    std::string to_json() const;

    bool operator==(const CsrfFailure& other) const;
    bool operator!=(const CsrfFailure& other) const;
};

/**
 * @brief Exception raised for configuration-time failures
 */
class CsrfException : public std::runtime_error {
public:
    explicit CsrfException(CsrfFailure failure);
    CsrfException(CsrfErrorKind kind, const std::string& detail);

    const CsrfFailure& failure() const noexcept { return failure_; }
    CsrfErrorKind kind() const noexcept { return failure_.kind; }

private:
    CsrfFailure failure_;
};

} // namespace csrfguard
