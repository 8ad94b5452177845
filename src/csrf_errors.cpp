/**
 * @file csrf_errors.cpp
 * @brief Implementation of the CSRF error taxonomy
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/csrf_errors.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace csrfguard {

// ============================================================================
// Code / Message Tables
// ============================================================================

std::string error_code(CsrfErrorKind kind) {
    switch (kind) {
        case CsrfErrorKind::MISSING_TOKEN: return "missing_token";
        case CsrfErrorKind::TOKEN_MISMATCH: return "token_mismatch";
        case CsrfErrorKind::TOKEN_EXPIRED: return "token_expired";
        case CsrfErrorKind::ORIGIN_MISMATCH: return "origin_mismatch";
        case CsrfErrorKind::REPLAY_DETECTED: return "replay_detected";
        case CsrfErrorKind::UNSUPPORTED_STRATEGY: return "unsupported_strategy";
        case CsrfErrorKind::CONFIGURATION_ERROR: return "configuration_error";
        default: return "csrf_error";
    }
}

std::string default_error_message(CsrfErrorKind kind) {
    switch (kind) {
        case CsrfErrorKind::MISSING_TOKEN: return "CSRF token is missing";
        case CsrfErrorKind::TOKEN_MISMATCH: return "CSRF token mismatch";
        case CsrfErrorKind::TOKEN_EXPIRED: return "CSRF token expired";
        case CsrfErrorKind::ORIGIN_MISMATCH: return "Origin header mismatch or missing";
        case CsrfErrorKind::REPLAY_DETECTED: return "Replay attack detected";
        case CsrfErrorKind::UNSUPPORTED_STRATEGY: return "CSRF strategy not supported";
        case CsrfErrorKind::CONFIGURATION_ERROR: return "Invalid configuration";
        default: return "Generic CSRF error";
    }
}

std::optional<CsrfErrorKind> error_kind_from_code(const std::string& code) {
    if (code == "missing_token") return CsrfErrorKind::MISSING_TOKEN;
    if (code == "token_mismatch") return CsrfErrorKind::TOKEN_MISMATCH;
    if (code == "token_expired") return CsrfErrorKind::TOKEN_EXPIRED;
    if (code == "origin_mismatch") return CsrfErrorKind::ORIGIN_MISMATCH;
    if (code == "replay_detected") return CsrfErrorKind::REPLAY_DETECTED;
    if (code == "unsupported_strategy") return CsrfErrorKind::UNSUPPORTED_STRATEGY;
    if (code == "configuration_error") return CsrfErrorKind::CONFIGURATION_ERROR;
    return std::nullopt;
}

// ============================================================================
// CsrfFailure
// ============================================================================

CsrfFailure::CsrfFailure(CsrfErrorKind failure_kind, std::string failure_detail)
    : kind(failure_kind)
    , detail(std::move(failure_detail))
{
}

std::string CsrfFailure::code() const {
    return error_code(kind);
}

std::string CsrfFailure::message() const {
    return detail.empty() ? default_error_message(kind) : detail;
}

std::string CsrfFailure::to_json() const {
    json j;
    j["code"] = code();
    j["message"] = message();
    return j.dump();
}

bool CsrfFailure::operator==(const CsrfFailure& other) const {
    return kind == other.kind && message() == other.message();
}

bool CsrfFailure::operator!=(const CsrfFailure& other) const {
    return !(*this == other);
}

// ============================================================================
// CsrfException
// ============================================================================

CsrfException::CsrfException(CsrfFailure failure)
    : std::runtime_error(failure.code() + ": " + failure.message())
    , failure_(std::move(failure))
{
}

CsrfException::CsrfException(CsrfErrorKind kind, const std::string& detail)
    : CsrfException(CsrfFailure(kind, detail))
{
}

} // namespace csrfguard
