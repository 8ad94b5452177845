/**
 * @file validation_info.cpp
 * @brief Implementation of ValidationInfo serialization and audit lines
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/validation_info.hpp"
#include "csrfguard/utilities.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace csrfguard {

ValidationInfo::ValidationInfo(
    bool valid,
    std::optional<CsrfFailure> error,
    double timestamp,
    double token_age_seconds,
    json details
)
    : valid_(valid)
    , error_(std::move(error))
    , timestamp_(timestamp)
    , token_age_seconds_(token_age_seconds)
    , additional_details_(details.is_object() ? std::move(details) : json::object())
{
}

ValidationInfo ValidationInfo::success(double timestamp, double token_age_seconds, json details) {
    return ValidationInfo(true, std::nullopt, timestamp, token_age_seconds, std::move(details));
}

ValidationInfo ValidationInfo::failure(
    CsrfFailure failure,
    double timestamp,
    double token_age_seconds,
    json details
) {
    if (!details.is_object()) {
        details = json::object();
    }

    // Keep the structured error alongside caller-supplied details
    if (!details.contains("error")) {
        details["error"] = json::parse(failure.to_json());
    }

    return ValidationInfo(false, std::move(failure), timestamp, token_age_seconds, std::move(details));
}

std::optional<std::string> ValidationInfo::reason() const {
    if (!error_) {
        return std::nullopt;
    }
    return error_->message();
}

std::optional<CsrfErrorKind> ValidationInfo::error_kind() const {
    if (!error_) {
        return std::nullopt;
    }
    return error_->kind;
}

std::optional<std::string> ValidationInfo::error_code() const {
    if (!error_) {
        return std::nullopt;
    }
    return error_->code();
}

json ValidationInfo::to_json() const {
    json j;
    j["valid"] = valid_;
    if (error_) {
        j["reason"] = error_->message();
    } else {
        j["reason"] = nullptr;
    }
    j["timestamp"] = utilities::format_timestamp(timestamp_);
    j["token_age_seconds"] = token_age_seconds_;
    j["additional_details"] = additional_details_;
    return j;
}

std::string ValidationInfo::format_attack_log() const {
    std::ostringstream oss;
    oss << "time=" << utilities::format_timestamp(timestamp_);
    oss << " | valid=" << (valid_ ? "true" : "false");

    if (error_) {
        oss << " | reason=" << error_->message();
    }

    oss << " | age=" << std::fixed << std::setprecision(1) << token_age_seconds_ << "s";

    if (!additional_details_.empty()) {
        oss << " | details=" << additional_details_.dump();
    }

    return oss.str();
}

} // namespace csrfguard
