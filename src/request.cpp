/**
 * @file request.cpp
 * @brief Implementation of the in-memory request
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/request.hpp"
#include "csrfguard/utilities.hpp"

#include <utility>

namespace csrfguard {

namespace {
    std::optional<std::string> lookup(
        const std::map<std::string, std::string>& values,
        const std::string& name
    ) {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}

BasicRequest::BasicRequest(
    std::string method_name,
    std::optional<std::string> origin,
    std::string remote_host
)
    : http_method(utilities::to_uppercase(method_name))
    , origin_header(std::move(origin))
    , remote_address(std::move(remote_host))
{
}

std::string BasicRequest::method() const {
    return utilities::to_uppercase(http_method);
}

std::optional<std::string> BasicRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (utilities::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> BasicRequest::form_value(const std::string& name) const {
    return lookup(form, name);
}

std::optional<std::string> BasicRequest::cookie(const std::string& name) const {
    return lookup(cookies, name);
}

std::optional<std::string> BasicRequest::query_value(const std::string& name) const {
    return lookup(query, name);
}

nlohmann::json& BasicRequest::session() {
    return session_record;
}

const nlohmann::json& BasicRequest::session() const {
    return session_record;
}

std::optional<std::string> BasicRequest::origin() const {
    return origin_header;
}

std::optional<std::string> BasicRequest::referer() const {
    return referer_header;
}

std::string BasicRequest::remote_host() const {
    return remote_address;
}

} // namespace csrfguard
