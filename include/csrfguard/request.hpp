/**
 * @file request.hpp
 * @brief Request abstraction consumed by the CSRF protector
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The hosting web layer owns the request and its session record. The
 * protector only reads request data and, for the per-session strategy,
 * reads and writes its own keys in the session record.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace csrfguard {

/**
 * @brief Request - Interface a web layer implements to be protected
 *
 * Callers must serialize validate/rotate calls that share one session record.
 */
class Request {
public:
    virtual ~Request() = default;

    /// HTTP verb, upper-case
    virtual std::string method() const = 0;

    /// Case-insensitive header lookup
    virtual std::optional<std::string> header(const std::string& name) const = 0;

    virtual std::optional<std::string> form_value(const std::string& name) const = 0;
    virtual std::optional<std::string> cookie(const std::string& name) const = 0;
    virtual std::optional<std::string> query_value(const std::string& name) const = 0;

    /// Mutable session record (JSON object)
    virtual nlohmann::json& session() = 0;
    virtual const nlohmann::json& session() const = 0;

    virtual std::optional<std::string> origin() const = 0;
    virtual std::optional<std::string> referer() const = 0;
    virtual std::string remote_host() const = 0;
};

/**
 * @brief BasicRequest - In-memory Request with directly editable fields
 */
class BasicRequest : public Request {
public:
    /**
     * @brief Construct request
     * @param method_name HTTP verb (any case)
     * @param origin Origin header value
     * @param remote_host Client host
     */
    explicit BasicRequest(
        std::string method_name,
        std::optional<std::string> origin = std::nullopt,
        std::string remote_host = ""
    );

    std::string method() const override;
    std::optional<std::string> header(const std::string& name) const override;
    std::optional<std::string> form_value(const std::string& name) const override;
    std::optional<std::string> cookie(const std::string& name) const override;
    std::optional<std::string> query_value(const std::string& name) const override;
    nlohmann::json& session() override;
    const nlohmann::json& session() const override;
    std::optional<std::string> origin() const override;
    std::optional<std::string> referer() const override;
    std::string remote_host() const override;

    std::string http_method;                       ///< Request verb
    std::map<std::string, std::string> headers;    ///< Header name -> value
    std::map<std::string, std::string> cookies;    ///< Cookie name -> value
    std::map<std::string, std::string> form;       ///< Form field -> value
    std::map<std::string, std::string> query;      ///< Query parameter -> value
    nlohmann::json session_record = nlohmann::json::object(); ///< Session state
    std::optional<std::string> origin_header;      ///< Origin header
    std::optional<std::string> referer_header;     ///< Referer header
    std::string remote_address;                    ///< Client host
};

} // namespace csrfguard
