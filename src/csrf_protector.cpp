/**
 * @file csrf_protector.cpp
 * @brief Implementation of the CSRF protection orchestrator
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/double_submit_strategy.hpp"
#include "csrfguard/per_session_strategy.hpp"
#include "csrfguard/stateless_strategy.hpp"
#include "csrfguard/token_crypto.hpp"
#include "csrfguard/utilities.hpp"

#include <sstream>

using json = nlohmann::json;

namespace csrfguard {

// ============================================================================
// Construction
// ============================================================================

CsrfProtector::CsrfProtector(
    security::ProtectorConfig config,
    std::vector<std::shared_ptr<TokenStrategy>> extra_strategies
) : config_(std::move(config)) {
    if (!TokenCrypto::initialize()) {
        fail_configuration(CsrfErrorKind::CONFIGURATION_ERROR, "Failed to initialize libsodium");
    }

    try {
        security::validate_config(config_);
    } catch (const CsrfException& e) {
        utilities::log_error(std::string("CsrfProtector: Rejected configuration: ") + e.what());
        throw;
    }

    config_.safe_methods = security::normalize_safe_methods(config_.safe_methods);
    if (!config_.time_source) {
        config_.time_source = security::system_time_seconds;
    }

    register_strategy(std::make_shared<PerSessionStrategy>());
    register_strategy(std::make_shared<StatelessStrategy>());
    register_strategy(std::make_shared<DoubleSubmitStrategy>());
    for (auto& strategy : extra_strategies) {
        register_strategy(std::move(strategy));
    }

    active_strategy_ = get_strategy(config_.strategy);
    if (config_.strategy.empty() || !active_strategy_) {
        fail_configuration(CsrfErrorKind::UNSUPPORTED_STRATEGY,
                           "Unsupported strategy '" + config_.strategy + "'");
    }

    std::ostringstream oss;
    oss << "CsrfProtector: Initialized (strategy=" << config_.strategy
        << ", lifetime=" << config_.token_lifetime_seconds << "s"
        << ", overlap=" << config_.rotation_overlap_seconds << "s"
        << ", replay_detection=" << (config_.enable_replay_detection ? "on" : "off")
        << ", enforce_origin=" << (config_.enforce_origin ? "on" : "off") << ")";
    utilities::log_info(oss.str());
}

CsrfProtector::~CsrfProtector() {
    if (!config_.secret_key.empty()) {
        TokenCrypto::secure_zero(&config_.secret_key[0], config_.secret_key.size());
    }
}

void CsrfProtector::fail_configuration(CsrfErrorKind kind, const std::string& detail) {
    CsrfFailure failure(kind, detail);
    utilities::log_error("CsrfProtector: " + failure.to_json());
    throw CsrfException(failure);
}

// ============================================================================
// Token API
// ============================================================================

std::string CsrfProtector::generate_token(Request& request) const {
    return generate_token_full(request).token;
}

GeneratedToken CsrfProtector::generate_token_full(Request& request) const {
    GeneratedToken generated = active_strategy_->generate(request, *this);
    utilities::log_debug("CsrfProtector: Issued " + active_strategy_->name() + " token");
    return generated;
}

GeneratedToken CsrfProtector::rotate_token(Request& request) const {
    GeneratedToken rotated = active_strategy_->rotate(request, *this);
    utilities::log_debug("CsrfProtector: Rotated " + active_strategy_->name() + " token");
    return rotated;
}

std::pair<bool, ValidationInfo> CsrfProtector::validate_request(
    const Request& request,
    const std::optional<std::string>& token
) {
    double timestamp = now();

    // Safe methods are never checked
    if (is_safe_method(request.method())) {
        json details = json::object();
        if (!collect_token_candidates(request, token).empty()) {
            details["note"] = "Token present on safe method";
        }
        return {true, ValidationInfo::success(timestamp, 0.0, details)};
    }

    if (config_.enforce_origin) {
        auto origin = request.origin();
        if (!origin || origin->empty()) {
            auto info = ValidationInfo::failure(
                CsrfFailure(CsrfErrorKind::ORIGIN_MISMATCH, "Origin header missing"),
                timestamp, 0.0);
            utilities::log_warn("CsrfProtector: Rejected request: " + info.format_attack_log());
            return {false, info};
        }
    }

    StrategyVerdict verdict = active_strategy_->validate(request, token, *this);
    if (!verdict.valid) {
        if (!verdict.error) {
            utilities::log_warn("CsrfProtector: Strategy '" + active_strategy_->name() +
                                "' rejected request without a failure reason");
        }
        CsrfFailure failure = verdict.error.value_or(CsrfFailure(CsrfErrorKind::TOKEN_MISMATCH));
        auto info = ValidationInfo::failure(failure, timestamp, verdict.age_seconds, verdict.extra);
        utilities::log_warn("CsrfProtector: Rejected request: " + info.format_attack_log());
        return {false, info};
    }

    // Single-use tokens: the highest-priority token supplied is consumed
    if (config_.enable_replay_detection) {
        auto candidates = collect_token_candidates(request, token);
        if (!candidates.empty()) {
            const std::string& consumed = candidates.front().value;
            if (!replay_cache_.check_and_record(consumed, timestamp, config_.token_lifetime_seconds)) {
                auto info = ValidationInfo::failure(
                    CsrfFailure(CsrfErrorKind::REPLAY_DETECTED),
                    timestamp,
                    verdict.age_seconds,
                    {{"token_fingerprint", TokenReplayCache::fingerprint(consumed)}});
                utilities::log_warn("CsrfProtector: Rejected request: " + info.format_attack_log());
                return {false, info};
            }
        }
    }

    auto info = ValidationInfo::success(timestamp, verdict.age_seconds, verdict.extra);
    utilities::log_debug("CsrfProtector: Accepted request: " + info.format_attack_log());
    return {true, info};
}

// ============================================================================
// Strategy Registry
// ============================================================================

void CsrfProtector::register_strategy(std::shared_ptr<TokenStrategy> strategy) {
    if (!strategy) {
        fail_configuration(CsrfErrorKind::CONFIGURATION_ERROR, "Cannot register null strategy");
    }

    std::string name = strategy->name();
    if (name.empty()) {
        fail_configuration(CsrfErrorKind::CONFIGURATION_ERROR, "Strategy name must be non-empty");
    }

    std::lock_guard<std::mutex> lock(strategies_mutex_);
    strategies_[name] = std::move(strategy);
    utilities::log_debug("CsrfProtector: Registered strategy '" + name + "'");
}

bool CsrfProtector::has_strategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    return strategies_.find(name) != strategies_.end();
}

std::vector<std::string> CsrfProtector::strategy_names() const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& entry : strategies_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<TokenStrategy> CsrfProtector::get_strategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        return nullptr;
    }
    return it->second;
}

const std::string& CsrfProtector::active_strategy_name() const {
    return config_.strategy;
}

// ============================================================================
// Configuration and State
// ============================================================================

double CsrfProtector::now() const {
    return config_.time_source();
}

bool CsrfProtector::is_safe_method(const std::string& method) const {
    return config_.safe_methods.count(utilities::to_uppercase(method)) > 0;
}

std::optional<std::string> CsrfProtector::get_bound_origin(const Request& request) const {
    auto origin = request.origin();
    if (!origin || origin->empty()) {
        return std::nullopt;
    }
    return origin;
}

size_t CsrfProtector::replay_cache_size() const {
    return replay_cache_.get_cache_size();
}

} // namespace csrfguard
