/**
 * @file replay_protection.cpp
 * @brief Implementation of CSRF token replay detection
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "csrfguard/replay_protection.hpp"
#include "csrfguard/token_crypto.hpp"

namespace csrfguard {

// ============================================================================
// Fingerprints
// ============================================================================

std::string TokenReplayCache::fingerprint(const std::string& token) {
    return TokenCrypto::sha256_hex(token);
}

// ============================================================================
// Replay Detection
// ============================================================================

bool TokenReplayCache::check_and_record(
    const std::string& token,
    double now,
    double lifetime_seconds
) {
    std::string key = fingerprint(token);

    std::lock_guard<std::mutex> lock(mutex_);

    purge_expired_locked(now);

    // Token already consumed
    if (token_cache_.find(key) != token_cache_.end()) {
        return false;
    }

    token_cache_[key] = now + lifetime_seconds;
    return true;
}

bool TokenReplayCache::has_seen(const std::string& token, double now) const {
    std::string key = fingerprint(token);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = token_cache_.find(key);
    return it != token_cache_.end() && !(it->second < now);
}

// ============================================================================
// Cache Management
// ============================================================================

size_t TokenReplayCache::get_cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_cache_.size();
}

size_t TokenReplayCache::cleanup_expired(double now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_expired_locked(now);
}

size_t TokenReplayCache::purge_expired_locked(double now) {
    size_t removed = 0;

    for (auto it = token_cache_.begin(); it != token_cache_.end(); ) {
        if (it->second < now) {
            it = token_cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void TokenReplayCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_cache_.clear();
}

} // namespace csrfguard
