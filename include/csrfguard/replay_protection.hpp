/**
 * @file replay_protection.hpp
 * @brief Replay detection for consumed CSRF tokens
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - SHA-256 token fingerprints (raw tokens are never retained)
 * - Per-entry expiry of token lifetime past first use
 * - Expired entries purged on every access
 * - Thread-safe implementation
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace csrfguard {

/**
 * @brief TokenReplayCache - Makes validated tokens single-use
 *
 * Thread-safe replay detection using:
 * 1. SHA-256 fingerprint of each consumed token
 * 2. Expiry time recorded at first use (now + lifetime)
 * 3. Purge of expired fingerprints under the same lock as lookup and insert
 *
 * Time is supplied by the caller (seconds since epoch) so the owning
 * protector's injected clock governs expiry.
 */
class TokenReplayCache {
public:
    TokenReplayCache() = default;
    ~TokenReplayCache() = default;

    // Disable copy and move (owned by a single protector)
    TokenReplayCache(const TokenReplayCache&) = delete;
    TokenReplayCache& operator=(const TokenReplayCache&) = delete;
    TokenReplayCache(TokenReplayCache&&) = delete;
    TokenReplayCache& operator=(TokenReplayCache&&) = delete;

    /**
     * @brief Fingerprint a token for storage and logging
     * @param token Token string
     * @return SHA-256 hex digest (64 characters)
     */
    static std::string fingerprint(const std::string& token);

    /**
     * @brief Atomically purge, check and record a token
     *
     * Of any number of concurrent calls with the same token, exactly one
     * returns true.
     *
     * @param token Token being consumed
     * @param now Current time (seconds since epoch)
     * @param lifetime_seconds How long the entry blocks reuse
     * @return true if first use (now recorded), false if replay detected
     */
    bool check_and_record(const std::string& token, double now, double lifetime_seconds);

    /**
     * @brief Check if a token has an unexpired entry (without recording it)
     * @param token Token to check
     * @param now Current time (seconds since epoch)
     * @return true if the token was already consumed
     */
    bool has_seen(const std::string& token, double now) const;

    /**
     * @brief Get number of tracked fingerprints (including not yet purged ones)
     */
    size_t get_cache_size() const;

    /**
     * @brief Manually trigger cleanup of expired entries
     * @param now Current time (seconds since epoch)
     * @return Number of expired entries removed
     */
    size_t cleanup_expired(double now);

    /**
     * @brief Clear all cached fingerprints (use with caution)
     */
    void clear();

private:
    /// Fingerprint -> expiry (seconds since epoch)
    std::map<std::string, double> token_cache_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;

    /// Remove entries with expiry < now; caller holds mutex_
    size_t purge_expired_locked(double now);
};

} // namespace csrfguard
