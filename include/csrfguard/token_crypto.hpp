/**
 * @file token_crypto.hpp
 * @brief Cryptographic primitives for CSRF token issuance and verification
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides CSPRNG tokens, HMAC-SHA256 signing, SHA-256 fingerprints and
 * constant-time comparison.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace csrfguard {

/// HMAC-SHA256 tag
using HmacTag = std::array<uint8_t, crypto_auth_hmacsha256_BYTES>;

/**
 * @brief TokenCrypto - Cryptographic operations for token strategies
 *
 * Thread-safe primitives using libsodium. All methods are stateless.
 */
class TokenCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Random Material
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of random bytes to generate
     * @return Vector of random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Generate a random hex token
     * @param entropy_bytes Number of random bytes (hex string is twice as long)
     * @return Lowercase hex string
     */
    static std::string generate_token_hex(size_t entropy_bytes);

    // ========================================================================
    // Message Authentication
    // ========================================================================

    /**
     * @brief Compute HMAC-SHA256 with a key of any length
     * @param key Secret key
     * @param message Message to authenticate
     * @return 32-byte authentication tag
     */
    static HmacTag hmac_sha256(const std::string& key, const std::string& message);

    /**
     * @brief HMAC-SHA256 rendered as lowercase hex (64 characters)
     */
    static std::string hmac_sha256_hex(const std::string& key, const std::string& message);

    /**
     * @brief SHA-256 digest rendered as lowercase hex (64 characters)
     * @param data Input data
     * @return Hex digest
     */
    static std::string sha256_hex(const std::string& data);

    // ========================================================================
    // Comparison and Encoding
    // ========================================================================

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     * @param a First byte array
     * @param b Second byte array
     * @return true if arrays are equal, false otherwise
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Constant-time comparison of strings
     *
     * Only the length is allowed to leak; equal-length inputs are compared
     * without data-dependent early exit.
     */
    static bool constant_time_compare(const std::string& a, const std::string& b);

    /**
     * @brief Convert bytes to hexadecimal string
     */
    static std::string bytes_to_hex(const uint8_t* data, size_t size);
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @param hex Hexadecimal string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace csrfguard
