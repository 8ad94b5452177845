/**
 * @file token_crypto.cpp
 * @brief Implementation of CSRF token cryptography
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - HMAC-SHA256: stateless token signatures
 * - SHA-256: replay cache fingerprints
 * - randombytes: token and session identifier entropy
 * - libsodium: Industry-standard implementation
 */

#include "csrfguard/token_crypto.hpp"

namespace csrfguard {

namespace {
    const char HEX_DIGITS[] = "0123456789abcdef";

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

// ============================================================================
// Initialization
// ============================================================================

bool TokenCrypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Random Material
// ============================================================================

std::vector<uint8_t> TokenCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

std::string TokenCrypto::generate_token_hex(size_t entropy_bytes) {
    std::vector<uint8_t> bytes = generate_random_bytes(entropy_bytes);
    std::string hex = bytes_to_hex(bytes);
    secure_zero(bytes.data(), bytes.size());
    return hex;
}

// ============================================================================
// Message Authentication
// ============================================================================

HmacTag TokenCrypto::hmac_sha256(const std::string& key, const std::string& message) {
    HmacTag tag;
    crypto_auth_hmacsha256_state state;

    // The init/update/final API accepts keys of arbitrary length
    crypto_auth_hmacsha256_init(
        &state,
        reinterpret_cast<const unsigned char*>(key.data()),
        key.size()
    );
    crypto_auth_hmacsha256_update(
        &state,
        reinterpret_cast<const unsigned char*>(message.data()),
        message.size()
    );
    crypto_auth_hmacsha256_final(&state, tag.data());

    sodium_memzero(&state, sizeof(state));
    return tag;
}

std::string TokenCrypto::hmac_sha256_hex(const std::string& key, const std::string& message) {
    HmacTag tag = hmac_sha256(key, message);
    return bytes_to_hex(tag.data(), tag.size());
}

std::string TokenCrypto::sha256_hex(const std::string& data) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> hash;
    crypto_hash_sha256(
        hash.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        data.size()
    );
    return bytes_to_hex(hash.data(), hash.size());
}

// ============================================================================
// Comparison and Encoding
// ============================================================================

bool TokenCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    // Must be same length
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    // Use libsodium's constant-time comparison to prevent timing attacks
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool TokenCrypto::constant_time_compare(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string TokenCrypto::bytes_to_hex(const uint8_t* data, size_t size) {
    std::string hex;
    hex.reserve(size * 2);

    for (size_t i = 0; i < size; ++i) {
        hex.push_back(HEX_DIGITS[data[i] >> 4]);
        hex.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }

    return hex;
}

std::string TokenCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::optional<std::vector<uint8_t>> TokenCrypto::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return bytes;
}

void TokenCrypto::secure_zero(void* data, size_t size) {
    // Use libsodium's secure memzero (prevents compiler optimization from removing)
    sodium_memzero(data, size);
}

} // namespace csrfguard
