/**
 * @file test_token_crypto.cpp
 * @brief Unit tests for TokenCrypto
 *
 * Tests the primitives behind token minting and verification:
 * - Random token generation
 * - HMAC-SHA256 and SHA-256 against published vectors
 * - Constant-time comparison
 * - Hex encoding
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "csrfguard/token_crypto.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <vector>

using namespace csrfguard;

// Test fixture for TokenCrypto tests
class TokenCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(TokenCrypto::initialize());
    }
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(TokenCryptoTest, InitializeIsIdempotent) {
    EXPECT_TRUE(TokenCrypto::initialize());
    EXPECT_TRUE(TokenCrypto::initialize());
}

// ============================================================================
// Random Material Tests
// ============================================================================

TEST_F(TokenCryptoTest, GenerateRandomBytesSize) {
    EXPECT_EQ(TokenCrypto::generate_random_bytes(16).size(), 16u);
    EXPECT_EQ(TokenCrypto::generate_random_bytes(64).size(), 64u);
}

TEST_F(TokenCryptoTest, GenerateRandomBytesUniqueness) {
    auto bytes1 = TokenCrypto::generate_random_bytes(32);
    auto bytes2 = TokenCrypto::generate_random_bytes(32);

    EXPECT_NE(bytes1, bytes2);
}

TEST_F(TokenCryptoTest, GenerateTokenHexLengthAndAlphabet) {
    std::string token = TokenCrypto::generate_token_hex(16);

    // 16 bytes -> 32 lowercase hex characters
    ASSERT_EQ(token.size(), 32u);
    for (char c : token) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c)));
    }
}

TEST_F(TokenCryptoTest, GenerateTokenHexUniqueness) {
    std::set<std::string> tokens;
    for (int i = 0; i < 1000; ++i) {
        tokens.insert(TokenCrypto::generate_token_hex(16));
    }
    EXPECT_EQ(tokens.size(), 1000u);
}

// ============================================================================
// HMAC / Digest Tests
// ============================================================================

TEST_F(TokenCryptoTest, HmacSha256KnownVector) {
    // RFC 4231 test case 2
    EXPECT_EQ(
        TokenCrypto::hmac_sha256_hex("Jefe", "what do ya want for nothing?"),
        "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"
    );
}

TEST_F(TokenCryptoTest, HmacSha256KeyLongerThanBlock) {
    // RFC 4231 test case 6 (131-byte key)
    std::string key(131, static_cast<char>(0xaa));
    EXPECT_EQ(
        TokenCrypto::hmac_sha256_hex(key, "Test Using Larger Than Block-Size Key - Hash Key First"),
        "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54"
    );
}

TEST_F(TokenCryptoTest, HmacSha256TagSize) {
    HmacTag tag = TokenCrypto::hmac_sha256("key", "message");
    EXPECT_EQ(tag.size(), 32u);
    EXPECT_EQ(TokenCrypto::bytes_to_hex(tag.data(), tag.size()),
              TokenCrypto::hmac_sha256_hex("key", "message"));
}

TEST_F(TokenCryptoTest, HmacSha256DependsOnKey) {
    EXPECT_NE(TokenCrypto::hmac_sha256_hex("key-a", "payload"),
              TokenCrypto::hmac_sha256_hex("key-b", "payload"));
}

TEST_F(TokenCryptoTest, Sha256KnownVectors) {
    EXPECT_EQ(TokenCrypto::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(TokenCrypto::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// Constant-Time Comparison Tests
// ============================================================================

TEST_F(TokenCryptoTest, ConstantTimeCompareEqual) {
    std::vector<uint8_t> a = {1, 2, 3, 4, 5};
    std::vector<uint8_t> b = {1, 2, 3, 4, 5};

    EXPECT_TRUE(TokenCrypto::constant_time_compare(a, b));
}

TEST_F(TokenCryptoTest, ConstantTimeCompareNotEqual) {
    std::vector<uint8_t> a = {1, 2, 3, 4, 5};
    std::vector<uint8_t> b = {1, 2, 3, 4, 6};

    EXPECT_FALSE(TokenCrypto::constant_time_compare(a, b));
}

TEST_F(TokenCryptoTest, ConstantTimeCompareDifferentSizes) {
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {1, 2, 3, 4};

    EXPECT_FALSE(TokenCrypto::constant_time_compare(a, b));
}

TEST_F(TokenCryptoTest, ConstantTimeCompareEmpty) {
    std::vector<uint8_t> a;
    std::vector<uint8_t> b;

    EXPECT_TRUE(TokenCrypto::constant_time_compare(a, b));
    EXPECT_TRUE(TokenCrypto::constant_time_compare(std::string(), std::string()));
}

TEST_F(TokenCryptoTest, ConstantTimeCompareStrings) {
    EXPECT_TRUE(TokenCrypto::constant_time_compare(std::string("0123abcd"), std::string("0123abcd")));
    EXPECT_FALSE(TokenCrypto::constant_time_compare(std::string("0123abcd"), std::string("0123abce")));
    EXPECT_FALSE(TokenCrypto::constant_time_compare(std::string("0123abcd"), std::string("0123abc")));
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(TokenCryptoTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};

    EXPECT_EQ(TokenCrypto::bytes_to_hex(bytes), "0123456789abcdef");
}

TEST_F(TokenCryptoTest, HexToBytes) {
    auto bytes = TokenCrypto::hex_to_bytes("0123456789ABCDEF");

    ASSERT_TRUE(bytes.has_value());
    std::vector<uint8_t> expected = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
    EXPECT_EQ(*bytes, expected);
}

TEST_F(TokenCryptoTest, HexInvalidCharacters) {
    EXPECT_FALSE(TokenCrypto::hex_to_bytes("0123456789GGGGGG").has_value());
}

TEST_F(TokenCryptoTest, HexOddLength) {
    EXPECT_FALSE(TokenCrypto::hex_to_bytes("012345f").has_value());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(TokenCryptoTest, ConcurrentTokenGeneration) {
    const int num_threads = 8;
    const int tokens_per_thread = 200;
    std::vector<std::vector<std::string>> results(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&results, t]() {
            for (int i = 0; i < tokens_per_thread; ++i) {
                results[t].push_back(TokenCrypto::generate_token_hex(16));
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> unique;
    for (const auto& batch : results) {
        unique.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(num_threads * tokens_per_thread));
}

// ============================================================================
// Security Tests
// ============================================================================

TEST_F(TokenCryptoTest, SecureZeroMemory) {
    std::vector<uint8_t> sensitive_data(32, 0xFF);

    TokenCrypto::secure_zero(sensitive_data.data(), sensitive_data.size());

    EXPECT_TRUE(std::all_of(sensitive_data.begin(), sensitive_data.end(),
                            [](uint8_t b) { return b == 0; }));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
