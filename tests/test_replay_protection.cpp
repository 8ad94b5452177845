/**
 * @file test_replay_protection.cpp
 * @brief Unit tests for TokenReplayCache
 *
 * Tests single-use token enforcement including:
 * - Token fingerprinting (SHA-256)
 * - Replay detection and entry expiry
 * - Cache management and cleanup
 * - Thread safety (exactly one concurrent consumer wins)
 */

#include <gtest/gtest.h>
#include "csrfguard/replay_protection.hpp"
#include "csrfguard/token_crypto.hpp"
#include <atomic>
#include <cctype>
#include <thread>
#include <vector>

using namespace csrfguard;

// Test fixture for replay cache tests
class ReplayProtectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(TokenCrypto::initialize());
        cache_ = std::make_unique<TokenReplayCache>();
    }

    void TearDown() override {
        cache_.reset();
    }

    std::unique_ptr<TokenReplayCache> cache_;

    static constexpr double NOW = 1700000000.0;
    static constexpr double LIFETIME = 300.0;
};

// ============================================================================
// Fingerprint Tests
// ============================================================================

TEST_F(ReplayProtectionTest, FingerprintIsSha256Hex) {
    std::string fingerprint = TokenReplayCache::fingerprint("a1b2c3d4e5f60718293a4b5c6d7e8f90");

    EXPECT_EQ(fingerprint.length(), 64u);
    for (char c : fingerprint) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
}

TEST_F(ReplayProtectionTest, FingerprintDeterministic) {
    EXPECT_EQ(TokenReplayCache::fingerprint("token"), TokenReplayCache::fingerprint("token"));
    EXPECT_NE(TokenReplayCache::fingerprint("token1"), TokenReplayCache::fingerprint("token2"));
}

TEST_F(ReplayProtectionTest, FingerprintDoesNotContainToken) {
    std::string token = "deadbeefdeadbeefdeadbeefdeadbeef";
    EXPECT_EQ(TokenReplayCache::fingerprint(token).find(token), std::string::npos);
}

// ============================================================================
// Replay Detection Tests
// ============================================================================

TEST_F(ReplayProtectionTest, FirstUseAccepted) {
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
    EXPECT_EQ(cache_->get_cache_size(), 1u);
}

TEST_F(ReplayProtectionTest, SecondUseRejected) {
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
    EXPECT_FALSE(cache_->check_and_record("token-1", NOW + 1.0, LIFETIME));
}

TEST_F(ReplayProtectionTest, DifferentTokensIndependent) {
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
    EXPECT_TRUE(cache_->check_and_record("token-2", NOW, LIFETIME));
    EXPECT_TRUE(cache_->check_and_record("token-3", NOW, LIFETIME));
    EXPECT_EQ(cache_->get_cache_size(), 3u);
}

TEST_F(ReplayProtectionTest, ReplayRejectedAtExpiryInstant) {
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));

    // Entry expires at NOW + LIFETIME; only strictly later times purge it
    EXPECT_FALSE(cache_->check_and_record("token-1", NOW + LIFETIME, LIFETIME));
}

TEST_F(ReplayProtectionTest, AcceptedAgainAfterEntryExpires) {
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW + LIFETIME + 1.0, LIFETIME));
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST_F(ReplayProtectionTest, HasSeenNotSeen) {
    EXPECT_FALSE(cache_->has_seen("token-1", NOW));
}

TEST_F(ReplayProtectionTest, HasSeenAfterRecord) {
    cache_->check_and_record("token-1", NOW, LIFETIME);
    EXPECT_TRUE(cache_->has_seen("token-1", NOW + 10.0));
    EXPECT_FALSE(cache_->has_seen("token-1", NOW + LIFETIME + 10.0));
}

TEST_F(ReplayProtectionTest, HasSeenDoesNotModifyCache) {
    EXPECT_FALSE(cache_->has_seen("token-1", NOW));
    EXPECT_EQ(cache_->get_cache_size(), 0u);

    // Still accepted on first real use
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
}

// ============================================================================
// Cache Management Tests
// ============================================================================

TEST_F(ReplayProtectionTest, CleanupExpiredEntries) {
    cache_->check_and_record("short", NOW, 10.0);
    cache_->check_and_record("long", NOW, LIFETIME);
    EXPECT_EQ(cache_->get_cache_size(), 2u);

    EXPECT_EQ(cache_->cleanup_expired(NOW + 20.0), 1u);
    EXPECT_EQ(cache_->get_cache_size(), 1u);
    EXPECT_TRUE(cache_->has_seen("long", NOW + 20.0));
}

TEST_F(ReplayProtectionTest, RecordingPurgesExpiredEntries) {
    cache_->check_and_record("old", NOW, 10.0);
    cache_->check_and_record("new", NOW + 100.0, LIFETIME);

    EXPECT_EQ(cache_->get_cache_size(), 1u);
}

TEST_F(ReplayProtectionTest, ClearAndReuse) {
    cache_->check_and_record("token-1", NOW, LIFETIME);
    cache_->clear();

    EXPECT_EQ(cache_->get_cache_size(), 0u);
    EXPECT_TRUE(cache_->check_and_record("token-1", NOW, LIFETIME));
}

TEST_F(ReplayProtectionTest, LargeNumberOfTokens) {
    for (int i = 0; i < 10000; ++i) {
        EXPECT_TRUE(cache_->check_and_record("token-" + std::to_string(i), NOW, LIFETIME));
    }
    EXPECT_EQ(cache_->get_cache_size(), 10000u);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(ReplayProtectionTest, ConcurrentReplayDetection) {
    const int num_threads = 16;
    std::vector<std::thread> threads;
    std::atomic<int> success_count{0};

    // All threads try to consume the same token
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, &success_count]() {
            if (cache_->check_and_record("shared-token", NOW, LIFETIME)) {
                success_count++;
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(success_count.load(), 1);
}

TEST_F(ReplayProtectionTest, ConcurrentDistinctTokens) {
    const int num_threads = 8;
    const int tokens_per_thread = 250;
    std::vector<std::thread> threads;
    std::atomic<int> success_count{0};

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, &success_count, t]() {
            for (int i = 0; i < tokens_per_thread; ++i) {
                std::string token = std::to_string(t) + ":" + std::to_string(i);
                if (cache_->check_and_record(token, NOW, LIFETIME)) {
                    success_count++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(success_count.load(), num_threads * tokens_per_thread);
    EXPECT_EQ(cache_->get_cache_size(), static_cast<size_t>(num_threads * tokens_per_thread));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
