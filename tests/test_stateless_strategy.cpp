/**
 * @file test_stateless_strategy.cpp
 * @brief Unit tests for StatelessStrategy
 *
 * Tests signed timestamp tokens including:
 * - Token layout and signature payload
 * - Origin binding
 * - Tampering and malformed tokens
 * - Lifetime and future-timestamp checks
 */

#include <gtest/gtest.h>
#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/stateless_strategy.hpp"
#include "csrfguard/token_crypto.hpp"
#include <memory>

using namespace csrfguard;

// Test fixture with a manually advanced clock
class StatelessStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<double>(START);

        security::ProtectorConfig config;
        config.secret_key = SECRET;
        config.strategy = StatelessStrategy::NAME;
        config.token_lifetime_seconds = 300.0;
        auto clock = clock_;
        config.time_source = [clock]() { return *clock; };

        protector_ = std::make_unique<CsrfProtector>(config);
    }

    void advance_to(double t) { *clock_ = t; }

    std::string issue(const std::optional<std::string>& origin = std::string(ORIGIN)) {
        BasicRequest page("GET", origin);
        return strategy_.generate(page, *protector_).token;
    }

    StrategyVerdict check(const std::string& token,
                          const std::optional<std::string>& origin = std::string(ORIGIN)) {
        BasicRequest request("POST", origin);
        request.headers["X-CSRF-Token"] = token;
        return strategy_.validate(request, std::nullopt, *protector_);
    }

    static constexpr double START = 1700000000.0;
    static constexpr const char* SECRET = "stateless-test-secret";
    static constexpr const char* ORIGIN = "https://app.example.com";

    std::shared_ptr<double> clock_;
    std::unique_ptr<CsrfProtector> protector_;
    StatelessStrategy strategy_;
};

// ============================================================================
// Generation Tests
// ============================================================================

TEST_F(StatelessStrategyTest, TokenLayout) {
    std::string token = issue();

    // hex(1700000000) = 6553f100
    auto separator = token.find('.');
    ASSERT_NE(separator, std::string::npos);
    EXPECT_EQ(token.substr(0, separator), "6553f100");
    EXPECT_EQ(token.substr(separator + 1), StatelessStrategy::sign(SECRET, 1700000000, ORIGIN));
    EXPECT_EQ(token.size(), 8u + 1u + 64u);
}

TEST_F(StatelessStrategyTest, SignatureCoversTimestampAndOrigin) {
    EXPECT_EQ(StatelessStrategy::sign(SECRET, 1700000000, ORIGIN),
              TokenCrypto::hmac_sha256_hex(SECRET, "1700000000:https://app.example.com"));
    EXPECT_EQ(StatelessStrategy::sign(SECRET, 1700000000, ""),
              TokenCrypto::hmac_sha256_hex(SECRET, "1700000000:"));
}

TEST_F(StatelessStrategyTest, FractionalClockTruncated) {
    advance_to(START + 0.9);
    std::string token = issue();
    EXPECT_EQ(token.substr(0, token.find('.')), "6553f100");
}

TEST_F(StatelessStrategyTest, MetadataReportsOriginBinding) {
    BasicRequest bound("GET", std::string(ORIGIN));
    BasicRequest unbound("GET");

    auto bound_meta = strategy_.generate(bound, *protector_).metadata;
    auto unbound_meta = strategy_.generate(unbound, *protector_).metadata;

    EXPECT_EQ(bound_meta["strategy"], "stateless");
    EXPECT_EQ(bound_meta["origin_bound"], true);
    EXPECT_EQ(unbound_meta["origin_bound"], false);
    EXPECT_EQ(bound_meta["expires_at"], "2023-11-14T22:18:20Z");
}

TEST_F(StatelessStrategyTest, GenerateLeavesSessionUntouched) {
    BasicRequest page("GET", std::string(ORIGIN));
    strategy_.generate(page, *protector_);
    EXPECT_TRUE(page.session_record.empty());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(StatelessStrategyTest, ValidTokenAccepted) {
    std::string token = issue();

    advance_to(START + 30.0);
    StrategyVerdict verdict = check(token);

    EXPECT_TRUE(verdict.valid);
    EXPECT_DOUBLE_EQ(verdict.age_seconds, 30.0);
    EXPECT_EQ(verdict.extra["strategy"], "stateless");
}

TEST_F(StatelessStrategyTest, AcceptedAtLifetimeBoundary) {
    std::string token = issue();

    advance_to(START + 300.0);
    EXPECT_TRUE(check(token).valid);
}

TEST_F(StatelessStrategyTest, ExpiredTokenRejected) {
    std::string token = issue();

    advance_to(START + 301.0);
    StrategyVerdict verdict = check(token);

    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.error->kind, CsrfErrorKind::TOKEN_EXPIRED);
    EXPECT_DOUBLE_EQ(verdict.age_seconds, 301.0);
    EXPECT_EQ(verdict.extra["expired_at"], "2023-11-14T22:18:20Z");
}

TEST_F(StatelessStrategyTest, FutureTimestampRejected) {
    std::string token = issue();

    advance_to(START - 10.0);
    StrategyVerdict verdict = check(token);

    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.error->message(), "Token timestamp in future");
}

TEST_F(StatelessStrategyTest, DifferentOriginRejected) {
    std::string token = issue();

    StrategyVerdict verdict = check(token, std::string("https://evil.example.net"));

    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.error->kind, CsrfErrorKind::TOKEN_MISMATCH);
    EXPECT_EQ(verdict.error->message(), "Signature mismatch");
    EXPECT_EQ(verdict.extra["origin"], "https://evil.example.net");
}

TEST_F(StatelessStrategyTest, UnboundTokenValidWithoutOrigin) {
    std::string token = issue(std::nullopt);
    EXPECT_TRUE(check(token, std::nullopt).valid);
}

TEST_F(StatelessStrategyTest, TamperedSignatureRejected) {
    std::string token = issue();
    size_t separator = token.find('.');
    ASSERT_NE(separator, std::string::npos);

    for (size_t i = separator + 1; i < token.size(); ++i) {
        std::string tampered = token;
        tampered[i] = tampered[i] == '0' ? '1' : '0';

        StrategyVerdict verdict = check(tampered);

        EXPECT_FALSE(verdict.valid) << "index " << i;
        ASSERT_TRUE(verdict.error.has_value()) << "index " << i;
        EXPECT_EQ(verdict.error->kind, CsrfErrorKind::TOKEN_MISMATCH) << "index " << i;
        EXPECT_EQ(verdict.error->message(), "Signature mismatch") << "index " << i;
    }
}

TEST_F(StatelessStrategyTest, TamperedTimestampRejected) {
    std::string token = issue();
    token[0] = '7';

    EXPECT_EQ(check(token).error->message(), "Signature mismatch");
}

TEST_F(StatelessStrategyTest, WrongSecretRejected) {
    std::string forged = "6553f100." + StatelessStrategy::sign("other-secret", 1700000000, ORIGIN);
    EXPECT_EQ(check(forged).error->message(), "Signature mismatch");
}

TEST_F(StatelessStrategyTest, MalformedTokensRejected) {
    EXPECT_EQ(check("no-separator").error->message(), "Bad token format");
    EXPECT_EQ(check("a.b.c").error->message(), "Bad token format");
    EXPECT_EQ(check("zz.abcdef").error->message(), "Invalid timestamp");
    EXPECT_EQ(check(".abcdef").error->message(), "Invalid timestamp");
    EXPECT_EQ(check("11111111111111111.abcdef").error->message(), "Invalid timestamp");
}

TEST_F(StatelessStrategyTest, NonCanonicalTimestampRejected) {
    std::string token = issue();
    ASSERT_EQ(token.substr(0, 9), "6553f100.");
    ASSERT_TRUE(check(token).valid);

    // Same numeric value, same signature, different text
    std::string signature = token.substr(9);
    for (const std::string& prefix : {std::string("06553f100"), std::string("006553f100"),
                                      std::string("6553F100")}) {
        StrategyVerdict verdict = check(prefix + "." + signature);

        EXPECT_FALSE(verdict.valid) << prefix;
        ASSERT_TRUE(verdict.error.has_value()) << prefix;
        EXPECT_EQ(verdict.error->kind, CsrfErrorKind::TOKEN_MISMATCH) << prefix;
        EXPECT_EQ(verdict.error->message(), "Invalid timestamp") << prefix;
    }
}

TEST_F(StatelessStrategyTest, MissingTokenRejected) {
    BasicRequest request("POST", std::string(ORIGIN));
    StrategyVerdict verdict = strategy_.validate(request, std::nullopt, *protector_);

    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.error->kind, CsrfErrorKind::MISSING_TOKEN);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
