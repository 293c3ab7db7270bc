/**
 * Tests for peer message authentication: constant-time comparison, HMAC
 * signing, the timestamp window and nonce replay protection.
 */

#include "security/message_auth.h"
#include <gtest/gtest.h>
#include <chrono>
#include <set>

using namespace hacluster;
using namespace hacluster::security;

namespace {

const std::string SECRET = "cluster-secret";
const std::string BODY = R"({"event":"new_main","new_main_ip":"10.0.0.2"})";

common::Timestamp at_millis(int64_t millis) { return common::from_unix_millis(millis); }

} // namespace

TEST(SecureCompareTest, MatchesOnlyIdenticalStrings) {
    EXPECT_TRUE(secure_compare("abc", "abc"));
    EXPECT_TRUE(secure_compare("", ""));
    EXPECT_FALSE(secure_compare("abc", "abd"));
    EXPECT_FALSE(secure_compare("abc", "abcd"));
    EXPECT_FALSE(secure_compare("secret", ""));
}

TEST(HmacTest, MatchesRfc4231Vector) {
    EXPECT_EQ(hmac_sha256_hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(NonceTest, NoncesAreHexAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string nonce;
        ASSERT_TRUE(generate_nonce(nonce).is_ok());
        EXPECT_EQ(nonce.size(), 32u);
        EXPECT_EQ(nonce.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(nonce);
    }
    EXPECT_EQ(seen.size(), 50u);
}

class MessageAuthenticatorTest : public ::testing::Test {
protected:
    MessageAuthenticator auth{300};
    const int64_t now_ms = 1700000000000;

    std::map<std::string, std::string> sign_at(int64_t millis) {
        auto headers = auth.sign(SECRET, BODY, at_millis(millis));
        EXPECT_TRUE(headers.is_ok());
        return headers.value();
    }

    Result<bool> verify(const std::map<std::string, std::string>& headers,
                        const std::string& secret, const std::string& body,
                        int64_t millis) {
        return auth.verify(secret, body, headers.at(TIMESTAMP_HEADER),
                           headers.at(NONCE_HEADER), headers.at(SIGNATURE_HEADER),
                           at_millis(millis));
    }
};

TEST_F(MessageAuthenticatorTest, AcceptsFreshSignature) {
    auto headers = sign_at(now_ms);
    auto verified = verify(headers, SECRET, BODY, now_ms + 1000);
    EXPECT_TRUE(verified.is_ok()) << verified.error();
    EXPECT_EQ(auth.cached_nonce_count(), 1u);
}

TEST_F(MessageAuthenticatorTest, RejectsReplayedNonce) {
    auto headers = sign_at(now_ms);
    ASSERT_TRUE(verify(headers, SECRET, BODY, now_ms).is_ok());

    auto replayed = verify(headers, SECRET, BODY, now_ms + 5000);
    ASSERT_TRUE(replayed.is_err());
    EXPECT_EQ(replayed.error(), "replayed message nonce");
}

TEST_F(MessageAuthenticatorTest, RejectsTamperedBodyAndWrongSecret) {
    auto headers = sign_at(now_ms);
    EXPECT_TRUE(verify(headers, SECRET, BODY + " ", now_ms).is_err());
    EXPECT_TRUE(verify(headers, "other-secret", BODY, now_ms).is_err());
    // Failed verifications do not burn the nonce
    EXPECT_TRUE(verify(headers, SECRET, BODY, now_ms).is_ok());
}

TEST_F(MessageAuthenticatorTest, RejectsTimestampsOutsideWindow) {
    auto old_headers = sign_at(now_ms - 301 * 1000);
    auto stale = verify(old_headers, SECRET, BODY, now_ms);
    ASSERT_TRUE(stale.is_err());
    EXPECT_EQ(stale.error(), "signature timestamp outside accepted window");

    auto future_headers = sign_at(now_ms + 301 * 1000);
    EXPECT_TRUE(verify(future_headers, SECRET, BODY, now_ms).is_err());
}

TEST_F(MessageAuthenticatorTest, RejectsMissingOrMalformedHeaders) {
    auto missing = auth.verify(SECRET, BODY, "", "", "", at_millis(now_ms));
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error(), "missing signature headers");

    auto malformed = auth.verify(SECRET, BODY, "yesterday", "abc", "def", at_millis(now_ms));
    ASSERT_TRUE(malformed.is_err());
    EXPECT_EQ(malformed.error(), "malformed signature timestamp");
}

TEST(MessageAuthenticatorCacheTest, NonceCacheIsBounded) {
    MessageAuthenticator auth(300, 4);
    const int64_t now_ms = 1700000000000;
    for (int i = 0; i < 10; ++i) {
        auto headers = auth.sign(SECRET, BODY, common::from_unix_millis(now_ms + i));
        ASSERT_TRUE(headers.is_ok());
        ASSERT_TRUE(auth.verify(SECRET, BODY, headers.value().at(TIMESTAMP_HEADER),
                                headers.value().at(NONCE_HEADER),
                                headers.value().at(SIGNATURE_HEADER),
                                common::from_unix_millis(now_ms + i))
                        .is_ok());
    }
    EXPECT_LE(auth.cached_nonce_count(), 4u);
}

TEST(MessageAuthenticatorCacheTest, ExpiredNoncesArePruned) {
    MessageAuthenticator auth(1);
    const int64_t now_ms = 1700000000000;
    auto headers = auth.sign(SECRET, BODY, common::from_unix_millis(now_ms));
    ASSERT_TRUE(headers.is_ok());
    ASSERT_TRUE(auth.verify(SECRET, BODY, headers.value().at(TIMESTAMP_HEADER),
                            headers.value().at(NONCE_HEADER),
                            headers.value().at(SIGNATURE_HEADER),
                            common::from_unix_millis(now_ms))
                    .is_ok());
    EXPECT_EQ(auth.cached_nonce_count(), 1u);

    auto later = auth.sign(SECRET, BODY, common::from_unix_millis(now_ms + 5000));
    ASSERT_TRUE(later.is_ok());
    ASSERT_TRUE(auth.verify(SECRET, BODY, later.value().at(TIMESTAMP_HEADER),
                            later.value().at(NONCE_HEADER),
                            later.value().at(SIGNATURE_HEADER),
                            common::from_unix_millis(now_ms + 5000))
                    .is_ok());
    EXPECT_EQ(auth.cached_nonce_count(), 1u);
}
