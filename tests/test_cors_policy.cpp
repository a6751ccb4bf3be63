#include <gtest/gtest.h>
#include "cors_policy.hpp"

using namespace captcha;

TEST(CorsPolicyTest, ExactMatchAllowsCredentials) {
    CorsDecision d = CorsPolicy::evaluate({"https://app.example.com"}, "https://app.example.com");
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.allow_origin, "https://app.example.com");
    EXPECT_TRUE(d.allow_credentials);
}

TEST(CorsPolicyTest, WildcardNeverSendsCredentials) {
    CorsDecision d = CorsPolicy::evaluate({"*"}, "https://evil.example.net");
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.allow_origin, "*");
    EXPECT_FALSE(d.allow_credentials);
}

TEST(CorsPolicyTest, ExactMatchWinsOverWildcard) {
    CorsDecision d = CorsPolicy::evaluate({"*", "https://app.example.com"}, "https://app.example.com");
    EXPECT_EQ(d.allow_origin, "https://app.example.com");
    EXPECT_TRUE(d.allow_credentials);
}

TEST(CorsPolicyTest, UnknownOriginRejected) {
    CorsDecision d = CorsPolicy::evaluate({"https://app.example.com"}, "https://app.example.com.evil.net");
    EXPECT_FALSE(d.allowed);
    EXPECT_TRUE(d.allow_origin.empty());
    EXPECT_FALSE(d.allow_credentials);

    EXPECT_FALSE(CorsPolicy::evaluate({"*"}, "").allowed);
    EXPECT_FALSE(CorsPolicy::evaluate({}, "https://app.example.com").allowed);
}
