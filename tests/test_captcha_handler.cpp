#include <gtest/gtest.h>
#include "handlers/captcha_handler.hpp"
#include "handlers/health_handler.hpp"
#include "metrics.hpp"

using namespace captcha;

namespace {

class CaptchaHandlerTest : public ::testing::Test {
protected:
    CaptchaHandlerTest()
        : challenge_config_(ChallengeConfig::parse(
              R"({"image": {"width": 150, "height": 40}, "debug": true})"))
        , codec_("handler-secret")
        , challenges_(renderer_, codec_)
        , verifier_(codec_)
        , handler_(config_, challenge_config_, challenges_, verifier_) {}

    // Issues a challenge and returns the token from Set-Cookie.
    std::string issue_token() {
        http::request<http::string_body> req{http::verb::get, "/captcha", 11};
        auto res = handler_.handle_create(req, "127.0.0.1");
        std::string cookie(res[http::field::set_cookie]);
        auto eq = cookie.find('=');
        auto semi = cookie.find(';');
        return cookie.substr(eq + 1, semi - eq - 1);
    }

    bool post_verify(const std::string& cookie, const std::string& body, const std::string& target = "/verify") {
        http::request<http::string_body> req{http::verb::post, target, 11};
        if (!cookie.empty()) {
            req.set(http::field::cookie, cookie);
        }
        req.set(http::field::content_type, "application/x-www-form-urlencoded");
        req.body() = body;
        req.prepare_payload();

        auto res = handler_.handle_verify(req, "127.0.0.1");
        EXPECT_EQ(res.result(), http::status::ok);
        return boost::json::parse(res.body()).as_object().at("valid").as_bool();
    }

    ServerConfig config_;
    ChallengeConfig challenge_config_;
    RasterRenderer renderer_;
    CommitmentCodec codec_;
    ChallengeService challenges_;
    VerificationService verifier_;
    CaptchaHandler handler_;
};

}

TEST_F(CaptchaHandlerTest, CreateReturnsImageAndCookie) {
    http::request<http::string_body> req{http::verb::get, "/captcha", 11};
    auto res = handler_.handle_create(req, "127.0.0.1");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "image/png");
    EXPECT_EQ(res.body().substr(1, 3), "PNG");

    std::string cookie(res[http::field::set_cookie]);
    EXPECT_EQ(cookie.rfind("hash=", 0), 0u);
    EXPECT_NE(cookie.find("HttpOnly"), std::string::npos);
    EXPECT_EQ(cookie.find("Secure"), std::string::npos);
    EXPECT_NE(std::string(res[http::field::cache_control]).find("no-store"), std::string::npos);
}

TEST_F(CaptchaHandlerTest, SecureCookieWithTls) {
    config_.enable_tls = true;
    http::request<http::string_body> req{http::verb::get, "/captcha", 11};
    auto res = handler_.handle_create(req, "127.0.0.1");
    EXPECT_NE(std::string(res[http::field::set_cookie]).find("; Secure"), std::string::npos);
}

TEST_F(CaptchaHandlerTest, VerifyRoundTrip) {
    std::string token = issue_token();
    ASSERT_EQ(token.size(), CommitmentCodec::TOKEN_LENGTH);

    EXPECT_TRUE(post_verify("hash=" + token, "verify=ABC123"));
    EXPECT_TRUE(post_verify("theme=dark; hash=" + token, "x=1&verify=ABC123"));
    EXPECT_FALSE(post_verify("hash=" + token, "verify=abc123"));
    EXPECT_FALSE(post_verify("hash=" + token, "verify="));
}

TEST_F(CaptchaHandlerTest, VerifyFromQueryString) {
    std::string token = issue_token();
    EXPECT_TRUE(post_verify("hash=" + token, "", "/verify?verify=ABC123"));
}

TEST_F(CaptchaHandlerTest, MissingCookieFails) {
    EXPECT_FALSE(post_verify("", "verify=ABC123"));
    EXPECT_FALSE(post_verify("other=1", "verify=ABC123"));
}

TEST_F(CaptchaHandlerTest, BadConfigIsServerError) {
    ChallengeConfig broken = ChallengeConfig::parse(
        R"({"image": {"width": 150, "height": 40}, "renderCreateOptions": ["normal", "spiral"]})");
    CaptchaHandler handler(config_, broken, challenges_, verifier_);

    http::request<http::string_body> req{http::verb::get, "/captcha", 11};
    auto res = handler.handle_create(req, "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.count(http::field::set_cookie), 0u);
}

TEST(HealthHandlerTest, AdminToken) {
    ServerConfig config;
    HealthHandler handler(config);

    http::request<http::string_body> req{http::verb::get, "/metrics", 11};
    req.set("X-Admin-Token", "s3cret");
    EXPECT_FALSE(handler.verify_admin_request(req));

    config.admin_token = "s3cret";
    EXPECT_TRUE(handler.verify_admin_request(req));

    req.set("X-Admin-Token", "s3creT");
    EXPECT_FALSE(handler.verify_admin_request(req));
}

TEST(HealthHandlerTest, MetricsExposition) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().increment_counter("captcha_challenges_issued");

    ServerConfig config;
    HealthHandler handler(config);
    auto res = handler.handle_metrics(11);
    EXPECT_NE(res.body().find("captcha_challenges_issued 1"), std::string::npos);

    auto health = handler.handle_health(11);
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(boost::json::parse(health.body()).as_object().at("status").as_string(), "healthy");
}
