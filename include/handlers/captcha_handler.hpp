#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "server_config.hpp"
#include "captcha_config.hpp"
#include "challenge_service.hpp"
#include "verification_service.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace captcha {

// HTTP transport for the challenge lifecycle: the token travels in a cookie,
// the answer in a form field.
class CaptchaHandler {
public:
    CaptchaHandler(const ServerConfig& config,
                   const ChallengeConfig& challenge_config,
                   const ChallengeService& challenges,
                   const VerificationService& verifier)
        : config_(config)
        , challenge_config_(challenge_config)
        , challenges_(challenges)
        , verifier_(verifier) {}

    // GET /captcha: image body plus Set-Cookie carrying the commitment token.
    http::response<http::string_body> handle_create(const http::request<http::string_body>& req, const std::string& remote_addr);

    // POST /verify: {"valid": bool}. Always 200, a failed check is not an error.
    http::response<http::string_body> handle_verify(const http::request<http::string_body>& req, const std::string& remote_addr);

private:
    const ServerConfig& config_;
    const ChallengeConfig& challenge_config_;
    const ChallengeService& challenges_;
    const VerificationService& verifier_;

    std::string read_answer(const http::request<http::string_body>& req) const;
    std::string read_token(const http::request<http::string_body>& req) const;

    http::response<http::string_body> error_response(http::status status, const std::string& message, unsigned version);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
    }
};

}
