#include "handlers/captcha_handler.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"
#include "captcha_errors.hpp"

namespace captcha {

http::response<http::string_body> CaptchaHandler::handle_create(const http::request<http::string_body>& req, const std::string& remote_addr) {
    ChallengeResult result;
    try {
        result = challenges_.create_challenge(challenge_config_, remote_addr);
    } catch (const ConfigError&) {
        return error_response(http::status::internal_server_error, "Challenge configuration error", req.version());
    } catch (const RenderConfigError&) {
        return error_response(http::status::internal_server_error, "Challenge rendering failed", req.version());
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::RENDER_ERROR,
                            remote_addr, std::string("Challenge creation failed: ") + e.what());
        return error_response(http::status::internal_server_error, "Challenge creation failed", req.version());
    }

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, result.mime_type);
    res.set(http::field::cache_control, "no-store, no-cache, must-revalidate");
    res.set(http::field::pragma, "no-cache");

    std::string cookie = config_.cookie_name + "=" + result.token + "; Path=/; HttpOnly; SameSite=Lax";
    if (config_.enable_tls) {
        cookie += "; Secure";
    }
    res.set(http::field::set_cookie, cookie);

    res.body().assign(result.image.begin(), result.image.end());
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> CaptchaHandler::handle_verify(const http::request<http::string_body>& req, const std::string& remote_addr) {
    std::string token = read_token(req);
    std::string answer = read_answer(req);

    bool valid = verifier_.verify_answer(token, answer, remote_addr);

    json::object response;
    response["valid"] = valid;

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

std::string CaptchaHandler::read_token(const http::request<http::string_body>& req) const {
    auto it = req.find(http::field::cookie);
    if (it == req.end()) {
        return "";
    }
    return InputValidator::sanitize_field(
        InputValidator::extract_cookie(std::string(it->value()), config_.cookie_name), 256);
}

// Answer comes from the url-encoded body, falling back to the query string.
std::string CaptchaHandler::read_answer(const http::request<http::string_body>& req) const {
    std::string answer = InputValidator::extract_form_field(req.body(), config_.answer_field);

    if (answer.empty()) {
        std::string target(req.target());
        auto q = target.find('?');
        if (q != std::string::npos) {
            answer = InputValidator::extract_form_field(target.substr(q + 1), config_.answer_field);
        }
    }

    return InputValidator::sanitize_field(answer, 256);
}

http::response<http::string_body> CaptchaHandler::error_response(http::status status, const std::string& message, unsigned version) {
    json::object error;
    error["error"] = message;

    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(error);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

}
