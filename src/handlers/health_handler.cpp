#include "handlers/health_handler.hpp"
#include <openssl/crypto.h>

namespace captcha {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["storage"] = "none";
    response["message"] = "Stateless challenges - no pending challenge table";
    response["tls"] = config_.enable_tls;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) {
    // If no token is configured, admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    return provided_token.size() == config_.admin_token.size() &&
           CRYPTO_memcmp(provided_token.data(), config_.admin_token.data(), provided_token.size()) == 0;
}

} // namespace captcha
