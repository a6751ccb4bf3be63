#include "http_session.hpp"
#include "cors_policy.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>
#include <iostream>

namespace json = boost::json;

namespace captcha {

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    CaptchaHandler& captcha_handler
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , health_handler_(config)
    , captcha_handler_(captcha_handler)
{
    beast::error_code ec;
    auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
    MetricsRegistry::instance().increment_gauge("active_sessions");
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    CaptchaHandler& captcha_handler
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , health_handler_(config)
    , captcha_handler_(captcha_handler)
{
    beast::error_code ec;
    auto& s = std::get<beast::tcp_stream>(stream_);
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
    MetricsRegistry::instance().increment_gauge("active_sessions");
}

HttpSession::~HttpSession() {
    MetricsRegistry::instance().decrement_gauge("active_sessions");
}

// Starts the asynchronous session activity
void HttpSession::run() {
    if (is_tls_) {
        // Perform SSL/TLS handshake before processing HTTP requests
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure to prevent resource exhaustion from scanners
        return;
    }
    do_read();
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Enforce request timeout to prevent slow-loris attacks
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(
            std::chrono::seconds(config_.request_timeout_sec));
    } else {
        beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).expires_after(
            std::chrono::seconds(config_.request_timeout_sec));
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t  ) {
    if (ec == http::error::end_of_stream) {
        return;
    }
    if (ec == http::error::body_limit) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr_, "Request body exceeds size limit");
        return;
    }
    if (ec) {
        return;
    }

    req_ = parser_->release();
    MetricsRegistry::instance().increment_counter("http_requests_total");

    handle_request();
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    auto method = req_.method();

    // Handle CORS Preflight
    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---

    if (path == "/captcha" && method == http::verb::get) {
        auto res = captcha_handler_.handle_create(req_, remote_addr_);
        add_cors_headers(res);
        send_response(std::move(res));
    } else if (path == "/verify" && method == http::verb::post) {
        auto res = captcha_handler_.handle_verify(req_, remote_addr_);
        add_cors_headers(res);
        send_response(std::move(res));

    // Health Checks & Metrics
    } else if (path == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
    } else if (path == "/metrics" && method == http::verb::get) {
        if (is_local_client() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }

    } else {
        send_response(handle_not_found());
    }
}

bool HttpSession::is_local_client() const {
    return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1";
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    add_cors_headers(res);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "CaptchaGate/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");

    if (config_.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

// Credentials are only allowed for explicitly configured origins.
template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    if (!config_.allowed_origins.empty() && !origin.empty()) {
        CorsDecision decision = CorsPolicy::evaluate(config_.allowed_origins, origin);
        if (decision.allowed) {
            res.set(http::field::access_control_allow_origin, decision.allow_origin);
            if (decision.allow_credentials) {
                res.set(http::field::access_control_allow_credentials, "true");
            }
        } else {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SUSPICIOUS_ACTIVITY,
                               remote_addr_, "Disallowed origin: " + origin);
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type,X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    if (!res.count(http::field::server)) {
        add_security_headers(res);
    }

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t  ) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        if (is_tls_) {
            beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        } else {
            beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        }
        return;
    }

    do_read();
}

}
