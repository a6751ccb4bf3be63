#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/captcha_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace captcha {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        CaptchaHandler& captcha_handler
    );

    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        CaptchaHandler& captcha_handler
    );

    ~HttpSession();

    void run();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;

    // Handlers
    HealthHandler health_handler_;
    CaptchaHandler& captcha_handler_;

    std::string remote_addr_;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    http::response<http::string_body> handle_cors_preflight();
    http::response<http::string_body> handle_not_found();

    bool is_local_client() const;

    template<class Body>
    void add_security_headers(http::response<Body>& res);

    template<class Body>
    void add_cors_headers(http::response<Body>& res);
};

}
