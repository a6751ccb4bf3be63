#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "captcha_config.hpp"
#include "captcha_errors.hpp"
#include "commitment_codec.hpp"
#include "image_renderer.hpp"
#include "challenge_service.hpp"
#include "verification_service.hpp"
#include "handlers/captcha_handler.hpp"
#include "http_session.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace captcha {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        CaptchaHandler& captcha_handler
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , captcha_handler_(captcha_handler)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    CaptchaHandler& captcha_handler_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED,
                                "internal", "Accept error: " + ec.message());
        } else if (config_.enable_tls) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(
                beast::tcp_stream(std::move(socket)),
                ssl_ctx_
            );
            std::make_shared<HttpSession>(std::move(stream), config_, captcha_handler_)->run();
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)), config_, captcha_handler_)->run();
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

namespace {

uint16_t parse_port(const std::string& value) {
    int port = std::stoi(value);
    if (port <= 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

}

int main(int argc, char* argv[]) {
    using captcha::SecurityLogger;
    try {
        captcha::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                config.config_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls, -t           Enable TLS (CAPTCHA_TLS_CERT / CAPTCHA_TLS_KEY)\n"
                          << "  --config, -c FILE   Challenge configuration (JSON)\n"
                          << "  --help, -h          Show this help\n";
                return 0;
            } else {
                try {
                    config.port = parse_port(arg);
                } catch (const std::exception&) {
                    std::cerr << "[!] Invalid argument: " << arg << "\n";
                    return 1;
                }
            }
        }

        // --- Environment Variable Overrides ---

        if (const char* env_port = std::getenv("CAPTCHA_PORT")) {
            config.port = parse_port(env_port);
        }
        if (const char* env_addr = std::getenv("CAPTCHA_ADDR")) {
            config.address = env_addr;
        }
        if (const char* env_config = std::getenv("CAPTCHA_CONFIG_PATH")) {
            config.config_path = env_config;
        }
        if (const char* env_secret = std::getenv("CAPTCHA_SECRET")) {
            config.commitment_secret = env_secret;
        }
        if (const char* env_admin = std::getenv("CAPTCHA_ADMIN_TOKEN")) {
            config.admin_token = env_admin;
        }
        if (const char* env_threads = std::getenv("CAPTCHA_THREADS")) {
            config.thread_count = std::stoi(env_threads);
        }
        if (const char* env_cert = std::getenv("CAPTCHA_TLS_CERT")) {
            config.cert_path = env_cert;
        }
        if (const char* env_key = std::getenv("CAPTCHA_TLS_KEY")) {
            config.key_path = env_key;
        }
        if (const char* env_origins = std::getenv("CAPTCHA_ALLOWED_ORIGINS")) {
            config.allowed_origins.clear();
            std::string origins_str(env_origins);
            size_t pos = 0;
            while ((pos = origins_str.find(',')) != std::string::npos) {
                config.allowed_origins.push_back(origins_str.substr(0, pos));
                origins_str.erase(0, pos + 1);
            }
            if (!origins_str.empty()) {
                config.allowed_origins.push_back(origins_str);
            }
        }

        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", "No CORS origins configured");
        }

        if (config.commitment_secret.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", "CAPTCHA_SECRET not set, tokens can be forged by clients");
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        // --- Challenge configuration ---
        captcha::ChallengeConfig challenge_config;
        captcha::RasterRenderer renderer;
        try {
            challenge_config = config.config_path.empty()
                ? captcha::ChallengeConfig::defaults()
                : captcha::ChallengeConfig::load_file(config.config_path);
            renderer.validate(challenge_config);
        } catch (const captcha::ConfigError& e) {
            SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", e.what());
            return 1;
        } catch (const captcha::RenderConfigError& e) {
            SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", e.what());
            return 1;
        }

        if (challenge_config.debug()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", "Debug mode enabled, every challenge is ABC123");
        }

        if (config.enable_tls) {
            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set CAPTCHA_TLS_CERT / CAPTCHA_TLS_KEY or run without --tls.\n";
                return 1;
            }
        }

        std::cout << "CAPTCHAGATE CHALLENGE SERVER v1.0\n"
                  << "  listening on " << config.address << ":" << config.port
                  << (config.enable_tls ? " (TLS 1.2+)" : " (plaintext)") << "\n\n";

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        captcha::CommitmentCodec codec(config.commitment_secret);
        captcha::ChallengeService challenges(renderer, codec);
        captcha::VerificationService verifier(codec);
        captcha::CaptchaHandler captcha_handler(config, challenge_config, challenges, verifier);

        auto listener = std::make_shared<captcha::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            captcha_handler
        );
        listener->run();

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CONNECTION_REJECTED,
                                    "internal", "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
