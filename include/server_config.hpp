#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace captcha {

// Reference HTTP host configuration.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Request Limits ---
    size_t max_message_size = 16 * 1024;  // 16KB, answers are tiny
    int request_timeout_sec = 30;

    // --- Challenge ---
    std::string config_path = "";           // empty uses ChallengeConfig::defaults()
    std::string commitment_secret = "";     // mixed into every token digest; set via CAPTCHA_SECRET
    std::string cookie_name = "hash";
    std::string answer_field = "verify";

    // --- Administration ---
    std::string admin_token = "";  // Used for privileged metrics access

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};
};

}
