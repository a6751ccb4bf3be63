#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <cctype>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace captcha {

// Logs challenge lifecycle and security events using blinded IP identifiers (salted hash).
// Challenge strings and tokens must never be passed in messages.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        CHALLENGE_ISSUED,
        VERIFY_SUCCESS,
        VERIFY_FAILURE,
        INVALID_INPUT,
        CONFIG_ERROR,
        RENDER_ERROR,
        SUSPICIOUS_ACTIVITY,
        CONNECTION_REJECTED
    };

    /**
     * Records an event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr The source IP address (will be blinded before logging).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        // The blinding salt is rotated every 6 hours so old IP-to-hash
        // mappings cannot be reversed with a later salt.
        std::string salt = current_salt(gmt);

        std::string hidden_ip = remote_addr;
        if (remote_addr != "unknown" && remote_addr != "internal") {
            std::string data = remote_addr + salt;
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

            std::stringstream hs;
            for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
            hidden_ip = "anon_" + hs.str();
        }
        ss << "ip=" << hidden_ip;

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CHALLENGE_ISSUED: return "CHALLENGE_ISSUED";
            case EventType::VERIFY_SUCCESS: return "VERIFY_SUCCESS";
            case EventType::VERIFY_FAILURE: return "VERIFY_FAILURE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CONFIG_ERROR: return "CONFIG_ERROR";
            case EventType::RENDER_ERROR: return "RENDER_ERROR";
            case EventType::SUSPICIOUS_ACTIVITY: return "SUSPICIOUS";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Replaces quotes, backslashes and line breaks and drops non-printable characters
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string current_salt(const struct tm& gmt) {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;

            std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] [INFO] [SECURITY] msg=\"IP blinding salt rotated for log forward secrecy\"\n";
        }
        return log_salt;
    }
};

}
