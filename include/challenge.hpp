#pragma once

#include <string>
#include <stdexcept>
#include <openssl/rand.h>

namespace captcha {

// Produces challenge strings and commitment salts.
class ChallengeGenerator {
public:
    // Fixed challenge used when a config has debug enabled.
    static constexpr const char* DEBUG_CHALLENGE = "ABC123";
    static constexpr size_t SALT_LENGTH = 6;
    static constexpr const char* ALPHANUMERIC =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    static std::string generate(bool debug, size_t length, const std::string& charset) {
        if (debug) {
            return DEBUG_CHALLENGE;
        }
        return random_string(length, charset);
    }

    static std::string generate_salt() {
        return random_string(SALT_LENGTH, ALPHANUMERIC);
    }

    /**
     * Draws length characters uniformly from charset.
     * Bytes above the largest multiple of the charset size are rejected to avoid modulo bias.
     */
    static std::string random_string(size_t length, const std::string& charset) {
        if (length == 0 || charset.empty() || charset.size() > 256) {
            throw std::invalid_argument("random_string requires a length and a charset of 1..256 characters");
        }

        const unsigned limit = 256 - (256 % static_cast<unsigned>(charset.size()));
        std::string out;
        out.reserve(length);

        unsigned char buffer[64];
        while (out.size() < length) {
            if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
                throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
            }
            for (unsigned char b : buffer) {
                if (b >= limit) continue;
                out += charset[b % charset.size()];
                if (out.size() == length) break;
            }
        }
        return out;
    }
};

}
