#include "commitment_codec.hpp"
#include "challenge.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace captcha {

CommitmentCodec::CommitmentCodec(std::string secret)
    : secret_(std::move(secret)) {}

Commitment CommitmentCodec::commit(const std::string& challenge) const {
    std::string salt = ChallengeGenerator::generate_salt();
    std::string token = commit_with_salt(challenge, salt);
    return Commitment{std::move(token), std::move(salt)};
}

std::string CommitmentCodec::commit_with_salt(const std::string& challenge, const std::string& salt) const {
    if (salt.size() != SALT_LENGTH || !InputValidator::is_strict_alphanumeric(salt)) {
        throw std::invalid_argument("commitment salt must be " + std::to_string(SALT_LENGTH) + " alphanumeric characters");
    }
    return salt + digest(challenge, salt);
}

bool CommitmentCodec::verify(const std::string& token, const std::string& answer) const noexcept {
    if (token.size() != TOKEN_LENGTH || answer.empty() || answer.size() > MAX_ANSWER_LENGTH) {
        return false;
    }

    try {
        std::string salt = token.substr(0, SALT_LENGTH);
        if (!InputValidator::is_strict_alphanumeric(salt) ||
            !InputValidator::is_valid_hex(token.substr(SALT_LENGTH), DIGEST_HEX_LENGTH)) {
            return false;
        }

        std::string expected = salt + digest(answer, salt);
        return CRYPTO_memcmp(expected.data(), token.data(), TOKEN_LENGTH) == 0;
    } catch (const std::exception& e) {
        try {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::VERIFY_FAILURE,
                                "internal", std::string("Commitment recomputation failed: ") + e.what());
        } catch (const std::exception& log_error) {
            std::cerr << "[!] Verification logging failed: " << log_error.what() << "\n";
        }
        return false;
    }
}

std::string CommitmentCodec::digest(const std::string& challenge, const std::string& salt) const {
    std::string key = secret_ + salt;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(challenge.data()), challenge.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < mac_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)mac[i];
    }
    return ss.str();
}

}
