#pragma once

#include <string>
#include <cstddef>

namespace captcha {

struct Commitment {
    std::string token;
    std::string salt;
};

// Salted, keyed commitment to a challenge string.
//
// Token layout: salt (6 alphanumeric characters) followed by the lowercase hex
// HMAC-SHA256 of the challenge, keyed with secret ++ salt. The salt is read
// back from the token prefix, so nothing is stored server side.
class CommitmentCodec {
public:
    static constexpr std::size_t SALT_LENGTH = 6;
    static constexpr std::size_t DIGEST_HEX_LENGTH = 64;
    static constexpr std::size_t TOKEN_LENGTH = SALT_LENGTH + DIGEST_HEX_LENGTH;
    static constexpr std::size_t MAX_ANSWER_LENGTH = 256;

    explicit CommitmentCodec(std::string secret = "");

    // Commits to challenge under a fresh random salt.
    Commitment commit(const std::string& challenge) const;

    /**
     * Deterministic commitment under a caller-supplied salt.
     * @throws std::invalid_argument if salt is not SALT_LENGTH alphanumeric characters.
     */
    std::string commit_with_salt(const std::string& challenge, const std::string& salt) const;

    /**
     * Recomputes the token for answer using the salt embedded in token and
     * compares in constant time. Malformed input yields false.
     */
    bool verify(const std::string& token, const std::string& answer) const noexcept;

private:
    std::string digest(const std::string& challenge, const std::string& salt) const;

    std::string secret_;
};

}
