#pragma once

#include <string>

#include "commitment_codec.hpp"

namespace captcha {

// Checks submitted answers against commitment tokens.
// Never throws: malformed, empty or mismatched input is a plain rejection.
class VerificationService {
public:
    explicit VerificationService(const CommitmentCodec& codec) : codec_(codec) {}

    bool verify_answer(const std::string& token, const std::string& answer,
                       const std::string& remote_addr = "unknown") const noexcept;

private:
    const CommitmentCodec& codec_;
};

}
