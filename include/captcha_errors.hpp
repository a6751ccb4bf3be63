#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace captcha {

// Raised when a ChallengeConfig is malformed or carries unrecognized keys.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}

    ConfigError(const std::string& message, std::vector<std::string> offending_keys)
        : std::runtime_error(message), offending_keys_(std::move(offending_keys)) {}

    const std::vector<std::string>& offending_keys() const noexcept {
        return offending_keys_;
    }

private:
    std::vector<std::string> offending_keys_;
};

// Raised by a renderer that rejects the supplied image/create/particle options.
class RenderConfigError : public std::runtime_error {
public:
    explicit RenderConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

}
