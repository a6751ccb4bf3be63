#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <string>

#include "captcha_errors.hpp"

namespace captcha {

// Immutable challenge configuration, validated once at construction.
//
// Recognized top-level keys: "image" (object), "renderCreateOptions" (array),
// "particleOptions" (array) and "debug" (bool). The "image" object is handed
// to the renderer as-is, apart from the generator keys "rndmax" and
// "rnd_data" which are validated here.
class ChallengeConfig {
public:
    static constexpr std::size_t DEFAULT_CHALLENGE_LENGTH = 6;
    static constexpr std::size_t MAX_CHALLENGE_LENGTH = 32;
    static constexpr std::size_t MAX_CHARSET_LENGTH = 256;
    static constexpr const char* DEFAULT_CHARSET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    ChallengeConfig() = default;

    /**
     * Builds a config from an already parsed JSON value.
     * @throws ConfigError if the value is not an object, carries unknown keys
     *         or any recognized key has the wrong shape.
     */
    static ChallengeConfig from_json(const boost::json::value& value);

    // Parses JSON text (depth-limited) and validates it.
    static ChallengeConfig parse(const std::string& text);

    // Reads and validates a JSON config file.
    static ChallengeConfig load_file(const std::string& path);

    // The configuration used when the host supplies none.
    static ChallengeConfig defaults();

    bool has_image() const { return has_image_; }
    const boost::json::object& image() const { return image_; }
    const boost::json::array& create_options() const { return create_options_; }
    const boost::json::array& particle_options() const { return particle_options_; }
    bool debug() const { return debug_; }

    std::size_t challenge_length() const { return challenge_length_; }
    const std::string& charset() const { return charset_; }

private:
    boost::json::object image_;
    boost::json::array create_options_;
    boost::json::array particle_options_;
    bool has_image_ = false;
    bool debug_ = false;

    std::size_t challenge_length_ = DEFAULT_CHALLENGE_LENGTH;
    std::string charset_ = DEFAULT_CHARSET;
};

}
