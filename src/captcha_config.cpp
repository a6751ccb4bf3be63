#include "captcha_config.hpp"
#include "input_validator.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace json = boost::json;

namespace captcha {

namespace {

const char* kind_name(const json::value& v) {
    switch (v.kind()) {
        case json::kind::null: return "null";
        case json::kind::bool_: return "bool";
        case json::kind::int64:
        case json::kind::uint64: return "integer";
        case json::kind::double_: return "number";
        case json::kind::string: return "string";
        case json::kind::array: return "array";
        case json::kind::object: return "object";
    }
    return "unknown";
}

}

ChallengeConfig ChallengeConfig::from_json(const json::value& value) {
    if (!value.is_object()) {
        throw ConfigError(std::string("challenge config must be an object, got ") + kind_name(value));
    }

    const auto& obj = value.as_object();
    ChallengeConfig config;

    std::vector<std::string> unknown;
    for (const auto& entry : obj) {
        std::string key(entry.key());
        const json::value& v = entry.value();

        if (key == "image") {
            if (!v.is_object()) {
                throw ConfigError(std::string("parameter 'image' must be an object, got ") + kind_name(v));
            }
            config.image_ = v.as_object();
            config.has_image_ = true;
        } else if (key == "renderCreateOptions") {
            if (!v.is_array()) {
                throw ConfigError(std::string("parameter 'renderCreateOptions' must be an array, got ") + kind_name(v));
            }
            config.create_options_ = v.as_array();
        } else if (key == "particleOptions") {
            if (!v.is_array()) {
                throw ConfigError(std::string("parameter 'particleOptions' must be an array, got ") + kind_name(v));
            }
            config.particle_options_ = v.as_array();
        } else if (key == "debug") {
            if (!v.is_bool()) {
                throw ConfigError(std::string("parameter 'debug' must be a bool, got ") + kind_name(v));
            }
            config.debug_ = v.as_bool();
        } else {
            unknown.push_back(key);
        }
    }

    if (!unknown.empty()) {
        std::string names;
        for (const auto& k : unknown) {
            if (!names.empty()) names += ", ";
            names += k;
        }
        throw ConfigError("invalid option(s) (" + names + ") passed to challenge config", unknown);
    }

    // Generator options travel inside the image object.
    if (auto* rndmax = config.image_.if_contains("rndmax")) {
        if (!rndmax->is_int64() && !rndmax->is_uint64()) {
            throw ConfigError(std::string("image option 'rndmax' must be an integer, got ") + kind_name(*rndmax));
        }
        auto len = rndmax->to_number<long long>();
        if (len < 1 || len > static_cast<long long>(MAX_CHALLENGE_LENGTH)) {
            throw ConfigError("image option 'rndmax' must be between 1 and " + std::to_string(MAX_CHALLENGE_LENGTH));
        }
        config.challenge_length_ = static_cast<std::size_t>(len);
    }

    if (auto* rnd_data = config.image_.if_contains("rnd_data")) {
        if (!rnd_data->is_string() || rnd_data->as_string().empty()) {
            throw ConfigError("image option 'rnd_data' must be a non-empty string");
        }
        std::string charset(rnd_data->as_string());
        if (charset.size() > MAX_CHARSET_LENGTH) {
            throw ConfigError("image option 'rnd_data' must not exceed " +
                              std::to_string(MAX_CHARSET_LENGTH) + " characters");
        }
        // Challenges are sampled byte by byte, so only printable ASCII is usable.
        for (char c : charset) {
            auto b = static_cast<unsigned char>(c);
            if (b >= 0x80 || std::iscntrl(b)) {
                throw ConfigError("image option 'rnd_data' may only contain printable ASCII characters");
            }
        }
        config.charset_ = std::move(charset);
    }

    return config;
}

ChallengeConfig ChallengeConfig::parse(const std::string& text) {
    json::value value;
    try {
        value = InputValidator::safe_parse_json(text);
    } catch (const std::exception& e) {
        throw ConfigError(std::string("challenge config is not valid JSON: ") + e.what());
    }
    return from_json(value);
}

ChallengeConfig ChallengeConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open challenge config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

ChallengeConfig ChallengeConfig::defaults() {
    json::object image;
    image["width"] = 150;
    image["height"] = 40;
    image["lines"] = 10;
    image["ptsize"] = 18;
    image["bgcolor"] = "#ffff00";

    json::object root;
    root["image"] = std::move(image);
    root["renderCreateOptions"] = json::array{"normal", "rect"};
    root["particleOptions"] = json::array{300};

    return from_json(root);
}

}
