#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace captcha {

// Input validation and request-field extraction for the HTTP host and tools.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Letters and digits only.
    static bool is_strict_alphanumeric(const std::string& str) {
        if (str.empty()) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c));
        });
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * @throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }

    // Truncates to max_length and drops control characters.
    static std::string sanitize_field(const std::string& input, size_t max_length = 256) {
        std::string result;
        result.reserve(std::min(input.size(), max_length));
        for (char c : input) {
            if (result.size() >= max_length) break;
            if (!std::iscntrl(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    // Decodes application/x-www-form-urlencoded text. Malformed escapes are kept verbatim.
    static std::string url_decode(const std::string& input) {
        std::string out;
        out.reserve(input.size());
        for (size_t i = 0; i < input.size(); ++i) {
            char c = input[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%' && i + 2 < input.size() &&
                       std::isxdigit(static_cast<unsigned char>(input[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
                out += static_cast<char>(std::stoi(input.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    /**
     * Finds a cookie value in a Cookie header ("a=1; hash=xyz").
     * Returns an empty string if the cookie is absent.
     */
    static std::string extract_cookie(const std::string& header, const std::string& name) {
        size_t pos = 0;
        while (pos < header.size()) {
            size_t end = header.find(';', pos);
            if (end == std::string::npos) end = header.size();

            std::string pair = trim(header.substr(pos, end - pos));
            size_t eq = pair.find('=');
            if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
                std::string value = trim(pair.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                return value;
            }
            pos = end + 1;
        }
        return "";
    }

    // Finds a field in a url-encoded body or query string ("a=1&verify=xyz").
    static std::string extract_form_field(const std::string& body, const std::string& name) {
        size_t pos = 0;
        while (pos < body.size()) {
            size_t end = body.find('&', pos);
            if (end == std::string::npos) end = body.size();

            std::string pair = body.substr(pos, end - pos);
            size_t eq = pair.find('=');
            std::string key = url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
            if (key == name) {
                return eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            }
            pos = end + 1;
        }
        return "";
    }

private:
    static std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }
};

}
