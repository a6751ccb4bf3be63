#pragma once

#include <string>
#include <vector>

namespace captcha {

struct CorsDecision {
    bool allowed = false;
    std::string allow_origin;
    bool allow_credentials = false;
};

// Decides the CORS response headers for a request Origin.
class CorsPolicy {
public:
    /**
     * An exact match echoes the origin and allows credentials, since the verify
     * endpoint reads the token cookie. A "*" entry allows any origin without
     * credentials.
     */
    static CorsDecision evaluate(const std::vector<std::string>& allowed_origins,
                                 const std::string& origin) {
        CorsDecision decision;
        if (origin.empty()) return decision;

        bool wildcard = false;
        for (const auto& allowed : allowed_origins) {
            if (allowed == origin) {
                decision.allowed = true;
                decision.allow_origin = origin;
                decision.allow_credentials = true;
                return decision;
            }
            if (allowed == "*") wildcard = true;
        }

        if (wildcard) {
            decision.allowed = true;
            decision.allow_origin = "*";
        }
        return decision;
    }
};

} // namespace captcha
