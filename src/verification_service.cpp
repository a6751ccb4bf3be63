#include "verification_service.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace captcha {

bool VerificationService::verify_answer(const std::string& token, const std::string& answer,
                                        const std::string& remote_addr) const noexcept {
    bool valid = !token.empty() && !answer.empty() && codec_.verify(token, answer);

    try {
        if (valid) {
            MetricsRegistry::instance().increment_counter("captcha_verifications_passed");
            SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::VERIFY_SUCCESS, remote_addr);
        } else {
            MetricsRegistry::instance().increment_counter("captcha_verifications_failed");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::VERIFY_FAILURE, remote_addr,
                                token.empty() ? "missing token" : (answer.empty() ? "missing answer" : "answer mismatch"));
        }
    } catch (const std::exception& e) {
        // Bookkeeping failures must not change the verdict.
        std::cerr << "[!] Verification bookkeeping failed: " << e.what() << "\n";
    }

    return valid;
}

}
