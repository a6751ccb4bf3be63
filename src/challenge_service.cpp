#include "challenge_service.hpp"
#include "challenge.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace captcha {

ChallengeResult ChallengeService::create_challenge(const ChallengeConfig& config,
                                                   const std::string& remote_addr) const {
    if (!config.has_image()) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                            remote_addr, "Challenge requested without image options");
        throw ConfigError("challenge config has no 'image' options");
    }

    std::string challenge = ChallengeGenerator::generate(config.debug(), config.challenge_length(), config.charset());

    RenderedImage rendered;
    try {
        rendered = renderer_.render(challenge, config);
    } catch (const RenderConfigError& e) {
        MetricsRegistry::instance().increment_counter("captcha_render_failures");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::RENDER_ERROR,
                            remote_addr, e.what());
        throw;
    }

    Commitment commitment = codec_.commit(challenge);

    MetricsRegistry::instance().increment_counter("captcha_challenges_issued");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CHALLENGE_ISSUED,
                        remote_addr, config.debug() ? "debug challenge issued" : "");

    return ChallengeResult{std::move(rendered.data), std::move(rendered.mime_type), std::move(commitment.token)};
}

}
