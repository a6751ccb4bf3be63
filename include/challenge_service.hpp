#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "captcha_config.hpp"
#include "commitment_codec.hpp"
#include "image_renderer.hpp"

namespace captcha {

struct ChallengeResult {
    std::vector<uint8_t> image;
    std::string mime_type;
    std::string token;
};

// Issues challenges: generates the string, renders it and commits to it.
// Holds no per-challenge state; one instance may serve any number of threads.
class ChallengeService {
public:
    ChallengeService(const ImageRenderer& renderer, const CommitmentCodec& codec)
        : renderer_(renderer), codec_(codec) {}

    /**
     * Creates a new challenge round.
     * @param config Validated challenge configuration.
     * @param remote_addr Client address, only used for logging.
     * @throws ConfigError if config carries no image options.
     * @throws RenderConfigError if the renderer rejects the options.
     */
    ChallengeResult create_challenge(const ChallengeConfig& config,
                                     const std::string& remote_addr = "unknown") const;

private:
    const ImageRenderer& renderer_;
    const CommitmentCodec& codec_;
};

}
