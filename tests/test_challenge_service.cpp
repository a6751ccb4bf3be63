#include <gtest/gtest.h>
#include "challenge_service.hpp"
#include "verification_service.hpp"
#include "metrics.hpp"

using namespace captcha;

namespace {

// Records what it was asked to draw instead of drawing it.
class RecordingRenderer : public ImageRenderer {
public:
    mutable std::string last_text;

    RenderedImage render(const std::string& text, const ChallengeConfig&) const override {
        last_text = text;
        return RenderedImage{std::vector<uint8_t>(text.begin(), text.end()), "image/x-test"};
    }
    void validate(const ChallengeConfig&) const override {}
};

class RejectingRenderer : public ImageRenderer {
public:
    RenderedImage render(const std::string&, const ChallengeConfig&) const override {
        throw RenderConfigError("unknown style 'spiral'");
    }
    void validate(const ChallengeConfig&) const override {
        throw RenderConfigError("unknown style 'spiral'");
    }
};

ChallengeConfig debug_config() {
    return ChallengeConfig::parse(R"({"image": {"width": 150, "height": 40}, "debug": true})");
}

}

TEST(ChallengeServiceTest, DebugRoundTrip) {
    RasterRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);
    VerificationService verifier(codec);

    ChallengeResult r = service.create_challenge(debug_config());
    EXPECT_EQ(r.mime_type, "image/png");
    EXPECT_FALSE(r.image.empty());
    EXPECT_EQ(r.token.size(), CommitmentCodec::TOKEN_LENGTH);

    EXPECT_TRUE(verifier.verify_answer(r.token, "ABC123"));
    EXPECT_FALSE(verifier.verify_answer(r.token, "abc123"));
    EXPECT_FALSE(verifier.verify_answer(r.token, "ABC124"));
}

TEST(ChallengeServiceTest, RandomChallengeMatchesToken) {
    RecordingRenderer renderer;
    CommitmentCodec codec("test-secret");
    ChallengeService service(renderer, codec);
    VerificationService verifier(codec);

    ChallengeConfig config = ChallengeConfig::parse(R"({"image": {"width": 150, "height": 40, "rndmax": 8}})");
    ChallengeResult r = service.create_challenge(config);

    ASSERT_EQ(renderer.last_text.size(), 8u);
    EXPECT_EQ(r.mime_type, "image/x-test");
    EXPECT_TRUE(verifier.verify_answer(r.token, renderer.last_text));
    // The token must not reveal the challenge.
    EXPECT_EQ(r.token.find(renderer.last_text), std::string::npos);
}

TEST(ChallengeServiceTest, TokensDifferAcrossRounds) {
    RecordingRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);

    ChallengeResult a = service.create_challenge(debug_config());
    ChallengeResult b = service.create_challenge(debug_config());
    EXPECT_NE(a.token, b.token);
}

TEST(ChallengeServiceTest, MissingImageIsConfigError) {
    RecordingRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);

    EXPECT_THROW(service.create_challenge(ChallengeConfig::parse(R"({"debug": true})")), ConfigError);
    EXPECT_TRUE(renderer.last_text.empty());
}

TEST(ChallengeServiceTest, RenderErrorPropagates) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    RejectingRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);

    EXPECT_THROW(service.create_challenge(debug_config()), RenderConfigError);
    EXPECT_EQ(reg.get_counter("captcha_render_failures"), 1.0);
    EXPECT_EQ(reg.get_counter("captcha_challenges_issued"), 0.0);
}

TEST(ChallengeServiceTest, CountsOutcomes) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    RecordingRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);
    VerificationService verifier(codec);

    ChallengeResult r = service.create_challenge(debug_config());
    verifier.verify_answer(r.token, "ABC123");
    verifier.verify_answer(r.token, "nope");

    EXPECT_EQ(reg.get_counter("captcha_challenges_issued"), 1.0);
    EXPECT_EQ(reg.get_counter("captcha_verifications_passed"), 1.0);
    EXPECT_EQ(reg.get_counter("captcha_verifications_failed"), 1.0);
}

TEST(VerificationServiceTest, EmptyInputsRejected) {
    CommitmentCodec codec;
    VerificationService verifier(codec);
    std::string token = codec.commit("ABC123").token;

    EXPECT_FALSE(verifier.verify_answer("", "ABC123"));
    EXPECT_FALSE(verifier.verify_answer(token, ""));
    EXPECT_FALSE(verifier.verify_answer("", ""));
}

TEST(VerificationServiceTest, RepeatedChecksAgree) {
    RecordingRenderer renderer;
    CommitmentCodec codec;
    ChallengeService service(renderer, codec);
    VerificationService verifier(codec);

    ChallengeResult r = service.create_challenge(debug_config());
    for (const char* answer : {"ABC123", "abc123", ""}) {
        bool first = verifier.verify_answer(r.token, answer);
        bool second = verifier.verify_answer(r.token, answer);
        EXPECT_EQ(first, second) << "answer " << answer;
    }
    EXPECT_TRUE(verifier.verify_answer(r.token, "ABC123"));
}
