#include <gtest/gtest.h>
#include "commitment_codec.hpp"
#include "input_validator.hpp"

using namespace captcha;

TEST(CommitmentCodecTest, TokenShape) {
    CommitmentCodec codec;
    Commitment c = codec.commit("ABC123");

    EXPECT_EQ(c.token.length(), CommitmentCodec::TOKEN_LENGTH);
    EXPECT_EQ(c.token.substr(0, CommitmentCodec::SALT_LENGTH), c.salt);
    EXPECT_TRUE(InputValidator::is_strict_alphanumeric(c.salt));
    EXPECT_TRUE(InputValidator::is_valid_hex(c.token.substr(CommitmentCodec::SALT_LENGTH),
                                             CommitmentCodec::DIGEST_HEX_LENGTH));
}

TEST(CommitmentCodecTest, VerifiesCorrectAnswer) {
    CommitmentCodec codec;
    Commitment c = codec.commit("k3Xp9Q");
    EXPECT_TRUE(codec.verify(c.token, "k3Xp9Q"));
}

TEST(CommitmentCodecTest, CaseSensitive) {
    CommitmentCodec codec;
    Commitment c = codec.commit("ABC123");
    EXPECT_FALSE(codec.verify(c.token, "abc123"));
    EXPECT_FALSE(codec.verify(c.token, "ABC12"));
    EXPECT_FALSE(codec.verify(c.token, "ABC1234"));
}

TEST(CommitmentCodecTest, FreshSaltPerCommit) {
    CommitmentCodec codec;
    Commitment a = codec.commit("ABC123");
    Commitment b = codec.commit("ABC123");
    EXPECT_NE(a.token, b.token);
    EXPECT_TRUE(codec.verify(a.token, "ABC123"));
    EXPECT_TRUE(codec.verify(b.token, "ABC123"));
}

TEST(CommitmentCodecTest, DeterministicUnderSalt) {
    CommitmentCodec codec;
    std::string t1 = codec.commit_with_salt("hello", "Ab12Cd");
    std::string t2 = codec.commit_with_salt("hello", "Ab12Cd");
    EXPECT_EQ(t1, t2);
    EXPECT_NE(t1, codec.commit_with_salt("hello", "Ab12Ce"));
    EXPECT_TRUE(codec.verify(t1, "hello"));
}

TEST(CommitmentCodecTest, RejectsBadSalt) {
    CommitmentCodec codec;
    EXPECT_THROW(codec.commit_with_salt("x", "short"), std::invalid_argument);
    EXPECT_THROW(codec.commit_with_salt("x", "toolong1"), std::invalid_argument);
    EXPECT_THROW(codec.commit_with_salt("x", "ab$d12"), std::invalid_argument);
}

TEST(CommitmentCodecTest, TamperedTokenFails) {
    CommitmentCodec codec;
    Commitment c = codec.commit("ABC123");

    for (size_t i = CommitmentCodec::SALT_LENGTH; i < CommitmentCodec::TOKEN_LENGTH; ++i) {
        std::string flipped = c.token;
        flipped[i] = flipped[i] == '0' ? '1' : '0';
        EXPECT_FALSE(codec.verify(flipped, "ABC123")) << "position " << i;
    }

    std::string flipped_salt = c.token;
    flipped_salt[0] = flipped_salt[0] == 'a' ? 'b' : 'a';
    EXPECT_FALSE(codec.verify(flipped_salt, "ABC123"));
}

TEST(CommitmentCodecTest, MalformedInputRejected) {
    CommitmentCodec codec;
    Commitment c = codec.commit("ABC123");

    EXPECT_FALSE(codec.verify("", "ABC123"));
    EXPECT_FALSE(codec.verify(c.token, ""));
    EXPECT_FALSE(codec.verify(c.token.substr(1), "ABC123"));
    EXPECT_FALSE(codec.verify(c.token + "0", "ABC123"));
    EXPECT_FALSE(codec.verify("!!!!!!" + c.token.substr(6), "ABC123"));
    EXPECT_FALSE(codec.verify(c.token, std::string(CommitmentCodec::MAX_ANSWER_LENGTH + 1, 'A')));

    // Right length, right salt, but the digest part is not hex.
    std::string non_hex = c.token.substr(0, CommitmentCodec::SALT_LENGTH) +
                          std::string(CommitmentCodec::DIGEST_HEX_LENGTH, 'z');
    EXPECT_FALSE(codec.verify(non_hex, "ABC123"));
}

TEST(CommitmentCodecTest, VerifyNeverThrows) {
    CommitmentCodec codec;
    static_assert(noexcept(codec.verify(std::string(), std::string())), "verify must be noexcept");
    EXPECT_NO_THROW(codec.verify(std::string(CommitmentCodec::TOKEN_LENGTH, '\0'), "ABC123"));
}

TEST(CommitmentCodecTest, SecretBindsToken) {
    CommitmentCodec keyed("server-secret");
    CommitmentCodec other("another-secret");
    CommitmentCodec unkeyed;

    Commitment c = keyed.commit("ABC123");
    EXPECT_TRUE(keyed.verify(c.token, "ABC123"));
    EXPECT_FALSE(other.verify(c.token, "ABC123"));
    EXPECT_FALSE(unkeyed.verify(c.token, "ABC123"));
}

TEST(CommitmentCodecTest, VerificationIsIdempotent) {
    CommitmentCodec codec("idem-secret");
    Commitment c = codec.commit("Zq81Kd");

    EXPECT_TRUE(codec.verify(c.token, "Zq81Kd"));
    EXPECT_TRUE(codec.verify(c.token, "Zq81Kd"));
    EXPECT_FALSE(codec.verify(c.token, "zq81kd"));
    EXPECT_FALSE(codec.verify(c.token, "zq81kd"));
}
