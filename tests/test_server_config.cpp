#include <gtest/gtest.h>
#include "server_config.hpp"

using namespace captcha;

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.enable_tls);
    EXPECT_EQ(config.max_message_size, 16 * 1024);
    EXPECT_EQ(config.cookie_name, "hash");
    EXPECT_EQ(config.answer_field, "verify");
    EXPECT_TRUE(config.commitment_secret.empty());
    EXPECT_TRUE(config.config_path.empty());
    EXPECT_TRUE(config.admin_token.empty());
}
