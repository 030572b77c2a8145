#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "gatekeeper/config.hpp"

namespace {

const char* const kConfigKeys[] = {
    "SERVER_PORT",      "SERVER_THREADS",         "LOG_LEVEL",
    "APP_ENV",          "SUPPORTED_LOCALES",      "DEFAULT_LOCALE",
    "AUTH_RATE_LIMIT",  "AUTH_RATE_LIMIT_WINDOW", "AUTH_RATE_LIMIT_CAPACITY",
    "LOCALE_COOKIE_MAX_AGE", "OPS_TOKEN",
};

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kConfigKeys) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigEnvTest, Defaults) {
  auto cfg = gatekeeper::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.threads, 0u);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_FALSE(cfg.IsProduction());
  ASSERT_EQ(cfg.supported_locales.size(), 5u);
  EXPECT_EQ(cfg.supported_locales[0], "en");
  EXPECT_EQ(cfg.default_locale, "en");
  EXPECT_EQ(cfg.login_rate_limit_max, 10u);
  EXPECT_EQ(cfg.login_rate_window_seconds, 60u);
  EXPECT_EQ(cfg.login_rate_capacity, 1000u);
  EXPECT_EQ(cfg.locale_cookie_max_age_seconds, 63072000);
  EXPECT_TRUE(cfg.ops_token.empty());
}

TEST_F(ConfigEnvTest, ReadsOverrides) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("APP_ENV", "production", 1);
  setenv("SUPPORTED_LOCALES", " fr , de,fr ", 1);
  setenv("DEFAULT_LOCALE", "de", 1);
  setenv("AUTH_RATE_LIMIT", "5", 1);
  setenv("OPS_TOKEN", "secret", 1);
  auto cfg = gatekeeper::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_TRUE(cfg.IsProduction());
  ASSERT_EQ(cfg.supported_locales.size(), 2u);
  EXPECT_EQ(cfg.supported_locales[0], "fr");
  EXPECT_EQ(cfg.supported_locales[1], "de");
  EXPECT_EQ(cfg.default_locale, "de");
  EXPECT_EQ(cfg.login_rate_limit_max, 5u);
  EXPECT_EQ(cfg.ops_token, "secret");
}

TEST_F(ConfigEnvTest, RejectsMalformedNumbers) {
  setenv("SERVER_PORT", "80a", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SERVER_PORT", "70000", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SERVER_PORT", "", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("SERVER_PORT");
  setenv("AUTH_RATE_LIMIT", "-3", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
  setenv("AUTH_RATE_LIMIT", "0", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigEnvTest, RejectsInconsistentLocales) {
  setenv("SUPPORTED_LOCALES", " , ", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SUPPORTED_LOCALES", "en,fr", 1);
  setenv("DEFAULT_LOCALE", "ja", 1);
  EXPECT_THROW(gatekeeper::LoadConfigFromEnv(), std::invalid_argument);
}
