#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "gridworld/config.hpp"

namespace {

class ConfigEnvTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* key : {"SERVER_PORT", "TICK_INTERVAL_MS", "WORLD_WIDTH", "WORLD_HEIGHT", "CHAT_HISTORY_LIMIT", "MAX_PLAYERS",
                            "LOG_LEVEL"}) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigEnvTest, DefaultsMatchGameRules) {
  auto cfg = gridworld::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.tick_interval_ms, 600u);
  EXPECT_EQ(cfg.world_width, 100);
  EXPECT_EQ(cfg.world_height, 100);
  EXPECT_EQ(cfg.chat_history_limit, 100u);
  EXPECT_EQ(cfg.chat_max_length, 100u);
  EXPECT_EQ(cfg.max_players, 2000u);
  EXPECT_EQ(cfg.log_level, "info");
}

TEST_F(ConfigEnvTest, ReadsOverrides) {
  setenv("SERVER_PORT", "9001", 1);
  setenv("TICK_INTERVAL_MS", "250", 1);
  setenv("WORLD_WIDTH", "64", 1);
  setenv("CHAT_HISTORY_LIMIT", "20", 1);
  setenv("LOG_LEVEL", "debug", 1);
  auto cfg = gridworld::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9001);
  EXPECT_EQ(cfg.tick_interval_ms, 250u);
  EXPECT_EQ(cfg.world_width, 64);
  EXPECT_EQ(cfg.chat_history_limit, 20u);
  EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(ConfigEnvTest, RejectsMalformedNumbers) {
  setenv("MAX_PLAYERS", "lots", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  setenv("MAX_PLAYERS", "12abc", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("MAX_PLAYERS");
  setenv("SERVER_PORT", "70000", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SERVER_PORT", "8080", 1);
  setenv("TICK_INTERVAL_MS", "0", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("TICK_INTERVAL_MS");
  setenv("WORLD_WIDTH", "0", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  setenv("WORLD_WIDTH", "4294967296", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("WORLD_WIDTH");
  setenv("WORLD_HEIGHT", "3000000000", 1);
  EXPECT_THROW(gridworld::LoadConfigFromEnv(), std::invalid_argument);
}
