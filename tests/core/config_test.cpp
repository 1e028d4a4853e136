// Tests for core/config.h -- channel list parsing and validation.

#include "core/config.h"

#include <gtest/gtest.h>

namespace midilight {
namespace {

// ---------------------------------------------------------------------------
// parseChannelList
// ---------------------------------------------------------------------------

TEST(ParseChannelListTest, SingleChannel) {
  std::set<uint8_t> channels;
  std::string error;
  ASSERT_TRUE(parseChannelList("9", channels, error));
  EXPECT_EQ(channels, (std::set<uint8_t>{9}));
}

TEST(ParseChannelListTest, MultipleChannelsDeduplicated) {
  std::set<uint8_t> channels;
  std::string error;
  ASSERT_TRUE(parseChannelList("0,1,15,1", channels, error));
  EXPECT_EQ(channels, (std::set<uint8_t>{0, 1, 15}));
}

TEST(ParseChannelListTest, RejectsBadInput) {
  std::set<uint8_t> channels = {3};
  std::string error;
  EXPECT_FALSE(parseChannelList("", channels, error));
  EXPECT_FALSE(parseChannelList("1,,2", channels, error));
  EXPECT_FALSE(parseChannelList("a", channels, error));
  EXPECT_FALSE(parseChannelList("-1", channels, error));
  EXPECT_FALSE(parseChannelList("16", channels, error));
  EXPECT_FALSE(parseChannelList("0001000", channels, error));
  EXPECT_FALSE(error.empty());
  // Output untouched on failure.
  EXPECT_EQ(channels, (std::set<uint8_t>{3}));
}

TEST(ChannelsToStringTest, Sorted) {
  EXPECT_EQ(channelsToString({9, 0, 1}), "0, 1, 9");
}

// ---------------------------------------------------------------------------
// validateConfig
// ---------------------------------------------------------------------------

TEST(ValidateConfigTest, DefaultsAreValid) {
  BridgeConfig config;
  std::string error;
  EXPECT_TRUE(validateConfig(config, error)) << error;
  EXPECT_EQ(config.channels, (std::set<uint8_t>{0}));
  EXPECT_EQ(config.rate_interval_ms, 50);
  EXPECT_EQ(config.port_name, "midilifx");
  EXPECT_TRUE(config.input_path.empty());
}

TEST(ValidateConfigTest, NeedsPortNameOrInputPath) {
  BridgeConfig config;
  config.port_name.clear();
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));
  EXPECT_NE(error.find("port name"), std::string::npos);

  config.input_path = "-";
  EXPECT_TRUE(validateConfig(config, error)) << error;
}

TEST(ValidateConfigTest, NegativeTransitionRejected) {
  BridgeConfig config;
  config.initial_transition_ms = -1;
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));
  EXPECT_NE(error.find("Transition"), std::string::npos);
}

TEST(ValidateConfigTest, EmptyChannelsRejected) {
  BridgeConfig config;
  config.channels.clear();
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));
}

TEST(ValidateConfigTest, ChannelOutOfRangeRejected) {
  BridgeConfig config;
  config.channels = {0, 16};
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));
}

TEST(ValidateConfigTest, RateIntervalMustBePositive) {
  BridgeConfig config;
  config.rate_interval_ms = 0;
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));
}

TEST(ValidateConfigTest, KelvinRangeMustBeOrdered) {
  BridgeConfig config;
  config.min_kelvin = 9000;
  config.max_kelvin = 2500;
  std::string error;
  EXPECT_FALSE(validateConfig(config, error));

  config.min_kelvin = 1500;
  config.max_kelvin = 9000;
  EXPECT_TRUE(validateConfig(config, error)) << error;
}

}  // namespace
}  // namespace midilight
