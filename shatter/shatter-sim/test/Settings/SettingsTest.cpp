// Ticket: 0009_settings
// Test: Settings defaults and validation

#include <gtest/gtest.h>

#include <limits>

#include "shatter-sim/src/Settings/Settings.hpp"

namespace shatter_sim
{
namespace test
{

TEST(SettingsTest, Defaults_AreValid)
{
  const Settings settings{};
  EXPECT_NO_THROW(settings.validate());
  EXPECT_DOUBLE_EQ(settings.defaultGridSize, 1.0);
  EXPECT_TRUE(settings.useGreedyMeshing);
  EXPECT_EQ(settings.nonDivisibleInteraction, NonDivisibleInteraction::None);
  EXPECT_FALSE(settings.skipInstanceCheck);
}

TEST(SettingsTest, ReplicationInterval_IsInverseFrequency)
{
  Settings settings{};
  settings.puppetReplicationFrequency = 10.0;
  EXPECT_DOUBLE_EQ(settings.replicationInterval(), 0.1);
}

TEST(SettingsTest, Validate_RejectsZeroCaps)
{
  Settings settings{};
  settings.maxOpsPerFrame = 0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.maxDivisionsPerFrame = 0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.gmWorkerCount = 0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.puppetMaxCount = 0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);
}

TEST(SettingsTest, Validate_RejectsBadDoubles)
{
  Settings settings{};
  settings.defaultGridSize = -1.0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.puppetReplicationFrequency = 0.0;
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.puppetAnchorTimeout = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(settings.validate(), std::invalid_argument);

  settings = Settings{};
  settings.defaultSmoothCleanupDelay = 0.0;
  EXPECT_NO_THROW(settings.validate());
}

TEST(SettingsTest, NonDivisibleInteraction_Names)
{
  EXPECT_EQ(toString(NonDivisibleInteraction::Fall), "Fall");
  EXPECT_EQ(toString(NonDivisibleInteraction::Remove), "Remove");
}

}  // namespace test
}  // namespace shatter_sim
