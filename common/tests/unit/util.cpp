#include <kruise/common/exceptions.hpp>
#include <kruise/common/util.hpp>

#include <cstdlib>

#include <gtest/gtest.h>

using namespace kruise::common;

TEST(Util, ParseBool)
{
  EXPECT_TRUE(util::parse_bool("true"));
  EXPECT_TRUE(util::parse_bool("1"));
  EXPECT_TRUE(util::parse_bool("yes"));
  EXPECT_FALSE(util::parse_bool("false"));
  EXPECT_FALSE(util::parse_bool("0"));
  EXPECT_FALSE(util::parse_bool("no"));

  EXPECT_THROW(util::parse_bool("enabled"), InvalidConfigurationError);
}

TEST(Util, Getenv)
{
  setenv("KRUISE_TEST_VARIABLE", "value", 1);
  EXPECT_EQ(util::getenv("KRUISE_TEST_VARIABLE"), "value");

  setenv("KRUISE_TEST_VARIABLE", "", 1);
  EXPECT_FALSE(util::getenv("KRUISE_TEST_VARIABLE").has_value());

  unsetenv("KRUISE_TEST_VARIABLE");
  EXPECT_FALSE(util::getenv("KRUISE_TEST_VARIABLE").has_value());
}

TEST(Util, Logger)
{
  auto logger = util::create_logger("UtilTest");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "UtilTest");
  EXPECT_EQ(logger->level(), spdlog::get_level());
}
