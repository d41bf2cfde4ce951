#include "util/logger.hpp"
#include <gtest/gtest.h>

using namespace convene;

TEST(Logger, initReusesConsoleLogger)
{
    auto first = util::init_logger();
    auto second = util::init_logger();
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(first, second);
    ASSERT_EQ(spdlog::default_logger(), first);
}

TEST(Logger, parseLevelNames)
{
    ASSERT_EQ(util::parse_log_level("debug"), std::optional<spdlog::level::level_enum>(spdlog::level::debug));
    ASSERT_EQ(util::parse_log_level("info"), std::optional<spdlog::level::level_enum>(spdlog::level::info));
    ASSERT_EQ(util::parse_log_level("off"), std::optional<spdlog::level::level_enum>(spdlog::level::off));
    ASSERT_FALSE(util::parse_log_level("chatty").has_value());
}

TEST(Logger, unknownLevelKeepsCurrent)
{
    util::init_logger();
    ASSERT_TRUE(util::apply_log_level("warn"));
    ASSERT_EQ(spdlog::get_level(), spdlog::level::warn);

    ASSERT_FALSE(util::apply_log_level("chatty"));
    ASSERT_EQ(spdlog::get_level(), spdlog::level::warn);

    ASSERT_TRUE(util::apply_log_level("info"));
}
