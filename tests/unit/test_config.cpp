#include "kernel/config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace convene::kernel;
using json = nlohmann::json;

TEST(Config, defaults)
{
    CoordinationConfig config;
    ASSERT_EQ(config.quorum_timeout, std::chrono::milliseconds(30000));
    ASSERT_EQ(config.targeted_window, std::chrono::milliseconds(500));
    ASSERT_EQ(config.accumulation_window, std::chrono::milliseconds(5000));
    ASSERT_EQ(config.first_meeting_id, 100u);
}

TEST(Config, fromJsonOverridesOnlyGivenKeys)
{
    auto config = config_from_json(json{{"quorum_timeout_ms", 250}, {"max_history", 3}});
    ASSERT_EQ(config.quorum_timeout, std::chrono::milliseconds(250));
    ASSERT_EQ(config.max_history, 3u);
    ASSERT_EQ(config.accumulation_window, std::chrono::milliseconds(5000));
}

TEST(Config, loadFile)
{
    const char* path = "convene_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"first_meeting_id": 500, "log_level": "debug"})";
    }
    auto config = load_config(path);
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->first_meeting_id, 500u);
    ASSERT_EQ(config->log_level, "debug");
    std::remove(path);
}

TEST(Config, loadFailures)
{
    ASSERT_FALSE(load_config("/nonexistent/convene.json").has_value());

    const char* path = "convene_bad_config.json";
    {
        std::ofstream out(path);
        out << "{not json";
    }
    ASSERT_FALSE(load_config(path).has_value());
    std::remove(path);
}
