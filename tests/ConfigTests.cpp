#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "Config.hpp"

TEST(ConfigTest, Defaults) {
    AppConfig config;
    EXPECT_EQ(config.port, 8081);
    EXPECT_DOUBLE_EQ(config.game.durations.open_seconds, 15.0);
    EXPECT_DOUBLE_EQ(config.game.durations.reveal_delay_seconds, 10.0);
    EXPECT_DOUBLE_EQ(config.game.durations.advance_delay_seconds, 5.0);
    EXPECT_EQ(config.game.max_winners_per_round, 5u);
    EXPECT_TRUE(config.leaderboard_json.empty());
}

TEST(ConfigTest, OverridesPresentKeysOnly) {
    AppConfig config;
    json j = json::parse(R"({
        "port": 9000,
        "bot_name": "Quizzer",
        "leaderboard_json": "out.json",
        "game": {"open_duration_seconds": 20, "max_winners_per_round": 3}
    })");
    EXPECT_TRUE(applyConfig(j, config));
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.bot_name, "Quizzer");
    EXPECT_EQ(config.leaderboard_json, "out.json");
    EXPECT_DOUBLE_EQ(config.game.durations.open_seconds, 20.0);
    EXPECT_DOUBLE_EQ(config.game.durations.reveal_delay_seconds, 10.0);
    EXPECT_EQ(config.game.max_winners_per_round, 3u);
    EXPECT_EQ(config.operator_name, "host");
}

TEST(ConfigTest, RejectedValuesKeepDefaults) {
    AppConfig config;
    json j = json::parse(R"({
        "port": 70000,
        "game": {
            "open_duration_seconds": 0,
            "reveal_delay_seconds": -1,
            "advance_delay_seconds": 0,
            "max_winners_per_round": 0
        }
    })");
    EXPECT_FALSE(applyConfig(j, config));
    EXPECT_EQ(config.port, 8081);
    EXPECT_DOUBLE_EQ(config.game.durations.open_seconds, 15.0);
    EXPECT_DOUBLE_EQ(config.game.durations.reveal_delay_seconds, 10.0);
    EXPECT_DOUBLE_EQ(config.game.durations.advance_delay_seconds, 0.0); // zero delay is allowed
    EXPECT_EQ(config.game.max_winners_per_round, 5u);
}

TEST(ConfigTest, WrongTypesAreRejected) {
    AppConfig config;
    EXPECT_FALSE(applyConfig(json::parse(R"({"bot_name": 5})"), config));
    EXPECT_EQ(config.bot_name, "TriviaBot");
    EXPECT_FALSE(applyConfig(json::parse(R"({"game": {"open_duration_seconds": "15"}})"), config));
    EXPECT_FALSE(applyConfig(json::parse(R"({"game": []})"), config));
    EXPECT_FALSE(applyConfig(json::array(), config));
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = "config_test.json";
    {
        std::ofstream f(path);
        f << R"({"operator_name": "", "auto_start_delay_seconds": 2.5})";
    }
    AppConfig config;
    EXPECT_TRUE(loadConfig(path, config));
    EXPECT_TRUE(config.operator_name.empty());
    EXPECT_DOUBLE_EQ(config.auto_start_delay_seconds, 2.5);
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingOrBrokenFile) {
    AppConfig config;
    EXPECT_FALSE(loadConfig("no_such_config.json", config));

    const std::string path = "config_broken.json";
    {
        std::ofstream f(path);
        f << "{ \"port\": ";
    }
    EXPECT_FALSE(loadConfig(path, config));
    EXPECT_EQ(config.port, 8081);
    std::remove(path.c_str());
}
