#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct PhaseDurations {
    double open_seconds = 15.0;         // question open for answers
    double reveal_delay_seconds = 10.0; // STOP -> REP
    double advance_delay_seconds = 5.0; // REP -> NEXT
};

struct GameConfig {
    PhaseDurations durations;
    std::size_t max_winners_per_round = 5;
};

struct AppConfig {
    int port = 8081;
    std::string questions_path = "../data/questions.csv";
    std::string leaderboard_csv = "leaderboard.csv";
    std::string leaderboard_json;   // empty = don't write
    std::string bot_name = "TriviaBot";
    std::string operator_name = "host"; // empty = auto start
    double auto_start_delay_seconds = 30.0;
    GameConfig game;
};

// Overlays the keys present in `j` onto `config`. Invalid values are
// reported on stderr and leave the default in place; returns false if any
// value was rejected.
bool applyConfig(const json& j, AppConfig& config);

// Returns false if the file can't be read or parsed, or a value was rejected.
bool loadConfig(const std::string& filename, AppConfig& config);
