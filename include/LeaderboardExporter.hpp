#pragma once
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "TriviaTypes.hpp"

using json = nlohmann::json;

namespace exporter {
    // Question, then Winner/Time/ResponseTime for each of max_winners slots.
    // Rows are padded to 1 + 3 * max_winners columns.
    bool writeCsv(const std::vector<LeaderboardEntry>& entries, std::ostream& out, std::size_t max_winners = 5);
    bool saveCsv(const std::vector<LeaderboardEntry>& entries, const std::string& filename, std::size_t max_winners = 5);
    bool saveJson(const json& table, const std::string& filename);

    std::string formatClock(double epoch_seconds);   // local HH:MM:SS
    std::string formatSeconds(double seconds);       // "2.5s"
    std::string escapeCsvField(const std::string& field);
}
