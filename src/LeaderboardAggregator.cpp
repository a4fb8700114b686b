#include "LeaderboardAggregator.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

LeaderboardAggregator::LeaderboardAggregator() : m_finalized(false) {}

/**
 * @brief Appends the result of one completed round.
 */
bool LeaderboardAggregator::record(const std::string& question_text, const std::vector<Winner>& winners) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finalized) {
        std::cerr << "Leaderboard: already finalized, dropping result for: " << question_text << std::endl;
        return false;
    }
    m_entries.push_back({question_text, winners});
    return true;
}

std::vector<LeaderboardEntry> LeaderboardAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

void LeaderboardAggregator::finalize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_finalized = true;
}

bool LeaderboardAggregator::isFinalized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finalized;
}

std::size_t LeaderboardAggregator::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

json LeaderboardAggregator::toJson() const {
    std::vector<LeaderboardEntry> entries = snapshot();

    json table = json::array();
    for (const auto& entry : entries) {
        json winners = json::array();
        for (const auto& w : entry.winners) {
            winners.push_back({
                {"name", w.sender_name},
                {"sender_id", w.sender_id},
                {"timestamp", w.timestamp},
                {"response_time", w.response_time_seconds}
            });
        }
        table.push_back({
            {"question", entry.question_text},
            {"winners", winners}
        });
    }
    return table;
}

void LeaderboardAggregator::print(std::ostream& out) const {
    std::vector<LeaderboardEntry> entries = snapshot();
    const std::string rule(80, '=');

    std::ostringstream text;
    text << "\n" << rule << "\nLEADERBOARD\n" << rule << "\n";
    for (std::size_t i = 0; i < entries.size(); ++i) {
        text << "\nQ" << (i + 1) << ": " << entries[i].question_text << "\n";
        if (entries[i].winners.empty()) {
            text << "  No correct answers\n";
            continue;
        }
        for (std::size_t j = 0; j < entries[i].winners.size(); ++j) {
            const Winner& w = entries[i].winners[j];
            text << "  " << (j + 1) << ". " << w.sender_name << " - "
                 << std::fixed << std::setprecision(1) << w.response_time_seconds << "s\n";
        }
    }
    text << "\n" << rule << "\n";
    out << text.str();
}
