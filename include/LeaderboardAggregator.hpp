#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <ostream>
#include <nlohmann/json.hpp>
#include "TriviaTypes.hpp"

using json = nlohmann::json;

// Session-wide results, one entry per completed round, in question order.
class LeaderboardAggregator {
private:
    std::vector<LeaderboardEntry> m_entries;
    bool m_finalized;
    mutable std::mutex m_mutex;

public:
    LeaderboardAggregator();

    // Returns false (and records nothing) once finalized.
    bool record(const std::string& question_text, const std::vector<Winner>& winners);
    std::vector<LeaderboardEntry> snapshot() const;
    void finalize();

    bool isFinalized() const;
    std::size_t size() const;

    json toJson() const;
    void print(std::ostream& out) const;
};
