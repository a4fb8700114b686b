#include "LeaderboardExporter.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string exporter::formatClock(double epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) return "";
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

std::string exporter::formatSeconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds << "s";
    return out.str();
}

std::string exporter::escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += "\"";
    return quoted;
}

bool exporter::writeCsv(const std::vector<LeaderboardEntry>& entries, std::ostream& out, std::size_t max_winners) {
    out << "Question";
    for (std::size_t i = 1; i <= max_winners; ++i) {
        out << ",Winner" << i << ",Time" << i << ",ResponseTime" << i;
    }
    out << "\n";

    for (const auto& entry : entries) {
        out << escapeCsvField(entry.question_text);
        std::size_t written = 0;
        for (const auto& w : entry.winners) {
            if (written == max_winners) break;
            out << "," << escapeCsvField(w.sender_name)
                << "," << formatClock(w.timestamp)
                << "," << formatSeconds(w.response_time_seconds);
            ++written;
        }
        for (; written < max_winners; ++written) {
            out << ",,,";
        }
        out << "\n";
    }
    return static_cast<bool>(out);
}

/**
 * @brief Writes the leaderboard as CSV, one row per question.
 */
bool exporter::saveCsv(const std::vector<LeaderboardEntry>& entries, const std::string& filename, std::size_t max_winners) {
    std::ofstream o(filename);
    if (!o.is_open()) {
        std::cerr << "Exporter: failed to open " << filename << " for writing." << std::endl;
        return false;
    }
    if (!writeCsv(entries, o, max_winners)) {
        std::cerr << "Exporter: write error on " << filename << std::endl;
        return false;
    }
    std::cout << "Leaderboard saved to " << filename << std::endl;
    return true;
}

bool exporter::saveJson(const json& table, const std::string& filename) {
    try {
        std::ofstream o(filename);
        if (!o.is_open()) {
            std::cerr << "Exporter: failed to open " << filename << " for writing." << std::endl;
            return false;
        }
        o << std::setw(2) << table << std::endl;
        std::cout << "Leaderboard saved to " << filename << std::endl;
        return static_cast<bool>(o);
    } catch (const json::exception& e) {
        std::cerr << "Exporter: error saving " << filename << ": " << e.what() << std::endl;
        return false;
    }
}
