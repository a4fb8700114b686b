#pragma once
#include <string>
#include <set>
#include <vector>
#include <optional>

// Accepted answers are already normalized (see answer::normalize).
struct Question {
    std::string text;
    std::set<std::string> accepted_answers;
};

// One inbound chat message, as stamped by the transport.
struct MessageEvent {
    std::string message_id;
    std::string sender_id;
    std::string sender_name;
    std::string body;
    std::optional<double> timestamp; // epoch seconds, nullopt = missing
};

struct Submission {
    std::string sender_id;
    std::string sender_name;
    std::string message_id;
    std::string raw_text;
    std::optional<double> timestamp;
    std::string normalized_text;
    bool is_correct = false;
    bool is_valid_window = false;
    bool is_counted_winner = false;
};

struct Winner {
    std::string sender_id;
    std::string sender_name;
    std::string message_id;
    double timestamp = 0.0;
    double response_time_seconds = 0.0;
};

enum class RoundState { OPEN, LOCKED, REVEALED, DONE };

const char* toString(RoundState state);

struct LeaderboardEntry {
    std::string question_text;
    std::vector<Winner> winners;
};
