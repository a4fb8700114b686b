#pragma once
#include <string>
#include <set>
#include <vector>
#include <mutex>
#include <optional>
#include "TriviaTypes.hpp"

constexpr std::size_t DEFAULT_MAX_WINNERS = 5;

// One question's lifecycle: OPEN -> LOCKED -> REVEALED -> DONE.
// Every public method takes the round's own mutex.
class Round {
private:
    int m_number;
    Question m_question;
    RoundState m_state;
    double m_posted_at;
    double m_cutoff_at;
    std::size_t m_max_winners;

    std::vector<Submission> m_submissions; // arrival order
    std::vector<Winner> m_winners;         // sorted by response time
    std::set<std::string> m_winner_ids;
    mutable std::mutex m_mutex;

    // --- Helpers, caller holds m_mutex ---
    bool isValidWindow_UNLOCKED(const std::optional<double>& timestamp) const;
    bool admitWinner_UNLOCKED(Submission& submission);
    bool transitionTo_UNLOCKED(RoundState target);
    std::optional<Winner> firstWinner_UNLOCKED() const;

public:
    Round(int number, const Question& question, double posted_at, double open_duration_seconds,
          std::size_t max_winners = DEFAULT_MAX_WINNERS);

    Round(const Round&) = delete;
    Round& operator=(const Round&) = delete;

    // Admission. Records a Submission in every state except DONE,
    // but only scores while OPEN.
    std::optional<Submission> submit(const MessageEvent& event);

    // Transitions. Repeating the current state is a no-op returning false
    // (or, for reveal, the same result). Going back or skipping a state
    // throws std::logic_error.
    bool lock();
    std::optional<Winner> reveal();
    bool finish();

    int getNumber() const { return m_number; }
    const Question& getQuestion() const { return m_question; }
    double getPostedAt() const { return m_posted_at; }
    double getCutoffAt() const { return m_cutoff_at; }
    std::size_t getMaxWinners() const { return m_max_winners; }

    RoundState getState() const;
    std::vector<Submission> getSubmissions() const;
    std::vector<Winner> getWinners() const;
};
