#include "Round.hpp"
#include "AnswerNormalizer.hpp"
#include "AnswerMatcher.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

const char* toString(RoundState state) {
    switch (state) {
        case RoundState::OPEN: return "OPEN";
        case RoundState::LOCKED: return "LOCKED";
        case RoundState::REVEALED: return "REVEALED";
        case RoundState::DONE: return "DONE";
    }
    return "UNKNOWN";
}

Round::Round(int number, const Question& question, double posted_at, double open_duration_seconds,
             std::size_t max_winners)
    : m_number(number),
      m_question(question),
      m_state(RoundState::OPEN),
      m_posted_at(posted_at),
      m_cutoff_at(posted_at + open_duration_seconds),
      m_max_winners(max_winners)
{}

// ==========================================================
// HELPERS - CALLER HOLDS m_mutex
// ==========================================================

bool Round::isValidWindow_UNLOCKED(const std::optional<double>& timestamp) const {
    if (!timestamp || !std::isfinite(*timestamp)) return false;
    if (*timestamp < m_posted_at || *timestamp > m_cutoff_at) return false;
    // Clock disorder must never turn into a negative response time
    return (*timestamp - m_posted_at) >= 0.0;
}

bool Round::admitWinner_UNLOCKED(Submission& submission) {
    if (!submission.is_valid_window || !submission.is_correct) return false;
    if (m_winner_ids.count(submission.sender_id)) return false; // first answer counts
    if (m_winners.size() >= m_max_winners) return false;

    Winner winner;
    winner.sender_id = submission.sender_id;
    winner.sender_name = submission.sender_name;
    winner.message_id = submission.message_id;
    winner.timestamp = *submission.timestamp;
    winner.response_time_seconds = winner.timestamp - m_posted_at;

    // upper_bound keeps equal response times in arrival order
    auto pos = std::upper_bound(m_winners.begin(), m_winners.end(), winner.response_time_seconds,
        [](double t, const Winner& w) { return t < w.response_time_seconds; });
    m_winners.insert(pos, winner);
    m_winner_ids.insert(winner.sender_id);

    submission.is_counted_winner = true;
    return true;
}

bool Round::transitionTo_UNLOCKED(RoundState target) {
    if (target == m_state) return false;

    if (static_cast<int>(target) != static_cast<int>(m_state) + 1) {
        throw std::logic_error("Round " + std::to_string(m_number) + ": illegal transition "
                               + toString(m_state) + " -> " + toString(target));
    }
    m_state = target;
    return true;
}

std::optional<Winner> Round::firstWinner_UNLOCKED() const {
    if (m_winners.empty()) return std::nullopt;
    return m_winners.front();
}

// ==========================================================
// PUBLIC (LOCKING)
// ==========================================================

/**
 * @brief Records one chat message against this question.
 *
 * While OPEN the submission is scored: a correct answer inside the window
 * from a sender who has not won yet is admitted, up to the winner cap.
 * LOCKED and REVEALED rounds keep the record for audit only. Returns
 * nullopt once the round is DONE.
 */
std::optional<Submission> Round::submit(const MessageEvent& event) {
    Submission submission;
    submission.sender_id = event.sender_id;
    submission.sender_name = event.sender_name;
    submission.message_id = event.message_id;
    submission.raw_text = event.body;
    submission.timestamp = event.timestamp;
    submission.normalized_text = answer::normalize(event.body);
    submission.is_correct = answer::isCorrect(submission.normalized_text, m_question.accepted_answers);

    RoundState state_at_admission;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        state_at_admission = m_state;
        if (m_state == RoundState::DONE) {
            return std::nullopt;
        }
        if (m_state == RoundState::OPEN) {
            submission.is_valid_window = isValidWindow_UNLOCKED(submission.timestamp);
            admitWinner_UNLOCKED(submission);
        }
        m_submissions.push_back(submission);
    }

    // Log outside the lock
    std::ostringstream line;
    line << std::fixed << std::setprecision(1) << "Round " << m_number << ": ";
    if (submission.is_counted_winner) {
        line << "correct by " << submission.sender_name << ": " << submission.normalized_text
             << " (+" << (*submission.timestamp - m_posted_at) << "s after question)";
    } else if (state_at_admission != RoundState::OPEN) {
        line << "message from " << submission.sender_name << " recorded while "
             << toString(state_at_admission) << " (not scored)";
    } else if (!submission.is_valid_window) {
        line << "out-of-window message from " << submission.sender_name << ": " << submission.normalized_text
             << " (sent at ";
        if (submission.timestamp) {
            line << *submission.timestamp;
        } else {
            line << "unknown time";
        }
        line << ", window was " << m_posted_at << " .. " << m_cutoff_at << ")";
    } else {
        return submission;
    }
    std::cout << line.str() << std::endl;
    return submission;
}

/**
 * @brief OPEN -> LOCKED. False if already locked; throws on any other state.
 */
bool Round::lock() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return transitionTo_UNLOCKED(RoundState::LOCKED);
}

/**
 * @brief LOCKED -> REVEALED. Returns the fastest winner, if any.
 */
std::optional<Winner> Round::reveal() {
    std::lock_guard<std::mutex> lock(m_mutex);
    transitionTo_UNLOCKED(RoundState::REVEALED);
    return firstWinner_UNLOCKED();
}

bool Round::finish() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return transitionTo_UNLOCKED(RoundState::DONE);
}

RoundState Round::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::vector<Submission> Round::getSubmissions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_submissions;
}

std::vector<Winner> Round::getWinners() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_winners;
}
