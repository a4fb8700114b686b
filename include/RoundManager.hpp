#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include "ChatTransport.hpp"
#include "Config.hpp"
#include "LeaderboardAggregator.hpp"
#include "PhaseTimer.hpp"
#include "Round.hpp"

// Sequences the question list. Owns the active Round, routes chat messages
// to it and drives the STOP -> REP -> NEXT timers.
class RoundManager {
private:
    ChatTransport* m_transport;
    LeaderboardAggregator& m_leaderboard;
    GameConfig m_config;
    PhaseDurations m_durations;

    std::vector<Question> m_questions;
    std::size_t m_next_question;
    bool m_started;
    bool m_finished;

    std::shared_ptr<Round> m_active_round;
    std::mutex m_round_mutex;  // guards m_active_round only
    std::mutex m_phase_mutex;  // serializes phase steps (timers and signals)
    std::condition_variable m_finished_cv;

    PhaseTimer m_timer; // last: its worker calls back into the members above

    std::shared_ptr<Round> getActiveRound_Internal();

    // --- Phase steps, caller holds m_phase_mutex ---
    void openNextRound_UNLOCKED();
    void lockRound_UNLOCKED(const std::shared_ptr<Round>& round);
    void revealRound_UNLOCKED(const std::shared_ptr<Round>& round);
    void completeRound_UNLOCKED(const std::shared_ptr<Round>& round, bool send_next);
    void finalizeSession_UNLOCKED();
    std::shared_ptr<Round> roundInState_UNLOCKED(RoundState expected, const char* signal);

    // Timer callbacks carry the round they were scheduled for
    void onOpenTimer(int round_number);
    void onRevealTimer(int round_number);
    void onAdvanceTimer(int round_number);
    void scheduleStep_UNLOCKED(double delay_seconds, void (RoundManager::*step)(int), int round_number);

public:
    RoundManager(ChatTransport* transport, LeaderboardAggregator& leaderboard, const GameConfig& config);
    ~RoundManager();

    RoundManager(const RoundManager&) = delete;
    RoundManager& operator=(const RoundManager&) = delete;

    // Opens the first round. False if already started or no questions.
    bool start(const std::vector<Question>& questions);
    bool start(const std::vector<Question>& questions, const PhaseDurations& durations);

    // Safe to call from any transport thread; drops the event if no round is active.
    void onMessage(const MessageEvent& event);

    // Explicit signals. Each cancels the pending timer and runs its step now;
    // outside its phase it is a no-op.
    void stop();     // OPEN -> LOCKED
    void reveal();   // LOCKED -> REVEALED
    void advance();  // REVEALED -> DONE, then next round or end of session

    bool isStarted();
    bool isFinished();
    void waitUntilFinished();
    bool waitUntilFinished(std::chrono::milliseconds timeout);

    std::shared_ptr<const Round> getActiveRound();
};
