#include "RoundManager.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

RoundManager::RoundManager(ChatTransport* transport, LeaderboardAggregator& leaderboard, const GameConfig& config)
    : m_transport(transport),
      m_leaderboard(leaderboard),
      m_config(config),
      m_durations(config.durations),
      m_next_question(0),
      m_started(false),
      m_finished(false)
{}

RoundManager::~RoundManager() {
    m_timer.shutdown();
}

std::shared_ptr<Round> RoundManager::getActiveRound_Internal() {
    std::lock_guard<std::mutex> lock(m_round_mutex);
    return m_active_round;
}

std::shared_ptr<const Round> RoundManager::getActiveRound() {
    return getActiveRound_Internal();
}

// ==========================================================
// SESSION CONTROL
// ==========================================================

/**
 * @brief Starts the session with the configured phase durations.
 */
bool RoundManager::start(const std::vector<Question>& questions) {
    return start(questions, m_config.durations);
}

/**
 * @brief Starts the session and opens the first round.
 * Returns false if a session was already started or the list is empty.
 */
bool RoundManager::start(const std::vector<Question>& questions, const PhaseDurations& durations) {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    if (m_started) {
        std::cerr << "RoundManager: session already started" << std::endl;
        return false;
    }
    if (questions.empty()) {
        std::cerr << "RoundManager: no questions, not starting" << std::endl;
        return false;
    }

    m_questions = questions;
    m_durations = durations;
    m_next_question = 0;
    m_started = true;

    std::cout << "RoundManager: starting trivia with " << m_questions.size() << " questions" << std::endl;
    openNextRound_UNLOCKED();
    return true;
}

/**
 * @brief Hands a chat message to the active round. Never blocks on a phase step.
 */
void RoundManager::onMessage(const MessageEvent& event) {
    std::shared_ptr<Round> round = getActiveRound_Internal();
    if (!round) return; // not started yet, or already finished

    round->submit(event);
}

bool RoundManager::isStarted() {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    return m_started;
}

bool RoundManager::isFinished() {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    return m_finished;
}

void RoundManager::waitUntilFinished() {
    std::unique_lock<std::mutex> lock(m_phase_mutex);
    m_finished_cv.wait(lock, [this] { return m_finished; });
}

bool RoundManager::waitUntilFinished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_phase_mutex);
    return m_finished_cv.wait_for(lock, timeout, [this] { return m_finished; });
}

// ==========================================================
// EXPLICIT SIGNALS
// ==========================================================

std::shared_ptr<Round> RoundManager::roundInState_UNLOCKED(RoundState expected, const char* signal) {
    std::shared_ptr<Round> round = getActiveRound_Internal();
    if (!round) {
        std::cout << "RoundManager: " << signal << " ignored, no active round" << std::endl;
        return nullptr;
    }
    RoundState state = round->getState();
    if (state != expected) {
        std::cout << "RoundManager: " << signal << " ignored, round " << round->getNumber()
                  << " is " << toString(state) << std::endl;
        return nullptr;
    }
    return round;
}

/**
 * @brief Explicit STOP: locks the open round now instead of at the cutoff timer.
 */
void RoundManager::stop() {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = roundInState_UNLOCKED(RoundState::OPEN, "STOP");
    if (!round) return;
    m_timer.cancel();
    lockRound_UNLOCKED(round);
}

void RoundManager::reveal() {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = roundInState_UNLOCKED(RoundState::LOCKED, "REP");
    if (!round) return;
    m_timer.cancel();
    revealRound_UNLOCKED(round);
}

void RoundManager::advance() {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = roundInState_UNLOCKED(RoundState::REVEALED, "NEXT");
    if (!round) return;
    m_timer.cancel();
    completeRound_UNLOCKED(round, true);
}

// ==========================================================
// TIMER CALLBACKS
// ==========================================================

void RoundManager::scheduleStep_UNLOCKED(double delay_seconds, void (RoundManager::*step)(int), int round_number) {
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(delay_seconds));
    m_timer.schedule(delay, [this, step, round_number]() { (this->*step)(round_number); });
}

void RoundManager::onOpenTimer(int round_number) {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = getActiveRound_Internal();
    // Stale: a signal got there first, or the round is gone
    if (!round || round->getNumber() != round_number || round->getState() != RoundState::OPEN) return;
    lockRound_UNLOCKED(round);
}

void RoundManager::onRevealTimer(int round_number) {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = getActiveRound_Internal();
    if (!round || round->getNumber() != round_number || round->getState() != RoundState::LOCKED) return;
    revealRound_UNLOCKED(round);
}

void RoundManager::onAdvanceTimer(int round_number) {
    std::lock_guard<std::mutex> lock(m_phase_mutex);
    auto round = getActiveRound_Internal();
    if (!round || round->getNumber() != round_number || round->getState() != RoundState::REVEALED) return;
    completeRound_UNLOCKED(round, true);
}

// ==========================================================
// PHASE STEPS (m_phase_mutex HELD)
// ==========================================================

void RoundManager::openNextRound_UNLOCKED() {
    const Question& question = m_questions[m_next_question];
    int number = static_cast<int>(m_next_question) + 1;
    ++m_next_question;

    // The round is live before the question goes out: answers racing the
    // broadcast must find it OPEN and stamped no earlier than posted_at.
    double posted_at = m_transport->serverTime();
    auto round = std::make_shared<Round>(number, question, posted_at, m_durations.open_seconds,
                                         m_config.max_winners_per_round);
    {
        std::lock_guard<std::mutex> lock(m_round_mutex);
        m_active_round = round; // old round is released here
    }
    scheduleStep_UNLOCKED(m_durations.open_seconds, &RoundManager::onOpenTimer, number);

    m_transport->send("Q" + std::to_string(number) + ": " + question.text);

    std::ostringstream times;
    times << std::fixed << std::setprecision(1)
          << "  posted at " << round->getPostedAt() << ", cutoff " << round->getCutoffAt();
    std::cout << "QUESTION " << number << ": " << question.text << std::endl;
    std::cout << times.str() << std::endl;
}

void RoundManager::lockRound_UNLOCKED(const std::shared_ptr<Round>& round) {
    if (!round->lock()) return;

    m_transport->send("STOP");
    std::cout << "Round " << round->getNumber() << ": STOP sent" << std::endl;

    scheduleStep_UNLOCKED(m_durations.reveal_delay_seconds, &RoundManager::onRevealTimer, round->getNumber());
}

void RoundManager::revealRound_UNLOCKED(const std::shared_ptr<Round>& round) {
    std::optional<Winner> first = round->reveal();

    if (first) {
        if (!first->message_id.empty()) {
            m_transport->reply("REP", first->message_id);
        } else {
            m_transport->send("REP: " + first->sender_name);
        }
        std::cout << "Round " << round->getNumber() << ": REP (quoted) - "
                  << round->getWinners().size() << " correct answer(s)" << std::endl;
    } else {
        const auto& accepted = round->getQuestion().accepted_answers; // std::set: already sorted
        std::string answers;
        for (const auto& a : accepted) {
            if (!answers.empty()) answers += " / ";
            answers += a;
        }
        m_transport->send("REP: " + (answers.empty() ? std::string("(no accepted answer)") : answers));
        std::cout << "Round " << round->getNumber() << ": REP (no correct answers)" << std::endl;
    }

    if (m_next_question >= m_questions.size()) {
        // Last question: no NEXT
        completeRound_UNLOCKED(round, false);
        return;
    }
    scheduleStep_UNLOCKED(m_durations.advance_delay_seconds, &RoundManager::onAdvanceTimer, round->getNumber());
}

void RoundManager::completeRound_UNLOCKED(const std::shared_ptr<Round>& round, bool send_next) {
    if (send_next) {
        m_transport->send("NEXT");
        std::cout << "Round " << round->getNumber() << ": NEXT sent" << std::endl;
    }
    if (!round->finish()) return;

    m_leaderboard.record(round->getQuestion().text, round->getWinners());

    if (m_next_question < m_questions.size()) {
        openNextRound_UNLOCKED();
    } else {
        finalizeSession_UNLOCKED();
    }
}

void RoundManager::finalizeSession_UNLOCKED() {
    {
        std::lock_guard<std::mutex> lock(m_round_mutex);
        m_active_round.reset();
    }
    m_timer.cancel();
    m_leaderboard.finalize();
    m_finished = true;

    std::cout << "All questions completed!" << std::endl;
    m_finished_cv.notify_all();
}
