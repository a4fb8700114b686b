#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <thread>
#include "Round.hpp"

namespace {

Question capitalQuestion() {
    return Question{"Capital of France?", {"paris"}};
}

MessageEvent message(const std::string& sender, const std::string& body, std::optional<double> ts,
                     const std::string& id = "") {
    MessageEvent e;
    e.message_id = id.empty() ? "msg-" + sender : id;
    e.sender_id = sender;
    e.sender_name = "Name-" + sender;
    e.body = body;
    e.timestamp = ts;
    return e;
}

} // namespace

// --- Admission ---

TEST(RoundTest, CorrectAnswerInsideWindowBecomesWinner) {
    Round round(1, capitalQuestion(), 0.0, 15.0);

    auto sub = round.submit(message("a", " Paris! ", 3.0));
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->normalized_text, "paris");
    EXPECT_TRUE(sub->is_correct);
    EXPECT_TRUE(sub->is_valid_window);
    EXPECT_TRUE(sub->is_counted_winner);

    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 1u);
    EXPECT_EQ(winners[0].sender_id, "a");
    EXPECT_EQ(winners[0].sender_name, "Name-a");
    EXPECT_DOUBLE_EQ(winners[0].response_time_seconds, 3.0);
}

TEST(RoundTest, AnswerAfterCutoffIsRecordedButNotScored) {
    Round round(1, capitalQuestion(), 0.0, 15.0);

    auto sub = round.submit(message("a", "paris", 20.0));
    ASSERT_TRUE(sub.has_value());
    EXPECT_TRUE(sub->is_correct);
    EXPECT_FALSE(sub->is_valid_window);
    EXPECT_FALSE(sub->is_counted_winner);
    EXPECT_TRUE(round.getWinners().empty());
    EXPECT_EQ(round.getSubmissions().size(), 1u);
}

TEST(RoundTest, EqualTimestampsKeepArrivalOrder) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 2.0));
    round.submit(message("b", "paris", 2.0));

    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 2u);
    EXPECT_EQ(winners[0].sender_id, "a");
    EXPECT_EQ(winners[1].sender_id, "b");
}

TEST(RoundTest, OnlyFirstCorrectAnswerPerSenderCounts) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 1.0, "m1"));
    auto second = round.submit(message("a", "Paris", 5.0, "m2"));

    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->is_correct);
    EXPECT_TRUE(second->is_valid_window);
    EXPECT_FALSE(second->is_counted_winner);

    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 1u);
    EXPECT_DOUBLE_EQ(winners[0].timestamp, 1.0);
    EXPECT_EQ(winners[0].message_id, "m1");
    EXPECT_EQ(round.getSubmissions().size(), 2u);
}

TEST(RoundTest, CutoffIsInclusive) {
    Round round(1, capitalQuestion(), 100.0, 15.0);
    EXPECT_DOUBLE_EQ(round.getCutoffAt(), 115.0);

    auto at_cutoff = round.submit(message("a", "paris", 115.0));
    auto past_cutoff = round.submit(message("b", "paris", 115.001));
    EXPECT_TRUE(at_cutoff->is_valid_window);
    EXPECT_TRUE(at_cutoff->is_counted_winner);
    EXPECT_FALSE(past_cutoff->is_valid_window);
    EXPECT_EQ(round.getWinners().size(), 1u);
}

TEST(RoundTest, AnswerAtPostedAtIsValidWithZeroResponseTime) {
    Round round(1, capitalQuestion(), 100.0, 15.0);
    round.submit(message("a", "paris", 100.0));
    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 1u);
    EXPECT_DOUBLE_EQ(winners[0].response_time_seconds, 0.0);
}

TEST(RoundTest, TimestampBeforeQuestionIsInvalid) {
    Round round(1, capitalQuestion(), 100.0, 15.0);
    auto sub = round.submit(message("a", "paris", 99.5));
    EXPECT_FALSE(sub->is_valid_window);
    EXPECT_FALSE(sub->is_counted_winner);
    EXPECT_TRUE(round.getWinners().empty());
}

TEST(RoundTest, MissingOrNonFiniteTimestampIsInvalid) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    auto missing = round.submit(message("a", "paris", std::nullopt));
    auto nan = round.submit(message("b", "paris", std::numeric_limits<double>::quiet_NaN()));
    auto inf = round.submit(message("c", "paris", std::numeric_limits<double>::infinity()));

    EXPECT_FALSE(missing->is_valid_window);
    EXPECT_FALSE(nan->is_valid_window);
    EXPECT_FALSE(inf->is_valid_window);
    EXPECT_TRUE(round.getWinners().empty());
    EXPECT_EQ(round.getSubmissions().size(), 3u);
}

TEST(RoundTest, WrongAnswerIsRecordedNotScored) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    auto sub = round.submit(message("a", "London", 2.0));
    EXPECT_FALSE(sub->is_correct);
    EXPECT_TRUE(sub->is_valid_window);
    EXPECT_FALSE(sub->is_counted_winner);
    EXPECT_TRUE(round.getWinners().empty());
}

TEST(RoundTest, WrongThenCorrectFromSameSenderStillCounts) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "london", 1.0));
    round.submit(message("a", "paris", 2.0));
    ASSERT_EQ(round.getWinners().size(), 1u);
    EXPECT_DOUBLE_EQ(round.getWinners()[0].response_time_seconds, 2.0);
}

TEST(RoundTest, WinnersCappedAtMaximum) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    for (int i = 0; i < 7; ++i) {
        round.submit(message("s" + std::to_string(i), "paris", 1.0 + i));
    }
    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 5u);
    EXPECT_EQ(winners.back().sender_id, "s4");

    auto submissions = round.getSubmissions();
    ASSERT_EQ(submissions.size(), 7u);
    EXPECT_FALSE(submissions[5].is_counted_winner);
    EXPECT_FALSE(submissions[6].is_counted_winner);
}

TEST(RoundTest, CustomWinnerCap) {
    Round round(1, capitalQuestion(), 0.0, 15.0, 2);
    round.submit(message("a", "paris", 1.0));
    round.submit(message("b", "paris", 2.0));
    round.submit(message("c", "paris", 3.0));
    EXPECT_EQ(round.getWinners().size(), 2u);
}

TEST(RoundTest, WinnersSortedByResponseTimeWhenDeliveredOutOfOrder) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 5.0));
    round.submit(message("b", "paris", 3.0));
    round.submit(message("c", "paris", 5.0));
    round.submit(message("d", "paris", 4.0));

    auto winners = round.getWinners();
    ASSERT_EQ(winners.size(), 4u);
    EXPECT_EQ(winners[0].sender_id, "b");
    EXPECT_EQ(winners[1].sender_id, "d");
    EXPECT_EQ(winners[2].sender_id, "a"); // tie with c, arrived first
    EXPECT_EQ(winners[3].sender_id, "c");

    // Submissions stay in arrival order
    auto submissions = round.getSubmissions();
    EXPECT_EQ(submissions[0].sender_id, "a");
    EXPECT_EQ(submissions[1].sender_id, "b");
}

TEST(RoundTest, UnanswerableQuestionNeverHasWinners) {
    Round round(1, Question{"No answer?", {}}, 0.0, 15.0);
    round.submit(message("a", "anything", 1.0));
    round.submit(message("b", "", 2.0));
    EXPECT_TRUE(round.getWinners().empty());
    EXPECT_EQ(round.getSubmissions().size(), 2u);
}

// --- State machine ---

TEST(RoundTest, FullLifecycle) {
    Round round(3, capitalQuestion(), 0.0, 15.0);
    EXPECT_EQ(round.getNumber(), 3);
    EXPECT_EQ(round.getState(), RoundState::OPEN);

    round.submit(message("a", "paris", 4.0, "m7"));

    EXPECT_TRUE(round.lock());
    EXPECT_EQ(round.getState(), RoundState::LOCKED);

    auto first = round.reveal();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->message_id, "m7");
    EXPECT_EQ(round.getState(), RoundState::REVEALED);

    EXPECT_TRUE(round.finish());
    EXPECT_EQ(round.getState(), RoundState::DONE);
}

TEST(RoundTest, RepeatedTransitionsAreNoOps) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 1.0));

    EXPECT_TRUE(round.lock());
    auto winners_after_first = round.getWinners();
    EXPECT_FALSE(round.lock());
    EXPECT_EQ(round.getState(), RoundState::LOCKED);
    EXPECT_EQ(round.getWinners().size(), winners_after_first.size());

    auto first = round.reveal();
    auto again = round.reveal();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(first->sender_id, again->sender_id);
    EXPECT_EQ(round.getState(), RoundState::REVEALED);

    EXPECT_TRUE(round.finish());
    EXPECT_FALSE(round.finish());
    EXPECT_EQ(round.getState(), RoundState::DONE);
}

TEST(RoundTest, RevealWithoutWinnersSignalsNoCorrectAnswer) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "london", 1.0));
    round.lock();
    EXPECT_FALSE(round.reveal().has_value());
    EXPECT_TRUE(round.finish());
}

TEST(RoundTest, SkippingAStateThrows) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    EXPECT_THROW(round.reveal(), std::logic_error);
    EXPECT_THROW(round.finish(), std::logic_error);
    EXPECT_EQ(round.getState(), RoundState::OPEN);

    round.lock();
    EXPECT_THROW(round.finish(), std::logic_error);
    EXPECT_EQ(round.getState(), RoundState::LOCKED);
}

TEST(RoundTest, GoingBackwardsThrows) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.lock();
    round.reveal();
    EXPECT_THROW(round.lock(), std::logic_error);
    round.finish();
    EXPECT_THROW(round.lock(), std::logic_error);
    EXPECT_THROW(round.reveal(), std::logic_error);
    EXPECT_EQ(round.getState(), RoundState::DONE);
}

TEST(RoundTest, MessagesAfterLockAreAuditedOnly) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 1.0));
    round.lock();

    // Timestamp is inside the window but the round is locked
    auto late = round.submit(message("b", "paris", 2.0));
    ASSERT_TRUE(late.has_value());
    EXPECT_TRUE(late->is_correct);
    EXPECT_FALSE(late->is_valid_window);
    EXPECT_FALSE(late->is_counted_winner);

    round.reveal();
    auto later = round.submit(message("c", "paris", 3.0));
    ASSERT_TRUE(later.has_value());
    EXPECT_FALSE(later->is_counted_winner);

    EXPECT_EQ(round.getWinners().size(), 1u);
    EXPECT_EQ(round.getSubmissions().size(), 3u);
}

TEST(RoundTest, NothingRecordedAfterDone) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    round.submit(message("a", "paris", 1.0));
    round.lock();
    round.reveal();
    round.finish();

    EXPECT_FALSE(round.submit(message("b", "paris", 2.0)).has_value());
    EXPECT_EQ(round.getSubmissions().size(), 1u);
    EXPECT_EQ(round.getWinners().size(), 1u);
}

// --- Concurrency ---

TEST(RoundTest, ConcurrentSubmittersKeepInvariants) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    const int threads = 8;
    const int per_thread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&round, t]() {
            for (int i = 0; i < per_thread; ++i) {
                // Each thread is one sender answering repeatedly
                round.submit(message("t" + std::to_string(t), i % 2 ? "Paris" : "nope", 1.0 + (i % 10)));
            }
        });
    }
    for (auto& w : workers) w.join();

    auto winners = round.getWinners();
    EXPECT_LE(winners.size(), 5u);
    EXPECT_FALSE(winners.empty());

    std::set<std::string> ids;
    for (std::size_t i = 0; i < winners.size(); ++i) {
        ids.insert(winners[i].sender_id);
        EXPECT_GE(winners[i].response_time_seconds, 0.0);
        if (i > 0) {
            EXPECT_LE(winners[i - 1].response_time_seconds, winners[i].response_time_seconds);
        }
    }
    EXPECT_EQ(ids.size(), winners.size());
    EXPECT_EQ(round.getSubmissions().size(), static_cast<std::size_t>(threads * per_thread));
}

TEST(RoundTest, LockRacingWithSubmittersIsConsistent) {
    Round round(1, capitalQuestion(), 0.0, 15.0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&round, t]() {
            for (int i = 0; i < 100; ++i) {
                round.submit(message("s" + std::to_string(t) + "-" + std::to_string(i), "paris", 2.0));
            }
        });
    }
    workers.emplace_back([&round]() { round.lock(); });
    workers.emplace_back([&round]() { round.lock(); });
    for (auto& w : workers) w.join();

    EXPECT_EQ(round.getState(), RoundState::LOCKED);
    EXPECT_LE(round.getWinners().size(), 5u);

    // Every counted submission corresponds to exactly one winner
    std::size_t counted = 0;
    for (const auto& s : round.getSubmissions()) {
        if (s.is_counted_winner) ++counted;
    }
    EXPECT_EQ(counted, round.getWinners().size());
}
