// SM-2 scheduling and due-queue selection

#include "core/Errors.hpp"
#include "core/Scheduler.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace testing_support;

class SchedulerTest : public ::testing::Test {
protected:
  void SetUp() override { quietLogs(); }

  static SchedulingState state(double ease, int interval, int reps) {
    SchedulingState s;
    s.ease_factor = ease;
    s.interval = interval;
    s.repetitions = reps;
    return s;
  }

  Scheduler sched;
};

// ============================================================================
// Rating branches
// ============================================================================

TEST_F(SchedulerTest, GoodOnMatureCardMultipliesIntervalByEase) {
  auto n = sched.next(state(2.5, 6, 2), ReviewQuality::GOOD, kNow);
  EXPECT_DOUBLE_EQ(n.ease_factor, 2.5);
  EXPECT_EQ(n.interval, 15);
  EXPECT_EQ(n.repetitions, 3);
  ASSERT_TRUE(n.next_review.has_value());
  EXPECT_EQ(*n.next_review, kNow + 15 * kDay);
  EXPECT_EQ(n.last_review, std::optional<std::time_t>(kNow));
}

TEST_F(SchedulerTest, AgainResetsRepetitionsAndLowersEase) {
  auto n = sched.next(state(2.5, 6, 2), ReviewQuality::AGAIN, kNow);
  EXPECT_NEAR(n.ease_factor, 2.3, 1e-9);
  EXPECT_EQ(n.interval, 1);
  EXPECT_EQ(n.repetitions, 0);
  EXPECT_EQ(*n.next_review, kNow + kDay);
}

TEST_F(SchedulerTest, HardGrowsIntervalSlowlyAndLowersEase) {
  auto n = sched.next(state(2.5, 6, 2), ReviewQuality::HARD, kNow);
  EXPECT_NEAR(n.ease_factor, 2.35, 1e-9);
  EXPECT_EQ(n.interval, 7); // round(6 * 1.2)
  EXPECT_EQ(n.repetitions, 3);
}

TEST_F(SchedulerTest, HardOnNewCardStillSchedulesAtLeastOneDay) {
  auto n = sched.next(state(2.5, 0, 0), ReviewQuality::HARD, kNow);
  EXPECT_EQ(n.interval, 1);
  EXPECT_GT(*n.next_review, kNow);
}

TEST_F(SchedulerTest, EasyUsesGoodIntervalWithBonus) {
  auto n = sched.next(state(2.5, 6, 2), ReviewQuality::EASY, kNow);
  EXPECT_NEAR(n.ease_factor, 2.65, 1e-9);
  EXPECT_EQ(n.interval, 20); // round(15 * 1.3)
  EXPECT_EQ(n.repetitions, 3);
}

TEST_F(SchedulerTest, FreshCardFollowsOneThenSixDayLadder) {
  auto first = sched.next(sched.initialState(kNow), ReviewQuality::GOOD, kNow);
  EXPECT_EQ(first.interval, 1);
  EXPECT_EQ(first.repetitions, 1);

  auto second = sched.next(first, ReviewQuality::GOOD, kNow + kDay);
  EXPECT_EQ(second.interval, 6);
  EXPECT_EQ(second.repetitions, 2);
}

// ============================================================================
// Bounds
// ============================================================================

TEST_F(SchedulerTest, EaseNeverDropsBelowFloor) {
  SchedulingState s = state(1.35, 3, 4);
  for (int i = 0; i < 10; ++i) {
    s = sched.next(s, i % 2 ? ReviewQuality::AGAIN : ReviewQuality::HARD, kNow);
    EXPECT_GE(s.ease_factor, 1.3);
  }
  EXPECT_DOUBLE_EQ(s.ease_factor, 1.3);
}

TEST_F(SchedulerTest, EaseIsCappedAtCeiling) {
  auto n = sched.next(state(2.95, 10, 3), ReviewQuality::EASY, kNow);
  EXPECT_DOUBLE_EQ(n.ease_factor, 3.0);
}

TEST_F(SchedulerTest, IntervalIsCappedAtMaximum) {
  auto n = sched.next(state(2.5, 30000, 9), ReviewQuality::GOOD, kNow);
  EXPECT_EQ(n.interval, 36500);
}

TEST_F(SchedulerTest, NextReviewAlwaysLiesInTheFuture) {
  for (auto q : {ReviewQuality::AGAIN, ReviewQuality::HARD, ReviewQuality::GOOD,
                 ReviewQuality::EASY}) {
    auto n = sched.next(state(2.5, 0, 0), q, kNow);
    EXPECT_GT(*n.next_review, kNow) << toString(q);
    EXPECT_GE(n.interval, 1) << toString(q);
  }
}

TEST_F(SchedulerTest, InconsistentConfigIsRejected) {
  SchedulerConfig cfg;
  cfg.ease_floor = 3.5;
  EXPECT_THROW(Scheduler{cfg}, ValidationError);

  SchedulerConfig intervals;
  intervals.second_interval_days = 0;
  EXPECT_THROW(Scheduler{intervals}, ValidationError);
}

TEST_F(SchedulerTest, AgainRestartsLadderFromAnyState) {
  for (const auto &s : {state(2.5, 0, 0), state(1.3, 1, 0), state(2.5, 6, 2),
                        state(2.1, 400, 9), state(3.0, 36500, 40)}) {
    auto n = sched.next(s, ReviewQuality::AGAIN, kNow);
    EXPECT_EQ(n.repetitions, 0) << "from interval " << s.interval;
    EXPECT_EQ(n.interval, 1) << "from interval " << s.interval;
    EXPECT_EQ(*n.next_review, kNow + kDay);
  }
}

// ============================================================================
// Interval growth: any run of passing ratings never shortens the interval
// ============================================================================

struct StartState {
  double ease;
  int interval;
  int reps;
};

class IntervalGrowthTest : public ::testing::TestWithParam<StartState> {
protected:
  void SetUp() override { quietLogs(); }

  static ReviewQuality rating(char c) {
    switch (c) {
    case 'H':
      return ReviewQuality::HARD;
    case 'E':
      return ReviewQuality::EASY;
    default:
      return ReviewQuality::GOOD;
    }
  }

  Scheduler sched;
};

TEST_P(IntervalGrowthTest, PassingRatingsNeverShortenInterval) {
  const std::vector<std::string> runs = {"GGGGGG", "HHHHHH", "EEEE",   "HGEHGE",
                                         "GHHEGH", "EHHHGG", "HHGGEE", "GEHHHHHG"};
  for (const auto &run : runs) {
    SchedulingState s;
    s.ease_factor = GetParam().ease;
    s.interval = GetParam().interval;
    s.repetitions = GetParam().reps;

    std::time_t now = kNow;
    for (char c : run) {
      auto n = sched.next(s, rating(c), now);
      EXPECT_GE(n.interval, s.interval) << run << " at '" << c << "' from " << s.interval;
      EXPECT_LE(n.interval, 36500);
      now = *n.next_review;
      s = n;
    }
  }
}

INSTANTIATE_TEST_SUITE_P(
    StartStates, IntervalGrowthTest,
    ::testing::Values(StartState{2.5, 0, 0},      // never reviewed
                      StartState{1.3, 1, 0},      // just lapsed at the ease floor
                      StartState{2.5, 1, 1},      // first step of the ladder
                      StartState{1.3, 6, 2},      // second step, lowest ease
                      StartState{2.5, 15, 3},     // mature
                      StartState{3.0, 30000, 12}, // close to the cap
                      StartState{2.0, 36500, 50}  // at the cap
                      ));

// ============================================================================
// review()
// ============================================================================

TEST_F(SchedulerTest, ReviewProducesLogWithBeforeAndAfter) {
  Card c = activeCard(7, kNow);
  c.sched = state(2.5, 6, 2);

  auto out = sched.review(c, ReviewQuality::GOOD, kNow, 4200);
  EXPECT_EQ(out.log.card_id, 7);
  EXPECT_EQ(out.log.quality, ReviewQuality::GOOD);
  EXPECT_EQ(out.log.before, c.sched);
  EXPECT_EQ(out.log.after, out.after);
  EXPECT_EQ(out.log.response_time_ms, std::optional<int>(4200));
  EXPECT_EQ(out.log.reviewed_at, kNow);
  EXPECT_EQ(out.log.id, 0);
}

TEST_F(SchedulerTest, NegativeResponseTimeIsInvalid) {
  Card c = activeCard(1, kNow);
  EXPECT_THROW(sched.review(c, ReviewQuality::GOOD, kNow, -5), InvalidRating);
}

// ============================================================================
// Due selection
// ============================================================================

TEST_F(SchedulerTest, SelectDueOrdersNeverScheduledFirstThenOldest) {
  std::vector<Card> cards = {
      activeCard(1, kNow - 1 * kDay),
      activeCard(2, std::nullopt),
      activeCard(3, kNow - 3 * kDay),
      activeCard(4, kNow + kDay), // not yet due
      activeCard(5, kNow - 3 * kDay),
  };

  auto due = sched.selectDue(cards, kNow);
  ASSERT_EQ(due.cards.size(), 4u);
  EXPECT_EQ(due.cards[0].id, 2);
  EXPECT_EQ(due.cards[1].id, 3);
  EXPECT_EQ(due.cards[2].id, 5);
  EXPECT_EQ(due.cards[3].id, 1);
  EXPECT_EQ(due.total_due, 4u);
}

TEST_F(SchedulerTest, SelectDueSkipsEverythingButActiveCards) {
  Card draft = activeCard(1, kNow - kDay);
  draft.status = CardStatus::DRAFT;
  Card suspended = activeCard(2, kNow - kDay);
  suspended.status = CardStatus::SUSPENDED;
  Card mastered = activeCard(3, kNow - kDay);
  mastered.status = CardStatus::MASTERED;

  auto due = sched.selectDue({draft, suspended, mastered, activeCard(4, kNow)}, kNow);
  ASSERT_EQ(due.cards.size(), 1u);
  EXPECT_EQ(due.cards[0].id, 4);
}

TEST_F(SchedulerTest, SelectDueFiltersByTagCaseInsensitively) {
  std::vector<Card> cards = {
      activeCard(1, kNow, {"rust"}),
      activeCard(2, kNow, {"go"}),
      activeCard(3, kNow, {"Rust", "systems"}),
  };
  auto due = sched.selectDue(cards, kNow, std::string("RUST"));
  ASSERT_EQ(due.cards.size(), 2u);
  EXPECT_EQ(due.cards[0].id, 1);
  EXPECT_EQ(due.cards[1].id, 3);
}

TEST_F(SchedulerTest, SelectDueLimitKeepsTotalCount) {
  std::vector<Card> cards;
  for (int i = 1; i <= 5; ++i) cards.push_back(activeCard(i, kNow - i * kDay));

  auto due = sched.selectDue(cards, kNow, std::nullopt, std::size_t(2));
  ASSERT_EQ(due.cards.size(), 2u);
  EXPECT_EQ(due.total_due, 5u);
  EXPECT_EQ(due.cards[0].id, 5);
  EXPECT_EQ(due.cards[1].id, 4);
}
