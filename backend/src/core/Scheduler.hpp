#pragma once
#include <vector>
#include <string>
#include <ctime>
#include <cstddef>
#include <optional>
#include "Card.hpp"
#include "ReviewLog.hpp"
#include "Status.hpp"

// Tuneable SM-2 constants. Defaults follow classic SM-2 with the
// hard/easy adjustments used by Anki-style four-button grading.
struct SchedulerConfig {
    double initial_ease = 2.5;
    double ease_floor = 1.3;
    double ease_ceiling = 3.0;
    double again_penalty = 0.20;
    double hard_penalty = 0.15;
    double easy_bonus = 0.15;
    double hard_multiplier = 1.2;
    double easy_multiplier = 1.3;
    int lapse_interval_days = 1;
    int first_interval_days = 1;
    int second_interval_days = 6;
    int max_interval_days = 36500;
};

struct ReviewOutcome {
    SchedulingState after;
    ReviewLog log;
};

struct DueCards {
    std::vector<Card> cards; // at most `limit` entries
    std::size_t total_due = 0; // over the whole filtered set
};

/*
  SM-2 review scheduler.

  review() is a pure function of (state, rating, instant): it returns the
  next scheduling state and the log entry describing the update and never
  touches anything else. Whether a card may be reviewed at all (status) is
  checked by the caller.

  selectDue() is the read-only due query:
    - due iff status is active and next_review is unset or <= now
    - ordered never-scheduled first, then by next_review, then by id
*/
class Scheduler {
public:
    explicit Scheduler(SchedulerConfig config = SchedulerConfig());

    ReviewOutcome review(const Card& card, ReviewQuality quality, std::time_t now,
        std::optional<int> response_time_ms = std::nullopt) const;

    SchedulingState next(const SchedulingState& state, ReviewQuality quality, std::time_t now) const;

    // State given to a card when it enters the review rotation.
    SchedulingState initialState(std::time_t now) const;

    DueCards selectDue(const std::vector<Card>& cards, std::time_t now,
        const std::optional<std::string>& tag = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt) const;

    static bool isDue(const Card& card, std::time_t now);

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;

    // Interval for a remembered rating before the easy bonus is applied.
    int successInterval(const SchedulingState& state, int repetitions) const;
    int clampInterval(long days) const;
    double clampEase(double ease) const;
    static std::time_t addDays(std::time_t from, int days);
};
