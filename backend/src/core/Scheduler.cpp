#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>

Scheduler::Scheduler(SchedulerConfig config)
    : cfg(config)
{
    if (cfg.ease_floor <= 0.0 || cfg.ease_ceiling < cfg.ease_floor) {
        throw ValidationError("scheduler ease bounds are inconsistent");
    }
    if (cfg.initial_ease < cfg.ease_floor || cfg.initial_ease > cfg.ease_ceiling) {
        throw ValidationError("scheduler initial ease is outside the ease bounds");
    }
    if (cfg.lapse_interval_days < 1 || cfg.first_interval_days < 1 ||
        cfg.second_interval_days < cfg.first_interval_days || cfg.max_interval_days < cfg.second_interval_days) {
        throw ValidationError("scheduler intervals are inconsistent");
    }
    if (cfg.hard_multiplier < 1.0 || cfg.easy_multiplier < 1.0) {
        throw ValidationError("scheduler multipliers must be >= 1");
    }
    spdlog::debug("Scheduler (SM-2) initialized: ease {}..{}, max interval {}d",
        cfg.ease_floor, cfg.ease_ceiling, cfg.max_interval_days);
}

ReviewOutcome Scheduler::review(const Card& card, ReviewQuality q, std::time_t now,
    std::optional<int> response_time_ms) const {
    if (response_time_ms && *response_time_ms < 0) {
        throw InvalidRating("response time must not be negative");
    }

    ReviewOutcome out;
    out.after = next(card.sched, q, now);

    out.log.card_id = card.id;
    out.log.quality = q;
    out.log.before = card.sched;
    out.log.after = out.after;
    out.log.response_time_ms = response_time_ms;
    out.log.reviewed_at = now;

    spdlog::info("Review card {} | q={} | interval {}d -> {}d | ease {:.2f} -> {:.2f}",
        card.id, toString(q), card.sched.interval, out.after.interval,
        card.sched.ease_factor, out.after.ease_factor);
    return out;
}

SchedulingState Scheduler::next(const SchedulingState& s, ReviewQuality q, std::time_t now) const {
    SchedulingState n = s;

    switch (q) {
    case ReviewQuality::AGAIN:
        // Forgotten: back to the start of the ladder
        n.repetitions = 0;
        n.interval = cfg.lapse_interval_days;
        n.ease_factor = clampEase(s.ease_factor - cfg.again_penalty);
        break;
    case ReviewQuality::HARD:
        n.repetitions = s.repetitions + 1;
        n.interval = clampInterval(std::max(1L, std::lround(s.interval * cfg.hard_multiplier)));
        n.ease_factor = clampEase(s.ease_factor - cfg.hard_penalty);
        break;
    case ReviewQuality::GOOD:
        n.repetitions = s.repetitions + 1;
        n.interval = successInterval(s, n.repetitions);
        break;
    case ReviewQuality::EASY:
        n.repetitions = s.repetitions + 1;
        n.interval = clampInterval(std::max(1L,
            std::lround(successInterval(s, n.repetitions) * cfg.easy_multiplier)));
        n.ease_factor = clampEase(s.ease_factor + cfg.easy_bonus);
        break;
    default:
        throw InvalidRating("unknown review quality " + std::to_string(static_cast<int>(q)));
    }

    n.last_review = now;
    n.next_review = addDays(now, n.interval);
    return n;
}

SchedulingState Scheduler::initialState(std::time_t now) const {
    SchedulingState s;
    s.ease_factor = cfg.initial_ease;
    s.interval = 0;
    s.repetitions = 0;
    s.next_review = now; // due immediately
    s.last_review = std::nullopt;
    return s;
}

DueCards Scheduler::selectDue(const std::vector<Card>& cards, std::time_t now,
    const std::optional<std::string>& tag, std::optional<std::size_t> limit) const {
    DueCards result;
    for (const auto& c : cards) {
        if (tag && !c.hasTag(*tag)) continue;
        if (isDue(c, now)) result.cards.push_back(c);
    }

    std::sort(result.cards.begin(), result.cards.end(),
        [](const Card& a, const Card& b) {
            if (a.sched.next_review.has_value() != b.sched.next_review.has_value())
                return !a.sched.next_review.has_value(); // never scheduled = most overdue
            if (a.sched.next_review && *a.sched.next_review != *b.sched.next_review)
                return *a.sched.next_review < *b.sched.next_review;
            return a.id < b.id;
        });

    result.total_due = result.cards.size();
    if (limit && result.cards.size() > *limit) {
        result.cards.resize(*limit);
    }
    return result;
}

bool Scheduler::isDue(const Card& card, std::time_t now) {
    if (card.status != CardStatus::ACTIVE) return false;
    return !card.sched.next_review || *card.sched.next_review <= now;
}

int Scheduler::successInterval(const SchedulingState& s, int repetitions) const {
    if (repetitions == 1) return cfg.first_interval_days;
    if (repetitions == 2) return cfg.second_interval_days;
    return clampInterval(std::max(1L, std::lround(s.interval * s.ease_factor)));
}

int Scheduler::clampInterval(long days) const {
    return static_cast<int>(std::min<long>(days, cfg.max_interval_days));
}

double Scheduler::clampEase(double ease) const {
    return std::clamp(ease, cfg.ease_floor, cfg.ease_ceiling);
}

std::time_t Scheduler::addDays(std::time_t from, int days) {
    using namespace std::chrono;
    auto future = system_clock::from_time_t(from) + hours(24 * days);
    return system_clock::to_time_t(future);
}
