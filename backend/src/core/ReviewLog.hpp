#pragma once
#include <ctime>
#include <cstdint>
#include <optional>
#include "Card.hpp"
#include "Status.hpp"

// One rating event. Append-only: written once by the repository commit that
// carries the card update, never edited afterwards.
struct ReviewLog {
    std::int64_t id = 0;
    std::int64_t card_id = 0;
    ReviewQuality quality = ReviewQuality::GOOD;
    SchedulingState before;
    SchedulingState after;
    std::optional<int> response_time_ms;
    std::time_t reviewed_at = 0;
};
