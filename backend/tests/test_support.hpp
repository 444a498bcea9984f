#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/Card.hpp"

namespace testing_support
{
    // 2024-03-01 12:00:00 UTC
    constexpr std::time_t kNow = 1709294400;
    constexpr std::time_t kDay = 24 * 60 * 60;

    inline void quietLogs() { spdlog::set_level(spdlog::level::warn); }

    inline Card activeCard(std::int64_t id, std::optional<std::time_t> next_review,
        std::vector<std::string> tags = {}) {
        Card c("front " + std::to_string(id), "back " + std::to_string(id));
        c.id = id;
        c.status = CardStatus::ACTIVE;
        c.sched.next_review = next_review;
        c.setTags(tags);
        return c;
    }
}
