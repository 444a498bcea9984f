#pragma once
#include <vector>
#include <cstdint>
#include "../core/Card.hpp"
#include "../core/Source.hpp"
#include "../core/ReviewLog.hpp"
#include "../core/TagManager.hpp"

// Full repository contents, as written to and read from disk.
struct Snapshot {
    std::vector<Source> sources;
    std::vector<Card> cards;
    std::vector<ReviewLog> logs;
    std::vector<Tag> tags;
    std::int64_t next_source_id = 1;
    std::int64_t next_card_id = 1;
    std::int64_t next_log_id = 1;
};
