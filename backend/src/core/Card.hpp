#pragma once
#include <string>
#include <ctime>
#include <cstdint>
#include <optional>
#include <vector>
#include "Status.hpp"
#include "Tagged.hpp"

// SM-2 state of one card. Value type: the scheduler never mutates it in
// place, it returns the next one.
struct SchedulingState {
    double ease_factor = 2.5;
    int interval = 0;                       // Days
    int repetitions = 0;                    // Successful reviews in a row
    std::optional<std::time_t> next_review; // nullopt: never scheduled
    std::optional<std::time_t> last_review;

    bool operator==(const SchedulingState& o) const {
        return ease_factor == o.ease_factor && interval == o.interval &&
            repetitions == o.repetitions && next_review == o.next_review &&
            last_review == o.last_review;
    }
    bool operator!=(const SchedulingState& o) const { return !(*this == o); }
};

class Card : public Tagged {
public:
    Card() = default;
    Card(const std::string& front, const std::string& back);

    std::int64_t id = 0;  // 0 until the repository assigns one
    std::string front;
    std::string back;
    std::optional<std::string> hint;
    std::optional<std::int64_t> source_id; // Manual cards have none

    CardStatus status = CardStatus::DRAFT;
    SchedulingState sched;

    std::time_t created_at = 0;
    std::time_t updated_at = 0;

    bool isDraft() const { return status == CardStatus::DRAFT; }
    std::string summary() const; // single line for logs and lists
};

// One proposal from a card-drafting collaborator.
struct CardDraft {
    std::string front;
    std::string back;
    std::optional<std::string> hint;
    std::vector<std::string> tags;
};

// Manual card creation.
struct CardInput {
    std::string front;
    std::string back;
    std::optional<std::string> hint;
    std::vector<std::string> tags;
    std::optional<std::int64_t> source_id;
};

// Partial update; unset fields are left alone.
struct CardEdit {
    std::optional<std::string> front;
    std::optional<std::string> back;
    std::optional<std::string> hint;
    std::optional<std::vector<std::string>> tags;
};
