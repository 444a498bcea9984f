#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "Card.hpp"
#include "Source.hpp"
#include "ReviewLog.hpp"
#include "TagManager.hpp"

// Everything one operation wants to write. A repository applies a
// changeset completely or not at all; entities with id 0 are inserted and
// receive their id in place.
struct Changeset {
    std::vector<Source> sources;
    std::vector<Card> cards;
    std::vector<std::int64_t> removed_cards; // draft cards only
    std::vector<ReviewLog> logs;
    std::vector<Tag> tags; // registered if missing, keyed by name
    std::vector<std::string> removed_tags; // unregistered after the entity writes

    bool empty() const {
        return sources.empty() && cards.empty() && removed_cards.empty() &&
            logs.empty() && tags.empty() && removed_tags.empty();
    }
};
