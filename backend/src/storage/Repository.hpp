#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include "../core/Card.hpp"
#include "../core/Source.hpp"
#include "../core/ReviewLog.hpp"
#include "../core/TagManager.hpp"
#include "../core/Changeset.hpp"

// Durable storage boundary. The core only reads entity copies through it and
// hands back a Changeset; how the data is kept is up to the implementation.
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::optional<Source> findSource(std::int64_t id) const = 0;
    virtual std::optional<Source> findSourceByExternalKey(OriginKind origin, const std::string& key) const = 0;
    virtual std::vector<Source> sources() const = 0;

    virtual std::optional<Card> findCard(std::int64_t id) const = 0;
    virtual std::vector<Card> cards() const = 0;
    virtual std::vector<Card> cardsForSource(std::int64_t source_id) const = 0;

    virtual std::vector<ReviewLog> logsForCard(std::int64_t card_id) const = 0;

    virtual std::vector<Tag> tags() const = 0;
    virtual std::optional<Tag> findTag(const std::string& name) const = 0;

    // Applies every change or none. Assigns ids to inserted entities in place.
    virtual void commit(Changeset& changes) = 0;
};
