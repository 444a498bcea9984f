#pragma once
#include <map>
#include <mutex>
#include "Repository.hpp"
#include "Snapshot.hpp"

// Repository kept in process memory. One mutex guards every table, so a
// commit is atomic with respect to readers and other commits.
class MemoryRepository : public Repository {
public:
    MemoryRepository() = default;

    std::optional<Source> findSource(std::int64_t id) const override;
    std::optional<Source> findSourceByExternalKey(OriginKind origin, const std::string& key) const override;
    std::vector<Source> sources() const override;

    std::optional<Card> findCard(std::int64_t id) const override;
    std::vector<Card> cards() const override;
    std::vector<Card> cardsForSource(std::int64_t source_id) const override;

    std::vector<ReviewLog> logsForCard(std::int64_t card_id) const override;

    std::vector<Tag> tags() const override;
    std::optional<Tag> findTag(const std::string& name) const override;

    void commit(Changeset& changes) override;

    Snapshot snapshot() const;
    void restore(const Snapshot& snap);

private:
    mutable std::mutex mtx;

    std::map<std::int64_t, Source> source_rows;
    std::map<std::int64_t, Card> card_rows;
    std::vector<ReviewLog> log_rows;
    TagManager tag_rows;

    std::int64_t next_source_id = 1;
    std::int64_t next_card_id = 1;
    std::int64_t next_log_id = 1;

    // Throws if applying `changes` would break a table invariant.
    void validate(const Changeset& changes) const;
    bool externalKeyTaken(OriginKind origin, const std::string& key, std::int64_t except_id) const;
};
