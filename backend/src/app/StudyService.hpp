#pragma once
#include <cstddef>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "CardDrafter.hpp"
#include "EntityLocks.hpp"
#include "../core/Lifecycle.hpp"
#include "../core/Scheduler.hpp"
#include "../storage/Repository.hpp"

struct CreateSourceResult {
    Source source;
    bool created = false; // false: external key already imported, existing source returned
};

struct ImportSummary {
    std::size_t created = 0;
    std::size_t skipped = 0;  // duplicates
    std::size_t rejected = 0; // invalid entries
};

struct ApprovalResult {
    Source source;
    std::size_t activated = 0;
};

struct SourceSummary {
    Source source;
    std::size_t card_count = 0;
};

struct CardQuery {
    std::optional<CardStatus> status;
    std::optional<std::string> tag;
    std::optional<std::int64_t> source_id;
    std::size_t page = 1;
    std::size_t per_page = 20;
};

struct SourceQuery {
    std::optional<SourceStatus> status;
    std::optional<OriginKind> origin;
    std::optional<std::string> tag;
    std::size_t page = 1;
    std::size_t per_page = 20;
};

template <typename T>
struct Page {
    std::vector<T> items;
    std::size_t total = 0;
};

struct TagStats {
    Tag tag;
    std::size_t source_count = 0;
    std::size_t card_count = 0;
};

struct ExportEntry {
    Source source;
    std::vector<Card> cards; // its active cards
};

// What the markdown export needs: approved sources, every active card
// (manual ones included) and the moment the bundle was taken.
struct ExportBundle {
    std::vector<ExportEntry> sources;
    std::vector<Card> cards;
    std::time_t generated_at = 0;
};

/*
  Entry point for producers and the presentation layer.

  Each mutating call locks the entities it touches, reads fresh copies from
  the repository, lets the lifecycle controller (or scheduler) plan the
  change and commits the resulting Changeset in one step. A rejected call
  throws before the commit, so nothing changes.

  Writes to a card that belongs to a source also hold that source's lock;
  source-wide operations (generation, approval) therefore exclude concurrent
  writes to any of the source's cards.
*/
class StudyService {
public:
    using Clock = std::function<std::time_t()>;

    explicit StudyService(Repository& repo, SchedulerConfig config = SchedulerConfig(), Clock clock = Clock());

    // Producers
    CreateSourceResult createSource(const SourceInput& input, bool strict = false);
    ImportSummary importSources(const std::vector<SourceInput>& inputs);

    // Source lifecycle
    std::vector<Card> generateCards(std::int64_t source_id, CardDrafter& drafter);
    ApprovalResult approve(std::int64_t source_id);
    Source archive(std::int64_t source_id);
    Source setSourceStatus(std::int64_t source_id, SourceStatus target);
    Source editSource(std::int64_t source_id, const SourceEdit& edit);

    // Cards
    Card createCard(const CardInput& input, bool activate = true);
    Card editCard(std::int64_t card_id, const CardEdit& edit);
    void deleteCard(std::int64_t card_id);
    Card setCardStatus(std::int64_t card_id, CardStatus target);

    // Reviews
    Card submitReview(std::int64_t card_id, ReviewQuality quality, std::optional<int> response_time_ms = std::nullopt);
    Card submitReview(std::int64_t card_id, int raw_rating, std::optional<int> response_time_ms = std::nullopt);
    DueCards listDue(const std::optional<std::string>& tag = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt) const;
    std::vector<ReviewLog> cardHistory(std::int64_t card_id) const; // newest first

    // Queries
    Source getSource(std::int64_t id) const;
    Card getCard(std::int64_t id) const;
    Page<SourceSummary> listSources(const SourceQuery& query) const;
    Page<Card> listCards(const CardQuery& query) const;

    // Tags
    std::vector<Tag> tags() const;
    Tag createTag(const std::string& name, const std::optional<std::string>& color = std::nullopt);
    TagStats tagStats(const std::string& name) const;
    // Also strips the tag from every source and card carrying it.
    void deleteTag(const std::string& name);

    // Export collaborator, read only
    ExportBundle exportBundle() const;

    const Scheduler& scheduler() const { return sched; }
    std::time_t now() const { return clock(); }

private:
    Repository& repo;
    Scheduler sched;
    LifecycleController lifecycle;
    Clock clock;
    EntityLocks locks;
    std::mutex tag_mtx;

    Source requireSource(std::int64_t id) const;
    Card requireCard(std::int64_t id) const;
    std::optional<Source> ownerOf(const Card& card) const;
    std::vector<std::unique_lock<std::mutex>> lockCard(const Card& card);
    Card commitCard(Changeset& cs);
    static void checkPaging(std::size_t page, std::size_t per_page);
};
