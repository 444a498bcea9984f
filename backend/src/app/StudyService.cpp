#include "StudyService.hpp"
#include "../core/Errors.hpp"
#include "../utils/strings.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

StudyService::StudyService(Repository& r, SchedulerConfig config, Clock c)
    : repo(r),
    sched(config),
    lifecycle(sched),
    clock(c ? c : Clock([] { return std::time(nullptr); }))
{
}

Source StudyService::requireSource(std::int64_t id) const {
    auto s = repo.findSource(id);
    if (!s) throw NotFound("source " + std::to_string(id) + " not found");
    return *s;
}

Card StudyService::requireCard(std::int64_t id) const {
    auto c = repo.findCard(id);
    if (!c) throw NotFound("card " + std::to_string(id) + " not found");
    return *c;
}

std::optional<Source> StudyService::ownerOf(const Card& card) const {
    if (!card.source_id) return std::nullopt;
    return requireSource(*card.source_id);
}

std::vector<std::unique_lock<std::mutex>> StudyService::lockCard(const Card& card) {
    std::vector<EntityLocks::Key> keys{ { EntityLocks::Kind::CARD, card.id } };
    if (card.source_id) keys.push_back({ EntityLocks::Kind::SOURCE, *card.source_id });
    return locks.lockAll(keys);
}

Card StudyService::commitCard(Changeset& cs) {
    repo.commit(cs);
    return cs.cards.front();
}

/* -------------------------
   Producers
   ------------------------- */

CreateSourceResult StudyService::createSource(const SourceInput& input, bool strict) {
    const std::time_t t = now();
    Changeset cs = lifecycle.planNewSource(input, t);
    const Source& planned = cs.sources.front();

    if (planned.external_key) {
        auto existing = repo.findSourceByExternalKey(planned.origin, *planned.external_key);
        if (existing) {
            if (strict) {
                throw DuplicateExternalKey("external key '" + *planned.external_key + "' already imported as source " +
                    std::to_string(existing->id));
            }
            spdlog::info("Source with external key '{}' already exists (id={}); skipping",
                *planned.external_key, existing->id);
            return { *existing, false };
        }
    }

    try {
        repo.commit(cs);
    }
    catch (const DuplicateExternalKey&) {
        // Lost a race with a concurrent import of the same key
        if (strict) throw;
        auto existing = repo.findSourceByExternalKey(planned.origin, *planned.external_key);
        if (!existing) throw;
        return { *existing, false };
    }

    spdlog::info("Created source {} ({}) with {} tag(s)", cs.sources.front().id,
        toString(cs.sources.front().origin), cs.sources.front().tags.size());
    return { cs.sources.front(), true };
}

ImportSummary StudyService::importSources(const std::vector<SourceInput>& inputs) {
    ImportSummary summary;
    for (const auto& in : inputs) {
        try {
            if (createSource(in, false).created) summary.created++;
            else summary.skipped++;
        }
        catch (const ValidationError& e) {
            spdlog::warn("Import entry rejected: {}", e.what());
            summary.rejected++;
        }
    }
    spdlog::info("Import finished: {} created, {} duplicate(s), {} rejected",
        summary.created, summary.skipped, summary.rejected);
    return summary;
}

/* -------------------------
   Source lifecycle
   ------------------------- */

std::vector<Card> StudyService::generateCards(std::int64_t source_id, CardDrafter& drafter) {
    Source snapshot = requireSource(source_id);
    if (!canTransition(snapshot.status, SourceStatus::CARDS_GENERATED)) {
        throw InvalidTransition("source " + std::to_string(source_id) + " is " + toString(snapshot.status) +
            "; cards can only be generated while pending review or generated");
    }

    // The drafter may be slow; it runs without holding the source lock
    std::vector<CardDraft> drafts = drafter.draft(snapshot);

    auto held = locks.lockAll({ { EntityLocks::Kind::SOURCE, source_id } });
    Source source = requireSource(source_id);
    Changeset cs = lifecycle.planGeneration(source, repo.cardsForSource(source_id), drafts, now());
    repo.commit(cs);

    spdlog::info("Source {} now has {} draft card(s)", source_id, cs.cards.size());
    return cs.cards;
}

ApprovalResult StudyService::approve(std::int64_t source_id) {
    auto held = locks.lockAll({ { EntityLocks::Kind::SOURCE, source_id } });
    Source source = requireSource(source_id);
    Changeset cs = lifecycle.planApproval(source, repo.cardsForSource(source_id), now());
    repo.commit(cs);

    spdlog::info("Source {} approved; {} card(s) activated", source_id, cs.cards.size());
    return { cs.sources.front(), cs.cards.size() };
}

Source StudyService::archive(std::int64_t source_id) {
    auto held = locks.lockAll({ { EntityLocks::Kind::SOURCE, source_id } });
    Source source = requireSource(source_id);
    Changeset cs = lifecycle.planArchive(source, now());
    repo.commit(cs);

    spdlog::info("Source {} archived", source_id);
    return cs.sources.front();
}

Source StudyService::setSourceStatus(std::int64_t source_id, SourceStatus target) {
    auto held = locks.lockAll({ { EntityLocks::Kind::SOURCE, source_id } });
    Source source = requireSource(source_id);
    Changeset cs = lifecycle.planSourceStatus(source, repo.cardsForSource(source_id), target, now());
    repo.commit(cs);

    spdlog::info("Source {} status {} -> {}", source_id, toString(source.status), toString(target));
    for (const auto& s : cs.sources) {
        if (s.id == source_id) return s;
    }
    return requireSource(source_id);
}

Source StudyService::editSource(std::int64_t source_id, const SourceEdit& edit) {
    auto held = locks.lockAll({ { EntityLocks::Kind::SOURCE, source_id } });
    Changeset cs = lifecycle.planSourceEdit(requireSource(source_id), edit, now());
    repo.commit(cs);

    spdlog::info("Source {} edited", source_id);
    return cs.sources.front();
}

/* -------------------------
   Cards
   ------------------------- */

Card StudyService::createCard(const CardInput& input, bool activate) {
    std::vector<std::unique_lock<std::mutex>> held;
    std::optional<Source> owner;
    if (input.source_id) {
        held = locks.lockAll({ { EntityLocks::Kind::SOURCE, *input.source_id } });
        owner = requireSource(*input.source_id);
    }

    Changeset cs = lifecycle.planNewCard(input, owner, activate, now());
    Card card = commitCard(cs);
    spdlog::info("Created card {} ({})", card.id, toString(card.status));
    return card;
}

Card StudyService::editCard(std::int64_t card_id, const CardEdit& edit) {
    auto held = lockCard(requireCard(card_id));
    Changeset cs = lifecycle.planCardEdit(requireCard(card_id), edit, now());
    return commitCard(cs);
}

void StudyService::deleteCard(std::int64_t card_id) {
    auto held = lockCard(requireCard(card_id));
    Changeset cs = lifecycle.planCardDeletion(requireCard(card_id));
    repo.commit(cs);
    spdlog::info("Deleted draft card {}", card_id);
}

Card StudyService::setCardStatus(std::int64_t card_id, CardStatus target) {
    auto held = lockCard(requireCard(card_id));
    Card card = requireCard(card_id);
    Changeset cs = lifecycle.planCardStatus(card, ownerOf(card), target, now());
    Card updated = commitCard(cs);

    spdlog::info("Card {} status {} -> {}", card_id, toString(card.status), toString(target));
    return updated;
}

/* -------------------------
   Reviews
   ------------------------- */

Card StudyService::submitReview(std::int64_t card_id, ReviewQuality quality, std::optional<int> response_time_ms) {
    auto held = lockCard(requireCard(card_id));
    Changeset cs = lifecycle.planReview(requireCard(card_id), quality, now(), response_time_ms);
    return commitCard(cs);
}

Card StudyService::submitReview(std::int64_t card_id, int raw_rating, std::optional<int> response_time_ms) {
    return submitReview(card_id, qualityFromInt(raw_rating), response_time_ms);
}

DueCards StudyService::listDue(const std::optional<std::string>& tag, std::optional<std::size_t> limit) const {
    return sched.selectDue(repo.cards(), now(), tag, limit);
}

std::vector<ReviewLog> StudyService::cardHistory(std::int64_t card_id) const {
    requireCard(card_id);
    auto logs = repo.logsForCard(card_id);
    std::sort(logs.begin(), logs.end(), [](const ReviewLog& a, const ReviewLog& b) {
        if (a.reviewed_at != b.reviewed_at) return a.reviewed_at > b.reviewed_at;
        return a.id > b.id;
    });
    return logs;
}

/* -------------------------
   Queries
   ------------------------- */

Source StudyService::getSource(std::int64_t id) const {
    return requireSource(id);
}

Card StudyService::getCard(std::int64_t id) const {
    return requireCard(id);
}

void StudyService::checkPaging(std::size_t page, std::size_t per_page) {
    if (page < 1) throw ValidationError("page must be >= 1");
    if (per_page < 1 || per_page > 100) throw ValidationError("per_page must be between 1 and 100");
}

Page<SourceSummary> StudyService::listSources(const SourceQuery& q) const {
    checkPaging(q.page, q.per_page);

    std::vector<Card> all_cards = repo.cards();
    std::vector<SourceSummary> matched;
    for (const auto& s : repo.sources()) {
        if (q.status && s.status != *q.status) continue;
        if (q.origin && s.origin != *q.origin) continue;
        if (q.tag && !s.hasTag(*q.tag)) continue;

        SourceSummary row{ s, 0 };
        row.card_count = static_cast<std::size_t>(std::count_if(all_cards.begin(), all_cards.end(),
            [&](const Card& c) { return c.source_id && *c.source_id == s.id; }));
        matched.push_back(row);
    }

    // Newest first
    std::sort(matched.begin(), matched.end(), [](const SourceSummary& a, const SourceSummary& b) {
        if (a.source.created_at != b.source.created_at) return a.source.created_at > b.source.created_at;
        return a.source.id > b.source.id;
    });

    Page<SourceSummary> page;
    page.total = matched.size();
    const std::size_t first = (q.page - 1) * q.per_page;
    for (std::size_t i = first; i < matched.size() && i < first + q.per_page; ++i) {
        page.items.push_back(matched[i]);
    }
    return page;
}

Page<Card> StudyService::listCards(const CardQuery& q) const {
    checkPaging(q.page, q.per_page);

    std::vector<Card> matched;
    for (const auto& c : repo.cards()) {
        if (q.status && c.status != *q.status) continue;
        if (q.source_id && (!c.source_id || *c.source_id != *q.source_id)) continue;
        if (q.tag && !c.hasTag(*q.tag)) continue;
        matched.push_back(c);
    }

    std::sort(matched.begin(), matched.end(), [](const Card& a, const Card& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });

    Page<Card> page;
    page.total = matched.size();
    const std::size_t first = (q.page - 1) * q.per_page;
    for (std::size_t i = first; i < matched.size() && i < first + q.per_page; ++i) {
        page.items.push_back(matched[i]);
    }
    return page;
}

/* -------------------------
   Tags
   ------------------------- */

std::vector<Tag> StudyService::tags() const {
    return repo.tags();
}

Tag StudyService::createTag(const std::string& name, const std::optional<std::string>& color) {
    std::lock_guard<std::mutex> lock(tag_mtx);

    Tag t;
    t.name = Text::normalizeTag(name);
    t.color = color;
    t.created_at = now();
    if (t.name.empty()) throw ValidationError("tag name must not be empty");
    if (repo.findTag(t.name)) throw ValidationError("tag '" + t.name + "' already exists");

    Changeset cs;
    cs.tags.push_back(t);
    repo.commit(cs);
    return cs.tags.front();
}

TagStats StudyService::tagStats(const std::string& name) const {
    auto tag = repo.findTag(name);
    if (!tag) throw NotFound("tag '" + Text::normalizeTag(name) + "' not found");

    TagStats stats;
    stats.tag = *tag;
    for (const auto& s : repo.sources()) {
        if (s.hasTag(tag->name)) stats.source_count++;
    }
    for (const auto& c : repo.cards()) {
        if (c.hasTag(tag->name)) stats.card_count++;
    }
    return stats;
}

void StudyService::deleteTag(const std::string& name) {
    std::lock_guard<std::mutex> lock(tag_mtx);
    auto tag = repo.findTag(name);
    if (!tag) throw NotFound("tag '" + Text::normalizeTag(name) + "' not found");

    // Every writer of a tagged entity is excluded while the tag is stripped
    std::vector<EntityLocks::Key> keys;
    for (const auto& s : repo.sources()) {
        if (s.hasTag(tag->name)) keys.push_back({ EntityLocks::Kind::SOURCE, s.id });
    }
    for (const auto& c : repo.cards()) {
        if (!c.hasTag(tag->name)) continue;
        keys.push_back({ EntityLocks::Kind::CARD, c.id });
        if (c.source_id) keys.push_back({ EntityLocks::Kind::SOURCE, *c.source_id });
    }
    auto held = locks.lockAll(keys);

    std::vector<Source> sources;
    std::vector<Card> cards;
    for (const auto& k : keys) {
        if (k.first == EntityLocks::Kind::SOURCE) {
            auto s = repo.findSource(k.second);
            if (s) sources.push_back(*s);
        }
        else {
            auto c = repo.findCard(k.second);
            if (c) cards.push_back(*c);
        }
    }
    // A source can be keyed twice (tagged itself and owning a tagged card)
    std::sort(sources.begin(), sources.end(), [](const Source& a, const Source& b) { return a.id < b.id; });
    sources.erase(std::unique(sources.begin(), sources.end(),
        [](const Source& a, const Source& b) { return a.id == b.id; }), sources.end());

    Changeset cs = lifecycle.planTagDeletion(*tag, sources, cards, now());
    repo.commit(cs);
}

ExportBundle StudyService::exportBundle() const {
    ExportBundle bundle;
    bundle.generated_at = now();

    for (const auto& c : repo.cards()) {
        if (c.status == CardStatus::ACTIVE) bundle.cards.push_back(c);
    }
    for (const auto& s : repo.sources()) {
        if (s.status != SourceStatus::APPROVED) continue;
        ExportEntry e{ s, {} };
        for (const auto& c : bundle.cards) {
            if (c.source_id && *c.source_id == s.id) e.cards.push_back(c);
        }
        bundle.sources.push_back(e);
    }
    return bundle;
}
