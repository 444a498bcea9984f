#include "Lifecycle.hpp"
#include "Errors.hpp"
#include "../utils/strings.hpp"
#include <spdlog/spdlog.h>

namespace {

std::string requireText(const std::string& value, const char* field) {
    std::string t = Text::trim(value);
    if (t.empty()) {
        throw ValidationError(std::string(field) + " must not be empty");
    }
    return t;
}

std::optional<std::string> optionalText(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    std::string t = Text::trim(*value);
    if (t.empty()) return std::nullopt;
    return t;
}

[[noreturn]] void rejectSource(const Source& s, SourceStatus target) {
    throw InvalidTransition("source " + std::to_string(s.id) + ": cannot move from " +
        toString(s.status) + " to " + toString(target));
}

[[noreturn]] void rejectCard(const Card& c, CardStatus target) {
    throw InvalidTransition("card " + std::to_string(c.id) + ": cannot move from " +
        toString(c.status) + " to " + toString(target));
}

void requireOpenOwner(const std::optional<Source>& owner, const char* what) {
    if (owner && owner->status == SourceStatus::ARCHIVED) {
        throw InvalidTransition(std::string(what) + ": source " + std::to_string(owner->id) + " is archived");
    }
}

} // namespace

LifecycleController::LifecycleController(const Scheduler& s)
    : scheduler(s)
{
}

Changeset LifecycleController::planNewSource(const SourceInput& in, std::time_t now) const {
    Source s(requireText(in.text, "source text"), in.origin);
    s.origin_url = optionalText(in.origin_url);
    s.origin_title = optionalText(in.origin_title);
    s.external_key = optionalText(in.external_key);
    s.highlight_color = optionalText(in.highlight_color);
    s.setTags(in.tags);
    s.status = SourceStatus::PENDING_REVIEW;
    s.created_at = now;
    s.updated_at = now;

    Changeset cs;
    addTagNames(cs, s.tags, now);
    cs.sources.push_back(s);
    return cs;
}

Changeset LifecycleController::planNewCard(const CardInput& in, const std::optional<Source>& owner,
    bool activate, std::time_t now) const {
    requireOpenOwner(owner, "cannot add a card");

    Card c(requireText(in.front, "card front"), requireText(in.back, "card back"));
    c.hint = optionalText(in.hint);
    c.source_id = in.source_id;
    c.setTags(in.tags);
    c.status = CardStatus::DRAFT;
    c.created_at = now;
    c.updated_at = now;

    Changeset cs;
    addTagNames(cs, c.tags, now);
    cs.cards.push_back(activate ? activated(c, now) : c);
    return cs;
}

Changeset LifecycleController::planGeneration(const Source& source, const std::vector<Card>& linked,
    const std::vector<CardDraft>& drafts, std::time_t now) const {
    if (!canTransition(source.status, SourceStatus::CARDS_GENERATED)) {
        rejectSource(source, SourceStatus::CARDS_GENERATED);
    }

    Changeset cs;

    // Validate every draft before planning anything
    std::vector<Card> fresh;
    fresh.reserve(drafts.size());
    for (const auto& d : drafts) {
        Card c(requireText(d.front, "draft front"), requireText(d.back, "draft back"));
        c.hint = optionalText(d.hint);
        c.source_id = source.id;
        c.setTags(d.tags);
        for (const auto& t : source.tags) c.addTag(t);
        c.status = CardStatus::DRAFT;
        c.sched = SchedulingState();
        c.sched.ease_factor = scheduler.config().initial_ease;
        c.created_at = now;
        c.updated_at = now;
        addTagNames(cs, c.tags, now);
        fresh.push_back(c);
    }

    for (const auto& c : linked) {
        if (c.isDraft()) cs.removed_cards.push_back(c.id);
    }
    cs.cards = std::move(fresh);

    Source next = source;
    next.status = SourceStatus::CARDS_GENERATED;
    next.updated_at = now;
    cs.sources.push_back(next);

    spdlog::info("Source {} generation planned: {} draft(s), {} superseded",
        source.id, cs.cards.size(), cs.removed_cards.size());
    return cs;
}

Changeset LifecycleController::planApproval(const Source& source, const std::vector<Card>& linked, std::time_t now) const {
    if (!canTransition(source.status, SourceStatus::APPROVED)) {
        rejectSource(source, SourceStatus::APPROVED);
    }
    // Skipping generation is only a no-op approval of an empty source
    if (source.status == SourceStatus::PENDING_REVIEW && !linked.empty()) {
        throw InvalidTransition("source " + std::to_string(source.id) +
            ": cards must be generated before approval");
    }

    Changeset cs;
    for (const auto& c : linked) {
        if (c.isDraft()) cs.cards.push_back(activated(c, now));
    }

    Source next = source;
    next.status = SourceStatus::APPROVED;
    next.updated_at = now;
    cs.sources.push_back(next);

    spdlog::info("Source {} approval planned: {} card(s) activated", source.id, cs.cards.size());
    return cs;
}

Changeset LifecycleController::planArchive(const Source& source, std::time_t now) const {
    if (!canTransition(source.status, SourceStatus::ARCHIVED)) {
        rejectSource(source, SourceStatus::ARCHIVED);
    }

    Source next = source;
    next.status = SourceStatus::ARCHIVED;
    next.updated_at = now;

    Changeset cs;
    cs.sources.push_back(next);
    return cs;
}

Changeset LifecycleController::planSourceStatus(const Source& source, const std::vector<Card>& linked,
    SourceStatus target, std::time_t now) const {
    switch (target) {
    case SourceStatus::APPROVED:
        return planApproval(source, linked, now);
    case SourceStatus::ARCHIVED:
        return planArchive(source, now);
    case SourceStatus::PENDING_REVIEW:
    case SourceStatus::CARDS_GENERATED:
        break;
    }
    // cards_generated needs drafts; nothing leads back to pending_review
    throw InvalidTransition("source " + std::to_string(source.id) + ": cannot set status " +
        toString(target) + " directly");
}

Changeset LifecycleController::planSourceEdit(const Source& source, const SourceEdit& edit, std::time_t now) const {
    if (source.status == SourceStatus::ARCHIVED) {
        throw InvalidTransition("source " + std::to_string(source.id) + " is archived and cannot be edited");
    }

    Source next = source;
    if (edit.text) next.text = requireText(*edit.text, "source text");
    if (edit.origin_url) next.origin_url = optionalText(edit.origin_url);
    if (edit.origin_title) next.origin_title = optionalText(edit.origin_title);
    if (edit.highlight_color) next.highlight_color = optionalText(edit.highlight_color);

    Changeset cs;
    if (edit.tags) {
        next.setTags(*edit.tags);
        addTagNames(cs, next.tags, now);
    }
    next.updated_at = now;
    cs.sources.push_back(next);
    return cs;
}

Changeset LifecycleController::planCardStatus(const Card& card, const std::optional<Source>& owner,
    CardStatus target, std::time_t now) const {
    if (!canTransition(card.status, target)) {
        rejectCard(card, target);
    }
    if (card.isDraft()) {
        requireOpenOwner(owner, ("card " + std::to_string(card.id) + " cannot be activated").c_str());
    }

    Card next = card;
    if (card.status == CardStatus::DRAFT && target == CardStatus::ACTIVE) {
        next = activated(card, now);
    }
    else {
        next.status = target;
        next.updated_at = now;
    }

    Changeset cs;
    cs.cards.push_back(next);
    return cs;
}

Changeset LifecycleController::planCardEdit(const Card& card, const CardEdit& edit, std::time_t now) const {
    Card next = card;
    if (edit.front) next.front = requireText(*edit.front, "card front");
    if (edit.back) next.back = requireText(*edit.back, "card back");
    if (edit.hint) next.hint = optionalText(edit.hint);

    Changeset cs;
    if (edit.tags) {
        next.setTags(*edit.tags);
        addTagNames(cs, next.tags, now);
    }
    // Scheduling state is carried over untouched
    next.updated_at = now;
    cs.cards.push_back(next);
    return cs;
}

Changeset LifecycleController::planCardDeletion(const Card& card) const {
    if (!card.isDraft()) {
        throw InvalidTransition("card " + std::to_string(card.id) + ": only draft cards can be deleted, status is " +
            toString(card.status));
    }
    Changeset cs;
    cs.removed_cards.push_back(card.id);
    return cs;
}

Changeset LifecycleController::planTagDeletion(const Tag& tag, const std::vector<Source>& sources,
    const std::vector<Card>& cards, std::time_t now) const {
    Changeset cs;
    for (const auto& s : sources) {
        Source next = s;
        if (!next.removeTag(tag.name)) continue;
        next.updated_at = now;
        cs.sources.push_back(next);
    }
    for (const auto& c : cards) {
        Card next = c;
        if (!next.removeTag(tag.name)) continue;
        next.updated_at = now;
        cs.cards.push_back(next);
    }
    cs.removed_tags.push_back(tag.name);

    spdlog::info("Tag '{}' deletion planned: {} source(s), {} card(s) untagged",
        tag.name, cs.sources.size(), cs.cards.size());
    return cs;
}

Changeset LifecycleController::planReview(const Card& card, ReviewQuality quality, std::time_t now,
    std::optional<int> response_time_ms) const {
    // Mastery is advisory: mastered cards may still be rated
    if (card.status != CardStatus::ACTIVE && card.status != CardStatus::MASTERED) {
        throw InvalidTransition("card " + std::to_string(card.id) + ": cannot review a " +
            toString(card.status) + " card");
    }

    ReviewOutcome outcome = scheduler.review(card, quality, now, response_time_ms);

    Card next = card;
    next.sched = outcome.after;
    next.updated_at = now;

    Changeset cs;
    cs.cards.push_back(next);
    cs.logs.push_back(outcome.log);
    return cs;
}

Card LifecycleController::activated(const Card& card, std::time_t now) const {
    Card next = card;
    next.status = CardStatus::ACTIVE;
    next.sched = scheduler.initialState(now);
    next.updated_at = now;
    return next;
}

void LifecycleController::addTagNames(Changeset& cs, const std::vector<std::string>& names, std::time_t now) {
    for (const auto& n : names) {
        bool seen = false;
        for (const auto& t : cs.tags) {
            if (t.name == n) { seen = true; break; }
        }
        if (seen) continue;
        Tag t;
        t.name = n;
        t.created_at = now;
        cs.tags.push_back(t);
    }
}
