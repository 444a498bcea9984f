#pragma once
#include <vector>
#include <ctime>
#include <optional>
#include "Card.hpp"
#include "Source.hpp"
#include "Changeset.hpp"
#include "Scheduler.hpp"
#include "Status.hpp"

/*
  Lifecycle controller for sources and cards.

  Every plan* call validates its input against the transition tables in
  Status.hpp and returns the complete next state as a Changeset. Nothing is
  written here; when a plan throws, no part of it exists yet, so the caller's
  entities are unchanged.

  `linked` always means every card whose source_id is the source's id, and
  `owner` the source a card belongs to (nullopt for manual cards). Cards of
  an archived source never become active again through a plan.
*/
class LifecycleController {
public:
    explicit LifecycleController(const Scheduler& scheduler);

    // New pending source from a producer. Throws ValidationError on empty text.
    Changeset planNewSource(const SourceInput& input, std::time_t now) const;

    // New card; optionally activated right away through draft -> active.
    Changeset planNewCard(const CardInput& input, const std::optional<Source>& owner, bool activate,
        std::time_t now) const;

    // Supersedes the source's drafts with `drafts`; source -> cards_generated.
    Changeset planGeneration(const Source& source, const std::vector<Card>& linked,
        const std::vector<CardDraft>& drafts, std::time_t now) const;

    // Activates the source's drafts; source -> approved.
    Changeset planApproval(const Source& source, const std::vector<Card>& linked, std::time_t now) const;

    Changeset planArchive(const Source& source, std::time_t now) const;

    // Text, origin details and tags of a non-archived source. Status is kept.
    Changeset planSourceEdit(const Source& source, const SourceEdit& edit, std::time_t now) const;

    // Generic status change for sources (approved or archived only).
    Changeset planSourceStatus(const Source& source, const std::vector<Card>& linked,
        SourceStatus target, std::time_t now) const;

    Changeset planCardStatus(const Card& card, const std::optional<Source>& owner, CardStatus target,
        std::time_t now) const;
    Changeset planCardEdit(const Card& card, const CardEdit& edit, std::time_t now) const;
    Changeset planCardDeletion(const Card& card) const;

    // Unregisters `tag` and strips it from every tagged source and card.
    Changeset planTagDeletion(const Tag& tag, const std::vector<Source>& sources,
        const std::vector<Card>& cards, std::time_t now) const;

    // Review of an active (or mastered) card: card update plus log entry.
    Changeset planReview(const Card& card, ReviewQuality quality, std::time_t now,
        std::optional<int> response_time_ms) const;

private:
    const Scheduler& scheduler;

    Card activated(const Card& card, std::time_t now) const;
    static void addTagNames(Changeset& cs, const std::vector<std::string>& names, std::time_t now);
};
