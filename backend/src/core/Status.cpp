#include "Status.hpp"
#include "Errors.hpp"
#include "../utils/strings.hpp"
#include <array>
#include <utility>

namespace {

// pending_review -> approved is allowed by the table; the controller only
// takes that edge when the source has no cards linked to it.
const std::array<std::pair<SourceStatus, SourceStatus>, 7> kSourceEdges = { {
    { SourceStatus::PENDING_REVIEW, SourceStatus::CARDS_GENERATED },
    { SourceStatus::PENDING_REVIEW, SourceStatus::APPROVED },
    { SourceStatus::PENDING_REVIEW, SourceStatus::ARCHIVED },
    { SourceStatus::CARDS_GENERATED, SourceStatus::CARDS_GENERATED },
    { SourceStatus::CARDS_GENERATED, SourceStatus::APPROVED },
    { SourceStatus::CARDS_GENERATED, SourceStatus::ARCHIVED },
    { SourceStatus::APPROVED, SourceStatus::ARCHIVED },
} };

const std::array<std::pair<CardStatus, CardStatus>, 4> kCardEdges = { {
    { CardStatus::DRAFT, CardStatus::ACTIVE },
    { CardStatus::ACTIVE, CardStatus::SUSPENDED },
    { CardStatus::SUSPENDED, CardStatus::ACTIVE },
    { CardStatus::ACTIVE, CardStatus::MASTERED },
} };

} // namespace

bool canTransition(SourceStatus from, SourceStatus to) {
    for (const auto& e : kSourceEdges) {
        if (e.first == from && e.second == to) return true;
    }
    return false;
}

bool canTransition(CardStatus from, CardStatus to) {
    for (const auto& e : kCardEdges) {
        if (e.first == from && e.second == to) return true;
    }
    return false;
}

ReviewQuality qualityFromInt(int value) {
    if (value < 0 || value > 3) {
        throw InvalidRating("rating must be 0..3 (again, hard, good, easy), got " + std::to_string(value));
    }
    return static_cast<ReviewQuality>(value);
}

std::string toString(SourceStatus s) {
    switch (s) {
    case SourceStatus::PENDING_REVIEW: return "pending_review";
    case SourceStatus::CARDS_GENERATED: return "cards_generated";
    case SourceStatus::APPROVED: return "approved";
    case SourceStatus::ARCHIVED: return "archived";
    }
    return "unknown";
}

std::string toString(CardStatus s) {
    switch (s) {
    case CardStatus::DRAFT: return "draft";
    case CardStatus::ACTIVE: return "active";
    case CardStatus::SUSPENDED: return "suspended";
    case CardStatus::MASTERED: return "mastered";
    }
    return "unknown";
}

std::string toString(OriginKind k) {
    switch (k) {
    case OriginKind::LINK_IMPORT: return "link_import";
    case OriginKind::BROWSER_CAPTURE: return "browser_capture";
    case OriginKind::MANUAL: return "manual";
    case OriginKind::LAUNCHER_CAPTURE: return "launcher_capture";
    case OriginKind::MOBILE_SHORTCUT: return "mobile_shortcut";
    case OriginKind::HIGHLIGHT_IMPORT: return "highlight_import";
    }
    return "unknown";
}

std::string toString(ReviewQuality q) {
    switch (q) {
    case ReviewQuality::AGAIN: return "again";
    case ReviewQuality::HARD: return "hard";
    case ReviewQuality::GOOD: return "good";
    case ReviewQuality::EASY: return "easy";
    }
    return "unknown";
}

SourceStatus sourceStatusFromString(const std::string& s) {
    const std::string v = Text::normalizeTag(s);
    for (auto st : { SourceStatus::PENDING_REVIEW, SourceStatus::CARDS_GENERATED,
                     SourceStatus::APPROVED, SourceStatus::ARCHIVED }) {
        if (toString(st) == v) return st;
    }
    throw ValidationError("unknown source status '" + s + "'");
}

CardStatus cardStatusFromString(const std::string& s) {
    const std::string v = Text::normalizeTag(s);
    for (auto st : { CardStatus::DRAFT, CardStatus::ACTIVE,
                     CardStatus::SUSPENDED, CardStatus::MASTERED }) {
        if (toString(st) == v) return st;
    }
    throw ValidationError("unknown card status '" + s + "'");
}

OriginKind originKindFromString(const std::string& s) {
    const std::string v = Text::normalizeTag(s);
    for (auto k : { OriginKind::LINK_IMPORT, OriginKind::BROWSER_CAPTURE, OriginKind::MANUAL,
                    OriginKind::LAUNCHER_CAPTURE, OriginKind::MOBILE_SHORTCUT,
                    OriginKind::HIGHLIGHT_IMPORT }) {
        if (toString(k) == v) return k;
    }
    throw ValidationError("unknown origin kind '" + s + "'");
}

ReviewQuality qualityFromString(const std::string& s) {
    const std::string v = Text::normalizeTag(s);
    for (auto q : { ReviewQuality::AGAIN, ReviewQuality::HARD,
                    ReviewQuality::GOOD, ReviewQuality::EASY }) {
        if (toString(q) == v) return q;
    }
    throw InvalidRating("unknown rating '" + s + "'");
}
