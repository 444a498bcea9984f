#pragma once
#include <string>

enum class SourceStatus {
    PENDING_REVIEW,
    CARDS_GENERATED,
    APPROVED,
    ARCHIVED
};

enum class CardStatus {
    DRAFT,
    ACTIVE,
    SUSPENDED,
    MASTERED
};

// Where a source was captured from. The last three are producer kinds kept
// for sources written by other capture tools.
enum class OriginKind {
    LINK_IMPORT,
    BROWSER_CAPTURE,
    MANUAL,
    LAUNCHER_CAPTURE,
    MOBILE_SHORTCUT,
    HIGHLIGHT_IMPORT
};

enum class ReviewQuality {
    AGAIN = 0,
    HARD = 1,
    GOOD = 2,
    EASY = 3
};

/*
  Central transition tables. Every status change in the system is checked
  against these two functions and nowhere else.
*/
bool canTransition(SourceStatus from, SourceStatus to);
bool canTransition(CardStatus from, CardStatus to);

// Raw rating from the presentation layer; throws InvalidRating outside 0..3.
ReviewQuality qualityFromInt(int value);

std::string toString(SourceStatus s);
std::string toString(CardStatus s);
std::string toString(OriginKind k);
std::string toString(ReviewQuality q);

// Inverse of toString; throw ValidationError on unknown names.
SourceStatus sourceStatusFromString(const std::string& s);
CardStatus cardStatusFromString(const std::string& s);
OriginKind originKindFromString(const std::string& s);
ReviewQuality qualityFromString(const std::string& s);
