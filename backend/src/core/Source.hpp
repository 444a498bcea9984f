#pragma once
#include <string>
#include <ctime>
#include <cstdint>
#include <optional>
#include <vector>
#include "Status.hpp"
#include "Tagged.hpp"

class Source : public Tagged {
public:
    Source() = default;
    Source(const std::string& text, OriginKind origin);

    std::int64_t id = 0;
    std::string text;
    OriginKind origin = OriginKind::MANUAL;
    std::optional<std::string> origin_url;
    std::optional<std::string> origin_title;
    std::optional<std::string> external_key; // Dedup key, unique per origin kind
    std::optional<std::string> highlight_color;

    SourceStatus status = SourceStatus::PENDING_REVIEW;

    std::time_t created_at = 0;
    std::time_t updated_at = 0;

    std::string displayTitle() const; // title, or the first words of the text
};

// What a source producer hands over.
struct SourceInput {
    std::string text;
    OriginKind origin = OriginKind::MANUAL;
    std::optional<std::string> origin_url;
    std::optional<std::string> origin_title;
    std::optional<std::string> external_key;
    std::optional<std::string> highlight_color;
    std::vector<std::string> tags;
};

// Partial update of a captured source; unset fields are left alone and an
// empty url, title or color clears it.
struct SourceEdit {
    std::optional<std::string> text;
    std::optional<std::string> origin_url;
    std::optional<std::string> origin_title;
    std::optional<std::string> highlight_color;
    std::optional<std::vector<std::string>> tags;
};
