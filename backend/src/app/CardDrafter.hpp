#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../core/Card.hpp"
#include "../core/Source.hpp"

// Card-drafting collaborator. Implementations may be slow or fail; any
// exception they throw reaches the caller of StudyService::generateCards
// unchanged and nothing is written.
class CardDrafter {
public:
    virtual ~CardDrafter() = default;
    virtual std::vector<CardDraft> draft(const Source& source) = 0;
};

// Drafts read from a JSON file (see DraftParser for the accepted shapes).
class JsonFileDrafter : public CardDrafter {
public:
    explicit JsonFileDrafter(const std::string& path);
    std::vector<CardDraft> draft(const Source& source) override;

private:
    std::string path;
};

// Fixed list of drafts, e.g. typed in by the user.
class StaticDrafter : public CardDrafter {
public:
    explicit StaticDrafter(std::vector<CardDraft> d) : drafts(std::move(d)) {}
    std::vector<CardDraft> draft(const Source&) override { return drafts; }

private:
    std::vector<CardDraft> drafts;
};
