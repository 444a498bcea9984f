#pragma once
#include <string>
#include <vector>

// Tag list shared by sources and cards. Names are stored trimmed and
// lower-cased, so membership is case-insensitive.
class Tagged {
public:
    std::vector<std::string> tags;

    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const;
};
