#include "Tagged.hpp"
#include "../utils/strings.hpp"
#include <algorithm>

void Tagged::addTag(const std::string& tag) {
    std::string t = Text::normalizeTag(tag);
    if (t.empty()) return;
    if (!hasTag(t)) tags.push_back(t);
}

bool Tagged::removeTag(const std::string& tag) {
    auto it = std::find(tags.begin(), tags.end(), Text::normalizeTag(tag));
    if (it != tags.end()) {
        tags.erase(it);
        return true;
    }
    return false;
}

bool Tagged::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), Text::normalizeTag(tag)) != tags.end();
}

void Tagged::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) addTag(t);
}

std::string Tagged::tagsAsLine() const {
    return Text::joinCsv(tags);
}
