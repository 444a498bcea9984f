#include "TagManager.hpp"
#include "Errors.hpp"
#include "../utils/strings.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

const Tag& TagManager::create(const std::string& name, const std::optional<std::string>& color, std::time_t now) {
    std::string key = Text::normalizeTag(name);
    if (key.empty()) {
        throw ValidationError("tag name must not be empty");
    }
    if (by_name.count(key)) {
        throw ValidationError("tag '" + key + "' already exists");
    }

    Tag t;
    t.id = next_id++;
    t.name = key;
    t.color = color;
    t.created_at = now;
    spdlog::info("Tag '{}' registered (id={})", key, t.id);
    return by_name.emplace(key, t).first->second;
}

const Tag& TagManager::ensure(const std::string& name, const std::optional<std::string>& color, std::time_t now) {
    auto it = by_name.find(Text::normalizeTag(name));
    if (it != by_name.end()) return it->second;
    return create(name, color, now);
}

bool TagManager::remove(const std::string& name) {
    if (by_name.erase(Text::normalizeTag(name)) == 0) return false;
    spdlog::info("Tag '{}' removed", Text::normalizeTag(name));
    return true;
}

std::optional<Tag> TagManager::find(const std::string& name) const {
    auto it = by_name.find(Text::normalizeTag(name));
    if (it == by_name.end()) return std::nullopt;
    return it->second;
}

bool TagManager::contains(const std::string& name) const {
    return by_name.count(Text::normalizeTag(name)) > 0;
}

std::vector<Tag> TagManager::all() const {
    std::vector<Tag> out;
    out.reserve(by_name.size());
    for (const auto& p : by_name) out.push_back(p.second);
    return out;
}

void TagManager::restore(const std::vector<Tag>& tags) {
    by_name.clear();
    next_id = 1;
    for (const auto& t : tags) {
        std::string key = Text::normalizeTag(t.name);
        if (key.empty()) continue;
        Tag copy = t;
        copy.name = key;
        by_name[key] = copy;
        next_id = std::max(next_id, t.id + 1);
    }
}
