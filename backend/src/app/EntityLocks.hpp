#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// Striped per-entity locks: two writers on the same (kind, id) always take
// the same mutex, unrelated entities rarely share one.
class EntityLocks {
public:
    enum class Kind { SOURCE, CARD };
    using Key = std::pair<Kind, std::int64_t>;

    std::mutex& lockFor(Kind kind, std::int64_t id) {
        std::size_t h = std::hash<std::int64_t>()(id) * 31 + static_cast<std::size_t>(kind);
        return stripes[h % stripes.size()];
    }

    // Locks every key's stripe in address order, so overlapping callers
    // cannot deadlock.
    std::vector<std::unique_lock<std::mutex>> lockAll(const std::vector<Key>& keys) {
        std::vector<std::mutex*> ms;
        for (const auto& k : keys) ms.push_back(&lockFor(k.first, k.second));
        std::sort(ms.begin(), ms.end());
        ms.erase(std::unique(ms.begin(), ms.end()), ms.end());

        std::vector<std::unique_lock<std::mutex>> held;
        held.reserve(ms.size());
        for (auto* m : ms) held.emplace_back(*m);
        return held;
    }

private:
    std::array<std::mutex, 64> stripes;
};
