#include "MemoryRepository.hpp"
#include "../core/Errors.hpp"
#include "../utils/strings.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

std::optional<Source> MemoryRepository::findSource(std::int64_t id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = source_rows.find(id);
    if (it == source_rows.end()) return std::nullopt;
    return it->second;
}

std::optional<Source> MemoryRepository::findSourceByExternalKey(OriginKind origin, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& p : source_rows) {
        const Source& s = p.second;
        if (s.origin == origin && s.external_key && *s.external_key == key) return s;
    }
    return std::nullopt;
}

std::vector<Source> MemoryRepository::sources() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Source> out;
    out.reserve(source_rows.size());
    for (const auto& p : source_rows) out.push_back(p.second);
    return out;
}

std::optional<Card> MemoryRepository::findCard(std::int64_t id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = card_rows.find(id);
    if (it == card_rows.end()) return std::nullopt;
    return it->second;
}

std::vector<Card> MemoryRepository::cards() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Card> out;
    out.reserve(card_rows.size());
    for (const auto& p : card_rows) out.push_back(p.second);
    return out;
}

std::vector<Card> MemoryRepository::cardsForSource(std::int64_t source_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Card> out;
    for (const auto& p : card_rows) {
        if (p.second.source_id && *p.second.source_id == source_id) out.push_back(p.second);
    }
    return out;
}

std::vector<ReviewLog> MemoryRepository::logsForCard(std::int64_t card_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ReviewLog> out;
    for (const auto& l : log_rows) {
        if (l.card_id == card_id) out.push_back(l);
    }
    return out;
}

std::vector<Tag> MemoryRepository::tags() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tag_rows.all();
}

std::optional<Tag> MemoryRepository::findTag(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    return tag_rows.find(name);
}

bool MemoryRepository::externalKeyTaken(OriginKind origin, const std::string& key, std::int64_t except_id) const {
    for (const auto& p : source_rows) {
        const Source& s = p.second;
        if (s.id != except_id && s.origin == origin && s.external_key && *s.external_key == key) return true;
    }
    return false;
}

void MemoryRepository::validate(const Changeset& cs) const {
    std::set<std::pair<int, std::string>> keys_in_batch;
    for (const auto& s : cs.sources) {
        if (s.id != 0 && !source_rows.count(s.id)) {
            throw NotFound("source " + std::to_string(s.id) + " not found");
        }
        if (Text::trim(s.text).empty()) {
            throw ValidationError("source text must not be empty");
        }
        if (s.external_key) {
            auto k = std::make_pair(static_cast<int>(s.origin), *s.external_key);
            if (externalKeyTaken(s.origin, *s.external_key, s.id) || !keys_in_batch.insert(k).second) {
                throw DuplicateExternalKey("external key '" + *s.external_key + "' already imported for " +
                    toString(s.origin));
            }
        }
    }

    std::set<std::int64_t> removed(cs.removed_cards.begin(), cs.removed_cards.end());
    for (auto id : removed) {
        auto it = card_rows.find(id);
        if (it == card_rows.end()) {
            throw NotFound("card " + std::to_string(id) + " not found");
        }
        if (!it->second.isDraft()) {
            throw InvalidTransition("card " + std::to_string(id) + " is " + toString(it->second.status) +
                "; only drafts can be removed");
        }
    }

    for (const auto& c : cs.cards) {
        if (c.id != 0 && !card_rows.count(c.id)) {
            throw NotFound("card " + std::to_string(c.id) + " not found");
        }
        if (c.id != 0 && removed.count(c.id)) {
            throw ValidationError("card " + std::to_string(c.id) + " is both updated and removed");
        }
        if (c.source_id && !source_rows.count(*c.source_id)) {
            throw NotFound("source " + std::to_string(*c.source_id) + " not found");
        }
        if (Text::trim(c.front).empty() || Text::trim(c.back).empty()) {
            throw ValidationError("card front and back must not be empty");
        }
    }

    for (const auto& l : cs.logs) {
        if (l.id != 0) {
            throw ValidationError("review logs are append-only");
        }
        if (!card_rows.count(l.card_id) || removed.count(l.card_id)) {
            throw NotFound("card " + std::to_string(l.card_id) + " not found");
        }
    }

    for (const auto& t : cs.tags) {
        if (Text::normalizeTag(t.name).empty()) {
            throw ValidationError("tag name must not be empty");
        }
    }

    for (const auto& name : cs.removed_tags) {
        if (!tag_rows.contains(name)) {
            throw NotFound("tag '" + Text::normalizeTag(name) + "' not found");
        }
        for (const auto& t : cs.tags) {
            if (Text::normalizeTag(t.name) == Text::normalizeTag(name)) {
                throw ValidationError("tag '" + t.name + "' is both registered and removed");
            }
        }
        for (const auto& s : cs.sources) {
            if (s.hasTag(name)) {
                throw ValidationError("source " + std::to_string(s.id) + " still carries removed tag '" + name + "'");
            }
        }
        for (const auto& c : cs.cards) {
            if (c.hasTag(name)) {
                throw ValidationError("card " + std::to_string(c.id) + " still carries removed tag '" + name + "'");
            }
        }
        // Stored rows the changeset leaves alone must not carry it either
        for (const auto& p : source_rows) {
            bool rewritten = std::any_of(cs.sources.begin(), cs.sources.end(),
                [&](const Source& s) { return s.id == p.first; });
            if (!rewritten && p.second.hasTag(name)) {
                throw ValidationError("source " + std::to_string(p.first) + " still carries removed tag '" + name + "'");
            }
        }
        for (const auto& p : card_rows) {
            bool rewritten = std::any_of(cs.cards.begin(), cs.cards.end(),
                [&](const Card& c) { return c.id == p.first; });
            bool removed = std::find(cs.removed_cards.begin(), cs.removed_cards.end(), p.first) != cs.removed_cards.end();
            if (!rewritten && !removed && p.second.hasTag(name)) {
                throw ValidationError("card " + std::to_string(p.first) + " still carries removed tag '" + name + "'");
            }
        }
    }
}

void MemoryRepository::commit(Changeset& cs) {
    std::lock_guard<std::mutex> lock(mtx);
    validate(cs);

    // Nothing below throws for a validated changeset
    for (auto& t : cs.tags) {
        t = tag_rows.ensure(t.name, t.color, t.created_at);
    }

    for (auto& s : cs.sources) {
        if (s.id == 0) s.id = next_source_id++;
        source_rows[s.id] = s;
    }

    for (auto id : cs.removed_cards) {
        card_rows.erase(id);
    }

    for (auto& c : cs.cards) {
        if (c.id == 0) c.id = next_card_id++;
        card_rows[c.id] = c;
    }

    for (auto& l : cs.logs) {
        l.id = next_log_id++;
        log_rows.push_back(l);
    }

    for (const auto& name : cs.removed_tags) {
        tag_rows.remove(name);
    }

    spdlog::debug("Commit: {} source(s), {} card(s), {} removed, {} log(s), {} tag(s)",
        cs.sources.size(), cs.cards.size(), cs.removed_cards.size(), cs.logs.size(), cs.tags.size());
}

Snapshot MemoryRepository::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    Snapshot snap;
    for (const auto& p : source_rows) snap.sources.push_back(p.second);
    for (const auto& p : card_rows) snap.cards.push_back(p.second);
    snap.logs = log_rows;
    snap.tags = tag_rows.all();
    snap.next_source_id = next_source_id;
    snap.next_card_id = next_card_id;
    snap.next_log_id = next_log_id;
    return snap;
}

void MemoryRepository::restore(const Snapshot& snap) {
    std::lock_guard<std::mutex> lock(mtx);
    source_rows.clear();
    card_rows.clear();
    log_rows = snap.logs;
    tag_rows.restore(snap.tags);

    next_source_id = std::max<std::int64_t>(1, snap.next_source_id);
    next_card_id = std::max<std::int64_t>(1, snap.next_card_id);
    next_log_id = std::max<std::int64_t>(1, snap.next_log_id);

    for (const auto& s : snap.sources) {
        source_rows[s.id] = s;
        next_source_id = std::max(next_source_id, s.id + 1);
    }
    for (const auto& c : snap.cards) {
        card_rows[c.id] = c;
        next_card_id = std::max(next_card_id, c.id + 1);
    }
    for (const auto& l : log_rows) {
        next_log_id = std::max(next_log_id, l.id + 1);
    }
}
