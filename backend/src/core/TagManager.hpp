#pragma once
#include <map>
#include <string>
#include <vector>
#include <ctime>
#include <cstdint>
#include <optional>

struct Tag {
    std::int64_t id = 0;
    std::string name;                 // normalized: trimmed, lower-case
    std::optional<std::string> color; // display hint only
    std::time_t created_at = 0;
};

// Case-insensitive tag registry owned by a repository.
class TagManager {
public:
    // Throws ValidationError on an empty or already-registered name.
    const Tag& create(const std::string& name, const std::optional<std::string>& color, std::time_t now);

    // Registers the name if it is new; returns the stored tag either way.
    const Tag& ensure(const std::string& name, const std::optional<std::string>& color, std::time_t now);

    bool remove(const std::string& name); // false if it was not registered

    std::optional<Tag> find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<Tag> all() const; // sorted by name

    void restore(const std::vector<Tag>& tags);
    std::int64_t nextId() const { return next_id; }

private:
    std::map<std::string, Tag> by_name;
    std::int64_t next_id = 1;
};
