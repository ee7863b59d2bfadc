#pragma once
// Roster: the NPCs a service can talk as
//
// Either the built-in office cast or a JSON file:
//   [{"name": "...", "title": "...", "location": "...", ...}, ...]
// or {"npcs": [...]}. Names must be unique and non-empty.

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace colloquy {

class Roster {
public:
    Roster() = default;
    explicit Roster(std::vector<RoleProfile> profiles);

    // Zhang San, Li Si, Wang Wu
    static Roster builtin();

    // Throws std::runtime_error on unreadable file, bad JSON, or a bad entry
    static Roster load(const std::string& path);
    static Roster from_json(const json& doc);

    std::optional<RoleProfile> find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name).has_value(); }
    std::vector<std::string> names() const;
    const std::vector<RoleProfile>& all() const { return profiles_; }
    size_t size() const { return profiles_.size(); }

private:
    std::vector<RoleProfile> profiles_;  // Roster order
};

// Character brief handed to a generator as its system prompt
std::string system_prompt(const RoleProfile& role);

} // namespace colloquy
