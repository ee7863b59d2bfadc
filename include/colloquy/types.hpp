#pragma once
// Core types: the vocabulary of a conversation
//
// Messages, memory snippets, role profiles and time.
// Everything that crosses a stage boundary is built from these.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace colloquy {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ISO-8601 local time with millisecond precision (2024-05-01T09:30:12.345)
inline std::string iso_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03d", buf, millis);
    return out;
}

// Strip leading/trailing whitespace
inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Speaker roles in the short-term transcript
namespace role {
    constexpr const char* HUMAN = "human";
    constexpr const char* AI = "ai";
}

// One line of the working-memory transcript
struct Message {
    std::string role;      // role::HUMAN or role::AI
    std::string content;

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }
};

inline void to_json(json& j, const Message& m) {
    j = json{{"role", m.role}, {"content", m.content}};
}

inline void from_json(const json& j, Message& m) {
    m.role = j.value("role", "");
    m.content = j.value("content", "");
}

using Transcript = std::vector<Message>;

// A long-term memory entry, as stored and as returned by search
struct MemorySnippet {
    std::string content;
    json metadata = json::object();
};

inline void to_json(json& j, const MemorySnippet& s) {
    j = json{{"content", s.content}, {"metadata", s.metadata}};
}

inline void from_json(const json& j, MemorySnippet& s) {
    s.content = j.value("content", "");
    s.metadata = j.value("metadata", json::object());
}

// Static profile of an NPC
struct RoleProfile {
    std::string name;
    std::string title;
    std::string location;
    std::string activity;
    std::string personality;
    std::string expertise;
    std::string style;         // Speaking style
    std::string hobbies;
};

inline void to_json(json& j, const RoleProfile& r) {
    j = json{
        {"name", r.name},
        {"title", r.title},
        {"location", r.location},
        {"activity", r.activity},
        {"personality", r.personality},
        {"expertise", r.expertise},
        {"style", r.style},
        {"hobbies", r.hobbies}
    };
}

inline void from_json(const json& j, RoleProfile& r) {
    r.name = j.value("name", "");
    r.title = j.value("title", "");
    r.location = j.value("location", "");
    r.activity = j.value("activity", "");
    r.personality = j.value("personality", "");
    r.expertise = j.value("expertise", "");
    r.style = j.value("style", "");
    r.hobbies = j.value("hobbies", "");
}

} // namespace colloquy
