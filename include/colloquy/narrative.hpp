#pragma once
// Narrative: the text blocks injected ahead of the player's line
//
// Fixed headers, fixed order. The dialogue stage concatenates
// relationship + memory + current turn into the composed input.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace colloquy {

// The "stranger" baseline: a relationship nobody has touched yet
namespace affinity {
    constexpr float NEUTRAL_SCORE = 50.0f;
    constexpr float MIN_SCORE = 0.0f;
    constexpr float MAX_SCORE = 100.0f;
    constexpr const char* NEUTRAL_LEVEL = "Stranger";
    constexpr const char* NEUTRAL_STYLE = "Polite and friendly";
}

namespace narrative {

constexpr const char* RELATIONSHIP_HEADER = "[Current relationship]";
constexpr const char* STYLE_HEADER = "[Speaking style]";
constexpr const char* MEMORY_HEADER = "[Relevant memories]";
constexpr const char* TURN_HEADER = "[Current conversation]";
constexpr size_t MAX_MEMORY_LINES = 3;

inline std::string relationship(float score, const std::string& level,
                                const std::string& style) {
    std::string out;
    out += RELATIONSHIP_HEADER;
    out += "\nYour relationship with the player: " + level +
           " (affinity: " + std::to_string(static_cast<long>(std::lround(score))) + "/100)\n";
    out += STYLE_HEADER;
    out += " " + style + "\n\n";
    return out;
}

// Empty when there is nothing to remember
inline std::string memories(const std::vector<std::string>& snippets) {
    if (snippets.empty()) return "";

    std::string out = MEMORY_HEADER;
    size_t n = std::min(snippets.size(), MAX_MEMORY_LINES);
    for (size_t i = 0; i < n; ++i) {
        out += "\n- " + snippets[i];
    }
    return out;
}

inline std::string current_turn(const std::string& utterance) {
    return std::string(TURN_HEADER) + "\nPlayer: " + utterance;
}

// relationship, then memory + blank line (if any), then the current turn
inline std::string compose(const std::string& relationship_block,
                           const std::string& memory_block,
                           const std::string& utterance) {
    std::string input = relationship_block;
    if (!memory_block.empty()) {
        input += memory_block + "\n\n";
    }
    input += current_turn(utterance);
    return input;
}

} // namespace narrative
} // namespace colloquy
