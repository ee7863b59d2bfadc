#pragma once
// BatchDialogues: one ambient line for every NPC in a single call
//
// The generator gets a prompt describing the scene and every NPC and
// must answer with a JSON object {"<npc>": "<line>", ...}. Without a
// generator, or when its answer cannot be used, the lines come from a
// preset table keyed by the time of day:
//
//   [06, 12) morning   [12, 14) noon   [14, 18) afternoon   else evening

#include "roster.hpp"
#include "services.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>

namespace colloquy {

struct AmbientLines {
    std::string period;                        // morning | noon | afternoon | evening
    std::string scene;
    bool generated = false;                    // False when presets were used
    std::map<std::string, std::string> lines;  // npc -> line

    json to_json() const {
        return {
            {"period", period},
            {"scene", scene},
            {"generated", generated},
            {"dialogues", lines}
        };
    }
};

class BatchDialogues {
public:
    BatchDialogues(Roster roster, Collaborator<Generator> generator);

    // Throws std::out_of_range unless 0 <= hour <= 23. An empty scene
    // is derived from the hour.
    AmbientLines generate(int hour, const std::string& scene = "") const;

    bool configured() const { return generator_.configured(); }

    static int current_hour();
    static const char* period_for(int hour);
    static std::string scene_for(int hour);

    // Preset line for one NPC in one period; falls back to its activity
    std::string preset_line(const RoleProfile& role, const std::string& period) const;

    std::string batch_prompt(const std::string& scene) const;

    // Lines for roster NPCs found in a generator answer. A well-formed
    // object must name every NPC; JSON embedded in other text may be partial.
    std::optional<std::map<std::string, std::string>> parse(const std::string& response) const;

private:
    std::map<std::string, std::string> presets(const std::string& period) const;

    const Roster roster_;
    Collaborator<Generator> generator_;
};

} // namespace colloquy
