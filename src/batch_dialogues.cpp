#include <colloquy/batch_dialogues.hpp>
#include <colloquy/log.hpp>

#include <ctime>
#include <stdexcept>

namespace colloquy {

namespace {

constexpr const char* COMPONENT = "ambient";

// period -> npc -> line, for the built-in cast
const std::map<std::string, std::map<std::string, std::string>>& preset_table() {
    static const std::map<std::string, std::map<std::string, std::string>> table = {
        {"morning", {
            {"Zhang San", "Morning! Time to keep tuning the performance of that multi-agent system."},
            {"Li Si", "A new day. First let me sort out today's meeting schedule."},
            {"Wang Wu", "Morning! Coffee first, then on to the new interface design."}
        }},
        {"noon", {
            {"Zhang San", "A whole morning of coding and that bug is finally fixed!"},
            {"Li Si", "The requirements review went smoothly, more of it this afternoon."},
            {"Wang Wu", "This colour scheme works, just a few details left to adjust."}
        }},
        {"afternoon", {
            {"Zhang San", "More code this afternoon, this algorithm still needs optimising."},
            {"Li Si", "Getting ready for next week's planning meeting, the requirements doc is nearly done."},
            {"Wang Wu", "The design draft is basically finished, I'll send it round in a bit."}
        }},
        {"evening", {
            {"Zhang San", "Today's code is committed, back at it tomorrow!"},
            {"Li Si", "That's about it for today, let me list tomorrow's to-dos."},
            {"Wang Wu", "Design work wraps up here, more polishing tomorrow."}
        }}
    };
    return table;
}

} // anonymous namespace

BatchDialogues::BatchDialogues(Roster roster, Collaborator<Generator> generator)
    : roster_(std::move(roster))
    , generator_(std::move(generator))
{}

int BatchDialogues::current_hour() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf.tm_hour;
}

const char* BatchDialogues::period_for(int hour) {
    if (hour >= 6 && hour < 12) return "morning";
    if (hour >= 12 && hour < 14) return "noon";
    if (hour >= 14 && hour < 18) return "afternoon";
    return "evening";
}

std::string BatchDialogues::scene_for(int hour) {
    if (hour >= 6 && hour < 9) {
        return "Early morning, people are arriving at the office and getting ready for the day";
    }
    if (hour >= 9 && hour < 12) {
        return "Morning work hours, everyone is heads-down and the office is busy";
    }
    if (hour >= 12 && hour < 14) {
        return "Lunch break, people are relaxing, chatting or checking their phones";
    }
    if (hour >= 14 && hour < 17) {
        return "Afternoon work hours, projects moving along, the odd coffee to stay sharp";
    }
    if (hour >= 17 && hour < 19) {
        return "Early evening, wrapping up today's work and planning tomorrow";
    }
    return "Night, the office has gone quiet, someone is still working late";
}

std::string BatchDialogues::preset_line(const RoleProfile& role, const std::string& period) const {
    auto by_period = preset_table().find(period);
    if (by_period != preset_table().end()) {
        auto line = by_period->second.find(role.name);
        if (line != by_period->second.end()) return line->second;
    }
    if (role.activity.empty()) return "...";
    return role.activity + ", as usual.";
}

std::map<std::string, std::string> BatchDialogues::presets(const std::string& period) const {
    std::map<std::string, std::string> lines;
    for (const auto& role : roster_.all()) {
        lines[role.name] = preset_line(role, period);
    }
    return lines;
}

std::string BatchDialogues::batch_prompt(const std::string& scene) const {
    std::string out;
    out += "You write ambient office dialogue for game NPCs. Write what each of the " +
           std::to_string(roster_.size()) + " NPCs is saying or doing right now.\n\n";
    out += "[Scene] " + scene + "\n\n";

    out += "[NPCs]\n";
    for (const auto& role : roster_.all()) {
        out += "- " + role.name + " (" + role.title + "): at " + role.location + ", " +
               role.activity + "; " + role.personality + "\n";
    }

    out += "\n[Rules]\n"
           "1. One sentence per NPC, 10 to 25 words\n"
           "2. Fit the character, their current activity and the scene\n"
           "3. Talking to themselves, describing their work, or a passing thought\n"
           "4. Natural, like a real coworker, with a little personality\n"
           "5. Answer with a JSON object only\n\n";

    out += "[Format]\n{";
    bool first = true;
    for (const auto& name : roster_.names()) {
        if (!first) out += ", ";
        out += "\"" + name + "\": \"...\"";
        first = false;
    }
    out += "}\n";
    return out;
}

std::optional<std::map<std::string, std::string>>
BatchDialogues::parse(const std::string& response) const {
    auto collect = [this](const json& doc) {
        std::map<std::string, std::string> lines;
        for (const auto& name : roster_.names()) {
            if (doc.contains(name) && doc[name].is_string()) {
                std::string line = trim(doc[name].get<std::string>());
                if (!line.empty()) lines[name] = line;
            }
        }
        return lines;
    };

    json doc = json::parse(response, nullptr, false);
    if (!doc.is_discarded()) {
        if (!doc.is_object()) return std::nullopt;
        auto lines = collect(doc);
        if (lines.size() != roster_.size()) {
            COLLOQUY_LOG_WARN(COMPONENT, "Answer names %zu of %zu NPCs", lines.size(),
                              roster_.size());
            return std::nullopt;
        }
        return lines;
    }

    // JSON wrapped in prose or a code fence
    size_t start = response.find('{');
    size_t end = response.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return std::nullopt;
    }
    doc = json::parse(response.substr(start, end - start + 1), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto lines = collect(doc);
    if (lines.empty()) return std::nullopt;
    return lines;
}

AmbientLines BatchDialogues::generate(int hour, const std::string& scene) const {
    if (hour < 0 || hour > 23) {
        throw std::out_of_range("hour must be between 0 and 23, got " + std::to_string(hour));
    }

    AmbientLines out;
    out.period = period_for(hour);
    out.scene = trim(scene).empty() ? scene_for(hour) : trim(scene);
    out.lines = presets(out.period);

    std::string response;
    try {
        response = generator_.match(
            [&](Generator& generator) { return generator.generate(batch_prompt(out.scene), {}); },
            [] { return std::string(); });
    } catch (const std::exception& e) {
        COLLOQUY_LOG_WARN(COMPONENT, "Batch generation failed, using presets: %s", e.what());
        return out;
    } catch (...) {
        COLLOQUY_LOG_WARN(COMPONENT, "Batch generation failed, using presets");
        return out;
    }
    if (response.empty()) return out;

    auto parsed = parse(response);
    if (!parsed) {
        COLLOQUY_LOG_WARN(COMPONENT, "Unusable batch answer, using presets");
        return out;
    }
    for (auto& [npc, line] : *parsed) {
        out.lines[npc] = std::move(line);
    }
    out.generated = true;
    COLLOQUY_LOG_DEBUG(COMPONENT, "Generated %zu of %zu lines", parsed->size(), out.lines.size());
    return out;
}

} // namespace colloquy
