#include <colloquy/roster.hpp>
#include <colloquy/log.hpp>

#include <fstream>
#include <set>
#include <stdexcept>

namespace colloquy {

Roster::Roster(std::vector<RoleProfile> profiles) {
    std::set<std::string> seen;
    for (auto& profile : profiles) {
        if (trim(profile.name).empty()) {
            throw std::runtime_error("roster entry without a name");
        }
        if (!seen.insert(profile.name).second) {
            throw std::runtime_error("duplicate roster entry: " + profile.name);
        }
        profiles_.push_back(std::move(profile));
    }
}

Roster Roster::builtin() {
    RoleProfile zhang;
    zhang.name = "Zhang San";
    zhang.title = "Python engineer";
    zhang.location = "Desk area";
    zhang.activity = "Writing code";
    zhang.personality = "Tech enthusiast who loves talking algorithms and frameworks";
    zhang.expertise = "Multi-agent systems, agent frameworks, Python development, code optimisation";
    zhang.style = "Concise and professional, heavy on jargon, grumbles about bugs now and then";
    zhang.hobbies = "Tech blogs, LeetCode, trying out new frameworks";

    RoleProfile li;
    li.name = "Li Si";
    li.title = "Product manager";
    li.location = "Meeting room";
    li.activity = "Sorting out requirements";
    li.personality = "Outgoing and talkative, good at bringing people together";
    li.expertise = "Requirements analysis, product planning, user experience, project management";
    li.style = "Friendly and enthusiastic, steers the conversation, fond of metaphors";
    li.hobbies = "Product teardowns, competitor research, thinking about users";

    RoleProfile wang;
    wang.name = "Wang Wu";
    wang.title = "UI designer";
    wang.location = "Break area";
    wang.activity = "Drinking coffee";
    wang.personality = "Perceptive and sensitive, with an eye for beauty";
    wang.expertise = "Interface design, interaction design, visual presentation, user experience";
    wang.style = "Elegant and understated, artistic turns of phrase, a perfectionist";
    wang.hobbies = "Browsing design work, Dribbble, tasting coffee";

    return Roster({zhang, li, wang});
}

Roster Roster::from_json(const json& doc) {
    const json& list = doc.is_object() && doc.contains("npcs") ? doc["npcs"] : doc;
    if (!list.is_array()) {
        throw std::runtime_error("roster must be an array of NPC profiles");
    }

    std::vector<RoleProfile> profiles;
    for (const auto& entry : list) {
        if (!entry.is_object()) {
            throw std::runtime_error("roster entry must be an object");
        }
        profiles.push_back(entry.get<RoleProfile>());
    }
    return Roster(std::move(profiles));
}

Roster Roster::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open roster: " + path);
    }
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid roster JSON in " + path + ": " + e.what());
    }
    Roster roster = from_json(doc);
    COLLOQUY_LOG_INFO("roster", "Loaded %zu NPCs from %s", roster.size(), path.c_str());
    return roster;
}

std::optional<RoleProfile> Roster::find(const std::string& name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) return profile;
    }
    return std::nullopt;
}

std::vector<std::string> Roster::names() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& profile : profiles_) out.push_back(profile.name);
    return out;
}

std::string system_prompt(const RoleProfile& role) {
    std::string first_skill = role.expertise.substr(0, role.expertise.find(','));

    std::string out;
    out += "You are " + role.name + ", the " + role.title + " of the office.\n\n";
    out += "[Character]\n";
    out += "- Title: " + role.title + "\n";
    out += "- Personality: " + role.personality + "\n";
    out += "- Expertise: " + role.expertise + "\n";
    out += "- Speaking style: " + role.style + "\n";
    out += "- Hobbies: " + role.hobbies + "\n";
    out += "- Location: " + role.location + "\n";
    out += "- Doing: " + role.activity + "\n\n";
    out += "[Rules]\n";
    out += "1. Stay in character and answer in the first person\n";
    out += "2. Keep replies short and natural, one or two sentences\n";
    out += "3. Mention your work and hobbies when it fits\n";
    out += "4. Be friendly to the player but stay believable\n";
    out += "5. Point to a colleague when a question is outside your expertise\n";
    out += "6. Never say you are an AI or a language model\n\n";
    out += "[Example]\n";
    out += "Player: \"Hi, what do you do?\"\n";
    out += role.name + ": \"Hi! I'm the " + role.title + ", mostly " + first_skill +
           ". Right now: " + role.activity + ".\"\n";
    return out;
}

} // namespace colloquy
