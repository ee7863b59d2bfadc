#pragma once
// ConversationContext: the working state of one turn
//
// Inputs are fixed at construction. Each stage's output has its own
// typed slot, filled once by the coordinator through merge_*().
// A second merge into the same slot is refused.

#include "types.hpp"
#include "narrative.hpp"
#include <optional>
#include <string>
#include <vector>

namespace colloquy {

// ═══════════════════════════════════════════════════════════════════════════
// Stage outputs
// ═══════════════════════════════════════════════════════════════════════════

struct MemoryOutput {
    Transcript working_memory;          // Oldest first
    std::vector<std::string> episodic;  // Long-term snippets, best match first
    std::string narrative;              // Empty when no snippets

    json to_payload() const {
        return {
            {"working_memory", working_memory},
            {"episodic_memories", episodic},
            {"memory_context", narrative}
        };
    }

    static MemoryOutput from_payload(const json& payload) {
        MemoryOutput out;
        out.working_memory = payload.value("working_memory", Transcript{});
        out.episodic = payload.value("episodic_memories", std::vector<std::string>{});
        out.narrative = payload.value("memory_context", "");
        return out;
    }
};

struct AffinityOutput {
    float score = affinity::NEUTRAL_SCORE;
    std::string level = affinity::NEUTRAL_LEVEL;
    std::string style = affinity::NEUTRAL_STYLE;
    std::string narrative;

    static AffinityOutput neutral() {
        AffinityOutput out;
        out.narrative = narrative::relationship(out.score, out.level, out.style);
        return out;
    }

    json to_payload() const {
        return {
            {"affinity", score},
            {"level", level},
            {"modifier", style},
            {"affinity_context", narrative}
        };
    }

    static AffinityOutput from_payload(const json& payload) {
        AffinityOutput out;
        out.score = payload.value("affinity", affinity::NEUTRAL_SCORE);
        out.level = payload.value("level", affinity::NEUTRAL_LEVEL);
        out.style = payload.value("modifier", affinity::NEUTRAL_STYLE);
        out.narrative = payload.value("affinity_context", "");
        return out;
    }
};

struct DialogueOutput {
    std::string reply;
    std::string composed_input;  // Exactly what was sent to the generator

    json to_payload() const {
        return {{"response", reply}, {"input", composed_input}};
    }

    static DialogueOutput from_payload(const json& payload) {
        DialogueOutput out;
        out.reply = payload.value("response", "");
        out.composed_input = payload.value("input", "");
        return out;
    }
};

struct RevisionOutput {
    std::string final_reply;
    bool revised = false;
    std::string verdict;  // Raw reviewer output, if any
    std::string note;     // Diagnostic when review failed internally

    json to_payload() const {
        json j = {
            {"revised_response", final_reply},
            {"needs_revision", revised}
        };
        if (!verdict.empty()) j["reflection"] = verdict;
        if (!note.empty()) j["error"] = note;
        return j;
    }

    static RevisionOutput from_payload(const json& payload) {
        RevisionOutput out;
        out.final_reply = payload.value("revised_response", "");
        out.revised = payload.value("needs_revision", false);
        out.verdict = payload.value("reflection", "");
        out.note = payload.value("error", "");
        return out;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// The context
// ═══════════════════════════════════════════════════════════════════════════

class ConversationContext {
public:
    ConversationContext(std::string id, std::string npc, std::string player,
                        std::string utterance, RoleProfile role,
                        Timestamp created_at = now())
        : id_(std::move(id))
        , npc_(std::move(npc))
        , player_(std::move(player))
        , utterance_(std::move(utterance))
        , role_(std::move(role))
        , created_at_(created_at)
    {}

    ConversationContext(const ConversationContext&) = delete;
    ConversationContext& operator=(const ConversationContext&) = delete;

    const std::string& id() const { return id_; }
    const std::string& npc() const { return npc_; }
    const std::string& player() const { return player_; }
    const std::string& utterance() const { return utterance_; }
    const RoleProfile& role() const { return role_; }
    Timestamp created_at() const { return created_at_; }

    // Typed, write-once merges. Return false if the slot was already filled.
    bool merge_memory(MemoryOutput out) { return fill(memory_, std::move(out)); }
    bool merge_affinity(AffinityOutput out) { return fill(affinity_, std::move(out)); }
    bool merge_dialogue(DialogueOutput out) { return fill(dialogue_, std::move(out)); }
    bool merge_revision(RevisionOutput out) { return fill(revision_, std::move(out)); }

    const std::optional<MemoryOutput>& memory() const { return memory_; }
    const std::optional<AffinityOutput>& affinity() const { return affinity_; }
    const std::optional<DialogueOutput>& dialogue() const { return dialogue_; }
    const std::optional<RevisionOutput>& revision() const { return revision_; }

    // Revised reply if revision ran, else the generated one, else empty
    std::string final_reply() const {
        if (revision_) return revision_->final_reply;
        if (dialogue_) return dialogue_->reply;
        return "";
    }

    json summary() const {
        return {
            {"id", id_},
            {"npc_name", npc_},
            {"player_id", player_},
            {"player_message", utterance_.substr(0, 50)},
            {"has_memory", memory_.has_value()},
            {"has_affinity", affinity_.has_value()},
            {"has_dialogue", dialogue_.has_value()},
            {"has_reflection", revision_.has_value()},
            {"created_at", iso_timestamp(created_at_)}
        };
    }

    // Everything merged so far, in a stable key order
    json to_json() const {
        json j = {
            {"npc", npc_},
            {"player", player_},
            {"utterance", utterance_}
        };
        j["memory"] = memory_ ? memory_->to_payload() : json();
        j["affinity"] = affinity_ ? affinity_->to_payload() : json();
        j["dialogue"] = dialogue_ ? dialogue_->to_payload() : json();
        j["revision"] = revision_ ? revision_->to_payload() : json();
        return j;
    }

private:
    template<typename T>
    static bool fill(std::optional<T>& slot, T value) {
        if (slot) return false;
        slot = std::move(value);
        return true;
    }

    const std::string id_;
    const std::string npc_;
    const std::string player_;
    const std::string utterance_;
    const RoleProfile role_;
    const Timestamp created_at_;

    std::optional<MemoryOutput> memory_;
    std::optional<AffinityOutput> affinity_;
    std::optional<DialogueOutput> dialogue_;
    std::optional<RevisionOutput> revision_;
};

} // namespace colloquy
