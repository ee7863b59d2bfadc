#pragma once
// PersistAgent: affinity update + memory persistence after the reply is final
//
// Two independent side effects, run concurrently and joined. Neither
// can fail the turn: the result is always success, and each inner
// fault is reported in its own field.

#include "../agent.hpp"
#include "../context.hpp"
#include "../log.hpp"
#include "../services.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace colloquy {

struct PersistOutput {
    bool affinity_ok = true;
    bool affinity_changed = false;
    std::optional<float> new_score;
    std::string affinity_error;

    bool history_ok = true;
    std::string history_error;

    bool episodic_ok = true;      // Also true when the NPC has no long-term store
    bool episodic_saved = false;
    std::string episodic_error;

    json to_payload() const {
        json j = {
            {"affinity_updated", affinity_ok},
            {"changed", affinity_changed},
            {"history_saved", history_ok},
            {"episodic_ok", episodic_ok},
            {"episodic_saved", episodic_saved}
        };
        if (new_score) j["new_score"] = *new_score;
        if (!affinity_error.empty()) j["affinity_error"] = affinity_error;
        if (!history_error.empty()) j["history_error"] = history_error;
        if (!episodic_error.empty()) j["episodic_error"] = episodic_error;
        return j;
    }

    static PersistOutput from_payload(const json& payload) {
        PersistOutput out;
        out.affinity_ok = payload.value("affinity_updated", false);
        out.affinity_changed = payload.value("changed", false);
        if (payload.contains("new_score")) out.new_score = payload["new_score"].get<float>();
        out.affinity_error = payload.value("affinity_error", "");
        out.history_ok = payload.value("history_saved", false);
        out.history_error = payload.value("history_error", "");
        out.episodic_saved = payload.value("episodic_saved", false);
        out.episodic_error = payload.value("episodic_error", "");
        out.episodic_ok = payload.value("episodic_ok", false);
        return out;
    }
};

class PersistAgent : public Agent {
public:
    static constexpr const char* NAME = "persist";

    PersistAgent(Collaborator<RelationshipService> relationships,
                 Collaborator<ShortTermStore> short_term,
                 std::shared_ptr<EpisodicShelf> shelf)
        : Agent(NAME)
        , relationships_(std::move(relationships))
        , short_term_(std::move(short_term))
        , shelf_(std::move(shelf))
    {}

    // Long-term entries for one exchange: player line, then NPC line
    static std::vector<MemorySnippet> episodic_entries(const std::string& npc,
                                                       const std::string& player,
                                                       const std::string& utterance,
                                                       const std::string& reply,
                                                       Timestamp at = now()) {
        std::string stamp = iso_timestamp(at);
        MemorySnippet player_entry;
        player_entry.content = "Player said: " + utterance;
        player_entry.metadata = {
            {"speaker", "player"},
            {"player_id", player},
            {"timestamp", stamp},
            {"type", "player_message"}
        };

        MemorySnippet npc_entry;
        npc_entry.content = npc + " said: " + reply;
        npc_entry.metadata = {
            {"speaker", npc},
            {"player_id", player},
            {"timestamp", stamp},
            {"type", "npc_response"}
        };
        return {player_entry, npc_entry};
    }

protected:
    AgentResult perform(const ConversationContext& ctx) override {
        PersistOutput out;
        const std::string reply = ctx.final_reply();
        if (reply.empty()) {
            out.affinity_ok = false;
            out.history_ok = false;
            out.affinity_error = out.history_error = "no final reply";
            return AgentResult::ok(out.to_payload());
        }

        auto affinity_task = std::async(std::launch::async, [&]() {
            update_affinity(ctx, reply, out);
        });
        auto memory_task = std::async(std::launch::async, [&]() {
            save_memory(ctx, reply, out);
        });
        // Each side effect writes only its own fields of `out`
        affinity_task.get();
        memory_task.get();

        return AgentResult::ok(out.to_payload());
    }

private:
    void update_affinity(const ConversationContext& ctx, const std::string& reply,
                         PersistOutput& out) {
        try {
            relationships_.match(
                [&](RelationshipService& service) {
                    AffinityUpdate update = service.analyze_and_update(
                        ctx.npc(), ctx.player(), ctx.utterance(), reply);
                    out.affinity_changed = update.changed;
                    if (update.changed) out.new_score = update.new_score;
                },
                [] {});
        } catch (const std::exception& e) {
            out.affinity_ok = false;
            out.affinity_error = e.what();
            COLLOQUY_LOG_WARN(NAME, "Affinity update failed: %s", e.what());
        } catch (...) {
            out.affinity_ok = false;
            out.affinity_error = "non-standard exception in affinity update";
            COLLOQUY_LOG_WARN(NAME, "Affinity update failed: %s", out.affinity_error.c_str());
        }
    }

    void save_memory(const ConversationContext& ctx, const std::string& reply,
                     PersistOutput& out) {
        // Working memory
        try {
            short_term_.match(
                [&](ShortTermStore& store) {
                    store.append(ctx.npc(), ctx.player(), role::HUMAN, ctx.utterance());
                    store.append(ctx.npc(), ctx.player(), role::AI, reply);
                    store.extend_expiry(ctx.npc(), ctx.player());
                },
                [] {});
        } catch (const std::exception& e) {
            out.history_ok = false;
            out.history_error = e.what();
            COLLOQUY_LOG_WARN(NAME, "Saving working memory failed: %s", e.what());
        } catch (...) {
            out.history_ok = false;
            out.history_error = "non-standard exception saving working memory";
            COLLOQUY_LOG_WARN(NAME, "Saving working memory failed: %s", out.history_error.c_str());
        }

        // Episodic memory
        if (!shelf_) return;
        try {
            shelf_->lookup(ctx.npc()).match(
                [&](LongTermStore& store) {
                    store.add(episodic_entries(ctx.npc(), ctx.player(), ctx.utterance(), reply));
                    out.episodic_saved = true;
                },
                [] {});
        } catch (const std::exception& e) {
            out.episodic_ok = false;
            out.episodic_error = e.what();
            COLLOQUY_LOG_WARN(NAME, "Saving episodic memory failed: %s", e.what());
        } catch (...) {
            out.episodic_ok = false;
            out.episodic_error = "non-standard exception saving episodic memory";
            COLLOQUY_LOG_WARN(NAME, "Saving episodic memory failed: %s", out.episodic_error.c_str());
        }
    }

    Collaborator<RelationshipService> relationships_;
    Collaborator<ShortTermStore> short_term_;
    std::shared_ptr<EpisodicShelf> shelf_;
};

} // namespace colloquy
