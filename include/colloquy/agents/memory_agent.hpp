#pragma once
// MemoryAgent: working memory + relevant long-term snippets
//
// Reads only. The short-term read path is the one that can fail the
// stage; a long-term search error degrades to no snippets.

#include "../agent.hpp"
#include "../config.hpp"
#include "../context.hpp"
#include "../log.hpp"
#include "../services.hpp"
#include <memory>
#include <string>
#include <vector>

namespace colloquy {

class MemoryAgent : public Agent {
public:
    static constexpr const char* NAME = "memory";

    MemoryAgent(Collaborator<ShortTermStore> short_term,
                std::shared_ptr<EpisodicShelf> shelf,
                MemoryConfig config = {})
        : Agent(NAME)
        , short_term_(std::move(short_term))
        , shelf_(std::move(shelf))
        , config_(config)
    {}

protected:
    AgentResult perform(const ConversationContext& ctx) override {
        MemoryOutput out;

        // 1. Working memory (short-term)
        out.working_memory = short_term_.match(
            [&](ShortTermStore& store) { return store.history(ctx.npc(), ctx.player()); },
            [] { return Transcript{}; });

        if (out.working_memory.size() > config_.history_limit) {
            out.working_memory.erase(
                out.working_memory.begin(),
                out.working_memory.end() - static_cast<long>(config_.history_limit));
        }

        // 2. Episodic memory (long-term), if this NPC has one
        std::string episodic_error;
        auto episodic = shelf_ ? shelf_->lookup(ctx.npc())
                               : Collaborator<LongTermStore>::unconfigured();
        out.episodic = episodic.match(
            [&](LongTermStore& store) {
                std::vector<std::string> snippets;
                try {
                    for (const auto& hit : store.search(ctx.utterance(), config_.episodic_top_k)) {
                        snippets.push_back(hit.content);
                    }
                } catch (const std::exception& e) {
                    episodic_error = e.what();
                    COLLOQUY_LOG_WARN(NAME, "Episodic search failed for %s: %s",
                                      ctx.npc().c_str(), e.what());
                    snippets.clear();
                } catch (...) {
                    episodic_error = "non-standard exception in episodic search";
                    COLLOQUY_LOG_WARN(NAME, "Episodic search failed for %s: %s",
                                      ctx.npc().c_str(), episodic_error.c_str());
                    snippets.clear();
                }
                if (snippets.size() > config_.episodic_top_k) {
                    snippets.resize(config_.episodic_top_k);
                }
                return snippets;
            },
            [] { return std::vector<std::string>{}; });

        out.narrative = narrative::memories(out.episodic);

        COLLOQUY_LOG_DEBUG(NAME, "%zu history messages, %zu episodic snippets",
                           out.working_memory.size(), out.episodic.size());

        json payload = out.to_payload();
        if (!episodic_error.empty()) {
            payload["episodic_error"] = episodic_error;
        }
        return AgentResult::ok(std::move(payload));
    }

private:
    Collaborator<ShortTermStore> short_term_;
    std::shared_ptr<EpisodicShelf> shelf_;
    MemoryConfig config_;
};

} // namespace colloquy
