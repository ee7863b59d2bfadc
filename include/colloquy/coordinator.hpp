#pragma once
// Coordinator: the per-turn pipeline
//
//   START -> RETRIEVE (memory || affinity) -> MERGE -> GENERATE
//         -> [REVISE] -> PERSIST -> DONE
//
// Transitions only move forward. GENERATE is the only stage whose
// failure aborts the turn; every other stage degrades to its default.

#include "agent.hpp"
#include "agents/affinity_agent.hpp"
#include "agents/dialogue_agent.hpp"
#include "agents/memory_agent.hpp"
#include "agents/persist_agent.hpp"
#include "agents/reflection_agent.hpp"
#include "config.hpp"
#include "context.hpp"
#include "context_registry.hpp"
#include "services.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace colloquy {

// Stage flag names reported in TurnResult::stage_success
namespace stage {
    constexpr const char* MEMORY = "memory";
    constexpr const char* AFFINITY = "affinity";
    constexpr const char* DIALOGUE = "dialogue";
    constexpr const char* REVISION = "revision";
    constexpr const char* AFFINITY_UPDATE = "affinity_update";
    constexpr const char* PERSISTENCE = "persistence";
}

// Everything the pipeline talks to. Unset collaborators degrade.
struct Collaborators {
    Collaborator<RelationshipService> relationships;
    Collaborator<ShortTermStore> short_term;
    std::shared_ptr<EpisodicShelf> shelf;
    Collaborator<Generator> generator;            // Shared by NPCs without their own
    std::shared_ptr<GeneratorRack> generators;   // Per-NPC generators
    Collaborator<Reviewer> reviewer;
};

// What the caller of run_turn gets back
struct TurnResult {
    bool success = false;
    std::string reply;
    float affinity_score = affinity::NEUTRAL_SCORE;  // Score the reply was generated under
    bool affinity_changed = false;
    std::optional<float> new_affinity;               // Set iff affinity_changed
    bool revised = false;
    std::map<std::string, bool> stage_success;       // Only stages that ran
    std::chrono::microseconds elapsed{0};
    std::string error;                               // Non-empty iff !success
    std::string context_id;
    std::string composed_input;

    static TurnResult failed(std::string error) {
        TurnResult r;
        r.success = false;
        r.error = std::move(error);
        return r;
    }

    json to_json() const;
};

// Both retrieval branches, each captured on its own
struct RetrievalOutcome {
    AgentResult memory;
    AgentResult affinity;
};

class Coordinator {
public:
    Coordinator(Collaborators collaborators,
                PipelineConfig pipeline = {},
                MemoryConfig memory = {},
                RegistryConfig registry = {});

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // One full turn. Never throws for stage faults.
    TurnResult run_turn(const std::string& npc, const std::string& player,
                        const std::string& utterance, const RoleProfile& role);

    // RETRIEVE: both branches, concurrently or sequentially per config
    RetrievalOutcome retrieve(const ConversationContext& ctx);

    // MERGE: write both retrieval outputs, defaults for failed branches
    void merge(ConversationContext& ctx, const RetrievalOutcome& outcome);

    ContextRegistry& registry() { return registry_; }
    const ContextRegistry& registry() const { return registry_; }

    const PipelineConfig& pipeline() const { return pipeline_; }

    // True when REVISE will run: enabled and a reviewer exists
    bool revision_active() const;

private:
    RetrievalOutcome retrieve_concurrently(const ConversationContext& ctx);
    RetrievalOutcome retrieve_sequentially(const ConversationContext& ctx);

    const PipelineConfig pipeline_;
    ContextRegistry registry_;

    MemoryAgent memory_agent_;
    AffinityAgent affinity_agent_;
    DialogueAgent dialogue_agent_;
    ReflectionAgent reflection_agent_;
    PersistAgent persist_agent_;
};

} // namespace colloquy
