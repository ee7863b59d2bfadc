// Coordinator: per-turn pipeline

#include <colloquy/coordinator.hpp>
#include <colloquy/log.hpp>

#include <future>
#include <system_error>

namespace colloquy {

namespace {

constexpr const char* COMPONENT = "coordinator";

// Join one branch. A fault here never touches the sibling branch.
AgentResult join(std::future<AgentResult>& future, const char* producer) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        AgentResult r = AgentResult::failure(e.what());
        r.producer = producer;
        r.completed_at = now();
        return r;
    }
}

// Slots are write-once; a second write keeps the first value
void warn_refused(const ConversationContext& ctx, const char* slot) {
    COLLOQUY_LOG_WARN(COMPONENT, "Context %s already has %s output, keeping the first",
                      ctx.id().c_str(), slot);
}

double millis(std::chrono::microseconds us) {
    return us.count() / 1000.0;
}

} // anonymous namespace

json TurnResult::to_json() const {
    json j = {
        {"success", success},
        {"response", reply},
        {"affinity", affinity_score},
        {"affinity_changed", affinity_changed},
        {"revised", revised},
        {"agents_used", stage_success},
        {"execution_time_ms", millis(elapsed)},
        {"context_id", context_id}
    };
    if (new_affinity) j["new_affinity"] = *new_affinity;
    if (!error.empty()) j["error"] = error;
    return j;
}

Coordinator::Coordinator(Collaborators collaborators,
                         PipelineConfig pipeline,
                         MemoryConfig memory,
                         RegistryConfig registry)
    : pipeline_(pipeline)
    , registry_(registry.idle_timeout_ms)
    , memory_agent_(collaborators.short_term, collaborators.shelf, memory)
    , affinity_agent_(collaborators.relationships)
    , dialogue_agent_(collaborators.generator, collaborators.generators)
    , reflection_agent_(collaborators.reviewer, pipeline.accept_unmarked_verdicts)
    , persist_agent_(collaborators.relationships, collaborators.short_term, collaborators.shelf)
{
    COLLOQUY_LOG_DEBUG(COMPONENT, "Pipeline ready (revision %s, retrieval %s)",
                       revision_active() ? "on" : "off",
                       pipeline_.parallel_retrieval ? "parallel" : "sequential");
}

bool Coordinator::revision_active() const {
    return pipeline_.enable_revision && reflection_agent_.configured();
}

// ═══════════════════════════════════════════════════════════════════════════
// RETRIEVE / MERGE
// ═══════════════════════════════════════════════════════════════════════════

RetrievalOutcome Coordinator::retrieve(const ConversationContext& ctx) {
    return pipeline_.parallel_retrieval ? retrieve_concurrently(ctx)
                                        : retrieve_sequentially(ctx);
}

RetrievalOutcome Coordinator::retrieve_sequentially(const ConversationContext& ctx) {
    RetrievalOutcome outcome;
    outcome.memory = memory_agent_.execute(ctx);
    outcome.affinity = affinity_agent_.execute(ctx);
    return outcome;
}

RetrievalOutcome Coordinator::retrieve_concurrently(const ConversationContext& ctx) {
    std::future<AgentResult> memory_future;
    try {
        memory_future = memory_agent_.launch(ctx);
    } catch (const std::system_error& e) {
        COLLOQUY_LOG_WARN(COMPONENT, "Cannot start retrieval task (%s), running sequentially",
                          e.what());
        return retrieve_sequentially(ctx);
    }

    RetrievalOutcome outcome;
    std::future<AgentResult> affinity_future;
    bool affinity_launched = true;
    try {
        affinity_future = affinity_agent_.launch(ctx);
    } catch (const std::system_error& e) {
        COLLOQUY_LOG_WARN(COMPONENT, "Cannot start affinity task (%s), running inline",
                          e.what());
        affinity_launched = false;
        outcome.affinity = affinity_agent_.execute(ctx);
    }

    outcome.memory = join(memory_future, MemoryAgent::NAME);
    if (affinity_launched) {
        outcome.affinity = join(affinity_future, AffinityAgent::NAME);
    }
    return outcome;
}

void Coordinator::merge(ConversationContext& ctx, const RetrievalOutcome& outcome) {
    if (outcome.memory.success) {
        if (!ctx.merge_memory(MemoryOutput::from_payload(outcome.memory.payload))) {
            warn_refused(ctx, stage::MEMORY);
        }
    } else {
        COLLOQUY_LOG_WARN(COMPONENT, "Memory retrieval failed, continuing without memory: %s",
                          outcome.memory.error.c_str());
        if (!ctx.merge_memory(MemoryOutput{})) warn_refused(ctx, stage::MEMORY);
    }

    if (outcome.affinity.success) {
        if (!ctx.merge_affinity(AffinityOutput::from_payload(outcome.affinity.payload))) {
            warn_refused(ctx, stage::AFFINITY);
        }
    } else {
        COLLOQUY_LOG_WARN(COMPONENT, "Affinity retrieval failed, treating player as a stranger: %s",
                          outcome.affinity.error.c_str());
        if (!ctx.merge_affinity(AffinityOutput::neutral())) warn_refused(ctx, stage::AFFINITY);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// The turn
// ═══════════════════════════════════════════════════════════════════════════

TurnResult Coordinator::run_turn(const std::string& npc, const std::string& player,
                                 const std::string& utterance, const RoleProfile& role) {
    auto start = std::chrono::steady_clock::now();
    auto stamp = [&](TurnResult& r) {
        r.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
    };

    ContextRegistry::Lease lease = registry_.create(npc, player, utterance, role);
    ConversationContext& ctx = *lease;

    TurnResult result;
    result.context_id = ctx.id();
    COLLOQUY_LOG_INFO(COMPONENT, "Turn %s: %s -> %s", ctx.id().c_str(),
                      player.c_str(), npc.c_str());

    // 1. RETRIEVE + MERGE
    COLLOQUY_LOG_DEBUG(COMPONENT, "Step 1: retrieve memory and affinity");
    RetrievalOutcome outcome = retrieve(ctx);
    result.stage_success[stage::MEMORY] = outcome.memory.success;
    result.stage_success[stage::AFFINITY] = outcome.affinity.success;
    merge(ctx, outcome);
    result.affinity_score = ctx.affinity()->score;

    // 2. GENERATE
    COLLOQUY_LOG_DEBUG(COMPONENT, "Step 2: generate reply");
    AgentResult generated = dialogue_agent_.execute(ctx);
    result.stage_success[stage::DIALOGUE] = generated.success;
    if (!generated.success) {
        result.success = false;
        result.error = "dialogue generation failed: " + generated.error;
        result.composed_input = generated.payload.value("input", "");
        stamp(result);
        COLLOQUY_LOG_ERROR(COMPONENT, "Turn %s aborted: %s", ctx.id().c_str(),
                           result.error.c_str());
        return result;
    }
    DialogueOutput dialogue = DialogueOutput::from_payload(generated.payload);
    result.composed_input = dialogue.composed_input;
    if (!ctx.merge_dialogue(std::move(dialogue))) warn_refused(ctx, stage::DIALOGUE);

    // 3. REVISE
    if (revision_active()) {
        COLLOQUY_LOG_DEBUG(COMPONENT, "Step 3: review reply");
        AgentResult reviewed = reflection_agent_.execute(ctx);
        if (reviewed.success) {
            RevisionOutput revision = RevisionOutput::from_payload(reviewed.payload);
            result.stage_success[stage::REVISION] = revision.note.empty();
            if (!ctx.merge_revision(std::move(revision))) warn_refused(ctx, stage::REVISION);
        } else {
            result.stage_success[stage::REVISION] = false;
            COLLOQUY_LOG_WARN(COMPONENT, "Review failed, keeping generated reply: %s",
                              reviewed.error.c_str());
        }
    }

    // The reply is final from here on
    result.reply = ctx.final_reply();
    result.revised = ctx.revision() && ctx.revision()->revised;
    result.success = true;

    // 4. PERSIST
    COLLOQUY_LOG_DEBUG(COMPONENT, "Step 4: update affinity and save memory");
    AgentResult persisted = persist_agent_.execute(ctx);
    if (persisted.success) {
        PersistOutput saved = PersistOutput::from_payload(persisted.payload);
        result.stage_success[stage::AFFINITY_UPDATE] = saved.affinity_ok;
        result.stage_success[stage::PERSISTENCE] = saved.history_ok && saved.episodic_ok;
        result.affinity_changed = saved.affinity_changed;
        if (saved.affinity_changed) result.new_affinity = saved.new_score;
    } else {
        result.stage_success[stage::AFFINITY_UPDATE] = false;
        result.stage_success[stage::PERSISTENCE] = false;
        COLLOQUY_LOG_WARN(COMPONENT, "Persistence stage failed: %s", persisted.error.c_str());
    }

    stamp(result);
    COLLOQUY_LOG_INFO(COMPONENT, "Turn %s done in %.2f ms%s", ctx.id().c_str(),
                      millis(result.elapsed), result.revised ? " (revised)" : "");
    return result;
}

} // namespace colloquy
