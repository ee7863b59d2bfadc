#pragma once
// DialogueAgent: composes the enhanced input and generates the reply
//
// Composed input = relationship block, memory block (+ blank line),
// then the current turn. An NPC's own generator (from the rack) wins
// over the shared one. Without either the NPC answers with a fixed
// offline line.

#include "../agent.hpp"
#include "../context.hpp"
#include "../log.hpp"
#include "../services.hpp"
#include <memory>
#include <string>

namespace colloquy {

class DialogueAgent : public Agent {
public:
    static constexpr const char* NAME = "dialogue";

    explicit DialogueAgent(Collaborator<Generator> generator,
                           std::shared_ptr<GeneratorRack> rack = nullptr)
        : Agent(NAME), generator_(std::move(generator)), rack_(std::move(rack)) {}

    static std::string offline_reply(const std::string& npc) {
        return "Hello! I'm " + npc + ". (offline mode)";
    }

protected:
    AgentResult perform(const ConversationContext& ctx) override {
        const MemoryOutput memory = ctx.memory().value_or(MemoryOutput{});
        const AffinityOutput affinity = ctx.affinity().value_or(AffinityOutput::neutral());

        DialogueOutput out;
        out.composed_input = narrative::compose(affinity.narrative, memory.narrative,
                                                ctx.utterance());

        Collaborator<Generator> generator = rack_ ? rack_->lookup(ctx.npc())
                                                  : Collaborator<Generator>::unconfigured();
        if (!generator.configured()) generator = generator_;

        out.reply = generator.match(
            [&](Generator& model) {
                return model.generate(out.composed_input, memory.working_memory);
            },
            [&] { return offline_reply(ctx.npc()); });

        if (trim(out.reply).empty()) {
            return AgentResult::failure("generator returned an empty reply",
                                        {{"input", out.composed_input}});
        }

        COLLOQUY_LOG_DEBUG(NAME, "%s replied (%zu bytes)", ctx.npc().c_str(), out.reply.size());
        return AgentResult::ok(out.to_payload());
    }

private:
    Collaborator<Generator> generator_;
    std::shared_ptr<GeneratorRack> rack_;
};

} // namespace colloquy
