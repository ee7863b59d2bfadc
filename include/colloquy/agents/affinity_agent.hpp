#pragma once
// AffinityAgent: where the NPC stands with this player

#include "../agent.hpp"
#include "../context.hpp"
#include "../services.hpp"

namespace colloquy {

class AffinityAgent : public Agent {
public:
    static constexpr const char* NAME = "affinity";

    explicit AffinityAgent(Collaborator<RelationshipService> relationships)
        : Agent(NAME), relationships_(std::move(relationships)) {}

protected:
    AgentResult perform(const ConversationContext& ctx) override {
        return relationships_.match(
            [&](RelationshipService& service) {
                AffinityOutput out;
                out.score = service.score(ctx.npc(), ctx.player());
                out.level = service.level(out.score);
                out.style = service.style(out.score);
                out.narrative = narrative::relationship(out.score, out.level, out.style);
                return AgentResult::ok(out.to_payload());
            },
            [] {
                // Same triple a brand-new relationship would have
                return AgentResult::ok(AffinityOutput::neutral().to_payload());
            });
    }

private:
    Collaborator<RelationshipService> relationships_;
};

} // namespace colloquy
