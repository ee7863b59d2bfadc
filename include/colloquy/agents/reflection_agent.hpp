#pragma once
// ReflectionAgent: quality review of the generated reply
//
// Verdict grammar (after trimming):
//   PASS               keep the reply
//   REVISED: <text>    replace the reply with <text>
//   <anything else>    replace the reply verbatim (see accept_unmarked)
//   <empty>            keep the reply
//
// Review is best-effort: an internal fault keeps the original reply
// and reports success with a diagnostic note.

#include "../agent.hpp"
#include "../context.hpp"
#include "../log.hpp"
#include "../services.hpp"
#include <string>

namespace colloquy {

class ReflectionAgent : public Agent {
public:
    static constexpr const char* NAME = "revision";
    static constexpr const char* APPROVAL_TOKEN = "PASS";
    static constexpr const char* REVISION_MARKER = "REVISED:";

    ReflectionAgent(Collaborator<Reviewer> reviewer, bool accept_unmarked = true)
        : Agent(NAME)
        , reviewer_(std::move(reviewer))
        , accept_unmarked_(accept_unmarked)
    {}

    bool configured() const { return reviewer_.configured(); }

    // Apply the verdict grammar to one reply
    static RevisionOutput interpret(const std::string& reply, const std::string& raw_verdict,
                                    bool accept_unmarked) {
        RevisionOutput out;
        out.final_reply = reply;
        out.verdict = trim(raw_verdict);

        const std::string& verdict = out.verdict;
        if (verdict.empty() || verdict == APPROVAL_TOKEN) {
            return out;
        }

        if (starts_with(verdict, REVISION_MARKER)) {
            std::string revised = trim(verdict.substr(std::string(REVISION_MARKER).size()));
            if (revised.empty()) {
                COLLOQUY_LOG_WARN(NAME, "Revision marker without replacement text, keeping reply");
                return out;
            }
            out.final_reply = revised;
            out.revised = true;
            return out;
        }

        if (!accept_unmarked) {
            COLLOQUY_LOG_WARN(NAME, "Unmarked verdict ignored");
            return out;
        }
        COLLOQUY_LOG_WARN(NAME, "Unmarked verdict used verbatim as the reply");
        out.final_reply = verdict;
        out.revised = true;
        return out;
    }

protected:
    AgentResult perform(const ConversationContext& ctx) override {
        if (!ctx.dialogue()) {
            return AgentResult::failure("no generated reply to review");
        }
        const std::string& reply = ctx.dialogue()->reply;
        const AffinityOutput affinity = ctx.affinity().value_or(AffinityOutput::neutral());

        RevisionOutput out;
        try {
            std::string verdict = reviewer_.match(
                [&](Reviewer& reviewer) {
                    return reviewer.review(reply, ctx.utterance(), ctx.role(),
                                           affinity.level, affinity.style);
                },
                [] { return std::string(APPROVAL_TOKEN); });
            out = interpret(reply, verdict, accept_unmarked_);
        } catch (const std::exception& e) {
            COLLOQUY_LOG_WARN(NAME, "Review failed, keeping original reply: %s", e.what());
            out = RevisionOutput{};
            out.final_reply = reply;
            out.note = std::string("review failed: ") + e.what();
        }

        if (out.revised) {
            COLLOQUY_LOG_DEBUG(NAME, "Reply revised");
        }
        return AgentResult::ok(out.to_payload());
    }

private:
    Collaborator<Reviewer> reviewer_;
    bool accept_unmarked_;
};

} // namespace colloquy
