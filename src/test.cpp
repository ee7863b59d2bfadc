#include <colloquy/colloquy.hpp>
#include <colloquy/rpc/handler.hpp>
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

using namespace colloquy;

// ═══════════════════════════════════════════════════════════════════════════
// Test collaborators
// ═══════════════════════════════════════════════════════════════════════════

class RecordingGenerator : public Generator {
public:
    explicit RecordingGenerator(std::string reply = "Hello there") : reply_(std::move(reply)) {}

    std::string generate(const std::string& composed_input, const Transcript& history) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls++;
        last_input = composed_input;
        last_history = history;
        return reply_;
    }

    std::atomic<int> calls{0};
    std::string last_input;
    Transcript last_history;

private:
    std::string reply_;
    std::mutex mutex_;
};

class FailingGenerator : public Generator {
public:
    std::string generate(const std::string&, const Transcript&) override {
        throw std::runtime_error("model offline");
    }
};

class ScriptedReviewer : public Reviewer {
public:
    explicit ScriptedReviewer(std::string verdict) : verdict_(std::move(verdict)) {}

    std::string review(const std::string& reply, const std::string&, const RoleProfile&,
                       const std::string& level, const std::string& style) override {
        calls++;
        last_reply = reply;
        last_level = level;
        last_style = style;
        return verdict_;
    }

    std::atomic<int> calls{0};
    std::string last_reply;
    std::string last_level;
    std::string last_style;

private:
    std::string verdict_;
};

class ThrowingReviewer : public Reviewer {
public:
    std::string review(const std::string&, const std::string&, const RoleProfile&,
                       const std::string&, const std::string&) override {
        throw std::runtime_error("reviewer timed out");
    }
};

class ThrowingShortTermStore : public ShortTermStore {
public:
    Transcript history(const std::string&, const std::string&) override {
        throw std::runtime_error("history backend down");
    }
    void append(const std::string&, const std::string&, const std::string&,
                const std::string&) override {
        throw std::runtime_error("history backend down");
    }
    void extend_expiry(const std::string&, const std::string&) override {
        throw std::runtime_error("history backend down");
    }
    void clear(const std::string&, const std::string&) override {}
};

class ThrowingRelationships : public RelationshipService {
public:
    float score(const std::string&, const std::string&) override {
        throw std::runtime_error("ledger unavailable");
    }
    std::string level(float) const override { return "?"; }
    std::string style(float) const override { return "?"; }
    AffinityUpdate analyze_and_update(const std::string&, const std::string&,
                                      const std::string&, const std::string&) override {
        throw std::runtime_error("ledger unavailable");
    }
};

class ThrowingLongTermStore : public LongTermStore {
public:
    std::vector<MemorySnippet> search(const std::string&, size_t) override {
        throw std::runtime_error("index corrupt");
    }
    void add(const std::vector<MemorySnippet>&) override {
        throw std::runtime_error("index corrupt");
    }
};

// Throws something that is not a std::exception from search
class OddThrowLongTermStore : public LongTermStore {
public:
    std::vector<MemorySnippet> search(const std::string&, size_t) override {
        throw 7;
    }
    void add(const std::vector<MemorySnippet>& entries) override {
        added += entries.size();
    }

    std::atomic<size_t> added{0};
};

class OddThrowRelationships : public RelationshipService {
public:
    float score(const std::string&, const std::string&) override { return 61.0f; }
    std::string level(float) const override { return "Friendly"; }
    std::string style(float) const override { return "Warm and chatty"; }
    AffinityUpdate analyze_and_update(const std::string&, const std::string&,
                                      const std::string&, const std::string&) override {
        throw 42;
    }
};

class OddThrowShortTermStore : public ShortTermStore {
public:
    Transcript history(const std::string&, const std::string&) override { return {}; }
    void append(const std::string&, const std::string&, const std::string&,
                const std::string&) override {
        throw 9;
    }
    void extend_expiry(const std::string&, const std::string&) override {}
    void clear(const std::string&, const std::string&) override {}
};

class CountingJudge : public AffinityJudge {
public:
    explicit CountingJudge(float step) : step_(step) {}

    float delta(const std::string&, const std::string&, const std::string&,
                const std::string& reply) override {
        calls++;
        last_reply = reply;
        return step_;
    }

    std::atomic<int> calls{0};
    std::string last_reply;

private:
    float step_;
};

class ThrowingAgent : public Agent {
public:
    ThrowingAgent() : Agent("thrower") {}
protected:
    AgentResult perform(const ConversationContext&) override {
        throw std::runtime_error("boom");
    }
};

class SilentFailureAgent : public Agent {
public:
    SilentFailureAgent() : Agent("silent") {}
protected:
    AgentResult perform(const ConversationContext&) override {
        AgentResult r;
        r.success = false;
        return r;
    }
};

class OddThrowAgent : public Agent {
public:
    OddThrowAgent() : Agent("odd") {}
protected:
    AgentResult perform(const ConversationContext&) override {
        throw 42;
    }
};

RoleProfile test_role(const std::string& name = "A") {
    RoleProfile role;
    role.name = name;
    role.title = "Tester";
    role.style = "Plain";
    return role;
}

const std::string NEUTRAL_NARRATIVE =
    "[Current relationship]\n"
    "Your relationship with the player: Stranger (affinity: 50/100)\n"
    "[Speaking style] Polite and friendly\n\n";

// ═══════════════════════════════════════════════════════════════════════════
// Contracts
// ═══════════════════════════════════════════════════════════════════════════

void test_agent_contract() {
    std::cout << "Testing Agent contract..." << std::endl;

    ConversationContext ctx("c1", "A", "p1", "hello", test_role());

    ThrowingAgent thrower;
    AgentResult r = thrower.execute(ctx);
    assert(!r.success);
    assert(r.error == "boom");
    assert(r.producer == "thrower");
    assert(r.completed_at > 0);

    SilentFailureAgent silent;
    r = silent.execute(ctx);
    assert(!r.success);
    assert(!r.error.empty());

    OddThrowAgent odd;
    r = odd.execute(ctx);
    assert(!r.success);
    assert(r.error.find("odd") != std::string::npos);

    auto future = thrower.launch(ctx);
    r = future.get();
    assert(!r.success && r.error == "boom");

    assert(AgentResult::failure("").error == "unknown error");
    assert(AgentResult::ok({{"k", 1}}).error.empty());

    std::cout << "  PASS" << std::endl;
}

void test_collaborator() {
    std::cout << "Testing Collaborator..." << std::endl;

    Collaborator<Generator> none;
    assert(!none.configured());
    std::string out = none.match([](Generator&) { return std::string("configured"); },
                                 [] { return std::string("unconfigured"); });
    assert(out == "unconfigured");

    std::shared_ptr<RecordingGenerator> null_handle;
    Collaborator<Generator> from_null(null_handle);
    assert(!from_null.configured());

    Collaborator<Generator> some(std::make_shared<RecordingGenerator>("hi"));
    assert(some.configured());
    out = some.match([](Generator& g) { return g.generate("x", {}); },
                     [] { return std::string(); });
    assert(out == "hi");

    std::cout << "  PASS" << std::endl;
}

void test_context_merges_once() {
    std::cout << "Testing ConversationContext write-once merges..." << std::endl;

    ConversationContext ctx("c1", "A", "p1", "hello", test_role());
    assert(ctx.final_reply().empty());

    DialogueOutput first;
    first.reply = "one";
    assert(ctx.merge_dialogue(first));
    DialogueOutput second;
    second.reply = "two";
    assert(!ctx.merge_dialogue(second));
    assert(ctx.final_reply() == "one");

    RevisionOutput revision;
    revision.final_reply = "revised";
    revision.revised = true;
    assert(ctx.merge_revision(revision));
    assert(ctx.final_reply() == "revised");

    json summary = ctx.summary();
    assert(summary["has_dialogue"] == true);
    assert(summary["has_memory"] == false);

    std::cout << "  PASS" << std::endl;
}

void test_narrative_blocks() {
    std::cout << "Testing narrative blocks..." << std::endl;

    assert(narrative::relationship(50.0f, "Stranger", "Polite and friendly") == NEUTRAL_NARRATIVE);
    assert(narrative::relationship(71.6f, "Friendly", "Warm").find("(affinity: 72/100)")
           != std::string::npos);

    assert(narrative::memories({}).empty());
    std::string block = narrative::memories({"a", "b", "c", "d"});
    assert(block == "[Relevant memories]\n- a\n- b\n- c");

    std::string composed = narrative::compose("R\n\n", "[Relevant memories]\n- a", "hi");
    assert(composed == "R\n\n[Relevant memories]\n- a\n\n[Current conversation]\nPlayer: hi");
    assert(narrative::compose("R\n\n", "", "hi") == "R\n\n[Current conversation]\nPlayer: hi");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Stages
// ═══════════════════════════════════════════════════════════════════════════

void test_memory_stage_without_long_term_store() {
    std::cout << "Testing memory stage without long-term store..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    store->append("A", "p1", role::HUMAN, "earlier");
    auto shelf = std::make_shared<EpisodicShelf>();  // Nothing placed for "A"

    MemoryAgent agent(store, shelf);
    ConversationContext ctx("c1", "A", "p1", "hello", test_role());
    AgentResult r = agent.execute(ctx);
    assert(r.success);

    MemoryOutput out = MemoryOutput::from_payload(r.payload);
    assert(out.episodic.empty());
    assert(out.narrative.empty());
    assert(out.working_memory.size() == 1);

    // No shelf at all behaves the same
    MemoryAgent bare(Collaborator<ShortTermStore>(), nullptr);
    r = bare.execute(ctx);
    assert(r.success);
    out = MemoryOutput::from_payload(r.payload);
    assert(out.working_memory.empty() && out.episodic.empty() && out.narrative.empty());

    std::cout << "  PASS" << std::endl;
}

void test_memory_stage_failures() {
    std::cout << "Testing memory stage failure paths..." << std::endl;

    ConversationContext ctx("c1", "A", "p1", "hello", test_role());

    // Long-term search error degrades to no snippets
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", std::make_shared<ThrowingLongTermStore>());
    MemoryAgent degraded(std::make_shared<InMemoryShortTermStore>(), shelf);
    AgentResult r = degraded.execute(ctx);
    assert(r.success);
    assert(r.payload.contains("episodic_error"));
    assert(MemoryOutput::from_payload(r.payload).episodic.empty());

    // Short-term read error fails the stage
    MemoryAgent broken(std::make_shared<ThrowingShortTermStore>(), nullptr);
    r = broken.execute(ctx);
    assert(!r.success);
    assert(r.error == "history backend down");
    assert(r.producer == MemoryAgent::NAME);

    std::cout << "  PASS" << std::endl;
}

void test_memory_stage_snippets() {
    std::cout << "Testing memory stage snippets..." << std::endl;

    auto episodic = std::make_shared<InMemoryEpisodicStore>();
    episodic->add({{"Player said: I love coffee", json::object()},
                   {"A said: Coffee is great", json::object()},
                   {"Player said: the weather is bad", json::object()}});
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", episodic);

    MemoryConfig config;
    config.episodic_top_k = 2;
    MemoryAgent agent(Collaborator<ShortTermStore>(), shelf, config);
    ConversationContext ctx("c1", "A", "p1", "any coffee today?", test_role());
    AgentResult r = agent.execute(ctx);
    assert(r.success);

    MemoryOutput out = MemoryOutput::from_payload(r.payload);
    assert(out.episodic.size() == 2);
    assert(out.narrative.rfind("[Relevant memories]\n- ", 0) == 0);
    assert(out.narrative.find("weather") == std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_affinity_stage_neutral() {
    std::cout << "Testing affinity stage without relationships..." << std::endl;

    AffinityAgent agent{Collaborator<RelationshipService>()};
    ConversationContext ctx("c1", "A", "p1", "hello", test_role());

    AgentResult first = agent.execute(ctx);
    AgentResult second = agent.execute(ctx);
    assert(first.success && second.success);
    assert(first.payload == second.payload);

    AffinityOutput out = AffinityOutput::from_payload(first.payload);
    assert(out.score == affinity::NEUTRAL_SCORE);
    assert(out.narrative == NEUTRAL_NARRATIVE);

    // Same triple as a relationship nobody has touched
    RelationshipLedger ledger(std::make_shared<InMemoryScoreTable>());
    float fresh = ledger.score("A", "p1");
    assert(fresh == out.score);
    assert(ledger.level(fresh) == out.level);
    assert(ledger.style(fresh) == out.style);

    std::cout << "  PASS" << std::endl;
}

void test_dialogue_stage() {
    std::cout << "Testing dialogue stage..." << std::endl;

    ConversationContext ctx("c1", "A", "p1", "hello", test_role());

    DialogueAgent offline{Collaborator<Generator>()};
    AgentResult r = offline.execute(ctx);
    assert(r.success);
    assert(DialogueOutput::from_payload(r.payload).reply == "Hello! I'm A. (offline mode)");

    DialogueAgent blank{std::make_shared<RecordingGenerator>("   ")};
    r = blank.execute(ctx);
    assert(!r.success);

    DialogueAgent failing{std::make_shared<FailingGenerator>()};
    r = failing.execute(ctx);
    assert(!r.success && r.error == "model offline");

    std::cout << "  PASS" << std::endl;
}

void test_revision_verdicts() {
    std::cout << "Testing revision verdict rules..." << std::endl;

    RevisionOutput out = ReflectionAgent::interpret("Hi.", "PASS", true);
    assert(out.final_reply == "Hi." && !out.revised);

    out = ReflectionAgent::interpret("Hi.", "  PASS\n", true);
    assert(out.final_reply == "Hi." && !out.revised);

    out = ReflectionAgent::interpret("Hi.", "REVISED: Hello, friend.", true);
    assert(out.final_reply == "Hello, friend." && out.revised);

    out = ReflectionAgent::interpret("Hi.", "Be warmer.", true);
    assert(out.final_reply == "Be warmer." && out.revised);

    out = ReflectionAgent::interpret("Hi.", "Be warmer.", false);
    assert(out.final_reply == "Hi." && !out.revised);

    out = ReflectionAgent::interpret("Hi.", "", true);
    assert(out.final_reply == "Hi." && !out.revised);

    out = ReflectionAgent::interpret("Hi.", "REVISED:   ", true);
    assert(out.final_reply == "Hi." && !out.revised);

    // "pass" is not the approval token
    out = ReflectionAgent::interpret("Hi.", "pass", true);
    assert(out.final_reply == "pass" && out.revised);

    std::cout << "  PASS" << std::endl;
}

void test_revision_stage_fault() {
    std::cout << "Testing revision stage internal fault..." << std::endl;

    ConversationContext ctx("c1", "A", "p1", "hello", test_role());
    DialogueOutput dialogue;
    dialogue.reply = "Original";
    ctx.merge_dialogue(dialogue);

    ReflectionAgent agent{std::make_shared<ThrowingReviewer>()};
    AgentResult r = agent.execute(ctx);
    assert(r.success);
    RevisionOutput out = RevisionOutput::from_payload(r.payload);
    assert(out.final_reply == "Original");
    assert(!out.revised);
    assert(out.note.find("reviewer timed out") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_persist_entries() {
    std::cout << "Testing persisted episodic entries..." << std::endl;

    auto entries = PersistAgent::episodic_entries("A", "p1", "hello", "Hi there", 1700000000000);
    assert(entries.size() == 2);
    assert(entries[0].content == "Player said: hello");
    assert(entries[0].metadata["speaker"] == "player");
    assert(entries[0].metadata["type"] == "player_message");
    assert(entries[0].metadata["player_id"] == "p1");
    assert(entries[1].content == "A said: Hi there");
    assert(entries[1].metadata["speaker"] == "A");
    assert(entries[1].metadata["type"] == "npc_response");
    assert(entries[0].metadata["timestamp"] == entries[1].metadata["timestamp"]);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Coordinator
// ═══════════════════════════════════════════════════════════════════════════

void test_scenario_first_contact() {
    std::cout << "Testing first contact turn..." << std::endl;

    auto generator = std::make_shared<RecordingGenerator>();
    auto store = std::make_shared<InMemoryShortTermStore>();
    Collaborators c;
    c.short_term = store;
    c.generator = generator;
    Coordinator coordinator(c);

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(result.success);
    assert(result.reply == "Hello there");
    assert(result.affinity_score == affinity::NEUTRAL_SCORE);
    assert(!result.affinity_changed && !result.new_affinity);
    assert(generator->last_input == NEUTRAL_NARRATIVE + "[Current conversation]\nPlayer: hello");
    assert(generator->last_input.find("[Relevant memories]") == std::string::npos);
    assert(generator->last_history.empty());
    assert(result.composed_input == generator->last_input);

    assert(result.stage_success.at(stage::MEMORY));
    assert(result.stage_success.at(stage::AFFINITY));
    assert(result.stage_success.at(stage::DIALOGUE));
    assert(result.stage_success.count(stage::REVISION) == 0);
    assert(result.stage_success.at(stage::AFFINITY_UPDATE));
    assert(result.stage_success.at(stage::PERSISTENCE));

    Transcript saved = store->history("A", "p1");
    assert(saved.size() == 2);
    assert(saved[0] == (Message{role::HUMAN, "hello"}));
    assert(saved[1] == (Message{role::AI, "Hello there"}));

    // The context stays inspectable until it idles out
    auto summary = coordinator.registry().summary(result.context_id);
    assert(summary && (*summary)["has_dialogue"] == true);

    std::cout << "  PASS" << std::endl;
}

void test_scenario_prior_history() {
    std::cout << "Testing turn with prior history..." << std::endl;

    auto generator = std::make_shared<RecordingGenerator>();
    auto store = std::make_shared<InMemoryShortTermStore>(20);
    store->append("A", "p1", role::HUMAN, "m1");
    store->append("A", "p1", role::AI, "r1");
    store->append("A", "p1", role::HUMAN, "m2");

    Collaborators c;
    c.short_term = store;
    c.generator = generator;
    MemoryConfig memory;
    memory.history_limit = 4;
    Coordinator coordinator(c, PipelineConfig{}, memory);

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(result.success);
    Transcript expected = {{role::HUMAN, "m1"}, {role::AI, "r1"}, {role::HUMAN, "m2"}};
    assert(generator->last_history == expected);

    // Now 5 stored messages, capped at 4 newest
    result = coordinator.run_turn("A", "p1", "again", test_role());
    assert(result.success);
    assert(generator->last_history.size() == 4);
    assert(generator->last_history.front().content == "r1");
    assert(generator->last_history.back().content == "Hello there");

    std::cout << "  PASS" << std::endl;
}

void test_scenario_generation_failure() {
    std::cout << "Testing generation failure aborts the turn..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    auto judge = std::make_shared<CountingJudge>(5.0f);
    auto ledger = std::make_shared<RelationshipLedger>(std::make_shared<InMemoryScoreTable>(), judge);
    auto episodic = std::make_shared<InMemoryEpisodicStore>();
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", episodic);
    auto reviewer = std::make_shared<ScriptedReviewer>("PASS");

    Collaborators c;
    c.relationships = ledger;
    c.short_term = store;
    c.shelf = shelf;
    c.generator = std::make_shared<FailingGenerator>();
    c.reviewer = reviewer;
    Coordinator coordinator(c);

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(!result.success);
    assert(result.error == "dialogue generation failed: model offline");
    assert(result.reply.empty());
    assert(!result.stage_success.at(stage::DIALOGUE));
    assert(result.stage_success.count(stage::PERSISTENCE) == 0);

    assert(store->history("A", "p1").empty());
    assert(episodic->size() == 0);
    assert(judge->calls == 0);
    assert(reviewer->calls == 0);
    assert(ledger->score("A", "p1") == affinity::NEUTRAL_SCORE);

    std::cout << "  PASS" << std::endl;
}

void test_scenario_revised_reply_persisted() {
    std::cout << "Testing revised reply is what gets persisted..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    auto judge = std::make_shared<CountingJudge>(0.0f);
    auto episodic = std::make_shared<InMemoryEpisodicStore>();
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", episodic);
    auto reviewer = std::make_shared<ScriptedReviewer>("REVISED: Hi there");

    Collaborators c;
    c.relationships = std::make_shared<RelationshipLedger>(std::make_shared<InMemoryScoreTable>(), judge);
    c.short_term = store;
    c.shelf = shelf;
    c.generator = std::make_shared<RecordingGenerator>("Yo.");
    c.reviewer = reviewer;
    Coordinator coordinator(c);
    assert(coordinator.revision_active());

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(result.success);
    assert(result.reply == "Hi there");
    assert(result.revised);
    assert(result.stage_success.at(stage::REVISION));
    assert(reviewer->last_reply == "Yo.");
    assert(reviewer->last_level == affinity::NEUTRAL_LEVEL);

    Transcript saved = store->history("A", "p1");
    assert(saved.size() == 2);
    assert(saved[1].content == "Hi there");
    assert(judge->last_reply == "Hi there");

    auto recent = episodic->recent(10);
    assert(recent.size() == 2);
    assert(recent[1].content == "A said: Hi there");

    std::cout << "  PASS" << std::endl;
}

void test_revision_disabled() {
    std::cout << "Testing revision switch..." << std::endl;

    auto reviewer = std::make_shared<ScriptedReviewer>("REVISED: nope");
    Collaborators c;
    c.generator = std::make_shared<RecordingGenerator>("Fine.");
    c.reviewer = reviewer;

    PipelineConfig pipeline;
    pipeline.enable_revision = false;
    Coordinator coordinator(c, pipeline);
    assert(!coordinator.revision_active());

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(result.success && result.reply == "Fine." && !result.revised);
    assert(reviewer->calls == 0);
    assert(result.stage_success.count(stage::REVISION) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_degradation() {
    std::cout << "Testing degraded turn still succeeds..." << std::endl;

    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", std::make_shared<ThrowingLongTermStore>());

    Collaborators c;
    c.relationships = std::make_shared<ThrowingRelationships>();
    c.short_term = std::make_shared<ThrowingShortTermStore>();
    c.shelf = shelf;
    c.generator = std::make_shared<RecordingGenerator>("Still here.");
    c.reviewer = std::make_shared<ThrowingReviewer>();

    for (bool parallel : {true, false}) {
        PipelineConfig pipeline;
        pipeline.parallel_retrieval = parallel;
        Coordinator coordinator(c, pipeline);

        TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
        assert(result.success);
        assert(result.error.empty());
        assert(result.reply == "Still here.");
        assert(!result.revised);
        assert(result.affinity_score == affinity::NEUTRAL_SCORE);
        assert(!result.affinity_changed);

        assert(!result.stage_success.at(stage::MEMORY));
        assert(!result.stage_success.at(stage::AFFINITY));
        assert(result.stage_success.at(stage::DIALOGUE));
        assert(!result.stage_success.at(stage::REVISION));
        assert(!result.stage_success.at(stage::AFFINITY_UPDATE));
        assert(!result.stage_success.at(stage::PERSISTENCE));
    }

    std::cout << "  PASS" << std::endl;
}

void test_affinity_change_reported() {
    std::cout << "Testing affinity change in turn result..." << std::endl;

    auto table = std::make_shared<InMemoryScoreTable>();
    auto ledger = std::make_shared<RelationshipLedger>(table, std::make_shared<KeywordJudge>());
    Collaborators c;
    c.relationships = ledger;
    c.generator = std::make_shared<RecordingGenerator>();
    Coordinator coordinator(c);

    TurnResult result = coordinator.run_turn("A", "p1", "thank you so much", test_role());
    assert(result.success);
    assert(result.affinity_score == affinity::NEUTRAL_SCORE);
    assert(result.affinity_changed);
    assert(result.new_affinity && std::fabs(*result.new_affinity - 52.0f) < 1e-4f);
    assert(std::fabs(ledger->score("A", "p1") - 52.0f) < 1e-4f);

    json j = result.to_json();
    assert(j["affinity_changed"] == true);
    assert(j.contains("new_affinity"));

    result = coordinator.run_turn("A", "p1", "ok", test_role());
    assert(!result.affinity_changed && !result.new_affinity);
    assert(std::fabs(result.affinity_score - 52.0f) < 1e-4f);

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_order_independence() {
    std::cout << "Testing retrieval concurrency does not change merge output..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    store->append("A", "p1", role::HUMAN, "do you like tea?");
    store->append("A", "p1", role::AI, "I prefer coffee.");
    auto table = std::make_shared<InMemoryScoreTable>();
    table->put("A", "p1", 72.0f);
    auto episodic = std::make_shared<InMemoryEpisodicStore>();
    episodic->add(PersistAgent::episodic_entries("A", "p1", "tea time", "coffee time", 1700000000000));
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", episodic);

    Collaborators c;
    c.relationships = std::make_shared<RelationshipLedger>(table);
    c.short_term = store;
    c.shelf = shelf;

    PipelineConfig parallel;
    parallel.parallel_retrieval = true;
    PipelineConfig sequential;
    sequential.parallel_retrieval = false;
    Coordinator concurrent_coordinator(c, parallel);
    Coordinator sequential_coordinator(c, sequential);

    auto merged = [](Coordinator& coordinator) {
        auto lease = coordinator.registry().create("A", "p1", "more tea?", test_role());
        coordinator.merge(*lease, coordinator.retrieve(*lease));
        return lease->to_json().dump();
    };

    std::string a = merged(concurrent_coordinator);
    std::string b = merged(sequential_coordinator);
    assert(a == b);
    assert(a.find("Friendly") != std::string::npos);
    assert(a.find("[Relevant memories]") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry, config, stores
// ═══════════════════════════════════════════════════════════════════════════

void test_context_registry() {
    std::cout << "Testing ContextRegistry..." << std::endl;

    ContextRegistry registry(1000);
    std::string id;
    {
        auto lease = registry.create("A", "p1", "hello", test_role());
        assert(lease);
        id = lease->id();
        assert(id.rfind("A:p1:", 0) == 0);
        assert(registry.contains(id));

        // Pinned entries survive removal and sweeps
        assert(!registry.remove(id));
        assert(registry.expire_idle(now() + 10000) == 0);

        auto other = registry.create("A", "p1", "hello", test_role());
        assert(other->id() != id);
    }
    assert(registry.size() == 2);
    assert(!registry.acquire("missing"));

    {
        auto again = registry.acquire(id);
        assert(again && again->utterance() == "hello");
    }

    assert(registry.expire_idle(now()) == 0);
    assert(registry.expire_idle(now() + 5000) == 2);
    assert(registry.size() == 0);
    assert(!registry.summary(id));

    auto lease = registry.create("B", "p2", "bye", test_role("B"));
    std::string kept = lease->id();
    lease = ContextRegistry::Lease();
    assert(registry.remove(kept));

    // Readers see the state as of the last release, never a context mid-turn
    auto busy = registry.create("C", "p3", "hi", test_role("C"));
    DialogueOutput dialogue;
    dialogue.reply = "Hey";
    busy->merge_dialogue(dialogue);
    std::string busy_id = busy->id();
    assert((*registry.summary(busy_id))["has_dialogue"] == false);
    busy = ContextRegistry::Lease();
    assert((*registry.summary(busy_id))["has_dialogue"] == true);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    ServiceConfig defaults;
    assert(defaults.pipeline.enable_revision);
    assert(defaults.pipeline.parallel_retrieval);
    assert(defaults.memory.history_limit == 10);
    assert(defaults.memory.history_ttl_ms == 3600000);

    json doc = {
        {"pipeline", {{"parallel_retrieval", false}}},
        {"memory", {{"history_limit", 6}}},
        {"default_player", "hero"},
        {"unknown_key", 1}
    };
    ServiceConfig config = config_from_json(doc);
    assert(!config.pipeline.parallel_retrieval);
    assert(config.pipeline.enable_revision);
    assert(config.memory.history_limit == 6);
    assert(config.default_player == "hero");
    assert(config_to_json(config)["memory"]["history_limit"] == 6);

    bool threw = false;
    try {
        config_from_json({{"pipeline", {{"enable_revision", "yes"}}}});
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("pipeline.enable_revision") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        config_from_json({{"memory", {{"history_limit", 0}}}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    for (const json& bad : {json{{"memory", {{"history_limit", -1}}}},
                            json{{"memory", {{"episodic_top_k", -3}}}},
                            json{{"memory", {{"episodic_top_k", 2.5}}}},
                            json{{"memory", {{"history_ttl_ms", -1000}}}},
                            json{{"registry", {{"idle_timeout_ms", -5}}}}}) {
        threw = false;
        try {
            config_from_json(bad);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("non-negative integer") != std::string::npos;
        }
        assert(threw);
    }

    threw = false;
    try {
        load_config("/nonexistent/colloquy.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    setenv("COLLOQUY_HISTORY_DB", "/tmp/colloquy-test.db", 1);
    setenv("COLLOQUY_VERBOSE", "true", 1);
    ServiceConfig env;
    apply_env_overrides(env);
    assert(env.history_db == "/tmp/colloquy-test.db");
    assert(env.verbose);
    unsetenv("COLLOQUY_HISTORY_DB");
    unsetenv("COLLOQUY_VERBOSE");

    std::cout << "  PASS" << std::endl;
}

void test_short_term_store() {
    std::cout << "Testing InMemoryShortTermStore..." << std::endl;

    InMemoryShortTermStore store(3);
    store.append("A", "p1", role::HUMAN, "  one\n");
    store.append("A", "p1", role::AI, "two");
    store.append("A", "p1", role::HUMAN, "three");
    store.append("A", "p1", role::AI, "four");

    Transcript history = store.history("A", "p1");
    assert(history.size() == 3);
    assert(history[0].content == "two");
    assert(history[2].content == "four");
    assert(store.history("A", "p2").empty());
    assert(store.history("B", "p1").empty());

    store.clear("A", "p1");
    assert(store.history("A", "p1").empty());

    InMemoryShortTermStore fleeting(10, 0);
    fleeting.append("A", "p1", role::HUMAN, "gone");
    assert(fleeting.history("A", "p1").empty());

    InMemoryShortTermStore trimmed(10);
    trimmed.append("A", "p1", role::HUMAN, "  spaced  ");
    assert(trimmed.history("A", "p1")[0].content == "spaced");

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_stores() {
    std::cout << "Testing SQLite stores..." << std::endl;

    auto db = std::make_shared<SqliteDatabase>(":memory:");
    SqliteShortTermStore store(db, 3);
    store.append("A", "p1", role::HUMAN, " one ");
    store.append("A", "p1", role::AI, "two");
    store.append("A", "p1", role::HUMAN, "three");
    store.append("A", "p1", role::AI, "four");
    store.append("A", "p2", role::HUMAN, "other player");
    store.extend_expiry("A", "p1");

    Transcript history = store.history("A", "p1");
    assert(history.size() == 3);
    assert(history[0] == (Message{role::AI, "two"}));
    assert(history[2] == (Message{role::AI, "four"}));
    assert(store.history("A", "p2").size() == 1);

    store.clear("A", "p1");
    assert(store.history("A", "p1").empty());
    assert(store.history("A", "p2").size() == 1);

    SqliteShortTermStore fleeting(db, 3, 0);
    fleeting.append("B", "p1", role::HUMAN, "gone");
    assert(fleeting.history("B", "p1").empty());

    SqliteScoreTable scores(db);
    assert(!scores.get("A", "p1"));
    scores.put("A", "p1", 61.5f);
    scores.put("B", "p1", 12.0f);
    scores.put("A", "p2", 90.0f);
    scores.put("A", "p1", 64.0f);
    assert(*scores.get("A", "p1") == 64.0f);
    auto all = scores.all_for("p1");
    assert(all.size() == 2);
    assert(all["B"] == 12.0f);

    bool threw = false;
    try {
        SqliteDatabase bad("/nonexistent/dir/history.db");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_episodic_index() {
    std::cout << "Testing InMemoryEpisodicStore..." << std::endl;

    InMemoryEpisodicStore store;
    assert(store.search("anything", 3).empty());

    store.add({{"the cat sat on the mat", json::object()},
               {"dogs chase cats", json::object()},
               {"quantum chromodynamics lecture", json::object()},
               {"the cat sat on the mat", {{"copy", 2}}}});

    auto hits = store.search("cat mat", 5);
    assert(hits.size() == 2);
    // Identical content ties; newest first
    assert(hits[0].metadata.contains("copy"));
    assert(hits[1].content == "the cat sat on the mat");

    assert(store.search("cat mat", 1).size() == 1);
    assert(store.search("zebra", 3).empty());

    auto newest = store.search("?", 2);
    assert(newest.size() == 2);
    assert(newest[0].metadata.contains("copy"));
    assert(newest[1].content == "quantum chromodynamics lecture");

    assert(tokenize("Hi, I'm A!") == (std::vector<std::string>{"hi"}));
    assert(cosine(term_vector("a b c"), term_vector("x y z")) == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_relationship_ledger() {
    std::cout << "Testing RelationshipLedger..." << std::endl;

    auto table = std::make_shared<InMemoryScoreTable>();
    RelationshipLedger readonly(table);
    assert(readonly.level(0.0f) == "Hostile");
    assert(readonly.level(19.9f) == "Hostile");
    assert(readonly.level(20.0f) == "Wary");
    assert(readonly.level(40.0f) == "Stranger");
    assert(readonly.level(60.0f) == "Friendly");
    assert(readonly.level(80.0f) == "Close friend");
    assert(readonly.level(100.0f) == "Close friend");
    assert(readonly.level(-5.0f) == "Hostile");
    assert(readonly.style(50.0f) == affinity::NEUTRAL_STYLE);

    AffinityUpdate update = readonly.analyze_and_update("A", "p1", "thanks", "sure");
    assert(!update.changed);
    assert(update.new_score == affinity::NEUTRAL_SCORE);

    assert(readonly.set_score("A", "p1", 140.0f) == 100.0f);
    assert(readonly.score("A", "p1") == 100.0f);
    assert(readonly.set_score("B", "p1", -3.0f) == 0.0f);
    auto scores = readonly.scores_for("p1");
    assert(scores.size() == 2 && scores["B"] == 0.0f);

    RelationshipLedger judged(std::make_shared<InMemoryScoreTable>(),
                              std::make_shared<CountingJudge>(30.0f));
    update = judged.analyze_and_update("A", "p1", "hi", "hello");
    assert(update.changed && update.new_score == 80.0f);
    update = judged.analyze_and_update("A", "p1", "hi", "hello");
    assert(update.changed && update.new_score == 100.0f);
    update = judged.analyze_and_update("A", "p1", "hi", "hello");
    assert(!update.changed && update.new_score == 100.0f);

    KeywordJudge judge;
    assert(judge.delta("A", "p1", "Thank you, please help", "") == 2 * KeywordJudge::WARM_STEP);
    assert(judge.delta("A", "p1", "you are stupid and useless", "") == 2 * KeywordJudge::HOSTILE_STEP);
    assert(judge.delta("A", "p1", "hello", "thank you") == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_roster() {
    std::cout << "Testing Roster..." << std::endl;

    Roster builtin = Roster::builtin();
    assert(builtin.size() == 3);
    assert(builtin.names() == (std::vector<std::string>{"Zhang San", "Li Si", "Wang Wu"}));
    assert(builtin.find("Li Si")->title == "Product manager");
    assert(!builtin.find("Nobody"));

    json doc = json::object();
    doc["npcs"] = json::array({json{{"name", "Mira"}, {"title", "Smith"}}});
    Roster custom = Roster::from_json(doc);
    assert(custom.size() == 1 && custom.contains("Mira"));

    bool threw = false;
    try {
        Roster::from_json(json::array({json{{"name", "X"}}, json{{"name", "X"}}}));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::string prompt = system_prompt(*builtin.find("Wang Wu"));
    assert(prompt.find("You are Wang Wu") == 0);
    assert(prompt.find("UI designer") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Service and RPC
// ═══════════════════════════════════════════════════════════════════════════

void test_dialogue_service() {
    std::cout << "Testing DialogueService..." << std::endl;

    DialogueService service(ServiceConfig{}, Roster::builtin());

    TurnResult missing = service.chat("Nobody", "p1", "hello");
    assert(!missing.success);
    assert(missing.error == "NPC 'Nobody' does not exist");

    TurnResult empty = service.chat("Li Si", "p1", "   ");
    assert(!empty.success);

    TurnResult result = service.chat("Zhang San", "p1", "hello");
    assert(result.success);
    assert(result.reply == "Hello! I'm Zhang San. (offline mode)");

    assert(service.history("Zhang San", "p1")->size() == 2);
    assert(!service.history("Nobody", "p1"));
    assert(service.memories("Zhang San")->size() == 2);
    assert(service.memories("Li Si")->empty());

    auto info = service.npc_info("Wang Wu");
    assert(info && (*info)["available"] == true);
    assert(!service.npc_info("Nobody"));
    assert(service.list_npcs().size() == 3);

    auto entry = service.affinity("Zhang San", "p1");
    assert(entry && (*entry)["level"] == "Stranger");
    entry = service.set_affinity("Zhang San", "p1", 85.0f);
    assert((*entry)["level"] == "Close friend");
    assert(service.affinities("p1").contains("Zhang San"));

    assert(service.context_summary(result.context_id));
    assert(service.clear_memory("Zhang San", "p1"));
    assert(service.history("Zhang San", "p1")->empty());
    assert(!service.clear_memory("Nobody", "p1"));

    // SQLite-backed variant
    ServiceConfig persisted;
    persisted.history_db = ":memory:";
    DialogueService on_disk(persisted, Roster::builtin());
    assert(on_disk.chat("Li Si", "p9", "thank you").success);
    assert(on_disk.history("Li Si", "p9")->size() == 2);
    assert((*on_disk.affinity("Li Si", "p9"))["affinity"].get<float>() > affinity::NEUTRAL_SCORE);

    std::cout << "  PASS" << std::endl;
}

void test_dialogue_service_with_hooks() {
    std::cout << "Testing DialogueService with generator and reviewer..." << std::endl;

    ServiceHooks hooks;
    hooks.generator = std::make_shared<RecordingGenerator>("Sure thing.");
    hooks.reviewer = std::make_shared<ScriptedReviewer>("PASS");
    DialogueService service(ServiceConfig{}, Roster::builtin(), hooks);
    assert(service.coordinator().revision_active());

    TurnResult result = service.chat("Li Si", "player", "hello");
    assert(result.success);
    assert(result.reply == "Sure thing.");
    assert(!result.revised);
    assert(result.stage_success.at(stage::REVISION));

    std::cout << "  PASS" << std::endl;
}

void test_nonstandard_faults_degrade() {
    std::cout << "Testing non-standard exceptions stay inside their branch..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    store->append("A", "p1", role::HUMAN, "remember me");
    auto episodic = std::make_shared<OddThrowLongTermStore>();
    auto shelf = std::make_shared<EpisodicShelf>();
    shelf->place("A", episodic);
    auto generator = std::make_shared<RecordingGenerator>();

    Collaborators c;
    c.relationships = std::make_shared<OddThrowRelationships>();
    c.short_term = store;
    c.shelf = shelf;
    c.generator = generator;
    Coordinator coordinator(c);

    TurnResult result = coordinator.run_turn("A", "p1", "hello", test_role());
    assert(result.success);
    assert(result.stage_success.at(stage::MEMORY));
    assert(generator->last_history.size() == 1);
    assert(generator->last_history[0].content == "remember me");
    assert(result.affinity_score == 61.0f);
    assert(!result.stage_success.at(stage::AFFINITY_UPDATE));
    assert(result.stage_success.at(stage::PERSISTENCE));
    assert(store->history("A", "p1").size() == 3);
    assert(episodic->added == 2);

    // Same for the working-memory save
    PersistAgent persist(Collaborator<RelationshipService>(),
                         std::make_shared<OddThrowShortTermStore>(), nullptr);
    ConversationContext ctx("c1", "A", "p1", "hello", test_role());
    DialogueOutput dialogue;
    dialogue.reply = "Hi";
    ctx.merge_dialogue(dialogue);
    AgentResult r = persist.execute(ctx);
    assert(r.success);
    PersistOutput saved = PersistOutput::from_payload(r.payload);
    assert(!saved.history_ok && !saved.history_error.empty());
    assert(saved.affinity_ok && saved.episodic_ok);

    std::cout << "  PASS" << std::endl;
}

void test_merge_keeps_first_output() {
    std::cout << "Testing a repeated merge keeps the first output..." << std::endl;

    auto store = std::make_shared<InMemoryShortTermStore>();
    store->append("A", "p1", role::HUMAN, "first");
    Collaborators c;
    c.short_term = store;
    Coordinator coordinator(c);

    auto lease = coordinator.registry().create("A", "p1", "hi", test_role());
    coordinator.merge(*lease, coordinator.retrieve(*lease));
    store->append("A", "p1", role::AI, "second");
    coordinator.merge(*lease, coordinator.retrieve(*lease));

    assert(lease->memory()->working_memory.size() == 1);
    assert(lease->memory()->working_memory[0].content == "first");

    std::cout << "  PASS" << std::endl;
}

void test_per_npc_generators() {
    std::cout << "Testing per-NPC generators..." << std::endl;

    auto prompts = std::make_shared<std::map<std::string, std::string>>();
    ServiceHooks hooks;
    hooks.generator = std::make_shared<RecordingGenerator>("Shared voice.");
    hooks.generator_factory = [prompts](const RoleProfile& role, const std::string& prompt)
        -> std::shared_ptr<Generator> {
        (*prompts)[role.name] = prompt;
        if (role.name == "Li Si") return nullptr;
        return std::make_shared<RecordingGenerator>("I am " + role.name + ".");
    };
    DialogueService service(ServiceConfig{}, Roster::builtin(), hooks);

    assert(prompts->size() == 3);
    assert((*prompts)["Zhang San"].rfind("You are Zhang San", 0) == 0);
    assert((*prompts)["Wang Wu"].find("UI designer") != std::string::npos);
    assert((*prompts)["Zhang San"] != (*prompts)["Wang Wu"]);

    assert(service.chat("Zhang San", "p1", "hello").reply == "I am Zhang San.");
    assert(service.chat("Wang Wu", "p1", "hello").reply == "I am Wang Wu.");
    assert(service.chat("Li Si", "p1", "hello").reply == "Shared voice.");

    // The rack alone, without a shared generator
    auto rack = std::make_shared<GeneratorRack>();
    rack->place("A", std::make_shared<RecordingGenerator>("From the rack."));
    DialogueAgent agent(Collaborator<Generator>(), rack);
    ConversationContext a_ctx("c1", "A", "p1", "hello", test_role("A"));
    ConversationContext b_ctx("c2", "B", "p1", "hello", test_role("B"));
    assert(DialogueOutput::from_payload(agent.execute(a_ctx).payload).reply == "From the rack.");
    assert(DialogueOutput::from_payload(agent.execute(b_ctx).payload).reply ==
           DialogueAgent::offline_reply("B"));

    std::cout << "  PASS" << std::endl;
}

void test_batch_dialogues() {
    std::cout << "Testing BatchDialogues..." << std::endl;

    assert(std::string(BatchDialogues::period_for(5)) == "evening");
    assert(std::string(BatchDialogues::period_for(6)) == "morning");
    assert(std::string(BatchDialogues::period_for(11)) == "morning");
    assert(std::string(BatchDialogues::period_for(12)) == "noon");
    assert(std::string(BatchDialogues::period_for(13)) == "noon");
    assert(std::string(BatchDialogues::period_for(14)) == "afternoon");
    assert(std::string(BatchDialogues::period_for(17)) == "afternoon");
    assert(std::string(BatchDialogues::period_for(18)) == "evening");
    assert(std::string(BatchDialogues::period_for(23)) == "evening");
    assert(BatchDialogues::scene_for(7) != BatchDialogues::scene_for(10));
    assert(BatchDialogues::scene_for(2) == BatchDialogues::scene_for(20));

    // Offline: one preset table per period
    Roster roster = Roster::builtin();
    BatchDialogues offline(roster, Collaborator<Generator>());
    assert(!offline.configured());
    std::set<std::string> zhang_lines;
    for (int hour : {7, 12, 15, 20}) {
        AmbientLines ambient = offline.generate(hour);
        assert(!ambient.generated);
        assert(ambient.period == BatchDialogues::period_for(hour));
        assert(ambient.scene == BatchDialogues::scene_for(hour));
        assert(ambient.lines.size() == 3);
        for (const auto& role : roster.all()) {
            assert(ambient.lines.at(role.name) == offline.preset_line(role, ambient.period));
        }
        zhang_lines.insert(ambient.lines.at("Zhang San"));
    }
    assert(zhang_lines.size() == 4);
    assert(offline.generate(9, "Fire drill").scene == "Fire drill");

    bool threw = false;
    try {
        offline.generate(24);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // A full answer replaces every line
    auto full = std::make_shared<RecordingGenerator>(
        R"({"Zhang San": "a", "Li Si": "b", "Wang Wu": "c"})");
    AmbientLines ambient = BatchDialogues(roster, full).generate(15);
    assert(ambient.generated);
    assert(ambient.lines.at("Li Si") == "b");
    assert(full->last_input.find(BatchDialogues::scene_for(15)) != std::string::npos);
    assert(full->last_input.find("Zhang San (Python engineer)") != std::string::npos);

    // JSON inside prose may be partial; the rest stays preset
    auto wrapped = std::make_shared<RecordingGenerator>(
        "Sure!\n```json\n{\"Li Si\": \"Only me today.\"}\n```");
    ambient = BatchDialogues(roster, wrapped).generate(12);
    assert(ambient.generated);
    assert(ambient.lines.at("Li Si") == "Only me today.");
    assert(ambient.lines.at("Zhang San") == offline.preset_line(*roster.find("Zhang San"), "noon"));

    // A bare object that skips an NPC, garbage, or a fault: presets
    for (auto generator : std::vector<std::shared_ptr<Generator>>{
             std::make_shared<RecordingGenerator>(R"({"Zhang San": "a"})"),
             std::make_shared<RecordingGenerator>("no json here"),
             std::make_shared<FailingGenerator>()}) {
        ambient = BatchDialogues(roster, generator).generate(20);
        assert(!ambient.generated);
        assert(ambient.lines.at("Wang Wu") == offline.preset_line(*roster.find("Wang Wu"), "evening"));
    }

    // NPCs outside the preset table fall back to their activity
    RoleProfile mira = test_role("Mira");
    mira.activity = "Sharpening blades";
    BatchDialogues custom(Roster({mira}), Collaborator<Generator>());
    assert(custom.generate(8).lines.at("Mira") == "Sharpening blades, as usual.");

    // Through the service
    DialogueService service(ServiceConfig{}, Roster::builtin());
    assert(service.ambient(15).period == "afternoon");
    assert(service.ambient().lines.size() == 3);

    std::cout << "  PASS" << std::endl;
}

json rpc_call(rpc::Handler& handler, const std::string& method, const json& params, int id = 1) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return json::parse(handler.handle(request.dump()));
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    DialogueService service(ServiceConfig{}, Roster::builtin());
    rpc::Handler handler(service);

    json r = json::parse(handler.handle("{not json"));
    assert(r["error"]["code"] == rpc::error::PARSE_ERROR);

    r = json::parse(handler.handle(R"({"id": 1, "method": "npc/list"})"));
    assert(r["error"]["code"] == rpc::error::INVALID_REQUEST);

    r = rpc_call(handler, "nope", json::object());
    assert(r["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    r = rpc_call(handler, "initialize", {{"protocol", {{"major", 1}, {"minor", 0}}}});
    assert(r["result"]["serverInfo"]["name"] == "colloquy");
    r = rpc_call(handler, "initialize", {{"protocol", {{"major", 2}, {"minor", 0}}}});
    assert(r.contains("error"));

    r = rpc_call(handler, "npc/list", json::object());
    assert(r["result"]["npcs"].size() == 3);

    r = rpc_call(handler, "turn/run", {{"npc", "Li Si"}, {"message", "hello"}}, 7);
    assert(r["id"] == 7);
    assert(r["result"]["success"] == true);
    assert(r["result"]["response"] == "Hello! I'm Li Si. (offline mode)");

    r = rpc_call(handler, "turn/run", {{"npc", "Nobody"}, {"message", "hello"}});
    assert(r["error"]["code"] == rpc::error::UNKNOWN_NPC);

    r = rpc_call(handler, "turn/run", {{"npc", "Li Si"}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = rpc_call(handler, "turn/run", {{"npc", 5}, {"message", "hello"}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = rpc_call(handler, "memory/history", {{"npc", "Li Si"}});
    assert(r["result"]["history"].size() == 2);
    assert(r["result"]["player"] == "player");

    r = rpc_call(handler, "affinity/set", {{"npc", "Li Si"}, {"score", 15}});
    assert(r["result"]["level"] == "Hostile");
    r = rpc_call(handler, "affinity/set", {{"npc", "Li Si"}, {"score", "high"}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    r = rpc_call(handler, "affinity/get", {{"npc", "Li Si"}});
    assert(r["result"]["affinity"] == 15.0);
    r = rpc_call(handler, "affinity/list", json::object());
    assert(r["result"]["affinities"].contains("Li Si"));

    r = rpc_call(handler, "memory/episodic", {{"npc", "Li Si"}, {"limit", 1}});
    assert(r["result"]["memories"].size() == 1);

    r = rpc_call(handler, "npc/ambient", {{"hour", 7}});
    assert(r["result"]["period"] == "morning");
    assert(r["result"]["generated"] == false);
    assert(r["result"]["dialogues"].size() == 3);
    r = rpc_call(handler, "npc/ambient", {{"hour", 30}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    r = rpc_call(handler, "npc/ambient", {{"scene", "Fire drill"}});
    assert(r["result"]["scene"] == "Fire drill");

    r = rpc_call(handler, "npc/info", {{"npc", "Nobody"}});
    assert(r["error"]["code"] == rpc::error::UNKNOWN_NPC);

    r = rpc_call(handler, "memory/clear", {{"npc", "Li Si"}});
    assert(r["result"]["status"] == "ok");

    assert(!handler.shutdown_requested());
    r = rpc_call(handler, "shutdown", json::object());
    assert(handler.shutdown_requested());

    assert(rpc::sanitize_utf8("ok\xff") == "ok\xEF\xBF\xBD");
    assert(rpc::sanitize_utf8("caf\xC3\xA9") == "caf\xC3\xA9");

    std::cout << "  PASS" << std::endl;
}

int main() {
    log::set_quiet(true);

    std::cout << "=== Colloquy Tests ===" << std::endl;

    test_agent_contract();
    test_collaborator();
    test_context_merges_once();
    test_narrative_blocks();

    test_memory_stage_without_long_term_store();
    test_memory_stage_failures();
    test_memory_stage_snippets();
    test_affinity_stage_neutral();
    test_dialogue_stage();
    test_revision_verdicts();
    test_revision_stage_fault();
    test_persist_entries();

    test_scenario_first_contact();
    test_scenario_prior_history();
    test_scenario_generation_failure();
    test_scenario_revised_reply_persisted();
    test_revision_disabled();
    test_degradation();
    test_affinity_change_reported();
    test_retrieval_order_independence();

    test_context_registry();
    test_config();
    test_short_term_store();
    test_sqlite_stores();
    test_episodic_index();
    test_relationship_ledger();
    test_roster();

    test_dialogue_service();
    test_dialogue_service_with_hooks();
    test_nonstandard_faults_degrade();
    test_merge_keeps_first_output();
    test_per_npc_generators();
    test_batch_dialogues();
    test_rpc_handler();

    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
