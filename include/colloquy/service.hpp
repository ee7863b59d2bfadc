#pragma once
// DialogueService: the composition root
//
// Owns configuration, roster, stores, ledger and the coordinator.
// Built once by main (or a test) and passed to whoever needs it.
// Every NPC in the roster gets its own in-process episodic store, and
// its own generator when the hooks carry a factory.

#include "batch_dialogues.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "relationships.hpp"
#include "roster.hpp"
#include "services.hpp"
#include "stores/episodic_index.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace colloquy {

class SqliteDatabase;

// Builds the generator that plays one character, given its system prompt.
// Returning null leaves that NPC on the shared generator.
using GeneratorFactory = std::function<std::shared_ptr<Generator>(const RoleProfile& role,
                                                                  const std::string& system_prompt)>;

// Pluggable collaborators that have no built-in implementation
struct ServiceHooks {
    Collaborator<Generator> generator;         // Shared; unconfigured: offline replies
    GeneratorFactory generator_factory;        // Optional, called once per roster NPC
    Collaborator<Generator> batch_generator;   // Ambient lines; unconfigured: presets
    Collaborator<Reviewer> reviewer;           // Unconfigured: no review stage
    std::shared_ptr<AffinityJudge> judge = std::make_shared<KeywordJudge>();
};

class DialogueService {
public:
    // Throws std::runtime_error if the history database cannot be opened
    DialogueService(ServiceConfig config, Roster roster, ServiceHooks hooks = {});
    ~DialogueService();

    DialogueService(const DialogueService&) = delete;
    DialogueService& operator=(const DialogueService&) = delete;

    // Roster from config.roster_path, or the built-in cast
    static std::unique_ptr<DialogueService> from_config(const ServiceConfig& config,
                                                        ServiceHooks hooks = {});

    // One turn. Unknown NPC or empty message gives a failed result.
    TurnResult chat(const std::string& npc, const std::string& player,
                    const std::string& message);

    // Profile + availability; nullopt for an unknown NPC
    std::optional<json> npc_info(const std::string& npc) const;
    json list_npcs() const;

    // {npc, player, affinity, level, modifier}
    std::optional<json> affinity(const std::string& npc, const std::string& player);
    std::optional<json> set_affinity(const std::string& npc, const std::string& player,
                                     float score);
    // npc -> {affinity, level, modifier}, only NPCs with a stored score
    json affinities(const std::string& player);

    std::optional<Transcript> history(const std::string& npc, const std::string& player);
    // Newest `limit` episodic entries, oldest first
    std::optional<std::vector<MemorySnippet>> memories(const std::string& npc, size_t limit = 10) const;
    bool clear_memory(const std::string& npc, const std::string& player);

    std::optional<json> context_summary(const std::string& id) const;

    // One ambient line per NPC. Hour defaults to local time; throws
    // std::out_of_range for an hour outside [0, 23].
    AmbientLines ambient(std::optional<int> hour = std::nullopt, const std::string& scene = "") const;

    const ServiceConfig& config() const { return config_; }
    const Roster& roster() const { return roster_; }
    Coordinator& coordinator() { return *coordinator_; }
    RelationshipLedger& ledger() { return *ledger_; }

private:
    json affinity_entry(float score) const;

    const ServiceConfig config_;
    const Roster roster_;

    std::shared_ptr<SqliteDatabase> database_;     // Null when running in memory
    std::shared_ptr<ShortTermStore> short_term_;
    std::shared_ptr<RelationshipLedger> ledger_;
    std::shared_ptr<EpisodicShelf> shelf_;
    std::map<std::string, std::shared_ptr<InMemoryEpisodicStore>> episodic_;
    std::shared_ptr<GeneratorRack> generators_;
    std::unique_ptr<BatchDialogues> batch_;
    std::unique_ptr<Coordinator> coordinator_;
};

} // namespace colloquy
