#include <colloquy/service.hpp>
#include <colloquy/log.hpp>
#include <colloquy/stores/short_term_memory.hpp>
#include <colloquy/stores/sqlite_history.hpp>

namespace colloquy {

namespace {
constexpr const char* COMPONENT = "service";
}

DialogueService::DialogueService(ServiceConfig config, Roster roster, ServiceHooks hooks)
    : config_(std::move(config))
    , roster_(std::move(roster))
    , shelf_(std::make_shared<EpisodicShelf>())
    , generators_(std::make_shared<GeneratorRack>())
    , batch_(std::make_unique<BatchDialogues>(roster_, hooks.batch_generator))
{
    const MemoryConfig& memory = config_.memory;
    std::shared_ptr<ScoreTable> scores;

    if (config_.history_db.empty()) {
        short_term_ = std::make_shared<InMemoryShortTermStore>(memory.history_limit,
                                                               memory.history_ttl_ms);
        scores = std::make_shared<InMemoryScoreTable>();
        COLLOQUY_LOG_DEBUG(COMPONENT, "Using in-memory history");
    } else {
        database_ = std::make_shared<SqliteDatabase>(config_.history_db);
        short_term_ = std::make_shared<SqliteShortTermStore>(database_, memory.history_limit,
                                                             memory.history_ttl_ms);
        scores = std::make_shared<SqliteScoreTable>(database_);
        COLLOQUY_LOG_INFO(COMPONENT, "History database: %s", config_.history_db.c_str());
    }
    ledger_ = std::make_shared<RelationshipLedger>(scores, hooks.judge);

    for (const auto& name : roster_.names()) {
        auto store = std::make_shared<InMemoryEpisodicStore>();
        episodic_[name] = store;
        shelf_->place(name, store);
    }

    if (hooks.generator_factory) {
        for (const auto& role : roster_.all()) {
            if (auto generator = hooks.generator_factory(role, system_prompt(role))) {
                generators_->place(role.name, std::move(generator));
            }
        }
    }

    Collaborators collaborators;
    collaborators.relationships = ledger_;
    collaborators.short_term = short_term_;
    collaborators.shelf = shelf_;
    collaborators.generator = hooks.generator;
    collaborators.generators = generators_;
    collaborators.reviewer = hooks.reviewer;

    coordinator_ = std::make_unique<Coordinator>(std::move(collaborators), config_.pipeline,
                                                 config_.memory, config_.registry);

    bool offline = !hooks.generator.configured() && generators_->size() < roster_.size();
    COLLOQUY_LOG_INFO(COMPONENT, "%zu NPCs ready, %zu with their own generator%s%s",
                      roster_.size(), generators_->size(),
                      offline ? " (offline mode)" : "",
                      ledger_->has_judge() ? "" : " (affinity frozen)");
}

DialogueService::~DialogueService() = default;

std::unique_ptr<DialogueService> DialogueService::from_config(const ServiceConfig& config,
                                                              ServiceHooks hooks) {
    Roster roster = config.roster_path.empty() ? Roster::builtin()
                                               : Roster::load(config.roster_path);
    return std::make_unique<DialogueService>(config, std::move(roster), std::move(hooks));
}

TurnResult DialogueService::chat(const std::string& npc, const std::string& player,
                                 const std::string& message) {
    auto role = roster_.find(npc);
    if (!role) {
        return TurnResult::failed("NPC '" + npc + "' does not exist");
    }
    if (trim(message).empty()) {
        return TurnResult::failed("message is empty");
    }
    return coordinator_->run_turn(npc, player, message, *role);
}

std::optional<json> DialogueService::npc_info(const std::string& npc) const {
    auto role = roster_.find(npc);
    if (!role) return std::nullopt;
    json j = *role;
    j["available"] = true;
    j["has_episodic_memory"] = shelf_->lookup(npc).configured();
    return j;
}

json DialogueService::list_npcs() const {
    json out = json::array();
    for (const auto& role : roster_.all()) {
        out.push_back({
            {"name", role.name},
            {"title", role.title},
            {"location", role.location},
            {"activity", role.activity}
        });
    }
    return out;
}

json DialogueService::affinity_entry(float score) const {
    return {
        {"affinity", score},
        {"level", ledger_->level(score)},
        {"modifier", ledger_->style(score)}
    };
}

std::optional<json> DialogueService::affinity(const std::string& npc, const std::string& player) {
    if (!roster_.contains(npc)) return std::nullopt;
    json j = affinity_entry(ledger_->score(npc, player));
    j["npc"] = npc;
    j["player"] = player;
    return j;
}

std::optional<json> DialogueService::set_affinity(const std::string& npc,
                                                  const std::string& player, float score) {
    if (!roster_.contains(npc)) return std::nullopt;
    float stored = ledger_->set_score(npc, player, score);
    COLLOQUY_LOG_INFO(COMPONENT, "Affinity %s -> %s set to %.1f (%s)", npc.c_str(),
                      player.c_str(), stored, ledger_->level(stored).c_str());
    json j = affinity_entry(stored);
    j["npc"] = npc;
    j["player"] = player;
    return j;
}

json DialogueService::affinities(const std::string& player) {
    json out = json::object();
    for (const auto& [npc, score] : ledger_->scores_for(player)) {
        out[npc] = affinity_entry(score);
    }
    return out;
}

std::optional<Transcript> DialogueService::history(const std::string& npc,
                                                   const std::string& player) {
    if (!roster_.contains(npc)) return std::nullopt;
    return short_term_->history(npc, player);
}

std::optional<std::vector<MemorySnippet>> DialogueService::memories(const std::string& npc,
                                                                    size_t limit) const {
    auto it = episodic_.find(npc);
    if (it == episodic_.end()) return std::nullopt;
    return it->second->recent(limit);
}

bool DialogueService::clear_memory(const std::string& npc, const std::string& player) {
    if (!roster_.contains(npc)) return false;
    short_term_->clear(npc, player);
    COLLOQUY_LOG_INFO(COMPONENT, "Cleared working memory of %s for %s", npc.c_str(),
                      player.c_str());
    return true;
}

std::optional<json> DialogueService::context_summary(const std::string& id) const {
    return coordinator_->registry().summary(id);
}

AmbientLines DialogueService::ambient(std::optional<int> hour, const std::string& scene) const {
    return batch_->generate(hour.value_or(BatchDialogues::current_hour()), scene);
}

} // namespace colloquy
