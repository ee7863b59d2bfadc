// colloquy: talk to NPCs from the command line
//
// Usage: colloquy <command> [options]
//
// Commands:
//   chat <message>   Run one turn and print the reply
//   serve            JSON-RPC over stdin/stdout
//   npcs             List NPCs
//   ambient          One ambient line per NPC for the time of day
//   affinity         Show (or with --score, set) affinity
//   history          Show working memory for --npc/--player
//   clear            Clear working memory for --npc/--player
//   help             Show this help

#include <colloquy/colloquy.hpp>
#include <colloquy/rpc/handler.hpp>

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace colloquy;

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "colloquy " << COLLOQUY_VERSION << " - NPC conversation pipeline\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  chat <message>     Run one turn and print the reply\n"
              << "  serve              JSON-RPC 2.0 over stdin/stdout\n"
              << "  npcs               List NPCs\n"
              << "  ambient            One ambient line per NPC (--hour to pick the time)\n"
              << "  affinity           Show affinity (all NPCs unless --npc; set with --score)\n"
              << "  history            Show working memory for --npc/--player\n"
              << "  clear              Clear working memory for --npc/--player\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      JSON config file\n"
              << "  --npc NAME         NPC to talk to (default: first in roster)\n"
              << "  --player ID        Player id (default: from config)\n"
              << "  --db PATH          SQLite history database (default: in memory)\n"
              << "  --roster PATH      JSON roster file\n"
              << "  --score N          New affinity score (affinity command)\n"
              << "  --hour H           Hour of day 0-23 (ambient command)\n"
              << "  --no-revision      Skip the review stage\n"
              << "  --sequential       Run retrieval branches one after another\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable debug logging\n"
              << "  -v, --version      Show version\n\n"
              << "Environment:\n"
              << "  COLLOQUY_HISTORY_DB, COLLOQUY_ROSTER, COLLOQUY_VERBOSE\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_chat(DialogueService& service, const std::string& npc, const std::string& player,
             const std::string& message, bool json_output) {
    TurnResult result = service.chat(npc, player, message);
    if (json_output) {
        std::cout << result.to_json().dump(2) << "\n";
        return result.success ? 0 : 1;
    }
    if (!result.success) {
        std::cerr << "Error: " << result.error << "\n";
        return 1;
    }

    std::cout << npc << ": " << result.reply << "\n";
    std::cout << "  affinity " << std::fixed << std::setprecision(0) << result.affinity_score;
    if (result.new_affinity) {
        std::cout << " -> " << *result.new_affinity;
    }
    if (result.revised) std::cout << " (revised)";
    std::cout << "\n";
    return 0;
}

int cmd_serve(DialogueService& service) {
    rpc::Handler handler(service);
    COLLOQUY_LOG_INFO("serve", "Listening on stdin...");

    std::string line;
    while (std::getline(std::cin, line)) {
        if (trim(line).empty()) continue;
        std::cout << handler.handle(line) << "\n";
        std::cout.flush();
        if (handler.shutdown_requested()) break;
    }
    COLLOQUY_LOG_INFO("serve", "Stopped");
    return 0;
}

int cmd_npcs(DialogueService& service, bool json_output) {
    if (json_output) {
        std::cout << service.list_npcs().dump(2) << "\n";
        return 0;
    }
    for (const auto& role : service.roster().all()) {
        std::cout << "  " << std::left << std::setw(12) << role.name
                  << role.title << " @ " << role.location << " (" << role.activity << ")\n";
    }
    return 0;
}

int cmd_ambient(DialogueService& service, std::optional<int> hour, bool json_output) {
    AmbientLines ambient = service.ambient(hour);
    if (json_output) {
        std::cout << ambient.to_json().dump(2) << "\n";
        return 0;
    }
    std::cout << "[" << ambient.period << "] " << ambient.scene << "\n";
    for (const auto& role : service.roster().all()) {
        auto it = ambient.lines.find(role.name);
        if (it == ambient.lines.end()) continue;
        std::cout << "  " << role.name << ": " << it->second << "\n";
    }
    return 0;
}

void print_affinity(const std::string& npc, const json& entry) {
    std::cout << "  " << std::left << std::setw(12) << npc
              << std::fixed << std::setprecision(1) << entry["affinity"].get<float>()
              << "  " << entry["level"].get<std::string>()
              << " / " << entry["modifier"].get<std::string>() << "\n";
}

int cmd_affinity(DialogueService& service, const std::string& npc, const std::string& player,
                 std::optional<float> score, bool json_output) {
    if (npc.empty()) {
        json all = service.affinities(player);
        if (json_output) {
            std::cout << all.dump(2) << "\n";
        } else if (all.empty()) {
            std::cout << "No relationships recorded for " << player << "\n";
        } else {
            for (const auto& item : all.items()) print_affinity(item.key(), item.value());
        }
        return 0;
    }

    auto entry = score ? service.set_affinity(npc, player, *score)
                       : service.affinity(npc, player);
    if (!entry) {
        std::cerr << "Error: NPC '" << npc << "' does not exist\n";
        return 1;
    }
    if (json_output) {
        std::cout << entry->dump(2) << "\n";
    } else {
        print_affinity(npc, *entry);
    }
    return 0;
}

int cmd_history(DialogueService& service, const std::string& npc, const std::string& player,
                bool json_output) {
    auto history = service.history(npc, player);
    if (!history) {
        std::cerr << "Error: NPC '" << npc << "' does not exist\n";
        return 1;
    }
    if (json_output) {
        std::cout << json(*history).dump(2) << "\n";
        return 0;
    }
    if (history->empty()) {
        std::cout << "No conversation with " << npc << " yet\n";
    }
    for (const auto& message : *history) {
        const std::string& speaker = message.role == role::HUMAN ? player : npc;
        std::cout << speaker << ": " << message.content << "\n";
    }
    return 0;
}

int cmd_clear(DialogueService& service, const std::string& npc, const std::string& player) {
    if (!service.clear_memory(npc, player)) {
        std::cerr << "Error: NPC '" << npc << "' does not exist\n";
        return 1;
    }
    std::cout << "Cleared working memory of " << npc << " for " << player << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    std::string command;
    std::string message;
    std::string config_path;
    std::string npc;
    std::string player;
    std::string db_path;
    std::string roster_path;
    std::optional<float> score;
    std::optional<int> hour;
    bool no_revision = false;
    bool sequential = false;
    bool json_output = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--npc") == 0 && i + 1 < argc) {
            npc = argv[++i];
        } else if (strcmp(argv[i], "--player") == 0 && i + 1 < argc) {
            player = argv[++i];
        } else if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--roster") == 0 && i + 1 < argc) {
            roster_path = argv[++i];
        } else if (strcmp(argv[i], "--score") == 0 && i + 1 < argc) {
            char* end = nullptr;
            float value = std::strtof(argv[++i], &end);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Invalid score: " << argv[i] << "\n";
                return 1;
            }
            score = value;
        } else if (strcmp(argv[i], "--hour") == 0 && i + 1 < argc) {
            char* end = nullptr;
            long value = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || value < 0 || value > 23) {
                std::cerr << "Invalid hour: " << argv[i] << "\n";
                return 1;
            }
            hour = static_cast<int>(value);
        } else if (strcmp(argv[i], "--no-revision") == 0) {
            no_revision = true;
        } else if (strcmp(argv[i], "--sequential") == 0) {
            sequential = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "colloquy " << COLLOQUY_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (command == "chat") {
                if (!message.empty()) message += " ";
                message += argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "colloquy " << COLLOQUY_VERSION << "\n";
        return 0;
    }

    try {
        // defaults -> file -> environment -> flags
        ServiceConfig config = config_path.empty() ? ServiceConfig{} : load_config(config_path);
        apply_env_overrides(config);
        if (!db_path.empty()) config.history_db = db_path;
        if (!roster_path.empty()) config.roster_path = roster_path;
        if (no_revision) config.pipeline.enable_revision = false;
        if (sequential) config.pipeline.parallel_retrieval = false;
        if (verbose) config.verbose = true;
        log::set_verbose(config.verbose);

        auto service = DialogueService::from_config(config);
        if (player.empty()) player = config.default_player;

        if (command == "serve") return cmd_serve(*service);
        if (command == "npcs") return cmd_npcs(*service, json_output);
        if (command == "ambient") return cmd_ambient(*service, hour, json_output);
        if (command == "affinity") return cmd_affinity(*service, npc, player, score, json_output);

        if (npc.empty()) {
            if (service->roster().size() == 0) {
                std::cerr << "Error: roster is empty\n";
                return 1;
            }
            npc = service->roster().all().front().name;
        }

        if (command == "chat") {
            if (trim(message).empty()) {
                std::cerr << "Usage: " << prog_name(argv[0]) << " chat <message> [--npc NAME]\n";
                return 1;
            }
            return cmd_chat(*service, npc, player, message, json_output);
        }
        if (command == "history") return cmd_history(*service, npc, player, json_output);
        if (command == "clear") return cmd_clear(*service, npc, player);

        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
