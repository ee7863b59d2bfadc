#include <colloquy/config.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace colloquy {

namespace {

// Copy doc[key] into out if present; wrong type is reported with the key path
template<typename T>
void read_field(const json& doc, const char* section, const char* key, T& out) {
    if (!doc.contains(key)) return;
    try {
        out = doc.at(key).get<T>();
    } catch (const json::exception& e) {
        std::string path = section ? std::string(section) + "." + key : std::string(key);
        throw std::runtime_error("Invalid config value for '" + path + "': " + e.what());
    }
}

// Counts and durations are non-negative integers
template<typename T>
void read_count(const json& doc, const char* section, const char* key, T& out) {
    if (!doc.contains(key)) return;
    const json& value = doc.at(key);
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw std::runtime_error(std::string("Invalid config value for '") + section + "." + key +
                                 "': must be a non-negative integer");
    }
    out = value.get<T>();
}

const json* section(const json& doc, const char* name) {
    if (!doc.contains(name)) return nullptr;
    const json& s = doc.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return &s;
}

bool env_flag(const char* value) {
    std::string v = value;
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

ServiceConfig config_from_json(const json& doc, ServiceConfig base) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    if (const json* p = section(doc, "pipeline")) {
        read_field(*p, "pipeline", "enable_revision", base.pipeline.enable_revision);
        read_field(*p, "pipeline", "parallel_retrieval", base.pipeline.parallel_retrieval);
        read_field(*p, "pipeline", "accept_unmarked_verdicts", base.pipeline.accept_unmarked_verdicts);
    }

    if (const json* m = section(doc, "memory")) {
        read_count(*m, "memory", "history_limit", base.memory.history_limit);
        read_count(*m, "memory", "history_ttl_ms", base.memory.history_ttl_ms);
        read_count(*m, "memory", "episodic_top_k", base.memory.episodic_top_k);
    }

    if (const json* r = section(doc, "registry")) {
        read_count(*r, "registry", "idle_timeout_ms", base.registry.idle_timeout_ms);
    }

    read_field(doc, nullptr, "history_db", base.history_db);
    read_field(doc, nullptr, "roster_path", base.roster_path);
    read_field(doc, nullptr, "default_player", base.default_player);
    read_field(doc, nullptr, "verbose", base.verbose);

    if (base.memory.history_limit == 0) {
        throw std::runtime_error("Invalid config value for 'memory.history_limit': must be > 0");
    }
    return base;
}

ServiceConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Config parse error in " + path + ": " + e.what());
    }
    return config_from_json(doc);
}

json config_to_json(const ServiceConfig& config) {
    return {
        {"pipeline", {
            {"enable_revision", config.pipeline.enable_revision},
            {"parallel_retrieval", config.pipeline.parallel_retrieval},
            {"accept_unmarked_verdicts", config.pipeline.accept_unmarked_verdicts}
        }},
        {"memory", {
            {"history_limit", config.memory.history_limit},
            {"history_ttl_ms", config.memory.history_ttl_ms},
            {"episodic_top_k", config.memory.episodic_top_k}
        }},
        {"registry", {
            {"idle_timeout_ms", config.registry.idle_timeout_ms}
        }},
        {"history_db", config.history_db},
        {"roster_path", config.roster_path},
        {"default_player", config.default_player},
        {"verbose", config.verbose}
    };
}

void apply_env_overrides(ServiceConfig& config) {
    if (const char* db = std::getenv("COLLOQUY_HISTORY_DB")) {
        config.history_db = db;
    }
    if (const char* roster = std::getenv("COLLOQUY_ROSTER")) {
        config.roster_path = roster;
    }
    if (const char* verbose = std::getenv("COLLOQUY_VERBOSE")) {
        config.verbose = env_flag(verbose);
    }
}

} // namespace colloquy
