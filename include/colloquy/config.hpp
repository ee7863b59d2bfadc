#pragma once
// Configuration: every knob with its default
//
// Load order: struct defaults -> JSON file (load_config) -> environment
// (apply_env_overrides). Unknown JSON keys are ignored; a known key
// with the wrong type is an error.

#include "types.hpp"
#include <cstdint>
#include <string>

namespace colloquy {

struct PipelineConfig {
    bool enable_revision = true;          // Run the review stage when a reviewer exists
    bool parallel_retrieval = true;       // Memory and affinity retrieval concurrently
    bool accept_unmarked_verdicts = true; // Non-PASS verdict without REVISED: replaces the reply
};

struct MemoryConfig {
    size_t history_limit = 10;            // Messages kept per npc+player
    int64_t history_ttl_ms = 3600000;     // 1 hour without activity
    size_t episodic_top_k = 3;            // Long-term snippets per turn
};

struct RegistryConfig {
    int64_t idle_timeout_ms = 300000;     // 5 minutes
};

struct ServiceConfig {
    PipelineConfig pipeline;
    MemoryConfig memory;
    RegistryConfig registry;
    std::string history_db;               // Empty = in-memory stores
    std::string roster_path;              // Empty = built-in roster
    std::string default_player = "player";
    bool verbose = false;
};

// Throws std::runtime_error on unreadable file, bad JSON or bad types
ServiceConfig load_config(const std::string& path);

// Merge a parsed JSON document over `base`
ServiceConfig config_from_json(const json& doc, ServiceConfig base = {});

json config_to_json(const ServiceConfig& config);

// COLLOQUY_HISTORY_DB, COLLOQUY_ROSTER, COLLOQUY_VERBOSE
void apply_env_overrides(ServiceConfig& config);

} // namespace colloquy
