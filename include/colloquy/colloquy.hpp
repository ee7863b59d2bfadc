#pragma once
// Colloquy: per-turn conversation pipeline for NPCs
//
// Include this for the whole public surface.

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "collaborator.hpp"
#include "services.hpp"
#include "narrative.hpp"
#include "agent.hpp"
#include "context.hpp"
#include "context_registry.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "relationships.hpp"
#include "roster.hpp"
#include "stores/short_term_memory.hpp"
#include "stores/episodic_index.hpp"
#include "stores/sqlite_history.hpp"
#include "service.hpp"
