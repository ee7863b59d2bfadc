#pragma once
// Services: contracts of the external collaborators
//
// The pipeline only ever talks to these interfaces. Implementations
// may block on I/O and may throw; the agents turn every throw into a
// failed AgentResult.

#include "types.hpp"
#include "collaborator.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace colloquy {

// Outcome of analyzing one exchange
struct AffinityUpdate {
    bool changed = false;
    float new_score = 0.0f;
};

// Relationship collaborator: owns the score and its mappings
class RelationshipService {
public:
    virtual ~RelationshipService() = default;

    virtual float score(const std::string& npc, const std::string& player) = 0;
    virtual std::string level(float score) const = 0;
    virtual std::string style(float score) const = 0;
    virtual AffinityUpdate analyze_and_update(const std::string& npc,
                                              const std::string& player,
                                              const std::string& utterance,
                                              const std::string& reply) = 0;
};

// Short-term (working memory) store: bounded per npc+player transcript
class ShortTermStore {
public:
    virtual ~ShortTermStore() = default;

    // Oldest first, capped by the store
    virtual Transcript history(const std::string& npc, const std::string& player) = 0;
    virtual void append(const std::string& npc, const std::string& player,
                        const std::string& role, const std::string& content) = 0;
    virtual void extend_expiry(const std::string& npc, const std::string& player) = 0;
    virtual void clear(const std::string& npc, const std::string& player) = 0;
};

// Long-term (episodic) store for a single NPC
class LongTermStore {
public:
    virtual ~LongTermStore() = default;

    virtual std::vector<MemorySnippet> search(const std::string& query, size_t k) = 0;
    virtual void add(const std::vector<MemorySnippet>& entries) = 0;
};

// Text generation: composed input + history -> reply
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::string generate(const std::string& composed_input,
                                 const Transcript& history) = 0;
};

// Quality review of a generated reply. Returns the raw verdict text.
class Reviewer {
public:
    virtual ~Reviewer() = default;

    virtual std::string review(const std::string& reply,
                               const std::string& utterance,
                               const RoleProfile& role,
                               const std::string& affinity_level,
                               const std::string& affinity_style) = 0;
};

// Collaborators that exist per NPC: long-term stores, generators
template<typename T>
class NpcShelf {
public:
    void place(const std::string& npc, std::shared_ptr<T> item) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[npc] = std::move(item);
    }

    Collaborator<T> lookup(const std::string& npc) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(npc);
        if (it == items_.end()) return Collaborator<T>::unconfigured();
        return Collaborator<T>(it->second);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<T>> items_;
};

// Long-term stores are optional per NPC
using EpisodicShelf = NpcShelf<LongTermStore>;

// Generators bound to one character; NPCs without one use the shared generator
using GeneratorRack = NpcShelf<Generator>;

} // namespace colloquy
