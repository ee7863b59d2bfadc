#pragma once
// ContextRegistry: owns the contexts of concurrent conversations
//
// Keyed by npc:player:created_millis:seq. A running turn pins its
// context through a Lease; unpinned contexts idle for longer than the
// timeout are dropped lazily (on create, or on an explicit sweep).

#include "context.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace colloquy {

class ContextRegistry {
private:
    struct Entry {
        std::unique_ptr<ConversationContext> context;
        Timestamp last_activity = 0;
        uint32_t pins = 0;
        json snapshot;  // summary() as of the last time nobody held a lease
    };

public:
    // RAII pin on one context. The reference is valid while the lease lives.
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept
            : registry_(other.registry_), context_(other.context_) {
            other.registry_ = nullptr;
            other.context_ = nullptr;
        }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                registry_ = other.registry_;
                context_ = other.context_;
                other.registry_ = nullptr;
                other.context_ = nullptr;
            }
            return *this;
        }

        explicit operator bool() const { return context_ != nullptr; }
        ConversationContext& operator*() const { return *context_; }
        ConversationContext* operator->() const { return context_; }
        ConversationContext* get() const { return context_; }

    private:
        friend class ContextRegistry;
        Lease(ContextRegistry* registry, ConversationContext* context)
            : registry_(registry), context_(context) {}

        void release() {
            if (registry_ && context_) {
                registry_->unpin(context_->id());
            }
            registry_ = nullptr;
            context_ = nullptr;
        }

        ContextRegistry* registry_ = nullptr;
        ConversationContext* context_ = nullptr;
    };

    explicit ContextRegistry(int64_t idle_timeout_ms = 300000)
        : idle_timeout_ms_(idle_timeout_ms) {}

    ContextRegistry(const ContextRegistry&) = delete;
    ContextRegistry& operator=(const ContextRegistry&) = delete;

    // Create a context and return it pinned
    Lease create(const std::string& npc, const std::string& player,
                 const std::string& utterance, const RoleProfile& role);

    // Pin an existing context; empty lease if unknown or expired
    Lease acquire(const std::string& id);

    // Summary as of the last release. A context under a lease is being
    // written, so readers see the state from before that lease.
    std::optional<json> summary(const std::string& id) const;

    bool contains(const std::string& id) const;
    bool remove(const std::string& id);
    size_t size() const;

    // Drop unpinned entries idle for longer than the timeout. Returns count removed.
    size_t expire_idle(Timestamp at = now());

private:
    void unpin(const std::string& id);
    size_t expire_idle_locked(Timestamp at);

    const int64_t idle_timeout_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace colloquy
