#include <colloquy/context_registry.hpp>
#include <colloquy/log.hpp>

namespace colloquy {

ContextRegistry::Lease ContextRegistry::create(const std::string& npc,
                                               const std::string& player,
                                               const std::string& utterance,
                                               const RoleProfile& role) {
    Timestamp created = now();
    std::string id = npc + ":" + player + ":" + std::to_string(created) + ":" +
                     std::to_string(sequence_.fetch_add(1));

    auto context = std::make_unique<ConversationContext>(id, npc, player, utterance, role, created);
    ConversationContext* raw = context.get();

    std::lock_guard<std::mutex> lock(mutex_);
    expire_idle_locked(created);

    Entry entry;
    entry.context = std::move(context);
    entry.last_activity = created;
    entry.pins = 1;
    entry.snapshot = entry.context->summary();
    entries_.emplace(id, std::move(entry));

    COLLOQUY_LOG_DEBUG("registry", "Created context %s (%zu live)", id.c_str(), entries_.size());
    return Lease(this, raw);
}

ContextRegistry::Lease ContextRegistry::acquire(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return Lease();

    // Lazily honour the timeout even if nobody swept
    Timestamp at = now();
    if (it->second.pins == 0 && at - it->second.last_activity > idle_timeout_ms_) {
        entries_.erase(it);
        return Lease();
    }

    it->second.pins++;
    it->second.last_activity = at;
    return Lease(this, it->second.context.get());
}

std::optional<json> ContextRegistry::summary(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.snapshot;
}

bool ContextRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

bool ContextRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    if (it->second.pins > 0) {
        COLLOQUY_LOG_WARN("registry", "Refusing to remove pinned context %s", id.c_str());
        return false;
    }
    entries_.erase(it);
    return true;
}

size_t ContextRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ContextRegistry::expire_idle(Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    return expire_idle_locked(at);
}

size_t ContextRegistry::expire_idle_locked(Timestamp at) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const Entry& entry = it->second;
        if (entry.pins == 0 && at - entry.last_activity > idle_timeout_ms_) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        COLLOQUY_LOG_DEBUG("registry", "Expired %zu idle contexts", removed);
    }
    return removed;
}

void ContextRegistry::unpin(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return;
    Entry& entry = it->second;
    if (entry.pins > 0) entry.pins--;
    if (entry.pins == 0) entry.snapshot = entry.context->summary();
    entry.last_activity = now();
}

} // namespace colloquy
