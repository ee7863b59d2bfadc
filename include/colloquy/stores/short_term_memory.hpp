#pragma once
// InMemoryShortTermStore: working memory held in process
//
// One transcript per npc+player. Each append trims the content and
// keeps the newest `limit` messages. A transcript that sees no append
// or extend_expiry for `ttl_ms` reads as empty and is dropped.

#include "../services.hpp"
#include "../types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace colloquy {

class InMemoryShortTermStore : public ShortTermStore {
public:
    explicit InMemoryShortTermStore(size_t limit = 10, int64_t ttl_ms = 3600000)
        : limit_(limit), ttl_ms_(ttl_ms) {}

    Transcript history(const std::string& npc, const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live(npc, player);
        if (it == transcripts_.end()) return {};
        return it->second.messages;
    }

    void append(const std::string& npc, const std::string& player,
                const std::string& role, const std::string& content) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live(npc, player);
        if (it == transcripts_.end()) {
            it = transcripts_.emplace(key(npc, player), Slot{}).first;
        }
        Slot& slot = it->second;
        slot.messages.push_back(Message{role, trim(content)});
        if (slot.messages.size() > limit_) {
            slot.messages.erase(slot.messages.begin(),
                                slot.messages.end() - static_cast<long>(limit_));
        }
        slot.expires_at = now() + ttl_ms_;
    }

    void extend_expiry(const std::string& npc, const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live(npc, player);
        if (it != transcripts_.end()) {
            it->second.expires_at = now() + ttl_ms_;
        }
    }

    void clear(const std::string& npc, const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        transcripts_.erase(key(npc, player));
    }

private:
    using Key = std::pair<std::string, std::string>;

    struct Slot {
        Transcript messages;
        Timestamp expires_at = 0;
    };

    static Key key(const std::string& npc, const std::string& player) {
        return {npc, player};
    }

    // Find a transcript, dropping it if expired. Caller holds mutex_.
    std::map<Key, Slot>::iterator live(const std::string& npc, const std::string& player) {
        auto it = transcripts_.find(key(npc, player));
        if (it != transcripts_.end() && it->second.expires_at <= now()) {
            transcripts_.erase(it);
            return transcripts_.end();
        }
        return it;
    }

    const size_t limit_;
    const int64_t ttl_ms_;
    std::mutex mutex_;
    std::map<Key, Slot> transcripts_;
};

} // namespace colloquy
