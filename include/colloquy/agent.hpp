#pragma once
// Agent: the unit of work every pipeline stage implements
//
// execute() never throws. Whatever goes wrong inside perform() comes
// back as a failed AgentResult carrying the exception text, so the
// coordinator only ever branches on `success`.

#include "types.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <string>

namespace colloquy {

class ConversationContext;

// Outcome of one unit of work
struct AgentResult {
    bool success = false;
    json payload = json::object();  // Shape defined per stage; diagnostic only on failure
    std::string error;              // Non-empty iff !success
    std::string producer;           // Stage name
    std::chrono::microseconds elapsed{0};
    Timestamp completed_at = 0;

    static AgentResult ok(json payload) {
        AgentResult r;
        r.success = true;
        r.payload = std::move(payload);
        return r;
    }

    static AgentResult failure(std::string error, json diagnostic = json::object()) {
        AgentResult r;
        r.success = false;
        r.error = error.empty() ? "unknown error" : std::move(error);
        r.payload = std::move(diagnostic);
        return r;
    }
};

// Base class for all pipeline stages
class Agent {
public:
    explicit Agent(std::string name) : name_(std::move(name)) {}
    virtual ~Agent() = default;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& name() const { return name_; }

    // Run the stage. Faults are captured, timing and identity stamped.
    AgentResult execute(const ConversationContext& ctx) {
        auto start = std::chrono::steady_clock::now();
        AgentResult result;
        try {
            result = perform(ctx);
        } catch (const std::exception& e) {
            result = AgentResult::failure(e.what());
        } catch (...) {
            result = AgentResult::failure("non-standard exception in " + name_);
        }
        // An implementation that reports failure without a message still honours the invariant
        if (!result.success && result.error.empty()) {
            result.error = "unknown error";
        }
        if (result.success) {
            result.error.clear();
        }
        result.producer = name_;
        result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        result.completed_at = now();
        return result;
    }

    // Schedule execute() on its own task. The context must outlive the future.
    std::future<AgentResult> launch(const ConversationContext& ctx) {
        return std::async(std::launch::async, [this, &ctx]() {
            return execute(ctx);
        });
    }

protected:
    virtual AgentResult perform(const ConversationContext& ctx) = 0;

private:
    std::string name_;
};

} // namespace colloquy
