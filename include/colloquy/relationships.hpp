#pragma once
// Relationships: the affinity ledger between NPCs and players
//
// Scores live in a ScoreTable and are clamped to [0, 100]. A pair that
// never talked reads as the neutral score. Changes come from an
// optional AffinityJudge; without one the ledger is read-only for turns.

#include "narrative.hpp"
#include "services.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace colloquy {

// Storage for npc+player scores
class ScoreTable {
public:
    virtual ~ScoreTable() = default;

    virtual std::optional<float> get(const std::string& npc, const std::string& player) = 0;
    virtual void put(const std::string& npc, const std::string& player, float score) = 0;
    // npc -> score for one player
    virtual std::map<std::string, float> all_for(const std::string& player) = 0;
};

class InMemoryScoreTable : public ScoreTable {
public:
    std::optional<float> get(const std::string& npc, const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scores_.find({npc, player});
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    void put(const std::string& npc, const std::string& player, float score) override {
        std::lock_guard<std::mutex> lock(mutex_);
        scores_[{npc, player}] = score;
    }

    std::map<std::string, float> all_for(const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, float> out;
        for (const auto& [key, score] : scores_) {
            if (key.second == player) out[key.first] = score;
        }
        return out;
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, float> scores_;
};

// Decides how much one exchange moves the score
class AffinityJudge {
public:
    virtual ~AffinityJudge() = default;

    virtual float delta(const std::string& npc, const std::string& player,
                        const std::string& utterance, const std::string& reply) = 0;
};

// Word-list judge: kind words raise the score, hostile ones lower it.
// Only the player's utterance counts.
class KeywordJudge : public AffinityJudge {
public:
    static constexpr float WARM_STEP = 2.0f;
    static constexpr float HOSTILE_STEP = -5.0f;
    static constexpr float MAX_SHIFT = 10.0f;

    float delta(const std::string&, const std::string&,
                const std::string& utterance, const std::string&) override {
        std::string text = lower(utterance);
        float shift = 0.0f;
        for (const char* word : warm_words()) {
            if (text.find(word) != std::string::npos) shift += WARM_STEP;
        }
        for (const char* word : hostile_words()) {
            if (text.find(word) != std::string::npos) shift += HOSTILE_STEP;
        }
        return std::clamp(shift, -MAX_SHIFT, MAX_SHIFT);
    }

private:
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static const std::vector<const char*>& warm_words() {
        static const std::vector<const char*> words = {
            "thank", "please", "great job", "appreciate", "well done", "nice to meet"
        };
        return words;
    }

    static const std::vector<const char*>& hostile_words() {
        static const std::vector<const char*> words = {
            "stupid", "idiot", "shut up", "useless", "hate you"
        };
        return words;
    }
};

// The relationship collaborator used by the pipeline
class RelationshipLedger : public RelationshipService {
public:
    struct Band {
        float floor;           // Inclusive lower bound
        const char* level;
        const char* style;
    };

    explicit RelationshipLedger(std::shared_ptr<ScoreTable> table,
                                std::shared_ptr<AffinityJudge> judge = nullptr)
        : table_(std::move(table)), judge_(std::move(judge)) {}

    // Highest band first
    static const std::vector<Band>& bands() {
        static const std::vector<Band> table = {
            {80.0f, "Close friend", "Open, playful and caring"},
            {60.0f, "Friendly", "Warm and chatty"},
            {40.0f, affinity::NEUTRAL_LEVEL, affinity::NEUTRAL_STYLE},
            {20.0f, "Wary", "Reserved and brief"},
            {0.0f, "Hostile", "Cold and curt"},
        };
        return table;
    }

    static float clamp(float score) {
        if (std::isnan(score)) return affinity::NEUTRAL_SCORE;
        return std::clamp(score, affinity::MIN_SCORE, affinity::MAX_SCORE);
    }

    float score(const std::string& npc, const std::string& player) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return table_->get(npc, player).value_or(affinity::NEUTRAL_SCORE);
    }

    std::string level(float score) const override { return band_for(score).level; }
    std::string style(float score) const override { return band_for(score).style; }

    AffinityUpdate analyze_and_update(const std::string& npc, const std::string& player,
                                      const std::string& utterance,
                                      const std::string& reply) override {
        std::lock_guard<std::mutex> lock(mutex_);
        float current = table_->get(npc, player).value_or(affinity::NEUTRAL_SCORE);

        AffinityUpdate update;
        update.new_score = current;
        if (!judge_) return update;

        float next = clamp(current + judge_->delta(npc, player, utterance, reply));
        if (std::fabs(next - current) < 1e-4f) return update;

        table_->put(npc, player, next);
        update.changed = true;
        update.new_score = next;
        return update;
    }

    // Administrative override. Returns the stored (clamped) score.
    float set_score(const std::string& npc, const std::string& player, float score) {
        std::lock_guard<std::mutex> lock(mutex_);
        float stored = clamp(score);
        table_->put(npc, player, stored);
        return stored;
    }

    std::map<std::string, float> scores_for(const std::string& player) {
        std::lock_guard<std::mutex> lock(mutex_);
        return table_->all_for(player);
    }

    bool has_judge() const { return judge_ != nullptr; }

private:
    static const Band& band_for(float score) {
        float s = clamp(score);
        for (const auto& band : bands()) {
            if (s >= band.floor) return band;
        }
        return bands().back();
    }

    std::shared_ptr<ScoreTable> table_;
    std::shared_ptr<AffinityJudge> judge_;
    std::mutex mutex_;
};

} // namespace colloquy
