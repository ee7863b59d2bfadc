#pragma once
// InMemoryEpisodicStore: long-term memory for one NPC
//
// Each entry is indexed as a term-frequency vector. search() ranks by
// cosine similarity against the query, keeps only hits with positive
// similarity, and breaks ties newest first. An empty query (no terms)
// returns the newest entries.

#include "../services.hpp"
#include "../types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace colloquy {

// Lowercased alphanumeric runs of 2+ bytes. Bytes >= 0x80 count as
// word characters so UTF-8 text is indexed too.
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.length() >= 2) tokens.push_back(current);
        current.clear();
    };

    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalnum(u)) {
            current += static_cast<char>(std::tolower(u));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

using TermVector = std::unordered_map<std::string, float>;

inline TermVector term_vector(const std::string& text) {
    TermVector v;
    for (const auto& token : tokenize(text)) v[token] += 1.0f;
    return v;
}

inline float cosine(const TermVector& a, const TermVector& b) {
    if (a.empty() || b.empty()) return 0.0f;
    const TermVector& small = a.size() <= b.size() ? a : b;
    const TermVector& large = a.size() <= b.size() ? b : a;

    float dot = 0.0f;
    for (const auto& [term, weight] : small) {
        auto it = large.find(term);
        if (it != large.end()) dot += weight * it->second;
    }
    if (dot == 0.0f) return 0.0f;

    auto norm = [](const TermVector& v) {
        float sum = 0.0f;
        for (const auto& [term, weight] : v) sum += weight * weight;
        return std::sqrt(sum);
    };
    return dot / (norm(a) * norm(b));
}

class InMemoryEpisodicStore : public LongTermStore {
public:
    std::vector<MemorySnippet> search(const std::string& query, size_t k) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MemorySnippet> out;
        if (k == 0 || entries_.empty()) return out;

        TermVector q = term_vector(query);
        if (q.empty()) {
            for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < k; ++it) {
                out.push_back(it->snippet);
            }
            return out;
        }

        struct Hit {
            float similarity;
            size_t index;
        };
        std::vector<Hit> hits;
        for (size_t i = 0; i < entries_.size(); ++i) {
            float sim = cosine(q, entries_[i].terms);
            if (sim > 0.0f) hits.push_back({sim, i});
        }

        std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
            if (a.similarity != b.similarity) return a.similarity > b.similarity;
            return a.index > b.index;
        });

        for (size_t i = 0; i < hits.size() && i < k; ++i) {
            out.push_back(entries_[hits[i].index].snippet);
        }
        return out;
    }

    void add(const std::vector<MemorySnippet>& entries) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& snippet : entries) {
            entries_.push_back(Entry{snippet, term_vector(snippet.content)});
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Newest last
    std::vector<MemorySnippet> recent(size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MemorySnippet> out;
        size_t start = entries_.size() > limit ? entries_.size() - limit : 0;
        for (size_t i = start; i < entries_.size(); ++i) out.push_back(entries_[i].snippet);
        return out;
    }

private:
    struct Entry {
        MemorySnippet snippet;
        TermVector terms;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;  // Insertion order
};

} // namespace colloquy
