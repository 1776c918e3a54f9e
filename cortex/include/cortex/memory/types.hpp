#pragma once
// Context memory types
//
// Entries live in one of two tiers. STM is small and churns; LTM keeps
// what earned a high Q-value. Both tiers evict by lowest Q-value.

#include "../types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cortex {

enum class Scope : uint8_t {
    STM,
    LTM,
};

// Retrieval / clear target
enum class ScopeFilter : uint8_t {
    STM,
    LTM,
    All,
};

inline const char* to_string(Scope scope) {
    return scope == Scope::STM ? "stm" : "ltm";
}

inline const char* to_string(ScopeFilter filter) {
    switch (filter) {
        case ScopeFilter::STM: return "stm";
        case ScopeFilter::LTM: return "ltm";
        case ScopeFilter::All: return "all";
    }
    return "all";
}

inline std::optional<Scope> scope_from_string(const std::string& s) {
    if (s == "stm") return Scope::STM;
    if (s == "ltm") return Scope::LTM;
    return std::nullopt;
}

inline std::optional<ScopeFilter> scope_filter_from_string(const std::string& s) {
    if (s == "stm") return ScopeFilter::STM;
    if (s == "ltm") return ScopeFilter::LTM;
    if (s == "all") return ScopeFilter::All;
    return std::nullopt;
}

struct MemoryEntry {
    std::string id;
    std::string key;
    json value;
    Scope scope = Scope::STM;
    std::vector<std::string> tags;
    double importance = 0.5;
    double q_value = 0.5;              // [0, 1]
    uint64_t access_count = 0;
    Timestamp created_at = 0;
    Timestamp last_accessed_at = 0;
    uint64_t sequence = 0;             // Creation order, breaks eviction ties
};

struct KnowledgeBlock {
    std::string id;
    std::vector<std::string> source_ids;
    std::string summary;
    Timestamp created_at = 0;
    double compression_ratio = 0.0;
};

// search_index result
struct IndexHit {
    std::string entry_id;
    std::vector<std::string> keywords;
    double score = 0.0;
};

struct StoreOptions {
    Scope scope = Scope::STM;
    std::optional<std::vector<std::string>> tags;
    std::optional<double> importance;
};

struct RetrieveOptions {
    ScopeFilter scope = ScopeFilter::All;
    std::vector<std::string> tags;         // Any-of; empty = no filter
    std::optional<size_t> top_k;           // Unbounded when absent
    double min_score = 0.0;
};

struct ContextConfig {
    size_t stm_capacity = 100;
    size_t ltm_capacity = 1000;
    double q_learning_rate = 0.1;
    double promotion_q_threshold = 0.7;
    bool enable_semantic_index = true;
    size_t knowledge_block_capacity = 200;
    bool verbose = false;
};

struct ContextStats {
    bool running = false;
    size_t stm_size = 0;
    size_t ltm_size = 0;
    size_t stm_capacity = 0;
    size_t ltm_capacity = 0;
    uint64_t total_stored = 0;
    uint64_t total_retrieved = 0;
    uint64_t total_evicted = 0;
    uint64_t total_compressed = 0;
    double avg_q_value = 0.0;
    size_t knowledge_blocks = 0;
    size_t index_size = 0;             // Entries with keywords
    size_t index_terms = 0;            // Distinct keywords
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON views
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const MemoryEntry& e) {
    j = {
        {"id", e.id},
        {"key", e.key},
        {"value", e.value},
        {"scope", to_string(e.scope)},
        {"tags", e.tags},
        {"importance", e.importance},
        {"q_value", e.q_value},
        {"access_count", e.access_count},
        {"created_at", e.created_at},
        {"last_accessed_at", e.last_accessed_at}
    };
}

// Lenient: missing fields take entry defaults, LTM scope is forced by import
inline void from_json(const json& j, MemoryEntry& e) {
    e.id = j.value("id", std::string());
    e.key = j.value("key", std::string());
    e.value = j.contains("value") ? j.at("value") : json();
    e.scope = scope_from_string(j.value("scope", std::string("ltm"))).value_or(Scope::LTM);
    if (j.contains("tags") && j.at("tags").is_array()) {
        e.tags.clear();
        for (const auto& tag : j.at("tags")) {
            if (tag.is_string()) e.tags.push_back(tag.get<std::string>());
        }
    }
    e.importance = j.value("importance", 0.5);
    e.q_value = j.value("q_value", e.importance);
    e.access_count = j.value("access_count", uint64_t{0});
    e.created_at = j.value("created_at", now());
    e.last_accessed_at = j.value("last_accessed_at", e.created_at);
}

inline void to_json(json& j, const KnowledgeBlock& b) {
    j = {
        {"id", b.id},
        {"source_ids", b.source_ids},
        {"summary", b.summary},
        {"created_at", b.created_at},
        {"compression_ratio", b.compression_ratio}
    };
}

inline void to_json(json& j, const IndexHit& h) {
    j = {{"entry_id", h.entry_id}, {"keywords", h.keywords}, {"score", h.score}};
}

inline void to_json(json& j, const ContextStats& s) {
    j = {
        {"running", s.running},
        {"stm_size", s.stm_size},
        {"ltm_size", s.ltm_size},
        {"stm_capacity", s.stm_capacity},
        {"ltm_capacity", s.ltm_capacity},
        {"total_stored", s.total_stored},
        {"total_retrieved", s.total_retrieved},
        {"total_evicted", s.total_evicted},
        {"total_compressed", s.total_compressed},
        {"avg_q_value", s.avg_q_value},
        {"knowledge_blocks", s.knowledge_blocks},
        {"index_size", s.index_size},
        {"index_terms", s.index_terms}
    };
}

} // namespace cortex
