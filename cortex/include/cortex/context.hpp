#pragma once
// ContextMemoryUnit: two-tier Q-valued memory
//
// STM holds recent working context, LTM holds what proved useful.
// Each entry carries a learned Q-value:
//
//   Q ← clamp(Q + α(reward − Q), 0, 1)
//
// STM entries that reach the promotion threshold move to LTM. Both tiers
// evict the lowest-Q entry (oldest on ties) when full. Compression folds
// the weakest 30% of STM into a knowledge block summary.

#include "types.hpp"
#include "events.hpp"
#include "bounded.hpp"
#include "memory/types.hpp"
#include "memory/term_index.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cortex {

class ContextMemoryUnit {
public:
    explicit ContextMemoryUnit(ContextConfig config = {})
        : config_(std::move(config))
        , events_("ContextMemory")
        , blocks_(config_.knowledge_block_capacity)
    {
        // A tier always holds at least one entry
        config_.stm_capacity = std::max<size_t>(1, config_.stm_capacity);
        config_.ltm_capacity = std::max<size_t>(1, config_.ltm_capacity);
    }

    ContextMemoryUnit(const ContextMemoryUnit&) = delete;
    ContextMemoryUnit& operator=(const ContextMemoryUnit&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        if (config_.verbose) std::cerr << "[ContextMemory] Started\n";
        events_.emit("started", {{"timestamp", now()}});
    }

    void stop() {
        if (!running_.exchange(false)) return;
        if (config_.verbose) std::cerr << "[ContextMemory] Stopped\n";
        events_.emit("stopped", {{"timestamp", now()}});
    }

    bool is_running() const { return running_; }

    SubscriptionId on(const std::string& event, EventCallback callback) {
        return events_.on(event, std::move(callback));
    }

    bool off(SubscriptionId id) { return events_.off(id); }

    const ContextConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════
    // Store / retrieve
    // ═══════════════════════════════════════════════════════════════════

    // Same key in the same scope updates in place
    MemoryEntry store(const std::string& key, json value, StoreOptions options = {}) {
        Pending pending;
        MemoryEntry result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& tier = tier_of(options.scope);

            auto key_it = key_index_.find(index_key(options.scope, key));
            if (key_it != key_index_.end()) {
                auto it = tier.find(key_it->second);
                if (it != tier.end()) {
                    MemoryEntry& entry = it->second;
                    entry.value = std::move(value);
                    entry.last_accessed_at = now();
                    entry.access_count++;
                    if (options.importance) {
                        entry.importance = std::clamp(*options.importance, 0.0, 1.0);
                        entry.q_value = entry.importance;
                    }
                    if (options.tags) {
                        entry.tags = *options.tags;
                        tags_.add(entry.id, entry.tags);
                    }
                    index_keywords(entry);
                    return entry;
                }
            }

            if (tier.size() >= capacity_of(options.scope)) {
                evict_lowest_q(options.scope, pending);
            }

            MemoryEntry entry;
            entry.id = generate_id("mem");
            entry.key = key;
            entry.value = std::move(value);
            entry.scope = options.scope;
            entry.tags = options.tags.value_or(std::vector<std::string>{});
            entry.importance = std::clamp(options.importance.value_or(0.5), 0.0, 1.0);
            entry.q_value = entry.importance;
            entry.access_count = 0;
            entry.created_at = now();
            entry.last_accessed_at = entry.created_at;
            entry.sequence = ++sequence_;

            insert_locked(entry);
            total_stored_++;
            result = entry;

            pending.emplace_back("stored", json{
                {"memory_id", entry.id},
                {"key", key},
                {"scope", to_string(entry.scope)},
                {"q_value", entry.q_value},
                {"timestamp", entry.created_at}
            });
        }
        flush(pending);
        return result;
    }

    // Composite score: 0.4·Q + 0.3·keyword + 0.2·recency + 0.1·frequency
    std::vector<MemoryEntry> retrieve(const std::string& query, RetrieveOptions options = {}) {
        std::vector<MemoryEntry> results;
        Timestamp t = now();
        {
            std::lock_guard<std::mutex> lock(mutex_);

            std::vector<MemoryEntry*> candidates;
            if (options.scope != ScopeFilter::LTM) {
                for (auto& [_, entry] : stm_) candidates.push_back(&entry);
            }
            if (options.scope != ScopeFilter::STM) {
                for (auto& [_, entry] : ltm_) candidates.push_back(&entry);
            }

            if (!options.tags.empty()) {
                auto matching = tags_.find_any(options.tags);
                candidates.erase(
                    std::remove_if(candidates.begin(), candidates.end(),
                        [&](const MemoryEntry* e) { return !matching.count(e->id); }),
                    candidates.end());
            }

            auto words = split_words(to_lower(query));
            std::vector<std::pair<double, MemoryEntry*>> scored;
            scored.reserve(candidates.size());
            for (MemoryEntry* entry : candidates) {
                double score = retrieval_score(*entry, words, t);
                if (score >= options.min_score) scored.emplace_back(score, entry);
            }

            std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
                if (a.first != b.first) return a.first > b.first;
                return a.second->sequence < b.second->sequence;
            });

            size_t limit = options.top_k.value_or(scored.size());
            for (size_t i = 0; i < scored.size() && i < limit; ++i) {
                MemoryEntry* entry = scored[i].second;
                entry->access_count++;
                entry->last_accessed_at = t;
                results.push_back(*entry);
            }
            total_retrieved_ += results.size();
        }

        events_.emit("retrieved", {
            {"query", query},
            {"result_count", results.size()},
            {"scope", to_string(options.scope)},
            {"timestamp", t}
        });
        return results;
    }

    bool update(const std::string& id, json value) {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryEntry* entry = find_locked(id);
        if (!entry) return false;

        entry->value = std::move(value);
        entry->last_accessed_at = now();
        entry->access_count++;
        index_keywords(*entry);
        return true;
    }

    bool discard(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryEntry* entry = find_locked(id);
        if (!entry) return false;
        erase_locked(entry->scope, id);
        return true;
    }

    std::optional<MemoryEntry> get_by_id(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stm_.find(id);
        if (it != stm_.end()) return it->second;
        it = ltm_.find(id);
        if (it != ltm_.end()) return it->second;
        return std::nullopt;
    }

    // Without a scope, STM wins over LTM
    std::optional<MemoryEntry> get_by_key(const std::string& key,
                                          std::optional<Scope> scope = std::nullopt) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Scope> order = scope ? std::vector<Scope>{*scope}
                                         : std::vector<Scope>{Scope::STM, Scope::LTM};
        for (Scope s : order) {
            auto key_it = key_index_.find(index_key(s, key));
            if (key_it == key_index_.end()) continue;
            const auto& tier = s == Scope::STM ? stm_ : ltm_;
            auto it = tier.find(key_it->second);
            if (it != tier.end()) return it->second;
        }
        return std::nullopt;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Q-learning and tier movement
    // ═══════════════════════════════════════════════════════════════════

    bool update_q_value(const std::string& id, double reward) {
        Pending pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            MemoryEntry* entry = find_locked(id);
            if (!entry) return false;

            double alpha = config_.q_learning_rate;
            entry->q_value += alpha * (reward - entry->q_value);
            entry->q_value = std::clamp(entry->q_value, 0.0, 1.0);

            if (entry->scope == Scope::STM &&
                entry->q_value >= config_.promotion_q_threshold) {
                move_locked(id, Scope::STM, Scope::LTM, pending);
            }
        }
        flush(pending);
        return true;
    }

    void batch_update_q_values(const std::vector<std::string>& ids, double reward) {
        for (const auto& id : ids) {
            update_q_value(id, reward);
        }
    }

    bool promote(const std::string& id) {
        Pending pending;
        bool moved;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            moved = move_locked(id, Scope::STM, Scope::LTM, pending);
        }
        flush(pending);
        return moved;
    }

    bool demote(const std::string& id) {
        Pending pending;
        bool moved;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            moved = move_locked(id, Scope::LTM, Scope::STM, pending);
        }
        flush(pending);
        return moved;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Compression and indexing
    // ═══════════════════════════════════════════════════════════════════

    std::optional<KnowledgeBlock> compress() {
        KnowledgeBlock block;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t k = static_cast<size_t>(std::floor(stm_.size() * 0.3));
            if (k < 2) return std::nullopt;

            std::vector<const MemoryEntry*> ordered;
            ordered.reserve(stm_.size());
            for (const auto& [_, entry] : stm_) ordered.push_back(&entry);
            std::sort(ordered.begin(), ordered.end(), lower_q_first);
            ordered.resize(k);

            std::string summary;
            std::vector<std::string> ids;
            for (const MemoryEntry* entry : ordered) {
                if (!summary.empty()) summary += " | ";
                summary += "[" + entry->key + "]: " + truncate(value_text(entry->value), 100);
                ids.push_back(entry->id);
            }

            block.id = generate_id("kb");
            block.source_ids = ids;
            block.summary = std::move(summary);
            block.created_at = now();
            block.compression_ratio = static_cast<double>(k);

            for (const auto& id : ids) erase_locked(Scope::STM, id);
            blocks_.set(block.id, block);
            total_compressed_ += k;
        }

        if (config_.verbose) {
            std::cerr << "[ContextMemory] Compressed " << block.source_ids.size()
                      << " STM entries into " << block.id << "\n";
        }
        events_.emit("compressed", {
            {"block_id", block.id},
            {"entries_compressed", block.source_ids.size()},
            {"timestamp", block.created_at}
        });
        return block;
    }

    std::vector<KnowledgeBlock> knowledge_blocks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocks_.values();
    }

    std::vector<IndexHit> search_index(const std::string& query, size_t top_k = 5) const {
        if (!config_.enable_semantic_index) return {};

        std::lock_guard<std::mutex> lock(mutex_);
        auto scores = keywords_.partial_scores(split_words(to_lower(query)));

        std::vector<IndexHit> hits;
        hits.reserve(scores.size());
        for (const auto& [id, score] : scores) {
            hits.push_back({id, keywords_.terms_for(id), score});
        }
        std::sort(hits.begin(), hits.end(), [](const IndexHit& a, const IndexHit& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.entry_id < b.entry_id;
        });
        if (hits.size() > top_k) hits.resize(top_k);
        return hits;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Persistence and housekeeping
    // ═══════════════════════════════════════════════════════════════════

    std::vector<MemoryEntry> export_ltm() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<const MemoryEntry*> ordered;
        for (const auto& [_, entry] : ltm_) ordered.push_back(&entry);
        std::sort(ordered.begin(), ordered.end(), [](const MemoryEntry* a, const MemoryEntry* b) {
            return a->sequence < b->sequence;
        });

        std::vector<MemoryEntry> out;
        out.reserve(ordered.size());
        for (const MemoryEntry* entry : ordered) out.push_back(*entry);
        return out;
    }

    // Skips entries whose key is already in LTM, whose id is already
    // known, or that arrive once LTM is full
    size_t import_ltm(const std::vector<MemoryEntry>& entries) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t imported = 0;
        for (const auto& source : entries) {
            if (ltm_.size() >= config_.ltm_capacity) break;
            if (key_index_.count(index_key(Scope::LTM, source.key))) continue;
            if (!source.id.empty() && (stm_.count(source.id) || ltm_.count(source.id))) continue;

            MemoryEntry entry = source;
            if (entry.id.empty()) entry.id = generate_id("mem");
            entry.scope = Scope::LTM;
            entry.q_value = std::clamp(entry.q_value, 0.0, 1.0);
            entry.sequence = ++sequence_;
            insert_locked(entry);
            imported++;
        }

        if (config_.verbose && imported > 0) {
            std::cerr << "[ContextMemory] Imported " << imported << " LTM entries\n";
        }
        return imported;
    }

    void clear(ScopeFilter target = ScopeFilter::All) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (target != ScopeFilter::LTM) clear_tier(Scope::STM);
        if (target != ScopeFilter::STM) clear_tier(Scope::LTM);
        if (target == ScopeFilter::All) blocks_.clear();
    }

    ContextStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ContextStats s;
        s.running = running_;
        s.stm_size = stm_.size();
        s.ltm_size = ltm_.size();
        s.stm_capacity = config_.stm_capacity;
        s.ltm_capacity = config_.ltm_capacity;
        s.total_stored = total_stored_;
        s.total_retrieved = total_retrieved_;
        s.total_evicted = total_evicted_;
        s.total_compressed = total_compressed_;
        s.knowledge_blocks = blocks_.size();
        s.index_size = keywords_.entry_count();
        s.index_terms = keywords_.term_count();

        double sum = 0.0;
        for (const auto& [_, e] : stm_) sum += e.q_value;
        for (const auto& [_, e] : ltm_) sum += e.q_value;
        size_t total = stm_.size() + ltm_.size();
        s.avg_q_value = total > 0 ? sum / total : 0.0;
        return s;
    }

private:
    using Tier = std::unordered_map<std::string, MemoryEntry>;
    using Pending = std::vector<std::pair<std::string, json>>;

    static std::string index_key(Scope scope, const std::string& key) {
        return std::string(to_string(scope)) + ":" + key;
    }

    static bool lower_q_first(const MemoryEntry* a, const MemoryEntry* b) {
        if (a->q_value != b->q_value) return a->q_value < b->q_value;
        return a->sequence < b->sequence;
    }

    static double retrieval_score(const MemoryEntry& entry,
                                  const std::vector<std::string>& words, Timestamp t) {
        double keyword = 0.0;
        if (!words.empty()) {
            std::string text = entry.key + " " + value_text(entry.value);
            for (const auto& tag : entry.tags) text += " " + tag;
            text = to_lower(text);

            size_t matched = 0;
            for (const auto& w : words) {
                if (text.find(w) != std::string::npos) matched++;
            }
            keyword = static_cast<double>(matched) / words.size();
        }

        double age_ms = static_cast<double>(std::max<Timestamp>(0, t - entry.last_accessed_at));
        double recency = 1.0 / (1.0 + age_ms / (24.0 * 3600.0 * 1000.0));
        double frequency = std::log2(static_cast<double>(entry.access_count) + 1.0) / 10.0;
        double q = std::clamp(entry.q_value, 0.0, 1.0);

        return q * 0.4 + keyword * 0.3 + recency * 0.2 + frequency * 0.1;
    }

    Tier& tier_of(Scope scope) { return scope == Scope::STM ? stm_ : ltm_; }

    size_t capacity_of(Scope scope) const {
        return scope == Scope::STM ? config_.stm_capacity : config_.ltm_capacity;
    }

    MemoryEntry* find_locked(const std::string& id) {
        auto it = stm_.find(id);
        if (it != stm_.end()) return &it->second;
        it = ltm_.find(id);
        if (it != ltm_.end()) return &it->second;
        return nullptr;
    }

    // Keywords: unique lowercase words longer than two chars, at most 20
    void index_keywords(const MemoryEntry& entry) {
        if (!config_.enable_semantic_index) return;

        std::string text = entry.key;
        if (entry.value.is_string()) text += " " + entry.value.get<std::string>();
        for (const auto& tag : entry.tags) text += " " + tag;

        std::vector<std::string> keywords;
        for (auto& word : split_words(to_lower(text), 3)) {
            if (std::find(keywords.begin(), keywords.end(), word) != keywords.end()) continue;
            keywords.push_back(std::move(word));
            if (keywords.size() >= 20) break;
        }
        keywords_.add(entry.id, keywords);
    }

    void insert_locked(const MemoryEntry& entry) {
        key_index_[index_key(entry.scope, entry.key)] = entry.id;
        tags_.add(entry.id, entry.tags);
        tier_of(entry.scope)[entry.id] = entry;
        index_keywords(entry);
    }

    void erase_locked(Scope scope, const std::string& id) {
        auto& tier = tier_of(scope);
        auto it = tier.find(id);
        if (it == tier.end()) return;

        auto key_it = key_index_.find(index_key(scope, it->second.key));
        if (key_it != key_index_.end() && key_it->second == id) {
            key_index_.erase(key_it);
        }
        tags_.remove(id);
        keywords_.remove(id);
        tier.erase(it);
    }

    void evict_lowest_q(Scope scope, Pending& pending) {
        auto& tier = tier_of(scope);
        const MemoryEntry* victim = nullptr;
        for (const auto& [_, entry] : tier) {
            if (!victim || lower_q_first(&entry, victim)) victim = &entry;
        }
        if (!victim) return;

        json payload = {
            {"memory_id", victim->id},
            {"key", victim->key},
            {"q_value", victim->q_value},
            {"scope", to_string(scope)},
            {"timestamp", now()}
        };
        if (config_.verbose) {
            std::cerr << "[ContextMemory] Evicted " << victim->id << " ('" << victim->key
                      << "', q=" << victim->q_value << ") from " << to_string(scope) << "\n";
        }

        std::string id = victim->id;
        erase_locked(scope, id);
        total_evicted_++;
        pending.emplace_back("evicted", std::move(payload));
    }

    bool move_locked(const std::string& id, Scope from, Scope to, Pending& pending) {
        auto& source = tier_of(from);
        auto it = source.find(id);
        if (it == source.end()) return false;

        MemoryEntry entry = it->second;
        erase_locked(from, id);

        if (tier_of(to).size() >= capacity_of(to)) {
            evict_lowest_q(to, pending);
        }

        entry.scope = to;
        insert_locked(entry);

        pending.emplace_back(to == Scope::LTM ? "promoted" : "demoted", json{
            {"memory_id", entry.id},
            {"key", entry.key},
            {"q_value", entry.q_value},
            {"timestamp", now()}
        });
        return true;
    }

    void clear_tier(Scope scope) {
        auto& tier = tier_of(scope);
        std::vector<std::string> ids;
        ids.reserve(tier.size());
        for (const auto& [id, _] : tier) ids.push_back(id);
        for (const auto& id : ids) erase_locked(scope, id);
    }

    void flush(const Pending& pending) const {
        for (const auto& [event, payload] : pending) {
            events_.emit(event, payload);
        }
    }

    ContextConfig config_;
    EventBus events_;
    mutable std::mutex mutex_;
    Tier stm_;
    Tier ltm_;
    std::unordered_map<std::string, std::string> key_index_;   // "scope:key" → id
    TermIndex tags_;
    TermIndex keywords_;
    BoundedMap<std::string, KnowledgeBlock> blocks_;
    uint64_t sequence_ = 0;
    uint64_t total_stored_ = 0;
    uint64_t total_retrieved_ = 0;
    uint64_t total_evicted_ = 0;
    uint64_t total_compressed_ = 0;
    std::atomic<bool> running_{false};
};

} // namespace cortex
