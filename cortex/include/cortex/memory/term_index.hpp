#pragma once
// TermIndex: term-to-entry mapping for any-of and partial matching
//
// One instance indexes tags (exact, any-of filtering), another indexes
// keywords extracted from entries (partial matching for search_index).

#include "../types.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortex {

class TermIndex {
public:
    // Index entry under terms (replaces any previous terms)
    void add(const std::string& id, const std::vector<std::string>& terms) {
        remove(id);
        std::vector<std::string> unique;
        for (const auto& term : terms) {
            if (std::find(unique.begin(), unique.end(), term) != unique.end()) continue;
            unique.push_back(term);
            index_[term].insert(id);
        }
        entry_terms_[id] = std::move(unique);
    }

    void remove(const std::string& id) {
        auto it = entry_terms_.find(id);
        if (it == entry_terms_.end()) return;
        for (const auto& term : it->second) {
            auto idx_it = index_.find(term);
            if (idx_it != index_.end()) {
                idx_it->second.erase(id);
                if (idx_it->second.empty()) {
                    index_.erase(idx_it);
                }
            }
        }
        entry_terms_.erase(it);
    }

    // Entries carrying ANY of the terms
    std::set<std::string> find_any(const std::vector<std::string>& terms) const {
        std::set<std::string> result;
        for (const auto& term : terms) {
            auto it = index_.find(term);
            if (it != index_.end()) {
                result.insert(it->second.begin(), it->second.end());
            }
        }
        return result;
    }

    // Fraction of query words matched by each entry, where a word matches
    // a term when either one contains the other
    std::unordered_map<std::string, double> partial_scores(
            const std::vector<std::string>& words) const {
        std::unordered_map<std::string, double> scores;
        if (words.empty()) return scores;

        for (const auto& [id, terms] : entry_terms_) {
            size_t matched = 0;
            for (const auto& word : words) {
                for (const auto& term : terms) {
                    if (term.find(word) != std::string::npos ||
                        word.find(term) != std::string::npos) {
                        matched++;
                        break;
                    }
                }
            }
            if (matched > 0) {
                scores[id] = static_cast<double>(matched) / words.size();
            }
        }
        return scores;
    }

    std::vector<std::string> terms_for(const std::string& id) const {
        auto it = entry_terms_.find(id);
        return it != entry_terms_.end() ? it->second : std::vector<std::string>{};
    }

    size_t term_count() const { return index_.size(); }
    size_t entry_count() const { return entry_terms_.size(); }

    void clear() {
        index_.clear();
        entry_terms_.clear();
    }

private:
    std::unordered_map<std::string, std::set<std::string>> index_;
    std::unordered_map<std::string, std::vector<std::string>> entry_terms_;
};

} // namespace cortex
