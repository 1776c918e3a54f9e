#pragma once
// Judges: projections of the same output
//
// Every judge applies the same scorer through its own bias, the way a
// strict reviewer and a lenient one read the same text. The panel then
// folds the votes into a verdict by one of three consensus methods.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <string>
#include <vector>

namespace cortex {

struct Judge {
    std::string id;
    std::string name;
    double bias = 0.0;

    Judge(std::string judge_id, std::string judge_name)
        : id(std::move(judge_id)), name(std::move(judge_name)) {}

    Judge& with_bias(double b) {
        bias = b;
        return *this;
    }

    JudgeVote vote(const std::string& output, const std::vector<std::string>& categories,
                   const std::string& context, const Scorer& scorer) const {
        JudgeVote v;
        v.judge_id = id;

        double sum = 0.0;
        for (const auto& category : categories) {
            double raw = scorer(output, category, context);
            double score = std::clamp(raw + bias, 0.0, 1.0);
            v.category_scores[category] = score;
            sum += score;
        }
        v.score = categories.empty() ? 0.0 : sum / categories.size();

        char buf[128];
        snprintf(buf, sizeof(buf), "%s judge scored %zu categories, avg %.0f%%",
                 name.c_str(), categories.size(), v.score * 100.0);
        v.reasoning = buf;
        return v;
    }
};

// The three temperaments, cycled across the panel
namespace panel {

inline Judge strict(size_t index) {
    return Judge("judge_" + std::to_string(index), "Strict").with_bias(-0.05);
}

inline Judge balanced(size_t index) {
    return Judge("judge_" + std::to_string(index), "Balanced").with_bias(0.0);
}

inline Judge lenient(size_t index) {
    return Judge("judge_" + std::to_string(index), "Lenient").with_bias(0.05);
}

inline std::vector<Judge> make(size_t count) {
    std::vector<Judge> judges;
    judges.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        switch (i % 3) {
            case 0: judges.push_back(balanced(i)); break;
            case 1: judges.push_back(strict(i)); break;
            default: judges.push_back(lenient(i)); break;
        }
    }
    return judges;
}

} // namespace panel

// Heuristic quality score in [0, 1]:
//   0.3 · length relevance + 0.4 · reasoning markers + 0.3 · context overlap
inline double heuristic_score(const std::string& output, const std::string& /*category*/,
                              const std::string& context) {
    size_t len = output.size();
    double length_score = len < 10 ? 0.2
                        : len > 5000 ? 0.5
                        : std::min(1.0, static_cast<double>(len) / 500.0);

    static const char* markers[] = {
        "because", "therefore", "result", "means", "since", "given", "shows", "indicates"
    };
    std::string lower = to_lower(output);
    size_t hits = 0;
    for (const char* m : markers) {
        if (lower.find(m) != std::string::npos) hits++;
    }
    double marker_score = std::min(1.0, hits / 3.0);

    double context_score = 0.5;
    if (!context.empty()) {
        auto context_words = split_words(to_lower(context), 4);
        std::set<std::string> vocab(context_words.begin(), context_words.end());
        size_t overlap = 0;
        for (const auto& w : split_words(lower, 4)) {
            if (vocab.count(w)) overlap++;
        }
        double denom = std::max(1.0, vocab.size() * 0.3);
        context_score = std::min(1.0, overlap / denom);
    }

    return length_score * 0.3 + marker_score * 0.4 + context_score * 0.3;
}

struct ConsensusReport {
    double overall_score = 0.0;
    double consensus = 0.0;
};

// Fraction of judges siding with the majority pass/fail decision
inline ConsensusReport majority_consensus(const std::vector<JudgeVote>& votes,
                                          double pass_threshold) {
    ConsensusReport report;
    if (votes.empty()) return report;

    size_t pass = 0;
    double sum = 0.0;
    for (const auto& v : votes) {
        if (v.score >= pass_threshold) pass++;
        sum += v.score;
    }
    size_t n = votes.size();
    report.overall_score = sum / n;
    report.consensus = static_cast<double>(std::max(pass, n - pass)) / n;
    return report;
}

// Confidence-weighted mean; agreement is one minus mean absolute deviation
inline ConsensusReport weighted_consensus(const std::vector<JudgeVote>& votes) {
    ConsensusReport report;
    if (votes.empty()) return report;

    double weight = 0.0;
    double weighted = 0.0;
    for (const auto& v : votes) {
        weight += v.score;
        weighted += v.score * v.score;
    }
    report.overall_score = weight > 0.0 ? weighted / weight : 0.0;

    double deviation = 0.0;
    for (const auto& v : votes) {
        deviation += std::abs(v.score - report.overall_score);
    }
    report.consensus = std::clamp(1.0 - deviation / votes.size(), 0.0, 1.0);
    return report;
}

// Judges repeatedly move halfway toward the panel mean; agreement falls
// with the variance left after the rounds
inline ConsensusReport debate_consensus(const std::vector<JudgeVote>& votes, size_t rounds = 3) {
    ConsensusReport report;
    if (votes.empty()) return report;

    std::vector<double> positions;
    for (const auto& v : votes) positions.push_back(v.score);

    auto mean_of = [](const std::vector<double>& xs) {
        double s = 0.0;
        for (double x : xs) s += x;
        return s / xs.size();
    };

    for (size_t r = 0; r < rounds; ++r) {
        double mean = mean_of(positions);
        for (double& p : positions) p += 0.5 * (mean - p);
    }

    double mean = mean_of(positions);
    double variance = 0.0;
    for (double p : positions) variance += (p - mean) * (p - mean);
    variance /= positions.size();

    report.overall_score = std::clamp(mean, 0.0, 1.0);
    report.consensus = 1.0 - std::min(1.0, variance * 4.0);
    return report;
}

} // namespace cortex
