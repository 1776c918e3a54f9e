#pragma once
// ReasoningEngine: the processor behind the reasoning primitives
//
// Five modes, each stateless per call:
//   reason    chain-of-thought under four strategies
//   search    tree search (bfs, dfs, beam, mcts)
//   simulate  Monte Carlo rollout with roulette-wheel transitions
//   judge     multi-judge panel with consensus
//   evolve    proposer/solver self-play with a difficulty schedule
//
// Caller-supplied functions (evaluator, transition, scorer, proposer,
// solver) run without the engine lock held. Results land in bounded
// stores so they can be looked up by id afterwards.

#include "types.hpp"
#include "events.hpp"
#include "bounded.hpp"
#include "reasoning/types.hpp"
#include "reasoning/judges.hpp"
#include "reasoning/tree_search.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace cortex {

class ReasoningEngine {
public:
    explicit ReasoningEngine(ReasoningConfig config = {})
        : config_(std::move(config))
        , events_("ReasoningEngine")
        , rng_(config_.seed != 0 ? config_.seed : std::random_device{}())
        , chains_(config_.chain_capacity)
        , trees_(config_.tree_capacity)
        , simulations_(config_.simulation_capacity)
        , verdicts_(config_.verdict_capacity)
        , history_(config_.evolution_history_capacity)
    {}

    ReasoningEngine(const ReasoningEngine&) = delete;
    ReasoningEngine& operator=(const ReasoningEngine&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        if (config_.verbose) std::cerr << "[ReasoningEngine] Started\n";
        events_.emit("started", {{"timestamp", now()}});
    }

    void stop() {
        if (!running_.exchange(false)) return;
        if (config_.verbose) std::cerr << "[ReasoningEngine] Stopped\n";
        events_.emit("stopped", {{"timestamp", now()}});
    }

    bool is_running() const { return running_; }

    SubscriptionId on(const std::string& event, EventCallback callback) {
        return events_.on(event, std::move(callback));
    }

    bool off(SubscriptionId id) { return events_.off(id); }

    const ReasoningConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════
    // Chain-of-thought
    // ═══════════════════════════════════════════════════════════════════

    ChainResult reason(const std::string& problem, const ReasonOptions& options = {}) {
        Strategy strategy = options.strategy.value_or(config_.default_strategy);
        size_t max_steps = std::max<size_t>(1, options.max_steps.value_or(config_.max_steps_per_chain));

        ChainBuilder chain;
        switch (strategy) {
            case Strategy::ZeroShot:
                zero_shot(chain, problem, options.context, max_steps);
                break;
            case Strategy::FewShot:
                few_shot(chain, problem, options.examples, max_steps);
                break;
            case Strategy::SelfConsistency:
                self_consistency(chain, problem, max_steps);
                break;
            case Strategy::LeastToMost:
                least_to_most(chain, problem, max_steps);
                break;
        }

        ChainResult result;
        result.chain_id = generate_id("chain");
        result.steps = std::move(chain.steps);
        result.conclusion = result.steps.back().content;
        result.confidence = result.steps.back().confidence;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            chains_.set(result.chain_id, result.steps);
            total_chains_++;
            total_steps_ += result.steps.size();
            confidence_sum_ += result.confidence;
        }

        events_.emit("completed", {
            {"chain_id", result.chain_id},
            {"strategy", to_string(strategy)},
            {"steps", result.steps.size()},
            {"confidence", result.confidence},
            {"timestamp", now()}
        });
        return result;
    }

    // Appends to a stored chain, linked to its current last step
    std::optional<ReasoningStep> add_step(const std::string& chain_id, const std::string& content,
                                          StepType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* steps = chains_.get(chain_id);
        if (!steps) return std::nullopt;

        ReasoningStep step;
        step.id = generate_id("step");
        step.parent_id = steps->empty() ? std::string() : steps->back().id;
        step.type = type;
        step.content = content;
        step.confidence = 0.5;
        step.timestamp = now();

        steps->push_back(step);
        total_steps_++;
        return step;
    }

    std::optional<std::vector<ReasoningStep>> get_chain(const std::string& chain_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* steps = chains_.get(chain_id);
        if (!steps) return std::nullopt;
        return *steps;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Tree search
    // ═══════════════════════════════════════════════════════════════════

    SearchResult search(const std::string& problem, const Evaluator& evaluator,
                        const SearchOptions& options = {}) {
        SearchTree tree;
        tree.id = generate_id("tree");
        tree.algorithm = options.algorithm.value_or(config_.default_search_algorithm);

        TreeSearch::Limits limits;
        limits.max_nodes = options.max_nodes;
        limits.max_depth = options.max_depth;
        limits.beam_width = options.beam_width.value_or(config_.default_beam_width);
        limits.exploration = config_.mcts_exploration;

        SearchResult result = TreeSearch(tree, evaluator, options.expander, limits).run(problem);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            trees_.set(tree.id, std::move(tree));
            total_searches_++;
            search_nodes_sum_ += result.nodes_explored;
        }

        events_.emit("searched", {
            {"tree_id", result.tree_id},
            {"algorithm", to_string(options.algorithm.value_or(config_.default_search_algorithm))},
            {"nodes_explored", result.nodes_explored},
            {"best_score", result.best_score},
            {"timestamp", now()}
        });
        return result;
    }

    std::optional<SearchTree> get_search_tree(const std::string& tree_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* tree = trees_.get(tree_id);
        if (!tree) return std::nullopt;
        return *tree;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Monte Carlo rollout
    // ═══════════════════════════════════════════════════════════════════

    SimulationResult simulate(const SimState& initial, const TransitionFn& transition,
                              const SimulateOptions& options = {}) {
        size_t num_trajectories = options.num_trajectories.value_or(config_.default_trajectories);
        std::mt19937_64 rng(next_seed());
        std::uniform_real_distribution<double> unit(0.0, 1.0);

        SimulationResult result;
        result.simulation_id = generate_id("sim");

        for (size_t t = 0; t < num_trajectories; ++t) {
            if (options.stop_requested && options.stop_requested()) break;

            Trajectory traj;
            traj.id = generate_id("traj");
            traj.states.push_back(initial);

            SimState current = initial;
            for (size_t step = 0; step < options.max_steps; ++step) {
                if (current.terminal) break;

                auto candidates = transition(current);
                if (candidates.empty()) break;

                // Roulette wheel over max(0.01, reward + 1)
                double total_fitness = 0.0;
                for (const auto& c : candidates) total_fitness += std::max(0.01, c.reward + 1.0);

                double spin = unit(rng) * total_fitness;
                size_t selected = candidates.size() - 1;
                for (size_t i = 0; i < candidates.size(); ++i) {
                    spin -= std::max(0.01, candidates[i].reward + 1.0);
                    if (spin <= 0.0) {
                        selected = i;
                        break;
                    }
                }

                current = std::move(candidates[selected]);
                current.step = step + 1;
                current.state_id = generate_id("state");
                traj.total_reward += current.reward * std::pow(options.discount, static_cast<double>(step));
                traj.states.push_back(current);
            }

            traj.steps = traj.states.size();
            result.trajectories.push_back(std::move(traj));
        }

        std::stable_sort(result.trajectories.begin(), result.trajectories.end(),
                         [](const Trajectory& a, const Trajectory& b) {
                             return a.total_reward > b.total_reward;
                         });

        if (!result.trajectories.empty()) {
            result.best = result.trajectories.front();
            double sum = 0.0;
            for (const auto& traj : result.trajectories) sum += traj.total_reward;
            result.expected_reward = sum / result.trajectories.size();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            simulations_.set(result.simulation_id, result);
            total_simulations_++;
        }

        events_.emit("simulated", {
            {"simulation_id", result.simulation_id},
            {"num_trajectories", result.trajectories.size()},
            {"expected_reward", result.expected_reward},
            {"best_reward", result.best.total_reward},
            {"timestamp", now()}
        });
        return result;
    }

    std::optional<SimulationResult> get_simulation(const std::string& simulation_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* sim = simulations_.get(simulation_id);
        if (!sim) return std::nullopt;
        return *sim;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Judge panel
    // ═══════════════════════════════════════════════════════════════════

    // With no categories the panel scores a single "overall" category
    Verdict judge(const std::string& output, const std::vector<std::string>& categories,
                  const JudgeOptions& options = {}) {
        size_t num_judges = std::max<size_t>(1, options.num_judges.value_or(config_.default_judge_count));
        std::vector<std::string> cats = categories.empty()
            ? std::vector<std::string>{"overall"} : categories;
        Scorer scorer = options.scorer ? options.scorer : Scorer(heuristic_score);

        Verdict verdict;
        verdict.id = generate_id("verdict");
        verdict.output = output;
        verdict.method = options.method;
        verdict.timestamp = now();

        for (const auto& judge : panel::make(num_judges)) {
            verdict.votes.push_back(judge.vote(output, cats, options.context, scorer));
        }

        for (const auto& category : cats) {
            double sum = 0.0;
            for (const auto& v : verdict.votes) sum += v.category_scores.at(category);
            verdict.category_scores[category] = sum / verdict.votes.size();
        }

        ConsensusReport report;
        switch (options.method) {
            case ConsensusMethod::Majority:
                report = majority_consensus(verdict.votes, config_.pass_threshold);
                break;
            case ConsensusMethod::Weighted:
                report = weighted_consensus(verdict.votes);
                break;
            case ConsensusMethod::Debate:
                report = debate_consensus(verdict.votes);
                break;
        }

        verdict.overall_score = std::clamp(report.overall_score, 0.0, 1.0);
        verdict.consensus = std::clamp(report.consensus, 0.0, 1.0);
        verdict.passed = verdict.overall_score >= config_.pass_threshold &&
                         verdict.consensus >= config_.consensus_threshold;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            verdicts_.set(verdict.id, verdict);
            total_judgements_++;
        }

        events_.emit("judged", {
            {"verdict_id", verdict.id},
            {"passed", verdict.passed},
            {"overall_score", verdict.overall_score},
            {"consensus", verdict.consensus},
            {"num_judges", num_judges},
            {"timestamp", verdict.timestamp}
        });
        return verdict;
    }

    bool add_evidence(const std::string& verdict_id, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        Verdict* verdict = verdicts_.get(verdict_id);
        if (!verdict) return false;
        verdict->evidence.push_back({content, now()});
        return true;
    }

    std::optional<Verdict> get_verdict(const std::string& verdict_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Verdict* verdict = verdicts_.get(verdict_id);
        if (!verdict) return std::nullopt;
        return *verdict;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Self-play evolution
    // ═══════════════════════════════════════════════════════════════════

    EvolutionRound evolve(const EvolveOptions& options = {}) {
        uint64_t round;
        uint64_t seed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            round = next_round_++;
            seed = rng_();
        }
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<double> jitter(-0.1, 0.1);

        double difficulty = std::clamp(options.difficulty, 0.0, 1.0);

        Proposer proposer = options.proposer;
        if (!proposer) {
            proposer = [&rng, &jitter, round](double d, size_t count) {
                std::vector<Problem> problems;
                for (size_t i = 0; i < count; ++i) {
                    Problem p;
                    p.difficulty = std::clamp(d + jitter(rng), 0.0, 1.0);
                    char buf[96];
                    snprintf(buf, sizeof(buf), "Problem %llu-%zu (difficulty: %.0f%%)",
                             static_cast<unsigned long long>(round), i, p.difficulty * 100.0);
                    p.content = buf;
                    problems.push_back(std::move(p));
                }
                return problems;
            };
        }

        Solver solver = options.solver;
        if (!solver) {
            solver = [&rng, &jitter](const Problem& problem) {
                double quality = std::clamp(0.8 - 0.3 * problem.difficulty + jitter(rng), 0.0, 1.0);
                return SolverOutput{quality, "Solution for: " + problem.content};
            };
        }

        EvolutionRound result;
        result.round = round;
        result.difficulty = difficulty;
        result.problems = proposer(difficulty, options.num_problems);

        for (size_t i = 0; i < result.problems.size(); ++i) {
            SolverOutput out = solver(result.problems[i]);
            result.solutions.push_back({i, std::clamp(out.quality, 0.0, 1.0), std::move(out.content)});
        }

        if (!result.solutions.empty()) {
            double sum = 0.0;
            for (const auto& s : result.solutions) {
                sum += s.quality;
                result.best_quality = std::max(result.best_quality, s.quality);
            }
            result.avg_quality = sum / result.solutions.size();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.push(result);
            total_evolutions_++;
        }

        if (config_.verbose) {
            std::cerr << "[ReasoningEngine] Round " << round << " difficulty=" << difficulty
                      << " avg_quality=" << result.avg_quality << "\n";
        }
        events_.emit("evolved", {
            {"round", round},
            {"difficulty", difficulty},
            {"avg_quality", result.avg_quality},
            {"best_quality", result.best_quality},
            {"num_problems", result.problems.size()},
            {"timestamp", now()}
        });
        return result;
    }

    // Rounds with a difficulty schedule; a quality plateau over the last
    // plateau_window rounds bumps difficulty by 0.1
    std::vector<EvolutionRound> evolve_loop(const EvolveLoopOptions& options = {}) {
        std::vector<EvolutionRound> rounds;
        std::vector<double> qualities;
        double difficulty = std::clamp(options.initial_difficulty, 0.0, 1.0);

        for (size_t i = 0; i < options.max_rounds; ++i) {
            if (options.stop_requested && options.stop_requested()) {
                if (config_.verbose) {
                    std::cerr << "[ReasoningEngine] Evolution stopped after " << i << " rounds\n";
                }
                break;
            }

            EvolveOptions round_options;
            round_options.difficulty = difficulty;
            round_options.num_problems = options.num_problems;
            round_options.proposer = options.proposer;
            round_options.solver = options.solver;

            EvolutionRound round = evolve(round_options);
            qualities.push_back(round.avg_quality);

            size_t window = config_.plateau_window;
            if (window > 0 && qualities.size() >= window) {
                auto [lo, hi] = std::minmax_element(
                    qualities.end() - static_cast<std::ptrdiff_t>(window), qualities.end());
                if (*hi - *lo < 0.02) {
                    if (config_.verbose) {
                        std::cerr << "[ReasoningEngine] Plateau at round " << round.round
                                  << ", raising difficulty\n";
                    }
                    difficulty = std::min(1.0, difficulty + 0.1);
                }
            }

            switch (options.schedule) {
                case DifficultySchedule::Linear:
                    difficulty = std::min(1.0, difficulty + 0.05);
                    break;
                case DifficultySchedule::Exponential:
                    difficulty = std::min(1.0, difficulty * 1.15);
                    break;
                case DifficultySchedule::Adaptive:
                    if (round.avg_quality > 0.7) {
                        difficulty = std::min(1.0, difficulty + 0.08);
                    } else if (round.avg_quality < 0.3) {
                        difficulty = std::max(0.1, difficulty - 0.05);
                    }
                    break;
            }

            rounds.push_back(std::move(round));
        }
        return rounds;
    }

    // Oldest first, bounded
    std::vector<EvolutionRound> evolution_history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.to_vector();
    }

    ReasoningStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ReasoningStats s;
        s.running = running_;
        s.total_chains = total_chains_;
        s.total_steps = total_steps_;
        s.total_searches = total_searches_;
        s.total_simulations = total_simulations_;
        s.total_judgements = total_judgements_;
        s.total_evolutions = total_evolutions_;
        s.avg_confidence = total_chains_ > 0 ? confidence_sum_ / total_chains_ : 0.0;
        s.avg_search_nodes = total_searches_ > 0
            ? static_cast<double>(search_nodes_sum_) / total_searches_ : 0.0;
        return s;
    }

private:
    // Accumulates steps, each linked to the one before
    struct ChainBuilder {
        std::vector<ReasoningStep> steps;

        void add(StepType type, std::string content, double confidence) {
            ReasoningStep step;
            step.id = generate_id("step");
            step.parent_id = steps.empty() ? std::string() : steps.back().id;
            step.type = type;
            step.content = std::move(content);
            step.confidence = std::clamp(confidence, 0.0, 1.0);
            step.timestamp = now();
            steps.push_back(std::move(step));
        }
    };

    static std::string quoted(const std::string& s, size_t n) {
        return "\"" + truncate(s, n) + "\"";
    }

    uint64_t next_seed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return rng_();
    }

    void zero_shot(ChainBuilder& chain, const std::string& problem,
                   const std::string& context, size_t max_steps) {
        if (!context.empty() && max_steps >= 3) {
            chain.add(StepType::Evidence, "Context: " + truncate(context, 200), 0.6);
        }
        if (max_steps >= 2) {
            chain.add(StepType::Deduction,
                      "Decomposition: identifying key components of " + quoted(problem, 100), 0.65);
        }
        chain.add(StepType::Conclusion, "Conclusion: synthesized answer for " + quoted(problem, 100), 0.7);
    }

    void few_shot(ChainBuilder& chain, const std::string& problem,
                  const std::vector<FewShotExample>& examples, size_t max_steps) {
        size_t limit = std::min(examples.size(), std::max<size_t>(1, max_steps > 2 ? max_steps - 2 : 1));
        for (size_t i = 0; i < limit; ++i) {
            chain.add(StepType::Evidence,
                      "Example " + std::to_string(i + 1) + ": " + quoted(examples[i].problem, 50) +
                      " → " + truncate(examples[i].answer, 50), 0.8);
        }
        chain.add(StepType::Deduction,
                  "Applying pattern from " + std::to_string(examples.size()) + " examples to " +
                  quoted(problem, 100), 0.75);
        chain.add(StepType::Conclusion, "Few-shot conclusion for " + quoted(problem, 100), 0.75);
    }

    void self_consistency(ChainBuilder& chain, const std::string& problem, size_t max_steps) {
        size_t samples = std::max<size_t>(1, std::min<size_t>(3, max_steps / 2));
        std::mt19937_64 rng(next_seed());
        std::uniform_real_distribution<double> spread(0.5, 0.9);

        double sum = 0.0;
        for (size_t i = 0; i < samples; ++i) {
            double confidence = spread(rng);
            sum += confidence;
            chain.add(StepType::Hypothesis,
                      "Chain " + std::to_string(i + 1) + " result for " + quoted(problem, 50), confidence);
        }

        double avg = sum / samples;
        char buf[96];
        snprintf(buf, sizeof(buf), "Self-consistency consensus from %zu chains (avg confidence: %.0f%%)",
                 samples, avg * 100.0);
        chain.add(StepType::Conclusion, buf, avg);
    }

    void least_to_most(ChainBuilder& chain, const std::string& problem, size_t max_steps) {
        static const char* stages[] = {
            "Sub-problem 1 (easiest): foundation of ",
            "Sub-problem 2 (medium): core analysis of ",
            "Sub-problem 3 (hardest): full synthesis of ",
        };
        size_t count = std::min<size_t>(3, max_steps > 1 ? max_steps - 1 : 0);
        for (size_t i = 0; i < count; ++i) {
            chain.add(StepType::Deduction, stages[i] + quoted(problem, 50), 0.5 + (i + 1) * 0.1);
        }
        chain.add(StepType::Conclusion,
                  "Least-to-most conclusion: built up from " + std::to_string(count) + " sub-problems", 0.8);
    }

    ReasoningConfig config_;
    EventBus events_;
    mutable std::mutex mutex_;
    std::mt19937_64 rng_;

    BoundedMap<std::string, std::vector<ReasoningStep>> chains_;
    BoundedMap<std::string, SearchTree> trees_;
    BoundedMap<std::string, SimulationResult> simulations_;
    BoundedMap<std::string, Verdict> verdicts_;
    RingBuffer<EvolutionRound> history_;

    uint64_t next_round_ = 0;
    uint64_t total_chains_ = 0;
    uint64_t total_steps_ = 0;
    uint64_t total_searches_ = 0;
    uint64_t total_simulations_ = 0;
    uint64_t total_judgements_ = 0;
    uint64_t total_evolutions_ = 0;
    double confidence_sum_ = 0.0;
    uint64_t search_nodes_sum_ = 0;
    std::atomic<bool> running_{false};
};

} // namespace cortex
