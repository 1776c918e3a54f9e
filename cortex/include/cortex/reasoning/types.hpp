#pragma once
// Reasoning types
//
// The five outputs of the engine: chains (chain-of-thought), trees
// (search), trajectories (rollout), verdicts (judge panel) and rounds
// (self-play). Callers supply the scoring functions; the engine owns
// the bookkeeping.

#include "../types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cortex {

enum class Strategy : uint8_t {
    ZeroShot,
    FewShot,
    SelfConsistency,
    LeastToMost,
};

enum class StepType : uint8_t {
    Evidence,
    Hypothesis,
    Deduction,
    Conclusion,
};

enum class SearchAlgorithm : uint8_t {
    BFS,
    DFS,
    Beam,
    MCTS,
};

enum class ConsensusMethod : uint8_t {
    Majority,
    Weighted,
    Debate,
};

enum class DifficultySchedule : uint8_t {
    Linear,
    Exponential,
    Adaptive,
};

inline const char* to_string(Strategy s) {
    switch (s) {
        case Strategy::ZeroShot: return "zero-shot";
        case Strategy::FewShot: return "few-shot";
        case Strategy::SelfConsistency: return "self-consistency";
        case Strategy::LeastToMost: return "least-to-most";
    }
    return "zero-shot";
}

inline const char* to_string(StepType t) {
    switch (t) {
        case StepType::Evidence: return "evidence";
        case StepType::Hypothesis: return "hypothesis";
        case StepType::Deduction: return "deduction";
        case StepType::Conclusion: return "conclusion";
    }
    return "deduction";
}

inline const char* to_string(SearchAlgorithm a) {
    switch (a) {
        case SearchAlgorithm::BFS: return "bfs";
        case SearchAlgorithm::DFS: return "dfs";
        case SearchAlgorithm::Beam: return "beam";
        case SearchAlgorithm::MCTS: return "mcts";
    }
    return "bfs";
}

inline const char* to_string(ConsensusMethod m) {
    switch (m) {
        case ConsensusMethod::Majority: return "majority";
        case ConsensusMethod::Weighted: return "weighted";
        case ConsensusMethod::Debate: return "debate";
    }
    return "majority";
}

inline const char* to_string(DifficultySchedule s) {
    switch (s) {
        case DifficultySchedule::Linear: return "linear";
        case DifficultySchedule::Exponential: return "exponential";
        case DifficultySchedule::Adaptive: return "adaptive";
    }
    return "adaptive";
}

inline std::optional<Strategy> strategy_from_string(const std::string& s) {
    if (s == "zero-shot") return Strategy::ZeroShot;
    if (s == "few-shot") return Strategy::FewShot;
    if (s == "self-consistency") return Strategy::SelfConsistency;
    if (s == "least-to-most") return Strategy::LeastToMost;
    return std::nullopt;
}

inline std::optional<StepType> step_type_from_string(const std::string& s) {
    if (s == "evidence") return StepType::Evidence;
    if (s == "hypothesis") return StepType::Hypothesis;
    if (s == "deduction") return StepType::Deduction;
    if (s == "conclusion") return StepType::Conclusion;
    return std::nullopt;
}

inline std::optional<SearchAlgorithm> search_algorithm_from_string(const std::string& s) {
    if (s == "bfs") return SearchAlgorithm::BFS;
    if (s == "dfs") return SearchAlgorithm::DFS;
    if (s == "beam") return SearchAlgorithm::Beam;
    if (s == "mcts") return SearchAlgorithm::MCTS;
    return std::nullopt;
}

inline std::optional<ConsensusMethod> consensus_method_from_string(const std::string& s) {
    if (s == "majority") return ConsensusMethod::Majority;
    if (s == "weighted") return ConsensusMethod::Weighted;
    if (s == "debate") return ConsensusMethod::Debate;
    return std::nullopt;
}

inline std::optional<DifficultySchedule> schedule_from_string(const std::string& s) {
    if (s == "linear") return DifficultySchedule::Linear;
    if (s == "exponential") return DifficultySchedule::Exponential;
    if (s == "adaptive") return DifficultySchedule::Adaptive;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Chain-of-thought
// ═══════════════════════════════════════════════════════════════════════════

struct ReasoningStep {
    std::string id;
    std::string parent_id;             // Empty for the first step
    StepType type = StepType::Deduction;
    std::string content;
    double confidence = 0.5;           // [0, 1]
    Timestamp timestamp = 0;
};

struct FewShotExample {
    std::string problem;
    std::string reasoning;
    std::string answer;
};

struct ReasonOptions {
    std::optional<Strategy> strategy;
    std::string context;
    std::vector<FewShotExample> examples;
    std::optional<size_t> max_steps;
};

struct ChainResult {
    std::string chain_id;
    std::vector<ReasoningStep> steps;
    std::string conclusion;
    double confidence = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Tree search
// ═══════════════════════════════════════════════════════════════════════════

using Evaluator = std::function<double(const std::string& state)>;

// Proposes up to `count` successor states of a node at `depth`
using Expander = std::function<std::vector<std::string>(
    const std::string& state, size_t depth, size_t count)>;

struct SearchNode {
    std::string id;
    std::string state;
    double score = 0.0;
    size_t depth = 0;
    std::optional<size_t> parent;      // Index into SearchTree::nodes
    std::vector<size_t> children;
    uint32_t visits = 0;
    double total_reward = 0.0;
};

struct SearchTree {
    std::string id;
    SearchAlgorithm algorithm = SearchAlgorithm::BFS;
    std::vector<SearchNode> nodes;     // Creation order, root first
};

struct SearchOptions {
    std::optional<SearchAlgorithm> algorithm;
    size_t max_nodes = 100;
    size_t max_depth = 10;
    std::optional<size_t> beam_width;
    Expander expander;
};

struct SearchResult {
    std::string tree_id;
    std::vector<std::string> best_path;
    double best_score = 0.0;
    size_t nodes_explored = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Monte Carlo rollout
// ═══════════════════════════════════════════════════════════════════════════

struct SimState {
    std::string state_id;
    json data;
    double reward = 0.0;
    bool terminal = false;
    size_t step = 0;
};

using TransitionFn = std::function<std::vector<SimState>(const SimState& state)>;

// Polled between units of work; true stops the run early
using StopCheck = std::function<bool()>;

struct Trajectory {
    std::string id;
    std::vector<SimState> states;      // Includes the initial state
    double total_reward = 0.0;
    size_t steps = 0;
};

struct SimulateOptions {
    std::optional<size_t> num_trajectories;
    size_t max_steps = 20;
    double discount = 1.0;             // 1.0 = undiscounted sum
    StopCheck stop_requested;          // Checked before each trajectory
};

struct SimulationResult {
    std::string simulation_id;
    std::vector<Trajectory> trajectories;   // Descending total_reward
    Trajectory best;
    double expected_reward = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Judge panel
// ═══════════════════════════════════════════════════════════════════════════

// Scores one category of an output in [0, 1]
using Scorer = std::function<double(
    const std::string& output, const std::string& category, const std::string& context)>;

struct JudgeVote {
    std::string judge_id;
    std::map<std::string, double> category_scores;
    double score = 0.0;
    std::string reasoning;
};

struct Evidence {
    std::string content;
    Timestamp added_at = 0;
};

struct Verdict {
    std::string id;
    std::string output;
    bool passed = false;
    double overall_score = 0.0;
    std::map<std::string, double> category_scores;
    double consensus = 0.0;
    ConsensusMethod method = ConsensusMethod::Majority;
    std::vector<JudgeVote> votes;
    std::vector<Evidence> evidence;
    Timestamp timestamp = 0;
};

struct JudgeOptions {
    std::optional<size_t> num_judges;
    ConsensusMethod method = ConsensusMethod::Majority;
    std::string context;
    Scorer scorer;
};

// ═══════════════════════════════════════════════════════════════════════════
// Self-play evolution
// ═══════════════════════════════════════════════════════════════════════════

struct Problem {
    double difficulty = 0.0;
    std::string content;
};

struct SolverOutput {
    double quality = 0.0;
    std::string content;
};

struct Solution {
    size_t problem_index = 0;
    double quality = 0.0;
    std::string content;
};

using Proposer = std::function<std::vector<Problem>(double difficulty, size_t count)>;
using Solver = std::function<SolverOutput(const Problem& problem)>;

struct EvolveOptions {
    double difficulty = 0.5;
    size_t num_problems = 5;
    Proposer proposer;
    Solver solver;
};

struct EvolveLoopOptions {
    size_t max_rounds = 10;
    double initial_difficulty = 0.3;
    DifficultySchedule schedule = DifficultySchedule::Adaptive;
    size_t num_problems = 5;
    Proposer proposer;
    Solver solver;
    StopCheck stop_requested;          // Checked before each round
};

struct EvolutionRound {
    uint64_t round = 0;
    std::vector<Problem> problems;
    std::vector<Solution> solutions;
    double avg_quality = 0.0;
    double best_quality = 0.0;
    double difficulty = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Engine configuration and stats
// ═══════════════════════════════════════════════════════════════════════════

struct ReasoningConfig {
    Strategy default_strategy = Strategy::ZeroShot;
    size_t max_steps_per_chain = 10;
    SearchAlgorithm default_search_algorithm = SearchAlgorithm::BFS;
    size_t default_beam_width = 5;
    double mcts_exploration = 1.414;
    size_t default_judge_count = 3;
    size_t default_trajectories = 10;
    size_t plateau_window = 3;
    double pass_threshold = 0.5;
    double consensus_threshold = 0.5;

    size_t chain_capacity = 500;
    size_t tree_capacity = 200;
    size_t simulation_capacity = 200;
    size_t verdict_capacity = 500;
    size_t evolution_history_capacity = 100;

    uint64_t seed = 0;                 // 0 = seed from std::random_device
    bool verbose = false;
};

struct ReasoningStats {
    bool running = false;
    uint64_t total_chains = 0;
    uint64_t total_steps = 0;
    uint64_t total_searches = 0;
    uint64_t total_simulations = 0;
    uint64_t total_judgements = 0;
    uint64_t total_evolutions = 0;
    double avg_confidence = 0.0;
    double avg_search_nodes = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON views
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const ReasoningStep& s) {
    j = {
        {"id", s.id},
        {"parent_id", s.parent_id.empty() ? json() : json(s.parent_id)},
        {"type", to_string(s.type)},
        {"content", s.content},
        {"confidence", s.confidence},
        {"timestamp", s.timestamp}
    };
}

inline void to_json(json& j, const ChainResult& r) {
    j = {
        {"chain_id", r.chain_id},
        {"steps", r.steps},
        {"conclusion", r.conclusion},
        {"confidence", r.confidence}
    };
}

inline void to_json(json& j, const SearchResult& r) {
    j = {
        {"tree_id", r.tree_id},
        {"best_path", r.best_path},
        {"best_score", r.best_score},
        {"nodes_explored", r.nodes_explored}
    };
}

inline void to_json(json& j, const SearchTree& t) {
    json nodes = json::array();
    for (const auto& n : t.nodes) {
        json children = json::array();
        for (size_t c : n.children) children.push_back(t.nodes[c].id);
        nodes.push_back({
            {"id", n.id},
            {"state", n.state},
            {"score", n.score},
            {"depth", n.depth},
            {"parent_id", n.parent ? json(t.nodes[*n.parent].id) : json()},
            {"children", children},
            {"visits", n.visits},
            {"total_reward", n.total_reward}
        });
    }
    j = {{"id", t.id}, {"algorithm", to_string(t.algorithm)}, {"nodes", nodes}};
}

inline void to_json(json& j, const SimState& s) {
    j = {
        {"state_id", s.state_id},
        {"data", s.data},
        {"reward", s.reward},
        {"terminal", s.terminal},
        {"step", s.step}
    };
}

inline void from_json(const json& j, SimState& s) {
    s.state_id = j.value("state_id", std::string());
    s.data = j.contains("data") ? j.at("data") : json();
    s.reward = j.value("reward", 0.0);
    s.terminal = j.value("terminal", false);
    s.step = j.value("step", size_t{0});
}

inline void to_json(json& j, const Trajectory& t) {
    j = {
        {"id", t.id},
        {"states", t.states},
        {"total_reward", t.total_reward},
        {"steps", t.steps}
    };
}

inline void to_json(json& j, const SimulationResult& r) {
    j = {
        {"simulation_id", r.simulation_id},
        {"trajectories", r.trajectories},
        {"best_trajectory", r.best},
        {"expected_reward", r.expected_reward}
    };
}

inline void to_json(json& j, const JudgeVote& v) {
    j = {
        {"judge_id", v.judge_id},
        {"category_scores", v.category_scores},
        {"score", v.score},
        {"reasoning", v.reasoning}
    };
}

inline void to_json(json& j, const Evidence& e) {
    j = {{"content", e.content}, {"added_at", e.added_at}};
}

inline void to_json(json& j, const Verdict& v) {
    j = {
        {"id", v.id},
        {"output", v.output},
        {"passed", v.passed},
        {"overall_score", v.overall_score},
        {"category_scores", v.category_scores},
        {"consensus", v.consensus},
        {"method", to_string(v.method)},
        {"votes", v.votes},
        {"evidence", v.evidence},
        {"timestamp", v.timestamp}
    };
}

inline void to_json(json& j, const Problem& p) {
    j = {{"difficulty", p.difficulty}, {"content", p.content}};
}

inline void to_json(json& j, const Solution& s) {
    j = {{"problem_index", s.problem_index}, {"quality", s.quality}, {"content", s.content}};
}

inline void to_json(json& j, const EvolutionRound& r) {
    j = {
        {"round", r.round},
        {"problems", r.problems},
        {"solutions", r.solutions},
        {"avg_quality", r.avg_quality},
        {"best_quality", r.best_quality},
        {"difficulty", r.difficulty}
    };
}

inline void to_json(json& j, const ReasoningStats& s) {
    j = {
        {"running", s.running},
        {"total_chains", s.total_chains},
        {"total_steps", s.total_steps},
        {"total_searches", s.total_searches},
        {"total_simulations", s.total_simulations},
        {"total_judgements", s.total_judgements},
        {"total_evolutions", s.total_evolutions},
        {"avg_confidence", s.avg_confidence},
        {"avg_search_nodes", s.avg_search_nodes}
    };
}

} // namespace cortex
