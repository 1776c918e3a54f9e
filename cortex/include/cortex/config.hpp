#pragma once
// Configuration loading
//
// Each component has a plain config struct with in-class defaults.
// These helpers overlay a JSON object on those defaults. Missing keys
// and keys of the wrong type keep the default; enum-valued options are
// read by name ("beam", "least-to-most", ...).
//
//   {
//     "kernel":    {"max_concurrency": 4, "call_timeout_ms": 5000},
//     "context":   {"stm_capacity": 50, "enable_semantic_index": false},
//     "reasoning": {"default_search_algorithm": "mcts", "seed": 42}
//   }

#include "types.hpp"
#include "registry.hpp"
#include "memory/types.hpp"
#include "reasoning/types.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace cortex {

// Safe parameter access with default
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (params.is_object() && params.contains(key)) {
        try {
            return params[key].get<T>();
        } catch (const json::exception&) {
            return default_val;
        }
    }
    return default_val;
}

// Enum option by name; unknown names keep the default
template<typename E, typename Parse>
inline E get_enum_param(const json& params, const char* key, E default_val, Parse parse) {
    std::string name = get_param<std::string>(params, key, "");
    if (name.empty()) return default_val;
    return parse(name).value_or(default_val);
}

inline KernelConfig kernel_config_from_json(const json& j) {
    KernelConfig c;
    c.max_concurrency = get_param<size_t>(j, "max_concurrency", c.max_concurrency);
    c.call_timeout_ms = get_param<int64_t>(j, "call_timeout_ms", c.call_timeout_ms);
    c.auto_enable = get_param<bool>(j, "auto_enable", c.auto_enable);
    c.tracing = get_param<bool>(j, "tracing", c.tracing);
    c.history_capacity = get_param<size_t>(j, "history_capacity", c.history_capacity);
    c.cancel_on_timeout = get_param<bool>(j, "cancel_on_timeout", c.cancel_on_timeout);
    c.verbose = get_param<bool>(j, "verbose", c.verbose);
    return c;
}

inline ContextConfig context_config_from_json(const json& j) {
    ContextConfig c;
    c.stm_capacity = get_param<size_t>(j, "stm_capacity", c.stm_capacity);
    c.ltm_capacity = get_param<size_t>(j, "ltm_capacity", c.ltm_capacity);
    c.q_learning_rate = get_param<double>(j, "q_learning_rate", c.q_learning_rate);
    c.promotion_q_threshold = get_param<double>(j, "promotion_q_threshold", c.promotion_q_threshold);
    c.enable_semantic_index = get_param<bool>(j, "enable_semantic_index", c.enable_semantic_index);
    c.knowledge_block_capacity = get_param<size_t>(j, "knowledge_block_capacity",
                                                   c.knowledge_block_capacity);
    c.verbose = get_param<bool>(j, "verbose", c.verbose);
    return c;
}

inline ReasoningConfig reasoning_config_from_json(const json& j) {
    ReasoningConfig c;
    c.default_strategy = get_enum_param(j, "default_strategy", c.default_strategy,
                                        strategy_from_string);
    c.max_steps_per_chain = get_param<size_t>(j, "max_steps_per_chain", c.max_steps_per_chain);
    c.default_search_algorithm = get_enum_param(j, "default_search_algorithm",
                                                c.default_search_algorithm,
                                                search_algorithm_from_string);
    c.default_beam_width = get_param<size_t>(j, "default_beam_width", c.default_beam_width);
    c.mcts_exploration = get_param<double>(j, "mcts_exploration", c.mcts_exploration);
    c.default_judge_count = get_param<size_t>(j, "default_judge_count", c.default_judge_count);
    c.default_trajectories = get_param<size_t>(j, "default_trajectories", c.default_trajectories);
    c.plateau_window = get_param<size_t>(j, "plateau_window", c.plateau_window);
    c.pass_threshold = get_param<double>(j, "pass_threshold", c.pass_threshold);
    c.consensus_threshold = get_param<double>(j, "consensus_threshold", c.consensus_threshold);
    c.chain_capacity = get_param<size_t>(j, "chain_capacity", c.chain_capacity);
    c.tree_capacity = get_param<size_t>(j, "tree_capacity", c.tree_capacity);
    c.simulation_capacity = get_param<size_t>(j, "simulation_capacity", c.simulation_capacity);
    c.verdict_capacity = get_param<size_t>(j, "verdict_capacity", c.verdict_capacity);
    c.evolution_history_capacity = get_param<size_t>(j, "evolution_history_capacity",
                                                     c.evolution_history_capacity);
    c.seed = get_param<uint64_t>(j, "seed", c.seed);
    c.verbose = get_param<bool>(j, "verbose", c.verbose);
    return c;
}

struct CortexConfig {
    KernelConfig kernel;
    ContextConfig context;
    ReasoningConfig reasoning;
};

inline CortexConfig config_from_json(const json& j) {
    CortexConfig c;
    json empty = json::object();
    c.kernel = kernel_config_from_json(j.is_object() && j.contains("kernel") ? j["kernel"] : empty);
    c.context = context_config_from_json(j.is_object() && j.contains("context") ? j["context"] : empty);
    c.reasoning = reasoning_config_from_json(
        j.is_object() && j.contains("reasoning") ? j["reasoning"] : empty);
    return c;
}

// Throws std::runtime_error when the file is missing or not valid JSON
inline CortexConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    try {
        return config_from_json(json::parse(in));
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

inline void to_json(json& j, const KernelConfig& c) {
    j = {
        {"max_concurrency", c.max_concurrency},
        {"call_timeout_ms", c.call_timeout_ms},
        {"auto_enable", c.auto_enable},
        {"tracing", c.tracing},
        {"history_capacity", c.history_capacity},
        {"cancel_on_timeout", c.cancel_on_timeout},
        {"verbose", c.verbose}
    };
}

inline void to_json(json& j, const ContextConfig& c) {
    j = {
        {"stm_capacity", c.stm_capacity},
        {"ltm_capacity", c.ltm_capacity},
        {"q_learning_rate", c.q_learning_rate},
        {"promotion_q_threshold", c.promotion_q_threshold},
        {"enable_semantic_index", c.enable_semantic_index},
        {"knowledge_block_capacity", c.knowledge_block_capacity},
        {"verbose", c.verbose}
    };
}

inline void to_json(json& j, const ReasoningConfig& c) {
    j = {
        {"default_strategy", to_string(c.default_strategy)},
        {"max_steps_per_chain", c.max_steps_per_chain},
        {"default_search_algorithm", to_string(c.default_search_algorithm)},
        {"default_beam_width", c.default_beam_width},
        {"mcts_exploration", c.mcts_exploration},
        {"default_judge_count", c.default_judge_count},
        {"default_trajectories", c.default_trajectories},
        {"plateau_window", c.plateau_window},
        {"pass_threshold", c.pass_threshold},
        {"consensus_threshold", c.consensus_threshold},
        {"chain_capacity", c.chain_capacity},
        {"tree_capacity", c.tree_capacity},
        {"simulation_capacity", c.simulation_capacity},
        {"verdict_capacity", c.verdict_capacity},
        {"evolution_history_capacity", c.evolution_history_capacity},
        {"seed", c.seed},
        {"verbose", c.verbose}
    };
}

} // namespace cortex
