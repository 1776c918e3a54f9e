#pragma once
// Builtin bindings: memory and reasoning operations as kernel primitives
//
// Layer 2 and the reasoning-backed primitives of layers 1, 3 and 5 are
// served by the local engines. The rest (attention, scale, the model
// lifecycle layer, route) are left for external handlers.
//
//   retrieve       ContextMemoryUnit::retrieve
//   remember       store / update / discard / reward / promote / demote
//   compress       ContextMemoryUnit::compress
//   index          ContextMemoryUnit::search_index
//   evolve_memory  batch Q-value update
//   reason         ReasoningEngine::reason, or add_step when chain_id is given
//   search         ReasoningEngine::search
//   simulate       ReasoningEngine::simulate
//   judge          ReasoningEngine::judge
//   self_evolve    ReasoningEngine::evolve_loop
//
// Handlers keep raw pointers; the owner must drain the registry before
// the engines are destroyed. Long-running handlers poll the CallContext
// and stop once the call has been abandoned.

#include "types.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "context.hpp"
#include "reasoning.hpp"
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace cortex::bindings {

// Throws std::invalid_argument naming the first missing parameter
inline void validate_required(const json& args, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!args.is_object() || !args.contains(key)) {
            throw std::invalid_argument(std::string("Missing required parameter: ") + key);
        }
    }
}

inline std::vector<std::string> get_strings(const json& args, const char* key) {
    std::vector<std::string> out;
    if (!args.is_object() || !args.contains(key) || !args[key].is_array()) return out;
    for (const auto& item : args[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Memory primitives
// ═══════════════════════════════════════════════════════════════════════════

namespace memory {

inline json retrieve(ContextMemoryUnit* mem, const json& args) {
    validate_required(args, {"query"});

    RetrieveOptions opts;
    opts.scope = get_enum_param(args, "scope", ScopeFilter::All, scope_filter_from_string);
    opts.tags = get_strings(args, "tags");
    opts.min_score = get_param<double>(args, "min_score", 0.0);
    if (args.contains("top_k")) opts.top_k = get_param<size_t>(args, "top_k", 10);

    return mem->retrieve(args["query"].get<std::string>(), opts);
}

inline json remember(ContextMemoryUnit* mem, const json& args) {
    std::string action = get_param<std::string>(args, "action", "store");

    if (action == "store") {
        validate_required(args, {"key", "value"});
        StoreOptions opts;
        opts.scope = get_enum_param(args, "scope", Scope::STM, scope_from_string);
        if (args.contains("tags")) opts.tags = get_strings(args, "tags");
        if (args.contains("importance")) opts.importance = get_param<double>(args, "importance", 0.5);
        return mem->store(args["key"].get<std::string>(), args["value"], opts);
    }

    validate_required(args, {"id"});
    std::string id = args["id"].get<std::string>();
    bool ok;
    if (action == "update") {
        validate_required(args, {"value"});
        ok = mem->update(id, args["value"]);
    } else if (action == "discard") {
        ok = mem->discard(id);
    } else if (action == "reward") {
        validate_required(args, {"reward"});
        ok = mem->update_q_value(id, get_param<double>(args, "reward", 0.0));
    } else if (action == "promote") {
        ok = mem->promote(id);
    } else if (action == "demote") {
        ok = mem->demote(id);
    } else {
        throw std::invalid_argument("Unknown remember action: " + action);
    }
    return {{"id", id}, {"action", action}, {"ok", ok}};
}

inline json compress(ContextMemoryUnit* mem, const json&) {
    auto block = mem->compress();
    return block ? json(*block) : json();
}

inline json index(ContextMemoryUnit* mem, const json& args) {
    validate_required(args, {"query"});
    return mem->search_index(args["query"].get<std::string>(), get_param<size_t>(args, "top_k", 5));
}

inline json evolve_memory(ContextMemoryUnit* mem, const json& args) {
    validate_required(args, {"ids", "reward"});
    auto ids = get_strings(args, "ids");
    mem->batch_update_q_values(ids, get_param<double>(args, "reward", 0.0));
    return {{"updated", ids.size()}, {"stats", mem->stats()}};
}

inline void register_handlers(KernelRegistry& registry, ContextMemoryUnit* mem) {
    registry.register_primitive(PrimitiveId::Retrieve, SimpleHandler([mem](const json& a) { return retrieve(mem, a); }));
    registry.register_primitive(PrimitiveId::Remember, SimpleHandler([mem](const json& a) { return remember(mem, a); }));
    registry.register_primitive(PrimitiveId::Compress, SimpleHandler([mem](const json& a) { return compress(mem, a); }));
    registry.register_primitive(PrimitiveId::Index, SimpleHandler([mem](const json& a) { return index(mem, a); }));
    registry.register_primitive(PrimitiveId::EvolveMemory, SimpleHandler([mem](const json& a) { return evolve_memory(mem, a); }));
}

} // namespace memory

// ═══════════════════════════════════════════════════════════════════════════
// Reasoning primitives
// ═══════════════════════════════════════════════════════════════════════════

namespace reasoning {

// {"chain_id", "content", "type"} appends a step to an existing chain
inline json append_step(ReasoningEngine* engine, const json& args) {
    validate_required(args, {"chain_id", "content"});

    std::string type_name = get_param<std::string>(args, "type", "deduction");
    auto type = step_type_from_string(type_name);
    if (!type) {
        throw std::invalid_argument("Unknown step type: " + type_name);
    }

    std::string chain_id = args["chain_id"].get<std::string>();
    auto step = engine->add_step(chain_id, args["content"].get<std::string>(), *type);
    if (!step) {
        throw std::invalid_argument("Unknown chain: " + chain_id);
    }
    return *step;
}

inline json reason(ReasoningEngine* engine, const json& args) {
    if (args.is_object() && args.contains("chain_id")) return append_step(engine, args);
    validate_required(args, {"problem"});

    ReasonOptions opts;
    if (args.contains("strategy")) {
        opts.strategy = get_enum_param(args, "strategy", engine->config().default_strategy,
                                       strategy_from_string);
    }
    opts.context = get_param<std::string>(args, "context", "");
    if (args.contains("max_steps")) {
        opts.max_steps = get_param<size_t>(args, "max_steps", engine->config().max_steps_per_chain);
    }
    if (args.contains("examples") && args["examples"].is_array()) {
        for (const auto& ex : args["examples"]) {
            opts.examples.push_back({
                get_param<std::string>(ex, "problem", ""),
                get_param<std::string>(ex, "reasoning", ""),
                get_param<std::string>(ex, "answer", "")
            });
        }
    }
    return engine->reason(args["problem"].get<std::string>(), opts);
}

// States are scored against the optional "goal" text
inline json search(ReasoningEngine* engine, const json& args) {
    validate_required(args, {"problem"});

    SearchOptions opts;
    if (args.contains("algorithm")) {
        opts.algorithm = get_enum_param(args, "algorithm", engine->config().default_search_algorithm,
                                        search_algorithm_from_string);
    }
    opts.max_nodes = get_param<size_t>(args, "max_nodes", opts.max_nodes);
    opts.max_depth = get_param<size_t>(args, "max_depth", opts.max_depth);
    if (args.contains("beam_width")) {
        opts.beam_width = get_param<size_t>(args, "beam_width", engine->config().default_beam_width);
    }

    std::string goal = get_param<std::string>(args, "goal", "");
    Evaluator evaluator = [goal](const std::string& state) {
        return heuristic_score(state, "", goal);
    };
    return engine->search(args["problem"].get<std::string>(), evaluator, opts);
}

// Every non-terminal state offers the same "transitions" candidates
inline json simulate(ReasoningEngine* engine, const json& args, const CallContext& ctx) {
    validate_required(args, {"initial", "transitions"});

    SimState initial = args["initial"].get<SimState>();
    std::vector<SimState> candidates;
    if (args["transitions"].is_array()) {
        for (const auto& t : args["transitions"]) candidates.push_back(t.get<SimState>());
    }

    SimulateOptions opts;
    if (args.contains("num_trajectories")) {
        opts.num_trajectories = get_param<size_t>(args, "num_trajectories",
                                                  engine->config().default_trajectories);
    }
    opts.max_steps = get_param<size_t>(args, "max_steps", opts.max_steps);
    opts.discount = get_param<double>(args, "discount", opts.discount);
    opts.stop_requested = [ctx]() { return ctx.cancelled(); };

    TransitionFn transition = [candidates](const SimState&) { return candidates; };
    return engine->simulate(initial, transition, opts);
}

inline json judge(ReasoningEngine* engine, const json& args) {
    validate_required(args, {"output"});

    JudgeOptions opts;
    if (args.contains("num_judges")) {
        opts.num_judges = get_param<size_t>(args, "num_judges", engine->config().default_judge_count);
    }
    opts.method = get_enum_param(args, "method", ConsensusMethod::Majority,
                                 consensus_method_from_string);
    opts.context = get_param<std::string>(args, "context", "");

    return engine->judge(args["output"].get<std::string>(), get_strings(args, "categories"), opts);
}

inline json self_evolve(ReasoningEngine* engine, const json& args, const CallContext& ctx) {
    EvolveLoopOptions opts;
    opts.max_rounds = get_param<size_t>(args, "max_rounds", opts.max_rounds);
    opts.initial_difficulty = get_param<double>(args, "initial_difficulty", opts.initial_difficulty);
    opts.schedule = get_enum_param(args, "schedule", opts.schedule, schedule_from_string);
    opts.num_problems = get_param<size_t>(args, "num_problems", opts.num_problems);
    opts.stop_requested = [ctx]() { return ctx.cancelled(); };
    return engine->evolve_loop(opts);
}

inline void register_handlers(KernelRegistry& registry, ReasoningEngine* engine) {
    registry.register_primitive(PrimitiveId::Reason, SimpleHandler([engine](const json& a) { return reason(engine, a); }));
    registry.register_primitive(PrimitiveId::Search, SimpleHandler([engine](const json& a) { return search(engine, a); }));
    registry.register_primitive(PrimitiveId::Simulate, PrimitiveHandler(
        [engine](const json& a, const CallContext& ctx) { return simulate(engine, a, ctx); }));
    registry.register_primitive(PrimitiveId::Judge, SimpleHandler([engine](const json& a) { return judge(engine, a); }));
    registry.register_primitive(PrimitiveId::SelfEvolve, PrimitiveHandler(
        [engine](const json& a, const CallContext& ctx) { return self_evolve(engine, a, ctx); }));
}

} // namespace reasoning

inline void register_builtin_primitives(KernelRegistry& registry, ContextMemoryUnit* mem,
                                        ReasoningEngine* engine) {
    memory::register_handlers(registry, mem);
    reasoning::register_handlers(registry, engine);
}

} // namespace cortex::bindings
