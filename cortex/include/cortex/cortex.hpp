#pragma once
// Cortex: the AI kernel
//
// Three components behind one syscall table:
// - Catalog: 19 primitives in 6 layers (static)
// - KernelRegistry: dispatch with enable flags, permits, timeouts, metrics
// - ContextMemoryUnit: STM/LTM with Q-values, compression, keyword index
// - ReasoningEngine: chains, search, rollout, judges, self-play
//
// Kernel owns one of each and wires the local engines into the registry.

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "catalog.hpp"
#include "registry.hpp"
#include "context.hpp"
#include "reasoning.hpp"
#include "config.hpp"
#include "bindings.hpp"
#include <iostream>

namespace cortex {

class Kernel {
public:
    explicit Kernel(CortexConfig config = {})
        : registry_(config.kernel)
        , memory_(config.context)
        , reasoning_(config.reasoning)
        , verbose_(config.kernel.verbose)
    {
        bindings::register_builtin_primitives(registry_, &memory_, &reasoning_);
    }

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Abandoned handler threads still point into memory_ and reasoning_
    ~Kernel() {
        stop();
        registry_.drain();
    }

    // Memory and reasoning first, registry last
    void start() {
        memory_.start();
        reasoning_.start();
        registry_.start();
        if (verbose_) {
            std::cerr << "[Cortex] Kernel " << CORTEX_VERSION << " up, catalog "
                      << version::catalog_version() << ", "
                      << registry_.registered_primitives().size() << " primitives bound\n";
        }
    }

    void stop() {
        registry_.stop();
        reasoning_.stop();
        memory_.stop();
    }

    json call(PrimitiveId id, const json& args) { return registry_.call(id, args); }

    // Dispatch by wire name ("evolve_memory")
    json call(const std::string& primitive, const json& args) {
        auto id = primitive_from_string(primitive);
        if (!id) {
            throw KernelError(ErrorCode::NotRegistered, "Unknown kernel primitive '" + primitive + "'");
        }
        return registry_.call(*id, args);
    }

    KernelRegistry& registry() { return registry_; }
    ContextMemoryUnit& memory() { return memory_; }
    ReasoningEngine& reasoning() { return reasoning_; }

    json stats() const {
        return {
            {"version", CORTEX_VERSION},
            {"catalog_version", version::catalog_version()},
            {"registry", registry_.stats()},
            {"memory", memory_.stats()},
            {"reasoning", reasoning_.stats()}
        };
    }

private:
    // Builtin handlers in registry_ point into memory_ and reasoning_
    KernelRegistry registry_;
    ContextMemoryUnit memory_;
    ReasoningEngine reasoning_;
    bool verbose_;
};

} // namespace cortex
