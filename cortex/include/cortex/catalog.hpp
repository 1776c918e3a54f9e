#pragma once
// Primitive catalog: the syscall table layout
//
// 19 primitives in 6 layers. A primitive may depend only on primitives
// from strictly lower layers, so the table is a DAG by construction.
//
//   Layer 0 (Hardware Abstraction): attention
//   Layer 1 (Core Execution):       scale, reason, extend
//   Layer 2 (Memory Subsystem):     retrieve, remember, compress, index, evolve_memory
//   Layer 3 (Reasoning & Search):   search, simulate
//   Layer 4 (Model Lifecycle):      adapt, instruct, distill, align, cascade
//   Layer 5 (Coordination):         route, self_evolve, judge

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cortex {

enum class PrimitiveId : uint8_t {
    Attention = 0,
    Scale,
    Reason,
    Extend,
    Retrieve,
    Remember,
    Compress,
    Index,
    EvolveMemory,
    Search,
    Simulate,
    Adapt,
    Instruct,
    Distill,
    Align,
    Cascade,
    Route,
    SelfEvolve,
    Judge,
};

using Layer = uint8_t;

constexpr size_t PRIMITIVE_COUNT = 19;
constexpr Layer LAYER_COUNT = 6;
constexpr size_t MAX_DEPENDENCIES = 3;

struct PrimitiveMeta {
    PrimitiveId id;
    const char* key;          // Wire name ("evolve_memory")
    const char* name;         // Display name
    Layer layer;
    const char* description;
    std::array<PrimitiveId, MAX_DEPENDENCIES> deps;
    uint8_t dep_count;
};

namespace detail {
using P = PrimitiveId;
}

// Indexed by static_cast<size_t>(PrimitiveId)
inline constexpr std::array<PrimitiveMeta, PRIMITIVE_COUNT> CATALOG = {{
    {detail::P::Attention, "attention", "Attention", 0,
     "Foundational compute primitive", {}, 0},
    {detail::P::Scale, "scale", "Scale", 1,
     "Test-time compute scaling", {detail::P::Attention}, 1},
    {detail::P::Reason, "reason", "Reason", 1,
     "Chain-of-thought reasoning", {detail::P::Attention}, 1},
    {detail::P::Extend, "extend", "Extend", 1,
     "Context window extension", {detail::P::Attention}, 1},
    {detail::P::Retrieve, "retrieve", "Retrieve", 2,
     "Retrieval over context memory", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Remember, "remember", "Remember", 2,
     "Memory storage with Q-value management", {detail::P::Attention}, 1},
    {detail::P::Compress, "compress", "Compress", 2,
     "Context compression into knowledge blocks", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Index, "index", "Index", 2,
     "Keyword indexing for efficient lookup", {detail::P::Attention}, 1},
    {detail::P::EvolveMemory, "evolve_memory", "Evolve Memory", 2,
     "Memory evolution and self-curriculum", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Search, "search", "Search", 3,
     "Tree search over reasoning space",
     {detail::P::Attention, detail::P::Reason, detail::P::Retrieve}, 3},
    {detail::P::Simulate, "simulate", "Simulate", 3,
     "Monte Carlo world-model rollout", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Adapt, "adapt", "Adapt", 4,
     "Adapter management", {detail::P::Attention}, 1},
    {detail::P::Instruct, "instruct", "Instruct", 4,
     "Instruction following", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Distill, "distill", "Distill", 4,
     "Knowledge distillation", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Align, "align", "Align", 4,
     "Preference alignment", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Cascade, "cascade", "Cascade", 4,
     "Confidence-gated model cascade", {detail::P::Attention, detail::P::Reason}, 2},
    {detail::P::Route, "route", "Route", 5,
     "Modality-aware routing",
     {detail::P::Attention, detail::P::Reason, detail::P::Cascade}, 3},
    {detail::P::SelfEvolve, "self_evolve", "Self Evolve", 5,
     "Self-play curriculum evolution",
     {detail::P::Attention, detail::P::Reason, detail::P::Search}, 3},
    {detail::P::Judge, "judge", "Judge", 5,
     "Multi-judge evaluation panel", {detail::P::Attention, detail::P::Reason}, 2},
}};

// Every entry sits at its own index and depends only on lower layers
constexpr bool catalog_is_layered() {
    for (size_t i = 0; i < CATALOG.size(); ++i) {
        const auto& meta = CATALOG[i];
        if (static_cast<size_t>(meta.id) != i) return false;
        if (meta.layer >= LAYER_COUNT) return false;
        for (size_t d = 0; d < meta.dep_count; ++d) {
            const auto& dep = CATALOG[static_cast<size_t>(meta.deps[d])];
            if (dep.layer >= meta.layer) return false;
        }
    }
    return true;
}

static_assert(catalog_is_layered(), "primitive catalog must be a layered DAG");

inline const PrimitiveMeta& meta_of(PrimitiveId id) {
    return CATALOG[static_cast<size_t>(id)];
}

inline Layer layer_of(PrimitiveId id) {
    return meta_of(id).layer;
}

inline std::vector<PrimitiveId> dependencies_of(PrimitiveId id) {
    const auto& meta = meta_of(id);
    return std::vector<PrimitiveId>(meta.deps.begin(), meta.deps.begin() + meta.dep_count);
}

inline std::vector<PrimitiveId> all_primitive_ids() {
    std::vector<PrimitiveId> ids;
    ids.reserve(CATALOG.size());
    for (const auto& meta : CATALOG) {
        ids.push_back(meta.id);
    }
    return ids;
}

inline std::string to_string(PrimitiveId id) {
    return meta_of(id).key;
}

inline std::optional<PrimitiveId> primitive_from_string(std::string_view key) {
    for (const auto& meta : CATALOG) {
        if (key == meta.key) return meta.id;
    }
    return std::nullopt;
}

} // namespace cortex
