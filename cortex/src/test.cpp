#include <cortex/cortex.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include <set>

using namespace cortex;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

template<typename F>
static ErrorCode expect_kernel_error(F&& fn) {
    try {
        fn();
    } catch (const KernelError& e) {
        return e.code();
    }
    assert(false && "expected KernelError");
    return ErrorCode::HandlerError;
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalog
// ═══════════════════════════════════════════════════════════════════════════

void test_catalog_layering() {
    std::cout << "Testing catalog layering..." << std::endl;

    auto ids = all_primitive_ids();
    assert(ids.size() == PRIMITIVE_COUNT);

    for (PrimitiveId id : ids) {
        assert(layer_of(id) < LAYER_COUNT);
        for (PrimitiveId dep : dependencies_of(id)) {
            assert(layer_of(dep) < layer_of(id));
        }
    }

    assert(layer_of(PrimitiveId::Attention) == 0);
    assert(layer_of(PrimitiveId::Reason) == 1);
    assert(layer_of(PrimitiveId::EvolveMemory) == 2);
    assert(layer_of(PrimitiveId::Search) == 3);
    assert(layer_of(PrimitiveId::Cascade) == 4);
    assert(layer_of(PrimitiveId::Judge) == 5);
    assert(dependencies_of(PrimitiveId::Attention).empty());
    assert(dependencies_of(PrimitiveId::Route).size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_catalog_names() {
    std::cout << "Testing catalog names..." << std::endl;

    assert(to_string(PrimitiveId::EvolveMemory) == "evolve_memory");
    assert(to_string(PrimitiveId::SelfEvolve) == "self_evolve");
    for (PrimitiveId id : all_primitive_ids()) {
        auto parsed = primitive_from_string(to_string(id));
        assert(parsed.has_value());
        assert(*parsed == id);
    }
    assert(!primitive_from_string("teleport").has_value());

    assert(version::catalog_compatible(CORTEX_CATALOG_VERSION_MAJOR, 0));
    assert(!version::catalog_compatible(CORTEX_CATALOG_VERSION_MAJOR + 1, 0));
    assert(std::string(error_code_name(ErrorCode::ConcurrencyLimitExceeded)) ==
           "ConcurrencyLimitExceeded");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// KernelRegistry
// ═══════════════════════════════════════════════════════════════════════════

void test_registry_registration() {
    std::cout << "Testing KernelRegistry registration..." << std::endl;

    KernelRegistry registry;
    registry.register_primitive(PrimitiveId::Attention, SimpleHandler([](const json&) { return json(1); }));
    assert(registry.has(PrimitiveId::Attention));
    assert(registry.is_enabled(PrimitiveId::Attention));

    auto code = expect_kernel_error([&] {
        registry.register_primitive(PrimitiveId::Attention, SimpleHandler([](const json&) { return json(2); }));
    });
    assert(code == ErrorCode::DuplicateRegistration);

    auto info = registry.primitive_info(PrimitiveId::Attention);
    assert(info.has_value());
    assert(info->layer == 0);
    assert(info->call_count == 0);

    assert(registry.unregister(PrimitiveId::Attention));
    assert(!registry.unregister(PrimitiveId::Attention));
    assert(!registry.has(PrimitiveId::Attention));
    assert(!registry.primitive_info(PrimitiveId::Attention).has_value());

    KernelConfig manual;
    manual.auto_enable = false;
    KernelRegistry gated(manual);
    gated.register_primitive(PrimitiveId::Scale, SimpleHandler([](const json&) { return json(); }));
    assert(!gated.is_enabled(PrimitiveId::Scale));

    std::cout << "  PASS" << std::endl;
}

void test_registry_enable_disable() {
    std::cout << "Testing KernelRegistry enable/disable..." << std::endl;

    KernelRegistry registry;
    assert(expect_kernel_error([&] { registry.call(PrimitiveId::Reason, json::object()); })
           == ErrorCode::NotRegistered);
    assert(expect_kernel_error([&] { registry.set_enabled(PrimitiveId::Reason, false); })
           == ErrorCode::NotRegistered);

    registry.register_primitive(PrimitiveId::Reason, SimpleHandler([](const json& a) { return a; }));

    std::vector<std::string> seen;
    registry.on("primitive:disabled", [&](const std::string& e, const json&) { seen.push_back(e); });
    registry.on("primitive:enabled", [&](const std::string& e, const json&) { seen.push_back(e); });

    registry.set_enabled(PrimitiveId::Reason, false);
    assert(!registry.is_enabled(PrimitiveId::Reason));
    assert(expect_kernel_error([&] { registry.call(PrimitiveId::Reason, json::object()); })
           == ErrorCode::Disabled);

    registry.set_enabled(PrimitiveId::Reason, true);
    json out = registry.call(PrimitiveId::Reason, {{"x", 1}});
    assert(out["x"] == 1);

    assert(seen.size() == 2);
    assert(seen[0] == "primitive:disabled");
    assert(seen[1] == "primitive:enabled");

    // Rejected calls never reach the budget
    assert(registry.budget().total_calls == 1);

    std::cout << "  PASS" << std::endl;
}

void test_registry_call_events() {
    std::cout << "Testing KernelRegistry call events..." << std::endl;

    KernelRegistry registry;
    registry.register_primitive(PrimitiveId::Attention,
        SimpleHandler([](const json&) { return json{{"attended", 42}}; }));

    std::mutex mu;
    std::vector<std::pair<std::string, std::string>> events;
    auto record = [&](const std::string& e, const json& payload) {
        std::lock_guard<std::mutex> lock(mu);
        events.emplace_back(e, payload.value("primitive", ""));
    };
    registry.on("primitive:called", record);
    registry.on("primitive:completed", record);
    registry.on("primitive:error", record);

    json result = registry.call(PrimitiveId::Attention, {{"tokens", 8}});
    assert(result["attended"] == 42);

    assert(events.size() == 2);
    assert(events[0].first == "primitive:called");
    assert(events[0].second == "attention");
    assert(events[1].first == "primitive:completed");
    assert(events[1].second == "attention");

    std::cout << "  PASS" << std::endl;
}

void test_registry_metrics() {
    std::cout << "Testing KernelRegistry metrics..." << std::endl;

    KernelRegistry registry;
    registry.register_primitive(PrimitiveId::Judge, SimpleHandler([](const json& a) {
        if (a.value("fail", false)) throw std::runtime_error("judge unavailable");
        return json(true);
    }));

    for (int i = 0; i < 3; ++i) {
        registry.call(PrimitiveId::Judge, {{"fail", false}});
    }
    for (int i = 0; i < 2; ++i) {
        try {
            registry.call(PrimitiveId::Judge, {{"fail", true}});
            assert(false);
        } catch (const KernelError& e) {
            assert(e.code() == ErrorCode::HandlerError);
            assert(contains(e.what(), "judge unavailable"));
        }
    }

    auto info = registry.primitive_info(PrimitiveId::Judge);
    assert(info->call_count == 5);
    assert(info->error_count == 2);

    auto budget = registry.budget();
    assert(budget.total_calls == 5);
    assert(budget.calls_by_primitive[PrimitiveId::Judge] == 5);

    auto stats = registry.stats();
    assert(stats.total_calls == 5);
    assert(stats.total_errors == 2);
    assert(std::abs(stats.error_rate - 0.4) < 1e-9);
    assert(stats.call_history.size() == 5);
    assert(stats.call_history[0].success);
    assert(!stats.call_history[4].success);
    assert(stats.call_history[4].error == "judge unavailable");

    json j = stats;
    assert(j["call_history"][0]["primitive"] == "judge");

    std::cout << "  PASS" << std::endl;
}

void test_registry_history_bounded() {
    std::cout << "Testing KernelRegistry history bound..." << std::endl;

    KernelConfig config;
    config.history_capacity = 4;
    KernelRegistry registry(config);
    registry.register_primitive(PrimitiveId::Scale, SimpleHandler([](const json&) { return json(); }));

    for (int i = 0; i < 10; ++i) registry.call(PrimitiveId::Scale, json::object());

    auto stats = registry.stats();
    assert(stats.call_history.size() == 4);
    assert(stats.total_calls == 10);

    KernelConfig untraced;
    untraced.tracing = false;
    KernelRegistry quiet(untraced);
    quiet.register_primitive(PrimitiveId::Scale, SimpleHandler([](const json&) { return json(); }));
    quiet.call(PrimitiveId::Scale, json::object());
    assert(quiet.stats().call_history.empty());
    assert(quiet.stats().total_calls == 1);

    std::cout << "  PASS" << std::endl;
}

void test_registry_concurrency_limit() {
    std::cout << "Testing KernelRegistry concurrency limit..." << std::endl;

    KernelConfig config;
    config.max_concurrency = 1;
    config.call_timeout_ms = 5000;
    KernelRegistry registry(config);

    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    registry.register_primitive(PrimitiveId::Attention, SimpleHandler([&](const json&) {
        started = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return json("done");
    }));

    json first_result;
    std::thread first([&] { first_result = registry.call(PrimitiveId::Attention, json::object()); });

    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(registry.active_calls() == 1);

    auto code = expect_kernel_error([&] { registry.call(PrimitiveId::Attention, json::object()); });
    assert(code == ErrorCode::ConcurrencyLimitExceeded);

    release = true;
    first.join();
    assert(first_result == "done");
    assert(registry.active_calls() == 0);

    json again = registry.call(PrimitiveId::Attention, json::object());
    assert(again == "done");

    std::cout << "  PASS" << std::endl;
}

void test_registry_timeout() {
    std::cout << "Testing KernelRegistry timeout..." << std::endl;

    KernelConfig config;
    config.call_timeout_ms = 50;
    KernelRegistry registry(config);

    // Cooperative handler: runs until the caller gives up
    registry.register_primitive(PrimitiveId::Simulate,
        PrimitiveHandler([](const json&, const CallContext& ctx) {
            while (!ctx.cancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return json("late");
        }));

    auto t0 = std::chrono::steady_clock::now();
    auto code = expect_kernel_error([&] { registry.call(PrimitiveId::Simulate, json::object()); });
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    assert(code == ErrorCode::Timeout);
    assert(elapsed >= 40);
    assert(elapsed < 2000);
    assert(registry.primitive_info(PrimitiveId::Simulate)->error_count == 1);
    assert(registry.active_calls() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // Without cancellation the handler finishes later; its result is dropped
    KernelConfig compat;
    compat.call_timeout_ms = 30;
    compat.cancel_on_timeout = false;
    KernelRegistry legacy(compat);
    legacy.register_primitive(PrimitiveId::Search, SimpleHandler([](const json&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return json("ignored");
    }));

    assert(expect_kernel_error([&] { legacy.call(PrimitiveId::Search, json::object()); })
           == ErrorCode::Timeout);
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    auto info = legacy.primitive_info(PrimitiveId::Search);
    assert(info->call_count == 1);
    assert(info->error_count == 1);
    assert(legacy.stats().call_history.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_initialization_order() {
    std::cout << "Testing initialization order..." << std::endl;

    KernelRegistry registry;
    auto noop = SimpleHandler([](const json&) { return json(); });
    for (PrimitiveId id : {PrimitiveId::Judge, PrimitiveId::Search, PrimitiveId::Retrieve,
                           PrimitiveId::Reason, PrimitiveId::Attention, PrimitiveId::Scale}) {
        registry.register_primitive(id, noop);
    }

    auto order = registry.initialization_order();
    std::vector<PrimitiveId> expected = {
        PrimitiveId::Attention, PrimitiveId::Reason, PrimitiveId::Scale,
        PrimitiveId::Retrieve, PrimitiveId::Search, PrimitiveId::Judge
    };
    assert(order == expected);

    for (size_t i = 0; i < order.size(); ++i) {
        if (i > 0) assert(layer_of(order[i - 1]) <= layer_of(order[i]));
        for (PrimitiveId dep : dependencies_of(order[i])) {
            auto pos = std::find(order.begin(), order.end(), dep);
            if (pos != order.end()) assert(static_cast<size_t>(pos - order.begin()) < i);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_validate_dependencies() {
    std::cout << "Testing dependency validation..." << std::endl;

    KernelRegistry registry;
    auto noop = SimpleHandler([](const json&) { return json(); });
    registry.register_primitive(PrimitiveId::Search, noop);

    auto v = registry.validate_dependencies();
    assert(!v.valid);
    assert(v.missing_dependencies.size() == 1);
    assert(v.missing_dependencies[0].primitive == PrimitiveId::Search);
    assert(v.missing_dependencies[0].missing.size() == 3);
    assert(v.circular_dependencies.empty());

    registry.register_primitive(PrimitiveId::Attention, noop);
    registry.register_primitive(PrimitiveId::Reason, noop);
    registry.register_primitive(PrimitiveId::Retrieve, noop);

    v = registry.validate_dependencies();
    assert(v.valid);
    assert(v.missing_dependencies.empty());

    json j = v;
    assert(j["valid"] == true);

    std::cout << "  PASS" << std::endl;
}

void test_layer_stats() {
    std::cout << "Testing layer stats..." << std::endl;

    KernelRegistry registry;
    registry.register_primitive(PrimitiveId::Attention, SimpleHandler([](const json&) { return json(); }));
    registry.register_primitive(PrimitiveId::Reason, SimpleHandler([](const json&) { return json(); }));
    registry.call(PrimitiveId::Attention, json::object());
    registry.call(PrimitiveId::Attention, json::object());

    auto layers = registry.layer_stats();
    assert(layers.size() == LAYER_COUNT);
    for (Layer l = 0; l < LAYER_COUNT; ++l) assert(layers[l].layer == l);

    assert(layers[0].registered_count == 1);
    assert(layers[0].total_calls == 2);
    assert(layers[1].registered_count == 1);
    assert(layers[1].total_calls == 0);
    assert(layers[3].registered_count == 0);
    assert(layers[5].enabled_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_registry_lifecycle() {
    std::cout << "Testing KernelRegistry lifecycle..." << std::endl;

    KernelRegistry registry;
    int started = 0;
    int stopped = 0;
    registry.on("started", [&](const std::string&, const json&) { started++; });
    auto sub = registry.on("stopped", [&](const std::string&, const json&) { stopped++; });

    registry.start();
    registry.start();
    assert(started == 1);
    assert(registry.is_running());
    assert(registry.stats().running);

    registry.stop();
    assert(stopped == 1);
    assert(registry.off(sub));
    assert(!registry.off(sub));

    registry.start();
    registry.stop();
    assert(started == 2);
    assert(stopped == 1);

    // A throwing listener never breaks dispatch
    registry.register_primitive(PrimitiveId::Attention, SimpleHandler([](const json&) { return json(7); }));
    registry.on("primitive:completed", [](const std::string&, const json&) {
        throw std::runtime_error("listener failure");
    });
    assert(registry.call(PrimitiveId::Attention, json::object()) == 7);

    std::cout << "  PASS" << std::endl;
}

void test_registry_drain() {
    std::cout << "Testing KernelRegistry drain of abandoned handlers..." << std::endl;

    std::atomic<bool> finished{false};
    {
        KernelConfig config;
        config.call_timeout_ms = 10;
        config.cancel_on_timeout = false;
        KernelRegistry registry(config);
        registry.register_primitive(PrimitiveId::Distill, SimpleHandler([&finished](const json&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            finished = true;
            return json();
        }));

        assert(expect_kernel_error([&] { registry.call(PrimitiveId::Distill, json::object()); })
               == ErrorCode::Timeout);
        assert(registry.pending_workers() == 1);
        assert(!finished);

        registry.drain();
        assert(registry.pending_workers() == 0);
        assert(finished);

        // Destruction waits too
        finished = false;
        assert(expect_kernel_error([&] { registry.call(PrimitiveId::Distill, json::object()); })
               == ErrorCode::Timeout);
    }
    assert(finished);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ContextMemoryUnit
// ═══════════════════════════════════════════════════════════════════════════

static StoreOptions with_importance(double importance, Scope scope = Scope::STM) {
    StoreOptions opts;
    opts.scope = scope;
    opts.importance = importance;
    return opts;
}

void test_context_store_update() {
    std::cout << "Testing ContextMemoryUnit store/update..." << std::endl;

    ContextMemoryUnit memory;
    auto first = memory.store("goal", "ship the kernel");
    assert(first.id.rfind("mem_", 0) == 0);
    assert(first.q_value == 0.5);
    assert(first.access_count == 0);

    auto second = memory.store("goal", "ship the kernel today", with_importance(0.8));
    assert(second.id == first.id);
    assert(second.access_count == 1);
    assert(second.q_value == 0.8);
    assert(second.value == "ship the kernel today");

    // Same key in the other tier is a distinct entry
    auto ltm = memory.store("goal", "long term", with_importance(0.6, Scope::LTM));
    assert(ltm.id != first.id);

    auto stats = memory.stats();
    assert(stats.total_stored == 2);
    assert(stats.stm_size == 1);
    assert(stats.ltm_size == 1);

    assert(memory.update(first.id, "shipped"));
    assert(memory.get_by_id(first.id)->value == "shipped");
    assert(!memory.update("mem_missing", 1));

    assert(memory.get_by_key("goal")->id == first.id);
    assert(memory.get_by_key("goal", Scope::LTM)->id == ltm.id);

    assert(memory.discard(first.id));
    assert(!memory.get_by_id(first.id).has_value());
    assert(!memory.discard(first.id));
    assert(!memory.get_by_key("goal", Scope::STM).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_context_eviction() {
    std::cout << "Testing ContextMemoryUnit eviction..." << std::endl;

    ContextConfig config;
    config.stm_capacity = 3;
    ContextMemoryUnit memory(config);

    std::vector<std::string> evicted;
    memory.on("evicted", [&](const std::string&, const json& p) {
        evicted.push_back(p["key"].get<std::string>());
    });

    memory.store("a", 1, with_importance(0.1));
    memory.store("b", 2, with_importance(0.5));
    memory.store("c", 3, with_importance(0.9));
    memory.store("d", 4, with_importance(0.7));

    assert(!memory.get_by_key("a").has_value());
    assert(memory.get_by_key("b").has_value());
    assert(memory.get_by_key("c").has_value());
    assert(memory.get_by_key("d").has_value());
    assert(memory.stats().stm_size == 3);
    assert(memory.stats().total_evicted == 1);
    assert(evicted.size() == 1 && evicted[0] == "a");

    // Equal Q-values: the oldest entry goes first
    ContextConfig tiny;
    tiny.stm_capacity = 2;
    ContextMemoryUnit ties(tiny);
    ties.store("x", 1);
    ties.store("y", 2);
    ties.store("z", 3);
    assert(!ties.get_by_key("x").has_value());
    assert(ties.get_by_key("y").has_value());
    assert(ties.get_by_key("z").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_context_retrieve() {
    std::cout << "Testing ContextMemoryUnit retrieve..." << std::endl;

    ContextMemoryUnit memory;
    StoreOptions geo;
    geo.tags = std::vector<std::string>{"geo"};
    StoreOptions nature;
    nature.tags = std::vector<std::string>{"nature"};
    StoreOptions food;
    food.tags = std::vector<std::string>{"geo", "food"};

    auto capital = memory.store("capital", "Paris is the capital of France", geo);
    memory.store("color", "The sky is blue", nature);
    memory.store("bakery", "Croissant from a Paris bakery", food);

    auto results = memory.retrieve("capital france");
    assert(results.size() == 3);
    assert(results[0].id == capital.id);
    assert(memory.get_by_id(capital.id)->access_count == 1);
    assert(memory.stats().total_retrieved == 3);

    RetrieveOptions top1;
    top1.top_k = 1;
    assert(memory.retrieve("paris", top1).size() == 1);

    RetrieveOptions by_tag;
    by_tag.tags = {"nature"};
    auto tagged = memory.retrieve("paris", by_tag);
    assert(tagged.size() == 1);
    assert(tagged[0].key == "color");

    RetrieveOptions any_of;
    any_of.tags = {"food", "nature"};
    assert(memory.retrieve("", any_of).size() == 2);

    RetrieveOptions strict;
    strict.min_score = 0.99;
    assert(memory.retrieve("paris", strict).empty());

    RetrieveOptions ltm_only;
    ltm_only.scope = ScopeFilter::LTM;
    assert(memory.retrieve("paris", ltm_only).empty());

    std::cout << "  PASS" << std::endl;
}

void test_context_q_promotion() {
    std::cout << "Testing ContextMemoryUnit Q-value promotion..." << std::endl;

    ContextConfig config;
    config.q_learning_rate = 0.5;
    config.promotion_q_threshold = 0.7;
    ContextMemoryUnit memory(config);

    int promotions = 0;
    memory.on("promoted", [&](const std::string&, const json&) { promotions++; });

    auto entry = memory.store("fact", "water boils at 100C", with_importance(0.5));
    assert(memory.update_q_value(entry.id, 1.0));     // 0.75
    assert(memory.update_q_value(entry.id, 1.0));     // 0.875, already in LTM
    assert(memory.update_q_value(entry.id, 1.0));
    assert(promotions == 1);

    auto stored = memory.get_by_id(entry.id);
    assert(stored->scope == Scope::LTM);
    assert(stored->q_value <= 1.0);

    RetrieveOptions ltm;
    ltm.scope = ScopeFilter::LTM;
    auto found = memory.retrieve("fact", ltm);
    assert(found.size() == 1);
    assert(found[0].id == entry.id);

    assert(!memory.update_q_value("mem_missing", 1.0));

    // Negative rewards never push Q below zero
    auto weak = memory.store("noise", "static", with_importance(0.1));
    for (int i = 0; i < 10; ++i) memory.update_q_value(weak.id, -5.0);
    assert(memory.get_by_id(weak.id)->q_value == 0.0);

    auto a = memory.store("p", 1, with_importance(0.2));
    auto b = memory.store("q", 2, with_importance(0.2));
    memory.batch_update_q_values({a.id, b.id}, 1.0);
    assert(std::abs(memory.get_by_id(a.id)->q_value - 0.6) < 1e-9);
    assert(std::abs(memory.get_by_id(b.id)->q_value - 0.6) < 1e-9);

    std::cout << "  PASS" << std::endl;
}

void test_context_promote_demote() {
    std::cout << "Testing ContextMemoryUnit promote/demote..." << std::endl;

    ContextConfig config;
    config.ltm_capacity = 1;
    ContextMemoryUnit memory(config);

    auto keep = memory.store("keep", 1, with_importance(0.3));
    auto other = memory.store("other", 2, with_importance(0.4));

    assert(memory.promote(keep.id));
    assert(!memory.promote(keep.id));
    assert(memory.get_by_key("keep", Scope::LTM).has_value());

    // LTM full: promoting evicts its lowest-Q entry
    assert(memory.promote(other.id));
    assert(!memory.get_by_id(keep.id).has_value());
    assert(memory.stats().ltm_size == 1);

    assert(memory.demote(other.id));
    assert(!memory.demote(other.id));
    assert(memory.get_by_id(other.id)->scope == Scope::STM);

    std::cout << "  PASS" << std::endl;
}

void test_context_compress() {
    std::cout << "Testing ContextMemoryUnit compress..." << std::endl;

    ContextMemoryUnit small;
    for (int i = 0; i < 6; ++i) small.store("k" + std::to_string(i), i);
    assert(!small.compress().has_value());     // floor(1.8) = 1
    assert(small.stats().stm_size == 6);

    ContextMemoryUnit memory;
    std::vector<std::string> ids;
    for (int i = 0; i < 11; ++i) {
        ids.push_back(memory.store("k" + std::to_string(i), "value " + std::to_string(i),
                                   with_importance(0.05 * (i + 1))).id);
    }

    auto block = memory.compress();
    assert(block.has_value());
    assert(block->id.rfind("kb_", 0) == 0);
    assert(block->source_ids.size() == 3);
    std::set<std::string> sources(block->source_ids.begin(), block->source_ids.end());
    assert(sources == std::set<std::string>(ids.begin(), ids.begin() + 3));
    assert(block->compression_ratio == 3.0);
    assert(contains(block->summary, "[k0]: value 0"));

    auto stats = memory.stats();
    assert(stats.stm_size == 8);
    assert(stats.total_compressed == 3);
    assert(stats.knowledge_blocks == 1);
    for (const auto& id : block->source_ids) assert(!memory.get_by_id(id).has_value());

    memory.clear(ScopeFilter::STM);
    assert(memory.stats().stm_size == 0);
    assert(memory.knowledge_blocks().size() == 1);
    memory.clear();
    assert(memory.knowledge_blocks().empty());

    std::cout << "  PASS" << std::endl;
}

void test_context_search_index() {
    std::cout << "Testing ContextMemoryUnit search index..." << std::endl;

    ContextMemoryUnit memory;
    auto ml = memory.store("machine learning", "neural networks learn representations");
    memory.store("cooking", "slow roasted vegetables");

    auto hits = memory.search_index("neural");
    assert(hits.size() == 1);
    assert(hits[0].entry_id == ml.id);
    assert(hits[0].score == 1.0);

    auto partial = memory.search_index("neural pasta");
    assert(partial.size() == 1);
    assert(partial[0].score == 0.5);

    assert(memory.search_index("zz").empty());
    assert(memory.stats().index_size == 2);
    assert(memory.stats().index_terms == 10);

    memory.discard(ml.id);
    assert(memory.search_index("neural").empty());

    ContextConfig off;
    off.enable_semantic_index = false;
    ContextMemoryUnit plain(off);
    plain.store("machine learning", "neural networks");
    assert(plain.search_index("neural").empty());

    std::cout << "  PASS" << std::endl;
}

void test_context_export_import() {
    std::cout << "Testing ContextMemoryUnit export/import..." << std::endl;

    ContextMemoryUnit source;
    source.store("alpha", "first", with_importance(0.6, Scope::LTM));
    source.store("beta", "second", with_importance(0.7, Scope::LTM));
    source.store("scratch", "stm only");

    auto exported = source.export_ltm();
    assert(exported.size() == 2);
    assert(exported[0].key == "alpha");

    ContextMemoryUnit target;
    assert(target.import_ltm(exported) == 2);
    assert(target.import_ltm(exported) == 0);
    assert(target.get_by_key("beta", Scope::LTM)->value == "second");

    // JSON round trip through the persistence view
    json dumped = exported;
    std::vector<MemoryEntry> restored;
    for (const auto& j : dumped) restored.push_back(j.get<MemoryEntry>());
    ContextConfig one;
    one.ltm_capacity = 1;
    ContextMemoryUnit narrow(one);
    assert(narrow.import_ltm(restored) == 1);
    assert(narrow.stats().ltm_size == 1);

    std::cout << "  PASS" << std::endl;
}

void test_context_zero_capacity() {
    std::cout << "Testing ContextMemoryUnit zero capacity..." << std::endl;

    ContextConfig config;
    config.stm_capacity = 0;
    config.ltm_capacity = 0;
    ContextMemoryUnit memory(config);

    memory.store("a", 1);
    memory.store("b", 2);
    auto stats = memory.stats();
    assert(stats.stm_size == 1);
    assert(stats.stm_capacity == 1);
    assert(stats.ltm_capacity == 1);
    assert(!memory.get_by_key("a").has_value());

    auto b = memory.get_by_key("b");
    assert(memory.promote(b->id));
    auto c = memory.store("c", 3);
    assert(memory.promote(c.id));
    stats = memory.stats();
    assert(stats.ltm_size == 1);
    assert(memory.get_by_id(c.id)->scope == Scope::LTM);
    assert(!memory.get_by_id(b->id).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_context_concurrent() {
    std::cout << "Testing ContextMemoryUnit under concurrent use..." << std::endl;

    ContextConfig config;
    config.stm_capacity = 50;
    config.ltm_capacity = 20;
    config.q_learning_rate = 0.5;
    ContextMemoryUnit memory(config);

    const int threads = 4;
    const int per_thread = 100;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&memory, t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                auto entry = memory.store("t" + std::to_string(t) + "_k" + std::to_string(i), i,
                                          with_importance(0.3));
                RetrieveOptions opts;
                opts.top_k = 5;
                memory.retrieve("k", opts);
                if (i % 3 == 0) {
                    memory.update_q_value(entry.id, 1.0);
                    memory.update_q_value(entry.id, 1.0);     // 0.825, promoted
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    auto stats = memory.stats();
    assert(stats.total_stored == threads * per_thread);
    assert(stats.stm_size <= 50);
    assert(stats.ltm_size <= 20);
    assert(stats.ltm_size > 0);
    // Every entry is in exactly one tier or was evicted once
    assert(stats.stm_size + stats.ltm_size + stats.total_evicted == threads * per_thread);
    assert(stats.avg_q_value >= 0.0 && stats.avg_q_value <= 1.0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ReasoningEngine
// ═══════════════════════════════════════════════════════════════════════════

static ReasoningConfig seeded() {
    ReasoningConfig config;
    config.seed = 42;
    return config;
}

static void assert_linked(const std::vector<ReasoningStep>& steps) {
    assert(!steps.empty());
    assert(steps[0].parent_id.empty());
    for (size_t i = 0; i < steps.size(); ++i) {
        assert(steps[i].confidence >= 0.0 && steps[i].confidence <= 1.0);
        if (i > 0) assert(steps[i].parent_id == steps[i - 1].id);
    }
    assert(steps.back().type == StepType::Conclusion);
}

void test_reason_strategies() {
    std::cout << "Testing ReasoningEngine reason..." << std::endl;

    ReasoningEngine engine(seeded());

    ReasonOptions zero;
    zero.context = "Trains leave hourly";
    auto with_context = engine.reason("When is the next train?", zero);
    assert_linked(with_context.steps);
    assert(with_context.steps.size() == 3);
    assert(with_context.steps[0].type == StepType::Evidence);
    assert(contains(with_context.steps[0].content, "Context"));
    assert(with_context.conclusion == with_context.steps.back().content);

    auto bare = engine.reason("What is 2+2?");
    assert_linked(bare.steps);
    assert(bare.steps.size() == 2);
    assert(bare.steps[0].type == StepType::Deduction);

    ReasonOptions few;
    few.strategy = Strategy::FewShot;
    few.examples = {{"2+2", "add", "4"}, {"3+3", "add", "6"}};
    auto few_shot = engine.reason("4+4", few);
    assert_linked(few_shot.steps);
    assert(few_shot.steps.size() >= 3);
    assert(few_shot.steps[0].type == StepType::Evidence);
    assert(few_shot.steps[1].type == StepType::Evidence);

    ReasonOptions sc;
    sc.strategy = Strategy::SelfConsistency;
    auto consistent = engine.reason("Is the bridge safe?", sc);
    assert_linked(consistent.steps);
    assert(consistent.steps.size() == 4);
    for (size_t i = 0; i + 1 < consistent.steps.size(); ++i) {
        assert(consistent.steps[i].type == StepType::Hypothesis);
    }

    ReasonOptions ltm;
    ltm.strategy = Strategy::LeastToMost;
    auto staged = engine.reason("Plan the migration", ltm);
    assert_linked(staged.steps);
    assert(staged.steps.size() == 4);
    assert(staged.steps[1].type == StepType::Deduction);
    assert(staged.confidence == 0.8);

    auto stats = engine.stats();
    assert(stats.total_chains == 5);
    assert(stats.avg_confidence > 0.0 && stats.avg_confidence <= 1.0);

    std::cout << "  PASS" << std::endl;
}

void test_add_step() {
    std::cout << "Testing ReasoningEngine add_step..." << std::endl;

    ReasoningEngine engine(seeded());
    auto chain = engine.reason("Why is the sky blue?");

    auto step = engine.add_step(chain.chain_id, "Rayleigh scattering", StepType::Evidence);
    assert(step.has_value());
    assert(step->parent_id == chain.steps.back().id);

    auto next = engine.add_step(chain.chain_id, "Shorter wavelengths scatter more", StepType::Deduction);
    assert(next->parent_id == step->id);

    auto stored = engine.get_chain(chain.chain_id);
    assert(stored->size() == chain.steps.size() + 2);

    assert(!engine.add_step("chain_missing", "x", StepType::Evidence).has_value());
    assert(!engine.get_chain("chain_missing").has_value());
    assert(engine.stats().total_steps == chain.steps.size() + 2);

    std::cout << "  PASS" << std::endl;
}

void test_search_algorithms() {
    std::cout << "Testing ReasoningEngine search..." << std::endl;

    ReasoningEngine engine(seeded());
    Evaluator evaluator = [](const std::string& s) {
        return static_cast<double>(s.size() % 17) / 17.0;
    };

    for (auto algorithm : {SearchAlgorithm::BFS, SearchAlgorithm::DFS,
                           SearchAlgorithm::Beam, SearchAlgorithm::MCTS}) {
        SearchOptions opts;
        opts.algorithm = algorithm;
        opts.max_nodes = 20;
        opts.max_depth = 4;
        opts.beam_width = 3;

        auto result = engine.search("root", evaluator, opts);
        assert(result.nodes_explored >= 1);
        assert(result.nodes_explored <= 20);
        assert(!result.best_path.empty());
        assert(result.best_path.front() == "root");

        auto tree = engine.get_search_tree(result.tree_id);
        assert(tree.has_value());
        assert(tree->nodes.size() == result.nodes_explored);
        assert(tree->algorithm == algorithm);
        for (const auto& node : tree->nodes) assert(node.depth <= 4);

        SearchOptions single = opts;
        single.max_nodes = 1;
        auto lone = engine.search("root", evaluator, single);
        assert(lone.nodes_explored == 1);
        assert(lone.best_path.size() == 1);
    }

    SearchOptions shallow;
    shallow.max_depth = 1;
    auto flat = engine.search("root", evaluator, shallow);
    assert(flat.nodes_explored == 4);

    assert(engine.stats().total_searches == 9);
    assert(engine.stats().avg_search_nodes > 1.0);
    assert(!engine.get_search_tree("tree_missing").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_search_expander() {
    std::cout << "Testing ReasoningEngine search expander..." << std::endl;

    ReasoningEngine engine(seeded());
    Evaluator count_b = [](const std::string& s) {
        return static_cast<double>(std::count(s.begin(), s.end(), 'b'));
    };

    SearchOptions opts;
    opts.algorithm = SearchAlgorithm::Beam;
    opts.beam_width = 2;
    opts.max_depth = 3;
    opts.expander = [](const std::string& state, size_t, size_t) {
        return std::vector<std::string>{state + "a", state + "b"};
    };

    auto result = engine.search("", count_b, opts);
    assert(result.best_score == 3.0);
    assert(result.best_path.back() == "bbb");
    assert(result.best_path.size() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_simulate() {
    std::cout << "Testing ReasoningEngine simulate..." << std::endl;

    ReasoningEngine engine(seeded());

    SimState initial;
    initial.data = {{"position", 0}};
    TransitionFn walk = [](const SimState& s) {
        SimState good;
        good.data = {{"position", s.data["position"].get<int>() + 1}};
        good.reward = 1.0;
        SimState bad;
        bad.data = {{"position", s.data["position"].get<int>() - 1}};
        bad.reward = -0.5;
        return std::vector<SimState>{good, bad};
    };

    SimulateOptions opts;
    opts.num_trajectories = 8;
    opts.max_steps = 5;
    auto result = engine.simulate(initial, walk, opts);

    assert(result.trajectories.size() == 8);
    assert(result.best.id == result.trajectories[0].id);
    double sum = 0.0;
    for (size_t i = 0; i < result.trajectories.size(); ++i) {
        const auto& t = result.trajectories[i];
        assert(t.states.size() == 6);
        assert(t.steps == t.states.size());
        assert(t.states[0].data["position"] == 0);
        if (i > 0) assert(result.trajectories[i - 1].total_reward >= t.total_reward);
        sum += t.total_reward;
    }
    assert(std::abs(result.expected_reward - sum / 8.0) < 1e-9);

    // Terminal state stops the rollout
    TransitionFn finish = [](const SimState&) {
        SimState end;
        end.reward = 2.0;
        end.terminal = true;
        return std::vector<SimState>{end};
    };
    auto ended = engine.simulate(initial, finish, opts);
    for (const auto& t : ended.trajectories) {
        assert(t.states.size() == 2);
        assert(t.total_reward == 2.0);
    }

    // No candidates: only the initial state
    TransitionFn stuck = [](const SimState&) { return std::vector<SimState>{}; };
    auto idle = engine.simulate(initial, stuck, opts);
    assert(idle.trajectories[0].states.size() == 1);
    assert(idle.expected_reward == 0.0);

    assert(engine.get_simulation(result.simulation_id).has_value());
    assert(engine.stats().total_simulations == 3);

    std::cout << "  PASS" << std::endl;
}

void test_judge() {
    std::cout << "Testing ReasoningEngine judge..." << std::endl;

    ReasoningEngine engine(seeded());
    std::string answer = "The bridge is safe because the load test shows a margin of 40%, "
                         "therefore the result indicates no structural risk.";

    JudgeOptions opts;
    opts.num_judges = 3;
    auto verdict = engine.judge(answer, {"accuracy", "clarity"}, opts);
    assert(verdict.votes.size() == 3);
    assert(verdict.category_scores.size() == 2);
    for (const auto& [_, score] : verdict.category_scores) assert(score >= 0.0 && score <= 1.0);
    assert(verdict.overall_score >= 0.0 && verdict.overall_score <= 1.0);
    assert(verdict.consensus >= 0.0 && verdict.consensus <= 1.0);

    JudgeOptions generous;
    generous.scorer = [](const std::string&, const std::string&, const std::string&) { return 0.9; };
    JudgeOptions harsh;
    harsh.scorer = [](const std::string&, const std::string&, const std::string&) { return 0.1; };

    for (auto method : {ConsensusMethod::Majority, ConsensusMethod::Weighted, ConsensusMethod::Debate}) {
        generous.method = method;
        harsh.method = method;
        assert(engine.judge("fine", {"quality"}, generous).passed);
        assert(!engine.judge("poor", {"quality"}, harsh).passed);
    }

    generous.method = ConsensusMethod::Majority;
    assert(engine.judge("fine", {"quality"}, generous).consensus == 1.0);

    auto overall = engine.judge("short", {}, opts);
    assert(overall.category_scores.count("overall") == 1);

    assert(engine.add_evidence(verdict.id, "independent inspection report"));
    assert(!engine.add_evidence("verdict_missing", "x"));
    auto stored = engine.get_verdict(verdict.id);
    assert(stored->evidence.size() == 1);
    assert(stored->evidence[0].content == "independent inspection report");

    json j = *stored;
    assert(j["votes"].size() == 3);
    assert(j["method"] == "majority");

    std::cout << "  PASS" << std::endl;
}

void test_evolve() {
    std::cout << "Testing ReasoningEngine evolve..." << std::endl;

    ReasoningEngine engine(seeded());

    auto r0 = engine.evolve();
    auto r1 = engine.evolve();
    assert(r0.round == 0);
    assert(r1.round == 1);
    assert(r0.problems.size() == 5);
    assert(r0.solutions.size() == 5);
    for (const auto& s : r0.solutions) {
        assert(s.quality >= 0.0 && s.quality <= 1.0);
        assert(s.quality <= r0.best_quality);
    }

    EvolveOptions empty;
    empty.proposer = [](double, size_t) { return std::vector<Problem>{}; };
    auto nothing = engine.evolve(empty);
    assert(nothing.round == 2);
    assert(nothing.avg_quality == 0.0);
    assert(nothing.best_quality == 0.0);

    EvolveLoopOptions loop;
    loop.max_rounds = 5;
    loop.initial_difficulty = 0.2;
    loop.schedule = DifficultySchedule::Exponential;
    auto rounds = engine.evolve_loop(loop);
    assert(rounds.size() == 5);
    assert(rounds.back().difficulty > rounds.front().difficulty);
    for (size_t i = 1; i < rounds.size(); ++i) assert(rounds[i].round == rounds[i - 1].round + 1);

    assert(engine.evolution_history().size() == 8);
    assert(engine.stats().total_evolutions == 8);

    std::cout << "  PASS" << std::endl;
}

void test_evolve_plateau() {
    std::cout << "Testing ReasoningEngine plateau detection..." << std::endl;

    ReasoningEngine engine(seeded());

    EvolveLoopOptions loop;
    loop.max_rounds = 4;
    loop.initial_difficulty = 0.3;
    loop.schedule = DifficultySchedule::Linear;
    loop.solver = [](const Problem& p) { return SolverOutput{0.5, p.content}; };

    auto rounds = engine.evolve_loop(loop);
    assert(std::abs(rounds[0].difficulty - 0.30) < 1e-9);
    assert(std::abs(rounds[1].difficulty - 0.35) < 1e-9);
    assert(std::abs(rounds[2].difficulty - 0.40) < 1e-9);
    assert(std::abs(rounds[3].difficulty - 0.55) < 1e-9);    // plateau +0.1, linear +0.05

    EvolveLoopOptions adaptive;
    adaptive.max_rounds = 20;
    adaptive.initial_difficulty = 0.5;
    adaptive.solver = [](const Problem& p) { return SolverOutput{0.95, p.content}; };
    auto climbing = engine.evolve_loop(adaptive);
    for (size_t i = 1; i < climbing.size(); ++i) {
        assert(climbing[i].difficulty >= climbing[i - 1].difficulty);
        assert(climbing[i].difficulty <= 1.0);
    }
    assert(climbing.back().difficulty == 1.0);

    std::cout << "  PASS" << std::endl;
}

void test_reasoning_concurrent() {
    std::cout << "Testing ReasoningEngine under concurrent use..." << std::endl;

    ReasoningEngine engine(seeded());

    std::mutex mu;
    std::vector<uint64_t> rounds;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&engine, &mu, &rounds]() {
            for (int i = 0; i < 25; ++i) {
                engine.reason("Parallel question " + std::to_string(i));
                EvolveOptions opts;
                opts.num_problems = 2;
                auto round = engine.evolve(opts);
                std::lock_guard<std::mutex> lock(mu);
                rounds.push_back(round.round);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::sort(rounds.begin(), rounds.end());
    assert(rounds.size() == 100);
    for (size_t i = 0; i < rounds.size(); ++i) assert(rounds[i] == i);

    std::set<uint64_t> recorded;
    for (const auto& round : engine.evolution_history()) recorded.insert(round.round);
    assert(recorded.size() == 100);
    assert(*recorded.begin() == 0 && *recorded.rbegin() == 99);

    auto stats = engine.stats();
    assert(stats.total_chains == 100);
    assert(stats.total_evolutions == 100);
    assert(stats.total_steps == 200);

    std::cout << "  PASS" << std::endl;
}

void test_truncate_utf8() {
    std::cout << "Testing UTF-8 safe truncation..." << std::endl;

    std::string accents;
    for (int i = 0; i < 60; ++i) accents += "\xC3\xA9";      // é

    std::string short_accent = "a\xC3\xA9";
    assert(cortex::truncate(short_accent, 2) == "a");
    assert(cortex::truncate(short_accent, 3) == short_accent);
    assert(cortex::truncate(accents, 99).size() == 98);
    assert(cortex::truncate(std::string("plain"), 3) == "pla");

    ReasoningEngine engine(seeded());
    auto chain = engine.reason("a" + accents);
    std::string dumped = json(chain).dump();
    assert(!dumped.empty());

    ContextMemoryUnit memory;
    for (int i = 0; i < 11; ++i) memory.store("k" + std::to_string(i), accents);
    auto block = memory.compress();
    assert(block.has_value());
    dumped = json(*block).dump();
    assert(contains(dumped, "[k0]: "));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration and kernel
// ═══════════════════════════════════════════════════════════════════════════

void test_config_from_json() {
    std::cout << "Testing config from JSON..." << std::endl;

    json j = {
        {"kernel", {{"max_concurrency", 4}, {"call_timeout_ms", 5000}, {"cancel_on_timeout", false}}},
        {"context", {{"stm_capacity", "lots"}, {"ltm_capacity", 50}, {"enable_semantic_index", false}}},
        {"reasoning", {{"default_search_algorithm", "mcts"}, {"default_strategy", "telepathy"},
                       {"seed", 7}}}
    };

    auto config = config_from_json(j);
    assert(config.kernel.max_concurrency == 4);
    assert(config.kernel.call_timeout_ms == 5000);
    assert(!config.kernel.cancel_on_timeout);
    assert(config.kernel.history_capacity == 1000);
    assert(config.context.stm_capacity == 100);
    assert(config.context.ltm_capacity == 50);
    assert(!config.context.enable_semantic_index);
    assert(config.reasoning.default_search_algorithm == SearchAlgorithm::MCTS);
    assert(config.reasoning.default_strategy == Strategy::ZeroShot);
    assert(config.reasoning.seed == 7);

    auto defaults = config_from_json(json::array());
    assert(defaults.kernel.max_concurrency == 10);
    assert(defaults.reasoning.default_beam_width == 5);

    json dumped = config.reasoning;
    assert(dumped["default_search_algorithm"] == "mcts");

    bool threw = false;
    try {
        load_config("/nonexistent/cortex.json");
    } catch (const std::runtime_error& e) {
        threw = contains(e.what(), "Cannot open config file");
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_kernel_end_to_end() {
    std::cout << "Testing Kernel end-to-end..." << std::endl;

    CortexConfig config;
    config.reasoning.seed = 1234;
    Kernel kernel(config);
    kernel.start();

    assert(expect_kernel_error([&] { kernel.call("attention", json::object()); })
           == ErrorCode::NotRegistered);
    assert(expect_kernel_error([&] { kernel.call("teleport", json::object()); })
           == ErrorCode::NotRegistered);

    // Only attention is left for an external model
    auto validation = kernel.registry().validate_dependencies();
    assert(!validation.valid);
    kernel.registry().register_primitive(PrimitiveId::Attention,
        SimpleHandler([](const json& a) { return json{{"echo", a}}; }));
    assert(kernel.registry().validate_dependencies().valid);
    assert(kernel.call("attention", {{"x", 1}})["echo"]["x"] == 1);

    json stored = kernel.call("remember", {{"key", "deadline"}, {"value", "release on friday"},
                                           {"importance", 0.6}, {"tags", json::array({"plan"})}});
    assert(stored["key"] == "deadline");
    std::string id = stored["id"];

    json found = kernel.call("retrieve", {{"query", "release friday"}, {"top_k", 1}});
    assert(found.is_array() && found.size() == 1);
    assert(found[0]["id"] == id);

    json rewarded = kernel.call("remember", {{"action", "reward"}, {"id", id}, {"reward", 1.0}});
    assert(rewarded["ok"] == true);

    json hits = kernel.call("index", {{"query", "deadline"}});
    assert(hits.size() == 1);

    assert(kernel.call("compress", json::object()).is_null());

    json evolved_memory = kernel.call("evolve_memory", {{"ids", json::array({id})}, {"reward", 0.0}});
    assert(evolved_memory["updated"] == 1);

    json chain = kernel.call("reason", {{"problem", "Should we ship?"}, {"strategy", "least-to-most"}});
    assert(chain["steps"].back()["type"] == "conclusion");

    json appended = kernel.call("reason", {{"chain_id", chain["chain_id"]},
                                           {"content", "Rollback plan is ready"},
                                           {"type", "evidence"}});
    assert(appended["type"] == "evidence");
    assert(appended["parent_id"] == chain["steps"].back()["id"]);
    try {
        kernel.call("reason", {{"chain_id", chain["chain_id"]}, {"content", "x"}, {"type", "guess"}});
        assert(false);
    } catch (const KernelError& e) {
        assert(contains(e.what(), "Unknown step type: guess"));
    }

    json searched = kernel.call("search", {{"problem", "route"}, {"algorithm", "beam"},
                                           {"max_nodes", 10}, {"goal", "route"}});
    assert(searched["nodes_explored"].get<size_t>() <= 10);

    json simulated = kernel.call("simulate", {
        {"initial", {{"reward", 0}}},
        {"transitions", json::array({{{"reward", 1.0}, {"terminal", true}}})},
        {"num_trajectories", 3}
    });
    assert(simulated["trajectories"].size() == 3);
    assert(simulated["best_trajectory"]["total_reward"] == 1.0);

    json verdict = kernel.call("judge", {{"output", "It works because the tests pass"},
                                         {"categories", json::array({"correctness"})}, {"method", "debate"}});
    assert(verdict.contains("passed"));
    assert(verdict["method"] == "debate");

    json rounds = kernel.call("self_evolve", {{"max_rounds", 2}, {"schedule", "linear"}});
    assert(rounds.size() == 2);

    try {
        kernel.call("remember", {{"action", "teleport"}, {"id", id}});
        assert(false);
    } catch (const KernelError& e) {
        assert(e.code() == ErrorCode::HandlerError);
        assert(contains(e.what(), "Unknown remember action"));
    }
    try {
        kernel.call("retrieve", json::object());
        assert(false);
    } catch (const KernelError& e) {
        assert(e.code() == ErrorCode::HandlerError);
        assert(contains(e.what(), "Missing required parameter: query"));
    }

    json stats = kernel.stats();
    assert(stats["registry"]["registered_primitives"] == 11);
    assert(stats["memory"]["total_stored"] == 1);
    assert(stats["reasoning"]["total_chains"] == 1);
    assert(stats["registry"]["running"] == true);

    auto order = kernel.registry().initialization_order();
    assert(order.front() == PrimitiveId::Attention);

    kernel.stop();
    assert(!kernel.registry().is_running());

    std::cout << "  PASS" << std::endl;
}

void test_kernel_teardown_after_timeout() {
    std::cout << "Testing Kernel teardown after a timed-out call..." << std::endl;

    CortexConfig config;
    config.kernel.call_timeout_ms = 20;
    config.reasoning.seed = 9;

    {
        Kernel kernel(config);
        assert(expect_kernel_error([&] { kernel.call("self_evolve", {{"max_rounds", 200000}}); })
               == ErrorCode::Timeout);
        kernel.registry().drain();
        assert(kernel.registry().pending_workers() == 0);
        assert(kernel.reasoning().stats().total_evolutions < 200000);
    }

    // Kernel goes out of scope with the worker still running
    {
        Kernel kernel(config);
        assert(expect_kernel_error([&] {
            kernel.call("simulate", {
                {"initial", {{"reward", 0}}},
                {"transitions", json::array({{{"reward", 0.5}}})},
                {"num_trajectories", 100000},
                {"max_steps", 50}
            });
        }) == ErrorCode::Timeout);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Cortex Kernel Tests ===" << std::endl;
    std::cout << "Version " << CORTEX_VERSION << ", catalog " << version::catalog_version() << std::endl;
    std::cout << std::endl;

    test_catalog_layering();
    test_catalog_names();

    std::cout << std::endl;
    std::cout << "=== KernelRegistry ===" << std::endl;
    test_registry_registration();
    test_registry_enable_disable();
    test_registry_call_events();
    test_registry_metrics();
    test_registry_history_bounded();
    test_registry_concurrency_limit();
    test_registry_timeout();
    test_initialization_order();
    test_validate_dependencies();
    test_layer_stats();
    test_registry_lifecycle();
    test_registry_drain();

    std::cout << std::endl;
    std::cout << "=== ContextMemoryUnit ===" << std::endl;
    test_context_store_update();
    test_context_eviction();
    test_context_retrieve();
    test_context_q_promotion();
    test_context_promote_demote();
    test_context_compress();
    test_context_search_index();
    test_context_export_import();
    test_context_zero_capacity();
    test_context_concurrent();

    std::cout << std::endl;
    std::cout << "=== ReasoningEngine ===" << std::endl;
    test_reason_strategies();
    test_add_step();
    test_search_algorithms();
    test_search_expander();
    test_simulate();
    test_judge();
    test_evolve();
    test_evolve_plateau();
    test_reasoning_concurrent();
    test_truncate_utf8();

    std::cout << std::endl;
    std::cout << "=== Kernel ===" << std::endl;
    test_config_from_json();
    test_kernel_end_to_end();
    test_kernel_teardown_after_timeout();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
