#pragma once
// KernelRegistry: the syscall table
//
// Every AI operation goes through a registered primitive. The registry
// owns the handler bindings and enforces the dispatch policy around them:
//   - enable/disable per primitive
//   - one registry-wide pool of max_concurrency permits (fail-fast, never queues)
//   - a per-call timeout raced against the handler
//   - per-primitive metrics, a budget, and a bounded call history
//
// Handlers run on a worker thread with the registry lock released, so a
// slow handler never blocks unrelated registry operations. A handler that
// loses the race against the timer keeps running; its result is dropped
// and its CallContext is marked cancelled. Destruction waits for every
// worker, abandoned ones included.

#include "types.hpp"
#include "catalog.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "bounded.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

namespace cortex {

// Per-call context handed to handlers
struct CallContext {
    PrimitiveId primitive = PrimitiveId::Attention;
    std::string call_id;
    std::shared_ptr<std::atomic<bool>> cancel_flag;

    // True once the caller gave up on this call (timeout)
    bool cancelled() const {
        return cancel_flag && cancel_flag->load();
    }
};

using PrimitiveHandler = std::function<json(const json& args, const CallContext& ctx)>;
using SimpleHandler = std::function<json(const json& args)>;

struct KernelConfig {
    size_t max_concurrency = 10;         // Simultaneous in-flight calls
    int64_t call_timeout_ms = 30000;     // <= 0 disables the timer
    bool auto_enable = true;             // New registrations start enabled
    bool tracing = true;                 // Record call history
    size_t history_capacity = 1000;      // Call history ring size
    bool cancel_on_timeout = true;       // Signal CallContext on timeout
    bool verbose = false;                // Log lifecycle to stderr
};

struct CallRecord {
    PrimitiveId primitive;
    std::string call_id;
    Timestamp timestamp;
    double duration_ms;
    bool success;
    std::string error;
};

struct KernelBudget {
    uint64_t total_calls = 0;
    std::map<PrimitiveId, uint64_t> calls_by_primitive;
};

struct MissingDependency {
    PrimitiveId primitive;
    std::vector<PrimitiveId> missing;
};

struct DependencyValidation {
    bool valid = true;
    std::vector<MissingDependency> missing_dependencies;
    std::vector<std::vector<PrimitiveId>> circular_dependencies;
};

struct LayerStats {
    Layer layer = 0;
    size_t registered_count = 0;
    size_t enabled_count = 0;
    uint64_t total_calls = 0;
    double avg_duration_ms = 0.0;
    double error_rate = 0.0;
};

struct PrimitiveInfo {
    PrimitiveId id;
    Layer layer;
    bool enabled;
    uint64_t call_count;
    uint64_t error_count;
    double avg_duration_ms;
    Timestamp registered_at;
};

struct RegistryStats {
    bool running = false;
    size_t registered_primitives = 0;
    size_t enabled_primitives = 0;
    uint64_t total_calls = 0;
    uint64_t total_errors = 0;
    double error_rate = 0.0;
    double avg_call_duration_ms = 0.0;
    std::vector<CallRecord> call_history;
    std::vector<LayerStats> layer_stats;
};

class KernelRegistry {
public:
    explicit KernelRegistry(KernelConfig config = {})
        : config_(std::move(config))
        , events_("KernelRegistry")
        , history_(config_.history_capacity)
        , workers_(std::make_shared<WorkerCount>())
    {}

    ~KernelRegistry() { drain(); }

    KernelRegistry(const KernelRegistry&) = delete;
    KernelRegistry& operator=(const KernelRegistry&) = delete;

    // ═══════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════

    void start() {
        if (running_.exchange(true)) return;
        if (config_.verbose) std::cerr << "[KernelRegistry] Started\n";
        events_.emit("started", {{"timestamp", now()}});
    }

    void stop() {
        if (!running_.exchange(false)) return;
        if (config_.verbose) std::cerr << "[KernelRegistry] Stopped\n";
        events_.emit("stopped", {{"timestamp", now()}});
    }

    bool is_running() const { return running_; }

    SubscriptionId on(const std::string& event, EventCallback callback) {
        return events_.on(event, std::move(callback));
    }

    bool off(SubscriptionId id) { return events_.off(id); }

    const KernelConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════
    // Registration
    // ═══════════════════════════════════════════════════════════════════

    void register_primitive(PrimitiveId id, PrimitiveHandler handler) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (primitives_.count(id)) {
                throw KernelError(ErrorCode::DuplicateRegistration,
                    "Kernel primitive '" + to_string(id) + "' is already registered");
            }

            Registration reg;
            reg.handler = std::make_shared<const PrimitiveHandler>(std::move(handler));
            reg.enabled = config_.auto_enable;
            reg.registered_at = now();
            primitives_.emplace(id, std::move(reg));
        }

        if (config_.verbose) {
            std::cerr << "[KernelRegistry] Registered " << to_string(id)
                      << " (layer " << static_cast<int>(layer_of(id)) << ")\n";
        }
        events_.emit("primitive:registered", {
            {"primitive", to_string(id)},
            {"layer", layer_of(id)},
            {"timestamp", now()}
        });
    }

    void register_primitive(PrimitiveId id, SimpleHandler handler) {
        register_primitive(id, PrimitiveHandler(
            [fn = std::move(handler)](const json& args, const CallContext&) {
                return fn(args);
            }));
    }

    bool unregister(PrimitiveId id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (primitives_.erase(id) == 0) return false;
        }
        events_.emit("primitive:unregistered", {
            {"primitive", to_string(id)},
            {"timestamp", now()}
        });
        return true;
    }

    bool has(PrimitiveId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return primitives_.count(id) > 0;
    }

    void set_enabled(PrimitiveId id, bool enabled) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = primitives_.find(id);
            if (it == primitives_.end()) {
                throw KernelError(ErrorCode::NotRegistered,
                    "Kernel primitive '" + to_string(id) + "' is not registered");
            }
            it->second.enabled = enabled;
        }
        events_.emit(enabled ? "primitive:enabled" : "primitive:disabled", {
            {"primitive", to_string(id)},
            {"timestamp", now()}
        });
    }

    bool is_enabled(PrimitiveId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = primitives_.find(id);
        return it != primitives_.end() && it->second.enabled;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Dispatch
    // ═══════════════════════════════════════════════════════════════════

    json call(PrimitiveId id, const json& args) {
        std::shared_ptr<const PrimitiveHandler> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = primitives_.find(id);
            if (it == primitives_.end()) {
                throw KernelError(ErrorCode::NotRegistered,
                    "Kernel primitive '" + to_string(id) + "' is not registered");
            }
            if (!it->second.enabled) {
                throw KernelError(ErrorCode::Disabled,
                    "Kernel primitive '" + to_string(id) + "' is disabled");
            }
            handler = it->second.handler;
        }

        if (!try_acquire_permit()) {
            throw KernelError(ErrorCode::ConcurrencyLimitExceeded,
                "Kernel concurrency limit reached (" + std::to_string(config_.max_concurrency) +
                "). Cannot call '" + to_string(id) + "'");
        }
        PermitGuard permit(active_calls_);

        CallContext ctx;
        ctx.primitive = id;
        ctx.call_id = generate_id("call");
        ctx.cancel_flag = std::make_shared<std::atomic<bool>>(false);

        Timestamp started_at = now();
        double start = monotonic_ms();

        events_.emit("primitive:called", {
            {"primitive", to_string(id)},
            {"call_id", ctx.call_id},
            {"timestamp", started_at}
        });

        auto outcome = run_with_timeout(handler, args, ctx);
        double duration_ms = monotonic_ms() - start;

        bool success = !outcome.timed_out && !outcome.failed;
        std::string error_message;
        if (outcome.timed_out) {
            error_message = "Kernel call '" + to_string(id) + "' timed out after " +
                            std::to_string(config_.call_timeout_ms) + "ms";
        } else if (outcome.failed) {
            error_message = outcome.error;
        }

        record_attempt(id, ctx.call_id, started_at, duration_ms, success, error_message);
        permit.release();

        if (success) {
            events_.emit("primitive:completed", {
                {"primitive", to_string(id)},
                {"call_id", ctx.call_id},
                {"duration_ms", duration_ms},
                {"timestamp", now()}
            });
            return std::move(outcome.result);
        }

        std::cerr << "[KernelRegistry] " << to_string(id) << " failed: " << error_message << "\n";
        events_.emit("primitive:error", {
            {"primitive", to_string(id)},
            {"call_id", ctx.call_id},
            {"error", error_message},
            {"timestamp", now()}
        });

        throw KernelError(outcome.timed_out ? ErrorCode::Timeout : ErrorCode::HandlerError,
                          error_message);
    }

    // Number of calls currently holding a permit
    size_t active_calls() const { return active_calls_.load(); }

    // Handler threads still running, including ones abandoned on timeout
    size_t pending_workers() const {
        std::lock_guard<std::mutex> lock(workers_->mutex);
        return workers_->running;
    }

    // Blocks until every handler thread has returned. Must not be called
    // from inside a handler.
    void drain() {
        std::unique_lock<std::mutex> lock(workers_->mutex);
        workers_->cv.wait(lock, [this]() { return workers_->running == 0; });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Dependency graph
    // ═══════════════════════════════════════════════════════════════════

    DependencyValidation validate_dependencies() const {
        DependencyValidation validation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, _] : primitives_) {
                MissingDependency entry{id, {}};
                for (PrimitiveId dep : dependencies_of(id)) {
                    if (!primitives_.count(dep)) entry.missing.push_back(dep);
                }
                if (!entry.missing.empty()) {
                    validation.missing_dependencies.push_back(std::move(entry));
                }
            }
            validation.circular_dependencies = detect_cycles();
        }

        validation.valid = validation.missing_dependencies.empty() &&
                           validation.circular_dependencies.empty();

        events_.emit("dependency:validated", {
            {"valid", validation.valid},
            {"timestamp", now()}
        });
        return validation;
    }

    // Lower layers first, then by name; registered dependencies always
    // precede their dependents
    std::vector<PrimitiveId> initialization_order() const {
        std::vector<PrimitiveId> sorted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, _] : primitives_) sorted.push_back(id);
        }

        std::sort(sorted.begin(), sorted.end(), [](PrimitiveId a, PrimitiveId b) {
            if (layer_of(a) != layer_of(b)) return layer_of(a) < layer_of(b);
            return to_string(a) < to_string(b);
        });

        std::set<PrimitiveId> registered(sorted.begin(), sorted.end());
        std::set<PrimitiveId> visited;
        std::vector<PrimitiveId> order;

        std::function<void(PrimitiveId)> visit = [&](PrimitiveId id) {
            if (!visited.insert(id).second) return;
            for (PrimitiveId dep : dependencies_of(id)) {
                if (registered.count(dep)) visit(dep);
            }
            order.push_back(id);
        };

        for (PrimitiveId id : sorted) visit(id);
        return order;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════

    // Always all six layers, registered or not
    std::vector<LayerStats> layer_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return compute_layer_stats();
    }

    KernelBudget budget() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return budget_;
    }

    std::optional<PrimitiveInfo> primitive_info(PrimitiveId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = primitives_.find(id);
        if (it == primitives_.end()) return std::nullopt;

        const auto& reg = it->second;
        return PrimitiveInfo{
            id,
            layer_of(id),
            reg.enabled,
            reg.call_count,
            reg.error_count,
            reg.call_count > 0 ? reg.total_duration_ms / reg.call_count : 0.0,
            reg.registered_at
        };
    }

    std::vector<PrimitiveId> registered_primitives() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PrimitiveId> ids;
        for (const auto& [id, _] : primitives_) ids.push_back(id);
        return ids;
    }

    RegistryStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        RegistryStats s;
        s.running = running_;
        s.registered_primitives = primitives_.size();

        double total_duration = 0.0;
        for (const auto& [_, reg] : primitives_) {
            if (reg.enabled) s.enabled_primitives++;
            s.total_calls += reg.call_count;
            s.total_errors += reg.error_count;
            total_duration += reg.total_duration_ms;
        }

        if (s.total_calls > 0) {
            s.error_rate = static_cast<double>(s.total_errors) / s.total_calls;
            s.avg_call_duration_ms = total_duration / s.total_calls;
        }
        s.call_history = history_.to_vector();
        s.layer_stats = compute_layer_stats();
        return s;
    }

private:
    struct Registration {
        std::shared_ptr<const PrimitiveHandler> handler;
        bool enabled = true;
        Timestamp registered_at = 0;
        uint64_t call_count = 0;
        uint64_t error_count = 0;
        double total_duration_ms = 0.0;
    };

    // Shared between the caller and the (possibly detached) worker
    struct CallState {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool failed = false;
        std::string error;
        json result;
    };

    struct WorkerCount {
        std::mutex mutex;
        std::condition_variable cv;
        size_t running = 0;
    };

    struct Outcome {
        bool timed_out = false;
        bool failed = false;
        std::string error;
        json result;
    };

    class PermitGuard {
    public:
        explicit PermitGuard(std::atomic<size_t>& counter) : counter_(&counter) {}
        ~PermitGuard() { release(); }

        PermitGuard(const PermitGuard&) = delete;
        PermitGuard& operator=(const PermitGuard&) = delete;

        void release() {
            if (counter_) {
                counter_->fetch_sub(1);
                counter_ = nullptr;
            }
        }

    private:
        std::atomic<size_t>* counter_;
    };

    bool try_acquire_permit() {
        size_t current = active_calls_.load();
        while (current < config_.max_concurrency) {
            if (active_calls_.compare_exchange_weak(current, current + 1)) {
                return true;
            }
        }
        return false;
    }

    Outcome run_with_timeout(std::shared_ptr<const PrimitiveHandler> handler,
                             const json& args, const CallContext& ctx) {
        auto state = std::make_shared<CallState>();
        auto workers = workers_;
        {
            std::lock_guard<std::mutex> lock(workers->mutex);
            workers->running++;
        }

        auto worker = [state, workers, handler, args, ctx]() {
            json result;
            bool failed = false;
            std::string error;
            try {
                result = (*handler)(args, ctx);
            } catch (const std::exception& e) {
                failed = true;
                error = e.what();
            } catch (...) {
                failed = true;
                error = "unknown handler error";
            }

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->result = std::move(result);
                state->failed = failed;
                state->error = std::move(error);
                state->done = true;
                state->cv.notify_all();
            }

            std::lock_guard<std::mutex> lock(workers->mutex);
            workers->running--;
            workers->cv.notify_all();
        };

        try {
            std::thread(std::move(worker)).detach();
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lock(workers->mutex);
            workers->running--;
            workers->cv.notify_all();
            throw;
        }

        Outcome outcome;
        std::unique_lock<std::mutex> lock(state->mutex);
        if (config_.call_timeout_ms > 0) {
            bool settled = state->cv.wait_for(
                lock, std::chrono::milliseconds(config_.call_timeout_ms),
                [&state]() { return state->done; });
            if (!settled) {
                outcome.timed_out = true;
                if (config_.cancel_on_timeout) ctx.cancel_flag->store(true);
                return outcome;
            }
        } else {
            state->cv.wait(lock, [&state]() { return state->done; });
        }

        outcome.failed = state->failed;
        outcome.error = state->error;
        outcome.result = std::move(state->result);
        return outcome;
    }

    void record_attempt(PrimitiveId id, const std::string& call_id, Timestamp started_at,
                        double duration_ms, bool success, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);

        // The binding may have been removed while the handler ran
        auto it = primitives_.find(id);
        if (it != primitives_.end()) {
            it->second.call_count++;
            it->second.total_duration_ms += duration_ms;
            if (!success) it->second.error_count++;
        }

        budget_.total_calls++;
        budget_.calls_by_primitive[id]++;

        if (config_.tracing) {
            history_.push(CallRecord{id, call_id, started_at, duration_ms, success, error});
        }
    }

    std::vector<LayerStats> compute_layer_stats() const {
        std::vector<LayerStats> stats(LAYER_COUNT);
        std::vector<uint64_t> errors(LAYER_COUNT, 0);
        std::vector<double> durations(LAYER_COUNT, 0.0);

        for (Layer layer = 0; layer < LAYER_COUNT; ++layer) {
            stats[layer].layer = layer;
        }

        for (const auto& [id, reg] : primitives_) {
            Layer layer = layer_of(id);
            stats[layer].registered_count++;
            if (reg.enabled) stats[layer].enabled_count++;
            stats[layer].total_calls += reg.call_count;
            errors[layer] += reg.error_count;
            durations[layer] += reg.total_duration_ms;
        }

        for (Layer layer = 0; layer < LAYER_COUNT; ++layer) {
            auto& s = stats[layer];
            if (s.total_calls > 0) {
                s.avg_duration_ms = durations[layer] / s.total_calls;
                s.error_rate = static_cast<double>(errors[layer]) / s.total_calls;
            }
        }
        return stats;
    }

    // DFS over registered bindings; caller holds mutex_
    std::vector<std::vector<PrimitiveId>> detect_cycles() const {
        std::vector<std::vector<PrimitiveId>> cycles;
        std::set<PrimitiveId> visited;
        std::set<PrimitiveId> in_stack;
        std::vector<PrimitiveId> path;

        std::function<void(PrimitiveId)> dfs = [&](PrimitiveId node) {
            if (in_stack.count(node)) {
                auto start = std::find(path.begin(), path.end(), node);
                if (start != path.end()) {
                    std::vector<PrimitiveId> cycle(start, path.end());
                    cycle.push_back(node);
                    cycles.push_back(std::move(cycle));
                }
                return;
            }
            if (!visited.insert(node).second) return;

            in_stack.insert(node);
            path.push_back(node);
            for (PrimitiveId dep : dependencies_of(node)) {
                if (primitives_.count(dep)) dfs(dep);
            }
            path.pop_back();
            in_stack.erase(node);
        };

        for (const auto& [id, _] : primitives_) {
            visited.clear();
            dfs(id);
        }
        return cycles;
    }

    KernelConfig config_;
    EventBus events_;
    mutable std::mutex mutex_;
    std::map<PrimitiveId, Registration> primitives_;
    RingBuffer<CallRecord> history_;
    KernelBudget budget_;
    std::atomic<size_t> active_calls_{0};
    std::atomic<bool> running_{false};
    std::shared_ptr<WorkerCount> workers_;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON views
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, PrimitiveId id) {
    j = to_string(id);
}

inline void to_json(json& j, const CallRecord& r) {
    j = {
        {"primitive", to_string(r.primitive)},
        {"call_id", r.call_id},
        {"timestamp", r.timestamp},
        {"duration_ms", r.duration_ms},
        {"success", r.success}
    };
    if (!r.error.empty()) j["error"] = r.error;
}

inline void to_json(json& j, const KernelBudget& b) {
    json by_primitive = json::object();
    for (const auto& [id, count] : b.calls_by_primitive) {
        by_primitive[to_string(id)] = count;
    }
    j = {{"total_calls", b.total_calls}, {"calls_by_primitive", by_primitive}};
}

inline void to_json(json& j, const LayerStats& s) {
    j = {
        {"layer", s.layer},
        {"registered_count", s.registered_count},
        {"enabled_count", s.enabled_count},
        {"total_calls", s.total_calls},
        {"avg_duration_ms", s.avg_duration_ms},
        {"error_rate", s.error_rate}
    };
}

inline void to_json(json& j, const DependencyValidation& v) {
    json missing = json::array();
    for (const auto& m : v.missing_dependencies) {
        missing.push_back({{"primitive", to_string(m.primitive)}, {"missing", m.missing}});
    }
    j = {
        {"valid", v.valid},
        {"missing_dependencies", missing},
        {"circular_dependencies", v.circular_dependencies}
    };
}

inline void to_json(json& j, const RegistryStats& s) {
    j = {
        {"running", s.running},
        {"registered_primitives", s.registered_primitives},
        {"enabled_primitives", s.enabled_primitives},
        {"total_calls", s.total_calls},
        {"total_errors", s.total_errors},
        {"error_rate", s.error_rate},
        {"avg_call_duration_ms", s.avg_call_duration_ms},
        {"call_history", s.call_history},
        {"layer_stats", s.layer_stats}
    };
}

} // namespace cortex
