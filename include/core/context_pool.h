#ifndef SIGN_CORE_CONTEXT_POOL_H
#define SIGN_CORE_CONTEXT_POOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/sandbox_context.h"
#include "core/script_store.h"

namespace sign_core {

struct PoolConfig {
    size_t size = 4;
    std::chrono::milliseconds acquireTimeout{2000};
    std::chrono::milliseconds buildTimeout{5000};
    uint64_t maxInvocationsPerContext = 10000; // rotation threshold
    size_t memoryLimitBytes = 64 * 1024 * 1024; // per context heap, 0 = no cap
};

enum class ReleaseOutcome {
    HEALTHY,
    FAULTED
};

struct PoolStats {
    size_t capacity = 0;
    size_t idle = 0;
    size_t busy = 0;
    size_t building = 0;
    size_t waiting = 0;
    uint64_t built = 0;
    uint64_t released = 0;
    uint64_t retired = 0;
    uint64_t faulted = 0;
    uint64_t rejected = 0; // acquire timeouts and cancellations
    size_t runaway = 0;    // abandoned script threads still executing
    std::string scriptHash;
};

// Caller-side cancellation for a pending acquire, e.g. on client disconnect.
// Callbacks must not subscribe, unsubscribe or cancel on the same token.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    size_t subscribe(std::function<void()> callback);
    void unsubscribe(size_t id);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<size_t, std::function<void()>> callbacks_;
    size_t nextId_ = 1;
};

class ContextPool;

// Exclusive checkout of one SandboxContext. A lease that goes out of scope
// without an explicit release is released as FAULTED, since the state of the
// heap after an unfinished exchange is unknown.
class ContextLease {
public:
    ContextLease() = default;
    ~ContextLease();

    ContextLease(ContextLease&& other) noexcept;
    ContextLease& operator=(ContextLease&& other) noexcept;
    ContextLease(const ContextLease&) = delete;
    ContextLease& operator=(const ContextLease&) = delete;

    SandboxContext* operator->() const { return context_.get(); }
    SandboxContext& operator*() const { return *context_; }
    SandboxContext* get() const { return context_.get(); }
    explicit operator bool() const { return context_ != nullptr; }

    void release(ReleaseOutcome outcome);

private:
    friend class ContextPool;
    ContextLease(ContextPool* pool, std::unique_ptr<SandboxContext> context);

    ContextPool* pool_ = nullptr;
    std::unique_ptr<SandboxContext> context_;
};

/**
 * Owns a bounded set of SandboxContexts built from the active script.
 *
 * Pool size is the concurrency ceiling for signing: callers beyond it wait in
 * acquire() until a context is released, the timeout passes, or they cancel.
 * A background builder thread keeps the pool at capacity, replacing contexts
 * that were retired because they faulted, went stale after a script update or
 * reached the rotation threshold. A script thread abandoned at its deadline
 * occupies a slot until it returns, so contexts plus runaways never exceed
 * the configured size.
 */
class ContextPool {
public:
    // Builds the initial contexts synchronously; throws SANDBOX_BUILD_ERROR if
    // the first build fails. A null script starts the pool empty.
    ContextPool(const PoolConfig& config, ScriptPtr script);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    // Throws SignError(SERVICE_UNAVAILABLE) on timeout, cancellation or shutdown.
    ContextLease acquire(std::chrono::milliseconds timeout, CancellationToken* cancel = nullptr);
    ContextLease acquire() { return acquire(config_.acquireTimeout); }

    void release(ContextLease& lease, ReleaseOutcome outcome);

    // Idle contexts of the old script are dropped now; busy ones on release.
    void onScriptUpdated(ScriptPtr script);

    bool hasReadyContext() const;
    PoolStats stats() const;
    const PoolConfig& config() const { return config_; }

    // Shared with builds made outside the pool, e.g. script validation.
    const std::shared_ptr<RunawayTracker>& runaways() const { return runaways_; }

private:
    void builderLoop();
    bool isStale(const SandboxContext& context) const; // mutex_ held

    PoolConfig config_;
    std::shared_ptr<RunawayTracker> runaways_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::condition_variable buildNeeded_;
    std::deque<std::unique_ptr<SandboxContext>> idle_;
    ScriptPtr active_;
    size_t busy_ = 0;
    size_t building_ = 0;
    size_t waiting_ = 0;
    bool stopping_ = false;

    uint64_t built_ = 0;
    uint64_t released_ = 0;
    uint64_t retired_ = 0;
    uint64_t faulted_ = 0;
    uint64_t rejected_ = 0;

    std::thread builder_;
};

} // namespace sign_core

#endif // SIGN_CORE_CONTEXT_POOL_H
