#include "core/context_pool.h"
#include "core/logger.h"

#include <utility>

namespace sign_core {

// Delay before retrying after a failed replacement build.
static const std::chrono::milliseconds kBuildRetryDelay{1000};

// ============================================================
// CancellationToken
// ============================================================

// Callbacks run under mutex_, so once unsubscribe() returns the callback is
// neither running nor about to run.
void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
        return;
    }
    for (const auto& entry : callbacks_) {
        entry.second();
    }
}

size_t CancellationToken::subscribe(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = nextId_++;
    callbacks_[id] = std::move(callback);
    return id;
}

void CancellationToken::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

// ============================================================
// ContextLease
// ============================================================

ContextLease::ContextLease(ContextPool* pool, std::unique_ptr<SandboxContext> context)
    : pool_(pool), context_(std::move(context)) {}

ContextLease::~ContextLease() {
    if (pool_ && context_) {
        pool_->release(*this, ReleaseOutcome::FAULTED);
    }
}

ContextLease::ContextLease(ContextLease&& other) noexcept
    : pool_(other.pool_), context_(std::move(other.context_)) {
    other.pool_ = nullptr;
}

ContextLease& ContextLease::operator=(ContextLease&& other) noexcept {
    if (this != &other) {
        if (pool_ && context_) {
            pool_->release(*this, ReleaseOutcome::FAULTED);
        }
        pool_ = other.pool_;
        context_ = std::move(other.context_);
        other.pool_ = nullptr;
    }
    return *this;
}

void ContextLease::release(ReleaseOutcome outcome) {
    if (pool_ && context_) {
        pool_->release(*this, outcome);
    }
}

// ============================================================
// ContextPool
// ============================================================

ContextPool::ContextPool(const PoolConfig& config, ScriptPtr script)
    : config_(config), runaways_(std::make_shared<RunawayTracker>()), active_(std::move(script)) {
    if (config_.size == 0) {
        throw SignError(ErrorKind::INTERNAL, "context pool size must be at least 1");
    }

    if (active_) {
        for (size_t i = 0; i < config_.size; ++i) {
            idle_.push_back(SandboxContext::build(active_, {}, config_.buildTimeout,
                                                  config_.memoryLimitBytes, runaways_));
            ++built_;
        }
    }

    runaways_->setListener([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        buildNeeded_.notify_one();
    });
    builder_ = std::thread(&ContextPool::builderLoop, this);

    LOG_INFO("ContextPool", "Initialized with size=" + std::to_string(config_.size) +
             ", acquire_timeout=" + std::to_string(config_.acquireTimeout.count()) + "ms" +
             ", max_invocations=" + std::to_string(config_.maxInvocationsPerContext));
}

ContextPool::~ContextPool() {
    // Waits out a listener call in progress; runaways may outlive the pool.
    runaways_->setListener(nullptr);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    buildNeeded_.notify_all();
    available_.notify_all();

    if (builder_.joinable()) {
        builder_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

bool ContextPool::isStale(const SandboxContext& context) const {
    return !active_ || context.scriptHash() != active_->hash;
}

ContextLease ContextPool::acquire(std::chrono::milliseconds timeout, CancellationToken* cancel) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::unique_ptr<SandboxContext>> stale; // destroyed after the lock is dropped
    std::unique_ptr<SandboxContext> picked;
    std::string failure;

    size_t subscription = 0;
    if (cancel) {
        subscription = cancel->subscribe([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            available_.notify_all();
        });
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        while (true) {
            while (!idle_.empty()) {
                std::unique_ptr<SandboxContext> candidate = std::move(idle_.front());
                idle_.pop_front();
                if (isStale(*candidate)) {
                    candidate->setState(ContextState::RETIRED);
                    ++retired_;
                    stale.push_back(std::move(candidate));
                    buildNeeded_.notify_one();
                    continue;
                }
                picked = std::move(candidate);
                break;
            }
            if (picked) {
                break;
            }
            if (stopping_) {
                failure = "context pool is shutting down";
                break;
            }
            if (cancel && cancel->cancelled()) {
                failure = "acquire cancelled by caller";
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                failure = "no sandbox context available within " + std::to_string(timeout.count()) + "ms";
                break;
            }
            available_.wait_until(lock, deadline);
        }
        --waiting_;

        if (picked) {
            picked->setState(ContextState::BUSY);
            ++busy_;
        } else {
            ++rejected_;
        }
    }

    if (cancel) {
        cancel->unsubscribe(subscription);
    }
    stale.clear();

    if (!picked) {
        LOG_WARN("ContextPool", failure);
        throw SignError(ErrorKind::SERVICE_UNAVAILABLE, failure);
    }
    return ContextLease(this, std::move(picked));
}

void ContextPool::release(ContextLease& lease, ReleaseOutcome outcome) {
    std::unique_ptr<SandboxContext> context = std::move(lease.context_);
    lease.pool_ = nullptr;
    if (!context) {
        return;
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --busy_;
        ++released_;

        if (outcome != ReleaseOutcome::HEALTHY || context->faulted()) {
            reason = "faulted";
            ++faulted_;
        } else if (isStale(*context)) {
            reason = "stale";
        } else if (context->invocationCount() >= config_.maxInvocationsPerContext) {
            reason = "rotated";
        }

        if (reason.empty()) {
            context->setState(ContextState::READY);
            idle_.push_back(std::move(context));
            available_.notify_one();
            return;
        }

        ++retired_;
        buildNeeded_.notify_one();
    }

    LOG_INFO("ContextPool", "Retired context " + context->id() + " (" + reason + ", " +
             std::to_string(context->invocationCount()) + " invocations)");
    context->setState(ContextState::RETIRED);
    context.reset();
}

void ContextPool::onScriptUpdated(ScriptPtr script) {
    std::vector<std::unique_ptr<SandboxContext>> stale;
    size_t busy = 0;
    std::string hash;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && script && active_->hash == script->hash) {
            return;
        }
        active_ = std::move(script);

        std::deque<std::unique_ptr<SandboxContext>> keep;
        for (auto& context : idle_) {
            if (isStale(*context)) {
                context->setState(ContextState::RETIRED);
                stale.push_back(std::move(context));
            } else {
                keep.push_back(std::move(context));
            }
        }
        idle_.swap(keep);
        retired_ += stale.size();
        busy = busy_;
        hash = active_ ? active_->hash.substr(0, 12) : "<none>";
        buildNeeded_.notify_one();
    }

    LOG_INFO("ContextPool", "Script updated to " + hash +
             ": dropped " + std::to_string(stale.size()) + " idle contexts, " +
             std::to_string(busy) + " busy contexts retire on release");
}

void ContextPool::builderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!active_ || idle_.size() + busy_ + building_ + runaways_->running() >= config_.size) {
            buildNeeded_.wait(lock);
            continue;
        }

        ScriptPtr script = active_;
        ++building_;
        lock.unlock();

        std::unique_ptr<SandboxContext> context;
        std::string error;
        try {
            context = SandboxContext::build(script, {}, config_.buildTimeout, config_.memoryLimitBytes, runaways_);
        } catch (const std::exception& e) {
            error = e.what();
        }

        lock.lock();
        --building_;

        if (!context) {
            LOG_ERROR("ContextPool", "Replacement build failed: " + error);
            buildNeeded_.wait_for(lock, kBuildRetryDelay, [this]() { return stopping_; });
            continue;
        }
        if (isStale(*context)) {
            // The script changed while this one was building.
            lock.unlock();
            context.reset();
            lock.lock();
            continue;
        }

        ++built_;
        LOG_DEBUG("ContextPool", "Added context " + context->id());
        idle_.push_back(std::move(context));
        available_.notify_one();
    }
}

bool ContextPool::hasReadyContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& context : idle_) {
        if (!isStale(*context)) {
            return true;
        }
    }
    return false;
}

PoolStats ContextPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats stats;
    stats.capacity = config_.size;
    stats.idle = idle_.size();
    stats.busy = busy_;
    stats.building = building_;
    stats.waiting = waiting_;
    stats.built = built_;
    stats.released = released_;
    stats.retired = retired_;
    stats.faulted = faulted_;
    stats.rejected = rejected_;
    stats.runaway = runaways_->running();
    stats.scriptHash = active_ ? active_->hash : "";
    return stats;
}

} // namespace sign_core
