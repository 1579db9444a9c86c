#ifndef SIGN_CORE_SANDBOX_CONTEXT_H
#define SIGN_CORE_SANDBOX_CONTEXT_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/script_store.h"
#include "core/sign_types.h"

namespace sign_core {

struct SandboxHeap; // Duktape heap plus host-side state, defined in sandbox_context.cpp

/**
 * Counts script threads that were abandoned at their deadline and are still
 * executing. Unless Duktape is built with the execution timeout hook, such a
 * thread runs until the script returns by itself, so it keeps using a CPU and
 * its heap after its context has been retired.
 */
class RunawayTracker {
public:
    size_t running() const { return running_.load(); }

    // Called after a runaway thread finishes; replaces any previous listener.
    void setListener(std::function<void()> listener);

    void abandoned();
    void finished();

private:
    std::atomic<size_t> running_{0};
    std::mutex mutex_;
    std::function<void()> listener_;
};

/**
 * One isolated Duktape heap in which an AlgorithmScript has been evaluated
 * exactly once. The heap only sees the ECMAScript built-ins plus the host
 * capabilities installed at build time: Date (wall clock), Math and
 * setTimeout/clearTimeout. Nothing that reaches the network, the filesystem
 * or the process is reachable from the script.
 *
 * A context serves one invocation at a time. After a timeout or a script
 * error its state is FAULTED and it must not be invoked again.
 */
class SandboxContext {
public:
    ~SandboxContext();

    SandboxContext(const SandboxContext&) = delete;
    SandboxContext& operator=(const SandboxContext&) = delete;

    /**
     * @brief Evaluates the script in a fresh heap and checks its entry points.
     *
     * Throws SignError(SANDBOX_BUILD_ERROR) if the heap cannot be created, the
     * script throws or does not finish within evalTimeout, or any of the
     * required entry points is not a global function. memoryLimitBytes caps
     * what the heap may allocate (0 for no cap); a script that hits the cap
     * gets a RangeError. Threads abandoned at a deadline, during the build or
     * any later invoke, are reported to `runaways` when one is given.
     */
    static std::unique_ptr<SandboxContext> build(ScriptPtr script,
                                                 const std::vector<std::string>& requiredEntryPoints,
                                                 std::chrono::milliseconds evalTimeout,
                                                 size_t memoryLimitBytes = 0,
                                                 std::shared_ptr<RunawayTracker> runaways = nullptr);

    /**
     * @brief Calls entryPoint(parameters, userAgent) and returns the token.
     *
     * String parameters are passed as a JS string, anything else as the
     * decoded JSON value. Throws SignError with INVOCATION_TIMEOUT,
     * SCRIPT_RUNTIME_ERROR or ENTRY_POINT_NOT_FOUND. The first two leave the
     * context FAULTED.
     */
    std::string invoke(const std::string& entryPoint,
                       const nlohmann::json& parameters,
                       const std::string& userAgent,
                       std::chrono::milliseconds timeout);

    const std::string& id() const { return id_; }
    const std::string& scriptHash() const { return script_->hash; }
    const ScriptPtr& script() const { return script_; }
    std::chrono::steady_clock::time_point createdAt() const { return createdAt_; }
    uint64_t invocationCount() const { return invocations_.load(); }

    ContextState state() const { return state_.load(); }
    void setState(ContextState state) { state_.store(state); }
    bool faulted() const { return state_.load() == ContextState::FAULTED; }

private:
    SandboxContext(ScriptPtr script, std::shared_ptr<SandboxHeap> heap,
                   std::shared_ptr<RunawayTracker> runaways);

    static std::string nextId();

    std::string id_;
    ScriptPtr script_;
    std::shared_ptr<SandboxHeap> heap_;
    std::shared_ptr<RunawayTracker> runaways_;
    std::chrono::steady_clock::time_point createdAt_;
    std::atomic<uint64_t> invocations_{0};
    std::atomic<ContextState> state_{ContextState::BUILDING};
    std::mutex invokeMutex_;
};

} // namespace sign_core

// Hook for Duktape builds configured with
//   #define DUK_USE_EXEC_TIMEOUT_CHECK(udata) sign_core_exec_timeout_check(udata)
// Returns non-zero once the running call's deadline has passed.
extern "C" int sign_core_exec_timeout_check(void* udata);

#endif // SIGN_CORE_SANDBOX_CONTEXT_H
