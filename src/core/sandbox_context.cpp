#include "core/sandbox_context.h"
#include "core/logger.h"

#include <cstddef>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>

#include "duktape.h"

namespace sign_core {

struct SandboxHeap {
    duk_context* ctx = nullptr;

    // Steady-clock deadline of the running call in nanoseconds, 0 when idle.
    std::atomic<int64_t> deadlineNs{0};

    // Virtual clock for deferred callbacks. Timers never make the host sleep.
    double virtualNow = 0;
    duk_uarridx_t nextTimerId = 1;

    // Bytes handed to Duktape and the cap on them, 0 for no cap. Only the
    // thread currently running the heap allocates from it.
    size_t allocated = 0;
    size_t memoryLimit = 0;

    ~SandboxHeap() {
        if (ctx) {
            duk_destroy_heap(ctx);
        }
    }

    static int64_t nowNs() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    void arm(std::chrono::milliseconds timeout) {
        deadlineNs.store(nowNs() + std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
    }

    void disarm() { deadlineNs.store(0); }

    bool expired() const {
        int64_t deadline = deadlineNs.load();
        return deadline != 0 && nowNs() >= deadline;
    }
};

const char* contextStateName(ContextState state) {
    switch (state) {
        case ContextState::BUILDING: return "building";
        case ContextState::READY: return "ready";
        case ContextState::BUSY: return "busy";
        case ContextState::FAULTED: return "faulted";
        case ContextState::RETIRED: return "retired";
    }
    return "unknown";
}

namespace {

// Upper bound on deferred callbacks run after one evaluation or call.
const int kMaxTimerCallbacks = 1000;

// Globals Duktape may provide that are not on the allow-list.
const char* const kStrippedGlobals[] = {"print", "alert", "require", "Duktape"};

// The functions below run inside duk_safe_call and may unwind through
// Duktape's error mechanism, so they keep only trivially destructible locals.

SandboxHeap* hostHeap(duk_context* ctx) {
    duk_push_heap_stash(ctx);
    duk_get_prop_string(ctx, -1, "host");
    SandboxHeap* heap = static_cast<SandboxHeap*>(duk_get_pointer(ctx, -1));
    duk_pop_2(ctx);
    return heap;
}

// setTimeout(fn, delay, ...args)
duk_ret_t hostSetTimeout(duk_context* ctx) {
    duk_idx_t nargs = duk_get_top(ctx);
    if (nargs < 1 || !duk_is_function(ctx, 0)) {
        return DUK_RET_TYPE_ERROR;
    }
    double delay = nargs > 1 ? duk_to_number(ctx, 1) : 0;
    if (!(delay >= 0)) {
        delay = 0; // NaN and negative delays fire as soon as possible
    }

    SandboxHeap* heap = hostHeap(ctx);
    duk_uarridx_t id = heap->nextTimerId++;

    duk_push_heap_stash(ctx);
    duk_get_prop_string(ctx, -1, "timers");
    duk_push_object(ctx);
    duk_dup(ctx, 0);
    duk_put_prop_string(ctx, -2, "fn");
    duk_push_number(ctx, heap->virtualNow + delay);
    duk_put_prop_string(ctx, -2, "due");
    duk_push_array(ctx);
    for (duk_idx_t i = 2; i < nargs; ++i) {
        duk_dup(ctx, i);
        duk_put_prop_index(ctx, -2, static_cast<duk_uarridx_t>(i - 2));
    }
    duk_put_prop_string(ctx, -2, "args");
    duk_put_prop_index(ctx, -2, id);
    duk_pop_2(ctx);

    duk_push_uint(ctx, id);
    return 1;
}

// clearTimeout(id)
duk_ret_t hostClearTimeout(duk_context* ctx) {
    if (!duk_is_number(ctx, 0)) {
        return 0;
    }
    duk_uarridx_t id = static_cast<duk_uarridx_t>(duk_get_uint(ctx, 0));
    duk_push_heap_stash(ctx);
    duk_get_prop_string(ctx, -1, "timers");
    duk_del_prop_index(ctx, -1, id);
    duk_pop_2(ctx);
    return 0;
}

// Runs pending timers in (due, registration) order until none are left.
void drainTimers(duk_context* ctx) {
    SandboxHeap* heap = hostHeap(ctx);

    for (int fired = 0; fired < kMaxTimerCallbacks; ++fired) {
        if (heap->expired()) {
            (void) duk_error(ctx, DUK_ERR_RANGE_ERROR, "execution timeout");
        }

        duk_push_heap_stash(ctx);
        duk_get_prop_string(ctx, -1, "timers");
        duk_enum(ctx, -1, DUK_ENUM_OWN_PROPERTIES_ONLY);

        bool found = false;
        duk_uarridx_t best_id = 0;
        double best_due = 0;
        while (duk_next(ctx, -1, 1)) {
            duk_get_prop_string(ctx, -1, "due");
            double due = duk_get_number(ctx, -1);
            duk_uarridx_t id = static_cast<duk_uarridx_t>(duk_to_uint32(ctx, -3));
            duk_pop_3(ctx);
            if (!found || due < best_due || (due == best_due && id < best_id)) {
                found = true;
                best_id = id;
                best_due = due;
            }
        }
        duk_pop(ctx); // enum

        if (!found) {
            duk_pop_2(ctx);
            return;
        }

        duk_get_prop_index(ctx, -1, best_id);
        duk_del_prop_index(ctx, -2, best_id);
        heap->virtualNow = best_due;

        duk_get_prop_string(ctx, -1, "fn");
        duk_get_prop_string(ctx, -2, "args");
        duk_idx_t args_idx = duk_get_top_index(ctx);
        duk_uarridx_t nargs = static_cast<duk_uarridx_t>(duk_get_length(ctx, args_idx));
        duk_require_stack(ctx, static_cast<duk_idx_t>(nargs));
        for (duk_uarridx_t i = 0; i < nargs; ++i) {
            duk_get_prop_index(ctx, args_idx, i);
        }
        duk_remove(ctx, args_idx);
        duk_call(ctx, static_cast<duk_idx_t>(nargs));
        duk_pop(ctx);     // callback result
        duk_pop_3(ctx);   // entry, timers, stash
    }
    (void) duk_error(ctx, DUK_ERR_RANGE_ERROR, "too many deferred callbacks");
}

duk_ret_t installHostCapabilities(duk_context* ctx, void* udata) {
    duk_push_heap_stash(ctx);
    duk_push_pointer(ctx, udata);
    duk_put_prop_string(ctx, -2, "host");
    duk_push_object(ctx);
    duk_put_prop_string(ctx, -2, "timers");
    duk_pop(ctx);

    duk_push_global_object(ctx);
    for (const char* name : kStrippedGlobals) {
        duk_del_prop_string(ctx, -1, name);
    }
    duk_pop(ctx);

    duk_push_c_function(ctx, hostSetTimeout, DUK_VARARGS);
    duk_put_global_string(ctx, "setTimeout");
    duk_push_c_function(ctx, hostClearTimeout, 1);
    duk_put_global_string(ctx, "clearTimeout");
    return 0;
}

struct EvalFrame {
    ScriptPtr script;
    std::vector<std::string> required;
    std::vector<std::string> missing;
};

duk_ret_t evaluateScript(duk_context* ctx, void* udata) {
    EvalFrame* frame = static_cast<EvalFrame*>(udata);
    duk_push_string(ctx, "algorithm.js");
    duk_compile_lstring_filename(ctx, 0, frame->script->source.data(), frame->script->source.size());
    duk_call(ctx, 0);
    duk_pop(ctx);
    drainTimers(ctx);

    for (size_t i = 0; i < frame->required.size(); ++i) {
        duk_get_global_string(ctx, frame->required[i].c_str());
        if (!duk_is_function(ctx, -1)) {
            frame->missing.push_back(frame->required[i]);
        }
        duk_pop(ctx);
    }
    return 0;
}

struct InvokeFrame {
    std::string entryPoint;
    std::string parameters;
    bool parametersAreJson = false;
    std::string userAgent;

    bool missing = false;
    bool noValue = false;
    std::string token;
};

duk_ret_t callEntryPoint(duk_context* ctx, void* udata) {
    InvokeFrame* frame = static_cast<InvokeFrame*>(udata);
    duk_push_global_object(ctx);
    duk_get_prop_string(ctx, -1, frame->entryPoint.c_str());
    if (!duk_is_function(ctx, -1)) {
        frame->missing = true;
        return 0;
    }

    duk_push_lstring(ctx, frame->parameters.data(), frame->parameters.size());
    if (frame->parametersAreJson) {
        duk_json_decode(ctx, -1);
    }
    duk_push_lstring(ctx, frame->userAgent.data(), frame->userAgent.size());
    duk_call(ctx, 2);

    if (!duk_is_null_or_undefined(ctx, -1)) {
        if (!duk_is_string(ctx, -1)) {
            duk_json_encode(ctx, -1);
        }
        duk_size_t len = 0;
        const char* text = duk_get_lstring(ctx, -1, &len);
        if (text) {
            frame->token.assign(text, len);
        } else {
            frame->noValue = true; // e.g. a function, which JSON cannot encode
        }
    } else {
        frame->noValue = true;
    }
    duk_pop_2(ctx);

    drainTimers(ctx);
    return 0;
}

// Allocation functions handed to duk_create_heap. Each block carries its
// size in a header so the heap's total can be tracked against its cap.
const size_t kAllocHeader = alignof(std::max_align_t) > sizeof(size_t) ? alignof(std::max_align_t) : sizeof(size_t);

void* sandboxAlloc(void* udata, duk_size_t size) {
    SandboxHeap* heap = static_cast<SandboxHeap*>(udata);
    if (size == 0) {
        return nullptr;
    }
    if (heap->memoryLimit != 0 && heap->allocated + size > heap->memoryLimit) {
        return nullptr; // Duktape runs a GC pass and retries before raising
    }
    char* raw = static_cast<char*>(std::malloc(size + kAllocHeader));
    if (!raw) {
        return nullptr;
    }
    *reinterpret_cast<size_t*>(raw) = size;
    heap->allocated += size;
    return raw + kAllocHeader;
}

void sandboxFree(void* udata, void* ptr) {
    if (!ptr) {
        return;
    }
    SandboxHeap* heap = static_cast<SandboxHeap*>(udata);
    char* raw = static_cast<char*>(ptr) - kAllocHeader;
    heap->allocated -= *reinterpret_cast<size_t*>(raw);
    std::free(raw);
}

void* sandboxRealloc(void* udata, void* ptr, duk_size_t size) {
    if (!ptr) {
        return sandboxAlloc(udata, size);
    }
    if (size == 0) {
        sandboxFree(udata, ptr);
        return nullptr;
    }
    SandboxHeap* heap = static_cast<SandboxHeap*>(udata);
    char* raw = static_cast<char*>(ptr) - kAllocHeader;
    size_t old_size = *reinterpret_cast<size_t*>(raw);
    if (heap->memoryLimit != 0 && size > old_size &&
        heap->allocated - old_size + size > heap->memoryLimit) {
        return nullptr;
    }
    char* grown = static_cast<char*>(std::realloc(raw, size + kAllocHeader));
    if (!grown) {
        return nullptr;
    }
    *reinterpret_cast<size_t*>(grown) = size;
    heap->allocated = heap->allocated - old_size + size;
    return grown + kAllocHeader;
}

void fatalHandler(void* udata, const char* msg) {
    (void) udata;
    LOG_ERROR("Sandbox", std::string("Duktape fatal error: ") + (msg ? msg : "no message"));
    std::abort(); // Duktape requires the fatal handler not to return
}

struct GuardedResult {
    bool timedOut = false;
    bool failed = false;
    std::string message;
};

// Runs fn on its own thread and waits at most `timeout` for it. On timeout the
// thread is detached; it keeps the heap and frame alive until the script
// returns, so a runaway call never touches freed memory. While it runs on it
// is counted in `runaways`.
template <typename Frame>
GuardedResult runGuarded(const std::shared_ptr<SandboxHeap>& heap,
                         const std::shared_ptr<Frame>& frame,
                         duk_safe_call_function fn,
                         std::chrono::milliseconds timeout,
                         const std::shared_ptr<RunawayTracker>& runaways) {
    auto task = std::make_shared<std::packaged_task<GuardedResult()>>([heap, frame, fn]() {
        GuardedResult out;
        duk_int_t rc = duk_safe_call(heap->ctx, fn, frame.get(), 0, 1);
        if (rc != DUK_EXEC_SUCCESS) {
            out.failed = true;
            out.message = duk_safe_to_string(heap->ctx, -1);
            out.timedOut = heap->expired();
        }
        duk_pop(heap->ctx);
        heap->disarm();
        return out;
    });
    std::future<GuardedResult> result = task->get_future();

    // 0 running, 1 abandoned by the caller, 2 finished
    auto phase = std::make_shared<std::atomic<int>>(0);

    heap->arm(timeout);
    std::thread worker([task, phase, runaways]() mutable {
        (*task)();
        task.reset();
        if (phase->exchange(2) == 1 && runaways) {
            runaways->finished();
        }
    });

    if (result.wait_for(timeout) == std::future_status::ready) {
        worker.join();
        return result.get();
    }

    if (runaways) {
        runaways->abandoned();
        if (phase->exchange(1) == 2) {
            runaways->finished(); // returned just after the deadline
        }
    }
    worker.detach();

    GuardedResult out;
    out.timedOut = true;
    out.message = "execution exceeded " + std::to_string(timeout.count()) + "ms";
    return out;
}

} // namespace

void RunawayTracker::setListener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void RunawayTracker::abandoned() {
    running_.fetch_add(1);
}

void RunawayTracker::finished() {
    running_.fetch_sub(1);
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener_) {
        listener_();
    }
}

SandboxContext::SandboxContext(ScriptPtr script, std::shared_ptr<SandboxHeap> heap,
                               std::shared_ptr<RunawayTracker> runaways)
    : id_(nextId()),
      script_(std::move(script)),
      heap_(std::move(heap)),
      runaways_(std::move(runaways)),
      createdAt_(std::chrono::steady_clock::now()) {}

SandboxContext::~SandboxContext() {
    LOG_DEBUG("Sandbox", "Destroyed context " + id_ + " after " +
              std::to_string(invocations_.load()) + " invocations");
}

std::string SandboxContext::nextId() {
    static std::atomic<uint64_t> counter{1};
    uint64_t id = counter.fetch_add(1);
    std::stringstream ss;
    ss << "ctx_" << std::setfill('0') << std::setw(6) << id;
    return ss.str();
}

std::unique_ptr<SandboxContext> SandboxContext::build(ScriptPtr script,
                                                      const std::vector<std::string>& requiredEntryPoints,
                                                      std::chrono::milliseconds evalTimeout,
                                                      size_t memoryLimitBytes,
                                                      std::shared_ptr<RunawayTracker> runaways) {
    if (!script) {
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR, "no algorithm script loaded");
    }

    auto heap = std::make_shared<SandboxHeap>();
    heap->memoryLimit = memoryLimitBytes;
    heap->ctx = duk_create_heap(sandboxAlloc, sandboxRealloc, sandboxFree, heap.get(), fatalHandler);
    if (!heap->ctx) {
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR, "failed to create Duktape heap");
    }

    if (duk_safe_call(heap->ctx, installHostCapabilities, heap.get(), 0, 1) != DUK_EXEC_SUCCESS) {
        std::string message = duk_safe_to_string(heap->ctx, -1);
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR, "failed to install host capabilities: " + message);
    }
    duk_pop(heap->ctx);

    auto frame = std::make_shared<EvalFrame>();
    frame->script = script;
    frame->required = requiredEntryPoints;

    GuardedResult result = runGuarded(heap, frame, evaluateScript, evalTimeout, runaways);
    if (result.timedOut) {
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR,
                        "script evaluation did not finish: " + result.message);
    }
    if (result.failed) {
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR,
                        "script threw during evaluation: " + result.message);
    }
    if (!frame->missing.empty()) {
        std::string names;
        for (const auto& name : frame->missing) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        throw SignError(ErrorKind::SANDBOX_BUILD_ERROR, "missing entry points: " + names);
    }

    std::unique_ptr<SandboxContext> context(new SandboxContext(script, heap, std::move(runaways)));
    context->setState(ContextState::READY);
    LOG_DEBUG("Sandbox", "Built context " + context->id() + " from script " + script->hash.substr(0, 12));
    return context;
}

std::string SandboxContext::invoke(const std::string& entryPoint,
                                   const nlohmann::json& parameters,
                                   const std::string& userAgent,
                                   std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(invokeMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw SignError(ErrorKind::INTERNAL, "context " + id_ + " is already executing");
    }
    ContextState current = state_.load();
    if (current == ContextState::FAULTED || current == ContextState::RETIRED) {
        throw SignError(ErrorKind::INTERNAL, "context " + id_ + " is " + contextStateName(current));
    }

    auto frame = std::make_shared<InvokeFrame>();
    frame->entryPoint = entryPoint;
    if (parameters.is_string()) {
        frame->parameters = parameters.get<std::string>();
    } else {
        frame->parameters = parameters.dump();
        frame->parametersAreJson = true;
    }
    frame->userAgent = userAgent;

    invocations_.fetch_add(1);
    GuardedResult result = runGuarded(heap_, frame, callEntryPoint, timeout, runaways_);

    if (result.timedOut) {
        state_.store(ContextState::FAULTED);
        LOG_WARN("Sandbox", "Context " + id_ + " timed out in " + entryPoint + ": " + result.message);
        throw SignError(ErrorKind::INVOCATION_TIMEOUT,
                        entryPoint + " exceeded " + std::to_string(timeout.count()) + "ms");
    }
    if (result.failed) {
        state_.store(ContextState::FAULTED);
        LOG_WARN("Sandbox", "Context " + id_ + " faulted in " + entryPoint + ": " + result.message);
        throw SignError(ErrorKind::SCRIPT_RUNTIME_ERROR, result.message);
    }
    if (frame->missing) {
        throw SignError(ErrorKind::ENTRY_POINT_NOT_FOUND,
                        "entry point '" + entryPoint + "' is not defined by the algorithm script");
    }
    if (frame->noValue) {
        throw SignError(ErrorKind::SCRIPT_RUNTIME_ERROR, entryPoint + " returned no value");
    }
    return frame->token;
}

} // namespace sign_core

extern "C" int sign_core_exec_timeout_check(void* udata) {
    const sign_core::SandboxHeap* heap = static_cast<const sign_core::SandboxHeap*>(udata);
    return heap != nullptr && heap->expired() ? 1 : 0;
}
