#ifndef SIGN_CORE_TEST_SUPPORT_H
#define SIGN_CORE_TEST_SUPPORT_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "core/script_store.h"
#include "core/sign_types.h"

namespace sign_test {

// Duktape is ES5.1: no let/const, arrow functions or template strings below.

const char* const kScriptV1 = R"JS(
function render(params) {
    return typeof params === "string" ? params : JSON.stringify(params);
}
function sign_detail(params, ua) {
    return "v1-detail:" + render(params) + "|" + ua;
}
function sign_reply(params, ua) {
    return "v1-reply:" + render(params);
}
)JS";

const char* const kScriptV2 = R"JS(
function sign_detail(params, ua) {
    return "v2-detail:" + (typeof params === "string" ? params : params.aweme_id);
}
function sign_reply(params, ua) {
    return "v2-reply";
}
)JS";

// Only sign_detail; rejected while a rule points at sign_reply.
const char* const kScriptWithoutReply = R"JS(
function sign_detail(params, ua) {
    return "lonely";
}
)JS";

const char* const kScriptThrowingDetail = R"JS(
function sign_detail(params, ua) {
    throw new Error("vendor algorithm exploded");
}
function sign_reply(params, ua) {
    return "reply-ok";
}
)JS";

// Spins on the wall clock for 1.5s; used with short invocation timeouts.
const char* const kScriptSlowDetail = R"JS(
function sign_detail(params, ua) {
    var end = Date.now() + 1500;
    while (Date.now() < end) {}
    return "late";
}
function sign_reply(params, ua) {
    return "fast";
}
)JS";

// Fails loudly if two calls ever overlap inside one heap.
const char* const kScriptInflightCounter = R"JS(
var inflight = 0;
function sign_detail(params, ua) {
    inflight++;
    if (inflight > 1) {
        throw new Error("overlapping invocation");
    }
    var end = Date.now() + 5;
    while (Date.now() < end) {}
    inflight--;
    return "ok";
}
function sign_reply(params, ua) {
    return sign_detail(params, ua);
}
)JS";

inline sign_core::ScriptPtr makeScript(const std::string& source, uint64_t version = 1) {
    auto script = std::make_shared<sign_core::AlgorithmScript>();
    script->source = source;
    script->hash = sign_core::sha256Hex(source);
    script->origin = "test";
    script->version = version;
    script->loadedAt = std::chrono::system_clock::now();
    return script;
}

// Polls pred every 10ms until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace sign_test

#endif // SIGN_CORE_TEST_SUPPORT_H
