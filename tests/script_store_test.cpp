#include <gtest/gtest.h>

#include "core/script_store.h"

using namespace sign_core;

TEST(Sha256HexTest, KnownDigest) {
    EXPECT_EQ(sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ScriptStoreTest, LoadPublishesHashedVersion) {
    ScriptStore store;
    EXPECT_EQ(store.current(), nullptr);

    ScriptPtr script = store.load("function sign_detail() { return 'x'; }", "unit");
    ASSERT_NE(script, nullptr);
    EXPECT_EQ(script->hash, sha256Hex(script->source));
    EXPECT_EQ(script->origin, "unit");
    EXPECT_EQ(script->version, 1u);
    EXPECT_EQ(store.current(), script);
}

TEST(ScriptStoreTest, BlankSourceIsRejected) {
    ScriptStore store;
    try {
        store.load("  \n\t ");
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SCRIPT_INVALID);
    }
    EXPECT_EQ(store.current(), nullptr);
}

TEST(ScriptStoreTest, IdenticalSourceKeepsCurrentVersion) {
    ScriptStore store;
    ScriptPtr first = store.load("var a = 1;");
    ScriptPtr again = store.load("var a = 1;");
    EXPECT_EQ(first, again);
    EXPECT_TRUE(store.history().empty());
}

TEST(ScriptStoreTest, ValidatorRejectionKeepsPreviousScript) {
    ScriptStore store([](const AlgorithmScript& candidate) {
        if (candidate.source.find("bad") != std::string::npos) {
            throw SignError(ErrorKind::SANDBOX_BUILD_ERROR, "missing entry points: sign_reply");
        }
    });

    ScriptPtr good = store.load("var good = true;");
    try {
        store.load("var bad = true;");
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SCRIPT_INVALID);
        EXPECT_NE(std::string(e.what()).find("sign_reply"), std::string::npos);
    }
    EXPECT_EQ(store.current(), good);
    EXPECT_TRUE(store.history().empty());
}

TEST(ScriptStoreTest, NonSignErrorFromValidatorBecomesScriptInvalid) {
    ScriptStore store([](const AlgorithmScript&) { throw std::runtime_error("validator failed"); });
    try {
        store.load("var x = 1;");
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SCRIPT_INVALID);
        EXPECT_STREQ(e.what(), "validator failed");
    }
}

TEST(ScriptStoreTest, HistoryIsNewestFirstAndBounded) {
    ScriptStore store(nullptr, 2);
    store.load("var v = 1;");
    store.load("var v = 2;");
    store.load("var v = 3;");
    ScriptPtr current = store.load("var v = 4;");

    EXPECT_EQ(current->version, 4u);
    auto history = store.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0]->source, "var v = 3;");
    EXPECT_EQ(history[1]->source, "var v = 2;");
}

TEST(ScriptStoreTest, RollbackRestoresPreviousSource) {
    ScriptStore store;
    store.load("var v = 1;");
    ScriptPtr second = store.load("var v = 2;");

    ScriptPtr restored = store.rollback();
    EXPECT_EQ(restored->source, "var v = 1;");
    EXPECT_EQ(restored->origin, "rollback");
    EXPECT_GT(restored->version, second->version);
    EXPECT_EQ(store.current(), restored);

    // The replaced script is now the rollback target.
    auto history = store.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0], second);
}

TEST(ScriptStoreTest, RollbackWithoutHistoryFails) {
    ScriptStore store;
    store.load("var only = 1;");
    EXPECT_THROW(store.rollback(), SignError);
    EXPECT_EQ(store.current()->source, "var only = 1;");
}

TEST(ScriptStoreTest, LoadFileReportsMissingFile) {
    ScriptStore store;
    try {
        store.loadFile("/nonexistent/algorithm.js");
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SCRIPT_INVALID);
    }
}
