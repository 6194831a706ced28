/**
 * @file test_patch.cpp
 * @brief Unit tests for patch application (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Patch.hpp"
#include "jpatch/Equality.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Logging.hpp"

using namespace jpatch;

namespace {

Value run(const Value& doc, const char* patch) {
    return jpatch::apply(doc, Value::parse(patch));
}

} // namespace

// ============================================================================
// add
// ============================================================================

class AddTest : public ::testing::Test {
protected:
    Value data = Value::parse(R"({
        "name": "app",
        "items": [1, 2],
        "nested": {"inner": {"x": 1}}
    })");
};

TEST_F(AddTest, AppendWithDash) {
    Value out = run(Value::parse(R"({"items": [1, 2]})"),
                    R"([{"op": "add", "path": "/items/-", "value": 3}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"items": [1, 2, 3]})")));
}

TEST_F(AddTest, InsertAtIndexShifts) {
    Value out = run(data, R"([{"op": "add", "path": "/items/0", "value": 0}])");
    EXPECT_TRUE(deep_equals(out["items"], Value::parse("[0, 1, 2]")));
}

TEST_F(AddTest, InsertAtLengthAppends) {
    Value out = run(data, R"([{"op": "add", "path": "/items/2", "value": 3}])");
    EXPECT_TRUE(deep_equals(out["items"], Value::parse("[1, 2, 3]")));
}

TEST_F(AddTest, IndexPastLengthIsInvalid) {
    EXPECT_THROW(run(data, R"([{"op": "add", "path": "/items/3", "value": 3}])"),
                 InvalidOperation);
}

TEST_F(AddTest, NewKeyGoesLast) {
    Value out = run(data, R"([{"op": "add", "path": "/version", "value": "1.0"}])");
    EXPECT_EQ(out["version"], "1.0");
    auto last = out.end();
    --last;
    EXPECT_EQ(last.key(), "version");
}

TEST_F(AddTest, ExistingKeyIsOverwritten) {
    Value out = run(data, R"([{"op": "add", "path": "/name", "value": "other"}])");
    EXPECT_EQ(out["name"], "other");
    EXPECT_EQ(out.size(), data.size());
}

TEST_F(AddTest, DashOnMapIsAKey) {
    Value out = run(data, R"([{"op": "add", "path": "/nested/-", "value": true}])");
    EXPECT_EQ(out["nested"]["-"], true);
}

TEST_F(AddTest, EmptyKey) {
    Value out = run(data, R"([{"op": "add", "path": "/", "value": 5}])");
    EXPECT_EQ(out[""], 5);
}

TEST_F(AddTest, RootReplacesDocument) {
    Value out = run(data, R"([{"op": "add", "path": "", "value": [1]}])");
    EXPECT_TRUE(deep_equals(out, Value::parse("[1]")));
}

TEST_F(AddTest, MissingParentIsPathNotFound) {
    EXPECT_THROW(run(data, R"([{"op": "add", "path": "/missing/x", "value": 1}])"),
                 PathNotFound);
}

TEST_F(AddTest, ScalarParentIsTypeMismatch) {
    try {
        run(data, R"([{"op": "add", "path": "/name/x", "value": 1}])");
        FAIL() << "Expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "/name");
        EXPECT_EQ(e.actual(), "string");
    }
}

TEST_F(AddTest, ScalarRootIsTypeMismatch) {
    try {
        run(Value(3), R"([{"op": "add", "path": "/x", "value": 1}])");
        FAIL() << "Expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "/");
        EXPECT_EQ(e.actual(), "integer");
    }
}

TEST_F(AddTest, InputIsUnchanged) {
    Value before = data;
    run(data, R"([{"op": "add", "path": "/nested/inner/y", "value": 2}])");
    EXPECT_EQ(data, before);
}

// ============================================================================
// remove
// ============================================================================

TEST(RemoveOp, MapKey) {
    Value out = run(Value::parse(R"({"a": 1, "b": 2, "c": 3})"),
                    R"([{"op": "remove", "path": "/b"}])");
    EXPECT_EQ(out.dump(), R"({"a":1,"c":3})");
}

TEST(RemoveOp, ListIndexShifts) {
    Value out = run(Value::parse(R"(["a", "b", "c"])"), R"([{"op": "remove", "path": "/0"}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"(["b", "c"])")));
}

TEST(RemoveOp, DashIsInvalid) {
    EXPECT_THROW(run(Value::parse(R"(["a", "b", "c"])"), R"([{"op": "remove", "path": "/-"}])"),
                 InvalidOperation);
}

TEST(RemoveOp, RootIsInvalid) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "remove", "path": ""}])"),
                 InvalidOperation);
}

TEST(RemoveOp, MissingKey) {
    try {
        run(Value::parse(R"({"a": 1})"), R"([{"op": "remove", "path": "/b"}])");
        FAIL() << "Expected PathNotFound";
    } catch (const PathNotFound& e) {
        EXPECT_EQ(e.path(), "/b");
    }
}

TEST(RemoveOp, IndexOutOfRange) {
    EXPECT_THROW(run(Value::parse("[1]"), R"([{"op": "remove", "path": "/1"}])"), PathNotFound);
    EXPECT_THROW(run(Value::parse("[1]"), R"([{"op": "remove", "path": "/99999999999999999999999"}])"),
                 PathNotFound);
}

TEST(RemoveOp, MalformedIndex) {
    Value list = Value::parse("[1, 2, 3]");
    EXPECT_THROW(run(list, R"([{"op": "remove", "path": "/01"}])"), InvalidOperation);
    EXPECT_THROW(run(list, R"([{"op": "remove", "path": "/-1"}])"), InvalidOperation);
    EXPECT_THROW(run(list, R"([{"op": "remove", "path": "/1a"}])"), InvalidOperation);
    EXPECT_THROW(run(list, R"([{"op": "remove", "path": "/"}])"), InvalidOperation);
}

TEST(RemoveOp, AddThenRemoveRestores) {
    Value doc = Value::parse(R"({"a": [1, 2], "b": {"c": 1}})");
    Value out = run(doc, R"([
        {"op": "add", "path": "/a/1", "value": 9},
        {"op": "remove", "path": "/a/1"}
    ])");
    EXPECT_TRUE(deep_equals(out, doc));
}

// ============================================================================
// replace
// ============================================================================

TEST(ReplaceOp, Root) {
    Value out = run(Value::parse(R"({"a": 1})"), R"([{"op": "replace", "path": "", "value": {"b": 2}}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"b": 2})")));
}

TEST(ReplaceOp, KeepsKeyPosition) {
    Value out = run(Value::parse(R"({"a": 1, "b": 2, "c": 3})"),
                    R"([{"op": "replace", "path": "/a", "value": 0}])");
    EXPECT_EQ(out.dump(), R"({"a":0,"b":2,"c":3})");
}

TEST(ReplaceOp, ListElement) {
    Value out = run(Value::parse("[1, 2, 3]"), R"([{"op": "replace", "path": "/2", "value": "x"}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"([1, 2, "x"])")));
}

TEST(ReplaceOp, MissingKeyIsPathNotFound) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "replace", "path": "/b", "value": 0}])"),
                 PathNotFound);
}

TEST(ReplaceOp, IndexAtLengthIsPathNotFound) {
    EXPECT_THROW(run(Value::parse("[1]"), R"([{"op": "replace", "path": "/1", "value": 0}])"),
                 PathNotFound);
}

// ============================================================================
// move
// ============================================================================

TEST(MoveOp, BetweenKeys) {
    Value out = run(Value::parse(R"({"a": {"x": 1}, "b": {}})"),
                    R"([{"op": "move", "from": "/a/x", "path": "/b/y"}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"a": {}, "b": {"y": 1}})")));
}

TEST(MoveOp, WithinList) {
    Value out = run(Value::parse("[1, 2, 3, 4]"), R"([{"op": "move", "from": "/1", "path": "/3"}])");
    EXPECT_TRUE(deep_equals(out, Value::parse("[1, 3, 4, 2]")));
}

TEST(MoveOp, SamePathIsNoOp) {
    Value doc = Value::parse(R"({"a": {"b": 1}})");
    Value out = run(doc, R"([{"op": "move", "from": "/a", "path": "/a"}])");
    EXPECT_EQ(out, doc);
}

TEST(MoveOp, IntoOwnChildIsInvalid) {
    EXPECT_THROW(run(Value::parse(R"({"a": {"b": 1}})"),
                     R"([{"op": "move", "from": "/a", "path": "/a/b"}])"),
                 InvalidOperation);
}

TEST(MoveOp, SiblingWithSharedPrefixIsAllowed) {
    Value out = run(Value::parse(R"({"a": 1})"), R"([{"op": "move", "from": "/a", "path": "/ab"}])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"ab": 1})")));
}

TEST(MoveOp, AddFailsAfterRemove) {
    // Index 2 is valid in the original list but not once "/0" is gone
    try {
        run(Value::parse(R"(["a", "b"])"), R"([{"op": "move", "from": "/0", "path": "/2"}])");
        FAIL() << "Expected InvalidOperation";
    } catch (const InvalidOperation& e) {
        EXPECT_NE(std::string(e.what()).find("out of range for add"), std::string::npos);
    }
}

TEST(MoveOp, AddFailureKeepsEarlierOperations) {
    Patch patch = patch_from_json(Value::parse(R"([
        {"op": "add", "path": "/-", "value": "c"},
        {"op": "move", "from": "/0", "path": "/3"}
    ])"));

    Value current = apply_operation(Value::parse(R"(["a", "b"])"), patch[0], 0);
    EXPECT_THROW(apply_operation(current, patch[1], 1), InvalidOperation);
    EXPECT_TRUE(deep_equals(current, Value::parse(R"(["a", "b", "c"])")));
}

TEST(MoveOp, MissingSource) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "move", "from": "/b", "path": "/c"}])"),
                 PathNotFound);
}

TEST(MoveOp, MalformedFrom) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "move", "from": "a", "path": "/c"}])"),
                 InvalidOperation);
}

// ============================================================================
// copy
// ============================================================================

TEST(CopyOp, CopyIsIndependent) {
    Value out = run(Value::parse(R"({"a": {"x": [1]}})"), R"([
        {"op": "copy", "from": "/a", "path": "/b"},
        {"op": "add", "path": "/b/x/-", "value": 2}
    ])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"a": {"x": [1]}, "b": {"x": [1, 2]}})")));
}

TEST(CopyOp, IntoList) {
    Value out = run(Value::parse(R"({"a": 1, "l": [0]})"),
                    R"([{"op": "copy", "from": "/a", "path": "/l/0"}])");
    EXPECT_TRUE(deep_equals(out["l"], Value::parse("[1, 0]")));
}

TEST(CopyOp, MissingSource) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "copy", "from": "/z", "path": "/b"}])"),
                 PathNotFound);
}

// ============================================================================
// test
// ============================================================================

TEST(TestOp, PassesDocumentThrough) {
    Value doc = Value::parse(R"({"a": {"x": 1, "y": 2}})");
    Value out = run(doc, R"([{"op": "test", "path": "/a", "value": {"y": 2, "x": 1}}])");
    EXPECT_EQ(out, doc);
}

TEST(TestOp, Root) {
    Value doc = Value::parse("[1, 2]");
    EXPECT_NO_THROW(run(doc, R"([{"op": "test", "path": "", "value": [1, 2]}])"));
}

TEST(TestOp, Mismatch) {
    try {
        run(Value::parse(R"({"a": 1})"), R"([{"op": "test", "path": "/a", "value": 1.0}])");
        FAIL() << "Expected TestFailed";
    } catch (const TestFailed& e) {
        EXPECT_EQ(e.path(), "/a");
    }
}

TEST(TestOp, MissingPath) {
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([{"op": "test", "path": "/b", "value": 1}])"),
                 PathNotFound);
}

// ============================================================================
// Patches as a whole
// ============================================================================

TEST(ApplyPatch, OperationsSeePreviousResults) {
    Value out = run(Value::object(), R"([
        {"op": "add", "path": "/list", "value": []},
        {"op": "add", "path": "/list/-", "value": {"id": 1}},
        {"op": "replace", "path": "/list/0/id", "value": 2},
        {"op": "test", "path": "/list/0/id", "value": 2}
    ])");
    EXPECT_TRUE(deep_equals(out, Value::parse(R"({"list": [{"id": 2}]})")));
}

TEST(ApplyPatch, EmptyPatchReturnsCopy) {
    Value doc = Value::parse(R"({"a": 1})");
    EXPECT_EQ(jpatch::apply(doc, Patch{}), doc);
}

TEST(ApplyPatch, NotAList) {
    EXPECT_THROW(run(Value::object(), R"({"op": "remove", "path": "/a"})"), InvalidOperation);
}

TEST(ApplyPatch, FailureLeavesInputUntouched) {
    Value doc = Value::parse(R"({"a": 1})");
    Value before = doc;
    EXPECT_THROW(run(doc, R"([
        {"op": "add", "path": "/b", "value": 2},
        {"op": "remove", "path": "/missing"}
    ])"), PathNotFound);
    EXPECT_EQ(doc, before);
}

TEST(ApplyPatch, OperationByOperationKeepsEarlierResults) {
    Patch patch = patch_from_json(Value::parse(R"([
        {"op": "add", "path": "/b", "value": 2},
        {"op": "remove", "path": "/missing"}
    ])"));

    Value current = Value::parse(R"({"a": 1})");
    current = apply_operation(current, patch[0], 0);
    EXPECT_THROW(apply_operation(current, patch[1], 1), PathNotFound);
    EXPECT_TRUE(deep_equals(current, Value::parse(R"({"a": 1, "b": 2})")));
}

TEST(ApplyPatch, DecodesOperationsLazily) {
    // Operation 1 is malformed but operation 0 fails first
    EXPECT_THROW(run(Value::parse(R"({"a": 1})"), R"([
        {"op": "test", "path": "/a", "value": 2},
        {"op": "bogus", "path": "/a"}
    ])"), TestFailed);
}

TEST(ApplyPatch, DebugLoggingDoesNotChangeResult) {
    auto log = logger();
    EXPECT_EQ(log->name(), kLoggerName);

    const auto level = log->level();
    log->set_level(spdlog::level::debug);
    Value out = run(Value::parse("[1]"), R"([{"op": "add", "path": "/-", "value": 2}])");
    log->set_level(level);

    EXPECT_TRUE(deep_equals(out, Value::parse("[1, 2]")));
}

TEST(ApplyPatch, ErrorNamesOperation) {
    try {
        run(Value::parse(R"({"a": 1})"), R"([
            {"op": "test", "path": "/a", "value": 1},
            {"op": "remove", "path": "/zz"}
        ])");
        FAIL() << "Expected PathNotFound";
    } catch (const PathNotFound& e) {
        EXPECT_NE(std::string(e.what()).find("Operation 1 (remove)"), std::string::npos);
    }
}

TEST(ApplyPatch, EscapedKeys) {
    Value out = run(Value::parse(R"({"a/b": {"m~n": 1}})"),
                    R"([{"op": "replace", "path": "/a~1b/m~0n", "value": 2}])");
    EXPECT_EQ(out["a/b"]["m~n"], 2);
}

TEST(ApplyPatch, SharedCache) {
    PointerCache cache;
    Value doc = Value::parse(R"({"a": 1})");
    jpatch::apply(doc, Value::parse(R"([{"op": "replace", "path": "/a", "value": 2}])"), &cache);
    EXPECT_TRUE(cache.contains("/a"));
}

// ============================================================================
// apply_json / get / test
// ============================================================================

TEST(ApplyJson, Compact) {
    EXPECT_EQ(apply_json(R"({"b": 1, "a": 2})", R"([{"op": "add", "path": "/c", "value": 3}])"),
              R"({"b":1,"a":2,"c":3})");
}

TEST(ApplyJson, Indented) {
    EXPECT_EQ(apply_json("[]", R"([{"op": "add", "path": "/-", "value": 1}])", 2), "[\n  1\n]");
}

TEST(ApplyJson, BadDocument) {
    try {
        apply_json("{not json", "[]");
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.source(), "document");
    }
}

TEST(ApplyJson, BadPatch) {
    EXPECT_THROW(apply_json("{}", "[{"), DocumentParseError);
    EXPECT_THROW(apply_json("{}", R"({"op": "add"})"), InvalidOperation);
}

TEST(GetValue, ResolvesPaths) {
    Value doc = Value::parse(R"({"a": [{"b": "x"}]})");
    EXPECT_EQ(jpatch::get(doc, "/a/0/b"), "x");
    EXPECT_EQ(jpatch::get(doc, ""), doc);
    EXPECT_THROW(jpatch::get(doc, "/a/1"), PathNotFound);
    EXPECT_THROW(jpatch::get(doc, "/a/0/b/c"), TypeMismatch);
    EXPECT_THROW(jpatch::get(doc, "a"), PointerSyntaxError);
}

TEST(TestValue, ComparesStructurally) {
    Value doc = Value::parse(R"({"a": {"x": 1, "y": [true]}})");
    EXPECT_TRUE(jpatch::test(doc, "/a", Value::parse(R"({"y": [true], "x": 1})")));
    EXPECT_FALSE(jpatch::test(doc, "/a/x", Value(1.0)));
    EXPECT_THROW(jpatch::test(doc, "/b", Value(1)), PathNotFound);
}
