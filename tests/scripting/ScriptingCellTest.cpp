#include "common/JailError.h"
#include "common/TestUtils.h"
#include "scripting/ScriptingCell.h"
#include <future>
#include <gtest/gtest.h>

namespace JAIL {
namespace Test {

class ScriptingCellTest : public ::testing::Test {
protected:
    void SetUp() override {
        cell_ = std::make_unique<ScriptingCell>("cell-test", std::chrono::seconds(5));
    }

    std::unique_ptr<ScriptingCell> cell_;
};

TEST_F(ScriptingCellTest, EvaluateRendersResults) {
    EXPECT_EQ(cell_->evaluate("1 + 2").getText(), "3");
    EXPECT_EQ(cell_->evaluate("'plain text'").getText(), "plain text");
    EXPECT_EQ(cell_->evaluate("({a: [1, null]})").getText(), R"({"a":[1,null]})");
    EXPECT_EQ(cell_->evaluate("undefined").getText(), "undefined");
    EXPECT_EQ(cell_->evaluate("var declared = 1;").getText(), "undefined");
    EXPECT_EQ(cell_->evaluate("(function () {})").getText(), "undefined");
}

TEST_F(ScriptingCellTest, EvaluateReportsSyntaxErrors) {
    auto result = cell_->evaluate("var = ;");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.getErrorMessage().find("SyntaxError"), std::string::npos);
}

TEST_F(ScriptingCellTest, EvaluateReportsThrownErrors) {
    auto result = cell_->evaluate("throw new Error('kaboom')");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.getErrorMessage().find("kaboom"), std::string::npos);

    // Cell remains usable after an exception
    EXPECT_EQ(cell_->evaluate("40 + 2").getText(), "42");
}

TEST_F(ScriptingCellTest, GlobalsPersistAcrossEvaluations) {
    ASSERT_TRUE(cell_->evaluate("var counter = 1;").isSuccess());
    ASSERT_TRUE(cell_->evaluate("counter += 1;").isSuccess());
    EXPECT_EQ(cell_->evaluate("counter").getText(), "2");
}

TEST_F(ScriptingCellTest, CallFunctionPassesStringArguments) {
    ASSERT_TRUE(cell_->evaluate("function join(a, b) { return typeof a + ':' + a + b; }").isSuccess());

    auto result = cell_->callFunction("join", {"x", "[1]"});
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getText(), "string:x[1]");
}

TEST_F(ScriptingCellTest, CallFunctionStringifiesObjects) {
    ASSERT_TRUE(cell_->evaluate("function make() { return {ok: true}; }").isSuccess());
    EXPECT_EQ(cell_->callFunction("make", {}).getText(), R"({"ok":true})");
}

TEST_F(ScriptingCellTest, CallMissingFunctionIsAnError) {
    auto result = cell_->callFunction("call", {"ping", "[]"});
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.getErrorMessage().find("not defined"), std::string::npos);

    ASSERT_TRUE(cell_->evaluate("var notCallable = 5;").isSuccess());
    result = cell_->callFunction("notCallable", {});
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.getErrorMessage().find("not a function"), std::string::npos);
}

TEST_F(ScriptingCellTest, GetGlobalString) {
    ASSERT_TRUE(cell_->evaluate("var _status_message_id = 'msg-7'; var n = 12;").isSuccess());

    EXPECT_EQ(cell_->getGlobalString("_status_message_id"), std::optional<std::string>("msg-7"));
    EXPECT_EQ(cell_->getGlobalString("n"), std::optional<std::string>("12"));
    EXPECT_FALSE(cell_->getGlobalString("missing").has_value());
}

TEST_F(ScriptingCellTest, ConsoleLogIsAvailable) {
    auto result = cell_->evaluate("console.log('hello from', 'cell', 1, {a: 1}); 'logged'");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getText(), "logged");
}

TEST_F(ScriptingCellTest, ContextMapsBackToCell) {
    EXPECT_EQ(ScriptingCell::fromContext(cell_->getContext()), cell_.get());
    EXPECT_EQ(ScriptingCell::fromContext(nullptr), nullptr);
    EXPECT_EQ(JS_GetRuntime(cell_->getContext()), cell_->getRuntime());
}

TEST_F(ScriptingCellTest, CellsAreIsolated) {
    ScriptingCell other("other", std::chrono::seconds(5));
    ASSERT_TRUE(cell_->evaluate("var secret = 'mine';").isSuccess());

    EXPECT_EQ(other.evaluate("typeof secret").getText(), "undefined");
}

TEST_F(ScriptingCellTest, UsableFromAnotherThread) {
    ASSERT_TRUE(cell_->evaluate("function depth(n) { return n === 0 ? 0 : 1 + depth(n - 1); }").isSuccess());

    auto result = std::async(std::launch::async, [this]() { return cell_->evaluate("depth(200)"); }).get();
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getText(), "200");
}

TEST_F(ScriptingCellTest, MemoryLimitStopsRunawayScripts) {
    ScriptingCell limited("limited", std::chrono::seconds(5), 4 * 1024 * 1024);

    auto result = limited.evaluate("var hoard = []; while (true) { hoard.push(new Array(100000).fill(7)); }");
    ASSERT_TRUE(result.isError());
}

TEST_F(ScriptingCellTest, BusyWhenAnotherThreadHoldsTheGate) {
    ScriptingCell busy("busy", Utils::SHORT_GATE_WAIT);
    auto lock = busy.enter();

    auto code = std::async(std::launch::async, [&busy]() -> ErrorCode {
                    try {
                        busy.evaluate("1");
                    } catch (const JailException &e) {
                        return e.code();
                    }
                    return ErrorCode::InternalError;
                }).get();

    EXPECT_EQ(code, ErrorCode::Busy);
}

}  // namespace Test
}  // namespace JAIL
