/**
 * @file native_debugger_test.cpp
 * @brief Unit tests for the typed wrapper over gdb/MI
 */

#include <gtest/gtest.h>
#include "fake_mi_channel.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "replay_bridge/native_debugger.hpp"
#include "logger.hpp"
#include <iostream>
#include <sstream>

class NativeDebuggerTest : public ::testing::Test {
protected:
    FakeMiChannel channel;
    NativeDebugger debugger{channel};
};

TEST(GdbStringTest, UnquoteCollapsesEscapedQuotes) {
    EXPECT_EQ(unquoteGdbStringResult("He said \\\"hi\\\""), "He said \"hi\"");
    EXPECT_EQ(unquoteGdbStringResult(""), "");
    EXPECT_EQ(unquoteGdbStringResult("already bare"), "already bare");
    EXPECT_EQ(unquoteGdbStringResult("back\\slash"), "back\\slash");
    EXPECT_EQ(unquoteGdbStringResult("trailing\\"), "trailing\\");
}

TEST(GdbStringTest, ParseStringResponse) {
    EvalResult result = parseGdbStringResponse("0x7f261d8624e8 \"some string here\"");
    ASSERT_TRUE(std::holds_alternative<EvalString>(result));
    EXPECT_EQ(std::get<EvalString>(result).value, "some string here");

    EvalResult empty = parseGdbStringResponse("0x7f44a33a9c1e \"\"");
    ASSERT_TRUE(std::holds_alternative<EvalString>(empty));
    EXPECT_EQ(std::get<EvalString>(empty).value, "");

    EvalResult quoted = parseGdbStringResponse("0x1 \"He said \\\"hi\\\"\"");
    ASSERT_TRUE(std::holds_alternative<EvalString>(quoted));
    EXPECT_EQ(std::get<EvalString>(quoted).value, "He said \"hi\"");
}

TEST(GdbStringTest, ParseStringResponseNeedsTwoQuotes) {
    EXPECT_TRUE(std::holds_alternative<EvalError>(parseGdbStringResponse("0x0")));
    EXPECT_TRUE(std::holds_alternative<EvalError>(parseGdbStringResponse("0x0 \"")));
}

TEST_F(NativeDebuggerTest, EvaluateStringKind) {
    channel.expect("data-evaluate-expression", "^done,value=\"0x55 \\\"index.php\\\"\"");
    EvalResult result = debugger.evaluate("filename", EvalKind::STRING);
    ASSERT_TRUE(std::holds_alternative<EvalString>(result));
    EXPECT_EQ(std::get<EvalString>(result).value, "index.php");
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"filename"});
}

TEST_F(NativeDebuggerTest, EvaluateIntKind) {
    channel.expect("data-evaluate-expression", "^done,value=\"17\"");
    EvalResult result = debugger.evaluate("lineno", EvalKind::INT);
    ASSERT_TRUE(std::holds_alternative<EvalInt>(result));
    EXPECT_EQ(std::get<EvalInt>(result).value, 17);

    channel.expect("data-evaluate-expression", "^done,value=\"0x10\"");
    EXPECT_TRUE(std::holds_alternative<EvalError>(debugger.evaluate("ptr", EvalKind::INT)));

    channel.expect("data-evaluate-expression", "^done,value=\"4294967301\"");
    EXPECT_TRUE(std::holds_alternative<EvalError>(debugger.evaluate("big", EvalKind::INT)));
}

TEST_F(NativeDebuggerTest, EvaluateErrorReplyIsTyped) {
    channel.expect("data-evaluate-expression", "^error,msg=\"No symbol \\\"nope\\\" in current context.\"");
    EvalResult result = debugger.evaluate("nope", EvalKind::VALUE);
    ASSERT_TRUE(std::holds_alternative<EvalError>(result));
    EXPECT_EQ(std::get<EvalError>(result).message, "No symbol \"nope\" in current context.");
}

TEST_F(NativeDebuggerTest, EvaluateValueKindKeepsText) {
    channel.expect("data-evaluate-expression", "^done,value=\"{a = 1, b = 2}\"");
    EvalResult result = debugger.evaluate("pair", EvalKind::VALUE);
    ASSERT_TRUE(std::holds_alternative<EvalString>(result));
    EXPECT_EQ(std::get<EvalString>(result).value, "{a = 1, b = 2}");
}

TEST_F(NativeDebuggerTest, FatalWrappers) {
    channel.expect("data-evaluate-expression", "^done,value=\"0x1 \\\"abc\\\"\"");
    EXPECT_EQ(debugger.evaluateString("s"), "abc");

    channel.expect("data-evaluate-expression", "^done,value=\"-4\"");
    EXPECT_EQ(debugger.evaluateInt("n"), -4);

    channel.expect("data-evaluate-expression", "^done,value=\"0x0\"");
    EXPECT_THROW(debugger.evaluateString("s"), FatalError);

    channel.expect("data-evaluate-expression", "^done,value=\"many\"");
    EXPECT_THROW(debugger.evaluateInt("n"), FatalError);
}

TEST_F(NativeDebuggerTest, EvaluateRawRequiresDone) {
    channel.expect("data-evaluate-expression", "^error,msg=\"boom\"");
    try {
        debugger.evaluateRaw("x");
        FAIL() << "expected FatalError";
    } catch (const FatalError& e) {
        EXPECT_EQ(e.getOperation(), "data-evaluate-expression");
        EXPECT_NE(std::string(e.what()).find("Not completed"), std::string::npos);
        EXPECT_FALSE(e.getLocation().empty());
    }
}

TEST_F(NativeDebuggerTest, ReplyWithoutClassIsFatal) {
    channel.expect("data-evaluate-expression", "garbage");
    EXPECT_THROW(debugger.evaluate("x", EvalKind::VALUE), FatalError);
}

TEST_F(NativeDebuggerTest, TransportFailureIsFatal) {
    // Nothing scripted: the fake reports a broken channel
    EXPECT_THROW(debugger.send("exec-continue"), FatalError);
}

TEST_F(NativeDebuggerTest, ResumeForwardAndReverse) {
    std::string error;
    channel.expect("exec-continue", "^running");
    EXPECT_TRUE(debugger.resume("exec-continue", false, error));
    EXPECT_TRUE(channel.last().args.empty());

    channel.expect("exec-next", "^running");
    EXPECT_TRUE(debugger.resume("exec-next", true, error));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"--reverse"});
}

TEST_F(NativeDebuggerTest, RefusedResumeIsRecoverable) {
    std::string error;
    channel.expect("exec-continue", "^error,msg=\"The program is not being run.\"");
    EXPECT_FALSE(debugger.resume("exec-continue", false, error));
    EXPECT_EQ(error, "The program is not being run.");
}

TEST_F(NativeDebuggerTest, ResumeReplyWithoutClassIsFatal) {
    std::string error;
    channel.expect("exec-continue", "garbage");
    EXPECT_THROW(debugger.resume("exec-continue", false, error), FatalError);
}

// Swaps std::cout for a buffer and the log level for the given one
class CapturedOutput {
public:
    explicit CapturedOutput(LogLevel level) : previous(std::cout.rdbuf(buffer.rdbuf())) {
        Logger::setLevel(level);
        Logger::setColorEnabled(false);
    }
    ~CapturedOutput() {
        std::cout.rdbuf(previous);
        Logger::setLevel(LogLevel::INFO);
    }
    std::string text() const { return buffer.str(); }

private:
    std::ostringstream buffer;
    std::streambuf* previous;
};

TEST_F(NativeDebuggerTest, NoisyCallsTraceAtAnyLevel) {
    channel.expect("data-evaluate-expression", "^done,value=\"1\"");
    std::string output;
    {
        CapturedOutput captured(LogLevel::ERROR);
        EvalResult result = debugger.evaluate("1", EvalKind::INT, Verbosity::NOISY);
        ASSERT_TRUE(std::holds_alternative<EvalInt>(result));
        EXPECT_EQ(std::get<EvalInt>(result).value, 1);
        output = captured.text();
    }
    EXPECT_NE(output.find("bridge -> gdb: data-evaluate-expression 1"), std::string::npos);
    EXPECT_NE(output.find("gdb -> bridge: ^done"), std::string::npos);
}

TEST_F(NativeDebuggerTest, AmbientCallsFollowTheLevel) {
    channel.expect("data-evaluate-expression", "^done,value=\"1\"");
    std::string output;
    {
        CapturedOutput captured(LogLevel::INFO);
        debugger.evaluate("1", EvalKind::INT);
        output = captured.text();
    }
    EXPECT_EQ(output.find("bridge -> gdb"), std::string::npos);
}

TEST_F(NativeDebuggerTest, InsertBreakpointParsesReply) {
    channel.expect("break-insert",
                   "^done,bkpt={number=\"3\",type=\"breakpoint\",disp=\"del\",enabled=\"y\","
                   "file=\"t.c\",fullname=\"/src/t.c\",line=\"12\"}");

    NativeBreakpoint bp;
    std::string error;
    ASSERT_TRUE(debugger.insertBreakpoint("/src/t.c:12", true, false, "i > 2", bp, error));
    EXPECT_EQ(bp.number, "3");
    EXPECT_EQ(bp.file, "/src/t.c");
    EXPECT_EQ(bp.line, 12);
    EXPECT_TRUE(bp.temporary);
    EXPECT_TRUE(bp.enabled);

    std::vector<std::string> expected = {"-t", "-c", "i > 2", "/src/t.c:12"};
    EXPECT_EQ(channel.last().args, expected);
}

TEST_F(NativeDebuggerTest, InsertBreakpointFailureIsRecoverable) {
    channel.expect("break-insert", "^error,msg=\"No source file named nope.c.\"");
    NativeBreakpoint bp;
    std::string error;
    EXPECT_FALSE(debugger.insertBreakpoint("nope.c:1", false, true, "", bp, error));
    EXPECT_EQ(error, "No source file named nope.c.");
    EXPECT_EQ(channel.last().args, (std::vector<std::string>{"-d", "nope.c:1"}));
}

TEST_F(NativeDebuggerTest, BreakpointMaintenance) {
    std::string error;
    channel.expect("break-delete", "^done");
    EXPECT_TRUE(debugger.deleteBreakpoint("3", error));

    channel.expect("break-disable", "^done");
    EXPECT_TRUE(debugger.enableBreakpoint("4", false, error));

    channel.expect("break-enable", "^error,msg=\"Bad breakpoint number '9'\"");
    EXPECT_FALSE(debugger.enableBreakpoint("9", true, error));
    EXPECT_EQ(error, "Bad breakpoint number '9'");
}

TEST_F(NativeDebuggerTest, StackQueries) {
    channel.expect("stack-info-depth", "^done,depth=\"3\"");
    EXPECT_EQ(debugger.stackDepth(), 3);

    channel.expect("stack-list-frames",
                   "^done,stack=[frame={level=\"0\",addr=\"0x1\",func=\"inner\",file=\"t.c\","
                   "fullname=\"/src/t.c\",line=\"4\"},frame={level=\"1\",addr=\"0x2\",func=\"main\","
                   "file=\"t.c\",fullname=\"/src/t.c\",line=\"20\"}]");
    auto frames = debugger.listFrames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].function, "inner");
    EXPECT_EQ(frames[1].level, 1);
    EXPECT_EQ(frames[1].line, 20);
    EXPECT_EQ(frames[1].fullname, "/src/t.c");

    channel.expect("stack-select-frame", "^done");
    EXPECT_TRUE(debugger.selectFrame(1));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"1"});

    channel.expect("stack-list-variables",
                   "^done,variables=[{name=\"i\",type=\"int\",value=\"2\"},{name=\"p\",type=\"struct s\"}]");
    auto variables = debugger.listVariables();
    ASSERT_EQ(variables.size(), 2u);
    EXPECT_EQ(variables[0].name, "i");
    EXPECT_EQ(variables[0].value, "2");
    EXPECT_EQ(variables[1].type, "struct s");
    EXPECT_EQ(variables[1].value, "");
}

TEST_F(NativeDebuggerTest, ConnectToReplay) {
    channel.expect("target-select", "^connected");
    debugger.connectToReplay(":9999");
    EXPECT_EQ(channel.last().args, (std::vector<std::string>{"extended-remote", ":9999"}));

    channel.expect("target-select", "^error,msg=\"Connection refused.\"");
    EXPECT_THROW(debugger.connectToReplay(":1"), FatalError);
}
