/**
 * @file command_dispatcher_test.cpp
 * @brief Tests for DBGp command handling against a scripted gdb
 */

#include <gtest/gtest.h>
#include "fake_ide_channel.hpp"
#include "fake_mi_channel.hpp"
#include "replay_bridge/command_dispatcher.hpp"

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

const char* const BKPT_1 =
    "^done,bkpt={number=\"1\",type=\"breakpoint\",disp=\"keep\",enabled=\"y\","
    "file=\"index.c\",fullname=\"/app/index.c\",line=\"10\"}";

const char* const BKPT_2_TEMP =
    "^done,bkpt={number=\"2\",type=\"breakpoint\",disp=\"del\",enabled=\"y\","
    "file=\"index.c\",fullname=\"/app/index.c\",line=\"20\"}";

const char* const TWO_FRAMES =
    "^done,stack=[frame={level=\"0\",addr=\"0x1\",func=\"inner\",file=\"index.c\","
    "fullname=\"/app/index.c\",line=\"10\"},frame={level=\"1\",addr=\"0x2\",func=\"main\","
    "file=\"main.c\",fullname=\"/app/main.c\",line=\"33\"}]";

}

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.featureMap = defaultFeatureMap("PHP");
        channel.routeStopsTo(session);
    }

    // Sets breakpoint 1 at /app/index.c:10
    void setLineBreakpoint() {
        channel.expect("break-insert", BKPT_1);
        ASSERT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 1 -t line -f file:///app/index.c -n 10"),
                             "id=\"1\""));
    }

    SessionState session;
    FakeMiChannel channel;
    NativeDebugger debugger{channel};
    CollectingIdeChannel ide;
    CommandDispatcher dispatcher{session, ide, debugger};
};

TEST_F(CommandDispatcherTest, StatusReportsSessionState) {
    std::string response = dispatcher.handleLine("status -i 1");
    EXPECT_TRUE(contains(response, "command=\"status\""));
    EXPECT_TRUE(contains(response, "transaction_id=\"1\""));
    EXPECT_TRUE(contains(response, "status=\"starting\" reason=\"ok\""));
    EXPECT_EQ(session.lastSequenceNum.load(), 1);
}

TEST_F(CommandDispatcherTest, EmptyLineProducesNoResponse) {
    EXPECT_EQ(dispatcher.handleLine(""), "");
}

TEST_F(CommandDispatcherTest, UnknownCommandIsUnimplemented) {
    std::string response = dispatcher.handleLine("source -i 5 -f file:///x");
    EXPECT_TRUE(contains(response, "transaction_id=\"5\""));
    EXPECT_TRUE(contains(response, "<error code=\"4\">"));
    EXPECT_TRUE(contains(response, "Unimplemented command: source"));
    EXPECT_FALSE(dispatcher.isFinished());
}

TEST_F(CommandDispatcherTest, FeatureGet) {
    std::string language = dispatcher.handleLine("feature_get -i 2 -n language_name");
    EXPECT_TRUE(contains(language, "feature_name=\"language_name\" supported=\"1\">PHP</response>"));

    std::string command = dispatcher.handleLine("feature_get -i 3 -n breakpoint_set");
    EXPECT_TRUE(contains(command, "supported=\"1\">1</response>"));

    std::string unknown = dispatcher.handleLine("feature_get -i 4 -n no_such_feature");
    EXPECT_TRUE(contains(unknown, "supported=\"0\""));

    EXPECT_TRUE(contains(dispatcher.handleLine("feature_get -i 5"), "<error code=\"3\">"));
}

TEST_F(CommandDispatcherTest, FeatureSetHonoursReadOnly) {
    std::string ok = dispatcher.handleLine("feature_set -i 2 -n max_depth -v 3");
    EXPECT_TRUE(contains(ok, "feature=\"max_depth\" success=\"1\""));
    EXPECT_EQ(session.featureMap["max_depth"].value, "3");

    std::string readOnly = dispatcher.handleLine("feature_set -i 3 -n language_name -v C");
    EXPECT_TRUE(contains(readOnly, "success=\"0\""));
    EXPECT_EQ(session.featureMap["language_name"].value, "PHP");

    std::string unknown = dispatcher.handleLine("feature_set -i 4 -n bogus -v 1");
    EXPECT_TRUE(contains(unknown, "success=\"0\""));

    EXPECT_TRUE(contains(dispatcher.handleLine("feature_set -i 5 -n max_depth"), "<error code=\"3\">"));
}

TEST_F(CommandDispatcherTest, BreakpointSetLine) {
    channel.expect("break-insert", BKPT_1);
    std::string response = dispatcher.handleLine("breakpoint_set -i 4 -t line -f file:///app/index.c -n 10");

    EXPECT_TRUE(contains(response, "state=\"enabled\" id=\"1\""));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"/app/index.c:10"});

    const auto* bp = session.breakpoints.getBreakpoint("1");
    ASSERT_NE(bp, nullptr);
    EXPECT_EQ(bp->filename, "file:///app/index.c");
    EXPECT_EQ(bp->lineno, 10);
    EXPECT_EQ(session.sourceMap.count("/app/index.c"), 1u);
}

TEST_F(CommandDispatcherTest, BreakpointSetConditionalTemporaryDisabled) {
    channel.expect("break-insert", BKPT_2_TEMP);
    std::string line = "breakpoint_set -i 4 -t conditional -f file:///app/index.c -n 20 -r 1 -s disabled -- " +
                       base64Encode("i > 2");
    std::string response = dispatcher.handleLine(line);

    EXPECT_TRUE(contains(response, "state=\"disabled\" id=\"2\""));
    std::vector<std::string> expected = {"-t", "-d", "-c", "i > 2", "/app/index.c:20"};
    EXPECT_EQ(channel.last().args, expected);

    std::string get = dispatcher.handleLine("breakpoint_get -i 5 -d 2");
    EXPECT_TRUE(contains(get, "type=\"conditional\""));
    EXPECT_TRUE(contains(get, "state=\"disabled\""));
    EXPECT_TRUE(contains(get, "temporary=\"1\""));
    EXPECT_TRUE(contains(get, "<expression>i &gt; 2</expression>"));
}

TEST_F(CommandDispatcherTest, BreakpointSetRejectsBadRequests) {
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 1 -t call -f file:///a.c -n 1"),
                         "<error code=\"201\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 2 -t line -f file:///a.c"),
                         "<error code=\"3\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 3 -t line -f file:///a.c -n ten"),
                         "<error code=\"3\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 4 -t conditional -f file:///a.c -n 1"),
                         "<error code=\"3\">"));
    EXPECT_TRUE(channel.sent.empty());
}

TEST_F(CommandDispatcherTest, BreakpointSetReportsNativeFailure) {
    channel.expect("break-insert", "^error,msg=\"No source file named a.c.\"");
    std::string response = dispatcher.handleLine("breakpoint_set -i 1 -t line -f file:///a.c -n 1");
    EXPECT_TRUE(contains(response, "<error code=\"200\">"));
    EXPECT_TRUE(contains(response, "No source file named a.c."));
    EXPECT_EQ(session.breakpoints.size(), 0u);
}

TEST_F(CommandDispatcherTest, BreakpointGetAndList) {
    setLineBreakpoint();
    channel.expect("break-insert", BKPT_2_TEMP);
    dispatcher.handleLine("breakpoint_set -i 2 -t line -f file:///app/index.c -n 20 -r 1");

    std::string get = dispatcher.handleLine("breakpoint_get -i 3 -d 1");
    EXPECT_TRUE(contains(get, "<breakpoint id=\"1\" type=\"line\" state=\"enabled\""));
    EXPECT_TRUE(contains(get, "filename=\"file:///app/index.c\" lineno=\"10\""));
    EXPECT_TRUE(contains(get, "hit_count=\"0\""));

    std::string list = dispatcher.handleLine("breakpoint_list -i 4");
    EXPECT_TRUE(contains(list, "<breakpoint id=\"1\""));
    EXPECT_TRUE(contains(list, "<breakpoint id=\"2\""));

    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_get -i 5 -d 9"), "<error code=\"205\">"));
}

TEST_F(CommandDispatcherTest, BreakpointUpdate) {
    setLineBreakpoint();

    channel.expect("break-disable", "^done");
    std::string response = dispatcher.handleLine("breakpoint_update -i 2 -d 1 -s disabled -h 3 -o >=");
    EXPECT_FALSE(contains(response, "<error"));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"1"});

    const auto* bp = session.breakpoints.getBreakpoint("1");
    EXPECT_FALSE(bp->enabled);
    EXPECT_EQ(bp->hitValue, 3);
    EXPECT_EQ(bp->hitCondition, ">=");

    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_update -i 3 -d 1 -n 11"), "<error code=\"3\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_update -i 4 -d 7 -s enabled"), "<error code=\"205\">"));

    channel.expect("break-enable", "^error,msg=\"Bad breakpoint number '1'\"");
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_update -i 5 -d 1 -s enabled"), "<error code=\"200\">"));
    EXPECT_FALSE(session.breakpoints.getBreakpoint("1")->enabled);
}

TEST_F(CommandDispatcherTest, BreakpointRemove) {
    setLineBreakpoint();

    channel.expect("break-delete", "^done");
    std::string response = dispatcher.handleLine("breakpoint_remove -i 2 -d 1");
    EXPECT_TRUE(contains(response, "<breakpoint id=\"1\""));
    EXPECT_FALSE(session.breakpoints.hasBreakpoint("1"));

    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_remove -i 3 -d 1"), "<error code=\"205\">"));
}

TEST_F(CommandDispatcherTest, RunStopsAtBreakpoint) {
    setLineBreakpoint();
    channel.expect("exec-continue", "^running", {breakpointStop("1", "/app/index.c", 10)});

    std::string response = dispatcher.handleLine("run -i 2");
    EXPECT_TRUE(contains(response, "command=\"run\""));
    EXPECT_TRUE(contains(response, "status=\"break\" reason=\"ok\""));
    EXPECT_TRUE(contains(response, "<xdebug:message filename=\"file:///app/index.c\" lineno=\"10\">"));
    EXPECT_TRUE(channel.last().args.empty());
    EXPECT_EQ(session.breakpoints.getBreakpoint("1")->hitCount, 1u);

    std::string status = dispatcher.handleLine("status -i 3");
    EXPECT_TRUE(contains(status, "status=\"break\""));
}

TEST_F(CommandDispatcherTest, ReverseFlagAndAmbientMode) {
    channel.expect("exec-continue", "^running", {reasonStop("no-history")});
    dispatcher.handleLine("run -i 1 -z 1");
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"--reverse"});

    session.reverseMode = true;
    channel.expect("exec-next", "^running", {reasonStop("end-stepping-range")});
    dispatcher.handleLine("step_over -i 2");
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"--reverse"});

    channel.expect("exec-step", "^running", {reasonStop("end-stepping-range")});
    dispatcher.handleLine("step_into -i 3 -z 0");
    EXPECT_TRUE(channel.last().args.empty());

    channel.expect("exec-finish", "^running", {reasonStop("function-finished")});
    std::string out = dispatcher.handleLine("step_out -i 4");
    EXPECT_EQ(channel.last().command, "exec-finish");
    EXPECT_TRUE(contains(out, "status=\"break\""));
}

TEST_F(CommandDispatcherTest, RunToExitStops) {
    channel.expect("exec-continue", "^running", {reasonStop("exited-normally")});
    std::string response = dispatcher.handleLine("run -i 1");
    EXPECT_TRUE(contains(response, "status=\"stopping\""));
    EXPECT_FALSE(contains(response, "xdebug:message"));
}

TEST_F(CommandDispatcherTest, StepOutOfOutermostFrameIsAnError) {
    session.status = SessionStatus::BREAK;
    channel.expect("exec-finish",
                   "^error,msg=\"\\\"finish\\\" not meaningful in the outermost frame.\"");

    std::string response = dispatcher.handleLine("step_out -i 7");
    EXPECT_TRUE(contains(response, "command=\"step_out\""));
    EXPECT_TRUE(contains(response, "transaction_id=\"7\""));
    EXPECT_TRUE(contains(response, "<error code=\"5\">"));
    EXPECT_TRUE(contains(response, "not meaningful in the outermost frame."));
    EXPECT_EQ(session.status.load(), SessionStatus::BREAK);
    EXPECT_FALSE(session.notifier.isArmed());
    EXPECT_FALSE(dispatcher.isFinished());

    EXPECT_TRUE(contains(dispatcher.handleLine("status -i 8"), "status=\"break\""));
}

TEST_F(CommandDispatcherTest, RunAfterExitIsAnError) {
    channel.expect("exec-continue", "^running", {reasonStop("exited-normally")});
    ASSERT_TRUE(contains(dispatcher.handleLine("run -i 1"), "status=\"stopping\""));

    channel.expect("exec-continue", "^error,msg=\"The program is not being run.\"");
    std::string response = dispatcher.handleLine("run -i 2");
    EXPECT_TRUE(contains(response, "<error code=\"5\">"));
    EXPECT_TRUE(contains(response, "The program is not being run."));
    EXPECT_EQ(session.status.load(), SessionStatus::STOPPING);
    EXPECT_FALSE(session.notifier.isArmed());

    // Going back in time still works
    channel.expect("exec-continue", "^running", {breakpointStop("9", "/app/index.c", 12)});
    std::string back = dispatcher.handleLine("run -i 3 -z 1");
    EXPECT_TRUE(contains(back, "status=\"break\""));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"--reverse"});
}

TEST_F(CommandDispatcherTest, OutOfRangeNumbersAreInvalidOptions) {
    std::string response = dispatcher.handleLine("context_get -i 1 -d 4294967296");
    EXPECT_TRUE(contains(response, "<error code=\"3\">"));
    EXPECT_TRUE(channel.sent.empty());

    EXPECT_TRUE(contains(dispatcher.handleLine("context_get -i 2 -d +1"), "<error code=\"3\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("breakpoint_set -i 3 -f file:///a.c -n 99999999999"),
                         "<error code=\"3\">"));
}

TEST_F(CommandDispatcherTest, StackDepth) {
    channel.expect("stack-info-depth", "^done,depth=\"2\"");
    EXPECT_TRUE(contains(dispatcher.handleLine("stack_depth -i 1"), "depth=\"2\""));
    EXPECT_EQ(session.maxStackDepth, 2);
}

TEST_F(CommandDispatcherTest, StackGet) {
    channel.expect("stack-list-frames", TWO_FRAMES);
    std::string all = dispatcher.handleLine("stack_get -i 1");
    EXPECT_TRUE(contains(all, "<stack level=\"0\" type=\"file\" filename=\"file:///app/index.c\" lineno=\"10\" where=\"inner\"/>"));
    EXPECT_TRUE(contains(all, "<stack level=\"1\" type=\"file\" filename=\"file:///app/main.c\" lineno=\"33\" where=\"main\"/>"));
    EXPECT_EQ(session.levelAr, (std::vector<int>{0, 1}));
    EXPECT_EQ(session.sourceMap.size(), 2u);

    channel.expect("stack-list-frames", TWO_FRAMES);
    std::string one = dispatcher.handleLine("stack_get -i 2 -d 1");
    EXPECT_TRUE(contains(one, "level=\"1\""));
    EXPECT_FALSE(contains(one, "level=\"0\""));

    channel.expect("stack-list-frames", TWO_FRAMES);
    EXPECT_TRUE(contains(dispatcher.handleLine("stack_get -i 3 -d 5"), "<error code=\"301\">"));
}

TEST_F(CommandDispatcherTest, ContextNames) {
    EXPECT_TRUE(contains(dispatcher.handleLine("context_names -i 1"), "<context name=\"Locals\" id=\"0\"/>"));
}

TEST_F(CommandDispatcherTest, ContextGetListsLocals) {
    channel.expect("stack-select-frame", "^done");
    channel.expect("stack-list-variables",
                   "^done,variables=[{name=\"i\",type=\"int\",value=\"2\"},{name=\"s\",type=\"char *\",value=\"0x0\"}]");

    std::string response = dispatcher.handleLine("context_get -i 1 -d 1");
    EXPECT_EQ(channel.sent[0].args, std::vector<std::string>{"1"});
    EXPECT_TRUE(contains(response, "context=\"0\""));
    EXPECT_TRUE(contains(response, "<property name=\"i\" fullname=\"i\" type=\"int\" children=\"0\" "
                                   "encoding=\"base64\" size=\"1\"><![CDATA[Mg==]]></property>"));
    EXPECT_TRUE(contains(response, "name=\"s\""));
}

TEST_F(CommandDispatcherTest, ContextGetErrors) {
    EXPECT_TRUE(contains(dispatcher.handleLine("context_get -i 1 -c 1"), "<error code=\"3\">"));

    channel.expect("stack-select-frame", "^error,msg=\"No frame at level 4.\"");
    EXPECT_TRUE(contains(dispatcher.handleLine("context_get -i 2 -d 4"), "<error code=\"301\">"));
}

TEST_F(CommandDispatcherTest, PropertyGetAndValue) {
    channel.expect("stack-select-frame", "^done");
    channel.expect("data-evaluate-expression", "^done,value=\"2\"");
    std::string get = dispatcher.handleLine("property_get -i 1 -n i");
    EXPECT_EQ(channel.sent[0].args, std::vector<std::string>{"0"});
    EXPECT_EQ(channel.sent[1].args, std::vector<std::string>{"i"});
    EXPECT_TRUE(contains(get, "name=\"i\""));
    EXPECT_TRUE(contains(get, "<![CDATA[Mg==]]>"));

    channel.expect("stack-select-frame", "^done");
    channel.expect("data-evaluate-expression", "^done,value=\"2\"");
    std::string value = dispatcher.handleLine("property_value -i 2 -n i");
    EXPECT_TRUE(contains(value, "size=\"1\" encoding=\"base64\"><![CDATA[Mg==]]></response>"));

    channel.expect("stack-select-frame", "^done");
    channel.expect("data-evaluate-expression", "^error,msg=\"No symbol \\\"zz\\\" in current context.\"");
    std::string missing = dispatcher.handleLine("property_get -i 3 -n zz");
    EXPECT_TRUE(contains(missing, "<error code=\"300\">"));
    EXPECT_TRUE(contains(missing, "No symbol \"zz\" in current context."));

    EXPECT_TRUE(contains(dispatcher.handleLine("property_get -i 4"), "<error code=\"3\">"));
}

TEST_F(CommandDispatcherTest, Eval) {
    channel.expect("stack-select-frame", "^done");
    channel.expect("data-evaluate-expression", "^done,value=\"3\"");
    std::string response = dispatcher.handleLine("eval -i 1 -- " + base64Encode("i + 1"));
    EXPECT_EQ(channel.last().args, std::vector<std::string>{"i + 1"});
    EXPECT_TRUE(contains(response, "<![CDATA[Mw==]]>"));

    channel.expect("stack-select-frame", "^done");
    channel.expect("data-evaluate-expression", "^error,msg=\"syntax error\"");
    EXPECT_TRUE(contains(dispatcher.handleLine("eval -i 2 -- " + base64Encode("i +")), "<error code=\"206\">"));

    EXPECT_TRUE(contains(dispatcher.handleLine("eval -i 3"), "<error code=\"3\">"));
    EXPECT_TRUE(contains(dispatcher.handleLine("eval -i 4 -- @@@"), "<error code=\"1\">"));
}

TEST_F(CommandDispatcherTest, StopAndDetachFinish) {
    std::string stop = dispatcher.handleLine("stop -i 1");
    EXPECT_TRUE(contains(stop, "status=\"stopped\" reason=\"ok\""));
    EXPECT_TRUE(dispatcher.isFinished());

    SessionState other;
    CommandDispatcher detaching(other, ide, debugger);
    EXPECT_TRUE(contains(detaching.handleLine("detach -i 1"), "status=\"stopping\" reason=\"ok\""));
    EXPECT_TRUE(detaching.isFinished());
}

TEST_F(CommandDispatcherTest, RunLoopAnswersUntilStop) {
    CollectingIdeChannel scripted({"status -i 1", "", "stop -i 2", "status -i 3"});
    CommandDispatcher loop(session, scripted, debugger, {"status"});
    loop.run();

    ASSERT_EQ(scripted.packets.size(), 2u);
    for (const auto& packet : scripted.packets) {
        EXPECT_EQ(packet.back(), '\0');
        EXPECT_TRUE(contains(packet, DBGP_XML_HEADER));
    }
    EXPECT_TRUE(contains(scripted.packets[1], "command=\"stop\""));
    EXPECT_EQ(scripted.commands.size(), 1u);
    EXPECT_TRUE(loop.isFinished());
}

TEST_F(CommandDispatcherTest, RunLoopEndsWhenIdeHangsUp) {
    CollectingIdeChannel scripted({"status -i 1"});
    CommandDispatcher loop(session, scripted, debugger);
    loop.run();
    EXPECT_EQ(scripted.packets.size(), 1u);
    EXPECT_FALSE(loop.isFinished());
}
