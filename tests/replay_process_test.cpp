/**
 * @file replay_process_test.cpp
 * @brief Tests for reading the gdbserver address announced by rr replay
 */

#include <gtest/gtest.h>
#include "replay_bridge/fatal_error.hpp"
#include "replay_bridge/replay_process.hpp"

TEST(ReplayAddressTest, QuotedHint) {
    EXPECT_EQ(parseReplayAddress("Launch gdb with\n"), "");
    EXPECT_EQ(parseReplayAddress("  gdb '-l' '10000' '-ex' 'target extended-remote :9999' /usr/bin/php7.0"),
              ":9999");
}

TEST(ReplayAddressTest, HostAndPort) {
    EXPECT_EQ(parseReplayAddress("target extended-remote 127.0.0.1:4444"), "127.0.0.1:4444");
    EXPECT_EQ(parseReplayAddress("\"target extended-remote localhost:1234\" then"), "localhost:1234");
}

TEST(ReplayAddressTest, NoHint) {
    EXPECT_EQ(parseReplayAddress(""), "");
    EXPECT_EQ(parseReplayAddress("rr: Saving execution to trace directory"), "");
}

TEST(ReplayProcessTest, MissingRrIsFatal) {
    ReplayProcess replay;
    EXPECT_THROW(replay.start("/nonexistent/rr", 9999, ""), FatalError);
    EXPECT_TRUE(replay.getAddress().empty());
}
