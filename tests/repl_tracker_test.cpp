#include "proc/repl_tracker.hpp"
#include <gtest/gtest.h>

TEST(ReplTracker, ControlCharactersFromClient) {
  ReplTracker t;
  EXPECT_FALSE(t.InRawRepl());
  t.OnClientInput("\r\x03\x01");
  EXPECT_TRUE(t.InRawRepl());
  t.OnClientInput("\x02");
  EXPECT_FALSE(t.InRawRepl());
}

TEST(ReplTracker, RawBannerFromInterpreter) {
  ReplTracker t;
  t.OnInterpreterOutput("MicroPython v1.22\r\n>>> \r\nraw REPL; CTRL-B to exit\r\n>");
  EXPECT_TRUE(t.InRawRepl());
}

TEST(ReplTracker, BannerSplitAcrossReads) {
  ReplTracker t;
  t.OnInterpreterOutput("\r\nraw REPL; CT");
  EXPECT_FALSE(t.InRawRepl());
  t.OnInterpreterOutput("RL-B to exit\r\n>");
  EXPECT_TRUE(t.InRawRepl());
}

TEST(ReplTracker, FriendlyPromptLeavesRawMode) {
  ReplTracker t;
  t.OnClientInput("\x01");
  t.OnInterpreterOutput("raw REPL; CTRL-B to exit\r\n>");
  ASSERT_TRUE(t.InRawRepl());
  t.OnInterpreterOutput("OK");
  EXPECT_TRUE(t.InRawRepl());
  t.OnInterpreterOutput("\r\nMicroPython v1.22\r\n>>> ");
  EXPECT_FALSE(t.InRawRepl());
}

TEST(ReplTracker, OldPromptDoesNotUndoCtrlA) {
  ReplTracker t;
  t.OnInterpreterOutput(">>> ");
  t.OnClientInput("\x01");
  t.OnInterpreterOutput("\r\nraw REPL; CT");
  EXPECT_TRUE(t.InRawRepl());
}

TEST(ReplTracker, ResetForNewConnection) {
  ReplTracker t;
  t.OnClientInput("\x01");
  t.Reset();
  EXPECT_FALSE(t.InRawRepl());
}
