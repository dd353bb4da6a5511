#include "net/backoff.hpp"
#include "proc/interpreter_process.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <string>

using namespace std::chrono_literals;

namespace {

// Runs `body` as a coroutine on `ioc` until it returns.
void RunCoroutine(net::io_context &ioc,
                  std::function<void(net::yield_context)> body) {
  net::spawn(ioc, [body](net::yield_context yield) { body(yield); });
  ioc.run();
  ioc.restart();
}

// Reads until `want` bytes arrived, the stream ended or ~2 s passed.
std::string ReadAtLeast(InterpreterProcess &p, net::yield_context yield,
                        std::size_t want) {
  std::string got;
  char buf[512];
  for (int i = 0; i < 40 && got.size() < want; ++i) {
    auto r = p.Read(yield, net::buffer(buf), 50ms);
    if (!r) {
      break;
    }
    got.append(buf, *r);
  }
  return got;
}

// Reads until the child closes its side; returns the last error.
boost::system::error_code ReadToEnd(InterpreterProcess &p,
                                    net::yield_context yield) {
  char buf[512];
  for (int i = 0; i < 100; ++i) {
    auto r = p.Read(yield, net::buffer(buf), 50ms);
    if (!r) {
      return r.error();
    }
  }
  return {};
}

} // namespace

TEST(InterpreterProcess, EchoesThroughRawTerminal) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"});
  ASSERT_TRUE(p.Start());
  EXPECT_TRUE(p.IsAlive());
  EXPECT_GT(p.Pid(), 0);
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("hello\n"))));
    // no terminal echo: exactly one copy comes back
    EXPECT_EQ(ReadAtLeast(p, yield, 6), "hello\n");
  });
}

TEST(InterpreterProcess, TerminalIsEightBitClean) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"});
  ASSERT_TRUE(p.Start());
  std::string all;
  for (int i = 0; i < 256; ++i) {
    all.push_back(static_cast<char>(i));
  }
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(all)));
    EXPECT_EQ(ReadAtLeast(p, yield, all.size()), all);
  });
}

TEST(InterpreterProcess, ReadTimesOutWithZeroBytes) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"});
  ASSERT_TRUE(p.Start());
  RunCoroutine(ioc, [&](net::yield_context yield) {
    char buf[64];
    const auto t0 = std::chrono::steady_clock::now();
    auto r = p.Read(yield, net::buffer(buf), 50ms);
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, 0u);
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 40ms);
    // a write still works after a timed out read
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("ok"))));
    EXPECT_EQ(ReadAtLeast(p, yield, 2), "ok");
  });
}

TEST(InterpreterProcess, MissingBinaryIsASpawnError) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/nonexistent/micropython"});
  auto st = p.Start();
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(),
            bridge::make_error_code(bridge::Error::process_spawn_failed));
  EXPECT_FALSE(p.IsAlive());
}

TEST(InterpreterProcess, MissingWorkingDirectoryIsASpawnError) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"}, "/nonexistent-dir");
  auto st = p.Start();
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(),
            bridge::make_error_code(bridge::Error::process_spawn_failed));
}

TEST(InterpreterProcess, RunsInWorkingDirectory) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/sh", "-c", "cd -P .; pwd; read l"}, "/");
  ASSERT_TRUE(p.Start());
  EXPECT_EQ(p.Cwd(), "/");
  RunCoroutine(ioc, [&](net::yield_context yield) {
    EXPECT_EQ(ReadAtLeast(p, yield, 2), "/\n");
  });
}

TEST(InterpreterProcess, CleanExitIsEndOfStream) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/sh", "-c", "read l; exit 0"});
  ASSERT_TRUE(p.Start());
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("x\n"))));
    EXPECT_EQ(ReadToEnd(p, yield),
              bridge::make_error_code(bridge::Error::end_of_stream));
    auto status = p.WaitForExit(yield, 1000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->kind, ExitKind::clean);
    EXPECT_TRUE(status->Check());
  });
  EXPECT_FALSE(p.IsAlive());
}

TEST(InterpreterProcess, NonZeroExitIsACrash) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/sh", "-c", "read l; exit 3"});
  ASSERT_TRUE(p.Start());
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("x\n"))));
    ReadToEnd(p, yield);
    auto status = p.WaitForExit(yield, 1000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->kind, ExitKind::crashed);
    EXPECT_EQ(status->Describe(), "exit code 3");
    ASSERT_FALSE(status->Check());
    EXPECT_EQ(status->Check().error(),
              bridge::make_error_code(bridge::Error::process_crashed));
  });
}

TEST(InterpreterProcess, SignalIsACrash) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/sh", "-c", "read l; kill -KILL $$"});
  ASSERT_TRUE(p.Start());
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("x\n"))));
    ReadToEnd(p, yield);
    auto status = p.WaitForExit(yield, 1000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->kind, ExitKind::crashed);
    EXPECT_NE(status->Describe().find("signal"), std::string::npos);
  });
}

TEST(InterpreterProcess, StopAndRestart) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"});
  ASSERT_TRUE(p.Start());
  const pid_t first = p.Pid();
  p.Stop();
  EXPECT_FALSE(p.IsAlive());
  ASSERT_TRUE(p.Restart());
  EXPECT_TRUE(p.IsAlive());
  EXPECT_NE(p.Pid(), first);
  RunCoroutine(ioc, [&](net::yield_context yield) {
    ASSERT_TRUE(p.Write(yield, net::buffer(std::string("again"))));
    EXPECT_EQ(ReadAtLeast(p, yield, 5), "again");
  });
}

TEST(InterpreterProcess, WriteAfterStopIsBrokenPipe) {
  net::io_context ioc;
  InterpreterProcess p(ioc, {"/bin/cat"});
  ASSERT_TRUE(p.Start());
  p.Stop();
  RunCoroutine(ioc, [&](net::yield_context yield) {
    auto st = p.Write(yield, net::buffer(std::string("x")));
    ASSERT_FALSE(st);
    EXPECT_EQ(st.error(), bridge::make_error_code(bridge::Error::broken_pipe));
  });
}

TEST(InterpreterProcess, ChildDoesNotInheritSockets) {
  net::io_context ioc;
  net::ip::tcp::acceptor listening(
      ioc, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  ASSERT_TRUE(listening.is_open());
  InterpreterProcess p(ioc, {"/bin/sh", "-c", "read l"});
  ASSERT_TRUE(p.Start());

  const auto fd_dir =
      std::filesystem::path("/proc") / std::to_string(p.Pid()) / "fd";
  std::size_t open_fds = 0;
  std::size_t sockets = 0;
  for (const auto &entry : std::filesystem::directory_iterator(fd_dir)) {
    ++open_fds;
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(entry.path(), ec);
    if (!ec && target.string().rfind("socket:", 0) == 0) {
      ++sockets;
    }
  }
  EXPECT_GE(open_fds, 3u);
  EXPECT_EQ(sockets, 0u);
}

TEST(InterpreterProcess, CoroutineStopKeepsTheReactorRunning) {
  net::io_context ioc;
  InterpreterProcess p(
      ioc, {"/bin/sh", "-c",
            "trap '' TERM; echo ready; while :; do sleep 0.1; done"});
  ASSERT_TRUE(p.Start());
  bool stopped = false;
  int ticks = 0;
  net::spawn(ioc, [&](net::yield_context yield) {
    EXPECT_EQ(ReadAtLeast(p, yield, 6), "ready\n");
    p.Stop(yield);
    stopped = true;
  });
  net::spawn(ioc, [&](net::yield_context yield) {
    while (!stopped) {
      retry::WaitAsync(ioc, yield, 100ms);
      ++ticks;
    }
  });
  ioc.run();
  EXPECT_FALSE(p.IsAlive());
  // SIGTERM is ignored, so the whole grace period passed on the io_context
  EXPECT_GE(ticks, 10);
  auto status = p.PollExit();
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->kind, ExitKind::crashed);
}
