#pragma once

#include "core/errors.hpp"
#include "logging/log.hpp"
#include "net/backoff.hpp"
#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/spawn.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <pty.h>
#include <string>
#include <sys/wait.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace net = boost::asio;

enum class ExitKind { clean, crashed };

struct ExitStatus {
  int raw = 0;
  ExitKind kind = ExitKind::crashed;

  static ExitStatus FromWait(int status) {
    ExitStatus s;
    s.raw = status;
    s.kind = (WIFEXITED(status) && WEXITSTATUS(status) == 0) ? ExitKind::clean
                                                             : ExitKind::crashed;
    return s;
  }

  std::string Describe() const {
    if (WIFEXITED(raw)) {
      return "exit code " + std::to_string(WEXITSTATUS(raw));
    }
    if (WIFSIGNALED(raw)) {
      return std::string("signal ") + ::strsignal(WTERMSIG(raw));
    }
    return "status " + std::to_string(raw);
  }

  // Error::process_crashed unless the child exited with status 0.
  bridge::Status Check() const {
    if (kind == ExitKind::clean) {
      return {};
    }
    return bridge::Fail(bridge::Error::process_crashed);
  }
};

// InterpreterProcess
// Owns the interpreter child and the master side of its pseudo-terminal. The
// child's stdin, stdout and stderr are the slave side in raw mode, so bytes
// pass through untouched and the interpreter still sees a terminal (the unix
// port only starts its REPL on a tty).
// The master is held twice (a dup'd descriptor for writing) so a read
// timeout or cancellation never aborts a pending write.
// Threading model:
// - All I/O is asynchronous on the io_context passed in; callers are
//   coroutines on the reactor thread
// - At most one Read() is outstanding at a time (the arbiter guarantees a
//   single active session)
class InterpreterProcess {
public:
  static constexpr std::chrono::milliseconds kSettle{20};
  static constexpr std::chrono::milliseconds kStopGrace{2000};

  InterpreterProcess(net::io_context &ioc, std::vector<std::string> argv,
                     std::string cwd = {})
      : ioc_(ioc), argv_(std::move(argv)), cwd_(std::move(cwd)),
        read_timer_(ioc) {}

  ~InterpreterProcess() { Stop(); }

  InterpreterProcess(const InterpreterProcess &) = delete;
  InterpreterProcess &operator=(const InterpreterProcess &) = delete;

  // Spawns the child. Fails with Error::process_spawn_failed if the binary
  // cannot be executed or the child exits within kSettle.
  bridge::Status Start() {
    if (argv_.empty()) {
      logging::Error("process") << "empty interpreter command line";
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }
    std::vector<char *> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto &a : argv_) {
      cargv.push_back(a.data());
    }
    cargv.push_back(nullptr);

    const long open_max = ::sysconf(_SC_OPEN_MAX);
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
      logging::Error("process") << "pipe2: " << std::strerror(errno);
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }

    struct termios tio {};
    ::cfmakeraw(&tio);
    tio.c_cc[VMIN] = 1;
    tio.c_cc[VTIME] = 0;
    ::cfsetspeed(&tio, B115200);

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, &tio, nullptr);
    if (pid < 0) {
      const int err = errno;
      ::close(err_pipe[0]);
      ::close(err_pipe[1]);
      logging::Error("process") << "forkpty: " << std::strerror(err);
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }
    if (pid == 0) {
      // child: only async-signal-safe calls from here on
      ::close(err_pipe[0]);
      CloseInheritedDescriptors(err_pipe[1], open_max);
      if (!cwd_.empty() && ::chdir(cwd_.c_str()) != 0) {
        ReportChildError(err_pipe[1]);
      }
      ::execvp(cargv[0], cargv.data());
      ReportChildError(err_pipe[1]);
    }

    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
      n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0) {
      int status = 0;
      ::waitpid(pid, &status, 0);
      ::close(master);
      logging::Error("process") << "cannot execute " << argv_.front() << ": "
                                << std::strerror(child_errno);
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }

    std::this_thread::sleep_for(kSettle);
    int status = 0;
    if (::waitpid(pid, &status, WNOHANG) == pid) {
      ::close(master);
      logging::Error("process") << argv_.front() << " exited immediately ("
                                << ExitStatus::FromWait(status).Describe()
                                << ")";
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }

    (void)::fcntl(master, F_SETFD, FD_CLOEXEC);
    const int input = ::fcntl(master, F_DUPFD_CLOEXEC, 0);
    if (input < 0) {
      const int err = errno;
      ::close(master);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      logging::Error("process") << "dup: " << std::strerror(err);
      return bridge::Fail(bridge::Error::process_spawn_failed);
    }
    pty_.emplace(ioc_, master);
    pty_in_.emplace(ioc_, input);
    pid_ = pid;
    exit_.reset();
    logging::Info("process") << "started " << argv_.front() << " pid " << pid_;
    return {};
  }

  // Reads what the interpreter produced, waiting at most `timeout`. Returns 0
  // bytes on timeout, Error::end_of_stream once the child closed its side, and
  // operation_aborted after CancelIo().
  bridge::Result<std::size_t> Read(net::yield_context yield,
                                   net::mutable_buffer buf,
                                   std::chrono::milliseconds timeout) {
    if (!pty_) {
      return bridge::Fail(bridge::Error::end_of_stream);
    }
    const std::uint64_t gen = ++read_gen_;
    reading_ = true;
    timed_out_ = false;
    read_timer_.expires_after(timeout);
    read_timer_.async_wait([this, gen](const boost::system::error_code &ec) {
      if (!ec && gen == read_gen_ && reading_ && pty_) {
        timed_out_ = true;
        boost::system::error_code ignored;
        pty_->cancel(ignored);
      }
    });
    boost::system::error_code ec;
    std::size_t n = pty_->async_read_some(buf, yield[ec]);
    reading_ = false;
    read_timer_.cancel();
    if (!ec) {
      return n;
    }
    if (ec == net::error::operation_aborted) {
      if (timed_out_) {
        return std::size_t{0};
      }
      return std::unexpected(ec);
    }
    if (ec == net::error::eof || ec == boost::system::errc::io_error) {
      // EIO on the master: every slave descriptor is closed
      return bridge::Fail(bridge::Error::end_of_stream);
    }
    return std::unexpected(ec);
  }

  bridge::Status Write(net::yield_context yield, net::const_buffer data) {
    if (!pty_in_) {
      return bridge::Fail(bridge::Error::broken_pipe);
    }
    boost::system::error_code ec;
    net::async_write(*pty_in_, data, yield[ec]);
    if (ec) {
      logging::Debug("process") << "write failed: " << ec.message();
      return bridge::Fail(bridge::Error::broken_pipe);
    }
    return {};
  }

  // Aborts outstanding Read() and Write() calls (the owning session is going
  // away). The descriptors stay open for the next session.
  void CancelIo() {
    boost::system::error_code ignored;
    if (pty_ && reading_) {
      pty_->cancel(ignored);
    }
    if (pty_in_) {
      pty_in_->cancel(ignored);
    }
  }

  // Closes the terminal, then SIGTERM, then SIGKILL after kStopGrace.
  // Blocks the calling thread; sessions use Stop(yield).
  void Stop() {
    CloseTerminal();
    if (pid_ <= 0) {
      return;
    }
    if (!PollExit()) {
      ::kill(pid_, SIGTERM);
      const auto deadline = std::chrono::steady_clock::now() + kStopGrace;
      while (!PollExit() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      if (!PollExit()) {
        Kill();
      }
    }
    Reaped();
  }

  // Stop() for coroutines: the grace period is waited out on the io_context,
  // so accept loops and other sessions keep running meanwhile.
  void Stop(net::yield_context yield) {
    CloseTerminal();
    if (pid_ <= 0) {
      return;
    }
    if (!PollExit()) {
      ::kill(pid_, SIGTERM);
      if (!WaitForExit(yield, kStopGrace)) {
        Kill();
      }
    }
    Reaped();
  }

  bridge::Status Restart() {
    logging::Info("process") << "restarting " << argv_.front();
    Stop();
    return Start();
  }

  // Non-blocking reap. Returns the exit status once the child has exited.
  std::optional<ExitStatus> PollExit() {
    if (exit_ || pid_ <= 0) {
      return exit_;
    }
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
      exit_ = ExitStatus::FromWait(status);
    } else if (r < 0) {
      // not our child any more (already reaped elsewhere)
      exit_ = ExitStatus{-1, ExitKind::crashed};
    }
    return exit_;
  }

  // Polls for the exit of a child that just closed its terminal.
  std::optional<ExitStatus> WaitForExit(net::yield_context yield,
                                        std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
      if (auto st = PollExit()) {
        return st;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        return std::nullopt;
      }
      retry::WaitAsync(ioc_, yield, std::chrono::milliseconds(5));
    }
  }

  bool IsAlive() { return pid_ > 0 && pty_.has_value() && !PollExit(); }

  pid_t Pid() const { return pid_; }
  const std::vector<std::string> &Argv() const { return argv_; }
  const std::string &Cwd() const { return cwd_; }

private:
  void CloseTerminal() {
    boost::system::error_code ignored;
    if (pty_in_) {
      pty_in_->close(ignored);
      pty_in_.reset();
    }
    if (pty_) {
      pty_->close(ignored);
      pty_.reset();
    }
  }

  void Kill() {
    logging::Warn("process") << "pid " << pid_ << " ignored SIGTERM, killing";
    ::kill(pid_, SIGKILL);
    int status = 0;
    if (::waitpid(pid_, &status, 0) == pid_) {
      exit_ = ExitStatus::FromWait(status);
    }
  }

  void Reaped() {
    logging::Info("process") << "pid " << pid_ << " stopped ("
                             << (exit_ ? exit_->Describe() : "unknown")
                             << ")";
    pid_ = -1;
  }

  // Child side, between fork and exec: the bridge's listening and client
  // sockets must not leak into the interpreter. Keeps stdio and `keep`.
  static void CloseInheritedDescriptors(int keep, long open_max) {
    const unsigned int k = static_cast<unsigned int>(keep);
    const bool closed =
        (k <= 3 || ::close_range(3, k - 1, 0) == 0) &&
        ::close_range(std::max(k + 1, 3u), ~0U, 0) == 0;
    if (closed) {
      return;
    }
    // kernels without close_range
    for (long fd = 3; fd < open_max; ++fd) {
      if (fd != keep) {
        ::close(static_cast<int>(fd));
      }
    }
  }

  [[noreturn]] static void ReportChildError(int fd) {
    const int err = errno;
    (void)!::write(fd, &err, sizeof(err));
    ::_exit(127);
  }

  net::io_context &ioc_;
  std::vector<std::string> argv_;
  std::string cwd_;
  std::optional<net::posix::stream_descriptor> pty_;    // interpreter output
  std::optional<net::posix::stream_descriptor> pty_in_; // interpreter input
  net::steady_timer read_timer_;
  std::uint64_t read_gen_ = 0;
  bool reading_ = false;
  bool timed_out_ = false;
  pid_t pid_ = -1;
  std::optional<ExitStatus> exit_;
};
