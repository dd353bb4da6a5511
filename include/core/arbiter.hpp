#pragma once

#include "core/errors.hpp"
#include "logging/log.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

// SessionArbiter
// Grants one client session at a time the right to talk to the interpreter.
// Both listeners go through the same arbiter; they never talk to each other.
// Threading model:
// - Called from the reactor thread in the bridge; the mutex keeps it safe to
//   inspect from other threads (tests, shutdown)
// - The terminate hook is invoked outside the lock
class SessionArbiter {
public:
  using TerminateHook = std::function<void()>;

  bridge::Status Acquire(std::uint64_t id, TerminateHook terminate) {
    std::lock_guard<std::mutex> lock(m_);
    if (active_) {
      logging::Debug("arbiter") << "session " << id << " rejected, session "
                                << *active_ << " is active";
      return bridge::Fail(bridge::Error::session_busy);
    }
    active_ = id;
    terminate_ = std::move(terminate);
    logging::Debug("arbiter") << "session " << id << " acquired";
    return {};
  }

  // Idle again if `id` holds the rights; a stale id is ignored.
  void Release(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(m_);
    if (!active_ || *active_ != id) {
      return;
    }
    active_.reset();
    terminate_ = nullptr;
    logging::Debug("arbiter") << "session " << id << " released";
  }

  // Interpreter crashed: back to idle and tell the active session to go.
  void ForceRelease() {
    TerminateHook hook;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!active_) {
        return;
      }
      logging::Info("arbiter") << "force releasing session " << *active_;
      active_.reset();
      hook = std::move(terminate_);
      terminate_ = nullptr;
    }
    if (hook) {
      hook();
    }
  }

  bool IsIdle() const {
    std::lock_guard<std::mutex> lock(m_);
    return !active_.has_value();
  }

  std::optional<std::uint64_t> ActiveId() const {
    std::lock_guard<std::mutex> lock(m_);
    return active_;
  }

private:
  mutable std::mutex m_;
  std::optional<std::uint64_t> active_;
  TerminateHook terminate_;
};
