#pragma once

#include <cstdint>

// ISession: what the listeners and the arbiter need from an admitted client
// session, independent of its wire protocol. Start() launches the session's
// coroutines; Terminate() asks it to close (interpreter crash, bridge
// shutdown) and may be called more than once.
class ISession {
public:
  virtual ~ISession() = default;
  virtual void Start() = 0;
  virtual void Terminate() = 0;
  virtual std::uint64_t Id() const = 0;
};
