#pragma once

#include <string>
#include <string_view>

// ReplTracker
// Follows whether the interpreter currently sits in raw REPL mode, by watching
// both directions of the traffic. The soft reboot emulation needs this to know
// which banner the client expects after a restart.
// - Ctrl-A from the client enters raw REPL, Ctrl-B leaves it
// - the interpreter's "raw REPL; CTRL-B to exit" banner confirms raw mode
// - a friendly ">>>" prompt while in raw mode means it left raw REPL
// Only ever touched from the reactor thread.
class ReplTracker {
public:
  static constexpr char kCtrlA = '\x01';
  static constexpr char kCtrlB = '\x02';
  static constexpr std::string_view kRawBanner = "raw REPL; CTRL-B to exit";
  static constexpr std::string_view kFriendlyPrompt = ">>>";

  void Reset() {
    raw_ = false;
    tail_.clear();
  }

  void OnClientInput(std::string_view data) {
    for (char ch : data) {
      if (ch == kCtrlA) {
        raw_ = true;
        tail_.clear();
      } else if (ch == kCtrlB) {
        raw_ = false;
        tail_.clear();
      }
    }
  }

  void OnInterpreterOutput(std::string_view data) {
    // keep a short tail so markers split across reads are still seen
    std::string window = tail_;
    window.append(data);
    if (window.find(kRawBanner) != std::string::npos) {
      raw_ = true;
    } else if (raw_ && window.find(kFriendlyPrompt) != std::string::npos) {
      raw_ = false;
    }
    const std::size_t keep = kRawBanner.size() - 1;
    tail_ = window.size() > keep ? window.substr(window.size() - keep)
                                 : std::move(window);
  }

  bool InRawRepl() const { return raw_; }

private:
  bool raw_ = false;
  std::string tail_;
};
