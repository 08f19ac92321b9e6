#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "internal/model/scan_state.hpp"

namespace voucher::scan {

enum class ScanMode {
  kSingle,     // success ends the session
  kContinuous, // success returns to idle for the next code
};

enum class DecodeDisposition {
  kAccepted,
  kRejected,
  kIgnoredInFlight,
  kIgnoredKnownBad,
  kIgnoredDuplicate,
  kIgnoredTerminal,
};

std::string_view ToString(DecodeDisposition disposition);

// Outcome of one attempt on a decoded string.
struct AttemptOutcome {
  bool        accepted = false;
  std::string message;
};

using AttemptHandler = std::function<AttemptOutcome(const std::string& text)>;

/*
  ScanSession

  Turns a repeating stream of decoded strings into at most one handler
  call per distinct code:

    - Idle: a string equal to the last rejected one is ignored; otherwise
      go to Processing and run the handler
    - Processing: every decode is ignored until the handler returns
    - handler accepted: Terminal (single) or Idle (continuous; the accepted
      string is then ignored while it keeps arriving)
    - handler rejected or threw: remember the string as last rejected, Idle

  The handler runs without the session lock held. Close() waits for an
  in-flight handler, then clears the last rejected string and returns to
  Idle. Called from inside the handler, Close() returns at once and the
  close is applied when the handler returns.
*/
class ScanSession {
 public:
  ScanSession(AttemptHandler handler, ScanMode mode);

  DecodeDisposition OnDecoded(const std::string& text);

  void Close();

  model::ScanState State() const;

  // Blocks until the session reaches Terminal or is closed.
  void WaitForTerminal();

  std::optional<std::string> LastRejected() const;
  std::optional<std::string> LastSeen() const;
  std::optional<std::string> LastMessage() const;

  ScanMode Mode() const {
    return mode_;
  }

 private:
  void TransitionLocked(model::ScanState to);
  void CloseLocked();

  AttemptHandler handler_;
  ScanMode       mode_;

  mutable std::mutex      mutex_;
  std::condition_variable state_changed_;

  model::ScanState           state_ = model::ScanState::kIdle;
  std::optional<std::string> last_rejected_;
  std::optional<std::string> last_seen_;
  std::optional<std::string> last_accepted_;
  std::optional<std::string> last_message_;
  unsigned long              close_generation_ = 0;
  std::thread::id            handler_thread_;
  bool                       close_pending_ = false;
};

} // namespace voucher::scan
