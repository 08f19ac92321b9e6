#include "scan_session.hpp"

#include <exception>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"

namespace voucher::scan {

using model::ScanState;

std::string_view ToString(DecodeDisposition disposition) {
  switch (disposition) {
    case DecodeDisposition::kAccepted:
      return "accepted";
    case DecodeDisposition::kRejected:
      return "rejected";
    case DecodeDisposition::kIgnoredInFlight:
      return "ignored_in_flight";
    case DecodeDisposition::kIgnoredKnownBad:
      return "ignored_known_bad";
    case DecodeDisposition::kIgnoredDuplicate:
      return "ignored_duplicate";
    case DecodeDisposition::kIgnoredTerminal:
      return "ignored_terminal";
  }
  return "unknown";
}

ScanSession::ScanSession(AttemptHandler handler, ScanMode mode) : handler_(std::move(handler)), mode_(mode) {
  if (!handler_) throw std::invalid_argument("scan session requires a handler");
}

DecodeDisposition ScanSession::OnDecoded(const std::string& text) {
  {
    std::scoped_lock lock(mutex_);
    if (state_ == ScanState::kTerminal) return DecodeDisposition::kIgnoredTerminal;
    if (state_ == ScanState::kProcessing) return DecodeDisposition::kIgnoredInFlight;
    if (last_rejected_ && *last_rejected_ == text) return DecodeDisposition::kIgnoredKnownBad;
    if (mode_ == ScanMode::kContinuous && last_accepted_ && *last_accepted_ == text) return DecodeDisposition::kIgnoredDuplicate;

    TransitionLocked(ScanState::kProcessing);
    last_seen_      = text;
    handler_thread_ = std::this_thread::get_id();
  }

  AttemptOutcome outcome;
  try {
    outcome = handler_(text);
  } catch (const std::exception& e) {
    VOUCHER_LOG_ERROR("scan attempt failed", {observability::StringField("error", e.what())});
    outcome = AttemptOutcome{false, e.what()};
  }

  std::scoped_lock lock(mutex_);
  last_message_   = outcome.message;
  handler_thread_ = {};
  if (outcome.accepted) {
    last_accepted_ = text;
    TransitionLocked(mode_ == ScanMode::kSingle ? ScanState::kTerminal : ScanState::kIdle);
  } else {
    last_rejected_ = text;
    TransitionLocked(ScanState::kIdle);
  }
  if (close_pending_) {
    close_pending_ = false;
    CloseLocked();
  }
  state_changed_.notify_all();
  return outcome.accepted ? DecodeDisposition::kAccepted : DecodeDisposition::kRejected;
}

void ScanSession::Close() {
  std::unique_lock lock(mutex_);
  // called by the running handler: close once it returns
  if (state_ == ScanState::kProcessing && handler_thread_ == std::this_thread::get_id()) {
    close_pending_ = true;
    return;
  }
  // never abandon a ledger write half way
  state_changed_.wait(lock, [this] { return state_ != ScanState::kProcessing; });
  CloseLocked();
  state_changed_.notify_all();
}

void ScanSession::CloseLocked() {
  last_rejected_.reset();
  TransitionLocked(ScanState::kIdle);
  ++close_generation_;
}

model::ScanState ScanSession::State() const {
  std::scoped_lock lock(mutex_);
  return state_;
}

void ScanSession::WaitForTerminal() {
  std::unique_lock lock(mutex_);
  const auto       generation = close_generation_;
  state_changed_.wait(lock, [&] { return state_ == ScanState::kTerminal || close_generation_ != generation; });
}

std::optional<std::string> ScanSession::LastRejected() const {
  std::scoped_lock lock(mutex_);
  return last_rejected_;
}

std::optional<std::string> ScanSession::LastSeen() const {
  std::scoped_lock lock(mutex_);
  return last_seen_;
}

std::optional<std::string> ScanSession::LastMessage() const {
  std::scoped_lock lock(mutex_);
  return last_message_;
}

void ScanSession::TransitionLocked(ScanState to) {
  if (!model::CanTransition(state_, to)) {
    throw std::logic_error(std::string("invalid scan transition ") + model::ToString(state_) + " -> " + model::ToString(to));
  }
  state_ = to;
}

} // namespace voucher::scan
