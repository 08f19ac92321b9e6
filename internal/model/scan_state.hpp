#pragma once

#include <cstdint>

namespace voucher::model {

enum class ScanState : std::uint8_t {
  kIdle       = 0,
  kProcessing = 1,
  kTerminal   = 2,
};

constexpr bool IsTerminal(ScanState state) {
  return state == ScanState::kTerminal;
}

// Idle -> Processing -> (Idle | Terminal). Any state may return to Idle on close.
constexpr bool CanTransition(ScanState from, ScanState to) {
  if (to == ScanState::kIdle) {
    return true;
  }
  if (from == ScanState::kIdle) {
    return to == ScanState::kProcessing;
  }
  if (from == ScanState::kProcessing) {
    return to == ScanState::kTerminal;
  }
  return false;
}

constexpr const char* ToString(ScanState state) {
  switch (state) {
    case ScanState::kIdle:
      return "idle";
    case ScanState::kProcessing:
      return "processing";
    case ScanState::kTerminal:
      return "terminal";
  }
  return "unknown";
}

} // namespace voucher::model
