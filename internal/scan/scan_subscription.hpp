#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "internal/scan/scan_session.hpp"
#include "internal/scan/scanner.hpp"

namespace voucher::scan {

using DispositionCallback = std::function<void(const std::string& text, DecodeDisposition disposition)>;

/*
  Explicit, cancellable subscription of a ScanSession to a Scanner.

  Start() subscribes; Cancel() stops the scanner, waits for an in-flight
  attempt and closes the session. A cancelled subscription can be started
  again. Destruction cancels.
*/
class ScanSubscription {
 public:
  ScanSubscription(std::shared_ptr<Scanner> scanner, std::shared_ptr<ScanSession> session, DispositionCallback on_disposition = {},
                   ErrorCallback on_error = {});
  ~ScanSubscription();

  ScanSubscription(const ScanSubscription&)            = delete;
  ScanSubscription& operator=(const ScanSubscription&) = delete;

  void Start();
  void Cancel();

  bool Active() const;

 private:
  std::shared_ptr<Scanner>     scanner_;
  std::shared_ptr<ScanSession> session_;
  DispositionCallback          on_disposition_;
  ErrorCallback                on_error_;

  mutable std::mutex mutex_;
  bool               active_ = false;
};

} // namespace voucher::scan
