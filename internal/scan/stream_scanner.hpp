#pragma once

#include <atomic>
#include <istream>
#include <mutex>
#include <thread>

#include "internal/scan/scanner.hpp"

namespace voucher::scan {

/*
  Scanner over a stream of decoded strings, one per line (e.g. the raw
  output of a barcode reader piped to stdin).

  Lines are read on a background thread. Blank lines are skipped and a
  trailing '\r' is dropped. End of input is reported through on_error as
  "end of input". The stop flag is checked between lines, so Stop() waits
  for a blocked read to complete. Called from a callback, Stop() behaves
  like RequestStop(): the read loop ends without joining and the thread is
  joined by the next Start() or the destructor.
*/
class StreamScanner final : public Scanner {
 public:
  static constexpr const char* kEndOfInput = "end of input";

  explicit StreamScanner(std::istream& in);
  ~StreamScanner() override;

  void Start(DecodedCallback on_decoded, ErrorCallback on_error) override;
  void Stop() override;

  void RequestStop() {
    stop_requested_ = true;
  }

  bool Exhausted() const {
    return exhausted_;
  }

 private:
  void ReadLoop(DecodedCallback on_decoded, ErrorCallback on_error);

  std::istream&     in_;
  std::mutex        mutex_;
  std::thread       reader_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> exhausted_{false};
};

} // namespace voucher::scan
