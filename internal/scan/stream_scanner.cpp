#include "stream_scanner.hpp"

#include <string>

namespace voucher::scan {

StreamScanner::StreamScanner(std::istream& in) : in_(in) {
}

StreamScanner::~StreamScanner() {
  Stop();
}

void StreamScanner::Start(DecodedCallback on_decoded, ErrorCallback on_error) {
  if (reader_.get_id() == std::this_thread::get_id()) return;
  std::scoped_lock lock(mutex_);
  if (reader_.joinable()) {
    if (!stop_requested_) return;
    reader_.join();
  }

  stop_requested_ = false;
  reader_         = std::thread(&StreamScanner::ReadLoop, this, std::move(on_decoded), std::move(on_error));
}

void StreamScanner::Stop() {
  stop_requested_ = true;
  // from a callback: the loop ends once the callback returns, joined later
  if (reader_.get_id() == std::this_thread::get_id()) return;

  std::scoped_lock lock(mutex_);
  if (reader_.joinable()) reader_.join();
}

void StreamScanner::ReadLoop(DecodedCallback on_decoded, ErrorCallback on_error) {
  std::string line;
  while (!stop_requested_) {
    if (!std::getline(in_, line)) {
      exhausted_ = true;
      if (on_error) on_error(in_.bad() ? "input stream error" : kEndOfInput);
      return;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    if (on_decoded) on_decoded(line);
  }
}

} // namespace voucher::scan
