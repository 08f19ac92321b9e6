#pragma once

#include <functional>
#include <string>

namespace voucher::scan {

using DecodedCallback = std::function<void(const std::string& text)>;
using ErrorCallback   = std::function<void(const std::string& error)>;

/*
  Source of decoded code strings (camera, barcode reader, stdin).

  on_decoded may fire many times for the same physical code. Callbacks may
  arrive on a scanner-owned thread. After Stop() returns no further
  callbacks are delivered.
*/
class Scanner {
 public:
  virtual ~Scanner() = default;

  virtual void Start(DecodedCallback on_decoded, ErrorCallback on_error) = 0;

  virtual void Stop() = 0;
};

} // namespace voucher::scan
