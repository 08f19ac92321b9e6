#pragma once

#include <ostream>
#include <string>

namespace voucher::scan {

// Displays an encoded payload as something scannable.
class Renderer {
 public:
  virtual ~Renderer() = default;

  virtual void Render(const std::string& payload) = 0;
};

// Writes the raw payload, one per line, for an external QR encoder.
class ConsoleRenderer final : public Renderer {
 public:
  explicit ConsoleRenderer(std::ostream& out) : out_(out) {
  }

  void Render(const std::string& payload) override {
    out_ << payload << '\n';
    out_.flush();
  }

 private:
  std::ostream& out_;
};

} // namespace voucher::scan
