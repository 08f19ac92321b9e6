#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voucher::util {

/*
  Fixed-point asset amount.

  Stored as a count of micro-units (6 fractional digits, the precision of
  the settled asset). Parsing never rounds: input with more than
  kDecimals fractional digits is rejected.
*/
class Amount {
 public:
  static constexpr int     kDecimals = 6;
  static constexpr int64_t kScale    = 1'000'000;

  constexpr Amount() = default;

  static constexpr Amount FromMicros(int64_t micros) {
    return Amount(micros);
  }

  static std::optional<Amount> Parse(std::string_view text);

  // Throws ValidationError when text is not a well-formed amount.
  static Amount ParseOrThrow(std::string_view text);

  constexpr int64_t Micros() const {
    return micros_;
  }

  constexpr bool IsPositive() const {
    return micros_ > 0;
  }

  // Canonical rendering, always kDecimals fractional digits ("40.000000").
  std::string ToString() const;

  // Throw ValidationError on overflow.
  Amount operator+(Amount other) const;
  Amount operator-(Amount other) const;

  Amount& operator+=(Amount other) {
    *this = *this + other;
    return *this;
  }

  constexpr auto operator<=>(const Amount&) const = default;

 private:
  constexpr explicit Amount(int64_t micros) : micros_(micros) {
  }

  int64_t micros_ = 0;
};

} // namespace voucher::util
