#include "amount.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace voucher::util {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool AccumulateDigits(std::string_view digits, int64_t* value) {
  for (char c : digits) {
    if (!IsDigit(c)) return false;
    const int64_t d = c - '0';
    if (*value > (std::numeric_limits<int64_t>::max() - d) / 10) return false;
    *value = *value * 10 + d;
  }
  return true;
}

} // namespace

std::optional<Amount> Amount::Parse(std::string_view text) {
  if (text.empty()) return std::nullopt;

  const auto             dot      = text.find('.');
  const std::string_view whole    = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty()) return std::nullopt;
  if (dot != std::string_view::npos && fraction.empty()) return std::nullopt;
  if (fraction.size() > static_cast<size_t>(kDecimals)) return std::nullopt;

  int64_t units = 0;
  if (!AccumulateDigits(whole, &units)) return std::nullopt;
  if (units > std::numeric_limits<int64_t>::max() / kScale) return std::nullopt;

  int64_t frac = 0;
  if (!AccumulateDigits(fraction, &frac)) return std::nullopt;
  for (size_t i = fraction.size(); i < static_cast<size_t>(kDecimals); ++i) {
    frac *= 10;
  }

  const int64_t scaled = units * kScale;
  if (scaled > std::numeric_limits<int64_t>::max() - frac) return std::nullopt;
  return Amount(scaled + frac);
}

Amount Amount::ParseOrThrow(std::string_view text) {
  auto parsed = Parse(text);
  if (!parsed) {
    throw ValidationError("invalid amount '" + std::string(text) + "'");
  }
  return *parsed;
}

std::string Amount::ToString() const {
  const bool negative = micros_ < 0;
  // magnitude as unsigned so INT64_MIN renders correctly
  const uint64_t magnitude = negative ? static_cast<uint64_t>(-(micros_ + 1)) + 1 : static_cast<uint64_t>(micros_);

  std::string fraction = std::to_string(magnitude % kScale);
  fraction.insert(0, kDecimals - fraction.size(), '0');

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / kScale);
  out += '.';
  out += fraction;
  return out;
}

Amount Amount::operator+(Amount other) const {
  int64_t sum = 0;
  if (__builtin_add_overflow(micros_, other.micros_, &sum)) {
    throw ValidationError("amount overflow");
  }
  return Amount(sum);
}

Amount Amount::operator-(Amount other) const {
  int64_t diff = 0;
  if (__builtin_sub_overflow(micros_, other.micros_, &diff)) {
    throw ValidationError("amount overflow");
  }
  return Amount(diff);
}

} // namespace voucher::util
