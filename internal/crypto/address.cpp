#include "address.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/hex.hpp"

namespace voucher::crypto {

namespace {

constexpr size_t kAddressHexDigits = 40;

char Lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

bool IsAddress(std::string_view text) {
  if (text.size() != kAddressHexDigits + 2) return false;
  if (text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) return false;
  return std::all_of(text.begin() + 2, text.end(), util::IsHexDigit);
}

bool AddressEquals(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return Lower(x) == Lower(y); });
}

std::string NormalizeAddress(std::string_view address) {
  std::string out(address);
  std::transform(out.begin(), out.end(), out.begin(), Lower);
  return out;
}

} // namespace voucher::crypto
