#pragma once

#include <string>
#include <string_view>

namespace voucher::crypto {

// "0x" followed by 40 hex digits, either case.
bool IsAddress(std::string_view text);

bool AddressEquals(std::string_view a, std::string_view b);

// Lower-case form used as storage key.
std::string NormalizeAddress(std::string_view address);

} // namespace voucher::crypto
