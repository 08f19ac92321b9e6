#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voucher::util {

// Lower-case, no prefix.
std::string HexEncode(std::span<const std::uint8_t> data);

// Accepts an optional 0x prefix and either case.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

bool IsHexDigit(char c);

} // namespace voucher::util
