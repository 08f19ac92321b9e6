#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace voucher::util {

/*
  UUID helpers

  Transaction ids and the device id are RFC4122 v4 UUIDs in string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace voucher::util
