#pragma once

#include <string>

#include "voucher/v1.hpp"

namespace voucher::codec {

/*
  Transport strings for the QR channel.

  Vouchers and address payloads travel as protobuf JSON. Printed field
  order follows field numbers, so encoding is canonical and stable.
*/

std::string EncodeVoucher(const voucher::v1::Voucher& voucher);

// Throws util::MalformedVoucher on parse failure, a missing required field
// or an amount that is not a positive decimal.
voucher::v1::Voucher DecodeVoucher(const std::string& text);

std::string EncodeAddress(const std::string& address);

// Accepts {"type":"address","address":...} or a bare address.
// Throws util::MalformedAddress otherwise.
std::string DecodeAddress(const std::string& text);

// Canonical message signed by the sender:
// {"from","to","amount","timestamp","tempAddress"} in that order.
std::string CanonicalSigningMessage(const std::string& from, const std::string& to, const std::string& amount, int64_t timestamp_ms,
                                    const std::string& ephemeral_address);

} // namespace voucher::codec
