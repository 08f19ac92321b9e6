#include "voucher_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/crypto/address.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

namespace voucher::codec {

namespace {

constexpr const char* kAddressPayloadType = "address";

std::string PrintJson(const google::protobuf::Message& message, const char* what) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = false;
  options.always_print_primitive_fields = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error(std::string("failed to encode ") + what + ": " + std::string(status.message()));
  }
  return out;
}

bool ParseJson(const std::string& text, google::protobuf::Message* message, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(text, message, options);
  if (!status.ok()) {
    *error = std::string(status.message());
    return false;
  }
  return true;
}

std::string MissingField(const voucher::v1::Voucher& v) {
  if (v.version() == 0) return "version";
  if (v.ephemeral_private_key().empty()) return "privateKey";
  if (v.amount().empty()) return "amount";
  if (v.from_address().empty()) return "from";
  if (v.to_address().empty()) return "to";
  if (v.timestamp() == 0) return "timestamp";
  if (v.signature().empty()) return "signature";
  return {};
}

} // namespace

std::string EncodeVoucher(const voucher::v1::Voucher& voucher) {
  return PrintJson(voucher, "voucher");
}

voucher::v1::Voucher DecodeVoucher(const std::string& text) {
  voucher::v1::Voucher voucher;
  std::string          error;
  if (!ParseJson(text, &voucher, &error)) {
    throw util::MalformedVoucher("failed to decode voucher: " + error);
  }

  if (auto missing = MissingField(voucher); !missing.empty()) {
    throw util::MalformedVoucher("invalid voucher data: missing required field '" + missing + "'");
  }

  auto amount = util::Amount::Parse(voucher.amount());
  if (!amount || !amount->IsPositive()) {
    throw util::MalformedVoucher("invalid voucher data: amount '" + voucher.amount() + "' is not a positive decimal");
  }

  return voucher;
}

std::string EncodeAddress(const std::string& address) {
  voucher::v1::AddressPayload payload;
  payload.set_type(kAddressPayloadType);
  payload.set_address(address);
  return PrintJson(payload, "address");
}

std::string DecodeAddress(const std::string& text) {
  voucher::v1::AddressPayload payload;
  std::string                 error;
  if (ParseJson(text, &payload, &error)) {
    if (payload.type() == kAddressPayloadType && crypto::IsAddress(payload.address())) {
      return payload.address();
    }
    error = "not an address payload";
  }

  // bare address fallback
  if (crypto::IsAddress(text)) {
    return text;
  }

  throw util::MalformedAddress("failed to decode address: " + error);
}

std::string CanonicalSigningMessage(const std::string& from, const std::string& to, const std::string& amount, int64_t timestamp_ms,
                                    const std::string& ephemeral_address) {
  voucher::v1::SigningPayload payload;
  payload.set_from_address(from);
  payload.set_to_address(to);
  payload.set_amount(amount);
  payload.set_timestamp(timestamp_ms);
  payload.set_ephemeral_address(ephemeral_address);
  return PrintJson(payload, "signing payload");
}

} // namespace voucher::codec
