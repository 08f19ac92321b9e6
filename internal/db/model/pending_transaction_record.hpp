#pragma once

#include <cstdint>
#include <string>

#include "voucher/v1.hpp"

namespace voucher::db::model {

/*
  Persistent pending transaction row.

  - voucher_json is the canonical voucher encoding, kept for settlement.
  - voucher_signature is indexed; a received voucher is redeemed at most
    once per device.
  - amount is the canonical 6-decimal string.
*/

struct PendingTransactionRecord {
  std::string id; // UUID

  voucher::v1::TransactionType type = voucher::v1::TRANSACTION_TYPE_UNSPECIFIED;

  std::string from_address;
  std::string to_address;
  std::string amount;

  std::string voucher_json;
  std::string voucher_signature;

  int64_t timestamp_ms = 0;

  voucher::v1::TransactionStatus status = voucher::v1::TRANSACTION_STATUS_UNSPECIFIED;

  // empty until settled on-chain
  std::string settlement_tx_hash;

  std::string device_id;
};

} // namespace voucher::db::model
