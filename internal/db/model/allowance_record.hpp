#pragma once

#include <string>

namespace voucher::db::model {

/*
  Per-wallet offline spending allowance.

  wallet_address is stored lower-cased. spent <= limit holds after every
  committed reservation.
*/
struct AllowanceRecord {
  std::string wallet_address;
  std::string limit = "0.000000";
  std::string spent = "0.000000";
};

} // namespace voucher::db::model
