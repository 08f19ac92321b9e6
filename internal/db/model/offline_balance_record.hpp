#pragma once

#include <string>

namespace voucher::db::model {

// Singleton row. Amounts are canonical 6-decimal strings.
struct OfflineBalanceRecord {
  std::string sent     = "0.000000";
  std::string received = "0.000000";
};

} // namespace voucher::db::model
