#pragma once

#include "voucher/v1/voucher.pb.h"

namespace voucher::v1 {

inline constexpr int kVoucherVersion = 1;

}
