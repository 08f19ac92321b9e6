#include "time.hpp"

namespace voucher::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace voucher::util
