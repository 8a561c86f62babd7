#include "core/ledger/clock.hpp"

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace tokenvest {

std::int64_t SystemClock::now() const {
  return util::unix_timestamp_now();
}

ManualClock::ManualClock(std::int64_t start_unix) : now_(start_unix) {}

std::int64_t ManualClock::now() const {
  return now_.load();
}

void ManualClock::set(std::int64_t unix_ts) {
  now_.store(unix_ts);
}

void ManualClock::advance(std::int64_t seconds) {
  now_.fetch_add(seconds);
}

void ManualClock::advance_days(std::int64_t days) {
  now_.fetch_add(days * static_cast<std::int64_t>(kSecondsPerDay));
}

std::unique_ptr<IClock> make_system_clock() {
  return std::make_unique<SystemClock>();
}

}  // namespace tokenvest
