#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

namespace tokenvest {

class IClock {
public:
  virtual ~IClock() = default;

  // Unix seconds.
  [[nodiscard]] virtual std::int64_t now() const = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] std::int64_t now() const override;
};

class ManualClock final : public IClock {
public:
  explicit ManualClock(std::int64_t start_unix);

  [[nodiscard]] std::int64_t now() const override;

  void set(std::int64_t unix_ts);
  void advance(std::int64_t seconds);
  void advance_days(std::int64_t days);

private:
  std::atomic<std::int64_t> now_;
};

std::unique_ptr<IClock> make_system_clock();

}  // namespace tokenvest
