#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/model/types.hpp"

namespace tokenvest {

// Token movement capability consumed by the vesting core. A non-ok Result
// means no tokens moved.
class ITokenLedger {
public:
  virtual ~ITokenLedger() = default;

  virtual Result transfer(std::string_view to, std::uint64_t amount) = 0;
};

// In-process custodial ledger: vesting payouts are debited from a single
// custody balance and credited to the holder.
class CustodyTokenLedger final : public ITokenLedger {
public:
  explicit CustodyTokenLedger(std::uint64_t custody_balance);

  Result transfer(std::string_view to, std::uint64_t amount) override;

  Result deposit(std::uint64_t amount);
  // Re-applies a transfer already recorded in the journal.
  Result record_settled(std::string_view to, std::uint64_t amount);

  [[nodiscard]] std::uint64_t custody_balance() const;
  [[nodiscard]] std::uint64_t balance_of(std::string_view holder) const;
  [[nodiscard]] std::uint64_t transfer_count() const;

private:
  Result move_locked(std::string_view to, std::uint64_t amount);

  mutable std::mutex mutex_;
  std::uint64_t custody_ = 0;
  std::unordered_map<std::string, std::uint64_t> balances_;
  std::uint64_t transfer_count_ = 0;
};

}  // namespace tokenvest
