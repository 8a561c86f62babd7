#include "core/ledger/token_ledger.hpp"

#include <limits>

namespace tokenvest {

CustodyTokenLedger::CustodyTokenLedger(std::uint64_t custody_balance) : custody_(custody_balance) {}

Result CustodyTokenLedger::transfer(std::string_view to, std::uint64_t amount) {
  std::lock_guard lock(mutex_);
  return move_locked(to, amount);
}

Result CustodyTokenLedger::deposit(std::uint64_t amount) {
  std::lock_guard lock(mutex_);
  if (amount > std::numeric_limits<std::uint64_t>::max() - custody_) {
    return Result::failure(ErrorKind::InvalidAmount, "Custody deposit would overflow the custody balance.");
  }
  custody_ += amount;
  return Result::success("Custody funded.", std::to_string(custody_));
}

Result CustodyTokenLedger::record_settled(std::string_view to, std::uint64_t amount) {
  std::lock_guard lock(mutex_);
  return move_locked(to, amount);
}

std::uint64_t CustodyTokenLedger::custody_balance() const {
  std::lock_guard lock(mutex_);
  return custody_;
}

std::uint64_t CustodyTokenLedger::balance_of(std::string_view holder) const {
  std::lock_guard lock(mutex_);
  const auto it = balances_.find(std::string{holder});
  return it == balances_.end() ? 0 : it->second;
}

std::uint64_t CustodyTokenLedger::transfer_count() const {
  std::lock_guard lock(mutex_);
  return transfer_count_;
}

Result CustodyTokenLedger::move_locked(std::string_view to, std::uint64_t amount) {
  if (to.empty()) {
    return Result::failure(ErrorKind::TransferFailed, "Transfer recipient is empty.");
  }
  if (amount == 0) {
    return Result::failure(ErrorKind::TransferFailed, "Transfer amount must be positive.");
  }
  if (amount > custody_) {
    return Result::failure(ErrorKind::TransferFailed, "insufficient custodial balance");
  }

  auto& balance = balances_[std::string{to}];
  if (amount > std::numeric_limits<std::uint64_t>::max() - balance) {
    return Result::failure(ErrorKind::TransferFailed, "Recipient balance would overflow.");
  }

  custody_ -= amount;
  balance += amount;
  ++transfer_count_;
  return Result::success("Transferred.", std::to_string(amount));
}

}  // namespace tokenvest
