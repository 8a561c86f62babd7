#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/crypto/crypto.hpp"
#include "core/ledger/clock.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/ledger/vesting_ledger.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace tokenvest {

class VestingService {
public:
  // clock and token_ledger default to the system clock and an in-process
  // CustodyTokenLedger funded with config.custody_balance.
  Result init(const InitConfig& config, std::unique_ptr<IClock> clock = nullptr,
              std::unique_ptr<ITokenLedger> token_ledger = nullptr);

  Result create_schedule(std::string_view caller, const ScheduleDraft& draft);
  ReleaseOutcome release(std::string_view caller, std::string_view beneficiary);
  Result revoke(std::string_view caller, std::string_view beneficiary);

  Result transfer_ownership(std::string_view caller, std::string_view new_owner);
  Result update_token_address(std::string_view caller, std::string_view new_address);
  Result authorize_creator(std::string_view caller, std::string_view identity);
  Result deauthorize_creator(std::string_view caller, std::string_view identity);

  [[nodiscard]] std::optional<VestingSchedule> get_schedule(std::string_view beneficiary) const;
  [[nodiscard]] std::vector<VestingSchedule> schedule_history(std::string_view beneficiary) const;
  [[nodiscard]] std::uint64_t get_releasable_amount(std::string_view beneficiary) const;
  [[nodiscard]] std::uint64_t vested_amount(std::string_view beneficiary) const;
  [[nodiscard]] LedgerStats get_stats() const;
  [[nodiscard]] std::vector<std::string> list_beneficiaries() const;

  [[nodiscard]] LedgerStatusReport status() const;
  [[nodiscard]] std::vector<EventEnvelope> journal_events() const;
  Result verify_journal() const;

  [[nodiscard]] bool initialized() const { return ledger_ != nullptr; }
  [[nodiscard]] const InitConfig& config() const { return config_; }

private:
  Result ensure_initialized(std::string_view operation) const;
  Result load_config_file(std::string_view path);
  Result write_config_file() const;
  Result replay_journal();
  Result record_genesis();
  Result persist_ledger_event(const LedgerEvent& event);
  EventEnvelope make_event(const LedgerEvent& event) const;
  [[nodiscard]] bool signature_ok(const EventEnvelope& envelope) const;

  InitConfig config_;
  CryptoEngine crypto_;
  Store store_;
  mutable std::mutex journal_mutex_;

  std::unique_ptr<IClock> clock_;
  std::unique_ptr<ITokenLedger> token_ledger_;
  CustodyTokenLedger* custody_ = nullptr;
  std::unique_ptr<VestingLedger> ledger_;
};

}  // namespace tokenvest
