#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/clock.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/model/types.hpp"
#include "core/service/vesting_service.hpp"

namespace tokenvest {

class CoreApi {
public:
  Result init(const InitConfig& config, std::unique_ptr<IClock> clock = nullptr,
              std::unique_ptr<ITokenLedger> token_ledger = nullptr);

  Result create_schedule(std::string_view caller, const ScheduleDraft& draft);
  ReleaseOutcome release(std::string_view caller, std::string_view beneficiary);
  Result revoke(std::string_view caller, std::string_view beneficiary);

  Result transfer_ownership(std::string_view caller, std::string_view new_owner);
  Result update_token_address(std::string_view caller, std::string_view new_address);
  Result authorize_creator(std::string_view caller, std::string_view identity);
  Result deauthorize_creator(std::string_view caller, std::string_view identity);

  std::optional<VestingSchedule> get_schedule(std::string_view beneficiary) const;
  std::vector<VestingSchedule> schedule_history(std::string_view beneficiary) const;
  std::uint64_t get_releasable_amount(std::string_view beneficiary) const;
  std::uint64_t vested_amount(std::string_view beneficiary) const;
  LedgerStats get_stats() const;
  std::vector<std::string> list_beneficiaries() const;

  LedgerStatusReport status() const;
  std::vector<EventEnvelope> journal_events() const;
  Result verify_journal() const;

private:
  VestingService service_;
};

}  // namespace tokenvest
