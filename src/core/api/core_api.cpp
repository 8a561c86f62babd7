#include "core/api/core_api.hpp"

#include <utility>

namespace tokenvest {

Result CoreApi::init(const InitConfig& config, std::unique_ptr<IClock> clock,
                     std::unique_ptr<ITokenLedger> token_ledger) {
  return service_.init(config, std::move(clock), std::move(token_ledger));
}

Result CoreApi::create_schedule(std::string_view caller, const ScheduleDraft& draft) {
  return service_.create_schedule(caller, draft);
}

ReleaseOutcome CoreApi::release(std::string_view caller, std::string_view beneficiary) {
  return service_.release(caller, beneficiary);
}

Result CoreApi::revoke(std::string_view caller, std::string_view beneficiary) {
  return service_.revoke(caller, beneficiary);
}

Result CoreApi::transfer_ownership(std::string_view caller, std::string_view new_owner) {
  return service_.transfer_ownership(caller, new_owner);
}

Result CoreApi::update_token_address(std::string_view caller, std::string_view new_address) {
  return service_.update_token_address(caller, new_address);
}

Result CoreApi::authorize_creator(std::string_view caller, std::string_view identity) {
  return service_.authorize_creator(caller, identity);
}

Result CoreApi::deauthorize_creator(std::string_view caller, std::string_view identity) {
  return service_.deauthorize_creator(caller, identity);
}

std::optional<VestingSchedule> CoreApi::get_schedule(std::string_view beneficiary) const {
  return service_.get_schedule(beneficiary);
}

std::vector<VestingSchedule> CoreApi::schedule_history(std::string_view beneficiary) const {
  return service_.schedule_history(beneficiary);
}

std::uint64_t CoreApi::get_releasable_amount(std::string_view beneficiary) const {
  return service_.get_releasable_amount(beneficiary);
}

std::uint64_t CoreApi::vested_amount(std::string_view beneficiary) const {
  return service_.vested_amount(beneficiary);
}

LedgerStats CoreApi::get_stats() const {
  return service_.get_stats();
}

std::vector<std::string> CoreApi::list_beneficiaries() const {
  return service_.list_beneficiaries();
}

LedgerStatusReport CoreApi::status() const {
  return service_.status();
}

std::vector<EventEnvelope> CoreApi::journal_events() const {
  return service_.journal_events();
}

Result CoreApi::verify_journal() const {
  return service_.verify_journal();
}

}  // namespace tokenvest
