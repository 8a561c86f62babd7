#include "core/ledger/vesting_ledger.hpp"

#include <limits>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace tokenvest {
namespace {

constexpr std::uint64_t kMaxAmount = std::numeric_limits<std::uint64_t>::max();

Result validate_durations(std::uint64_t cliff_duration, std::uint64_t vesting_duration) {
  if (vesting_duration == 0) {
    return Result::failure(ErrorKind::InvalidDuration, "Vesting duration must be positive.");
  }
  if (cliff_duration > vesting_duration) {
    return Result::failure(ErrorKind::InvalidDuration, "Cliff duration exceeds vesting duration.");
  }
  if (vesting_duration > kMaxVestingDurationSeconds) {
    return Result::failure(ErrorKind::InvalidDuration, "Vesting duration exceeds the supported maximum.");
  }
  return Result::success();
}

bool start_fits(std::int64_t start_time, std::uint64_t vesting_duration) {
  return start_time <= std::numeric_limits<std::int64_t>::max() - static_cast<std::int64_t>(vesting_duration);
}

Result corrupt(std::string msg) {
  return Result::failure(ErrorKind::JournalCorrupt, std::move(msg));
}

}  // namespace

VestingLedger::VestingLedger(std::string owner, const IClock& clock, ITokenLedger& token_ledger,
                             std::string token_address)
    : clock_(clock), token_ledger_(token_ledger), roles_(std::move(owner)), token_address_(std::move(token_address)) {}

void VestingLedger::set_event_listener(EventListener listener) {
  listener_ = std::move(listener);
}

std::uint64_t VestingLedger::vested_at(const VestingSchedule& schedule, std::int64_t now) {
  const std::int64_t cliff_end = schedule.start_time + static_cast<std::int64_t>(schedule.cliff_duration);
  if (now < cliff_end) {
    return 0;
  }
  const std::int64_t vesting_end = schedule.start_time + static_cast<std::int64_t>(schedule.vesting_duration);
  if (now >= vesting_end) {
    return schedule.total_amount;
  }

  // floor(total * elapsed / duration) without a wide type. remainder * elapsed
  // stays below duration^2, which fits while duration <= kMaxVestingDurationSeconds.
  const auto elapsed = static_cast<std::uint64_t>(now - schedule.start_time);
  const std::uint64_t whole = schedule.total_amount / schedule.vesting_duration;
  const std::uint64_t remainder = schedule.total_amount % schedule.vesting_duration;
  return whole * elapsed + (remainder * elapsed) / schedule.vesting_duration;
}

Result VestingLedger::create_schedule(std::string_view caller, std::string_view beneficiary,
                                      std::uint64_t total_amount, std::uint64_t cliff_duration,
                                      std::uint64_t vesting_duration) {
  if (!is_administrator(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only an administrator may create vesting schedules.");
  }
  if (!util::is_valid_identity(beneficiary)) {
    return Result::failure(ErrorKind::InvalidBeneficiary, "Beneficiary identity is empty or malformed.");
  }
  if (total_amount == 0) {
    return Result::failure(ErrorKind::InvalidAmount, "Vesting amount must be positive.");
  }
  if (const Result durations = validate_durations(cliff_duration, vesting_duration); !durations.ok) {
    return durations;
  }

  const std::int64_t now = clock_.now();
  if (!start_fits(now, vesting_duration)) {
    return Result::failure(ErrorKind::InvalidDuration, "Vesting end time is not representable.");
  }

  ScheduleSlot& slot = find_or_insert_slot(beneficiary);
  std::lock_guard slot_lock(slot.mutex);
  if (slot.schedule.is_active) {
    return Result::failure(ErrorKind::ScheduleAlreadyActive,
                           "Beneficiary already has an active vesting schedule.");
  }

  std::lock_guard total_lock(vesting_total_mutex_);
  if (!vesting_fits_locked(total_amount)) {
    return Result::failure(ErrorKind::InvalidAmount, "Vesting amount would overflow the ledger total.");
  }

  const Result published = publish({
      .kind = LedgerEventKind::ScheduleCreated,
      .actor = std::string{caller},
      .subject = std::string{beneficiary},
      .amount = total_amount,
      .unix_ts = now,
      .cliff_duration = cliff_duration,
      .vesting_duration = vesting_duration,
      .detail = {},
  });
  if (!published.ok) {
    return published;
  }

  total_vesting_.fetch_add(total_amount);
  install_schedule_locked(slot, {
                                    .beneficiary = std::string{beneficiary},
                                    .total_amount = total_amount,
                                    .start_time = now,
                                    .cliff_duration = cliff_duration,
                                    .vesting_duration = vesting_duration,
                                    .released_amount = 0,
                                    .is_active = true,
                                });
  return Result::success("Vesting schedule created.", std::string{beneficiary});
}

ReleaseOutcome VestingLedger::release(std::string_view caller, std::string_view beneficiary, std::int64_t now) {
  if (caller.empty() || (caller != beneficiary && !is_administrator(caller))) {
    return {Result::failure(ErrorKind::Unauthorized, "Only the beneficiary or an administrator may release."), 0};
  }

  ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return {Result::failure(ErrorKind::NoActiveSchedule, "Beneficiary has no active vesting schedule."), 0};
  }

  std::lock_guard slot_lock(slot->mutex);
  if (!slot->schedule.is_active) {
    return {Result::failure(ErrorKind::NoActiveSchedule, "Beneficiary has no active vesting schedule."), 0};
  }
  return settle_locked(*slot, caller, now);
}

Result VestingLedger::revoke(std::string_view caller, std::string_view beneficiary, std::int64_t now) {
  if (!is_administrator(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only an administrator may revoke vesting schedules.");
  }

  ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return Result::failure(ErrorKind::NoActiveSchedule, "Beneficiary has no active vesting schedule.");
  }

  std::lock_guard slot_lock(slot->mutex);
  if (!slot->schedule.is_active) {
    return Result::failure(ErrorKind::NoActiveSchedule, "Beneficiary has no active vesting schedule.");
  }

  std::uint64_t settled = 0;
  if (vested_at(slot->schedule, now) > slot->schedule.released_amount) {
    const ReleaseOutcome settlement = settle_locked(*slot, caller, now);
    if (!settlement.result.ok) {
      return settlement.result;
    }
    settled = settlement.amount;
  }

  const Result published = publish({
      .kind = LedgerEventKind::ScheduleRevoked,
      .actor = std::string{caller},
      .subject = std::string{beneficiary},
      .amount = settled,
      .unix_ts = now,
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
  if (!published.ok) {
    return published;
  }

  slot->schedule.is_active = false;
  active_count_.fetch_sub(1);
  return Result::success("Vesting schedule revoked.", std::to_string(settled));
}

std::uint64_t VestingLedger::vested_amount(std::string_view beneficiary, std::int64_t now) const {
  const ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return 0;
  }
  std::lock_guard slot_lock(slot->mutex);
  if (!slot->schedule.is_active) {
    return 0;
  }
  return vested_at(slot->schedule, now);
}

std::uint64_t VestingLedger::get_releasable(std::string_view beneficiary, std::int64_t now) const {
  const ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return 0;
  }
  std::lock_guard slot_lock(slot->mutex);
  if (!slot->schedule.is_active) {
    return 0;
  }
  const std::uint64_t vested = vested_at(slot->schedule, now);
  return vested > slot->schedule.released_amount ? vested - slot->schedule.released_amount : 0;
}

std::optional<VestingSchedule> VestingLedger::get_schedule(std::string_view beneficiary) const {
  const ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return std::nullopt;
  }
  std::lock_guard slot_lock(slot->mutex);
  if (!slot->created) {
    return std::nullopt;
  }
  return slot->schedule;
}

std::vector<VestingSchedule> VestingLedger::schedule_history(std::string_view beneficiary) const {
  const ScheduleSlot* slot = find_slot(beneficiary);
  if (slot == nullptr) {
    return {};
  }
  std::lock_guard slot_lock(slot->mutex);
  return slot->history;
}

LedgerStats VestingLedger::get_stats() const {
  LedgerStats stats;
  {
    std::lock_guard lock(registry_mutex_);
    stats.beneficiary_count = registry_.size();
  }
  stats.active_schedule_count = active_count_.load();
  stats.total_vesting_amount = total_vesting_.load();
  stats.total_released_amount = total_released_.load();
  return stats;
}

std::vector<std::string> VestingLedger::list_beneficiaries() const {
  std::lock_guard lock(registry_mutex_);
  return registry_;
}

Result VestingLedger::transfer_ownership(std::string_view caller, std::string_view new_owner) {
  std::lock_guard admin_lock(admin_mutex_);
  if (!is_owner(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only the owner may transfer ownership.");
  }
  if (!util::is_valid_identity(new_owner)) {
    return Result::failure(ErrorKind::InvalidIdentity, "New owner must be a non-empty identity.");
  }

  const Result published = publish({
      .kind = LedgerEventKind::OwnershipTransferred,
      .actor = std::string{caller},
      .subject = std::string{new_owner},
      .amount = 0,
      .unix_ts = clock_.now(),
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = roles_.owner(),
  });
  if (!published.ok) {
    return published;
  }
  return roles_.set_owner(new_owner);
}

Result VestingLedger::update_token_address(std::string_view caller, std::string_view new_address) {
  std::lock_guard admin_lock(admin_mutex_);
  if (!is_owner(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only the owner may update the token address.");
  }
  if (!util::is_valid_identity(new_address)) {
    return Result::failure(ErrorKind::InvalidTokenAddress, "Token address must be a non-empty identifier.");
  }

  const Result published = publish({
      .kind = LedgerEventKind::TokenAddressUpdated,
      .actor = std::string{caller},
      .subject = std::string{new_address},
      .amount = 0,
      .unix_ts = clock_.now(),
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = token_address(),
  });
  if (!published.ok) {
    return published;
  }

  std::lock_guard lock(token_address_mutex_);
  token_address_ = std::string{new_address};
  return Result::success("Token address updated.", token_address_);
}

Result VestingLedger::authorize_creator(std::string_view caller, std::string_view identity) {
  std::lock_guard admin_lock(admin_mutex_);
  if (!is_owner(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only the owner may authorize creators.");
  }
  if (!util::is_valid_identity(identity)) {
    return Result::failure(ErrorKind::InvalidIdentity, "Creator must be a non-empty identity.");
  }
  if (roles_.has_role(identity, Role::AuthorizedCreator)) {
    return Result::success("Creator already authorized.");
  }

  const Result published = publish({
      .kind = LedgerEventKind::CreatorAuthorized,
      .actor = std::string{caller},
      .subject = std::string{identity},
      .amount = 0,
      .unix_ts = clock_.now(),
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
  if (!published.ok) {
    return published;
  }
  return roles_.grant_creator(identity);
}

Result VestingLedger::deauthorize_creator(std::string_view caller, std::string_view identity) {
  std::lock_guard admin_lock(admin_mutex_);
  if (!is_owner(caller)) {
    return Result::failure(ErrorKind::Unauthorized, "Only the owner may deauthorize creators.");
  }
  if (!roles_.has_role(identity, Role::AuthorizedCreator)) {
    return Result::failure(ErrorKind::InvalidIdentity, "Identity is not an authorized creator.");
  }

  const Result published = publish({
      .kind = LedgerEventKind::CreatorDeauthorized,
      .actor = std::string{caller},
      .subject = std::string{identity},
      .amount = 0,
      .unix_ts = clock_.now(),
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
  if (!published.ok) {
    return published;
  }
  return roles_.revoke_creator(identity);
}

std::string VestingLedger::token_address() const {
  std::lock_guard lock(token_address_mutex_);
  return token_address_;
}

Result VestingLedger::replay(const LedgerEvent& event) {
  switch (event.kind) {
    case LedgerEventKind::ScheduleCreated:
      return replay_created(event);
    case LedgerEventKind::TokensReleased:
      return replay_released(event);
    case LedgerEventKind::ScheduleRevoked:
      return replay_revoked(event);
    case LedgerEventKind::OwnershipTransferred: {
      const Result set = roles_.set_owner(event.subject);
      return set.ok ? set : corrupt("Replayed ownership transfer names an invalid owner.");
    }
    case LedgerEventKind::TokenAddressUpdated: {
      if (!util::is_valid_identity(event.subject)) {
        return corrupt("Replayed token address update names an invalid address.");
      }
      std::lock_guard lock(token_address_mutex_);
      token_address_ = event.subject;
      return Result::success();
    }
    case LedgerEventKind::CreatorAuthorized: {
      const Result granted = roles_.grant_creator(event.subject);
      return granted.ok ? granted : corrupt("Replayed creator authorization names an invalid identity.");
    }
    case LedgerEventKind::CreatorDeauthorized: {
      const Result revoked = roles_.revoke_creator(event.subject);
      return revoked.ok ? revoked : corrupt("Replayed creator deauthorization names an unknown creator.");
    }
  }
  return corrupt("Unknown ledger event kind.");
}

Result VestingLedger::replay_created(const LedgerEvent& event) {
  if (!util::is_valid_identity(event.subject) || event.amount == 0) {
    return corrupt("Replayed schedule creation has an invalid beneficiary or amount.");
  }
  if (!validate_durations(event.cliff_duration, event.vesting_duration).ok ||
      !start_fits(event.unix_ts, event.vesting_duration)) {
    return corrupt("Replayed schedule creation has invalid durations.");
  }

  ScheduleSlot& slot = find_or_insert_slot(event.subject);
  std::lock_guard slot_lock(slot.mutex);
  if (slot.schedule.is_active) {
    return corrupt("Replayed schedule creation targets an active schedule: " + event.subject);
  }
  {
    std::lock_guard total_lock(vesting_total_mutex_);
    if (!vesting_fits_locked(event.amount)) {
      return corrupt("Replayed schedule creation overflows the vesting total.");
    }
    total_vesting_.fetch_add(event.amount);
  }

  install_schedule_locked(slot, {
                                    .beneficiary = event.subject,
                                    .total_amount = event.amount,
                                    .start_time = event.unix_ts,
                                    .cliff_duration = event.cliff_duration,
                                    .vesting_duration = event.vesting_duration,
                                    .released_amount = 0,
                                    .is_active = true,
                                });
  return Result::success();
}

Result VestingLedger::replay_released(const LedgerEvent& event) {
  ScheduleSlot* slot = find_slot(event.subject);
  if (slot == nullptr) {
    return corrupt("Replayed release targets an unknown beneficiary: " + event.subject);
  }

  std::lock_guard slot_lock(slot->mutex);
  VestingSchedule& schedule = slot->schedule;
  if (!schedule.is_active || event.amount == 0) {
    return corrupt("Replayed release targets an inactive schedule: " + event.subject);
  }
  if (event.amount > schedule.total_amount - schedule.released_amount ||
      schedule.released_amount + event.amount > vested_at(schedule, event.unix_ts)) {
    return corrupt("Replayed release exceeds the vested amount for " + event.subject);
  }

  schedule.released_amount += event.amount;
  total_released_.fetch_add(event.amount);
  return Result::success();
}

Result VestingLedger::replay_revoked(const LedgerEvent& event) {
  ScheduleSlot* slot = find_slot(event.subject);
  if (slot == nullptr) {
    return corrupt("Replayed revocation targets an unknown beneficiary: " + event.subject);
  }

  std::lock_guard slot_lock(slot->mutex);
  if (!slot->schedule.is_active) {
    return corrupt("Replayed revocation targets an inactive schedule: " + event.subject);
  }
  slot->schedule.is_active = false;
  active_count_.fetch_sub(1);
  return Result::success();
}

VestingLedger::ScheduleSlot* VestingLedger::find_slot(std::string_view beneficiary) const {
  std::shared_lock lock(slots_mutex_);
  const auto it = slots_.find(std::string{beneficiary});
  return it == slots_.end() ? nullptr : it->second.get();
}

VestingLedger::ScheduleSlot& VestingLedger::find_or_insert_slot(std::string_view beneficiary) {
  if (ScheduleSlot* existing = find_slot(beneficiary); existing != nullptr) {
    return *existing;
  }

  std::unique_lock lock(slots_mutex_);
  auto [it, inserted] = slots_.try_emplace(std::string{beneficiary}, nullptr);
  if (inserted) {
    it->second = std::make_unique<ScheduleSlot>();
  }
  return *it->second;
}

bool VestingLedger::is_administrator(std::string_view caller) const {
  const IAuthorityLookup& lookup = authority();
  return lookup.has_role(caller, Role::Owner) || lookup.has_role(caller, Role::AuthorizedCreator);
}

bool VestingLedger::is_owner(std::string_view caller) const {
  return authority().has_role(caller, Role::Owner);
}

Result VestingLedger::flush_unrecorded() {
  std::lock_guard lock(unrecorded_mutex_);
  return flush_unrecorded_locked();
}

std::size_t VestingLedger::unrecorded_event_count() const {
  std::lock_guard lock(unrecorded_mutex_);
  return unrecorded_.size();
}

Result VestingLedger::flush_unrecorded_locked() {
  while (!unrecorded_.empty()) {
    if (!listener_) {
      unrecorded_.clear();
      break;
    }
    const Result published = listener_(unrecorded_.front());
    if (!published.ok) {
      return Result::failure(ErrorKind::StorageFailed,
                             std::to_string(unrecorded_.size()) +
                                 " settled release(s) are not journaled yet: " + published.message);
    }
    unrecorded_.pop_front();
  }
  return Result::success();
}

Result VestingLedger::publish(const LedgerEvent& event) {
  if (!listener_) {
    return Result::success();
  }
  std::lock_guard lock(unrecorded_mutex_);
  if (const Result flushed = flush_unrecorded_locked(); !flushed.ok) {
    return flushed;
  }
  Result published = listener_(event);
  if (!published.ok && published.error == ErrorKind::Internal) {
    published.error = ErrorKind::StorageFailed;
  }
  return published;
}

Result VestingLedger::publish_settlement(const LedgerEvent& event) {
  if (!listener_) {
    return Result::success();
  }
  std::lock_guard lock(unrecorded_mutex_);
  Result published = flush_unrecorded_locked();
  if (published.ok) {
    published = listener_(event);
  }
  if (!published.ok) {
    unrecorded_.push_back(event);
  }
  return published;
}

bool VestingLedger::vesting_fits_locked(std::uint64_t amount) const {
  return amount <= kMaxAmount - total_vesting_.load();
}

ReleaseOutcome VestingLedger::settle_locked(ScheduleSlot& slot, std::string_view caller, std::int64_t now) {
  VestingSchedule& schedule = slot.schedule;
  const std::uint64_t vested = vested_at(schedule, now);
  const std::uint64_t releasable = vested > schedule.released_amount ? vested - schedule.released_amount : 0;
  if (releasable == 0) {
    return {Result::failure(ErrorKind::NothingToRelease, "No vested tokens are available to release."), 0};
  }

  if (const Result flushed = flush_unrecorded(); !flushed.ok) {
    return {flushed, 0};
  }

  const Result transfer = token_ledger_.transfer(schedule.beneficiary, releasable);
  if (!transfer.ok) {
    return {Result::failure(ErrorKind::TransferFailed, "Token transfer failed: " + transfer.message), 0};
  }

  schedule.released_amount += releasable;
  total_released_.fetch_add(releasable);

  const Result published = publish_settlement({
      .kind = LedgerEventKind::TokensReleased,
      .actor = std::string{caller},
      .subject = schedule.beneficiary,
      .amount = releasable,
      .unix_ts = now,
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
  if (!published.ok) {
    return {Result::failure(ErrorKind::StorageFailed, "Released " + std::to_string(releasable) +
                                                          " tokens but the event was not recorded: " +
                                                          published.message),
            releasable};
  }
  return {Result::success("Tokens released.", std::to_string(releasable)), releasable};
}

void VestingLedger::install_schedule_locked(ScheduleSlot& slot, VestingSchedule schedule) {
  if (slot.created) {
    slot.history.push_back(slot.schedule);
  }
  const std::string beneficiary = schedule.beneficiary;
  slot.schedule = std::move(schedule);
  slot.created = true;
  active_count_.fetch_add(1);

  std::lock_guard lock(registry_mutex_);
  registry_.push_back(beneficiary);
}

}  // namespace tokenvest
