#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/ledger/clock.hpp"
#include "core/ledger/role_table.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/model/types.hpp"

namespace tokenvest {

// Owns every vesting schedule, the beneficiary registry and the aggregate
// counters. Mutations on one beneficiary are serialized by that beneficiary's
// slot lock; different beneficiaries proceed concurrently.
//
// Vested amount for an active schedule at time t:
//   t <  start + cliff     -> 0
//   t >= start + duration  -> total
//   otherwise              -> floor(total * (t - start) / duration)
// The cliff gates the curve, it does not move its origin.
class VestingLedger {
public:
  // Called once per mutation with the event describing it. A non-ok result is
  // reported to the caller of the mutation. A settlement whose event was not
  // accepted is held and offered again before any later event; until it is
  // accepted every mutation fails with StorageFailed.
  using EventListener = std::function<Result(const LedgerEvent&)>;

  VestingLedger(std::string owner, const IClock& clock, ITokenLedger& token_ledger,
                std::string token_address = {});

  VestingLedger(const VestingLedger&) = delete;
  VestingLedger& operator=(const VestingLedger&) = delete;

  // Must be installed before the ledger is shared between threads.
  void set_event_listener(EventListener listener);

  Result create_schedule(std::string_view caller, std::string_view beneficiary, std::uint64_t total_amount,
                         std::uint64_t cliff_duration, std::uint64_t vesting_duration);
  ReleaseOutcome release(std::string_view caller, std::string_view beneficiary, std::int64_t now);
  Result revoke(std::string_view caller, std::string_view beneficiary, std::int64_t now);

  [[nodiscard]] std::uint64_t vested_amount(std::string_view beneficiary, std::int64_t now) const;
  [[nodiscard]] std::uint64_t get_releasable(std::string_view beneficiary, std::int64_t now) const;
  [[nodiscard]] std::optional<VestingSchedule> get_schedule(std::string_view beneficiary) const;
  [[nodiscard]] std::vector<VestingSchedule> schedule_history(std::string_view beneficiary) const;
  [[nodiscard]] LedgerStats get_stats() const;
  [[nodiscard]] std::vector<std::string> list_beneficiaries() const;

  Result transfer_ownership(std::string_view caller, std::string_view new_owner);
  Result update_token_address(std::string_view caller, std::string_view new_address);
  Result authorize_creator(std::string_view caller, std::string_view identity);
  Result deauthorize_creator(std::string_view caller, std::string_view identity);

  // Offers held settlement events to the listener again, oldest first.
  Result flush_unrecorded();
  [[nodiscard]] std::size_t unrecorded_event_count() const;

  [[nodiscard]] const IAuthorityLookup& authority() const { return roles_; }
  [[nodiscard]] std::vector<std::string> authorized_creators() const { return roles_.creators(); }
  [[nodiscard]] std::string token_address() const;

  // Applies a journaled event without authorization, token movement or
  // listener notification. Inconsistent events fail with JournalCorrupt.
  Result replay(const LedgerEvent& event);

  [[nodiscard]] static std::uint64_t vested_at(const VestingSchedule& schedule, std::int64_t now);

private:
  struct ScheduleSlot {
    mutable std::mutex mutex;
    VestingSchedule schedule;
    bool created = false;
    std::vector<VestingSchedule> history;
  };

  [[nodiscard]] ScheduleSlot* find_slot(std::string_view beneficiary) const;
  ScheduleSlot& find_or_insert_slot(std::string_view beneficiary);
  [[nodiscard]] bool is_administrator(std::string_view caller) const;
  [[nodiscard]] bool is_owner(std::string_view caller) const;

  Result publish(const LedgerEvent& event);
  Result publish_settlement(const LedgerEvent& event);
  Result flush_unrecorded_locked();
  [[nodiscard]] bool vesting_fits_locked(std::uint64_t amount) const;
  ReleaseOutcome settle_locked(ScheduleSlot& slot, std::string_view caller, std::int64_t now);
  void install_schedule_locked(ScheduleSlot& slot, VestingSchedule schedule);

  Result replay_created(const LedgerEvent& event);
  Result replay_released(const LedgerEvent& event);
  Result replay_revoked(const LedgerEvent& event);

  const IClock& clock_;
  ITokenLedger& token_ledger_;
  RoleTable roles_;
  EventListener listener_;

  std::mutex admin_mutex_;
  mutable std::mutex token_address_mutex_;
  std::string token_address_;

  mutable std::shared_mutex slots_mutex_;
  std::unordered_map<std::string, std::unique_ptr<ScheduleSlot>> slots_;

  mutable std::mutex registry_mutex_;
  std::vector<std::string> registry_;

  mutable std::mutex unrecorded_mutex_;
  std::deque<LedgerEvent> unrecorded_;

  // Held from the overflow check until total_vesting_ is bumped.
  std::mutex vesting_total_mutex_;
  std::atomic<std::uint64_t> total_vesting_{0};
  std::atomic<std::uint64_t> total_released_{0};
  std::atomic<std::size_t> active_count_{0};
};

}  // namespace tokenvest
