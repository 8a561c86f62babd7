#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <ranges>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/crypto/crypto.hpp"
#include "core/ledger/clock.hpp"
#include "core/ledger/token_ledger.hpp"
#include "core/ledger/vesting_ledger.hpp"
#include "core/model/app_meta.hpp"
#include "core/storage/store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

constexpr std::int64_t kStart = 1'700'000'000;
constexpr std::int64_t kDay = 86'400;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "tokenvest-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

std::int64_t at_day(std::int64_t days) {
  return kStart + days * kDay;
}

class FlakyTokenLedger final : public tokenvest::ITokenLedger {
public:
  tokenvest::Result transfer(std::string_view to, std::uint64_t amount) override {
    ++attempts;
    if (fail) {
      return tokenvest::Result::failure(tokenvest::ErrorKind::TransferFailed, "token contract rejected transfer");
    }
    last_to = std::string{to};
    delivered += amount;
    return tokenvest::Result::success();
  }

  bool fail = false;
  int attempts = 0;
  std::string last_to;
  std::uint64_t delivered = 0;
};

void test_linear_curve_with_cliff() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(10'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);

  const tokenvest::Result created = ledger.create_schedule("owner", "alice", 1200, 30 * kDay, 365 * kDay);
  assert(created.ok);

  assert(ledger.vested_amount("alice", kStart) == 0);
  assert(ledger.vested_amount("alice", at_day(29)) == 0);
  assert(ledger.get_releasable("alice", at_day(29)) == 0);
  assert(ledger.vested_amount("alice", at_day(30)) == 98);

  const tokenvest::ReleaseOutcome early = ledger.release("alice", "alice", at_day(29));
  assert(!early.result.ok);
  assert(early.result.error == tokenvest::ErrorKind::NothingToRelease);

  const tokenvest::ReleaseOutcome first = ledger.release("alice", "alice", at_day(30));
  assert(first.result.ok);
  assert(first.amount == 98);
  assert(custody.balance_of("alice") == 98);
  assert(custody.custody_balance() == 10'000 - 98);

  const tokenvest::ReleaseOutcome again = ledger.release("alice", "alice", at_day(30));
  assert(again.result.error == tokenvest::ErrorKind::NothingToRelease);
  assert(again.amount == 0);

  assert(ledger.vested_amount("alice", at_day(365)) == 1200);
  assert(ledger.vested_amount("alice", at_day(400)) == 1200);
  assert(ledger.vested_amount("alice", at_day(5000)) == 1200);

  const tokenvest::ReleaseOutcome rest = ledger.release("owner", "alice", at_day(365));
  assert(rest.result.ok);
  assert(rest.amount == 1102);
  assert(custody.balance_of("alice") == 1200);
  assert(custody.transfer_count() == 2);
  assert(ledger.get_releasable("alice", at_day(400)) == 0);

  assert(custody.deposit(100).ok);
  assert(custody.custody_balance() == 10'000 - 1200 + 100);
  assert(custody.deposit(std::numeric_limits<std::uint64_t>::max()).error == tokenvest::ErrorKind::InvalidAmount);

  const auto schedule = ledger.get_schedule("alice");
  assert(schedule.has_value());
  assert(schedule->released_amount == 1200);
  assert(schedule->start_time == kStart);
  assert(schedule->is_active);

  const tokenvest::LedgerStats stats = ledger.get_stats();
  assert(stats.beneficiary_count == 1);
  assert(stats.active_schedule_count == 1);
  assert(stats.total_vesting_amount == 1200);
  assert(stats.total_released_amount == 1200);

  assert(!ledger.get_schedule("nobody").has_value());
  assert(ledger.vested_amount("nobody", at_day(400)) == 0);
}

void test_vested_amount_is_monotonic() {
  const tokenvest::VestingSchedule schedule{
      .beneficiary = "bob",
      .total_amount = 7'777'777,
      .start_time = kStart,
      .cliff_duration = 13 * kDay,
      .vesting_duration = 97 * kDay,
      .released_amount = 0,
      .is_active = true,
  };

  std::uint64_t previous = 0;
  for (std::int64_t t = kStart - kDay; t <= at_day(100); t += 3'607) {
    const std::uint64_t vested = tokenvest::VestingLedger::vested_at(schedule, t);
    assert(vested >= previous);
    assert(vested <= schedule.total_amount);
    previous = vested;
  }
  assert(previous == schedule.total_amount);

  const tokenvest::VestingSchedule huge{
      .beneficiary = "whale",
      .total_amount = std::numeric_limits<std::uint64_t>::max(),
      .start_time = kStart,
      .cliff_duration = 0,
      .vesting_duration = 2 * kDay,
      .released_amount = 0,
      .is_active = true,
  };
  assert(tokenvest::VestingLedger::vested_at(huge, at_day(1)) == std::numeric_limits<std::uint64_t>::max() / 2);

  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  constexpr std::uint64_t kSpan = tokenvest::kMaxVestingDurationSeconds;
  const tokenvest::VestingSchedule longest{
      .beneficiary = "whale",
      .total_amount = kMax,
      .start_time = kStart,
      .cliff_duration = 0,
      .vesting_duration = kSpan,
      .released_amount = 0,
      .is_active = true,
  };
  // floor(max * (span - 1) / span) == max - ceil(max / span)
  const std::uint64_t ceil_share = kMax / kSpan + (kMax % kSpan != 0 ? 1 : 0);
  const std::int64_t last_second = kStart + static_cast<std::int64_t>(kSpan) - 1;
  assert(tokenvest::VestingLedger::vested_at(longest, last_second) == kMax - ceil_share);
  assert(tokenvest::VestingLedger::vested_at(longest, last_second + 1) == kMax);
}

void test_create_validation_order() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(0);
  tokenvest::VestingLedger ledger("owner", clock, custody);

  assert(ledger.create_schedule("mallory", "alice", 100, 0, kDay).error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.create_schedule("mallory", "", 0, 0, 0).error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.create_schedule("owner", "", 100, 0, kDay).error == tokenvest::ErrorKind::InvalidBeneficiary);
  assert(ledger.create_schedule("owner", "al ice", 100, 0, kDay).error == tokenvest::ErrorKind::InvalidBeneficiary);
  assert(ledger.create_schedule("owner", "alice", 0, 0, 0).error == tokenvest::ErrorKind::InvalidAmount);
  assert(ledger.create_schedule("owner", "alice", 100, 0, 0).error == tokenvest::ErrorKind::InvalidDuration);
  assert(ledger.create_schedule("owner", "alice", 100, 2 * kDay, kDay).error ==
         tokenvest::ErrorKind::InvalidDuration);
  assert(ledger.create_schedule("owner", "alice", 100, 0, tokenvest::kMaxVestingDurationSeconds + 1).error ==
         tokenvest::ErrorKind::InvalidDuration);

  tokenvest::LedgerStats stats = ledger.get_stats();
  assert(stats.beneficiary_count == 0);
  assert(stats.total_vesting_amount == 0);

  // Cliff equal to duration is allowed.
  assert(ledger.create_schedule("owner", "alice", 100, kDay, kDay).ok);
  assert(ledger.create_schedule("owner", "alice", 5, 0, kDay).error == tokenvest::ErrorKind::ScheduleAlreadyActive);
  assert(ledger.get_schedule("alice")->total_amount == 100);

  assert(ledger.create_schedule("owner", "bob", std::numeric_limits<std::uint64_t>::max(), 0, kDay).error ==
         tokenvest::ErrorKind::InvalidAmount);
  assert(!ledger.get_schedule("bob").has_value());

  stats = ledger.get_stats();
  assert(stats.beneficiary_count == 1);
  assert(stats.active_schedule_count == 1);
  assert(stats.total_vesting_amount == 100);
}

void test_release_authorization() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(1'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);
  assert(ledger.create_schedule("owner", "alice", 1'000, 0, 10 * kDay).ok);

  const tokenvest::ReleaseOutcome stranger = ledger.release("mallory", "alice", at_day(5));
  assert(stranger.result.error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.get_schedule("alice")->released_amount == 0);

  const tokenvest::ReleaseOutcome missing = ledger.release("owner", "carol", at_day(5));
  assert(missing.result.error == tokenvest::ErrorKind::NoActiveSchedule);

  const tokenvest::ReleaseOutcome own = ledger.release("alice", "alice", at_day(5));
  assert(own.result.ok);
  assert(own.amount == 500);
  assert(own.result.data == "500");
}

void test_transfer_failure_leaves_state_untouched() {
  tokenvest::ManualClock clock(kStart);
  FlakyTokenLedger tokens;
  tokenvest::VestingLedger ledger("owner", clock, tokens);
  assert(ledger.create_schedule("owner", "alice", 1200, 30 * kDay, 365 * kDay).ok);

  tokens.fail = true;
  const tokenvest::ReleaseOutcome failed = ledger.release("alice", "alice", at_day(30));
  assert(!failed.result.ok);
  assert(failed.result.error == tokenvest::ErrorKind::TransferFailed);
  assert(failed.amount == 0);
  assert(tokens.attempts == 1);
  assert(ledger.get_schedule("alice")->released_amount == 0);
  assert(ledger.get_stats().total_released_amount == 0);
  assert(ledger.get_releasable("alice", at_day(30)) == 98);

  tokens.fail = false;
  const tokenvest::ReleaseOutcome retried = ledger.release("alice", "alice", at_day(30));
  assert(retried.result.ok);
  assert(retried.amount == 98);
  assert(tokens.last_to == "alice");
  assert(tokens.delivered == 98);
  assert(ledger.get_stats().total_released_amount == 98);

  tokens.fail = true;
  const tokenvest::Result revoke = ledger.revoke("owner", "alice", at_day(60));
  assert(revoke.error == tokenvest::ErrorKind::TransferFailed);
  assert(ledger.get_schedule("alice")->is_active);
  assert(ledger.get_stats().active_schedule_count == 1);
}

void test_revoke_settles_vested_tokens() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(5'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);
  assert(ledger.create_schedule("owner", "alice", 1200, 30 * kDay, 365 * kDay).ok);
  assert(ledger.create_schedule("owner", "bob", 800, 30 * kDay, 365 * kDay).ok);

  assert(ledger.revoke("alice", "alice", at_day(100)).error == tokenvest::ErrorKind::Unauthorized);

  const tokenvest::Result revoked = ledger.revoke("owner", "alice", at_day(100));
  assert(revoked.ok);
  assert(revoked.data == "328");
  assert(custody.balance_of("alice") == 328);

  const auto alice = ledger.get_schedule("alice");
  assert(alice.has_value());
  assert(!alice->is_active);
  assert(alice->released_amount == 328);
  assert(ledger.get_releasable("alice", at_day(365)) == 0);
  assert(ledger.vested_amount("alice", at_day(365)) == 0);
  assert(ledger.release("alice", "alice", at_day(365)).result.error == tokenvest::ErrorKind::NoActiveSchedule);
  assert(ledger.revoke("owner", "alice", at_day(365)).error == tokenvest::ErrorKind::NoActiveSchedule);

  // Nothing vested before the cliff, so nothing is paid out.
  const tokenvest::Result revoked_early = ledger.revoke("owner", "bob", at_day(10));
  assert(revoked_early.ok);
  assert(revoked_early.data == "0");
  assert(custody.balance_of("bob") == 0);

  const tokenvest::LedgerStats stats = ledger.get_stats();
  assert(stats.active_schedule_count == 0);
  assert(stats.beneficiary_count == 2);
  assert(stats.total_vesting_amount == 2000);
  assert(stats.total_released_amount == 328);
}

void test_recreation_after_revoke_archives_schedule() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(10'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);
  assert(ledger.create_schedule("owner", "alice", 1000, 0, 10 * kDay).ok);
  assert(ledger.revoke("owner", "alice", at_day(4)).ok);

  clock.set(at_day(20));
  assert(ledger.create_schedule("owner", "alice", 300, 0, 3 * kDay).ok);

  const auto history = ledger.schedule_history("alice");
  assert(history.size() == 1);
  assert(history.front().total_amount == 1000);
  assert(history.front().released_amount == 400);
  assert(!history.front().is_active);

  const auto current = ledger.get_schedule("alice");
  assert(current->is_active);
  assert(current->start_time == at_day(20));
  assert(current->released_amount == 0);

  const std::vector<std::string> registry = ledger.list_beneficiaries();
  assert(registry.size() == 2);
  assert(std::ranges::count(registry, std::string{"alice"}) == 2);

  assert(ledger.release("alice", "alice", at_day(23)).amount == 300);
  const tokenvest::LedgerStats stats = ledger.get_stats();
  assert(stats.total_vesting_amount == 1300);
  assert(stats.total_released_amount == 700);
  assert(stats.total_released_amount <= stats.total_vesting_amount);
}

void test_event_listener_failures() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(10'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);

  bool journal_up = false;
  std::vector<std::uint64_t> totals_seen_by_journal;
  std::vector<tokenvest::LedgerEvent> journal;
  ledger.set_event_listener([&](const tokenvest::LedgerEvent& event) {
    totals_seen_by_journal.push_back(ledger.get_stats().total_vesting_amount);
    if (!journal_up) {
      return tokenvest::Result::failure("disk full");
    }
    journal.push_back(event);
    return tokenvest::Result::success();
  });

  const tokenvest::Result rejected = ledger.create_schedule("owner", "alice", 1000, 0, 10 * kDay);
  assert(rejected.error == tokenvest::ErrorKind::StorageFailed);
  assert(totals_seen_by_journal == std::vector<std::uint64_t>{0});
  assert(!ledger.get_schedule("alice").has_value());
  assert(ledger.get_stats().total_vesting_amount == 0);
  assert(ledger.list_beneficiaries().empty());

  journal_up = true;
  assert(ledger.create_schedule("owner", "alice", 1000, 0, 10 * kDay).ok);
  assert(totals_seen_by_journal.back() == 0);
  assert(ledger.get_stats().total_vesting_amount == 1000);

  // The transfer already happened, so the release stays committed and its
  // event is held until the journal accepts it.
  journal_up = false;
  const tokenvest::ReleaseOutcome unrecorded = ledger.release("alice", "alice", at_day(5));
  assert(unrecorded.result.error == tokenvest::ErrorKind::StorageFailed);
  assert(unrecorded.amount == 500);
  assert(ledger.get_schedule("alice")->released_amount == 500);
  assert(custody.balance_of("alice") == 500);
  assert(ledger.unrecorded_event_count() == 1);

  // Nothing moves while a settlement is unrecorded.
  const tokenvest::ReleaseOutcome blocked = ledger.release("alice", "alice", at_day(6));
  assert(blocked.result.error == tokenvest::ErrorKind::StorageFailed);
  assert(blocked.amount == 0);
  assert(custody.balance_of("alice") == 500);
  assert(ledger.get_schedule("alice")->released_amount == 500);
  assert(ledger.transfer_ownership("owner", "heir").error == tokenvest::ErrorKind::StorageFailed);
  assert(ledger.authority().owner() == "owner");
  assert(ledger.create_schedule("owner", "bob", 10, 0, kDay).error == tokenvest::ErrorKind::StorageFailed);
  assert(!ledger.get_schedule("bob").has_value());
  assert(ledger.flush_unrecorded().error == tokenvest::ErrorKind::StorageFailed);
  assert(ledger.unrecorded_event_count() == 1);

  journal_up = true;
  const tokenvest::ReleaseOutcome resumed = ledger.release("alice", "alice", at_day(8));
  assert(resumed.result.ok);
  assert(resumed.amount == 300);
  assert(ledger.unrecorded_event_count() == 0);
  assert(custody.balance_of("alice") == 800);

  assert(journal.size() == 3);
  assert(journal[0].kind == tokenvest::LedgerEventKind::ScheduleCreated);
  assert(journal[1].kind == tokenvest::LedgerEventKind::TokensReleased);
  assert(journal[1].amount == 500);
  assert(journal[1].unix_ts == at_day(5));
  assert(journal[2].amount == 300);

  // Rebuilding from the journal remembers every payout.
  tokenvest::CustodyTokenLedger fresh_custody(10'000);
  tokenvest::VestingLedger rebuilt("owner", clock, fresh_custody);
  for (const auto& event : journal) {
    assert(rebuilt.replay(event).ok);
  }
  assert(rebuilt.get_schedule("alice")->released_amount == 800);
  assert(rebuilt.get_stats().total_released_amount == 800);
  assert(rebuilt.get_releasable("alice", at_day(8)) == 0);

  assert(ledger.revoke("owner", "alice", at_day(9)).ok);
  assert(journal.size() == 5);
  assert(journal[3].kind == tokenvest::LedgerEventKind::TokensReleased);
  assert(journal[3].amount == 100);
  assert(journal[4].kind == tokenvest::LedgerEventKind::ScheduleRevoked);
}

void test_roles_and_ownership() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(10'000);
  tokenvest::VestingLedger ledger("owner", clock, custody, "tok-1");

  assert(ledger.authorize_creator("ops", "ops").error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.authorize_creator("owner", "").error == tokenvest::ErrorKind::InvalidIdentity);
  assert(ledger.authorize_creator("owner", "ops").ok);
  assert(ledger.authorized_creators() == std::vector<std::string>{"ops"});

  assert(ledger.create_schedule("ops", "alice", 100, 0, kDay).ok);
  assert(ledger.revoke("ops", "alice", at_day(2)).ok);
  assert(ledger.transfer_ownership("ops", "ops").error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.update_token_address("ops", "tok-2").error == tokenvest::ErrorKind::Unauthorized);

  assert(ledger.transfer_ownership("owner", "").error == tokenvest::ErrorKind::InvalidIdentity);
  const tokenvest::Result transferred = ledger.transfer_ownership("owner", "heir");
  assert(transferred.ok);
  assert(transferred.data == "owner");
  assert(ledger.authority().owner() == "heir");
  assert(ledger.create_schedule("owner", "bob", 100, 0, kDay).error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.update_token_address("owner", "tok-2").error == tokenvest::ErrorKind::Unauthorized);

  assert(ledger.update_token_address("heir", "").error == tokenvest::ErrorKind::InvalidTokenAddress);
  assert(ledger.token_address() == "tok-1");
  assert(ledger.update_token_address("heir", "tok-2").ok);
  assert(ledger.token_address() == "tok-2");

  assert(ledger.deauthorize_creator("heir", "stranger").error == tokenvest::ErrorKind::InvalidIdentity);
  assert(ledger.deauthorize_creator("heir", "ops").ok);
  assert(ledger.authorized_creators().empty());
  assert(ledger.create_schedule("ops", "bob", 100, 0, kDay).error == tokenvest::ErrorKind::Unauthorized);
  assert(ledger.create_schedule("heir", "bob", 100, 0, kDay).ok);
}

void test_concurrent_releases_and_creates() {
  tokenvest::ManualClock clock(kStart);
  tokenvest::CustodyTokenLedger custody(1'000'000);
  tokenvest::VestingLedger ledger("owner", clock, custody);

  constexpr std::size_t kBeneficiaries = 4;
  constexpr std::uint64_t kTotal = 3650;
  const std::array<std::string, kBeneficiaries> names{"b0", "b1", "b2", "b3"};
  for (const auto& name : names) {
    assert(ledger.create_schedule("owner", name, kTotal, 0, 365 * kDay).ok);
  }

  std::array<std::atomic<std::uint64_t>, kBeneficiaries> paid{};
  std::vector<std::thread> workers;
  for (std::size_t k = 0; k < 16; ++k) {
    workers.emplace_back([&, k] {
      const std::size_t index = k % kBeneficiaries;
      for (std::int64_t day = 0; day <= 366; ++day) {
        const auto outcome = ledger.release(names[index], names[index], at_day(day) + static_cast<std::int64_t>(k));
        assert(outcome.result.ok || outcome.result.error == tokenvest::ErrorKind::NothingToRelease);
        paid[index].fetch_add(outcome.amount);
      }
    });
  }

  std::vector<std::thread> creators;
  for (std::size_t k = 0; k < 32; ++k) {
    creators.emplace_back([&ledger, k] {
      assert(ledger.create_schedule("owner", "late-" + std::to_string(k), 10, 0, kDay).ok);
    });
  }

  for (auto& worker : workers) {
    worker.join();
  }
  for (auto& creator : creators) {
    creator.join();
  }

  for (std::size_t i = 0; i < kBeneficiaries; ++i) {
    assert(paid[i].load() == kTotal);
    assert(custody.balance_of(names[i]) == kTotal);
    assert(ledger.get_schedule(names[i])->released_amount == kTotal);
  }

  const tokenvest::LedgerStats stats = ledger.get_stats();
  assert(stats.beneficiary_count == kBeneficiaries + 32);
  assert(stats.active_schedule_count == kBeneficiaries + 32);
  assert(stats.total_vesting_amount == kBeneficiaries * kTotal + 320);
  assert(stats.total_released_amount == kBeneficiaries * kTotal);
}

void test_crypto_vault() {
  const auto dir = temp_dir("crypto");

  tokenvest::CryptoEngine crypto;
  const tokenvest::Result created = crypto.initialize(dir.string(), "vault-passphrase");
  assert(created.ok);
  assert(crypto.ready());
  assert(std::filesystem::exists(crypto.vault_path()));
  const std::string key_id = crypto.identity().key_id;
  assert(key_id.starts_with("key-"));

  const std::string payload = "kind=TokensReleased";
  assert(crypto.hash_bytes(payload) == crypto.hash_bytes(payload));
  const std::string signature = crypto.sign(payload);
  assert(crypto.verify(payload, signature, crypto.identity().public_key));
  assert(!crypto.verify(payload + "x", signature, crypto.identity().public_key));
  assert(crypto.last_unlocked_unix() > 0);

  assert(crypto.lock().ok);
  assert(!crypto.ready());
  assert(crypto.sign(payload).empty());
  assert(crypto.identity().private_key.empty());

  tokenvest::CryptoEngine reopened;
  assert(reopened.initialize(dir.string(), "vault-passphrase").ok);
  assert(reopened.identity().key_id == key_id);
  assert(reopened.verify(payload, signature, reopened.identity().public_key));

  tokenvest::CryptoEngine wrong;
  const tokenvest::Result denied = wrong.initialize(dir.string(), "not-the-passphrase");
  assert(!denied.ok);
  assert(denied.error == tokenvest::ErrorKind::InvalidConfig);
  assert(!wrong.ready());

  tokenvest::CryptoEngine empty;
  assert(empty.initialize(dir.string(), "").error == tokenvest::ErrorKind::InvalidConfig);
}

void test_store_hash_chain() {
  const auto dir = temp_dir("store");
  tokenvest::Store store;
  assert(store.open(dir.string()).ok);
  assert(store.head_event_id() == tokenvest::Store::kGenesisPrevId);

  const auto make = [](std::uint64_t sequence, const std::string& prev) {
    const std::string payload = tokenvest::util::canonical_join({
        {"kind", "CreatorAuthorized"},
        {"actor", "owner"},
        {"subject", "ops-" + std::to_string(sequence)},
        {"unix_ts", std::to_string(kStart)},
        {"sequence", std::to_string(sequence)},
        {"prev_event_id", prev},
    });
    return tokenvest::EventEnvelope{
        .event_id = tokenvest::util::event_id_for_payload(payload),
        .kind = tokenvest::LedgerEventKind::CreatorAuthorized,
        .actor = "owner",
        .unix_ts = kStart,
        .sequence = sequence,
        .prev_event_id = prev,
        .payload = payload,
        .signature = "sig",
    };
  };

  const tokenvest::EventEnvelope first = make(1, "genesis");
  assert(store.append_event(first).ok);
  assert(store.append_event(first).ok);
  assert(store.all_events().size() == 1);

  const tokenvest::Result skipped = store.append_event(make(3, first.event_id));
  assert(skipped.error == tokenvest::ErrorKind::StorageFailed);
  const tokenvest::Result unlinked = store.append_event(make(2, "evt-bogus"));
  assert(unlinked.error == tokenvest::ErrorKind::StorageFailed);

  tokenvest::EventEnvelope mislabeled = make(2, first.event_id);
  mislabeled.actor = "mallory";
  assert(!store.append_event(mislabeled).ok);

  assert(store.append_event(make(2, first.event_id)).ok);
  assert(store.verify({}).ok);
  assert(!store.verify([](const tokenvest::EventEnvelope&) { return false; }).ok);

  tokenvest::Store reopened;
  assert(reopened.open(dir.string()).ok);
  assert(reopened.all_events().size() == 2);
  const tokenvest::JournalHealthReport health = reopened.health_report();
  assert(health.healthy);
  assert(health.event_count == 2);
  assert(health.invalid_event_count == 0);
  assert(health.consensus_hash == store.health_report().consensus_hash);
  assert(std::filesystem::exists(dir / "invalid-events.log"));
}

tokenvest::InitConfig service_config(const std::filesystem::path& dir) {
  return {
      .data_dir = dir.string(),
      .passphrase = "integration-passphrase",
      .owner = "treasury",
      .token_address = "tok-main",
      .custody_balance = 5'000,
  };
}

void test_service_journal_replay() {
  const auto dir = temp_dir("service-replay");

  tokenvest::LedgerStats stats_before;
  std::string head_before;
  {
    auto clock = std::make_unique<tokenvest::ManualClock>(kStart);
    tokenvest::ManualClock* time = clock.get();

    tokenvest::CoreApi api;
    const tokenvest::Result init = api.init(service_config(dir), std::move(clock));
    assert(init.ok);
    assert(std::filesystem::exists(dir / std::string{tokenvest::kConfigFileName}));
    assert(!tokenvest::kBuildRelease.empty());
    assert(!tokenvest::kAuthorList.empty());

    assert(api.create_schedule("treasury", {
                                               .beneficiary = "alice",
                                               .total_amount = 1200,
                                               .cliff_duration_days = 30,
                                               .vesting_duration_days = 365,
                                           })
               .ok);
    assert(api.get_releasable_amount("alice") == 0);

    time->advance_days(30);
    assert(api.vested_amount("alice") == 98);
    const tokenvest::ReleaseOutcome released = api.release("alice", "alice");
    assert(released.result.ok);
    assert(released.amount == 98);

    assert(api.authorize_creator("treasury", "ops").ok);
    assert(api.create_schedule("ops", {
                                          .beneficiary = "bob",
                                          .total_amount = 600,
                                          .cliff_duration_days = 0,
                                          .vesting_duration_days = 10,
                                      })
               .ok);
    time->advance_days(5);
    assert(api.revoke("ops", "bob").ok);
    assert(api.update_token_address("treasury", "tok-v2").ok);

    const tokenvest::LedgerStatusReport status = api.status();
    assert(status.owner == "treasury");
    assert(status.token_address == "tok-v2");
    assert(status.custody_managed);
    assert(status.custody_balance == 5'000 - 98 - 300);
    assert(status.journal.healthy);
    assert(status.clock_now == at_day(35));
    assert(!status.signer_key_id.empty());

    assert(api.verify_journal().ok);
    const auto events = api.journal_events();
    // genesis owner, genesis token, create, release, authorize, create, settle, revoke, token update
    assert(events.size() == 9);
    assert(events.front().actor == "genesis");
    assert(events.front().prev_event_id == "genesis");
    for (std::size_t i = 1; i < events.size(); ++i) {
      assert(events[i].prev_event_id == events[i - 1].event_id);
      assert(events[i].sequence == i + 1);
    }

    stats_before = api.get_stats();
    head_before = status.journal.head_event_id;
  }

  tokenvest::CoreApi reopened;
  tokenvest::InitConfig config{
      .data_dir = dir.string(),
      .passphrase = "integration-passphrase",
  };
  const tokenvest::Result init = reopened.init(config, std::make_unique<tokenvest::ManualClock>(at_day(35)));
  assert(init.ok);

  const tokenvest::LedgerStats stats_after = reopened.get_stats();
  assert(stats_after.beneficiary_count == stats_before.beneficiary_count);
  assert(stats_after.active_schedule_count == stats_before.active_schedule_count);
  assert(stats_after.total_vesting_amount == stats_before.total_vesting_amount);
  assert(stats_after.total_released_amount == stats_before.total_released_amount);
  assert(reopened.list_beneficiaries() == (std::vector<std::string>{"alice", "bob"}));

  const auto alice = reopened.get_schedule("alice");
  assert(alice.has_value());
  assert(alice->released_amount == 98);
  assert(alice->start_time == kStart);
  assert(alice->cliff_duration == 30 * static_cast<std::uint64_t>(kDay));
  assert(!reopened.get_schedule("bob")->is_active);
  assert(reopened.get_schedule("bob")->released_amount == 300);

  const tokenvest::LedgerStatusReport status = reopened.status();
  assert(status.owner == "treasury");
  assert(status.token_address == "tok-v2");
  assert(status.authorized_creators == std::vector<std::string>{"ops"});
  assert(status.custody_balance == 5'000 - 98 - 300);
  assert(status.journal.head_event_id == head_before);

  assert(reopened.transfer_ownership("treasury", "council").ok);
  assert(reopened.create_schedule("treasury", {.beneficiary = "carol", .total_amount = 1,
                                               .cliff_duration_days = 0, .vesting_duration_days = 1})
             .error == tokenvest::ErrorKind::Unauthorized);
  assert(reopened.verify_journal().ok);

  tokenvest::CoreApi locked_out;
  config.passphrase = "wrong-passphrase";
  const tokenvest::Result denied = locked_out.init(config);
  assert(!denied.ok);
  assert(denied.error == tokenvest::ErrorKind::InvalidConfig);
  assert(locked_out.release("alice", "alice").result.error == tokenvest::ErrorKind::InvalidConfig);
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

void write_lines(const std::filesystem::path& path, const std::vector<std::string>& lines) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  for (const auto& line : lines) {
    out << line << '\n';
  }
}

void seed_journal(const std::filesystem::path& dir) {
  tokenvest::CoreApi api;
  assert(api.init(service_config(dir), std::make_unique<tokenvest::ManualClock>(kStart)).ok);
  assert(api.create_schedule("treasury", {
                                             .beneficiary = "alice",
                                             .total_amount = 1200,
                                             .cliff_duration_days = 0,
                                             .vesting_duration_days = 365,
                                         })
             .ok);
  assert(api.authorize_creator("treasury", "ops").ok);
}

void test_tampered_journal_is_rejected() {
  const auto dir = temp_dir("service-tamper");
  seed_journal(dir);
  const auto log = dir / "events.log";
  const std::vector<std::string> pristine = read_lines(log);
  assert(pristine.size() == 5);  // header + 4 events

  std::vector<std::string> lines = pristine;
  std::string& target = lines.back();
  const auto actor_begin = target.find('\t', target.find('\t') + 1) + 1;
  const auto actor_end = target.find('\t', actor_begin);
  target.replace(actor_begin, actor_end - actor_begin, "mallory");
  write_lines(log, lines);
  {
    tokenvest::CoreApi api;
    const tokenvest::Result init = api.init(service_config(dir));
    assert(!init.ok);
    assert(init.error == tokenvest::ErrorKind::JournalCorrupt);
  }

  lines = pristine;
  lines.erase(lines.begin() + 2);
  write_lines(log, lines);
  {
    tokenvest::CoreApi api;
    assert(api.init(service_config(dir)).error == tokenvest::ErrorKind::JournalCorrupt);
  }

  lines = pristine;
  lines.back() = "garbage";
  write_lines(log, lines);
  {
    tokenvest::CoreApi api;
    assert(api.init(service_config(dir)).error == tokenvest::ErrorKind::JournalCorrupt);
  }

  write_lines(log, pristine);
  tokenvest::CoreApi api;
  assert(api.init(service_config(dir)).ok);
  assert(api.verify_journal().ok);
}

void test_service_input_conversion() {
  const auto dir = temp_dir("service-inputs");
  tokenvest::CoreApi api;
  assert(api.create_schedule("treasury", {.beneficiary = "alice", .total_amount = 1,
                                          .cliff_duration_days = 0, .vesting_duration_days = 1})
             .error == tokenvest::ErrorKind::InvalidConfig);

  tokenvest::InitConfig bad_owner = service_config(dir);
  bad_owner.owner = "two words";
  assert(api.init(bad_owner).error == tokenvest::ErrorKind::InvalidConfig);

  assert(api.init(service_config(dir), std::make_unique<tokenvest::ManualClock>(kStart)).ok);

  const tokenvest::Result overflow = api.create_schedule("treasury", {
                                                                         .beneficiary = "alice",
                                                                         .total_amount = 10,
                                                                         .cliff_duration_days = 0,
                                                                         .vesting_duration_days =
                                                                             std::numeric_limits<std::uint64_t>::max(),
                                                                     });
  assert(overflow.error == tokenvest::ErrorKind::InvalidDuration);

  const tokenvest::Result too_long = api.create_schedule("treasury", {
                                                                         .beneficiary = "alice",
                                                                         .total_amount = 10,
                                                                         .cliff_duration_days = 0,
                                                                         .vesting_duration_days = 36'501,
                                                                     });
  assert(too_long.error == tokenvest::ErrorKind::InvalidDuration);

  const tokenvest::Result cliff_too_long = api.create_schedule("treasury", {
                                                                               .beneficiary = "alice",
                                                                               .total_amount = 10,
                                                                               .cliff_duration_days = 11,
                                                                               .vesting_duration_days = 10,
                                                                           });
  assert(cliff_too_long.error == tokenvest::ErrorKind::InvalidDuration);

  assert(api.create_schedule("treasury", {
                                             .beneficiary = "  alice  ",
                                             .total_amount = 10,
                                             .cliff_duration_days = 0,
                                             .vesting_duration_days = 36'500,
                                         })
             .ok);
  assert(api.get_schedule("alice").has_value());
  assert(api.get_stats().total_vesting_amount == 10);
}

void test_custody_shortfall_is_transfer_failure() {
  const auto dir = temp_dir("service-custody");
  auto clock = std::make_unique<tokenvest::ManualClock>(kStart);
  tokenvest::ManualClock* time = clock.get();

  tokenvest::InitConfig config = service_config(dir);
  config.custody_balance = 50;
  tokenvest::CoreApi api;
  assert(api.init(config, std::move(clock)).ok);
  assert(api.create_schedule("treasury", {
                                             .beneficiary = "alice",
                                             .total_amount = 100,
                                             .cliff_duration_days = 0,
                                             .vesting_duration_days = 10,
                                         })
             .ok);

  time->advance_days(4);
  assert(api.release("alice", "alice").amount == 40);

  time->advance_days(6);
  const tokenvest::ReleaseOutcome short_funded = api.release("alice", "alice");
  assert(short_funded.result.error == tokenvest::ErrorKind::TransferFailed);
  assert(api.get_schedule("alice")->released_amount == 40);
  assert(api.get_releasable_amount("alice") == 60);
  assert(api.status().custody_balance == 10);
  assert(api.journal_events().size() == 4);
}

void test_unjournaled_release_survives_restart() {
  const auto dir = temp_dir("service-unjournaled");
  const auto log = dir / "events.log";
  const auto parked = dir / "events.log.parked";

  tokenvest::ScheduleDraft draft{
      .beneficiary = "alice",
      .total_amount = 1000,
      .cliff_duration_days = 0,
      .vesting_duration_days = 10,
  };

  std::uint64_t released_before = 0;
  std::uint64_t total_released_before = 0;
  {
    auto clock = std::make_unique<tokenvest::ManualClock>(kStart);
    tokenvest::ManualClock* time = clock.get();
    tokenvest::CoreApi api;
    assert(api.init(service_config(dir), std::move(clock)).ok);
    assert(api.create_schedule("treasury", draft).ok);

    // A directory in place of the log makes every append fail.
    std::filesystem::rename(log, parked);
    std::filesystem::create_directory(log);

    time->advance_days(5);
    const tokenvest::ReleaseOutcome first = api.release("alice", "alice");
    assert(first.result.error == tokenvest::ErrorKind::StorageFailed);
    assert(first.amount == 500);
    assert(api.status().unrecorded_events == 1);

    const tokenvest::ReleaseOutcome blocked = api.release("alice", "alice");
    assert(blocked.result.error == tokenvest::ErrorKind::StorageFailed);
    assert(blocked.amount == 0);
    assert(api.status().custody_balance == 5'000 - 500);

    std::filesystem::remove(log);
    std::filesystem::rename(parked, log);

    time->advance_days(3);
    const tokenvest::ReleaseOutcome second = api.release("alice", "alice");
    assert(second.result.ok);
    assert(second.amount == 300);
    assert(api.status().unrecorded_events == 0);
    assert(api.verify_journal().ok);

    released_before = api.get_schedule("alice")->released_amount;
    total_released_before = api.get_stats().total_released_amount;
    assert(released_before == 800);
    assert(api.get_releasable_amount("alice") == 0);
  }

  tokenvest::CoreApi reopened;
  assert(reopened.init(service_config(dir), std::make_unique<tokenvest::ManualClock>(at_day(8))).ok);
  assert(reopened.get_schedule("alice")->released_amount == released_before);
  assert(reopened.get_stats().total_released_amount == total_released_before);
  assert(reopened.get_releasable_amount("alice") == 0);
  assert(reopened.status().custody_balance == 5'000 - 800);
  assert(reopened.release("alice", "alice").result.error == tokenvest::ErrorKind::NothingToRelease);
}

void test_boundary_identities_are_trimmed() {
  const auto dir = temp_dir("service-trim");
  auto clock = std::make_unique<tokenvest::ManualClock>(kStart);
  tokenvest::ManualClock* time = clock.get();
  tokenvest::CoreApi api;
  assert(api.init(service_config(dir), std::move(clock)).ok);

  assert(api.create_schedule(" treasury ", {
                                               .beneficiary = "  alice  ",
                                               .total_amount = 100,
                                               .cliff_duration_days = 0,
                                               .vesting_duration_days = 10,
                                           })
             .ok);
  time->advance_days(5);
  assert(api.get_releasable_amount("  alice  ") == 50);
  assert(api.vested_amount("alice\t") == 50);
  assert(api.get_schedule(" alice")->total_amount == 100);

  const tokenvest::ReleaseOutcome released = api.release("  alice  ", "  alice  ");
  assert(released.result.ok);
  assert(released.amount == 50);

  assert(api.authorize_creator("treasury", " ops ").ok);
  assert(api.status().authorized_creators == std::vector<std::string>{"ops"});
  assert(api.revoke(" ops", "alice  ").ok);
  assert(api.schedule_history("  alice  ").empty());
  assert(!api.get_schedule("alice")->is_active);
}

void test_explicit_zero_custody_overrides_config_file() {
  const auto dir = temp_dir("service-custody-zero");
  {
    tokenvest::CoreApi api;
    assert(api.init(service_config(dir), std::make_unique<tokenvest::ManualClock>(kStart)).ok);
    assert(api.status().custody_balance == 5'000);
  }
  {
    tokenvest::CoreApi api;
    tokenvest::InitConfig config{.data_dir = dir.string(), .passphrase = "integration-passphrase"};
    assert(api.init(config).ok);
    assert(api.status().custody_balance == 5'000);
  }
  {
    tokenvest::CoreApi api;
    tokenvest::InitConfig config{.data_dir = dir.string(), .passphrase = "integration-passphrase"};
    config.custody_balance = 0;
    assert(api.init(config).ok);
    assert(api.status().custody_balance == 0);
  }
  tokenvest::CoreApi api;
  tokenvest::InitConfig config{.data_dir = dir.string(), .passphrase = "integration-passphrase"};
  assert(api.init(config).ok);
  assert(api.status().custody_balance == 0);
}

}  // namespace

int main() {
  test_linear_curve_with_cliff();
  test_vested_amount_is_monotonic();
  test_create_validation_order();
  test_release_authorization();
  test_transfer_failure_leaves_state_untouched();
  test_revoke_settles_vested_tokens();
  test_recreation_after_revoke_archives_schedule();
  test_event_listener_failures();
  test_roles_and_ownership();
  test_concurrent_releases_and_creates();
  test_crypto_vault();
  test_store_hash_chain();
  test_service_journal_replay();
  test_tampered_journal_is_rejected();
  test_service_input_conversion();
  test_custody_shortfall_is_transfer_failure();
  test_unjournaled_release_survives_restart();
  test_boundary_identities_are_trimmed();
  test_explicit_zero_custody_overrides_config_file();

  std::cout << "tokenvest_unit_tests passed\n";
  return 0;
}
