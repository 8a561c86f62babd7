#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tokenvest {

enum class ErrorKind {
  None,
  Unauthorized,
  InvalidBeneficiary,
  InvalidAmount,
  InvalidDuration,
  ScheduleAlreadyActive,
  NoActiveSchedule,
  NothingToRelease,
  TransferFailed,
  InvalidIdentity,
  InvalidTokenAddress,
  InvalidConfig,
  StorageFailed,
  JournalCorrupt,
  Internal,
};

inline std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::Unauthorized:
      return "Unauthorized";
    case ErrorKind::InvalidBeneficiary:
      return "InvalidBeneficiary";
    case ErrorKind::InvalidAmount:
      return "InvalidAmount";
    case ErrorKind::InvalidDuration:
      return "InvalidDuration";
    case ErrorKind::ScheduleAlreadyActive:
      return "ScheduleAlreadyActive";
    case ErrorKind::NoActiveSchedule:
      return "NoActiveSchedule";
    case ErrorKind::NothingToRelease:
      return "NothingToRelease";
    case ErrorKind::TransferFailed:
      return "TransferFailed";
    case ErrorKind::InvalidIdentity:
      return "InvalidIdentity";
    case ErrorKind::InvalidTokenAddress:
      return "InvalidTokenAddress";
    case ErrorKind::InvalidConfig:
      return "InvalidConfig";
    case ErrorKind::StorageFailed:
      return "StorageFailed";
    case ErrorKind::JournalCorrupt:
      return "JournalCorrupt";
    case ErrorKind::Internal:
      return "Internal";
  }
  return "Internal";
}

struct Result {
  bool ok = false;
  ErrorKind error = ErrorKind::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, ErrorKind::Internal, std::move(msg), {}};
  }

  static Result failure(ErrorKind kind, std::string msg) {
    return {false, kind, std::move(msg), {}};
  }
};

enum class Role {
  Owner,
  AuthorizedCreator,
};

struct VestingSchedule {
  std::string beneficiary;
  std::uint64_t total_amount = 0;
  std::int64_t start_time = 0;
  std::uint64_t cliff_duration = 0;
  std::uint64_t vesting_duration = 0;
  std::uint64_t released_amount = 0;
  bool is_active = false;
};

struct LedgerStats {
  std::size_t beneficiary_count = 0;
  std::size_t active_schedule_count = 0;
  std::uint64_t total_vesting_amount = 0;
  std::uint64_t total_released_amount = 0;
};

struct ReleaseOutcome {
  Result result;
  std::uint64_t amount = 0;
};

enum class LedgerEventKind {
  ScheduleCreated,
  TokensReleased,
  ScheduleRevoked,
  OwnershipTransferred,
  TokenAddressUpdated,
  CreatorAuthorized,
  CreatorDeauthorized,
};

// subject is the beneficiary for schedule events, the new owner / creator /
// token address for administrative ones. detail carries the previous value.
struct LedgerEvent {
  LedgerEventKind kind = LedgerEventKind::ScheduleCreated;
  std::string actor;
  std::string subject;
  std::uint64_t amount = 0;
  std::int64_t unix_ts = 0;
  std::uint64_t cliff_duration = 0;
  std::uint64_t vesting_duration = 0;
  std::string detail;
};

struct EventEnvelope {
  std::string event_id;
  LedgerEventKind kind = LedgerEventKind::ScheduleCreated;
  std::string actor;
  std::int64_t unix_ts = 0;
  std::uint64_t sequence = 0;
  std::string prev_event_id;
  std::string payload;
  std::string signature;
};

struct ScheduleDraft {
  std::string beneficiary;
  std::uint64_t total_amount = 0;
  std::uint64_t cliff_duration_days = 0;
  std::uint64_t vesting_duration_days = 0;
};

struct JournalHealthReport {
  bool healthy = false;
  std::string details;
  std::string data_dir;
  std::string events_file;
  std::string invalid_events_file;
  std::size_t event_count = 0;
  std::uintmax_t event_log_size_bytes = 0;
  std::string head_event_id;
  std::string consensus_hash;
  std::size_t invalid_event_count = 0;
  std::size_t max_event_bytes = 0;
};

struct InitConfig {
  std::string data_dir;
  std::string passphrase;
  std::string owner;
  std::string token_address;
  std::optional<std::uint64_t> custody_balance;  // unset -> config file, else 0
  std::string config_path;  // empty -> <data_dir>/tokenvest.conf
  std::size_t max_event_bytes = 16U << 10U;  // 16 KiB
  bool verify_signatures_on_open = true;
  bool write_config_file = true;
};

struct LedgerStatusReport {
  std::string owner;
  std::string token_address;
  std::vector<std::string> authorized_creators;
  bool custody_managed = false;
  std::uint64_t custody_balance = 0;
  LedgerStats stats;
  std::size_t unrecorded_events = 0;
  JournalHealthReport journal;
  std::string signer_key_id;
  std::string signer_public_key;
  std::string config_path;
  std::int64_t clock_now = 0;
};

}  // namespace tokenvest
