#include "core/service/vesting_service.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace tokenvest {
namespace {

constexpr std::string_view kGenesisActor = "genesis";

std::string payload_field(const std::unordered_map<std::string, std::string>& fields, const char* key) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string{} : it->second;
}

std::optional<LedgerEvent> event_from_envelope(const EventEnvelope& envelope) {
  const auto fields = util::parse_canonical_map(envelope.payload);
  const auto amount = util::parse_uint64(payload_field(fields, "amount"));
  const auto cliff = util::parse_uint64(payload_field(fields, "cliff_duration"));
  const auto duration = util::parse_uint64(payload_field(fields, "vesting_duration"));
  if (!amount.has_value() || !cliff.has_value() || !duration.has_value()) {
    return std::nullopt;
  }

  return LedgerEvent{
      .kind = envelope.kind,
      .actor = envelope.actor,
      .subject = payload_field(fields, "subject"),
      .amount = *amount,
      .unix_ts = envelope.unix_ts,
      .cliff_duration = *cliff,
      .vesting_duration = *duration,
      .detail = payload_field(fields, "detail"),
  };
}

// Identities arriving at the boundary are compared after trimming.
std::string identity_arg(std::string_view value) {
  return util::trim_copy(value);
}

Result days_to_seconds(std::uint64_t days, std::uint64_t& seconds) {
  if (days > std::numeric_limits<std::uint64_t>::max() / kSecondsPerDay) {
    return Result::failure(ErrorKind::InvalidDuration, "Duration in days is too large.");
  }
  seconds = days * kSecondsPerDay;
  return Result::success();
}

}  // namespace

Result VestingService::init(const InitConfig& config, std::unique_ptr<IClock> clock,
                            std::unique_ptr<ITokenLedger> token_ledger) {
  ledger_.reset();
  custody_ = nullptr;
  config_ = config;

  if (config_.data_dir.empty()) {
    return Result::failure(ErrorKind::InvalidConfig, "A data directory is required.");
  }
  if (config_.config_path.empty()) {
    config_.config_path = (std::filesystem::path{config_.data_dir} / std::string{kConfigFileName}).string();
  }

  std::error_code ec;
  if (std::filesystem::exists(config_.config_path, ec)) {
    const Result loaded = load_config_file(config_.config_path);
    if (!loaded.ok) {
      return loaded;
    }
  }

  if (!util::is_valid_identity(config_.owner)) {
    return Result::failure(ErrorKind::InvalidConfig, "An owner identity is required for a new ledger.");
  }
  if (!config_.token_address.empty() && !util::is_valid_identity(config_.token_address)) {
    return Result::failure(ErrorKind::InvalidConfig, "Configured token address is malformed.");
  }

  const Result crypto_result = crypto_.initialize(config_.data_dir, config_.passphrase);
  if (!crypto_result.ok) {
    return crypto_result;
  }

  store_.set_max_event_bytes(config_.max_event_bytes);
  const Result store_result = store_.open(config_.data_dir);
  if (!store_result.ok) {
    return store_result;
  }

  clock_ = clock ? std::move(clock) : make_system_clock();
  if (token_ledger) {
    token_ledger_ = std::move(token_ledger);
  } else {
    auto custody = std::make_unique<CustodyTokenLedger>(config_.custody_balance.value_or(0));
    custody_ = custody.get();
    token_ledger_ = std::move(custody);
  }

  auto ledger = std::make_unique<VestingLedger>(config_.owner, *clock_, *token_ledger_, config_.token_address);
  ledger_ = std::move(ledger);

  const Result replayed = replay_journal();
  if (!replayed.ok) {
    ledger_.reset();
    return replayed;
  }

  if (store_.all_events().empty()) {
    const Result genesis = record_genesis();
    if (!genesis.ok) {
      ledger_.reset();
      return genesis;
    }
  }

  ledger_->set_event_listener([this](const LedgerEvent& event) {
    return persist_ledger_event(event);
  });

  if (config_.write_config_file) {
    const Result written = write_config_file();
    if (!written.ok) {
      ledger_.reset();
      return written;
    }
  }

  return Result::success("Vesting ledger ready (" + std::to_string(store_.all_events().size()) +
                             " journal entries).",
                         crypto_.identity().key_id);
}

Result VestingService::create_schedule(std::string_view caller, const ScheduleDraft& draft) {
  if (const Result ready = ensure_initialized("create_schedule"); !ready.ok) {
    return ready;
  }

  std::uint64_t cliff_seconds = 0;
  std::uint64_t vesting_seconds = 0;
  if (const Result cliff = days_to_seconds(draft.cliff_duration_days, cliff_seconds); !cliff.ok) {
    return cliff;
  }
  if (const Result vesting = days_to_seconds(draft.vesting_duration_days, vesting_seconds); !vesting.ok) {
    return vesting;
  }

  return ledger_->create_schedule(identity_arg(caller), identity_arg(draft.beneficiary), draft.total_amount,
                                  cliff_seconds, vesting_seconds);
}

ReleaseOutcome VestingService::release(std::string_view caller, std::string_view beneficiary) {
  if (const Result ready = ensure_initialized("release"); !ready.ok) {
    return {ready, 0};
  }
  return ledger_->release(identity_arg(caller), identity_arg(beneficiary), clock_->now());
}

Result VestingService::revoke(std::string_view caller, std::string_view beneficiary) {
  if (const Result ready = ensure_initialized("revoke"); !ready.ok) {
    return ready;
  }
  return ledger_->revoke(identity_arg(caller), identity_arg(beneficiary), clock_->now());
}

Result VestingService::transfer_ownership(std::string_view caller, std::string_view new_owner) {
  if (const Result ready = ensure_initialized("transfer_ownership"); !ready.ok) {
    return ready;
  }
  return ledger_->transfer_ownership(identity_arg(caller), identity_arg(new_owner));
}

Result VestingService::update_token_address(std::string_view caller, std::string_view new_address) {
  if (const Result ready = ensure_initialized("update_token_address"); !ready.ok) {
    return ready;
  }
  return ledger_->update_token_address(identity_arg(caller), identity_arg(new_address));
}

Result VestingService::authorize_creator(std::string_view caller, std::string_view identity) {
  if (const Result ready = ensure_initialized("authorize_creator"); !ready.ok) {
    return ready;
  }
  return ledger_->authorize_creator(identity_arg(caller), identity_arg(identity));
}

Result VestingService::deauthorize_creator(std::string_view caller, std::string_view identity) {
  if (const Result ready = ensure_initialized("deauthorize_creator"); !ready.ok) {
    return ready;
  }
  return ledger_->deauthorize_creator(identity_arg(caller), identity_arg(identity));
}

std::optional<VestingSchedule> VestingService::get_schedule(std::string_view beneficiary) const {
  if (!initialized()) {
    return std::nullopt;
  }
  return ledger_->get_schedule(identity_arg(beneficiary));
}

std::vector<VestingSchedule> VestingService::schedule_history(std::string_view beneficiary) const {
  if (!initialized()) {
    return {};
  }
  return ledger_->schedule_history(identity_arg(beneficiary));
}

std::uint64_t VestingService::get_releasable_amount(std::string_view beneficiary) const {
  if (!initialized()) {
    return 0;
  }
  return ledger_->get_releasable(identity_arg(beneficiary), clock_->now());
}

std::uint64_t VestingService::vested_amount(std::string_view beneficiary) const {
  if (!initialized()) {
    return 0;
  }
  return ledger_->vested_amount(identity_arg(beneficiary), clock_->now());
}

LedgerStats VestingService::get_stats() const {
  if (!initialized()) {
    return {};
  }
  return ledger_->get_stats();
}

std::vector<std::string> VestingService::list_beneficiaries() const {
  if (!initialized()) {
    return {};
  }
  return ledger_->list_beneficiaries();
}

LedgerStatusReport VestingService::status() const {
  LedgerStatusReport report;
  report.config_path = config_.config_path;
  report.signer_key_id = crypto_.identity().key_id;
  report.signer_public_key = crypto_.identity().public_key;
  {
    std::lock_guard lock(journal_mutex_);
    report.journal = store_.health_report();
  }
  if (!initialized()) {
    return report;
  }

  report.owner = ledger_->authority().owner();
  report.token_address = ledger_->token_address();
  report.authorized_creators = ledger_->authorized_creators();
  report.custody_managed = custody_ != nullptr;
  report.custody_balance = custody_ != nullptr ? custody_->custody_balance() : 0;
  report.stats = ledger_->get_stats();
  report.unrecorded_events = ledger_->unrecorded_event_count();
  report.clock_now = clock_->now();
  return report;
}

std::vector<EventEnvelope> VestingService::journal_events() const {
  std::lock_guard lock(journal_mutex_);
  return store_.all_events();
}

Result VestingService::verify_journal() const {
  if (const Result ready = ensure_initialized("verify_journal"); !ready.ok) {
    return ready;
  }
  std::lock_guard lock(journal_mutex_);
  return store_.verify([this](const EventEnvelope& envelope) {
    return signature_ok(envelope);
  });
}

Result VestingService::ensure_initialized(std::string_view operation) const {
  if (!initialized()) {
    return Result::failure(ErrorKind::InvalidConfig,
                           std::string{operation} + " requires an initialized vesting service.");
  }
  return Result::success();
}

Result VestingService::load_config_file(std::string_view path) {
  std::ifstream in(std::string{path});
  if (!in) {
    return Result::failure(ErrorKind::StorageFailed, "Unable to read config file: " + std::string{path});
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    fields[util::trim_copy(trimmed.substr(0, split))] = util::trim_copy(trimmed.substr(split + 1));
  }

  // Explicit settings win; the file only fills what the caller left unset.
  if (config_.owner.empty() && fields.contains("owner")) {
    config_.owner = fields["owner"];
  }
  if (config_.token_address.empty() && fields.contains("token_address")) {
    config_.token_address = fields["token_address"];
  }
  if (!config_.custody_balance.has_value() && fields.contains("custody_balance")) {
    const auto custody = util::parse_uint64(fields["custody_balance"]);
    if (!custody.has_value()) {
      return Result::failure(ErrorKind::InvalidConfig, "custody_balance in config file is not a number.");
    }
    config_.custody_balance = *custody;
  }
  if (fields.contains("max_event_bytes")) {
    const auto max_bytes = util::parse_uint64(fields["max_event_bytes"]);
    if (!max_bytes.has_value() || *max_bytes == 0) {
      return Result::failure(ErrorKind::InvalidConfig, "max_event_bytes in config file is not a positive number.");
    }
    config_.max_event_bytes = static_cast<std::size_t>(*max_bytes);
  }
  if (fields.contains("verify_signatures_on_open")) {
    config_.verify_signatures_on_open = fields["verify_signatures_on_open"] != "0";
  }

  return Result::success("Config file loaded.");
}

Result VestingService::write_config_file() const {
  std::error_code ec;
  const std::filesystem::path file_path{config_.config_path};
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorKind::StorageFailed, "Unable to create config directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorKind::StorageFailed, "Unable to write config file: " + config_.config_path);
  }

  out << "# tokenvest ledger config\n";
  out << "# owner and token_address seed a new journal; afterwards the journal is authoritative.\n";
  out << "owner=" << config_.owner << '\n';
  out << "token_address=" << config_.token_address << '\n';
  out << "custody_balance=" << config_.custody_balance.value_or(0) << '\n';
  out << "max_event_bytes=" << config_.max_event_bytes << '\n';
  out << "verify_signatures_on_open=" << (config_.verify_signatures_on_open ? "1" : "0") << '\n';

  if (!out.good()) {
    return Result::failure(ErrorKind::StorageFailed, "Failed writing config file: " + config_.config_path);
  }

  return Result::success("Config file written.");
}

Result VestingService::replay_journal() {
  std::lock_guard lock(journal_mutex_);
  if (config_.verify_signatures_on_open) {
    const Result verified = store_.verify([this](const EventEnvelope& envelope) {
      return signature_ok(envelope);
    });
    if (!verified.ok) {
      return verified;
    }
  }

  for (const auto& envelope : store_.all_events()) {
    const auto event = event_from_envelope(envelope);
    if (!event.has_value()) {
      return Result::failure(ErrorKind::JournalCorrupt,
                             "Journal entry " + std::to_string(envelope.sequence) + " has a malformed payload.");
    }

    const Result applied = ledger_->replay(*event);
    if (!applied.ok) {
      return Result::failure(ErrorKind::JournalCorrupt, "Journal entry " + std::to_string(envelope.sequence) +
                                                            " rejected: " + applied.message);
    }

    if (event->kind == LedgerEventKind::TokensReleased && custody_ != nullptr) {
      const Result settled = custody_->record_settled(event->subject, event->amount);
      if (!settled.ok) {
        return Result::failure(ErrorKind::InvalidConfig,
                               "Custody balance cannot cover journal entry " + std::to_string(envelope.sequence) +
                                   ": " + settled.message);
      }
    }
  }

  return Result::success("Journal replayed.", std::to_string(store_.all_events().size()));
}

Result VestingService::record_genesis() {
  const std::int64_t now = clock_->now();
  const Result owner = persist_ledger_event({
      .kind = LedgerEventKind::OwnershipTransferred,
      .actor = std::string{kGenesisActor},
      .subject = config_.owner,
      .amount = 0,
      .unix_ts = now,
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
  if (!owner.ok || config_.token_address.empty()) {
    return owner;
  }

  return persist_ledger_event({
      .kind = LedgerEventKind::TokenAddressUpdated,
      .actor = std::string{kGenesisActor},
      .subject = config_.token_address,
      .amount = 0,
      .unix_ts = now,
      .cliff_duration = 0,
      .vesting_duration = 0,
      .detail = {},
  });
}

Result VestingService::persist_ledger_event(const LedgerEvent& event) {
  std::lock_guard lock(journal_mutex_);
  const EventEnvelope envelope = make_event(event);
  if (envelope.signature.empty()) {
    return Result::failure(ErrorKind::StorageFailed, "Journal signer is locked; event was not recorded.");
  }
  return store_.append_event(envelope);
}

EventEnvelope VestingService::make_event(const LedgerEvent& event) const {
  const std::uint64_t sequence = store_.next_sequence();
  const std::string prev_event_id = store_.head_event_id();

  const std::string payload = util::canonical_join({
      {"kind", std::string{ledger_event_kind_name(event.kind)}},
      {"actor", event.actor},
      {"subject", event.subject},
      {"amount", std::to_string(event.amount)},
      {"unix_ts", std::to_string(event.unix_ts)},
      {"cliff_duration", std::to_string(event.cliff_duration)},
      {"vesting_duration", std::to_string(event.vesting_duration)},
      {"detail", event.detail},
      {"sequence", std::to_string(sequence)},
      {"prev_event_id", prev_event_id},
      {"signer", crypto_.identity().key_id},
  });

  return {
      .event_id = crypto_.content_id(payload),
      .kind = event.kind,
      .actor = event.actor,
      .unix_ts = event.unix_ts,
      .sequence = sequence,
      .prev_event_id = prev_event_id,
      .payload = payload,
      .signature = crypto_.sign(payload),
  };
}

bool VestingService::signature_ok(const EventEnvelope& envelope) const {
  const auto fields = util::parse_canonical_map(envelope.payload);
  if (payload_field(fields, "signer") != crypto_.identity().key_id) {
    return false;
  }
  return crypto_.verify(envelope.payload, envelope.signature, crypto_.identity().public_key);
}

}  // namespace tokenvest
