#include "core/storage/store.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace tokenvest {
namespace {

constexpr std::string_view kEventLogFile = "events.log";
constexpr std::string_view kInvalidEventLogFile = "invalid-events.log";
constexpr std::string_view kJournalHeader = "# tokenvest journal v1";

std::string serialize_event_line(const EventEnvelope& event) {
  std::ostringstream out;
  out << event.event_id << '\t' << ledger_event_kind_name(event.kind) << '\t' << event.actor << '\t'
      << event.unix_ts << '\t' << event.sequence << '\t' << event.prev_event_id << '\t'
      << util::to_hex(event.payload) << '\t' << event.signature << '\n';
  return out.str();
}

bool parse_event_line(std::string_view line, EventEnvelope& out) {
  std::array<std::string_view, 8> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        return false;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }

  if (field_index != fields.size()) {
    return false;
  }

  const auto kind = ledger_event_kind_from_name(fields[1]);
  const auto unix_ts = util::parse_int64(fields[3]);
  const auto sequence = util::parse_uint64(fields[4]);
  if (!kind.has_value() || !unix_ts.has_value() || !sequence.has_value()) {
    return false;
  }

  out.event_id = std::string{fields[0]};
  out.kind = *kind;
  out.actor = std::string{fields[2]};
  out.unix_ts = *unix_ts;
  out.sequence = *sequence;
  out.prev_event_id = std::string{fields[5]};
  out.payload = util::from_hex(fields[6]);
  out.signature = std::string{fields[7]};
  return !out.event_id.empty() && !out.payload.empty();
}

}  // namespace

std::string_view ledger_event_kind_name(LedgerEventKind kind) {
  switch (kind) {
    case LedgerEventKind::ScheduleCreated:
      return "ScheduleCreated";
    case LedgerEventKind::TokensReleased:
      return "TokensReleased";
    case LedgerEventKind::ScheduleRevoked:
      return "ScheduleRevoked";
    case LedgerEventKind::OwnershipTransferred:
      return "OwnershipTransferred";
    case LedgerEventKind::TokenAddressUpdated:
      return "TokenAddressUpdated";
    case LedgerEventKind::CreatorAuthorized:
      return "CreatorAuthorized";
    case LedgerEventKind::CreatorDeauthorized:
      return "CreatorDeauthorized";
  }
  return "ScheduleCreated";
}

std::optional<LedgerEventKind> ledger_event_kind_from_name(std::string_view name) {
  if (name == "ScheduleCreated") {
    return LedgerEventKind::ScheduleCreated;
  }
  if (name == "TokensReleased") {
    return LedgerEventKind::TokensReleased;
  }
  if (name == "ScheduleRevoked") {
    return LedgerEventKind::ScheduleRevoked;
  }
  if (name == "OwnershipTransferred") {
    return LedgerEventKind::OwnershipTransferred;
  }
  if (name == "TokenAddressUpdated") {
    return LedgerEventKind::TokenAddressUpdated;
  }
  if (name == "CreatorAuthorized") {
    return LedgerEventKind::CreatorAuthorized;
  }
  if (name == "CreatorDeauthorized") {
    return LedgerEventKind::CreatorDeauthorized;
  }
  return std::nullopt;
}

Result Store::open(std::string_view data_dir) {
  data_dir_ = std::string{data_dir};

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorKind::StorageFailed, "Failed to create journal directory: " + ec.message());
  }

  event_log_path_ = (std::filesystem::path{data_dir_} / std::string{kEventLogFile}).string();
  invalid_event_log_path_ = (std::filesystem::path{data_dir_} / std::string{kInvalidEventLogFile}).string();
  invalid_event_count_ = 0;
  last_error_.clear();

  return load_event_log();
}

void Store::set_max_event_bytes(std::size_t max_event_bytes) {
  max_event_bytes_ = max_event_bytes == 0 ? (16U << 10U) : max_event_bytes;
}

Result Store::append_event(const EventEnvelope& event) {
  if (event_log_path_.empty()) {
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: journal is not open.");
  }
  if (event.event_id.empty()) {
    record_invalid_event("", "append_event failed: missing event id.");
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: missing event id.");
  }
  if (event.payload.empty()) {
    record_invalid_event(event.event_id, "append_event failed: missing payload.");
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: missing payload.");
  }
  if (event.signature.empty()) {
    record_invalid_event(event.event_id, "append_event failed: missing signature.");
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: missing signature.");
  }
  if (event.payload.size() > max_event_bytes_) {
    record_invalid_event(event.event_id, "append_event failed: payload exceeds max_event_bytes.");
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: payload exceeds max_event_bytes.");
  }

  if (has_event(event.event_id)) {
    return Result::success("Event already exists (idempotent append).", event.event_id);
  }

  const Result link = check_link(event, next_sequence(), head_event_id());
  if (!link.ok) {
    record_invalid_event(event.event_id, link.message);
    return Result::failure(ErrorKind::StorageFailed, "append_event failed: " + link.message);
  }

  const Result persist = persist_event(event);
  if (!persist.ok) {
    return persist;
  }

  events_.push_back(event);
  event_ids_.insert(event.event_id);
  return Result::success("Event appended.", event.event_id);
}

bool Store::has_event(std::string_view event_id) const {
  return event_ids_.contains(std::string{event_id});
}

Result Store::verify(const std::function<bool(const EventEnvelope&)>& signature_ok) const {
  std::string expected_prev{kGenesisPrevId};
  std::uint64_t expected_sequence = 1;
  for (const auto& event : events_) {
    const Result link = check_link(event, expected_sequence, expected_prev);
    if (!link.ok) {
      return link;
    }
    if (signature_ok && !signature_ok(event)) {
      return Result::failure(ErrorKind::JournalCorrupt,
                             "Signature check failed for journal entry " + std::to_string(event.sequence) + ".");
    }
    expected_prev = event.event_id;
    ++expected_sequence;
  }
  return Result::success("Journal verified.", std::to_string(events_.size()));
}

std::string Store::head_event_id() const {
  return events_.empty() ? std::string{kGenesisPrevId} : events_.back().event_id;
}

JournalHealthReport Store::health_report() const {
  JournalHealthReport report;
  report.data_dir = data_dir_;
  report.events_file = event_log_path_;
  report.invalid_events_file = invalid_event_log_path_;
  report.event_count = events_.size();
  report.head_event_id = head_event_id();
  report.consensus_hash = consensus_hash();
  report.invalid_event_count = invalid_event_count_;
  report.max_event_bytes = max_event_bytes_;

  std::error_code ec;
  if (!event_log_path_.empty() && std::filesystem::exists(event_log_path_, ec) && !ec) {
    report.event_log_size_bytes = std::filesystem::file_size(event_log_path_, ec);
  }

  const Result chain = verify({});
  report.healthy = !event_log_path_.empty() && chain.ok && last_error_.empty();
  if (event_log_path_.empty()) {
    report.details = "Journal is not open.";
  } else if (!chain.ok) {
    report.details = chain.message;
  } else if (!last_error_.empty()) {
    report.details = last_error_;
  } else {
    report.details = "Journal chain intact.";
  }
  return report;
}

Result Store::load_event_log() {
  events_.clear();
  event_ids_.clear();

  std::ifstream in(event_log_path_);
  if (!in) {
    return Result::success("Journal will be created on first write.");
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }

    EventEnvelope event;
    if (!parse_event_line(line, event)) {
      const std::string reason = "Failed to parse journal line " + std::to_string(line_number) + ".";
      record_invalid_event("load-event-log", reason);
      last_error_ = reason;
      return Result::failure(ErrorKind::JournalCorrupt, reason);
    }

    const Result link = check_link(event, next_sequence(), head_event_id());
    if (!link.ok) {
      record_invalid_event(event.event_id, link.message);
      last_error_ = link.message;
      return link;
    }

    event_ids_.insert(event.event_id);
    events_.push_back(std::move(event));
  }

  return Result::success("Journal loaded.", std::to_string(events_.size()));
}

Result Store::persist_event(const EventEnvelope& event) const {
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(event_log_path_, ec) || std::filesystem::file_size(event_log_path_, ec) == 0;

  std::ofstream out(event_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorKind::StorageFailed, "Failed to open journal file for append.");
  }

  if (fresh) {
    out << kJournalHeader << '\n';
  }
  out << serialize_event_line(event);
  out.flush();
  if (!out.good()) {
    return Result::failure(ErrorKind::StorageFailed, "Failed to flush journal file.");
  }

  return Result::success();
}

Result Store::check_link(const EventEnvelope& event, std::uint64_t expected_sequence,
                         std::string_view expected_prev) const {
  const std::string position = "journal entry " + std::to_string(expected_sequence);
  if (event.sequence != expected_sequence) {
    return Result::failure(ErrorKind::JournalCorrupt, position + " has an out-of-order sequence number.");
  }
  if (event.prev_event_id != expected_prev) {
    return Result::failure(ErrorKind::JournalCorrupt, position + " does not link to its predecessor.");
  }
  if (event.event_id != util::event_id_for_payload(event.payload)) {
    return Result::failure(ErrorKind::JournalCorrupt, position + " does not match its payload hash.");
  }

  const auto fields = util::parse_canonical_map(event.payload);
  const auto field = [&fields](const char* key) -> std::string {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string{} : it->second;
  };
  if (field("sequence") != std::to_string(event.sequence) || field("prev_event_id") != event.prev_event_id ||
      field("kind") != ledger_event_kind_name(event.kind) || field("actor") != event.actor ||
      field("unix_ts") != std::to_string(event.unix_ts)) {
    return Result::failure(ErrorKind::JournalCorrupt, position + " envelope disagrees with its payload.");
  }
  return Result::success();
}

void Store::record_invalid_event(std::string_view event_id, std::string_view reason) {
  ++invalid_event_count_;
  if (invalid_event_log_path_.empty()) {
    return;
  }

  std::ofstream out(invalid_event_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << util::unix_timestamp_now() << "\t" << event_id << "\t" << reason << "\n";
}

std::string Store::consensus_hash() const {
  std::ostringstream out;
  for (const auto& event : events_) {
    out << event.sequence << ":" << event.event_id << "\n";
  }
  return util::sha256_hex(out.str());
}

}  // namespace tokenvest
