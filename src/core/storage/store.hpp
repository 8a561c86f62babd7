#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace tokenvest {

std::string_view ledger_event_kind_name(LedgerEventKind kind);
std::optional<LedgerEventKind> ledger_event_kind_from_name(std::string_view name);

// Append-only journal of signed ledger events. Each envelope carries its
// sequence number and the id of its predecessor; the id is the hash of a
// payload that repeats both, so the log is a hash chain.
class Store {
public:
  static constexpr std::string_view kGenesisPrevId = "genesis";

  Result open(std::string_view data_dir);
  void set_max_event_bytes(std::size_t max_event_bytes);

  Result append_event(const EventEnvelope& event);
  [[nodiscard]] bool has_event(std::string_view event_id) const;

  // Re-checks chain links and payload hashes, then asks signature_ok for every
  // envelope.
  Result verify(const std::function<bool(const EventEnvelope&)>& signature_ok) const;

  [[nodiscard]] const std::vector<EventEnvelope>& all_events() const { return events_; }
  [[nodiscard]] std::uint64_t next_sequence() const { return events_.size() + 1U; }
  [[nodiscard]] std::string head_event_id() const;
  [[nodiscard]] JournalHealthReport health_report() const;

private:
  std::string data_dir_;
  std::string event_log_path_;
  std::string invalid_event_log_path_;
  std::size_t max_event_bytes_ = 16U << 10U;

  std::vector<EventEnvelope> events_;
  std::unordered_set<std::string> event_ids_;
  std::size_t invalid_event_count_ = 0;
  std::string last_error_;

  Result load_event_log();
  Result persist_event(const EventEnvelope& event) const;
  [[nodiscard]] Result check_link(const EventEnvelope& event, std::uint64_t expected_sequence,
                                  std::string_view expected_prev) const;
  void record_invalid_event(std::string_view event_id, std::string_view reason);
  [[nodiscard]] std::string consensus_hash() const;
};

}  // namespace tokenvest
