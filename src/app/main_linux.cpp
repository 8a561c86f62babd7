#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace {

struct CliOptions {
  tokenvest::InitConfig config;
  std::string command;
  std::vector<std::string> args;
};

void print_usage() {
  std::cerr << tokenvest::kAppDisplayName << " " << tokenvest::kAppVersion << " (" << tokenvest::kBuildRelease
            << ")\n"
            << tokenvest::kAuthorList << "\n\n"
            << "usage: tokenvest [--data-dir DIR] [--passphrase P] [--owner ID] [--token ADDR] [--custody N]\n"
            << "                 <command> [args...]\n\n"
            << "  create CALLER BENEFICIARY AMOUNT CLIFF_DAYS DURATION_DAYS\n"
            << "  release CALLER BENEFICIARY\n"
            << "  revoke CALLER BENEFICIARY\n"
            << "  schedule BENEFICIARY\n"
            << "  history BENEFICIARY\n"
            << "  releasable BENEFICIARY\n"
            << "  stats\n"
            << "  beneficiaries\n"
            << "  transfer-ownership CALLER NEW_OWNER\n"
            << "  update-token CALLER ADDRESS\n"
            << "  authorize CALLER IDENTITY\n"
            << "  deauthorize CALLER IDENTITY\n"
            << "  status\n"
            << "  verify\n\n"
            << "The passphrase may also be supplied through " << tokenvest::kPassphraseEnvVar << ".\n";
}

bool parse_options(int argc, char** argv, CliOptions& out) {
  out.config.data_dir = "tokenvest-data";
  if (const char* env = std::getenv(std::string{tokenvest::kPassphraseEnvVar}.c_str()); env != nullptr) {
    out.config.passphrase = env;
  }

  int i = 1;
  for (; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (!arg.starts_with("--")) {
      break;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << '\n';
      return false;
    }
    const std::string value = argv[++i];
    if (arg == "--data-dir") {
      out.config.data_dir = value;
    } else if (arg == "--passphrase") {
      out.config.passphrase = value;
    } else if (arg == "--owner") {
      out.config.owner = value;
    } else if (arg == "--token") {
      out.config.token_address = value;
    } else if (arg == "--custody") {
      const auto custody = tokenvest::util::parse_uint64(value);
      if (!custody.has_value()) {
        std::cerr << "--custody expects a non-negative integer\n";
        return false;
      }
      out.config.custody_balance = *custody;
    } else {
      std::cerr << "Unknown option " << arg << '\n';
      return false;
    }
  }

  if (i >= argc) {
    return false;
  }
  out.command = argv[i++];
  for (; i < argc; ++i) {
    out.args.emplace_back(argv[i]);
  }
  return true;
}

int report(const tokenvest::Result& result) {
  if (!result.ok) {
    std::cerr << tokenvest::error_kind_name(result.error) << ": " << result.message << '\n';
    return 1;
  }
  std::cout << result.message;
  if (!result.data.empty()) {
    std::cout << " (" << result.data << ")";
  }
  std::cout << '\n';
  return 0;
}

void print_schedule(const tokenvest::VestingSchedule& schedule) {
  std::cout << "beneficiary=" << schedule.beneficiary << '\n'
            << "total_amount=" << schedule.total_amount << '\n'
            << "start_time=" << schedule.start_time << '\n'
            << "cliff_duration=" << schedule.cliff_duration << '\n'
            << "vesting_duration=" << schedule.vesting_duration << '\n'
            << "released_amount=" << schedule.released_amount << '\n'
            << "is_active=" << (schedule.is_active ? "true" : "false") << '\n';
}

void print_stats(const tokenvest::LedgerStats& stats) {
  std::cout << "beneficiary_count=" << stats.beneficiary_count << '\n'
            << "active_schedule_count=" << stats.active_schedule_count << '\n'
            << "total_vesting_amount=" << stats.total_vesting_amount << '\n'
            << "total_released_amount=" << stats.total_released_amount << '\n';
}

bool expect_args(const CliOptions& options, std::size_t count) {
  if (options.args.size() != count) {
    std::cerr << options.command << " expects " << count << " argument(s)\n";
    return false;
  }
  return true;
}

int run_command(tokenvest::CoreApi& api, const CliOptions& options) {
  const auto& cmd = options.command;
  const auto& args = options.args;

  if (cmd == "create") {
    if (!expect_args(options, 5)) {
      return 1;
    }
    const auto amount = tokenvest::util::parse_uint64(args[2]);
    const auto cliff_days = tokenvest::util::parse_uint64(args[3]);
    const auto duration_days = tokenvest::util::parse_uint64(args[4]);
    if (!amount.has_value() || !cliff_days.has_value() || !duration_days.has_value()) {
      std::cerr << "InvalidConfig: AMOUNT, CLIFF_DAYS and DURATION_DAYS must be non-negative integers\n";
      return 1;
    }
    return report(api.create_schedule(args[0], {
                                                   .beneficiary = args[1],
                                                   .total_amount = *amount,
                                                   .cliff_duration_days = *cliff_days,
                                                   .vesting_duration_days = *duration_days,
                                               }));
  }
  if (cmd == "release") {
    if (!expect_args(options, 2)) {
      return 1;
    }
    const tokenvest::ReleaseOutcome outcome = api.release(args[0], args[1]);
    if (!outcome.result.ok) {
      return report(outcome.result);
    }
    std::cout << "released=" << outcome.amount << '\n';
    return 0;
  }
  if (cmd == "revoke") {
    return expect_args(options, 2) ? report(api.revoke(args[0], args[1])) : 1;
  }
  if (cmd == "schedule") {
    if (!expect_args(options, 1)) {
      return 1;
    }
    const auto schedule = api.get_schedule(args[0]);
    if (!schedule.has_value()) {
      print_schedule({.beneficiary = args[0]});
      return 0;
    }
    print_schedule(*schedule);
    return 0;
  }
  if (cmd == "history") {
    if (!expect_args(options, 1)) {
      return 1;
    }
    const auto history = api.schedule_history(args[0]);
    for (std::size_t n = 0; n < history.size(); ++n) {
      std::cout << "[" << n << "]\n";
      print_schedule(history[n]);
    }
    return 0;
  }
  if (cmd == "releasable") {
    if (!expect_args(options, 1)) {
      return 1;
    }
    std::cout << api.get_releasable_amount(args[0]) << '\n';
    return 0;
  }
  if (cmd == "stats") {
    print_stats(api.get_stats());
    return 0;
  }
  if (cmd == "beneficiaries") {
    for (const auto& beneficiary : api.list_beneficiaries()) {
      std::cout << beneficiary << '\n';
    }
    return 0;
  }
  if (cmd == "transfer-ownership") {
    return expect_args(options, 2) ? report(api.transfer_ownership(args[0], args[1])) : 1;
  }
  if (cmd == "update-token") {
    return expect_args(options, 2) ? report(api.update_token_address(args[0], args[1])) : 1;
  }
  if (cmd == "authorize") {
    return expect_args(options, 2) ? report(api.authorize_creator(args[0], args[1])) : 1;
  }
  if (cmd == "deauthorize") {
    return expect_args(options, 2) ? report(api.deauthorize_creator(args[0], args[1])) : 1;
  }
  if (cmd == "status") {
    const tokenvest::LedgerStatusReport status = api.status();
    std::cout << "owner=" << status.owner << '\n'
              << "token_address=" << status.token_address << '\n'
              << "authorized_creators=" << status.authorized_creators.size() << '\n';
    for (const auto& creator : status.authorized_creators) {
      std::cout << "  " << creator << '\n';
    }
    if (status.custody_managed) {
      std::cout << "custody_balance=" << status.custody_balance << '\n';
    }
    print_stats(status.stats);
    std::cout << "unrecorded_events=" << status.unrecorded_events << '\n'
              << "journal_healthy=" << (status.journal.healthy ? "true" : "false") << '\n'
              << "journal_details=" << status.journal.details << '\n'
              << "journal_events=" << status.journal.event_count << '\n'
              << "journal_head=" << status.journal.head_event_id << '\n'
              << "journal_consensus_hash=" << status.journal.consensus_hash << '\n'
              << "signer_key_id=" << status.signer_key_id << '\n'
              << "config_path=" << status.config_path << '\n'
              << "clock_now=" << status.clock_now << '\n';
    return 0;
  }
  if (cmd == "verify") {
    return report(api.verify_journal());
  }

  std::cerr << "Unknown command " << cmd << '\n';
  print_usage();
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options;
  if (!parse_options(argc, argv, options)) {
    print_usage();
    return 1;
  }

  tokenvest::CoreApi api;
  const tokenvest::Result init = api.init(options.config);
  if (!init.ok) {
    std::cerr << "tokenvest init failed: " << tokenvest::error_kind_name(init.error) << ": " << init.message
              << '\n';
    return 1;
  }

  return run_command(api, options);
}
