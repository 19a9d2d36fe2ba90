#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/service/ledger_config.hpp"

namespace {

void print_usage() {
  std::cerr << extropy::kAppDisplayName << " " << extropy::kAppVersion << " (" << extropy::kBuildRelease << ")\n"
            << "usage: extropy_ledger [--data-dir DIR] [--config FILE] <command> [args]\n"
            << "  create-account [ID] [HANDLE]\n"
            << "  award ID AMOUNT REASON [CONTENT]\n"
            << "  transfer FROM TO AMOUNT REASON [ATTRIBUTION]\n"
            << "  balance ID\n"
            << "  history ID [LIMIT] [OFFSET] [KIND]\n"
            << "  stats ID\n"
            << "  earnings ID\n"
            << "  top [COUNT]\n"
            << "  attribute KIND SOURCE_CONTENT TARGET_CONTENT SOURCE_OWNER TARGET_OWNER [TITLE]\n"
            << "  publish ID CONTENT TITLE\n"
            << "  rewards\n"
            << "  health\n"
            << "  verify\n";
}

int report_failure(const extropy::Result& status) {
  std::cerr << "error: " << extropy::error_kind_name(status.error) << ": " << status.message << '\n';
  return 1;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::size_t i = 0;
  bool negative = false;
  if (text.front() == '-') {
    negative = true;
    i = 1;
    if (text.size() == 1) {
      return std::nullopt;
    }
  }
  std::int64_t value = 0;
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    if (value > (INT64_MAX - (c - '0')) / 10) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return negative ? -value : value;
}

void print_entry(const extropy::LedgerEntry& entry) {
  std::cout << entry.sequence << '\t' << entry.entry_id << '\t' << extropy::transaction_kind_name(entry.kind)
            << '\t' << entry.from_account.value_or("-") << '\t' << entry.to_account << '\t'
            << entry.amount.to_string() << '\t' << entry.reason << '\n';
}

void print_transfer(const extropy::TransferResult& result) {
  std::cout << "transaction " << result.transaction_id << '\n'
            << "  " << result.from_account << " -> " << result.to_account << " " << result.amount.to_string()
            << " " << extropy::kTokenSymbol << '\n'
            << "  sender balance " << result.from_balance.to_string() << '\n'
            << "  receiver balance " << result.to_balance.to_string() << '\n';
}

int run_command(extropy::CoreApi& api, const std::vector<std::string>& args) {
  const std::string& command = args.front();
  const auto arg = [&args](std::size_t i) -> std::string_view {
    return i < args.size() ? std::string_view{args[i]} : std::string_view{};
  };
  const std::size_t argc = args.size();

  if (command == "create-account") {
    const auto created = api.create_account(arg(1), arg(2));
    if (!created.ok()) {
      return report_failure(created.status);
    }
    std::cout << created.value.account_id << '\n';
    return 0;
  }

  if (command == "award" && argc >= 4) {
    const auto amount = extropy::Amount::parse(arg(2));
    if (!amount.has_value()) {
      return report_failure(extropy::Result::failure(extropy::ErrorKind::InvalidAmount, "Malformed amount."));
    }
    extropy::AwardRequest request{
        .to_account = std::string{arg(1)},
        .amount = *amount,
        .reason = std::string{arg(3)},
        .content_ref = std::nullopt,
        .metadata = {},
    };
    if (argc >= 5) {
      request.content_ref = std::string{arg(4)};
    }
    const auto awarded = api.award(request);
    if (!awarded.ok()) {
      return report_failure(awarded.status);
    }
    std::cout << awarded.value.to_string() << '\n';
    return 0;
  }

  if (command == "transfer" && argc >= 5) {
    const auto amount = extropy::Amount::parse(arg(3));
    if (!amount.has_value()) {
      return report_failure(extropy::Result::failure(extropy::ErrorKind::InvalidAmount, "Malformed amount."));
    }
    extropy::TransferRequest request{
        .from_account = std::string{arg(1)},
        .to_account = std::string{arg(2)},
        .amount = *amount,
        .reason = std::string{arg(4)},
        .attribution_ref = std::nullopt,
        .metadata = {},
    };
    if (argc >= 6) {
      request.attribution_ref = std::string{arg(5)};
    }
    const auto moved = api.transfer(request);
    if (!moved.ok()) {
      return report_failure(moved.status);
    }
    print_transfer(moved.value);
    return 0;
  }

  if (command == "balance" && argc >= 2) {
    const auto balance = api.balance(arg(1));
    if (!balance.ok()) {
      return report_failure(balance.status);
    }
    std::cout << balance.value.to_string() << '\n';
    return 0;
  }

  if (command == "history" && argc >= 2) {
    extropy::HistoryQuery query{.account_id = std::string{arg(1)}};
    if (argc >= 3) {
      const auto limit = parse_integer(arg(2));
      if (!limit.has_value()) {
        return report_failure(extropy::Result::failure(extropy::ErrorKind::InvalidArgument, "Malformed limit."));
      }
      query.limit = *limit;
    }
    if (argc >= 4) {
      const auto offset = parse_integer(arg(3));
      if (!offset.has_value()) {
        return report_failure(extropy::Result::failure(extropy::ErrorKind::InvalidArgument, "Malformed offset."));
      }
      query.offset = *offset;
    }
    if (argc >= 5) {
      query.kind = std::string{arg(4)};
    }
    const auto history = api.history(query);
    if (!history.ok()) {
      return report_failure(history.status);
    }
    for (const auto& entry : history.value) {
      print_entry(entry);
    }
    return 0;
  }

  if (command == "stats" && argc >= 2) {
    const auto stats = api.stats(arg(1));
    if (!stats.ok()) {
      return report_failure(stats.status);
    }
    const auto& s = stats.value;
    std::cout << "account " << s.account_id << '\n'
              << "balance " << s.balance.to_string() << '\n'
              << "total_earned " << s.total_earned.to_string() << '\n'
              << "total_spent " << s.total_spent.to_string() << '\n'
              << "net_change " << s.net_change.to_string() << '\n'
              << "transactions earn=" << s.transaction_counts.earn
              << " transfer=" << s.transaction_counts.transfer
              << " attribution=" << s.transaction_counts.attribution
              << " total=" << s.transaction_counts.total << '\n';
    return 0;
  }

  if (command == "earnings" && argc >= 2) {
    const auto earnings = api.attribution_earnings(arg(1));
    if (!earnings.ok()) {
      return report_failure(earnings.status);
    }
    std::cout << earnings.value.total.to_string() << " from " << earnings.value.count << " attributions\n";
    return 0;
  }

  if (command == "top") {
    std::size_t count = 10;
    if (argc >= 2) {
      const auto parsed = parse_integer(arg(1));
      if (!parsed.has_value() || *parsed < 0) {
        return report_failure(extropy::Result::failure(extropy::ErrorKind::InvalidArgument, "Malformed count."));
      }
      count = static_cast<std::size_t>(*parsed);
    }
    const auto top = api.top_earners(count);
    if (!top.ok()) {
      return report_failure(top.status);
    }
    for (const auto& earner : top.value) {
      std::cout << earner.account_id << '\t' << (earner.handle.empty() ? "-" : earner.handle) << '\t'
                << earner.total_earned.to_string() << '\n';
    }
    return 0;
  }

  if (command == "attribute" && argc >= 6) {
    const auto rewarded = api.resolve_attribution({
        .attribution_id = {},
        .source_content_id = std::string{arg(2)},
        .target_content_id = std::string{arg(3)},
        .source_owner = std::string{arg(4)},
        .target_owner = std::string{arg(5)},
        .kind = std::string{arg(1)},
        .target_title = std::string{arg(6)},
    });
    if (!rewarded.ok()) {
      return report_failure(rewarded.status);
    }
    print_transfer(rewarded.value);
    return 0;
  }

  if (command == "publish" && argc >= 4) {
    const auto awarded = api.reward_publish(arg(1), arg(2), arg(3));
    if (!awarded.ok()) {
      return report_failure(awarded.status);
    }
    std::cout << awarded.value.to_string() << '\n';
    return 0;
  }

  if (command == "rewards") {
    for (const auto& rate : api.reward_table()) {
      std::cout << extropy::attribution_kind_name(rate.kind) << '\t' << rate.amount.to_string() << '\n';
    }
    return 0;
  }

  if (command == "health") {
    const auto health = api.health_report();
    std::cout << "healthy " << (health.healthy ? "yes" : "no") << '\n'
              << "details " << health.details << '\n'
              << "data_dir " << health.data_dir << '\n'
              << "accounts " << health.account_count << " (" << health.accounts_file << ")\n"
              << "entries " << health.entry_count << " (" << health.ledger_file << ")\n"
              << "  earn " << health.earn_entry_count << '\n'
              << "  transfer " << health.transfer_entry_count << '\n'
              << "  attribution " << health.attribution_entry_count << '\n'
              << "issued " << health.issued_total.to_string() << '\n'
              << "circulating " << health.circulating_supply.to_string() << '\n'
              << "head " << health.head_hash << '\n'
              << "dropped_journal_lines " << health.dropped_journal_lines << '\n'
              << "recovered_torn_tail " << (health.recovered_torn_tail ? "yes" : "no") << '\n'
              << "rejected_operations " << health.rejected_operation_count << " (" << health.rejected_log_file
              << ")\n";
    return health.healthy ? 0 : 1;
  }

  if (command == "verify") {
    const auto report = api.verify();
    std::cout << report.details << " entries=" << report.entries_checked
              << " accounts=" << report.accounts_checked << '\n';
    return report.ok ? 0 : 1;
  }

  print_usage();
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  std::string data_dir;
  std::string config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string_view current{argv[i]};
    if ((current == "--data-dir" || current == "--config") && i + 1 < argc) {
      (current == "--data-dir" ? data_dir : config_path) = argv[++i];
      continue;
    }
    if (current == "--help" || current == "-h") {
      print_usage();
      return 0;
    }
    args.emplace_back(current);
  }
  if (args.empty()) {
    print_usage();
    return 2;
  }

  extropy::LedgerConfig config;
  if (!config_path.empty()) {
    const auto loaded = extropy::load_ledger_config(config_path);
    if (!loaded.ok()) {
      return report_failure(loaded.status);
    }
    config = loaded.value;
  }
  if (!data_dir.empty()) {
    config.data_dir = data_dir;
  }

  extropy::CoreApi api;
  const extropy::Result init = api.init(config);
  if (!init.ok) {
    std::cerr << extropy::kAppDisplayName << " init failed: " << init.message << '\n';
    return 1;
  }

  return run_command(api, args);
}
