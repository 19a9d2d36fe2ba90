#include "core/service/ledger_service.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace extropy {
namespace {

constexpr std::string_view kAccountsFile = "accounts.log";
constexpr std::string_view kLedgerFile = "ledger.log";
constexpr std::string_view kRejectedLogFile = "rejected-operations.log";

std::string normalize_id(std::string_view id) {
  return util::lowercase_copy(util::trim_copy(id));
}

std::optional<std::string> normalize_ref(const std::optional<std::string>& ref) {
  if (!ref.has_value()) {
    return std::nullopt;
  }
  std::string clean = normalize_id(*ref);
  if (clean.empty()) {
    return std::nullopt;
  }
  return clean;
}

// One record per line: tabs, newlines and backslashes in messages are escaped.
std::string escape_log_field(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

}  // namespace

Result LedgerService::init(const LedgerConfig& config) {
  return init(config, make_file_journal(config.fsync_journal), make_file_journal(config.fsync_journal));
}

Result LedgerService::init(const LedgerConfig& config, std::unique_ptr<IJournal> accounts_journal,
                           std::unique_ptr<IJournal> ledger_journal) {
  initialized_ = false;
  config_ = config;
  reporting_.set_max_page(config_.max_history_page);

  if (!util::crypto_init()) {
    return Result::failure(ErrorKind::NotInitialized, "libsodium initialization failed.");
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.data_dir, ec);
  if (ec) {
    return Result::failure(ErrorKind::StorageFault, "Failed to create data directory: " + ec.message());
  }

  const std::filesystem::path root{config_.data_dir};
  rejected_log_path_ = (root / std::string{kRejectedLogFile}).string();

  if (const Result opened = accounts_.open(std::move(accounts_journal), (root / std::string{kAccountsFile}).string());
      !opened.ok) {
    record_rejected("init", opened);
    return opened;
  }
  if (const Result opened = ledger_.open(std::move(ledger_journal), (root / std::string{kLedgerFile}).string());
      !opened.ok) {
    record_rejected("init", opened);
    return opened;
  }
  if (const Result restored = engine_.restore(); !restored.ok) {
    record_rejected("init", restored);
    return restored;
  }
  resolver_.restore(ledger_);

  if (config_.verify_on_open) {
    const ChainReport chain = ledger_.verify_chain();
    if (!chain.ok) {
      const Result fault = Result::failure(ErrorKind::StorageFault, chain.details);
      record_rejected("init", fault);
      return fault;
    }
  }

  initialized_ = true;
  return Result::success("Ledger opened with " + std::to_string(accounts_.account_count()) + " accounts and " +
                         std::to_string(ledger_.size()) + " entries.");
}

Outcome<Account> LedgerService::create_account(std::string_view account_id, std::string_view handle) {
  if (!initialized_) {
    return Outcome<Account>::failure(not_initialized());
  }
  Outcome<Account> created = accounts_.create_account(account_id, handle);
  if (!created.ok()) {
    record_rejected("create_account", created.status);
  }
  return created;
}

Outcome<Amount> LedgerService::award(const AwardRequest& request) {
  if (!initialized_) {
    return Outcome<Amount>::failure(not_initialized());
  }
  AwardRequest normalized = request;
  normalized.to_account = normalize_id(request.to_account);
  normalized.content_ref = normalize_ref(request.content_ref);

  Outcome<Amount> awarded = engine_.award(normalized);
  if (!awarded.ok()) {
    record_rejected("award", awarded.status);
  }
  return awarded;
}

Outcome<TransferResult> LedgerService::transfer(const TransferRequest& request) {
  if (!initialized_) {
    return Outcome<TransferResult>::failure(not_initialized());
  }
  TransferRequest normalized = request;
  normalized.from_account = normalize_id(request.from_account);
  normalized.to_account = normalize_id(request.to_account);
  normalized.attribution_ref = normalize_ref(request.attribution_ref);

  Outcome<TransferResult> moved = engine_.transfer(normalized);
  if (!moved.ok()) {
    record_rejected("transfer", moved.status);
  }
  return moved;
}

Outcome<TransferResult> LedgerService::resolve_attribution(const AttributionEvent& event) {
  if (!initialized_) {
    return Outcome<TransferResult>::failure(not_initialized());
  }
  AttributionEvent normalized = event;
  normalized.attribution_id = normalize_id(event.attribution_id);
  normalized.source_content_id = normalize_id(event.source_content_id);
  normalized.target_content_id = normalize_id(event.target_content_id);
  normalized.source_owner = normalize_id(event.source_owner);
  normalized.target_owner = normalize_id(event.target_owner);

  Outcome<TransferResult> rewarded = resolver_.resolve(normalized);
  if (!rewarded.ok()) {
    record_rejected("resolve_attribution", rewarded.status);
  }
  return rewarded;
}

Outcome<Amount> LedgerService::reward_publish(std::string_view account_id, std::string_view content_id,
                                              std::string_view title) {
  const std::string clean_title = util::trim_copy(title);
  return award({
      .to_account = std::string{account_id},
      .amount = config_.publish_reward,
      .reason = "Published card: " + clean_title,
      .content_ref = std::string{content_id},
      .metadata = {{"card_title", clean_title}},
  });
}

Outcome<Amount> LedgerService::balance(std::string_view account_id) const {
  if (!initialized_) {
    return Outcome<Amount>::failure(not_initialized());
  }
  return reporting_.balance(normalize_id(account_id));
}

Outcome<std::vector<LedgerEntry>> LedgerService::history(const HistoryQuery& query) const {
  if (!initialized_) {
    return Outcome<std::vector<LedgerEntry>>::failure(not_initialized());
  }
  HistoryQuery normalized = query;
  normalized.account_id = normalize_id(query.account_id);
  return reporting_.history(normalized);
}

Outcome<AccountStats> LedgerService::stats(std::string_view account_id) const {
  if (!initialized_) {
    return Outcome<AccountStats>::failure(not_initialized());
  }
  return reporting_.stats(normalize_id(account_id));
}

Outcome<AttributionEarnings> LedgerService::attribution_earnings(std::string_view account_id) const {
  if (!initialized_) {
    return Outcome<AttributionEarnings>::failure(not_initialized());
  }
  return reporting_.attribution_earnings(normalize_id(account_id));
}

Outcome<std::vector<EarnerSummary>> LedgerService::top_earners(std::size_t count) const {
  if (!initialized_) {
    return Outcome<std::vector<EarnerSummary>>::failure(not_initialized());
  }
  return reporting_.top_earners(count);
}

std::optional<LedgerEntry> LedgerService::entry(std::string_view entry_id) const {
  return ledger_.find(normalize_id(entry_id));
}

std::optional<Account> LedgerService::account(std::string_view account_id) const {
  return accounts_.account(normalize_id(account_id));
}

std::vector<RewardRate> LedgerService::reward_table() const {
  return AttributionResolver::reward_table();
}

ChainReport LedgerService::verify() const {
  ChainReport report = ledger_.verify_chain();
  if (!report.ok) {
    return report;
  }

  std::unordered_map<std::string, Amount> replayed;
  for (const auto& entry : ledger_.entries()) {
    const auto credited = replayed[entry.to_account].checked_add(entry.amount);
    if (!credited.has_value()) {
      report.ok = false;
      report.details = "Replayed balance of " + entry.to_account + " overflows at entry " + entry.entry_id + ".";
      return report;
    }
    replayed[entry.to_account] = *credited;
    if (entry.from_account.has_value()) {
      const auto debited = replayed[*entry.from_account].checked_sub(entry.amount);
      if (!debited.has_value()) {
        report.ok = false;
        report.details =
            "Replayed balance of " + *entry.from_account + " overflows at entry " + entry.entry_id + ".";
        return report;
      }
      replayed[*entry.from_account] = *debited;
    }
  }

  for (const auto& account : accounts_.accounts()) {
    const auto it = replayed.find(account.account_id);
    const Amount expected = it == replayed.end() ? Amount{} : it->second;
    if (account.balance != expected || account.balance.negative()) {
      report.ok = false;
      report.details = "Balance of " + account.account_id + " is " + account.balance.to_string() +
                       " but the ledger sums to " + expected.to_string() + ".";
      return report;
    }
    ++report.accounts_checked;
  }

  report.details = "Ledger chain and balances verified.";
  return report;
}

LedgerHealthReport LedgerService::health_report() const {
  LedgerHealthReport report;
  report.data_dir = config_.data_dir;
  report.accounts_file = accounts_.journal_path();
  report.ledger_file = ledger_.journal_path();
  report.rejected_log_file = rejected_log_path_;
  report.account_count = accounts_.account_count();
  report.dropped_journal_lines = ledger_.dropped_lines();
  report.recovered_torn_tail = ledger_.recovered_torn_tail();
  report.rejected_operation_count = rejected_count_.load();
  report.head_hash = ledger_.head_hash();

  if (!initialized_) {
    report.details = "Ledger is not initialized.";
    return report;
  }

  const auto entries = ledger_.entries();
  report.entry_count = entries.size();
  bool totals_fit = true;
  for (const auto& entry : entries) {
    switch (entry.kind) {
      case TransactionKind::Earn: {
        ++report.earn_entry_count;
        const auto issued = report.issued_total.checked_add(entry.amount);
        if (issued.has_value()) {
          report.issued_total = *issued;
        } else {
          totals_fit = false;
        }
        break;
      }
      case TransactionKind::Transfer:
        ++report.transfer_entry_count;
        break;
      case TransactionKind::Attribution:
        ++report.attribution_entry_count;
        break;
    }
  }

  for (const auto& account : accounts_.accounts()) {
    const auto circulating = report.circulating_supply.checked_add(account.balance);
    if (circulating.has_value()) {
      report.circulating_supply = *circulating;
    } else {
      totals_fit = false;
    }
  }

  const ChainReport chain = verify();
  if (!chain.ok) {
    report.details = chain.details;
  } else if (!totals_fit) {
    report.details = "Issued or circulating supply overflows the amount range.";
  } else if (report.issued_total != report.circulating_supply) {
    // Transfers conserve tokens, so every issued unit must still be held somewhere.
    report.details = "Circulating supply differs from issued total.";
  } else {
    report.healthy = true;
    report.details = chain.details;
  }
  return report;
}

Result LedgerService::not_initialized() const {
  return Result::failure(ErrorKind::NotInitialized, "Ledger service is not initialized.");
}

void LedgerService::record_rejected(std::string_view operation, const Result& status) {
  ++rejected_count_;
  if (rejected_log_path_.empty()) {
    return;
  }

  std::lock_guard lock(rejected_log_mutex_);
  std::ofstream out(rejected_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << util::unix_timestamp_now() << '\t' << operation << '\t' << error_kind_name(status.error) << '\t'
      << escape_log_field(status.message) << '\n';
}

}  // namespace extropy
