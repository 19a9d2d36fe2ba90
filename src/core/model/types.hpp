#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/amount.hpp"

namespace extropy {

enum class ErrorKind {
  None,
  InvalidAmount,
  SelfTransfer,
  AccountNotFound,
  InsufficientBalance,
  UnknownAttributionKind,
  DuplicateAttribution,
  DuplicateAccount,
  InvalidArgument,
  NotInitialized,
  StorageFault,
};

std::string_view error_kind_name(ErrorKind kind);

struct Result {
  bool ok = false;
  ErrorKind error = ErrorKind::None;
  std::string message;
  // Set for InsufficientBalance only.
  std::optional<Amount> available;
  std::optional<Amount> required;

  static Result success(std::string msg = {}) {
    return {true, ErrorKind::None, std::move(msg), std::nullopt, std::nullopt};
  }

  static Result failure(ErrorKind kind, std::string msg) {
    return {false, kind, std::move(msg), std::nullopt, std::nullopt};
  }

  static Result insufficient(Amount have, Amount need) {
    return {false, ErrorKind::InsufficientBalance,
            "Insufficient balance. Available: " + have.to_string() + ", Required: " + need.to_string(),
            have, need};
  }
};

template <typename T>
struct Outcome {
  Result status;
  T value{};

  [[nodiscard]] bool ok() const { return status.ok; }

  static Outcome success(T v, std::string msg = {}) {
    return {Result::success(std::move(msg)), std::move(v)};
  }

  static Outcome failure(Result r) {
    return {std::move(r), T{}};
  }
};

enum class TransactionKind {
  Earn,
  Transfer,
  Attribution,
};

std::string_view transaction_kind_name(TransactionKind kind);
std::optional<TransactionKind> transaction_kind_from_string(std::string_view text);

enum class AttributionKind {
  Citation,
  Remix,
  Reply,
};

std::string_view attribution_kind_name(AttributionKind kind);

// String-keyed scalar attachments; ordered so serialization is stable.
using Metadata = std::map<std::string, std::string>;

struct Account {
  std::string account_id;
  std::string handle;
  Amount balance;
  std::int64_t created_us = 0;
};

struct LedgerEntry {
  std::uint64_t sequence = 0;
  std::string entry_id;
  std::int64_t created_us = 0;
  TransactionKind kind = TransactionKind::Earn;
  std::optional<std::string> from_account;
  std::string to_account;
  Amount amount;
  // Content id for awards, attribution id for attribution transfers.
  std::optional<std::string> reference_id;
  std::string reason;
  std::optional<Amount> from_balance_after;
  Amount to_balance_after;
  Metadata metadata;
  std::string prev_hash;
  std::string entry_hash;
};

struct TransferRequest {
  std::string from_account;
  std::string to_account;
  Amount amount;
  std::string reason;
  std::optional<std::string> attribution_ref;
  Metadata metadata;
};

struct AwardRequest {
  std::string to_account;
  Amount amount;
  std::string reason;
  std::optional<std::string> content_ref;
  Metadata metadata;
};

struct TransferResult {
  std::string transaction_id;
  std::string from_account;
  std::string to_account;
  Amount amount;
  Amount from_balance;
  Amount to_balance;
  std::string reason;
};

struct AttributionEvent {
  std::string attribution_id;
  std::string source_content_id;
  std::string target_content_id;
  // Owner of the cited/remixed/replied-to content; receives the reward.
  std::string source_owner;
  // Owner of the citing content; pays the reward.
  std::string target_owner;
  std::string kind;
  std::string target_title;
};

struct RewardRate {
  AttributionKind kind = AttributionKind::Citation;
  Amount amount;
};

struct HistoryQuery {
  std::string account_id;
  std::int64_t limit = 100;
  std::int64_t offset = 0;
  std::optional<std::string> kind;
};

struct TransactionCounts {
  std::size_t earn = 0;
  std::size_t transfer = 0;
  std::size_t attribution = 0;
  std::size_t total = 0;
};

struct AccountStats {
  std::string account_id;
  Amount balance;
  Amount total_earned;
  Amount total_spent;
  Amount net_change;
  TransactionCounts transaction_counts;
};

struct AttributionEarnings {
  std::string account_id;
  Amount total;
  std::size_t count = 0;
};

struct EarnerSummary {
  std::string account_id;
  std::string handle;
  Amount total_earned;
};

struct ChainReport {
  bool ok = false;
  std::size_t entries_checked = 0;
  std::size_t accounts_checked = 0;
  std::string details;
};

struct LedgerHealthReport {
  bool healthy = false;
  std::string details;
  std::string data_dir;
  std::string accounts_file;
  std::string ledger_file;
  std::string rejected_log_file;
  std::size_t account_count = 0;
  std::size_t entry_count = 0;
  std::size_t earn_entry_count = 0;
  std::size_t transfer_entry_count = 0;
  std::size_t attribution_entry_count = 0;
  std::size_t dropped_journal_lines = 0;
  std::size_t rejected_operation_count = 0;
  Amount circulating_supply;
  Amount issued_total;
  std::string head_hash;
  bool recovered_torn_tail = false;
};

struct LedgerConfig {
  std::string data_dir = "extropy-data";
  std::int64_t max_history_page = 100;
  bool fsync_journal = true;
  bool verify_on_open = true;
  Amount publish_reward = Amount::from_units(Amount::kUnitsPerToken);
};

}  // namespace extropy
