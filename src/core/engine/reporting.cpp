#include "core/engine/reporting.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

#include "core/util/canonical.hpp"

namespace extropy {
namespace {

Result not_found(std::string_view account_id) {
  return Result::failure(ErrorKind::AccountNotFound, "User " + std::string{account_id} + " not found");
}

}  // namespace

Outcome<Amount> Reporting::balance(std::string_view account_id) const {
  return accounts_.get_balance(account_id);
}

Outcome<std::vector<LedgerEntry>> Reporting::history(const HistoryQuery& query) const {
  using HistoryOutcome = Outcome<std::vector<LedgerEntry>>;

  if (!accounts_.exists(query.account_id)) {
    return HistoryOutcome::failure(not_found(query.account_id));
  }
  if (query.limit < 1) {
    return HistoryOutcome::failure(Result::failure(ErrorKind::InvalidArgument, "History limit must be at least 1."));
  }
  if (query.offset < 0) {
    return HistoryOutcome::failure(Result::failure(ErrorKind::InvalidArgument, "History offset cannot be negative."));
  }

  std::optional<TransactionKind> kind;
  if (query.kind.has_value() && !query.kind->empty()) {
    kind = transaction_kind_from_string(util::lowercase_copy(util::trim_copy(*query.kind)));
    if (!kind.has_value()) {
      return HistoryOutcome::failure(
          Result::failure(ErrorKind::InvalidArgument, "Unknown transaction type: " + *query.kind));
    }
  }

  const auto limit = static_cast<std::size_t>(std::min(query.limit, max_page_));
  return HistoryOutcome::success(
      ledger_.history(query.account_id, limit, static_cast<std::size_t>(query.offset), kind));
}

Outcome<AccountStats> Reporting::stats(std::string_view account_id) const {
  // Holding the balance lock keeps the balance and the ledger sums from the same commit.
  const AccountStore::LockedAccount account = accounts_.lock_account(account_id);
  if (account.account == nullptr) {
    return Outcome<AccountStats>::failure(not_found(account_id));
  }

  const Outcome<Amount> earned = ledger_.total_earned(account_id);
  if (!earned.ok()) {
    return Outcome<AccountStats>::failure(earned.status);
  }
  const Outcome<Amount> spent = ledger_.total_spent(account_id);
  if (!spent.ok()) {
    return Outcome<AccountStats>::failure(spent.status);
  }
  const auto net = earned.value.checked_sub(spent.value);
  if (!net.has_value()) {
    return Outcome<AccountStats>::failure(
        Result::failure(ErrorKind::StorageFault, "Net change overflows for " + std::string{account_id}));
  }

  return Outcome<AccountStats>::success({
      .account_id = std::string{account_id},
      .balance = account.account->balance,
      .total_earned = earned.value,
      .total_spent = spent.value,
      .net_change = *net,
      .transaction_counts = ledger_.counts_for(account_id),
  });
}

Outcome<AttributionEarnings> Reporting::attribution_earnings(std::string_view account_id) const {
  if (!accounts_.exists(account_id)) {
    return Outcome<AttributionEarnings>::failure(not_found(account_id));
  }

  AttributionEarnings earnings;
  earnings.account_id = std::string{account_id};
  for (const auto& entry : ledger_.entries_for(account_id)) {
    if (entry.kind != TransactionKind::Attribution || entry.to_account != account_id) {
      continue;
    }
    const auto next = earnings.total.checked_add(entry.amount);
    if (!next.has_value()) {
      return Outcome<AttributionEarnings>::failure(
          Result::failure(ErrorKind::StorageFault, "Attribution earnings overflow."));
    }
    earnings.total = *next;
    ++earnings.count;
  }
  return Outcome<AttributionEarnings>::success(std::move(earnings));
}

Outcome<std::vector<EarnerSummary>> Reporting::top_earners(std::size_t count) const {
  std::vector<EarnerSummary> out;
  for (const auto& account : accounts_.accounts()) {
    const Outcome<Amount> earned = ledger_.total_earned(account.account_id);
    if (!earned.ok()) {
      return Outcome<std::vector<EarnerSummary>>::failure(earned.status);
    }
    if (earned.value.zero()) {
      continue;
    }
    out.push_back({.account_id = account.account_id, .handle = account.handle, .total_earned = earned.value});
  }

  std::ranges::sort(out, [](const EarnerSummary& lhs, const EarnerSummary& rhs) {
    if (lhs.total_earned != rhs.total_earned) {
      return lhs.total_earned > rhs.total_earned;
    }
    return lhs.account_id < rhs.account_id;
  });
  if (out.size() > count) {
    out.resize(count);
  }
  return Outcome<std::vector<EarnerSummary>>::success(std::move(out));
}

}  // namespace extropy
