#include "core/engine/transfer_engine.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace extropy {
namespace {

constexpr std::size_t kMaxReasonBytes = 1024;
constexpr std::size_t kMaxMetadataEntries = 64;

Result validate_annotations(std::string_view reason, const Metadata& metadata,
                            const std::optional<std::string>& reference) {
  if (reason.size() > kMaxReasonBytes) {
    return Result::failure(ErrorKind::InvalidArgument, "Reason exceeds 1024 bytes.");
  }
  if (metadata.size() > kMaxMetadataEntries) {
    return Result::failure(ErrorKind::InvalidArgument, "Too many metadata entries.");
  }
  for (const auto& [key, value] : metadata) {
    if (key.empty() || key.find_first_of("=\n\\") != std::string::npos) {
      return Result::failure(ErrorKind::InvalidArgument, "Invalid metadata key: " + key);
    }
  }
  if (reference.has_value() && !util::is_canonical_uuid(*reference)) {
    return Result::failure(ErrorKind::InvalidArgument, "Reference id must be a UUID: " + *reference);
  }
  return Result::success();
}

}  // namespace

Outcome<TransferResult> TransferEngine::transfer(const TransferRequest& request) {
  if (!request.amount.positive()) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::InvalidAmount, "Amount must be positive"));
  }
  if (request.from_account == request.to_account) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::SelfTransfer, "Cannot transfer to yourself"));
  }

  AccountStore::Slot* sender = accounts_.find_slot(request.from_account);
  if (sender == nullptr) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::AccountNotFound, "Sender " + request.from_account + " not found"));
  }
  AccountStore::Slot* receiver = accounts_.find_slot(request.to_account);
  if (receiver == nullptr) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::AccountNotFound, "Receiver " + request.to_account + " not found"));
  }

  if (const Result valid = validate_annotations(request.reason, request.metadata, request.attribution_ref);
      !valid.ok) {
    return Outcome<TransferResult>::failure(valid);
  }

  std::scoped_lock lock(sender->mutex, receiver->mutex);

  const Amount available = sender->account.balance;
  if (available < request.amount) {
    return Outcome<TransferResult>::failure(Result::insufficient(available, request.amount));
  }

  const Amount sender_after = Amount::from_units(available.units() - request.amount.units());
  const auto receiver_after = receiver->account.balance.checked_add(request.amount);
  if (!receiver_after.has_value()) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::InvalidAmount, "Amount would overflow the receiver balance"));
  }

  LedgerEntry entry;
  entry.entry_id = util::random_uuid();
  entry.created_us =
      std::max({util::unix_micros_now(), sender->last_entry_us, receiver->last_entry_us});
  entry.kind = request.attribution_ref.has_value() ? TransactionKind::Attribution : TransactionKind::Transfer;
  entry.from_account = request.from_account;
  entry.to_account = request.to_account;
  entry.amount = request.amount;
  entry.reference_id = request.attribution_ref;
  entry.reason = request.reason;
  entry.from_balance_after = sender_after;
  entry.to_balance_after = *receiver_after;
  entry.metadata = request.metadata;

  const Outcome<LedgerEntry> committed = ledger_.append(std::move(entry));
  if (!committed.ok()) {
    return Outcome<TransferResult>::failure(committed.status);
  }

  accounts_.debit(*sender, request.amount);
  accounts_.credit(*receiver, request.amount);
  sender->last_entry_us = committed.value.created_us;
  receiver->last_entry_us = committed.value.created_us;

  return Outcome<TransferResult>::success({
      .transaction_id = committed.value.entry_id,
      .from_account = request.from_account,
      .to_account = request.to_account,
      .amount = request.amount,
      .from_balance = sender->account.balance,
      .to_balance = receiver->account.balance,
      .reason = request.reason,
  });
}

Outcome<Amount> TransferEngine::award(const AwardRequest& request) {
  if (!request.amount.positive()) {
    return Outcome<Amount>::failure(Result::failure(ErrorKind::InvalidAmount, "Amount must be positive"));
  }

  AccountStore::Slot* receiver = accounts_.find_slot(request.to_account);
  if (receiver == nullptr) {
    return Outcome<Amount>::failure(
        Result::failure(ErrorKind::AccountNotFound, "User " + request.to_account + " not found"));
  }

  if (const Result valid = validate_annotations(request.reason, request.metadata, request.content_ref);
      !valid.ok) {
    return Outcome<Amount>::failure(valid);
  }

  std::lock_guard lock(receiver->mutex);

  const auto receiver_after = receiver->account.balance.checked_add(request.amount);
  if (!receiver_after.has_value()) {
    return Outcome<Amount>::failure(
        Result::failure(ErrorKind::InvalidAmount, "Amount would overflow the receiver balance"));
  }

  LedgerEntry entry;
  entry.entry_id = util::random_uuid();
  entry.created_us = std::max(util::unix_micros_now(), receiver->last_entry_us);
  entry.kind = TransactionKind::Earn;
  entry.to_account = request.to_account;
  entry.amount = request.amount;
  entry.reference_id = request.content_ref;
  entry.reason = request.reason;
  entry.to_balance_after = *receiver_after;
  entry.metadata = request.metadata;

  const Outcome<LedgerEntry> committed = ledger_.append(std::move(entry));
  if (!committed.ok()) {
    return Outcome<Amount>::failure(committed.status);
  }

  accounts_.credit(*receiver, request.amount);
  receiver->last_entry_us = committed.value.created_us;
  return Outcome<Amount>::success(receiver->account.balance);
}

Result TransferEngine::restore() {
  accounts_.reset_balances();

  for (const auto& entry : ledger_.entries()) {
    const std::string at = " (entry " + entry.entry_id + ")";

    AccountStore::Slot* receiver = accounts_.find_slot(entry.to_account);
    if (receiver == nullptr) {
      return Result::failure(ErrorKind::StorageFault, "Ledger references unknown account " + entry.to_account + at);
    }
    if (entry.created_us < receiver->last_entry_us) {
      return Result::failure(ErrorKind::StorageFault, "Ledger timestamps go backwards" + at);
    }

    AccountStore::Slot* sender = nullptr;
    if (entry.from_account.has_value()) {
      sender = accounts_.find_slot(*entry.from_account);
      if (sender == nullptr || sender == receiver) {
        return Result::failure(ErrorKind::StorageFault, "Ledger has an invalid source account" + at);
      }
      if (entry.created_us < sender->last_entry_us) {
        return Result::failure(ErrorKind::StorageFault, "Ledger timestamps go backwards" + at);
      }
      if (sender->account.balance < entry.amount) {
        return Result::failure(ErrorKind::StorageFault, "Ledger replay drives a balance negative" + at);
      }
    }

    const auto receiver_after = receiver->account.balance.checked_add(entry.amount);
    if (!receiver_after.has_value() || *receiver_after != entry.to_balance_after) {
      return Result::failure(ErrorKind::StorageFault, "Receiver balance disagrees with ledger" + at);
    }
    if (sender != nullptr) {
      const Amount sender_after = Amount::from_units(sender->account.balance.units() - entry.amount.units());
      if (!entry.from_balance_after.has_value() || sender_after != *entry.from_balance_after) {
        return Result::failure(ErrorKind::StorageFault, "Sender balance disagrees with ledger" + at);
      }
      accounts_.debit(*sender, entry.amount);
      sender->last_entry_us = entry.created_us;
    }
    accounts_.credit(*receiver, entry.amount);
    receiver->last_entry_us = entry.created_us;
  }

  return Result::success("Balances restored from " + std::to_string(ledger_.size()) + " ledger entries.");
}

}  // namespace extropy
