#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/journal.hpp"

namespace extropy {

// Append-only, hash-chained log of every balance-affecting event. Entries are
// never updated or removed once append() returns them.
class Ledger {
public:
  static constexpr std::string_view kGenesisHash =
      "0000000000000000000000000000000000000000000000000000000000000000";

  Result open(std::unique_ptr<IJournal> journal, std::string_view path);

  // Assigns sequence and chain hashes, then persists. Nothing is indexed when
  // the journal write fails.
  Outcome<LedgerEntry> append(LedgerEntry entry);

  // Entries where the account is source or destination, newest first.
  [[nodiscard]] std::vector<LedgerEntry> history(std::string_view account_id, std::size_t limit,
                                                 std::size_t offset,
                                                 std::optional<TransactionKind> kind) const;
  [[nodiscard]] Outcome<Amount> total_earned(std::string_view account_id) const;
  [[nodiscard]] Outcome<Amount> total_spent(std::string_view account_id) const;
  [[nodiscard]] TransactionCounts counts_for(std::string_view account_id) const;

  [[nodiscard]] std::optional<LedgerEntry> find(std::string_view entry_id) const;
  [[nodiscard]] std::vector<LedgerEntry> entries() const;
  [[nodiscard]] std::vector<LedgerEntry> entries_for(std::string_view account_id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::string head_hash() const;

  // Recomputes every entry hash and the chain links.
  [[nodiscard]] ChainReport verify_chain() const;

  [[nodiscard]] bool recovered_torn_tail() const { return recovered_torn_tail_; }
  [[nodiscard]] std::size_t dropped_lines() const { return dropped_lines_; }
  [[nodiscard]] std::string journal_path() const;

  static std::string compute_entry_hash(const LedgerEntry& entry);

private:
  Result load_journal();
  void index_entry(LedgerEntry entry);

  std::unique_ptr<IJournal> journal_;
  mutable std::mutex mutex_;
  std::vector<LedgerEntry> entries_;
  std::unordered_map<std::string, std::size_t> by_id_;
  std::unordered_map<std::string, std::vector<std::size_t>> by_account_;
  bool recovered_torn_tail_ = false;
  std::size_t dropped_lines_ = 0;
};

}  // namespace extropy
