#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/journal.hpp"

namespace extropy {

class TransferEngine;

// Current balance per account. Balances change only through TransferEngine,
// which is the only class with access to credit/debit.
class AccountStore {
public:
  Result open(std::unique_ptr<IJournal> journal, std::string_view path);

  Outcome<Account> create_account(std::string_view account_id, std::string_view handle);

  [[nodiscard]] Outcome<Amount> get_balance(std::string_view account_id) const;
  [[nodiscard]] std::optional<Account> account(std::string_view account_id) const;
  [[nodiscard]] bool exists(std::string_view account_id) const;
  [[nodiscard]] std::size_t account_count() const;
  [[nodiscard]] std::vector<Account> accounts() const;

  // The account record while its balance lock is held. `account` is null and
  // `lock` empty when the account is unknown.
  struct LockedAccount {
    std::unique_lock<std::mutex> lock;
    const Account* account = nullptr;
  };

  // Never touches the account map while the balance lock is held.
  [[nodiscard]] LockedAccount lock_account(std::string_view account_id) const;

  [[nodiscard]] std::string journal_path() const;

private:
  friend class TransferEngine;

  struct Slot {
    Account account;
    // Latest created_us of any ledger entry touching this account.
    std::int64_t last_entry_us = 0;
    mutable std::mutex mutex;
  };

  [[nodiscard]] Slot* find_slot(std::string_view account_id) const;
  void credit(Slot& slot, Amount amount);
  void debit(Slot& slot, Amount amount);
  void reset_balances();

  Result load_journal();

  std::unique_ptr<IJournal> journal_;
  mutable std::shared_mutex map_mutex_;
  // Slots are heap allocated so pointers stay valid across rehashing.
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

}  // namespace extropy
