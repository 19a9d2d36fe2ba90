#include "core/storage/account_store.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace extropy {
namespace {

constexpr std::string_view kAccountRecordTag = "ACCOUNT";
constexpr std::size_t kMaxHandleBytes = 128;

std::string record_hash(std::string_view account_id, std::int64_t created_us, std::string_view handle_hex) {
  return util::sha256_hex(std::string{account_id} + "|" + std::to_string(created_us) + "|" +
                          std::string{handle_hex});
}

std::string serialize_account_line(const Account& account) {
  const std::string handle_hex = util::to_hex(account.handle);
  return std::string{kAccountRecordTag} + '\t' + account.account_id + '\t' +
         std::to_string(account.created_us) + '\t' + handle_hex + '\t' +
         record_hash(account.account_id, account.created_us, handle_hex);
}

bool parse_account_line(std::string_view line, Account& out) {
  std::array<std::string_view, 5> fields{};
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
  if (field_index != fields.size() || fields[0] != kAccountRecordTag) {
    return false;
  }

  std::int64_t created_us = 0;
  const auto parsed = std::from_chars(fields[2].data(), fields[2].data() + fields[2].size(), created_us);
  if (parsed.ec != std::errc() || parsed.ptr != fields[2].data() + fields[2].size()) {
    return false;
  }
  const auto handle = util::from_hex(fields[3]);
  if (!handle.has_value()) {
    return false;
  }
  if (record_hash(fields[1], created_us, fields[3]) != fields[4]) {
    return false;
  }

  out.account_id = std::string{fields[1]};
  out.created_us = created_us;
  out.handle = *handle;
  out.balance = Amount{};
  return util::is_canonical_uuid(out.account_id);
}

}  // namespace

Result AccountStore::open(std::unique_ptr<IJournal> journal, std::string_view path) {
  if (!journal) {
    return Result::failure(ErrorKind::InvalidArgument, "Account store requires a journal.");
  }
  journal_ = std::move(journal);

  const Result opened = journal_->open(path);
  if (!opened.ok) {
    return opened;
  }
  return load_journal();
}

Outcome<Account> AccountStore::create_account(std::string_view account_id, std::string_view handle) {
  std::string id = util::lowercase_copy(util::trim_copy(account_id));
  if (id.empty()) {
    id = util::random_uuid();
  }
  if (!util::is_canonical_uuid(id)) {
    return Outcome<Account>::failure(
        Result::failure(ErrorKind::InvalidArgument, "Account id must be a UUID: " + std::string{account_id}));
  }
  const std::string clean_handle = util::trim_copy(handle);
  if (clean_handle.size() > kMaxHandleBytes) {
    return Outcome<Account>::failure(Result::failure(ErrorKind::InvalidArgument, "Account handle is too long."));
  }

  std::unique_lock lock(map_mutex_);
  if (slots_.contains(id)) {
    return Outcome<Account>::failure(Result::failure(ErrorKind::DuplicateAccount, "Account already exists: " + id));
  }

  auto slot = std::make_unique<Slot>();
  slot->account.account_id = id;
  slot->account.handle = clean_handle;
  slot->account.created_us = util::unix_micros_now();

  const Result persisted = journal_->append(serialize_account_line(slot->account));
  if (!persisted.ok) {
    return Outcome<Account>::failure(persisted);
  }

  Account created = slot->account;
  slots_.emplace(id, std::move(slot));
  return Outcome<Account>::success(std::move(created), "Account created.");
}

Outcome<Amount> AccountStore::get_balance(std::string_view account_id) const {
  Slot* slot = find_slot(account_id);
  if (slot == nullptr) {
    return Outcome<Amount>::failure(
        Result::failure(ErrorKind::AccountNotFound, "Account " + std::string{account_id} + " not found"));
  }
  std::lock_guard guard(slot->mutex);
  return Outcome<Amount>::success(slot->account.balance);
}

std::optional<Account> AccountStore::account(std::string_view account_id) const {
  Slot* slot = find_slot(account_id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  std::lock_guard guard(slot->mutex);
  return slot->account;
}

bool AccountStore::exists(std::string_view account_id) const {
  return find_slot(account_id) != nullptr;
}

std::size_t AccountStore::account_count() const {
  std::shared_lock lock(map_mutex_);
  return slots_.size();
}

std::vector<Account> AccountStore::accounts() const {
  std::vector<Account> out;
  {
    std::shared_lock lock(map_mutex_);
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
      std::lock_guard guard(slot->mutex);
      out.push_back(slot->account);
    }
  }
  std::ranges::sort(out, [](const Account& lhs, const Account& rhs) {
    return lhs.account_id < rhs.account_id;
  });
  return out;
}

AccountStore::LockedAccount AccountStore::lock_account(std::string_view account_id) const {
  Slot* slot = find_slot(account_id);
  if (slot == nullptr) {
    return {};
  }
  return {std::unique_lock<std::mutex>(slot->mutex), &slot->account};
}

std::string AccountStore::journal_path() const {
  return journal_ ? journal_->path() : std::string{};
}

AccountStore::Slot* AccountStore::find_slot(std::string_view account_id) const {
  std::shared_lock lock(map_mutex_);
  const auto it = slots_.find(std::string{account_id});
  return it == slots_.end() ? nullptr : it->second.get();
}

void AccountStore::credit(Slot& slot, Amount amount) {
  slot.account.balance = Amount::from_units(slot.account.balance.units() + amount.units());
}

void AccountStore::debit(Slot& slot, Amount amount) {
  slot.account.balance = Amount::from_units(slot.account.balance.units() - amount.units());
}

void AccountStore::reset_balances() {
  std::unique_lock lock(map_mutex_);
  for (auto& [id, slot] : slots_) {
    std::lock_guard guard(slot->mutex);
    slot->account.balance = Amount{};
    slot->last_entry_us = 0;
  }
}

Result AccountStore::load_journal() {
  const Outcome<JournalContents> contents = journal_->load();
  if (!contents.ok()) {
    return contents.status;
  }

  std::unique_lock lock(map_mutex_);
  slots_.clear();
  const auto& lines = contents.value.lines;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto slot = std::make_unique<Slot>();
    if (!parse_account_line(lines[i], slot->account)) {
      return Result::failure(ErrorKind::StorageFault,
                             "Corrupt account record at line " + std::to_string(i + 1U) + ".");
    }
    const std::string id = slot->account.account_id;
    if (!slots_.emplace(id, std::move(slot)).second) {
      return Result::failure(ErrorKind::StorageFault, "Duplicate account record for " + id + ".");
    }
  }

  return Result::success("Loaded " + std::to_string(slots_.size()) + " accounts.");
}

}  // namespace extropy
