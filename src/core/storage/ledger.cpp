#include "core/storage/ledger.hpp"

#include <array>
#include <charconv>
#include <ranges>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace extropy {
namespace {

constexpr std::string_view kEntryRecordTag = "ENTRY";
constexpr std::string_view kAbsent = "-";
constexpr std::size_t kEntryFieldCount = 15;

std::string optional_text(const std::optional<std::string>& value) {
  return value.has_value() ? *value : std::string{kAbsent};
}

std::string optional_amount(const std::optional<Amount>& value) {
  return value.has_value() ? value->to_string() : std::string{kAbsent};
}

// Every field except the entry hash, in record order.
std::string serialize_entry_body(const LedgerEntry& entry) {
  std::string out;
  out.reserve(256);
  out += kEntryRecordTag;
  out += '\t' + std::to_string(entry.sequence);
  out += '\t' + entry.entry_id;
  out += '\t' + std::to_string(entry.created_us);
  out += '\t' + std::string{transaction_kind_name(entry.kind)};
  out += '\t' + optional_text(entry.from_account);
  out += '\t' + entry.to_account;
  out += '\t' + entry.amount.to_string();
  out += '\t' + optional_text(entry.reference_id);
  out += '\t' + util::to_hex(entry.reason);
  out += '\t' + optional_amount(entry.from_balance_after);
  out += '\t' + entry.to_balance_after.to_string();
  out += '\t' + util::to_hex(util::canonical_join(entry.metadata));
  out += '\t' + entry.prev_hash;
  return out;
}

std::string serialize_entry_line(const LedgerEntry& entry) {
  return serialize_entry_body(entry) + '\t' + entry.entry_hash;
}

template <typename Int>
bool parse_integer(std::string_view text, Int& out) {
  Int value{};
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

std::optional<std::string> parse_optional_text(std::string_view text) {
  if (text == kAbsent) {
    return std::nullopt;
  }
  return std::string{text};
}

bool parse_entry_line(std::string_view line, LedgerEntry& out) {
  std::array<std::string_view, kEntryFieldCount> fields{};
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
  if (field_index != fields.size() || fields[0] != kEntryRecordTag) {
    return false;
  }

  if (!parse_integer(fields[1], out.sequence) || !parse_integer(fields[3], out.created_us)) {
    return false;
  }
  out.entry_id = std::string{fields[2]};

  const auto kind = transaction_kind_from_string(fields[4]);
  if (!kind.has_value()) {
    return false;
  }
  out.kind = *kind;
  out.from_account = parse_optional_text(fields[5]);
  out.to_account = std::string{fields[6]};

  const auto amount = Amount::parse(fields[7]);
  if (!amount.has_value() || !amount->positive()) {
    return false;
  }
  out.amount = *amount;
  out.reference_id = parse_optional_text(fields[8]);

  const auto reason = util::from_hex(fields[9]);
  if (!reason.has_value()) {
    return false;
  }
  out.reason = *reason;

  if (fields[10] == kAbsent) {
    out.from_balance_after.reset();
  } else {
    const auto from_after = Amount::parse(fields[10]);
    if (!from_after.has_value()) {
      return false;
    }
    out.from_balance_after = *from_after;
  }
  const auto to_after = Amount::parse(fields[11]);
  if (!to_after.has_value()) {
    return false;
  }
  out.to_balance_after = *to_after;

  const auto metadata = util::from_hex(fields[12]);
  if (!metadata.has_value()) {
    return false;
  }
  out.metadata = util::parse_canonical_map(*metadata);
  out.prev_hash = std::string{fields[13]};
  out.entry_hash = std::string{fields[14]};

  // Source and its post-balance are present together or not at all.
  return out.from_account.has_value() == out.from_balance_after.has_value();
}

}  // namespace

std::string Ledger::compute_entry_hash(const LedgerEntry& entry) {
  return util::sha256_hex(serialize_entry_body(entry));
}

Result Ledger::open(std::unique_ptr<IJournal> journal, std::string_view path) {
  if (!journal) {
    return Result::failure(ErrorKind::InvalidArgument, "Ledger requires a journal.");
  }
  journal_ = std::move(journal);

  const Result opened = journal_->open(path);
  if (!opened.ok) {
    return opened;
  }
  return load_journal();
}

Outcome<LedgerEntry> Ledger::append(LedgerEntry entry) {
  std::lock_guard lock(mutex_);
  if (!journal_) {
    return Outcome<LedgerEntry>::failure(Result::failure(ErrorKind::NotInitialized, "Ledger is not open."));
  }
  if (by_id_.contains(entry.entry_id)) {
    return Outcome<LedgerEntry>::failure(
        Result::failure(ErrorKind::StorageFault, "Ledger entry id collision: " + entry.entry_id));
  }

  entry.sequence = entries_.empty() ? 1U : entries_.back().sequence + 1U;
  entry.prev_hash = entries_.empty() ? std::string{kGenesisHash} : entries_.back().entry_hash;
  entry.entry_hash = compute_entry_hash(entry);

  const Result persisted = journal_->append(serialize_entry_line(entry));
  if (!persisted.ok) {
    return Outcome<LedgerEntry>::failure(persisted);
  }

  LedgerEntry committed = entry;
  index_entry(std::move(entry));
  return Outcome<LedgerEntry>::success(std::move(committed));
}

std::vector<LedgerEntry> Ledger::history(std::string_view account_id, std::size_t limit, std::size_t offset,
                                         std::optional<TransactionKind> kind) const {
  std::vector<LedgerEntry> out;
  std::lock_guard lock(mutex_);
  const auto it = by_account_.find(std::string{account_id});
  if (it == by_account_.end()) {
    return out;
  }

  // Per-account timestamps never decrease, so reverse append order is newest first.
  std::size_t skipped = 0;
  for (const std::size_t index : it->second | std::views::reverse) {
    const LedgerEntry& entry = entries_[index];
    if (kind.has_value() && entry.kind != *kind) {
      continue;
    }
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= limit) {
      break;
    }
    out.push_back(entry);
  }
  return out;
}

Outcome<Amount> Ledger::total_earned(std::string_view account_id) const {
  std::lock_guard lock(mutex_);
  Amount total;
  const auto it = by_account_.find(std::string{account_id});
  if (it == by_account_.end()) {
    return Outcome<Amount>::success(total);
  }
  for (const std::size_t index : it->second) {
    const LedgerEntry& entry = entries_[index];
    if (entry.to_account != account_id) {
      continue;
    }
    const auto next = total.checked_add(entry.amount);
    if (!next.has_value()) {
      return Outcome<Amount>::failure(
          Result::failure(ErrorKind::StorageFault, "Total earned overflows for " + std::string{account_id}));
    }
    total = *next;
  }
  return Outcome<Amount>::success(total);
}

Outcome<Amount> Ledger::total_spent(std::string_view account_id) const {
  std::lock_guard lock(mutex_);
  Amount total;
  const auto it = by_account_.find(std::string{account_id});
  if (it == by_account_.end()) {
    return Outcome<Amount>::success(total);
  }
  for (const std::size_t index : it->second) {
    const LedgerEntry& entry = entries_[index];
    if (!entry.from_account.has_value() || *entry.from_account != account_id) {
      continue;
    }
    const auto next = total.checked_add(entry.amount);
    if (!next.has_value()) {
      return Outcome<Amount>::failure(
          Result::failure(ErrorKind::StorageFault, "Total spent overflows for " + std::string{account_id}));
    }
    total = *next;
  }
  return Outcome<Amount>::success(total);
}

TransactionCounts Ledger::counts_for(std::string_view account_id) const {
  TransactionCounts counts;
  std::lock_guard lock(mutex_);
  const auto it = by_account_.find(std::string{account_id});
  if (it == by_account_.end()) {
    return counts;
  }
  for (const std::size_t index : it->second) {
    switch (entries_[index].kind) {
      case TransactionKind::Earn:
        ++counts.earn;
        break;
      case TransactionKind::Transfer:
        ++counts.transfer;
        break;
      case TransactionKind::Attribution:
        ++counts.attribution;
        break;
    }
  }
  counts.total = counts.earn + counts.transfer + counts.attribution;
  return counts;
}

std::optional<LedgerEntry> Ledger::find(std::string_view entry_id) const {
  std::lock_guard lock(mutex_);
  const auto it = by_id_.find(std::string{entry_id});
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return entries_[it->second];
}

std::vector<LedgerEntry> Ledger::entries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

std::vector<LedgerEntry> Ledger::entries_for(std::string_view account_id) const {
  std::vector<LedgerEntry> out;
  std::lock_guard lock(mutex_);
  const auto it = by_account_.find(std::string{account_id});
  if (it == by_account_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const std::size_t index : it->second) {
    out.push_back(entries_[index]);
  }
  return out;
}

std::size_t Ledger::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::string Ledger::head_hash() const {
  std::lock_guard lock(mutex_);
  return entries_.empty() ? std::string{kGenesisHash} : entries_.back().entry_hash;
}

ChainReport Ledger::verify_chain() const {
  ChainReport report;
  std::lock_guard lock(mutex_);

  std::string expected_prev{kGenesisHash};
  std::uint64_t expected_sequence = 1;
  for (const auto& entry : entries_) {
    if (entry.sequence != expected_sequence) {
      report.details = "Sequence gap at entry " + entry.entry_id + ".";
      return report;
    }
    if (entry.prev_hash != expected_prev) {
      report.details = "Broken chain link at sequence " + std::to_string(entry.sequence) + ".";
      return report;
    }
    if (compute_entry_hash(entry) != entry.entry_hash) {
      report.details = "Hash mismatch at sequence " + std::to_string(entry.sequence) + ".";
      return report;
    }
    expected_prev = entry.entry_hash;
    ++expected_sequence;
    ++report.entries_checked;
  }

  report.ok = true;
  report.details = "Ledger chain verified.";
  return report;
}

std::string Ledger::journal_path() const {
  return journal_ ? journal_->path() : std::string{};
}

Result Ledger::load_journal() {
  const Outcome<JournalContents> contents = journal_->load();
  if (!contents.ok()) {
    return contents.status;
  }

  std::lock_guard lock(mutex_);
  entries_.clear();
  by_id_.clear();
  by_account_.clear();
  recovered_torn_tail_ = contents.value.torn_tail;
  dropped_lines_ = contents.value.torn_tail ? 1U : 0U;

  const auto& lines = contents.value.lines;
  std::string expected_prev{kGenesisHash};
  for (std::size_t i = 0; i < lines.size(); ++i) {
    LedgerEntry entry;
    const bool parsed = parse_entry_line(lines[i], entry);
    const bool linked = parsed && entry.prev_hash == expected_prev &&
                        entry.sequence == static_cast<std::uint64_t>(i + 1U) &&
                        compute_entry_hash(entry) == entry.entry_hash && !by_id_.contains(entry.entry_id);
    if (!linked) {
      if (i + 1U == lines.size()) {
        // A damaged final record never reached a successful append; drop it.
        std::vector<std::string> kept(lines.begin(), lines.end() - 1);
        const Result repaired = journal_->rewrite(kept);
        if (!repaired.ok) {
          return repaired;
        }
        recovered_torn_tail_ = true;
        ++dropped_lines_;
        break;
      }
      return Result::failure(ErrorKind::StorageFault,
                             "Ledger journal is corrupt at line " + std::to_string(i + 1U) + ".");
    }
    expected_prev = entry.entry_hash;
    index_entry(std::move(entry));
  }

  return Result::success("Loaded " + std::to_string(entries_.size()) + " ledger entries.");
}

void Ledger::index_entry(LedgerEntry entry) {
  const std::size_t index = entries_.size();
  by_id_.emplace(entry.entry_id, index);
  by_account_[entry.to_account].push_back(index);
  if (entry.from_account.has_value() && *entry.from_account != entry.to_account) {
    by_account_[*entry.from_account].push_back(index);
  }
  entries_.push_back(std::move(entry));
}

}  // namespace extropy
