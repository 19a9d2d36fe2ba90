#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/engine/attribution_resolver.hpp"
#include "core/engine/reporting.hpp"
#include "core/engine/transfer_engine.hpp"
#include "core/model/types.hpp"
#include "core/storage/account_store.hpp"
#include "core/storage/journal.hpp"
#include "core/storage/ledger.hpp"

namespace extropy {

class LedgerService {
public:
  Result init(const LedgerConfig& config);
  // Same as init(config) with caller-supplied journals in place of files.
  Result init(const LedgerConfig& config, std::unique_ptr<IJournal> accounts_journal,
              std::unique_ptr<IJournal> ledger_journal);

  Outcome<Account> create_account(std::string_view account_id, std::string_view handle);
  Outcome<Amount> award(const AwardRequest& request);
  Outcome<TransferResult> transfer(const TransferRequest& request);
  Outcome<TransferResult> resolve_attribution(const AttributionEvent& event);
  Outcome<Amount> reward_publish(std::string_view account_id, std::string_view content_id,
                                 std::string_view title);

  [[nodiscard]] Outcome<Amount> balance(std::string_view account_id) const;
  [[nodiscard]] Outcome<std::vector<LedgerEntry>> history(const HistoryQuery& query) const;
  [[nodiscard]] Outcome<AccountStats> stats(std::string_view account_id) const;
  [[nodiscard]] Outcome<AttributionEarnings> attribution_earnings(std::string_view account_id) const;
  [[nodiscard]] Outcome<std::vector<EarnerSummary>> top_earners(std::size_t count) const;
  [[nodiscard]] std::optional<LedgerEntry> entry(std::string_view entry_id) const;
  [[nodiscard]] std::optional<Account> account(std::string_view account_id) const;
  [[nodiscard]] std::vector<RewardRate> reward_table() const;

  // Chain hashes plus a full replay compared against live balances. Writes
  // racing with the call can make the comparison fail transiently.
  [[nodiscard]] ChainReport verify() const;
  [[nodiscard]] LedgerHealthReport health_report() const;

private:
  Result not_initialized() const;
  void record_rejected(std::string_view operation, const Result& status);

  LedgerConfig config_;
  bool initialized_ = false;
  std::string rejected_log_path_;
  std::atomic<std::size_t> rejected_count_{0};
  std::mutex rejected_log_mutex_;

  AccountStore accounts_;
  Ledger ledger_;
  TransferEngine engine_{accounts_, ledger_};
  AttributionResolver resolver_{engine_};
  Reporting reporting_{accounts_, ledger_};
};

}  // namespace extropy
