#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/ledger_service.hpp"

namespace extropy {

class CoreApi {
public:
  Result init(const LedgerConfig& config);

  Outcome<Account> create_account(std::string_view account_id, std::string_view handle);
  Outcome<Amount> award(const AwardRequest& request);
  Outcome<TransferResult> transfer(const TransferRequest& request);
  Outcome<TransferResult> resolve_attribution(const AttributionEvent& event);
  Outcome<Amount> reward_publish(std::string_view account_id, std::string_view content_id,
                                 std::string_view title);

  Outcome<Amount> balance(std::string_view account_id) const;
  Outcome<std::vector<LedgerEntry>> history(const HistoryQuery& query) const;
  Outcome<AccountStats> stats(std::string_view account_id) const;
  Outcome<AttributionEarnings> attribution_earnings(std::string_view account_id) const;
  Outcome<std::vector<EarnerSummary>> top_earners(std::size_t count) const;
  std::optional<LedgerEntry> entry(std::string_view entry_id) const;
  std::optional<Account> account(std::string_view account_id) const;
  std::vector<RewardRate> reward_table() const;

  ChainReport verify() const;
  LedgerHealthReport health_report() const;

private:
  LedgerService service_;
};

}  // namespace extropy
