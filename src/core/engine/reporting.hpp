#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/account_store.hpp"
#include "core/storage/ledger.hpp"

namespace extropy {

// Read-only views. Totals and counts are recomputed from the ledger on each call.
class Reporting {
public:
  Reporting(const AccountStore& accounts, const Ledger& ledger) : accounts_(accounts), ledger_(ledger) {}

  void set_max_page(std::int64_t max_page) { max_page_ = max_page > 0 ? max_page : 100; }

  [[nodiscard]] Outcome<Amount> balance(std::string_view account_id) const;
  [[nodiscard]] Outcome<std::vector<LedgerEntry>> history(const HistoryQuery& query) const;
  [[nodiscard]] Outcome<AccountStats> stats(std::string_view account_id) const;
  [[nodiscard]] Outcome<AttributionEarnings> attribution_earnings(std::string_view account_id) const;
  [[nodiscard]] Outcome<std::vector<EarnerSummary>> top_earners(std::size_t count) const;

private:
  const AccountStore& accounts_;
  const Ledger& ledger_;
  std::int64_t max_page_ = 100;
};

}  // namespace extropy
