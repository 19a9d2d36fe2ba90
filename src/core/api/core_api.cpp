#include "core/api/core_api.hpp"

namespace extropy {

Result CoreApi::init(const LedgerConfig& config) {
  return service_.init(config);
}

Outcome<Account> CoreApi::create_account(std::string_view account_id, std::string_view handle) {
  return service_.create_account(account_id, handle);
}

Outcome<Amount> CoreApi::award(const AwardRequest& request) {
  return service_.award(request);
}

Outcome<TransferResult> CoreApi::transfer(const TransferRequest& request) {
  return service_.transfer(request);
}

Outcome<TransferResult> CoreApi::resolve_attribution(const AttributionEvent& event) {
  return service_.resolve_attribution(event);
}

Outcome<Amount> CoreApi::reward_publish(std::string_view account_id, std::string_view content_id,
                                        std::string_view title) {
  return service_.reward_publish(account_id, content_id, title);
}

Outcome<Amount> CoreApi::balance(std::string_view account_id) const {
  return service_.balance(account_id);
}

Outcome<std::vector<LedgerEntry>> CoreApi::history(const HistoryQuery& query) const {
  return service_.history(query);
}

Outcome<AccountStats> CoreApi::stats(std::string_view account_id) const {
  return service_.stats(account_id);
}

Outcome<AttributionEarnings> CoreApi::attribution_earnings(std::string_view account_id) const {
  return service_.attribution_earnings(account_id);
}

Outcome<std::vector<EarnerSummary>> CoreApi::top_earners(std::size_t count) const {
  return service_.top_earners(count);
}

std::optional<LedgerEntry> CoreApi::entry(std::string_view entry_id) const {
  return service_.entry(entry_id);
}

std::optional<Account> CoreApi::account(std::string_view account_id) const {
  return service_.account(account_id);
}

std::vector<RewardRate> CoreApi::reward_table() const {
  return service_.reward_table();
}

ChainReport CoreApi::verify() const {
  return service_.verify();
}

LedgerHealthReport CoreApi::health_report() const {
  return service_.health_report();
}

}  // namespace extropy
