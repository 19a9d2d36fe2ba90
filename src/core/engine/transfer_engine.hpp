#pragma once

#include "core/model/types.hpp"
#include "core/storage/account_store.hpp"
#include "core/storage/ledger.hpp"

namespace extropy {

// The only writer of balances. Every operation checks its preconditions, then
// appends exactly one ledger entry and applies the matching balance changes
// while holding the involved account locks. The journal append is the commit
// point: if it fails, no balance changes.
class TransferEngine {
public:
  TransferEngine(AccountStore& accounts, Ledger& ledger) : accounts_(accounts), ledger_(ledger) {}

  Outcome<TransferResult> transfer(const TransferRequest& request);
  Outcome<Amount> award(const AwardRequest& request);

  // Rebuilds balances by replaying the ledger. Fails when a recorded
  // post-balance disagrees with the replay or an entry names an unknown account.
  Result restore();

private:
  AccountStore& accounts_;
  Ledger& ledger_;
};

}  // namespace extropy
