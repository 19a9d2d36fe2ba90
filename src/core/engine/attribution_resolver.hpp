#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/engine/transfer_engine.hpp"
#include "core/model/types.hpp"
#include "core/storage/ledger.hpp"

namespace extropy {

// Turns a citation/remix/reply between two content items into a fixed-price
// transfer from the citing creator to the original creator.
class AttributionResolver {
public:
  explicit AttributionResolver(TransferEngine& engine) : engine_(engine) {}

  Outcome<TransferResult> resolve(const AttributionEvent& event);

  // Rebuilds the set of already rewarded (source, target, kind) triples.
  void restore(const Ledger& ledger);

  static std::optional<AttributionKind> parse_kind(std::string_view text);
  static Amount reward_for(AttributionKind kind);
  static std::vector<RewardRate> reward_table();

private:
  static std::string triple_key(std::string_view source_content_id, std::string_view target_content_id,
                                AttributionKind kind);

  TransferEngine& engine_;
  mutable std::mutex mutex_;
  std::unordered_set<std::string> rewarded_;
  std::unordered_set<std::string> in_flight_;
};

}  // namespace extropy
