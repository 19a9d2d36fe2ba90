#include "core/engine/attribution_resolver.hpp"

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace extropy {
namespace {

constexpr std::size_t kReasonTitleChars = 50;

constexpr Amount kCitationReward = Amount::from_units(10000000);  // 0.1
constexpr Amount kRemixReward = Amount::from_units(50000000);     // 0.5
constexpr Amount kReplyReward = Amount::from_units(5000000);      // 0.05

}  // namespace

std::optional<AttributionKind> AttributionResolver::parse_kind(std::string_view text) {
  const std::string kind = util::lowercase_copy(util::trim_copy(text));
  if (kind == "citation") {
    return AttributionKind::Citation;
  }
  if (kind == "remix") {
    return AttributionKind::Remix;
  }
  if (kind == "reply") {
    return AttributionKind::Reply;
  }
  return std::nullopt;
}

Amount AttributionResolver::reward_for(AttributionKind kind) {
  switch (kind) {
    case AttributionKind::Citation:
      return kCitationReward;
    case AttributionKind::Remix:
      return kRemixReward;
    case AttributionKind::Reply:
      return kReplyReward;
  }
  return kCitationReward;
}

std::vector<RewardRate> AttributionResolver::reward_table() {
  return {
      {.kind = AttributionKind::Citation, .amount = kCitationReward},
      {.kind = AttributionKind::Remix, .amount = kRemixReward},
      {.kind = AttributionKind::Reply, .amount = kReplyReward},
  };
}

Outcome<TransferResult> AttributionResolver::resolve(const AttributionEvent& event) {
  const auto kind = parse_kind(event.kind);
  if (!kind.has_value()) {
    return Outcome<TransferResult>::failure(Result::failure(
        ErrorKind::UnknownAttributionKind,
        "Invalid attribution type '" + event.kind + "'. Must be one of: citation, remix, reply"));
  }
  if (!util::is_canonical_uuid(event.source_content_id) || !util::is_canonical_uuid(event.target_content_id)) {
    return Outcome<TransferResult>::failure(
        Result::failure(ErrorKind::InvalidArgument, "Attribution content ids must be UUIDs."));
  }

  const std::string attribution_id = event.attribution_id.empty() ? util::random_uuid() : event.attribution_id;
  const std::string key = triple_key(event.source_content_id, event.target_content_id, *kind);
  {
    std::lock_guard lock(mutex_);
    if (rewarded_.contains(key) || in_flight_.contains(key)) {
      return Outcome<TransferResult>::failure(Result::failure(
          ErrorKind::DuplicateAttribution, "Attribution already exists for this card pair and type"));
    }
    in_flight_.insert(key);
  }

  const std::string kind_name{attribution_kind_name(*kind)};
  std::string reason = util::uppercase_copy(kind_name);
  if (!event.target_title.empty()) {
    reason += ": " + util::utf8_prefix(event.target_title, kReasonTitleChars);
  }

  const Outcome<TransferResult> result = engine_.transfer({
      .from_account = event.target_owner,
      .to_account = event.source_owner,
      .amount = reward_for(*kind),
      .reason = reason,
      .attribution_ref = attribution_id,
      .metadata = {{"source_card_id", event.source_content_id},
                   {"target_card_id", event.target_content_id},
                   {"attribution_type", kind_name}},
  });

  std::lock_guard lock(mutex_);
  in_flight_.erase(key);
  if (result.ok()) {
    rewarded_.insert(key);
  }
  return result;
}

void AttributionResolver::restore(const Ledger& ledger) {
  std::lock_guard lock(mutex_);
  rewarded_.clear();
  for (const auto& entry : ledger.entries()) {
    if (entry.kind != TransactionKind::Attribution) {
      continue;
    }
    const auto source = entry.metadata.find("source_card_id");
    const auto target = entry.metadata.find("target_card_id");
    const auto type = entry.metadata.find("attribution_type");
    if (source == entry.metadata.end() || target == entry.metadata.end() || type == entry.metadata.end()) {
      continue;
    }
    const auto kind = parse_kind(type->second);
    if (kind.has_value()) {
      rewarded_.insert(triple_key(source->second, target->second, *kind));
    }
  }
}

std::string AttributionResolver::triple_key(std::string_view source_content_id,
                                            std::string_view target_content_id, AttributionKind kind) {
  return std::string{source_content_id} + "|" + std::string{target_content_id} + "|" +
         std::string{attribution_kind_name(kind)};
}

}  // namespace extropy
