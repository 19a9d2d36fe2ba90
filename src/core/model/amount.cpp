#include "core/model/amount.hpp"

namespace extropy {

std::optional<Amount> Amount::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view integer_part = dot == std::string_view::npos ? text : text.substr(0, dot);
  const std::string_view fraction_part =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1U);

  if (integer_part.empty() && fraction_part.empty()) {
    return std::nullopt;
  }
  if (dot != std::string_view::npos && fraction_part.empty()) {
    return std::nullopt;
  }
  if (integer_part.size() > static_cast<std::size_t>(kMaxIntegerDigits) ||
      fraction_part.size() > static_cast<std::size_t>(kFractionDigits)) {
    return std::nullopt;
  }

  std::int64_t whole = 0;
  for (char c : integer_part) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    whole = (whole * 10) + (c - '0');
  }

  std::int64_t fraction = 0;
  int digits = 0;
  for (char c : fraction_part) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    fraction = (fraction * 10) + (c - '0');
    ++digits;
  }
  for (; digits < kFractionDigits; ++digits) {
    fraction *= 10;
  }

  // Twelve integer digits can exceed the int64 unit range (about 92233720368 tokens).
  std::int64_t scaled = 0;
  std::int64_t units = 0;
  if (__builtin_mul_overflow(whole, kUnitsPerToken, &scaled) || __builtin_add_overflow(scaled, fraction, &units)) {
    return std::nullopt;
  }
  return Amount{negative ? -units : units};
}

std::string Amount::to_string() const {
  const bool negative = units_ < 0;
  // Magnitude as unsigned so INT64_MIN does not overflow on negation.
  const std::uint64_t magnitude = negative ? (~static_cast<std::uint64_t>(units_) + 1U)
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / static_cast<std::uint64_t>(kUnitsPerToken);
  const std::uint64_t fraction = magnitude % static_cast<std::uint64_t>(kUnitsPerToken);

  std::string fraction_text = std::to_string(fraction);
  fraction_text.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction_text.size(), '0');

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += fraction_text;
  return out;
}

std::optional<Amount> Amount::checked_add(Amount other) const {
  std::int64_t sum = 0;
  if (__builtin_add_overflow(units_, other.units_, &sum)) {
    return std::nullopt;
  }
  return Amount{sum};
}

std::optional<Amount> Amount::checked_sub(Amount other) const {
  std::int64_t diff = 0;
  if (__builtin_sub_overflow(units_, other.units_, &diff)) {
    return std::nullopt;
  }
  return Amount{diff};
}

}  // namespace extropy
