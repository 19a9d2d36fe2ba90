#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace extropy {

// Fixed-point token amount: an integer count of 1e-8 $EXTROPY units.
class Amount {
public:
  static constexpr int kFractionDigits = 8;
  static constexpr std::int64_t kUnitsPerToken = 100000000LL;
  static constexpr int kMaxIntegerDigits = 12;

  constexpr Amount() = default;

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) { return Amount{units}; }
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const { return units_; }
  [[nodiscard]] constexpr bool positive() const { return units_ > 0; }
  [[nodiscard]] constexpr bool negative() const { return units_ < 0; }
  [[nodiscard]] constexpr bool zero() const { return units_ == 0; }

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::optional<Amount> checked_add(Amount other) const;
  [[nodiscard]] std::optional<Amount> checked_sub(Amount other) const;

  constexpr auto operator<=>(const Amount&) const = default;

private:
  constexpr explicit Amount(std::int64_t units) : units_(units) {}

  std::int64_t units_ = 0;
};

}  // namespace extropy
