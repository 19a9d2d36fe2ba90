#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace extropy::util {

std::int64_t unix_timestamp_now();
std::int64_t unix_micros_now();

std::string lowercase_copy(std::string_view value);
std::string uppercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);
// First `code_points` UTF-8 characters; continuation bytes count with their lead byte.
std::string utf8_prefix(std::string_view value, std::size_t code_points);

std::string to_hex(std::string_view bytes);
// Returns nullopt on odd length or a non-hex digit.
std::optional<std::string> from_hex(std::string_view hex);

std::string canonical_join(const Metadata& fields);
Metadata parse_canonical_map(std::string_view payload);

}  // namespace extropy::util
