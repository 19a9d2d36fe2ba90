#pragma once

#include <string>
#include <string_view>

namespace extropy::util {

// Must run before any other call in this header; safe to call repeatedly.
bool crypto_init();

std::string sha256_hex(std::string_view payload);

// Random RFC 4122 version 4 UUID in canonical lowercase form.
std::string random_uuid();
bool is_canonical_uuid(std::string_view text);

}  // namespace extropy::util
