#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace extropy {

// Reads `key=value` lines over `base`. Blank lines and `#` comments are
// skipped; unknown keys and malformed values are rejected.
Outcome<LedgerConfig> load_ledger_config(std::string_view path, LedgerConfig base = {});

Outcome<LedgerConfig> parse_ledger_config(std::string_view text, LedgerConfig base = {});

}  // namespace extropy
