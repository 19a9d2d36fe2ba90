#include "core/service/ledger_config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"

namespace extropy {
namespace {

bool parse_boolish(std::string_view value, bool& out) {
  if (value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "YES") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "FALSE" || value == "no" || value == "NO") {
    out = false;
    return true;
  }
  return false;
}

bool parse_int64(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

Result bad_value(std::size_t line_number, std::string_view key) {
  return Result::failure(ErrorKind::InvalidArgument,
                         "Invalid value for '" + std::string{key} + "' on line " + std::to_string(line_number) + ".");
}

}  // namespace

Outcome<LedgerConfig> parse_ledger_config(std::string_view text, LedgerConfig base) {
  LedgerConfig config = std::move(base);

  std::istringstream in{std::string{text}};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Outcome<LedgerConfig>::failure(Result::failure(
          ErrorKind::InvalidArgument, "Expected key=value on line " + std::to_string(line_number) + "."));
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));

    if (key == "data_dir") {
      if (value.empty()) {
        return Outcome<LedgerConfig>::failure(bad_value(line_number, key));
      }
      config.data_dir = value;
    } else if (key == "max_history_page") {
      std::int64_t page = 0;
      if (!parse_int64(value, page) || page < 1) {
        return Outcome<LedgerConfig>::failure(bad_value(line_number, key));
      }
      config.max_history_page = page;
    } else if (key == "fsync_journal") {
      if (!parse_boolish(value, config.fsync_journal)) {
        return Outcome<LedgerConfig>::failure(bad_value(line_number, key));
      }
    } else if (key == "verify_on_open") {
      if (!parse_boolish(value, config.verify_on_open)) {
        return Outcome<LedgerConfig>::failure(bad_value(line_number, key));
      }
    } else if (key == "publish_reward") {
      const auto reward = Amount::parse(value);
      if (!reward.has_value() || !reward->positive()) {
        return Outcome<LedgerConfig>::failure(bad_value(line_number, key));
      }
      config.publish_reward = *reward;
    } else {
      return Outcome<LedgerConfig>::failure(Result::failure(
          ErrorKind::InvalidArgument, "Unknown config key '" + key + "' on line " + std::to_string(line_number) + "."));
    }
  }

  return Outcome<LedgerConfig>::success(std::move(config));
}

Outcome<LedgerConfig> load_ledger_config(std::string_view path, LedgerConfig base) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Outcome<LedgerConfig>::failure(
        Result::failure(ErrorKind::InvalidArgument, "Cannot read config file " + std::string{path} + "."));
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_ledger_config(ss.str(), std::move(base));
}

}  // namespace extropy
