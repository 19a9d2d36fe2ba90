#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace extropy {

struct JournalContents {
  std::vector<std::string> lines;
  // Trailing bytes without a newline were found and discarded.
  bool torn_tail = false;
};

// Append-only line store backing the account and ledger records. A successful
// append() is the commit point of a ledger operation.
class IJournal {
public:
  virtual ~IJournal() = default;

  virtual Result open(std::string_view path) = 0;
  virtual Outcome<JournalContents> load() = 0;
  virtual Result append(std::string_view line) = 0;
  // Replaces the file content with exactly these lines.
  virtual Result rewrite(const std::vector<std::string>& lines) = 0;

  [[nodiscard]] virtual std::string path() const = 0;
};

class FileJournal final : public IJournal {
public:
  explicit FileJournal(bool sync_writes) : sync_writes_(sync_writes) {}

  Result open(std::string_view path) override;
  Outcome<JournalContents> load() override;
  Result append(std::string_view line) override;
  Result rewrite(const std::vector<std::string>& lines) override;

  [[nodiscard]] std::string path() const override { return path_; }

private:
  std::string path_;
  bool sync_writes_ = true;
};

std::unique_ptr<IJournal> make_file_journal(bool sync_writes);

}  // namespace extropy
