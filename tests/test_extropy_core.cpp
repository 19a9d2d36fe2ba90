#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/engine/attribution_resolver.hpp"
#include "core/service/ledger_config.hpp"
#include "core/service/ledger_service.hpp"
#include "core/storage/journal.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "extropy-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

extropy::Amount amount(std::string_view text) {
  const auto parsed = extropy::Amount::parse(text);
  assert(parsed.has_value());
  return *parsed;
}

extropy::LedgerConfig test_config(const std::filesystem::path& dir) {
  extropy::LedgerConfig config;
  config.data_dir = dir.string();
  config.fsync_journal = false;
  return config;
}

std::string new_account(extropy::LedgerService& service, std::string_view handle = {}) {
  const auto created = service.create_account("", handle);
  assert(created.ok());
  return created.value.account_id;
}

void fund(extropy::LedgerService& service, const std::string& account_id, std::string_view value) {
  const auto awarded = service.award({.to_account = account_id, .amount = amount(value), .reason = "seed"});
  assert(awarded.ok());
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Forwards to a file journal, failing appends while the shared flag is set.
class FlakyJournal final : public extropy::IJournal {
public:
  explicit FlakyJournal(std::shared_ptr<std::atomic<bool>> fail)
      : inner_(extropy::make_file_journal(false)), fail_(std::move(fail)) {}

  extropy::Result open(std::string_view path) override { return inner_->open(path); }
  extropy::Outcome<extropy::JournalContents> load() override { return inner_->load(); }
  extropy::Result append(std::string_view line) override {
    if (fail_->load()) {
      return extropy::Result::failure(extropy::ErrorKind::StorageFault, "injected append failure");
    }
    return inner_->append(line);
  }
  extropy::Result rewrite(const std::vector<std::string>& lines) override { return inner_->rewrite(lines); }
  [[nodiscard]] std::string path() const override { return inner_->path(); }

private:
  std::unique_ptr<extropy::IJournal> inner_;
  std::shared_ptr<std::atomic<bool>> fail_;
};

void test_amount_parsing() {
  assert(amount("1").to_string() == "1.00000000");
  assert(amount("0.1").units() == 10000000);
  assert(amount(".5").to_string() == "0.50000000");
  assert(amount("92233720368.54775807").units() == INT64_MAX);
  assert(amount("-92233720368.54775807").to_string() == "-92233720368.54775807");
  assert(amount("-0.00000005").to_string() == "-0.00000005");
  assert(amount("0.1") < amount("0.10000001"));

  assert(!extropy::Amount::parse("").has_value());
  assert(!extropy::Amount::parse("1e5").has_value());
  assert(!extropy::Amount::parse("1,5").has_value());
  assert(!extropy::Amount::parse(" 1").has_value());
  assert(!extropy::Amount::parse("nan").has_value());
  assert(!extropy::Amount::parse("1.").has_value());
  assert(!extropy::Amount::parse("0.123456789").has_value());
  assert(!extropy::Amount::parse("1234567890123").has_value());
  // Twelve digits fit the text form but not the int64 unit range.
  assert(!extropy::Amount::parse("92233720368.54775808").has_value());
  assert(!extropy::Amount::parse("100000000000").has_value());
  assert(!extropy::Amount::parse("184467440737.09551617").has_value());
  assert(!extropy::Amount::parse("999999999999.99999999").has_value());

  const auto max = extropy::Amount::from_units(INT64_MAX);
  assert(!max.checked_add(extropy::Amount::from_units(1)).has_value());
}

void test_uuid_and_hex_helpers() {
  assert(extropy::util::crypto_init());
  const std::string id = extropy::util::random_uuid();
  assert(extropy::util::is_canonical_uuid(id));
  assert(id[14] == '4');
  assert(!extropy::util::is_canonical_uuid("not-a-uuid"));
  assert(!extropy::util::is_canonical_uuid(extropy::util::uppercase_copy(id)));

  const std::string text = "tab\there\nnewline";
  const auto decoded = extropy::util::from_hex(extropy::util::to_hex(text));
  assert(decoded.has_value() && *decoded == text);
  assert(!extropy::util::from_hex("abc").has_value());
  assert(extropy::util::sha256_hex("").size() == 64);

  const std::string snowmen = "\xE2\x98\x83\xE2\x98\x83\xE2\x98\x83";
  assert(extropy::util::utf8_prefix(snowmen, 2) == "\xE2\x98\x83\xE2\x98\x83");
  assert(extropy::util::utf8_prefix("abc", 10) == "abc");
  assert(extropy::util::utf8_prefix("abc", 0).empty());
}

void test_account_creation() {
  extropy::LedgerService service;
  const auto dir = temp_dir("accounts");
  assert(service.init(test_config(dir)).ok);

  const std::string id = extropy::util::random_uuid();
  const auto created = service.create_account(extropy::util::uppercase_copy(id), "  alice  ");
  assert(created.ok());
  assert(created.value.account_id == id);
  assert(created.value.handle == "alice");
  assert(created.value.balance.zero());

  const auto duplicate = service.create_account(id, "again");
  assert(!duplicate.ok());
  assert(duplicate.status.error == extropy::ErrorKind::DuplicateAccount);

  const auto bad_id = service.create_account("alice", "");
  assert(bad_id.status.error == extropy::ErrorKind::InvalidArgument);

  const auto long_handle = service.create_account("", std::string(200, 'h'));
  assert(long_handle.status.error == extropy::ErrorKind::InvalidArgument);

  const auto balance = service.balance(" " + extropy::util::uppercase_copy(id) + " ");
  assert(balance.ok() && balance.value.zero());

  const auto missing = service.balance(extropy::util::random_uuid());
  assert(missing.status.error == extropy::ErrorKind::AccountNotFound);
}

void test_award_and_transfer_scenarios() {
  extropy::LedgerService service;
  const auto dir = temp_dir("scenarios");
  assert(service.init(test_config(dir)).ok);

  const std::string a = new_account(service, "a");
  const std::string b = new_account(service, "b");

  const auto awarded = service.award({.to_account = a, .amount = amount("1.0"), .reason = "publish"});
  assert(awarded.ok());
  assert(awarded.value.to_string() == "1.00000000");
  auto history = service.history({.account_id = a});
  assert(history.ok() && history.value.size() == 1);
  assert(history.value.front().kind == extropy::TransactionKind::Earn);
  assert(!history.value.front().from_account.has_value());
  assert(history.value.front().to_balance_after == amount("1"));

  const auto moved = service.transfer({.from_account = a, .to_account = b, .amount = amount("0.1"),
                                       .reason = "citation"});
  assert(moved.ok());
  assert(moved.value.from_balance.to_string() == "0.90000000");
  assert(moved.value.to_balance.to_string() == "0.10000000");
  const auto entry = service.entry(moved.value.transaction_id);
  assert(entry.has_value());
  assert(entry->kind == extropy::TransactionKind::Transfer);
  assert(entry->from_balance_after.has_value() && *entry->from_balance_after == amount("0.9"));
  assert(entry->to_balance_after == amount("0.1"));
  assert(entry->reason == "citation");

  const std::string poor = new_account(service, "poor");
  fund(service, poor, "0.01");
  const auto short_funds = service.transfer({.from_account = poor, .to_account = b, .amount = amount("0.1"),
                                             .reason = "citation"});
  assert(!short_funds.ok());
  assert(short_funds.status.error == extropy::ErrorKind::InsufficientBalance);
  assert(short_funds.status.available.has_value() && short_funds.status.available->to_string() == "0.01000000");
  assert(short_funds.status.required.has_value() && short_funds.status.required->to_string() == "0.10000000");
  assert(service.balance(poor).value == amount("0.01"));
  assert(service.balance(b).value == amount("0.1"));

  const auto self = service.transfer({.from_account = a, .to_account = a, .amount = amount("1.0"), .reason = "x"});
  assert(self.status.error == extropy::ErrorKind::SelfTransfer);

  const auto zero = service.transfer({.from_account = a, .to_account = b, .amount = amount("0"), .reason = "x"});
  assert(zero.status.error == extropy::ErrorKind::InvalidAmount);
  const auto negative = service.award({.to_account = a, .amount = amount("-1"), .reason = "x"});
  assert(negative.status.error == extropy::ErrorKind::InvalidAmount);

  const auto unknown = service.transfer({.from_account = a, .to_account = extropy::util::random_uuid(),
                                         .amount = amount("0.1"), .reason = "x"});
  assert(unknown.status.error == extropy::ErrorKind::AccountNotFound);

  const auto bad_ref = service.transfer({.from_account = a, .to_account = b, .amount = amount("0.1"),
                                         .reason = "x", .attribution_ref = "card-7"});
  assert(bad_ref.status.error == extropy::ErrorKind::InvalidArgument);
  const auto bad_key = service.transfer({.from_account = a, .to_account = b, .amount = amount("0.1"),
                                         .reason = "x", .metadata = {{"a=b", "1"}}});
  assert(bad_key.status.error == extropy::ErrorKind::InvalidArgument);
  assert(service.balance(a).value == amount("0.9"));

  const std::string thirds = new_account(service, "thirds");
  for (int i = 0; i < 3; ++i) {
    fund(service, thirds, "0.33333333");
  }
  assert(service.balance(thirds).value.to_string() == "0.99999999");

  const auto report = service.verify();
  assert(report.ok);
  assert(report.accounts_checked == 4);
}

void test_attribution_resolution() {
  extropy::LedgerService service;
  const auto dir = temp_dir("attribution");
  assert(service.init(test_config(dir)).ok);

  const std::string author = new_account(service, "author");
  const std::string citer = new_account(service, "citer");
  fund(service, citer, "1.0");

  const std::string source_card = extropy::util::random_uuid();
  const std::string target_card = extropy::util::random_uuid();

  const auto remix = service.resolve_attribution({
      .attribution_id = {},
      .source_content_id = source_card,
      .target_content_id = target_card,
      .source_owner = author,
      .target_owner = citer,
      .kind = " Remix ",
      .target_title = {},
  });
  assert(remix.ok());
  assert(remix.value.from_account == citer);
  assert(remix.value.to_account == author);
  assert(remix.value.amount == amount("0.5"));
  assert(remix.value.reason == "REMIX");
  assert(service.balance(citer).value == amount("0.5"));
  assert(service.balance(author).value == amount("0.5"));

  const auto entry = service.entry(remix.value.transaction_id);
  assert(entry.has_value());
  assert(entry->kind == extropy::TransactionKind::Attribution);
  assert(entry->reference_id.has_value() && extropy::util::is_canonical_uuid(*entry->reference_id));
  assert(entry->metadata.at("attribution_type") == "remix");
  assert(entry->metadata.at("source_card_id") == source_card);

  const auto again = service.resolve_attribution({
      .source_content_id = source_card,
      .target_content_id = target_card,
      .source_owner = author,
      .target_owner = citer,
      .kind = "remix",
  });
  assert(again.status.error == extropy::ErrorKind::DuplicateAttribution);
  assert(service.balance(citer).value == amount("0.5"));

  const auto unknown = service.resolve_attribution({
      .source_content_id = source_card,
      .target_content_id = target_card,
      .source_owner = author,
      .target_owner = citer,
      .kind = "like",
  });
  assert(unknown.status.error == extropy::ErrorKind::UnknownAttributionKind);

  const std::string title(60, 't');
  const auto citation = service.resolve_attribution({
      .source_content_id = source_card,
      .target_content_id = target_card,
      .source_owner = author,
      .target_owner = citer,
      .kind = "citation",
      .target_title = title,
  });
  assert(citation.ok());
  assert(citation.value.reason == "CITATION: " + title.substr(0, 50));
  assert(citation.value.amount == amount("0.1"));

  // A failed reward does not consume the pair.
  const std::string broke = new_account(service, "broke");
  const std::string reply_card = extropy::util::random_uuid();
  const extropy::AttributionEvent reply{
      .source_content_id = source_card,
      .target_content_id = reply_card,
      .source_owner = author,
      .target_owner = broke,
      .kind = "reply",
  };
  assert(service.resolve_attribution(reply).status.error == extropy::ErrorKind::InsufficientBalance);
  fund(service, broke, "0.05");
  const auto replied = service.resolve_attribution(reply);
  assert(replied.ok());
  assert(service.balance(broke).value.zero());

  const auto earnings = service.attribution_earnings(author);
  assert(earnings.ok());
  assert(earnings.value.count == 3);
  assert(earnings.value.total == amount("0.65"));

  const auto table = service.reward_table();
  assert(table.size() == 3);
  assert(extropy::AttributionResolver::reward_for(extropy::AttributionKind::Reply) == amount("0.05"));

  // Titles are cut by characters, never inside a multi-byte sequence.
  const std::string accented = std::string(49, 'a') + "\xC3\xA9" + "clair";
  const auto accented_reply = service.resolve_attribution({
      .source_content_id = source_card,
      .target_content_id = extropy::util::random_uuid(),
      .source_owner = author,
      .target_owner = citer,
      .kind = "reply",
      .target_title = accented,
  });
  assert(accented_reply.ok());
  const std::string expected_reason = "REPLY: " + std::string(49, 'a') + "\xC3\xA9";
  assert(accented_reply.value.reason == expected_reason);
  assert(service.entry(accented_reply.value.transaction_id)->reason == expected_reason);
}

void test_history_and_stats() {
  extropy::LedgerService service;
  const auto dir = temp_dir("history");
  auto config = test_config(dir);
  config.max_history_page = 3;
  assert(service.init(config).ok);

  const std::string a = new_account(service, "a");
  const std::string b = new_account(service, "b");
  for (int i = 0; i < 4; ++i) {
    fund(service, a, "1");
  }
  const auto sent = service.transfer({.from_account = a, .to_account = b, .amount = amount("1.5"), .reason = "gift"});
  assert(sent.ok());
  const auto published = service.reward_publish(b, extropy::util::random_uuid(), "  First card ");
  assert(published.ok());
  assert(published.value == amount("2.5"));

  const auto newest = service.history({.account_id = a, .limit = 1});
  assert(newest.ok() && newest.value.size() == 1);
  assert(newest.value.front().entry_id == sent.value.transaction_id);

  const auto clamped = service.history({.account_id = a, .limit = 1000});
  assert(clamped.ok() && clamped.value.size() == 3);
  const auto tail = service.history({.account_id = a, .limit = 3, .offset = 3});
  assert(tail.ok() && tail.value.size() == 2);
  for (const auto& entry : clamped.value) {
    for (const auto& older : tail.value) {
      assert(entry.created_us >= older.created_us);
      assert(entry.entry_id != older.entry_id);
    }
  }

  const auto earns = service.history({.account_id = a, .limit = 10, .offset = 0, .kind = "EARN"});
  assert(earns.ok() && earns.value.size() == 3);
  for (const auto& entry : earns.value) {
    assert(entry.kind == extropy::TransactionKind::Earn);
  }

  assert(service.history({.account_id = a, .limit = 0}).status.error == extropy::ErrorKind::InvalidArgument);
  assert(service.history({.account_id = a, .offset = -1}).status.error == extropy::ErrorKind::InvalidArgument);
  assert(service.history({.account_id = a, .kind = "gift"}).status.error == extropy::ErrorKind::InvalidArgument);

  const auto b_history = service.history({.account_id = b});
  assert(b_history.ok() && b_history.value.size() == 2);
  assert(b_history.value.front().reason == "Published card: First card");
  assert(b_history.value.front().metadata.at("card_title") == "First card");

  const auto stats = service.stats(a);
  assert(stats.ok());
  assert(stats.value.balance == amount("2.5"));
  assert(stats.value.total_earned == amount("4"));
  assert(stats.value.total_spent == amount("1.5"));
  assert(stats.value.net_change == stats.value.balance);
  assert(stats.value.transaction_counts.earn == 4);
  assert(stats.value.transaction_counts.transfer == 1);
  assert(stats.value.transaction_counts.total == 5);

  const auto repeat = service.stats(a);
  assert(repeat.value.total_earned == stats.value.total_earned);
  assert(repeat.value.transaction_counts.total == stats.value.transaction_counts.total);

  const auto top = service.top_earners(1);
  assert(top.ok() && top.value.size() == 1);
  assert(top.value.front().account_id == a);
  assert(top.value.front().handle == "a");
}

void test_commit_is_atomic_under_journal_faults() {
  const auto dir = temp_dir("atomicity");
  auto fail = std::make_shared<std::atomic<bool>>(false);

  extropy::LedgerService service;
  assert(service.init(test_config(dir), extropy::make_file_journal(false), std::make_unique<FlakyJournal>(fail)).ok);

  const std::string a = new_account(service);
  const std::string b = new_account(service);
  fund(service, a, "2");
  const std::string head = service.health_report().head_hash;

  fail->store(true);
  const auto moved = service.transfer({.from_account = a, .to_account = b, .amount = amount("1"), .reason = "x"});
  assert(!moved.ok());
  assert(moved.status.error == extropy::ErrorKind::StorageFault);
  const auto awarded = service.award({.to_account = b, .amount = amount("1"), .reason = "x"});
  assert(awarded.status.error == extropy::ErrorKind::StorageFault);

  assert(service.balance(a).value == amount("2"));
  assert(service.balance(b).value.zero());
  auto health = service.health_report();
  assert(health.entry_count == 1);
  assert(health.head_hash == head);
  assert(health.rejected_operation_count == 2);

  fail->store(false);
  const auto retried = service.transfer({.from_account = a, .to_account = b, .amount = amount("1"), .reason = "x"});
  assert(retried.ok());
  health = service.health_report();
  assert(health.healthy);
  assert(health.entry_count == 2);

  const std::string rejected = read_file(dir / "rejected-operations.log");
  assert(rejected.find("transfer\tStorageFault") != std::string::npos);
  assert(rejected.find("award\tStorageFault") != std::string::npos);
}

void test_restart_restores_balances() {
  const auto dir = temp_dir("restart");
  std::string a;
  std::string b;
  std::string head;
  const std::string source_card = extropy::util::random_uuid();
  const std::string target_card = extropy::util::random_uuid();
  {
    extropy::CoreApi api;
    assert(api.init(test_config(dir)).ok);
    a = api.create_account("", "a").value.account_id;
    b = api.create_account("", "b").value.account_id;
    assert(api.award({.to_account = a, .amount = amount("3"), .reason = "seed"}).ok());
    assert(api.resolve_attribution({.source_content_id = source_card,
                                    .target_content_id = target_card,
                                    .source_owner = b,
                                    .target_owner = a,
                                    .kind = "citation"})
               .ok());
    head = api.health_report().head_hash;
  }

  {
    extropy::CoreApi api;
    assert(api.init(test_config(dir)).ok);
    assert(api.balance(a).value == amount("2.9"));
    assert(api.balance(b).value == amount("0.1"));
    assert(api.health_report().head_hash == head);
    assert(api.account(b)->handle == "b");

    const auto duplicate = api.resolve_attribution({.source_content_id = source_card,
                                                    .target_content_id = target_card,
                                                    .source_owner = b,
                                                    .target_owner = a,
                                                    .kind = "citation"});
    assert(duplicate.status.error == extropy::ErrorKind::DuplicateAttribution);

    // Appending after a restart continues the same chain.
    assert(api.award({.to_account = b, .amount = amount("1"), .reason = "later"}).ok());
    assert(api.verify().ok);
  }

  // A torn final record is dropped on open.
  {
    std::ofstream out(dir / "ledger.log", std::ios::app | std::ios::binary);
    out << "ENTRY\t4\tpartial";
  }
  {
    extropy::LedgerService service;
    assert(service.init(test_config(dir)).ok);
    const auto health = service.health_report();
    assert(health.recovered_torn_tail);
    assert(health.dropped_journal_lines == 1);
    assert(health.entry_count == 3);
    assert(health.healthy);
    assert(service.balance(b).value == amount("1.1"));
  }
  assert(read_file(dir / "ledger.log").find("partial") == std::string::npos);

  // Tampering with a committed record is detected.
  {
    std::string text = read_file(dir / "ledger.log");
    const auto pos = text.find("3.00000000");
    assert(pos != std::string::npos);
    text.replace(pos, 10, "9.00000000");
    std::ofstream out(dir / "ledger.log", std::ios::trunc | std::ios::binary);
    out << text;
  }
  {
    extropy::LedgerService service;
    const extropy::Result init = service.init(test_config(dir));
    assert(!init.ok);
    assert(init.error == extropy::ErrorKind::StorageFault);
    assert(service.balance(a).status.error == extropy::ErrorKind::NotInitialized);
  }
}

void test_concurrent_transfers_never_overdraw() {
  extropy::LedgerService service;
  const auto dir = temp_dir("concurrency");
  assert(service.init(test_config(dir)).ok);

  const std::string payer = new_account(service, "payer");
  std::vector<std::string> payees;
  for (int i = 0; i < 4; ++i) {
    payees.push_back(new_account(service));
  }
  fund(service, payer, "1");

  constexpr int kThreads = 20;
  std::atomic<int> succeeded{0};
  std::atomic<int> insufficient{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      const auto moved = service.transfer({.from_account = payer,
                                           .to_account = payees[static_cast<std::size_t>(i) % payees.size()],
                                           .amount = amount("0.1"),
                                           .reason = "burst"});
      if (moved.ok()) {
        ++succeeded;
      } else if (moved.status.error == extropy::ErrorKind::InsufficientBalance) {
        ++insufficient;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(succeeded.load() == 10);
  assert(insufficient.load() == kThreads - 10);
  assert(service.balance(payer).value.zero());

  // Opposite-direction transfers between the same pair must not deadlock.
  const std::string left = payees[0];
  const std::string right = payees[1];
  fund(service, left, "5");
  fund(service, right, "5");
  std::thread forward([&] {
    for (int i = 0; i < 50; ++i) {
      (void)service.transfer({.from_account = left, .to_account = right, .amount = amount("0.01"), .reason = "ping"});
    }
  });
  std::thread backward([&] {
    for (int i = 0; i < 50; ++i) {
      (void)service.transfer({.from_account = right, .to_account = left, .amount = amount("0.01"), .reason = "pong"});
    }
  });
  forward.join();
  backward.join();

  const auto report = service.verify();
  assert(report.ok);
  const auto health = service.health_report();
  assert(health.healthy);
  assert(health.issued_total == amount("11"));
}

void test_config_parsing() {
  const auto parsed = extropy::parse_ledger_config(
      "# ledger settings\n"
      "data_dir = /var/lib/extropy\n"
      "\n"
      "max_history_page=25\n"
      "fsync_journal=no\n"
      "publish_reward=2.5\n");
  assert(parsed.ok());
  assert(parsed.value.data_dir == "/var/lib/extropy");
  assert(parsed.value.max_history_page == 25);
  assert(!parsed.value.fsync_journal);
  assert(parsed.value.verify_on_open);
  assert(parsed.value.publish_reward == amount("2.5"));

  assert(extropy::parse_ledger_config("max_history_page=0\n").status.error == extropy::ErrorKind::InvalidArgument);
  assert(extropy::parse_ledger_config("publish_reward=-1\n").status.error == extropy::ErrorKind::InvalidArgument);
  assert(extropy::parse_ledger_config("colour=blue\n").status.error == extropy::ErrorKind::InvalidArgument);
  assert(extropy::parse_ledger_config("just words\n").status.error == extropy::ErrorKind::InvalidArgument);

  const auto dir = temp_dir("config");
  {
    std::ofstream out(dir / "ledger.conf");
    out << "verify_on_open=false\n";
  }
  const auto loaded = extropy::load_ledger_config((dir / "ledger.conf").string());
  assert(loaded.ok());
  assert(!loaded.value.verify_on_open);
  assert(!extropy::load_ledger_config((dir / "missing.conf").string()).ok());
}

void test_uninitialized_service_rejects_calls() {
  extropy::LedgerService service;
  const std::string id = extropy::util::random_uuid();
  assert(service.create_account(id, "x").status.error == extropy::ErrorKind::NotInitialized);
  assert(service.award({.to_account = id, .amount = amount("1"), .reason = "x"}).status.error ==
         extropy::ErrorKind::NotInitialized);
  assert(service.history({.account_id = id}).status.error == extropy::ErrorKind::NotInitialized);
  assert(!service.health_report().healthy);
}

void test_supply_totals_overflow_is_unhealthy() {
  extropy::LedgerService service;
  const auto dir = temp_dir("supply-overflow");
  assert(service.init(test_config(dir)).ok);

  const std::string a = new_account(service);
  const std::string b = new_account(service);
  fund(service, a, "50000000000");
  fund(service, b, "50000000000");
  assert(service.balance(a).value == amount("50000000000"));
  assert(service.balance(b).value == amount("50000000000"));

  // Each balance fits, the sum of both does not.
  assert(service.verify().ok);
  const auto health = service.health_report();
  assert(!health.healthy);
  assert(health.details.find("overflows") != std::string::npos);
  assert(health.earn_entry_count == 2);
}

void test_journal_rewrite_replaces_torn_tail() {
  const auto dir = temp_dir("journal-rewrite");
  const auto path = dir / "journal.log";
  {
    std::ofstream out(path, std::ios::binary);
    out << "first\nsecond\nthird-partial";
  }

  extropy::FileJournal journal(true);
  assert(journal.open(path.string()).ok);
  const auto loaded = journal.load();
  assert(loaded.ok());
  assert(loaded.value.torn_tail);
  assert(loaded.value.lines.size() == 2);
  assert(read_file(path) == "first\nsecond\n");
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  assert(journal.append("third").ok);
  assert(read_file(path) == "first\nsecond\nthird\n");

  assert(journal.rewrite({"only"}).ok);
  assert(read_file(path) == "only\n");
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  const auto reloaded = journal.load();
  assert(reloaded.ok());
  assert(!reloaded.value.torn_tail);
  assert(reloaded.value.lines == std::vector<std::string>{"only"});
}

void test_stats_while_accounts_are_created() {
  extropy::LedgerService service;
  const auto dir = temp_dir("stats-concurrency");
  assert(service.init(test_config(dir)).ok);

  const std::string a = new_account(service, "a");
  fund(service, a, "1");

  constexpr int kCreated = 50;
  std::thread reader([&] {
    for (int i = 0; i < 200; ++i) {
      const auto stats = service.stats(a);
      assert(stats.ok());
      assert(stats.value.balance == amount("1"));
    }
  });
  std::thread lister([&] {
    for (int i = 0; i < 200; ++i) {
      const auto top = service.top_earners(5);
      assert(top.ok() && !top.value.empty());
    }
  });
  std::thread creator([&] {
    for (int i = 0; i < kCreated; ++i) {
      assert(service.create_account("", "").ok());
    }
  });
  reader.join();
  lister.join();
  creator.join();

  assert(service.health_report().account_count == static_cast<std::size_t>(kCreated) + 1U);
}

void test_rejected_log_keeps_one_line_per_record() {
  extropy::LedgerService service;
  const auto dir = temp_dir("rejected-log");
  assert(service.init(test_config(dir)).ok);

  const auto bad = service.create_account("not\na-uuid\twith\\slash", "");
  assert(bad.status.error == extropy::ErrorKind::InvalidArgument);
  const std::string a = new_account(service);
  const std::string b = new_account(service);
  const auto zero = service.transfer({.from_account = a, .to_account = b, .amount = amount("0"), .reason = "x"});
  assert(zero.status.error == extropy::ErrorKind::InvalidAmount);

  const std::string log = read_file(dir / "rejected-operations.log");
  assert(std::ranges::count(log, '\n') == 2);
  assert(log.find("create_account\tInvalidArgument\t") != std::string::npos);
  assert(log.find("not\\na-uuid\\twith\\\\slash") != std::string::npos);
  assert(log.find("transfer\tInvalidAmount\t") != std::string::npos);
  assert(service.health_report().rejected_operation_count == 2);
}

}  // namespace

int main() {
  test_amount_parsing();
  test_uuid_and_hex_helpers();
  test_account_creation();
  test_award_and_transfer_scenarios();
  test_attribution_resolution();
  test_history_and_stats();
  test_commit_is_atomic_under_journal_faults();
  test_restart_restores_balances();
  test_concurrent_transfers_never_overdraw();
  test_config_parsing();
  test_uninitialized_service_rejects_calls();
  test_supply_totals_overflow_is_unhealthy();
  test_journal_rewrite_replaces_torn_tail();
  test_stats_while_accounts_are_created();
  test_rejected_log_keeps_one_line_per_record();

  std::cout << "extropy_unit_tests passed\n";
  return 0;
}
