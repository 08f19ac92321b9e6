#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using voucher::db::ErrorCode;
using voucher::db::Repository;
using voucher::db::memory::MemoryRepository;
using voucher::db::model::AllowanceRecord;
using voucher::db::model::OfflineBalanceRecord;
using voucher::db::model::PendingTransactionRecord;
using voucher::v1::TRANSACTION_STATUS_FAILED;
using voucher::v1::TRANSACTION_STATUS_PENDING;
using voucher::v1::TRANSACTION_STATUS_SETTLED;
using voucher::v1::TRANSACTION_TYPE_RECEIVED;
using voucher::v1::TRANSACTION_TYPE_SENT;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

PendingTransactionRecord MakeRecord(const std::string& id, voucher::v1::TransactionType type, int64_t ts) {
  return PendingTransactionRecord{.id                 = id,
                                  .type               = type,
                                  .from_address       = "0x1234567890abcdef1234567890abcdef12345678",
                                  .to_address         = "0xabcdef0123456789abcdef0123456789abcdef01",
                                  .amount             = "1.500000",
                                  .voucher_json       = R"({"version":1})",
                                  .voucher_signature  = "sig-" + id,
                                  .timestamp_ms       = ts,
                                  .status             = TRANSACTION_STATUS_PENDING,
                                  .settlement_tx_hash = "",
                                  .device_id          = "device-1"};
}

void VerifyPendingTransactionLifecycle(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertPendingTransaction(*tx, MakeRecord(prefix + "-2", TRANSACTION_TYPE_SENT, 200)));
    assert(repo.InsertPendingTransaction(*tx, MakeRecord(prefix + "-1", TRANSACTION_TYPE_RECEIVED, 100)));

    // reads inside the transaction see its writes
    auto fetched = repo.GetPendingTransaction(*tx, prefix + "-1");
    assert(fetched.has_value());
    assert(fetched->type == TRANSACTION_TYPE_RECEIVED);
    assert(fetched->amount == "1.500000");
    assert(fetched->timestamp_ms == 100);
    assert(fetched->device_id == "device-1");
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto all = repo.ListPendingTransactions(*tx);
    assert(all.size() == 2);
    assert(all[0].id == prefix + "-1");
    assert(all[1].id == prefix + "-2");

    auto by_voucher = repo.FindPendingTransactionByVoucher(*tx, TRANSACTION_TYPE_SENT, "sig-" + prefix + "-2");
    assert(by_voucher.has_value());
    assert(by_voucher->id == prefix + "-2");
    assert(!repo.FindPendingTransactionByVoucher(*tx, TRANSACTION_TYPE_RECEIVED, "sig-" + prefix + "-2").has_value());

    auto duplicate = repo.InsertPendingTransaction(*tx, MakeRecord(prefix + "-1", TRANSACTION_TYPE_RECEIVED, 300));
    assert(!duplicate);

    auto same_voucher = MakeRecord(prefix + "-3", TRANSACTION_TYPE_RECEIVED, 300);
    same_voucher.voucher_signature = "sig-" + prefix + "-1";
    auto second_redemption = repo.InsertPendingTransaction(*tx, same_voucher);
    assert(second_redemption.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.UpdatePendingTransactionStatus(*tx, prefix + "-2", TRANSACTION_STATUS_SETTLED, "0xabc"));
    assert(repo.UpdatePendingTransactionStatus(*tx, prefix + "-1", TRANSACTION_STATUS_FAILED, ""));
    auto missing = repo.UpdatePendingTransactionStatus(*tx, prefix + "-missing", TRANSACTION_STATUS_SETTLED, "");
    assert(missing.code == ErrorCode::NotFound);

    auto settled = repo.GetPendingTransaction(*tx, prefix + "-2");
    assert(settled->status == TRANSACTION_STATUS_SETTLED);
    assert(settled->settlement_tx_hash == "0xabc");

    assert(repo.DeletePendingTransactionsWithStatus(*tx, TRANSACTION_STATUS_SETTLED));
    assert(!repo.GetPendingTransaction(*tx, prefix + "-2").has_value());
    assert(repo.GetPendingTransaction(*tx, prefix + "-1").has_value());
    tx->Commit();
  }
}

void VerifyBalancesAllowancesAndSettings(Repository& repo) {
  auto tx = repo.Begin();

  assert(!repo.GetOfflineBalances(*tx).has_value());
  assert(repo.UpsertOfflineBalances(*tx, OfflineBalanceRecord{.sent = "1.000000", .received = "2.000000"}));
  assert(repo.UpsertOfflineBalances(*tx, OfflineBalanceRecord{.sent = "3.000000", .received = "4.000000"}));
  auto balances = repo.GetOfflineBalances(*tx);
  assert(balances.has_value());
  assert(balances->sent == "3.000000");
  assert(balances->received == "4.000000");

  const std::string wallet = "0x1234567890abcdef1234567890abcdef12345678";
  assert(!repo.GetAllowance(*tx, wallet).has_value());
  assert(repo.UpsertAllowance(*tx, AllowanceRecord{.wallet_address = wallet, .limit = "100.000000", .spent = "0.000000"}));
  assert(repo.UpsertAllowance(*tx, AllowanceRecord{.wallet_address = wallet, .limit = "100.000000", .spent = "40.000000"}));
  auto allowance = repo.GetAllowance(*tx, wallet);
  assert(allowance.has_value());
  assert(allowance->spent == "40.000000");

  assert(!repo.GetSetting(*tx, "device_id").has_value());
  assert(repo.PutSetting(*tx, "device_id", "a"));
  assert(repo.PutSetting(*tx, "device_id", "b"));
  assert(repo.GetSetting(*tx, "device_id") == std::optional<std::string>("b"));

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertPendingTransaction(*tx, MakeRecord(id, TRANSACTION_TYPE_SENT, 1)));
    assert(repo.PutSetting(*tx, id, "value"));
    tx->Rollback();
  }
  {
    // destructor without commit also rolls back
    auto tx = repo.Begin();
    assert(repo.InsertPendingTransaction(*tx, MakeRecord(id + "-dtor", TRANSACTION_TYPE_SENT, 1)));
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetPendingTransaction(*tx, id).has_value());
    assert(!repo.GetPendingTransaction(*tx, id + "-dtor").has_value());
    assert(!repo.GetSetting(*tx, id).has_value());
    tx->Commit();
  }
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.PutSetting(*tx1, id, "first"));
  assert(repo.PutSetting(*tx2, id, "second"));
  tx1->Commit();

  // the stale snapshot may not overwrite the first commit
  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  auto verify_tx = repo.Begin();
  assert(repo.GetSetting(*verify_tx, id) == std::optional<std::string>("first"));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertPendingTransaction(*tx, MakeRecord(id, TRANSACTION_TYPE_RECEIVED, 42)));
    assert(repo->PutSetting(*tx, "durable", id));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto record = repo->GetPendingTransaction(*tx, id);
  assert(record.has_value());
  assert(record->timestamp_ms == 42);
  assert(repo->GetSetting(*tx, "durable") == std::optional<std::string>(id));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("voucher_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto open = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<voucher::db::sqlite::SqliteDB>(db_path);
    voucher::db::sql::RunMigrations(*db, voucher::db::sql::LedgerMigrations());
    return std::make_shared<voucher::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = open,
      .supports_restart = []() { return true; },
      .restart =
          [open](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = open();
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      // one connection, BEGIN IMMEDIATE cannot nest
      .supports_parallel_transactions = false,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyPendingTransactionLifecycle(*repo, backend.name + "-pending");
    VerifyBalancesAllowancesAndSettings(*repo);
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentTransactions(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "voucher_integration_repository_parity: pass\n";
  return 0;
}
