#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"

namespace voucher::testing {

/*
  Forwards to an inner repository and fails the selected operation.

  Failures are returned as db::Result (writes) or thrown from Commit(), the
  way a real backend reports a full disk or a lost lock.
*/
class FaultInjectingRepository final : public db::Repository {
 public:
  enum class Fault {
    kNone,
    kInsertPendingTransaction,
    kUpsertOfflineBalances,
    kUpsertAllowance,
    kCommit,
  };

  explicit FaultInjectingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void Inject(Fault fault) {
    fault_ = fault;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return std::make_unique<Tx>(inner_->Begin(), fault_ == Fault::kCommit);
  }

  db::Result InsertPendingTransaction(db::Transaction& t, const db::model::PendingTransactionRecord& r) override {
    if (fault_ == Fault::kInsertPendingTransaction) return Injected();
    return inner_->InsertPendingTransaction(Inner(t), r);
  }

  std::optional<db::model::PendingTransactionRecord> GetPendingTransaction(db::Transaction& t, const std::string& id) override {
    return inner_->GetPendingTransaction(Inner(t), id);
  }

  std::optional<db::model::PendingTransactionRecord> FindPendingTransactionByVoucher(db::Transaction& t, voucher::v1::TransactionType type,
                                                                                     const std::string& voucher_signature) override {
    return inner_->FindPendingTransactionByVoucher(Inner(t), type, voucher_signature);
  }

  std::vector<db::model::PendingTransactionRecord> ListPendingTransactions(db::Transaction& t) override {
    return inner_->ListPendingTransactions(Inner(t));
  }

  db::Result UpdatePendingTransactionStatus(db::Transaction& t, const std::string& id, voucher::v1::TransactionStatus status,
                                            const std::string& settlement_tx_hash) override {
    return inner_->UpdatePendingTransactionStatus(Inner(t), id, status, settlement_tx_hash);
  }

  db::Result DeletePendingTransactionsWithStatus(db::Transaction& t, voucher::v1::TransactionStatus status) override {
    return inner_->DeletePendingTransactionsWithStatus(Inner(t), status);
  }

  std::optional<db::model::OfflineBalanceRecord> GetOfflineBalances(db::Transaction& t) override {
    return inner_->GetOfflineBalances(Inner(t));
  }

  db::Result UpsertOfflineBalances(db::Transaction& t, const db::model::OfflineBalanceRecord& r) override {
    if (fault_ == Fault::kUpsertOfflineBalances) return Injected();
    return inner_->UpsertOfflineBalances(Inner(t), r);
  }

  std::optional<db::model::AllowanceRecord> GetAllowance(db::Transaction& t, const std::string& wallet_address) override {
    return inner_->GetAllowance(Inner(t), wallet_address);
  }

  db::Result UpsertAllowance(db::Transaction& t, const db::model::AllowanceRecord& r) override {
    if (fault_ == Fault::kUpsertAllowance) return Injected();
    return inner_->UpsertAllowance(Inner(t), r);
  }

  std::optional<std::string> GetSetting(db::Transaction& t, const std::string& key) override {
    return inner_->GetSetting(Inner(t), key);
  }

  db::Result PutSetting(db::Transaction& t, const std::string& key, const std::string& value) override {
    return inner_->PutSetting(Inner(t), key, value);
  }

 private:
  class Tx final : public db::Transaction {
   public:
    Tx(std::unique_ptr<db::Transaction> inner, bool fail_commit) : inner_(std::move(inner)), fail_commit_(fail_commit) {
    }

    void Commit() override {
      if (fail_commit_) {
        inner_->Rollback();
        throw std::runtime_error("injected commit failure");
      }
      inner_->Commit();
    }

    void Rollback() override {
      inner_->Rollback();
    }

    bool IsCommitted() const override {
      return inner_->IsCommitted();
    }

    db::Transaction& Inner() {
      return *inner_;
    }

   private:
    std::unique_ptr<db::Transaction> inner_;
    bool                             fail_commit_;
  };

  static db::Transaction& Inner(db::Transaction& t) {
    return static_cast<Tx&>(t).Inner();
  }

  static db::Result Injected() {
    return db::Result::Err(db::ErrorCode::IOError, "injected storage failure");
  }

  std::shared_ptr<db::Repository> inner_;
  Fault                           fault_ = Fault::kNone;
};

} // namespace voucher::testing
