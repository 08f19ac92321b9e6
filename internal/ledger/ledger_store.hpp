#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace voucher::ledger {

// Maps a non-OK repository result to util::NotFound or util::StorageError.
void ThrowIfDbError(const db::Result& result, const std::string& context);

/*
  LedgerStore

  Owns the device ledger and enforces a single writer per device: every
  unit of work runs under one mutex inside one repository transaction.

  Write(fn):
    - Begin or Commit failure -> util::StorageError, nothing persisted
    - fn throws -> transaction rolled back, exception propagates unchanged

  Do not call Write/Read from inside fn; use the Transaction& overloads of
  LocalLedger and AllowanceGuard instead.
*/
class LedgerStore {
 public:
  explicit LedgerStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  }

  db::Repository& Repository() {
    return *repository_;
  }

  template <typename Fn>
  auto Write(Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&> {
    std::scoped_lock lock(mutex_);
    auto             tx = BeginOrThrow();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      CommitOrThrow(*tx);
    } else {
      auto result = fn(*tx);
      CommitOrThrow(*tx);
      return result;
    }
  }

  // Reads run in a transaction that is never committed.
  template <typename Fn>
  auto Read(Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&> {
    std::scoped_lock lock(mutex_);
    auto             tx = BeginOrThrow();
    return fn(*tx);
  }

 private:
  std::unique_ptr<db::Transaction> BeginOrThrow();
  void                             CommitOrThrow(db::Transaction& tx);

  std::shared_ptr<db::Repository> repository_;
  std::mutex                      mutex_;
};

} // namespace voucher::ledger
