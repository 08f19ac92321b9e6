#include "ledger_store.hpp"

#include "internal/observability/logging.hpp"

namespace voucher::ledger {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageError(message);
  }
}

std::unique_ptr<db::Transaction> LedgerStore::BeginOrThrow() {
  try {
    return repository_->Begin();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("begin ledger transaction: ") + e.what());
  }
}

void LedgerStore::CommitOrThrow(db::Transaction& tx) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    VOUCHER_LOG_ERROR("ledger commit failed", {observability::StringField("error", e.what())});
    if (dynamic_cast<const util::StorageError*>(&e) != nullptr) {
      throw;
    }
    throw util::StorageError(std::string("commit ledger transaction: ") + e.what());
  }
}

} // namespace voucher::ledger
