#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/offline_wallet.hpp"
#include "internal/crypto/crypto_capability.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/allowance_guard.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/ledger/local_ledger.hpp"
#include "internal/voucher/voucher_issuer.hpp"
#include "internal/voucher/voucher_verifier.hpp"

namespace voucher::factory {

/*
  Application

  Owns the long-lived objects of one device ledger.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<ledger::LedgerStore>           store;
  std::shared_ptr<crypto::CryptoCapability>      crypto;
  std::shared_ptr<ledger::LocalLedger>           ledger;
  std::shared_ptr<ledger::AllowanceGuard>        allowance;
  std::shared_ptr<issuance::VoucherIssuer>       issuer;
  std::shared_ptr<verification::VoucherVerifier> verifier;
  std::shared_ptr<core::OfflineWallet>           wallet;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete DB and crypto
  types. Throws util::StorageError when the ledger cannot be opened.
*/
Application Build(const voucher::runtime::config::RuntimeConfig& config);

// Same graph over a caller-provided repository (tests, fault injection).
Application Build(const voucher::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

std::shared_ptr<db::Repository> BuildRepository(const voucher::runtime::config::RuntimeConfig& config);

} // namespace voucher::factory
