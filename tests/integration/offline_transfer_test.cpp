#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/codec/voucher_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/scan/scan_session.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fault_injecting_repository.hpp"
#include "support/test_keys.hpp"

namespace {

using voucher::core::ReceiveFailure;
using voucher::factory::Application;
using voucher::scan::DecodeDisposition;
using voucher::scan::ScanMode;
using voucher::scan::ScanSession;
using voucher::testing::FaultInjectingRepository;
using voucher::util::Amount;
using voucher::v1::TRANSACTION_STATUS_PENDING;
using voucher::v1::TRANSACTION_TYPE_RECEIVED;
using voucher::v1::TRANSACTION_TYPE_SENT;

voucher::runtime::config::RuntimeConfig MemoryConfig() {
  voucher::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_allowance()->set_default_limit("0");
  return config;
}

Application MakeDevice() {
  return voucher::factory::Build(MemoryConfig());
}

struct Parties {
  std::string sender;
  std::string recipient;
};

Parties Addresses(Application& app) {
  return Parties{voucher::testing::AddressOf(*app.crypto, voucher::testing::kSenderSeed),
                 voucher::testing::AddressOf(*app.crypto, voucher::testing::kRecipientSeed)};
}

voucher::crypto::SecretKey SenderKey() {
  return voucher::crypto::SecretKey(voucher::testing::kSenderSeed);
}

void TestIssueAndReceiveAcrossDevices() {
  auto sender_device    = MakeDevice();
  auto recipient_device = MakeDevice();
  auto who              = Addresses(sender_device);

  sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));

  auto issued = sender_device.wallet->Issue(SenderKey(), who.recipient, "40");
  assert(issued.voucher.amount() == "40.000000");
  assert(issued.voucher.from_address() == who.sender);
  assert(issued.transaction.type() == TRANSACTION_TYPE_SENT);
  assert(issued.allowance.spent() == "40.000000");
  assert(issued.allowance.limit() == "100.000000");

  auto sender_balances = sender_device.ledger->GetOfflineBalances();
  assert(sender_balances.sent() == "40.000000");
  assert(sender_balances.received() == "0.000000");
  assert(sender_device.allowance->GetAllowance(who.sender).spent() == "40.000000");

  auto received = recipient_device.wallet->Receive(issued.encoded, who.recipient);
  assert(received);
  assert(received.transaction.has_value());
  assert(received.transaction->type() == TRANSACTION_TYPE_RECEIVED);
  assert(received.transaction->status() == TRANSACTION_STATUS_PENDING);
  assert(received.transaction->amount() == "40.000000");
  assert(received.balances->received() == "40.000000");

  auto pending = recipient_device.ledger->ListPendingTransactions();
  assert(pending.size() == 1);
  assert(pending[0].voucher().signature() == issued.voucher.signature());
  assert(pending[0].device_id() == recipient_device.ledger->GetDeviceId());
  assert(pending[0].device_id() != sender_device.ledger->GetDeviceId());

  // the bearer key sweeps to the address bound in the voucher
  auto redeemed = recipient_device.wallet->Redeem(pending[0].voucher());
  assert(!redeemed.address.empty());

  // the remaining 60 is still available, one unit more is not
  sender_device.wallet->Issue(SenderKey(), who.recipient, "60");
  bool threw = false;
  try {
    sender_device.wallet->Issue(SenderKey(), who.recipient, "0.000001");
  } catch (const voucher::util::InsufficientAllowance&) {
    threw = true;
  }
  assert(threw);
  assert(sender_device.ledger->ListPendingTransactions().size() == 2);
  assert(sender_device.ledger->GetOfflineBalances().sent() == "100.000000");
}

void TestRejectionsLeaveLedgerUntouched() {
  auto sender_device    = MakeDevice();
  auto recipient_device = MakeDevice();
  auto who              = Addresses(sender_device);
  auto other = voucher::testing::AddressOf(*sender_device.crypto, voucher::testing::kOtherSeed);

  sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));
  auto issued = sender_device.wallet->Issue(SenderKey(), who.recipient, "5");

  auto malformed = recipient_device.wallet->Receive("not a voucher", who.recipient);
  assert(!malformed);
  assert(malformed.reason == ReceiveFailure::kMalformedVoucher);

  auto wrong_recipient = recipient_device.wallet->Receive(issued.encoded, other);
  assert(!wrong_recipient);
  assert(wrong_recipient.reason == ReceiveFailure::kInvalidRecipient);

  auto tampered_voucher = issued.voucher;
  tampered_voucher.set_amount("500.000000");
  auto tampered = recipient_device.wallet->Receive(voucher::codec::EncodeVoucher(tampered_voucher), who.recipient);
  assert(!tampered);
  assert(tampered.reason == ReceiveFailure::kInvalidSignature);

  const int64_t eight_days = 8LL * 24 * 60 * 60 * 1000;
  auto          expired    = recipient_device.wallet->Receive(issued.encoded, who.recipient, issued.voucher.timestamp() + eight_days);
  assert(!expired);
  assert(expired.reason == ReceiveFailure::kExpired);

  assert(recipient_device.ledger->ListPendingTransactions().empty());
  assert(recipient_device.ledger->GetOfflineBalances().received() == "0.000000");
}

void TestIssueValidation() {
  auto device = MakeDevice();
  auto who    = Addresses(device);

  // default limit is zero
  bool threw = false;
  try {
    device.wallet->Issue(SenderKey(), who.recipient, "1");
  } catch (const voucher::util::InsufficientAllowance&) {
    threw = true;
  }
  assert(threw);

  device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));

  threw = false;
  try {
    device.wallet->Issue(SenderKey(), who.recipient, "10", std::string("9.999999"));
  } catch (const voucher::util::InsufficientBalance&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    device.wallet->Issue(SenderKey(), who.recipient, "0");
  } catch (const voucher::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    device.wallet->Issue(SenderKey(), "0x1234", "1");
  } catch (const voucher::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  assert(device.ledger->ListPendingTransactions().empty());
  assert(device.allowance->GetAllowance(who.sender).spent() == "0.000000");
}

void TestScanSessionIngestsOnce() {
  auto sender_device    = MakeDevice();
  auto recipient_device = MakeDevice();
  auto who              = Addresses(sender_device);

  sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));
  auto issued = sender_device.wallet->Issue(SenderKey(), who.recipient, "12.5");

  int  handler_calls = 0;
  auto handler       = [&](const std::string& text) {
    ++handler_calls;
    auto result = recipient_device.wallet->Receive(text, who.recipient);
    return voucher::scan::AttemptOutcome{result.accepted, result.message};
  };

  {
    ScanSession session(handler, ScanMode::kContinuous);
    assert(session.OnDecoded(issued.encoded) == DecodeDisposition::kAccepted);
    assert(session.OnDecoded(issued.encoded) == DecodeDisposition::kIgnoredDuplicate);
    assert(session.OnDecoded(issued.encoded) == DecodeDisposition::kIgnoredDuplicate);
    session.Close();
  }
  assert(handler_calls == 1);

  // a new session reaches the ledger, which refuses the second redemption
  {
    ScanSession session(handler, ScanMode::kSingle);
    assert(session.OnDecoded(issued.encoded) == DecodeDisposition::kRejected);
    assert(session.LastMessage().has_value());
    assert(session.OnDecoded(issued.encoded) == DecodeDisposition::kIgnoredKnownBad);
    session.Close();
  }
  assert(handler_calls == 2);

  auto again = recipient_device.wallet->Receive(issued.encoded, who.recipient);
  assert(again.reason == ReceiveFailure::kAlreadyRedeemed);

  assert(recipient_device.ledger->ListPendingTransactions().size() == 1);
  assert(recipient_device.ledger->GetOfflineBalances().received() == "12.500000");
}

void VerifyIssueFaultLeavesNoTrace(FaultInjectingRepository::Fault fault) {
  auto repository = std::make_shared<FaultInjectingRepository>(std::make_shared<voucher::db::memory::MemoryRepository>());
  auto device     = voucher::factory::Build(MemoryConfig(), repository);
  auto who        = Addresses(device);
  device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));

  repository->Inject(fault);
  bool threw = false;
  try {
    device.wallet->Issue(SenderKey(), who.recipient, "40");
  } catch (const voucher::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  repository->Inject(FaultInjectingRepository::Fault::kNone);

  assert(device.ledger->ListPendingTransactions().empty());
  assert(device.ledger->GetOfflineBalances().sent() == "0.000000");
  assert(device.allowance->GetAllowance(who.sender).spent() == "0.000000");

  // the failed attempt left the full allowance in place
  auto issued = device.wallet->Issue(SenderKey(), who.recipient, "100");
  assert(issued.allowance.spent() == "100.000000");
}

void VerifyReceiveFaultLeavesNoTrace(FaultInjectingRepository::Fault fault) {
  auto sender_device = MakeDevice();
  auto who           = Addresses(sender_device);
  sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));
  auto issued = sender_device.wallet->Issue(SenderKey(), who.recipient, "7");

  auto repository       = std::make_shared<FaultInjectingRepository>(std::make_shared<voucher::db::memory::MemoryRepository>());
  auto recipient_device = voucher::factory::Build(MemoryConfig(), repository);

  repository->Inject(fault);
  bool threw = false;
  try {
    recipient_device.wallet->Receive(issued.encoded, who.recipient);
  } catch (const voucher::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  repository->Inject(FaultInjectingRepository::Fault::kNone);

  assert(recipient_device.ledger->ListPendingTransactions().empty());
  assert(recipient_device.ledger->GetOfflineBalances().received() == "0.000000");

  // nothing was recorded, so the same voucher is still redeemable
  auto retried = recipient_device.wallet->Receive(issued.encoded, who.recipient);
  assert(retried);
  assert(recipient_device.ledger->GetOfflineBalances().received() == "7.000000");
}

void TestStorageFailuresAreAtomic() {
  using Fault = FaultInjectingRepository::Fault;
  for (auto fault : {Fault::kInsertPendingTransaction, Fault::kUpsertOfflineBalances, Fault::kUpsertAllowance, Fault::kCommit}) {
    VerifyIssueFaultLeavesNoTrace(fault);
  }
  for (auto fault : {Fault::kInsertPendingTransaction, Fault::kUpsertOfflineBalances, Fault::kCommit}) {
    VerifyReceiveFaultLeavesNoTrace(fault);
  }
}

void TestSettlementLifecycle() {
  auto sender_device    = MakeDevice();
  auto recipient_device = MakeDevice();
  auto who              = Addresses(sender_device);
  sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("100"));

  auto first  = sender_device.wallet->Issue(SenderKey(), who.recipient, "10");
  auto second = sender_device.wallet->Issue(SenderKey(), who.recipient, "20");
  assert(recipient_device.wallet->Receive(first.encoded, who.recipient));
  assert(recipient_device.wallet->Receive(second.encoded, who.recipient));

  auto& ledger  = *recipient_device.ledger;
  auto  pending = ledger.ListPendingTransactions();
  assert(pending.size() == 2);

  ledger.UpdateTransactionStatus(pending[0].id(), voucher::v1::TRANSACTION_STATUS_SETTLED, "0xfeed");
  auto recalculated = ledger.RecalculateOfflineBalances();
  assert(recalculated.received() == Amount::ParseOrThrow(pending[1].amount()).ToString());

  ledger.ClearSettledTransactions();
  assert(ledger.ListPendingTransactions().size() == 1);

  bool threw = false;
  try {
    ledger.UpdateTransactionStatus("missing", voucher::v1::TRANSACTION_STATUS_SETTLED);
  } catch (const voucher::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto reset = sender_device.allowance->ResetAllowance(who.sender, Amount::ParseOrThrow("50"));
  assert(reset.limit() == "50.000000");
  assert(reset.spent() == "0.000000");
}

} // namespace

int main() {
  TestIssueAndReceiveAcrossDevices();
  TestRejectionsLeaveLedgerUntouched();
  TestIssueValidation();
  TestScanSessionIngestsOnce();
  TestStorageFailuresAreAtomic();
  TestSettlementLifecycle();

  std::cout << "voucher_integration_offline_transfer: pass\n";
  return 0;
}
