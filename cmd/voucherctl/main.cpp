#include <google/protobuf/util/json_util.h>

#include <condition_variable>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/voucher_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scan/renderer.hpp"
#include "internal/scan/scan_session.hpp"
#include "internal/scan/scan_subscription.hpp"
#include "internal/scan/stream_scanner.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "voucher/v1.hpp"

using namespace voucher;

static void Usage() {
  std::cout << "Usage:\n"
            << "  voucherctl [--config <file.yaml>] keygen\n"
            << "  voucherctl [--config <file.yaml>] address <private_key>\n"
            << "  voucherctl [--config <file.yaml>] issue <private_key> <to_address|address_payload> <amount> [available_balance]\n"
            << "  voucherctl [--config <file.yaml>] receive <my_address>\n"
            << "  voucherctl [--config <file.yaml>] balances\n"
            << "  voucherctl [--config <file.yaml>] pending\n"
            << "  voucherctl [--config <file.yaml>] device-id\n"
            << "  voucherctl [--config <file.yaml>] allowance show <address>\n"
            << "  voucherctl [--config <file.yaml>] allowance reset <address> <limit>\n"
            << "  voucherctl [--config <file.yaml>] settle <tx_id> <settled|failed> [tx_hash]\n"
            << "  voucherctl [--config <file.yaml>] recalculate\n"
            << "  voucherctl [--config <file.yaml>] clear-settled\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  auto status                           = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to print message: " + std::string(status.message()));
  }
  return json;
}

static std::optional<v1::TransactionStatus> ParseStatus(const std::string& value) {
  if (value == "settled") {
    return v1::TRANSACTION_STATUS_SETTLED;
  }
  if (value == "failed") {
    return v1::TRANSACTION_STATUS_FAILED;
  }
  if (value == "pending") {
    return v1::TRANSACTION_STATUS_PENDING;
  }
  return std::nullopt;
}

// Feeds stdin lines through a scan session until a voucher is accepted
// (single mode) or input ends.
static int ReceiveFromStdin(factory::Application& app, const std::string& my_address, bool continuous) {
  int accepted = 0;

  auto session = std::make_shared<scan::ScanSession>(
      [&](const std::string& text) {
        auto result = app.wallet->Receive(text, my_address);
        if (!result) {
          std::cerr << "rejected: " << core::ToString(*result.reason) << ": " << result.message << "\n";
          return scan::AttemptOutcome{false, result.message};
        }
        std::cout << ToJson(*result.transaction) << "\n";
        return scan::AttemptOutcome{true, {}};
      },
      continuous ? scan::ScanMode::kContinuous : scan::ScanMode::kSingle);

  auto scanner = std::make_shared<scan::StreamScanner>(std::cin);

  std::mutex              mutex;
  std::condition_variable done_cv;
  bool                    done = false;
  auto                    finish = [&] {
    std::scoped_lock lock(mutex);
    done = true;
    done_cv.notify_all();
  };

  scan::ScanSubscription subscription(
      scanner, session,
      [&](const std::string&, scan::DecodeDisposition disposition) {
        if (disposition != scan::DecodeDisposition::kAccepted) return;
        ++accepted;
        if (!continuous) {
          scanner->RequestStop();
          finish();
        }
      },
      [&](const std::string&) { finish(); });

  subscription.Start();
  {
    std::unique_lock lock(mutex);
    done_cv.wait(lock, [&] { return done; });
  }
  subscription.Cancel();

  if (accepted == 0) {
    std::cerr << "no valid voucher received\n";
    return 2;
  }
  return 0;
}

static int Run(factory::Application& app, const runtime::config::RuntimeConfig& config, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "keygen") {
    auto keypair = app.crypto->GenerateKeypair();
    std::cout << "private_key=" << keypair.private_key.Reveal() << "\n";
    std::cout << "address=" << keypair.address << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "address") {
    if (args.size() < 2) return 1;

    crypto::SecretKey key(args[1]);
    scan::ConsoleRenderer renderer(std::cout);
    renderer.Render(codec::EncodeAddress(app.crypto->DeriveAddress(key)));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "issue") {
    if (args.size() < 4) return 1;

    crypto::SecretKey          key(args[1]);
    const auto                 to = codec::DecodeAddress(args[2]);
    std::optional<std::string> available_balance;
    if (args.size() >= 5) available_balance = args[4];

    auto result = app.wallet->Issue(key, to, args[3], available_balance);

    std::cerr << "issued " << result.voucher.amount() << " to " << to << " (tx " << result.transaction.id() << ")\n";
    scan::ConsoleRenderer renderer(std::cout);
    renderer.Render(result.encoded);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "receive") {
    if (args.size() < 2) return 1;

    const auto my_address = codec::DecodeAddress(args[1]);
    return ReceiveFromStdin(app, my_address, config.scan().continuous());
  }

  // ------------------------------------------------------------

  if (cmd == "balances") {
    std::cout << ToJson(app.ledger->GetOfflineBalances()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pending") {
    for (auto& tx : app.ledger->ListPendingTransactions()) {
      // the bearer key stays in the ledger
      tx.mutable_voucher()->clear_ephemeral_private_key();
      std::cout << ToJson(tx) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "device-id") {
    std::cout << app.ledger->GetDeviceId() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "allowance") {
    if (args.size() < 3) return 1;

    if (args[1] == "show") {
      std::cout << ToJson(app.allowance->GetAllowance(args[2])) << "\n";
      return 0;
    }
    if (args[1] == "reset") {
      if (args.size() < 4) return 1;
      std::cout << ToJson(app.allowance->ResetAllowance(args[2], util::Amount::ParseOrThrow(args[3]))) << "\n";
      return 0;
    }
    std::cerr << "unknown allowance command: " << args[1] << "\n";
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "settle") {
    if (args.size() < 3) return 1;

    auto status = ParseStatus(args[2]);
    if (!status.has_value()) {
      std::cerr << "unsupported status: " << args[2] << "\n";
      return 1;
    }
    app.ledger->UpdateTransactionStatus(args[1], *status, args.size() >= 4 ? args[3] : std::string());
    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recalculate") {
    std::cout << ToJson(app.ledger->RecalculateOfflineBalances()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear-settled") {
    app.ledger->ClearSettledTransactions();
    std::cout << "cleared\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::vector<std::string>   args;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    args.emplace_back(argv[i]);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = config_path ? config::ConfigLoader::LoadFromYaml(*config_path) : config::ConfigLoader::Defaults();
    observability::InitializeLogging(config);

    auto app  = factory::Build(config);
    int  code = Run(app, config, args);
    if (code == 1) Usage();

    observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  observability::ShutdownLogging();
  return 2;
}
