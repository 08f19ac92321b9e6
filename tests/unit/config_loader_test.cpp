#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "voucher_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)voucher::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
database:
  sqlite:
    path: "/tmp/voucher/ledger.db"
    wal_mode: true
allowance:
  default_limit: "100"
scan:
  continuous: true
)");

  auto config = voucher::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/voucher/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.allowance().default_limit() == "100");
  assert(config.scan().continuous());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\voucher\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = voucher::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\voucher\\\"quoted\"\\db.sqlite");
}

void TestMemoryBackendSelection() {
  const auto yaml_path = WriteYaml("memory",
                                   R"(database:
  memory: {}
)");

  auto config = voucher::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestInvalidDefaultLimitIsRejected() {
  const auto yaml_path = WriteYaml("bad_limit",
                                   R"(allowance:
  default_limit: "12.3456789"
)");

  assert(LoadThrows(yaml_path));
}

void TestEmptySqlitePathIsRejected() {
  const auto yaml_path = WriteYaml("empty_path",
                                   R"(database:
  sqlite:
    path: ""
)");

  assert(LoadThrows(yaml_path));
}

void TestDefaults() {
  auto config = voucher::config::ConfigLoader::Defaults();
  assert(config.database().sqlite().path() == "./voucher-ledger.db");
  assert(config.allowance().default_limit() == "0");
  assert(config.logging().level() == "info");
  assert(!config.scan().continuous());
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMemoryBackendSelection();
  TestUnknownFieldsAreRejected();
  TestInvalidDefaultLimitIsRejected();
  TestEmptySqlitePathIsRejected();
  TestDefaults();

  std::cout << "voucher_unit_config_loader: pass\n";
  return 0;
}
