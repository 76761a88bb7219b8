#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using bounty::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "bounty_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "C:\\bounty\\\"quoted\"\\ledger.db"
logging:
  level: debug
review:
  compensation_max_attempts: 5
  compensation_backoff_ms: 20
  notifier: NOTIFIER_KIND_LOG_ONLY
admins:
  - id: "22222222-2222-4222-8222-222222222222"
    role: ADMIN_ROLE_SUPER_ADMIN
  - id: "11111111-1111-4111-8111-111111111111"
    role: ADMIN_ROLE_REVIEWER
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "C:\\bounty\\\"quoted\"\\ledger.db");
  assert(config.logging().level() == "debug");
  assert(config.review().compensation_max_attempts() == 5);
  assert(config.review().compensation_backoff_ms() == 20);
  assert(config.review().notifier() == bounty::runtime::config::NOTIFIER_KIND_LOG_ONLY);
  assert(config.admins_size() == 2);
  assert(config.admins(0).role() == bounty::ledger::core::v1::ADMIN_ROLE_SUPER_ADMIN);
}

void TestDefaultsApplied() {
  auto config = ConfigLoader::LoadFromString("logging:\n  level: info\n");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.review().compensation_max_attempts() == 3);
  assert(config.review().compensation_backoff_ms() == 50);
  assert(config.review().notifier() == bounty::runtime::config::NOTIFIER_KIND_ACTIVITY_LOG);

  auto empty = ConfigLoader::LoadFromString("");
  assert(empty.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("server:\n  bind_address: \"0.0.0.0:1\"\nunknown_field: 123\n"));
  assert(Rejects("review:\n  retries: 3\n"));
}

void TestRangesAreValidated() {
  assert(Rejects("review:\n  compensation_max_attempts: 11\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("admins:\n  - id: \"alice\"\n    role: ADMIN_ROLE_ADMIN\n"));
  assert(Rejects("admins:\n  - id: \"22222222-2222-4222-8222-222222222222\"\n"));
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/bounty-ledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must fail on a missing file.");
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsApplied();
  TestUnknownFieldsAreRejected();
  TestRangesAreValidated();
  TestMissingFileFails();

  std::cout << "bounty_ledger_unit_config_loader: pass\n";
  return 0;
}
