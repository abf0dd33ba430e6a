#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_defaults.hpp"

namespace {

using ledger::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Throws(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
logging:
  level: debug
store:
  enabled: true
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\events.db"
  retention_ms: 3600000
  max_rows: 5000
  prune_interval_ms: 1000
  busy_timeout_ms: 250
  span_timeout_ms: 2000
sampling:
  dev_mode: true
ingest:
  queue_capacity: 64
contracts:
  defer_ttl_ms: 500
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.logging().level() == "debug");
  assert(config.store().sqlite().path() == "C:\\ledger\\\"quoted\"\\events.db");
  assert(config.store().retention_ms() == 3600000);
  assert(config.store().max_rows() == 5000);
  assert(config.store().span_timeout_ms() == 2000);
  assert(config.sampling().dev_mode());
  assert(config.ingest().queue_capacity() == 64);
  assert(config.contracts().defer_ttl_ms() == 500);
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == ledger::config::kDefaultBindAddress);
  assert(config.store().enabled());
  assert(config.store().sqlite().path() == ledger::config::kDefaultSqlitePath);
  assert(config.store().retention_ms() == ledger::config::kDefaultRetentionMs);
  assert(config.store().busy_timeout_ms() == ledger::config::kDefaultBusyTimeoutMs);
  assert(config.ingest().queue_capacity() == ledger::config::kDefaultIngestCapacity);
  assert(config.contracts().defer_ttl_ms() == ledger::config::kDefaultDeferTtlMs);
  assert(config.logging().level() == ledger::config::kDefaultLogLevel);
  assert(config.logging().sink() == ledger::config::kDefaultLogSink);
  assert(!config.sampling().dev_mode());
}

void TestPartialDocumentKeepsExplicitValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  enabled: false
  retention_ms: 1000
)");
  assert(!config.store().enabled());
  assert(config.store().retention_ms() == 1000);
  assert(config.store().max_rows() == ledger::config::kDefaultMaxRows);
  assert(config.store().sqlite().path() == ledger::config::kDefaultSqlitePath);
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  assert(Throws("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Throws("store:\n  retention: 5\n"));
  // the outbound bridge section was removed; old files must be fixed, not ignored
  assert(Throws("bridge:\n  peer_id: ledgerd\n"));
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  sqlite:
    path: "2024"
  max_rows: "5000"
)");
  assert(config.store().sqlite().path() == "2024");
  assert(config.store().max_rows() == 5000);
}

void TestLoggingSettingsAreValidated() {
  auto config = ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n  sink: stdout\n");
  assert(config.logging().level() == "warn");
  assert(config.logging().sink() == "stdout");

  assert(Throws("logging:\n  level: verbose\n"));
  assert(Throws("logging:\n  sink: syslog\n"));

  std::string message;
  try {
    (void)ConfigLoader::LoadFromYamlString("logging:\n  sink: file\n");
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message.find("logging.sink") != std::string::npos);
}

void TestMalformedDocumentsAreRejected() {
  assert(Throws("- a\n- b\n"));
  assert(Throws("store: [1, 2\n"));
  assert(Throws("store:\n  max_rows: lots\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/ledger/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullFile();
  TestEmptyDocumentIsAllDefaults();
  TestPartialDocumentKeepsExplicitValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestQuotedNumbersStayStrings();
  TestLoggingSettingsAreValidated();
  TestMalformedDocumentsAreRejected();

  std::cout << "ledger_unit_config_loader: pass\n";
  return 0;
}
