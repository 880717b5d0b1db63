#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stockcount_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: /var/lib/stockcount/device.db
remote:
  inventory_address: "inventory.local:50051"
  deadline_ms: 2500
session:
  device_id: "0042"
  healthy_factor: 2
  skip_hint_threshold: 3
)");

  auto config = stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/stockcount/device.db");
  assert(config.remote().inventory_address() == "inventory.local:50051");
  assert(config.remote().deadline_ms() == 2500);

  // quoted scalars stay strings
  assert(config.session().device_id() == "0042");
  assert(config.session().healthy_factor() == 2.0);
  assert(config.session().skip_hint_threshold() == 3);

  // blob store follows the inventory endpoint unless set
  assert(config.remote().blob_store_address() == "inventory.local:50051");
}

void TestDefaultsFillEmptyConfig() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(remote:
  fixture_path: examples/fixtures/areas.yaml
)");

  auto config = stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.remote().fixture_path() == "examples/fixtures/areas.yaml");
  assert(config.remote().deadline_ms() == 5000);
  assert(config.remote().connectivity_poll_ms() == 1000);
  assert(config.session().device_id() == "local-device");
  assert(config.session().healthy_factor() == 1.5);
  assert(config.session().skip_hint_threshold() == 2);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\stock\\\"quoted\"\\db.sqlite"
)");

  auto config = stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\stock\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(session:
  device_id: "a"
  max_skips: 3
)");

  bool threw = false;
  try {
    (void)stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)stockcount::config::ConfigLoader::LoadFromYaml("/nonexistent/stockcount.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const stockcount::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects("low_factor", "session:\n  healthy_factor: 0.5\n"));
  assert(Rejects("negative_factor", "session:\n  healthy_factor: -2\n"));
  assert(Rejects("empty_sqlite_path", "database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("bad_level", "logging:\n  level: chatty\n"));
  assert(Rejects("top_level_list", "- a\n- b\n"));

  assert(!Rejects("level_off", "logging:\n  level: \"off\"\n"));
  assert(!Rejects("factor_one", "session:\n  healthy_factor: 1\n"));
}

void TestEmptyFileUsesDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = stockcount::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.session().device_id() == "local-device");
  assert(config.remote().inventory_address().empty());
}

} // namespace

int main() {
  TestFullConfigParses();
  TestDefaultsFillEmptyConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestOutOfRangeValuesAreRejected();
  TestEmptyFileUsesDefaults();

  std::cout << "stockcount_unit_config_loader: pass\n";
  return 0;
}
