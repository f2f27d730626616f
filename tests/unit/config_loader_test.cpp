#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using recall::config::ConfigLoader;

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "recall_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\recall\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\recall\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(observability:
  service_name: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.observability().service_name() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: "1"
)");
  assert(config.logging().level() == "1");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)"));
  assert(Rejects(R"(maintenance:
  decay:
    half_life: 3
)"));
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/recall/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "recall.db");
  assert(config.logging().level() == "info");
  assert(config.logging().sink() == "stdout");
  assert(config.observability().trace_sample_ratio() == 1.0);
  assert(!config.logging().log_memory_content());
  assert(config.embedding().provider() == "hashing");
  assert(config.embedding().dimensions() == 256);
  assert(config.decision().timeout_ms() == 30000);
  assert(config.update_engine().similarity_threshold() == 0.5);
  assert(config.retrieval().default_token_budget() == 2000);
  assert(config.maintenance().workers() == 2);
  assert(config.maintenance().decay().pinned_floor() == 0.7);
  assert(config.maintenance().consolidate().similarity_threshold() == 0.85);
  assert(config.maintenance().cleanup().unused_days() == 180);

  // Applying defaults twice changes nothing.
  auto again = config;
  ConfigLoader::ApplyDefaults(again);
  assert(again.SerializeAsString() == config.SerializeAsString());
}

void TestExplicitValuesWin() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
update_engine:
  similar_k: 4
  similarity_threshold: 0.65
maintenance:
  disable_scheduler: true
  resummarize:
    max_members: 8
)");
  assert(config.database().has_memory());
  assert(config.update_engine().similar_k() == 4);
  assert(config.update_engine().similarity_threshold() == 0.65);
  assert(config.maintenance().disable_scheduler());
  assert(config.maintenance().resummarize().max_members() == 8);
  assert(config.maintenance().resummarize().max_chars() == 1200);
}

void TestPostgresNeedsConnectionUri() {
  assert(Rejects(R"(database:
  postgres:
    max_connections: 4
)"));

  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://recall@localhost/recall"
)");
  assert(config.database().postgres().max_connections() == 8);
}

void TestRangesAreValidated() {
  assert(Rejects(R"(update_engine:
  similarity_threshold: 1.5
)"));
  assert(Rejects(R"(maintenance:
  decay:
    floor: 0.8
    pinned_floor: 0.5
)"));
  assert(Rejects(R"(retrieval:
  recency_half_life_days: -2
)"));
  assert(Rejects(R"(embedding:
  provider: remote
)"));
  assert(Rejects(R"(logging:
  sink: syslog
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();
  TestEmptyDocumentGetsDefaults();
  TestExplicitValuesWin();
  TestPostgresNeedsConnectionUri();
  TestRangesAreValidated();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
