#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "mirrorsync_config_loader_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto    file_path = TestDir() / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const mirrorsync::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestOriginConfigLoads() {
  const auto archive = TestDir() / "archive";
  std::filesystem::create_directories(archive);

  const auto yaml_path = WriteYaml("origin", R"(server:
  bind_address: "0.0.0.0:7443"
database:
  sqlite:
    path: "/var/lib/mirrorsync/origin.db"
    wal_mode: true
origin:
  archive_path: ")" + archive.string() + R"("
  public_url: "https://files.example.org"
  admin_token: "s3cret"
  pairing:
    code_ttl: "900s"
    max_outstanding_codes: 10
  heartbeat:
    interval: "60s"
    timeout_multiplier: 3
  sync:
    interval: "300s"
    workers: 4
    sync_on_catalog_change: true
)");

  const auto config = mirrorsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().wal_mode());
  assert(config.origin().public_url() == "https://files.example.org");
  assert(config.origin().pairing().code_ttl().seconds() == 900);
  assert(config.origin().heartbeat().timeout_multiplier() == 3);
  assert(config.origin().sync().workers() == 4);
  assert(config.origin().sync().sync_on_catalog_change());

  mirrorsync::config::ValidateOriginConfig(config);
}

void TestAgentConfigLoads() {
  const auto storage   = TestDir() / "replicas";
  const auto yaml_path = WriteYaml("agent", R"(database:
  memory: {}
agent:
  origin_url: "origin.example.org:7443"
  mirror_name: "campus-east"
  listen_port: 8081
  storage_path: ")" + storage.string() + R"("
  max_files: 250
  direct_url: "http://10.1.2.3:8081"
  download_speed_limit: 1048576
  heartbeat_interval: "30s"
)");

  const auto config = mirrorsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.agent().max_files() == 250);
  assert(config.agent().download_speed_limit() == 1048576);
  assert(config.agent().heartbeat_interval().seconds() == 30);

  mirrorsync::config::ValidateAgentConfig(config);
  assert(std::filesystem::is_directory(storage));
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(database:
  sqlite:
    path: "C:\\mirror\\\"quoted\"\\db.sqlite"
)");

  const auto config = mirrorsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\mirror\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(server:
  bind_address: "0.0.0.0:7443"
unknown_field: 123
)");

  assert(ThrowsConfigError([&] { mirrorsync::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
  assert(ThrowsConfigError([&] { mirrorsync::config::ConfigLoader::LoadFromYaml((TestDir() / "missing.yaml").string()); }));
}

void TestValidationNamesTheProblem() {
  mirrorsync::runtime::config::RuntimeConfig config;
  assert(ThrowsConfigError([&] { mirrorsync::config::ValidateOriginConfig(config); }));
  assert(ThrowsConfigError([&] { mirrorsync::config::ValidateAgentConfig(config); }));

  auto* agent = config.mutable_agent();
  agent->set_origin_url("origin:7443");
  agent->set_mirror_name("edge");
  agent->set_listen_port(8081);
  agent->set_storage_path((TestDir() / "validate").string());
  assert(ThrowsConfigError([&] { mirrorsync::config::ValidateAgentConfig(config); }));

  agent->set_max_files(5);
  agent->set_content_hash_algorithm("not-a-digest");
  assert(ThrowsConfigError([&] { mirrorsync::config::ValidateAgentConfig(config); }));

  agent->set_content_hash_algorithm("sha256");
  mirrorsync::config::ValidateAgentConfig(config);

  auto* origin = config.mutable_origin();
  config.mutable_server()->set_bind_address("0.0.0.0:7443");
  origin->set_archive_path((TestDir() / "no-such-archive").string());
  origin->set_admin_token("t");
  assert(ThrowsConfigError([&] { mirrorsync::config::ValidateOriginConfig(config); }));
}

} // namespace

int main() {
  TestOriginConfigLoads();
  TestAgentConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestValidationNamesTheProblem();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
