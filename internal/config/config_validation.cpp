#include "config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::config {

namespace {

void RequireHashAlgorithm(const std::string& algorithm) {
  if (!algorithm.empty() && !util::ContentHasher::IsSupported(algorithm)) {
    throw util::ConfigError("unsupported content_hash_algorithm: " + algorithm);
  }
}

void RequireWritableDirectory(const std::string& path, const std::string& what) {
  if (path.empty()) {
    throw util::ConfigError(what + " is required");
  }

  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw util::ConfigError(what + " " + path + " cannot be created: " + ec.message());
  }

  const auto    check_file = std::filesystem::path(path) / ".write_check";
  std::ofstream out(check_file, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::ConfigError(what + " " + path + " is not writable");
  }
  out.close();
  std::filesystem::remove(check_file, ec);
}

} // namespace

void ValidateOriginConfig(const mirrorsync::runtime::config::RuntimeConfig& config) {
  if (!config.has_origin()) {
    throw util::ConfigError("origin section is required");
  }
  const auto& origin = config.origin();

  if (config.server().bind_address().empty()) {
    throw util::ConfigError("server.bind_address is required");
  }
  if (origin.archive_path().empty() || !std::filesystem::is_directory(origin.archive_path())) {
    throw util::ConfigError("origin.archive_path must name an existing directory");
  }
  if (origin.admin_token().empty()) {
    throw util::ConfigError("origin.admin_token is required");
  }
  if (origin.pairing().code_length() != 0 && origin.pairing().code_length() < 6) {
    throw util::ConfigError("origin.pairing.code_length must be at least 6");
  }
  RequireHashAlgorithm(origin.content_hash_algorithm());
}

void ValidateAgentConfig(const mirrorsync::runtime::config::RuntimeConfig& config) {
  if (!config.has_agent()) {
    throw util::ConfigError("agent section is required");
  }
  const auto& agent = config.agent();

  if (agent.origin_url().empty()) {
    throw util::ConfigError("agent.origin_url is required");
  }
  if (agent.mirror_name().empty()) {
    throw util::ConfigError("agent.mirror_name is required");
  }
  if (agent.max_files() == 0) {
    throw util::ConfigError("agent.max_files must be greater than zero");
  }
  if (agent.listen_port() == 0 && config.server().bind_address().empty()) {
    throw util::ConfigError("agent.listen_port or server.bind_address is required");
  }
  if (agent.listen_port() > 65535) {
    throw util::ConfigError("agent.listen_port out of range");
  }
  RequireWritableDirectory(agent.storage_path(), "agent.storage_path");
  RequireHashAlgorithm(agent.content_hash_algorithm());
}

} // namespace mirrorsync::config
