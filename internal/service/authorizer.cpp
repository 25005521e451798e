#include "internal/service/authorizer.hpp"

#include "internal/registry/mirror_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace mirrorsync::service {

Authorizer::Authorizer(std::string admin_token, std::shared_ptr<registry::MirrorRegistry> registry)
    : admin_token_(std::move(admin_token)), registry_(std::move(registry)) {
}

bool Authorizer::IsAdmin(const std::string& bearer) const {
  return !admin_token_.empty() && !bearer.empty() && util::SecretEquals(bearer, admin_token_);
}

void Authorizer::RequireAdmin(const std::string& bearer) const {
  if (!IsAdmin(bearer)) {
    throw util::Unauthenticated("admin token required; pass it as 'authorization: Bearer <token>'");
  }
}

db::model::MirrorRecord Authorizer::RequireMirror(const std::string& bearer) const {
  if (bearer.empty()) {
    throw util::Unauthenticated("mirror credential required; pass it as 'authorization: Bearer <credential>'");
  }
  auto mirror = registry_->FindByCredential(bearer);
  if (!mirror) {
    throw util::Unauthenticated("unknown mirror credential");
  }
  return *mirror;
}

void Authorizer::RequireAdminOrMirror(const std::string& bearer, const std::string& mirror_id) const {
  if (IsAdmin(bearer)) return;

  const auto mirror = RequireMirror(bearer);
  if (mirror.id != mirror_id) {
    throw util::Unauthenticated("credential belongs to a different mirror");
  }
}

} // namespace mirrorsync::service
