#pragma once

#include <memory>
#include <string>

#include "internal/db/model/mirror_record.hpp"

namespace mirrorsync::registry {
class MirrorRegistry;
}

namespace mirrorsync::service {

/*
  Bearer-token checks for the origin surfaces.

  The admin token opens everything; a mirror credential opens only calls
  about that same mirror. Every failure is Unauthenticated.
*/
class Authorizer {
 public:
  Authorizer(std::string admin_token, std::shared_ptr<registry::MirrorRegistry> registry);

  void RequireAdmin(const std::string& bearer) const;

  // The mirror owning the credential.
  db::model::MirrorRecord RequireMirror(const std::string& bearer) const;

  void RequireAdminOrMirror(const std::string& bearer, const std::string& mirror_id) const;

 private:
  bool IsAdmin(const std::string& bearer) const;

  std::string                               admin_token_;
  std::shared_ptr<registry::MirrorRegistry> registry_;
};

} // namespace mirrorsync::service
