#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/model/endpoint.hpp"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::routing {

struct Route {
  std::string url;
  std::string mirror_id; // empty on fallback
  bool        fallback = false;
};

/*
  Picks where an end user should download an entry from.

  Candidates are online mirrors holding a verified copy. Preference:
  tunneled endpoint, then most recent heartbeat, then mirror id. With no
  candidate the origin's public URL is returned, so a request never waits
  on a dead node.
*/
class DownloadRouter {
 public:
  DownloadRouter(std::shared_ptr<db::Repository> repository, std::string origin_public_url);

  Route Resolve(const std::string& entry_id) const;

 private:
  std::string DownloadUrl(const model::Endpoint& endpoint, const std::string& entry_id) const;

  std::shared_ptr<db::Repository> repository_;
  std::string                     origin_public_url_;
};

} // namespace mirrorsync::routing
