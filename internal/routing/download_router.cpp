#include "internal/routing/download_router.hpp"

#include <tuple>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::routing {

namespace {

std::string JoinUrl(std::string base, const std::string& entry_id) {
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/download/" + entry_id;
}

} // namespace

DownloadRouter::DownloadRouter(std::shared_ptr<db::Repository> repository, std::string origin_public_url)
    : repository_(std::move(repository)), origin_public_url_(std::move(origin_public_url)) {
}

std::string DownloadRouter::DownloadUrl(const model::Endpoint& endpoint, const std::string& entry_id) const {
  return JoinUrl(model::EffectiveUrl(endpoint), entry_id);
}

Route DownloadRouter::Resolve(const std::string& entry_id) const {
  if (entry_id.empty()) throw util::InvalidArgument("resolve download: entry id is required");

  auto tx      = repository_->Begin();
  auto holders = repository_->ListHoldersOf(*tx, entry_id);

  std::optional<db::model::MirrorRecord> best;
  for (const auto& holder : holders) {
    if (holder.state != mirrorsync::v1::VERIFICATION_STATE_VERIFIED) continue;

    auto mirror = repository_->GetMirror(*tx, holder.mirror_id);
    if (!mirror || mirror->status != mirrorsync::v1::MIRROR_STATUS_ONLINE) continue;

    if (!best) {
      best = std::move(mirror);
      continue;
    }

    // larger tuple wins; id compared reversed so the smaller id is preferred
    const auto key = [](const db::model::MirrorRecord& m) { return std::make_tuple(!m.tunnel_url.empty(), m.last_heartbeat_ms); };
    if (key(*mirror) > key(*best) || (key(*mirror) == key(*best) && mirror->id < best->id)) {
      best = std::move(mirror);
    }
  }
  tx->Commit();

  if (!best) {
    return Route{JoinUrl(origin_public_url_, entry_id), "", true};
  }
  return Route{DownloadUrl(model::EndpointOf(best->direct_url, best->tunnel_url), entry_id), best->id, false};
}

} // namespace mirrorsync::routing
