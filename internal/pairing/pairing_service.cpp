#include "internal/pairing/pairing_service.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"
#include "internal/util/uuid.hpp"

namespace mirrorsync::pairing {

using mirrorsync::observability::StringField;
using mirrorsync::observability::UintField;

namespace {

// Redraws on collision before giving up.
constexpr int kCodeAttempts = 4;

} // namespace

PairingService::PairingService(std::shared_ptr<db::Repository> repository, PairingOptions options, util::MillisClock clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
}

db::model::PairingCodeRecord PairingService::IssueCode() {
  const uint64_t now = clock_();

  auto tx = repository_->Begin();
  if (repository_->CountOutstandingPairingCodes(*tx, now) >= options_.max_outstanding_codes) {
    throw util::RateLimited("issue pairing code: " + std::to_string(options_.max_outstanding_codes) +
                            " codes outstanding; redeem or let them expire first");
  }

  db::model::PairingCodeRecord record;
  record.issued_at_ms  = now;
  record.expires_at_ms = now + static_cast<uint64_t>(options_.code_ttl.count());

  for (int attempt = 0;; ++attempt) {
    record.code = util::RandomPairingCode(options_.code_length);
    if (!repository_->GetPairingCode(*tx, record.code)) break;
    if (attempt + 1 == kCodeAttempts) throw std::runtime_error("issue pairing code: could not draw an unused code");
  }

  db::ThrowIfDbError(repository_->InsertPairingCode(*tx, record), "issue pairing code");
  tx->Commit();

  MIRRORSYNC_LOG_INFO("pairing code issued", {UintField("expires_at_ms", record.expires_at_ms)});
  return record;
}

RedeemResult PairingService::Redeem(const RedeemRequest& request) {
  if (request.mirror_name.empty()) throw util::InvalidArgument("redeem pairing code: mirror name is required");
  if (request.direct_url.empty()) throw util::InvalidArgument("redeem pairing code: direct url is required");
  if (request.max_files == 0) throw util::InvalidArgument("redeem pairing code: max_files must be positive");

  const uint64_t now = clock_();

  auto tx   = repository_->Begin();
  auto code = repository_->GetPairingCode(*tx, request.code);
  if (!code) throw util::InvalidCode("redeem pairing code: unknown code; check for typos or issue a new one");
  if (code->consumed) throw util::AlreadyConsumed("redeem pairing code: code was already used; issue a new one");
  if (now >= code->expires_at_ms) throw util::ExpiredCode("redeem pairing code: code expired; issue a new one");

  db::model::MirrorRecord mirror;
  mirror.id            = util::NewMirrorId();
  mirror.name          = request.mirror_name;
  mirror.status        = mirrorsync::v1::MIRROR_STATUS_PENDING;
  mirror.credential    = util::RandomToken();
  mirror.direct_url    = request.direct_url;
  mirror.tunnel_url    = request.tunnel_url;
  mirror.max_files     = request.max_files;
  mirror.created_at_ms = now;
  db::ThrowIfDbError(repository_->InsertMirror(*tx, mirror), "redeem pairing code");

  code->consumed  = true;
  code->mirror_id = mirror.id;
  db::ThrowIfDbError(repository_->UpdatePairingCode(*tx, *code), "redeem pairing code");
  tx->Commit();

  MIRRORSYNC_LOG_INFO("mirror paired", {StringField("mirror_id", mirror.id), StringField("name", mirror.name),
                                        UintField("max_files", mirror.max_files)});
  return RedeemResult{mirror.id, mirror.credential};
}

uint64_t PairingService::CollectExpired() {
  auto tx      = repository_->Begin();
  auto removed = repository_->DeleteExpiredPairingCodes(*tx, clock_());
  tx->Commit();

  if (removed > 0) {
    MIRRORSYNC_LOG_DEBUG("expired pairing codes collected", {UintField("count", removed)});
  }
  return removed;
}

} // namespace mirrorsync::pairing
