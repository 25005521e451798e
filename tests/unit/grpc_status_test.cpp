#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/origin_server.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"
#include "internal/routing/download_router.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/origin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace mirrorsync::v1;

mirrorsync::service::ServiceContext BuildServiceContext() {
  mirrorsync::service::ServiceContext ctx;
  auto repository = std::make_shared<mirrorsync::db::memory::MemoryRepository>();
  ctx.repository  = repository;
  ctx.registry    = std::make_shared<mirrorsync::registry::MirrorRegistry>(repository);
  ctx.pairing     = std::make_shared<mirrorsync::pairing::PairingService>(repository, mirrorsync::pairing::PairingOptions{});
  ctx.heartbeat   = std::make_shared<mirrorsync::heartbeat::HeartbeatMonitor>(repository, mirrorsync::heartbeat::HeartbeatOptions{});
  ctx.scheduler   = std::make_shared<mirrorsync::sync::SyncScheduler>();
  ctx.router      = std::make_shared<mirrorsync::routing::DownloadRouter>(repository, "https://origin.example");
  ctx.admin_token = "admin-token";
  return ctx;
}

template <typename Ex>
void ExpectRoundTrip(const Ex& original, ::grpc::StatusCode code) {
  const auto status = mirrorsync::grpc::ToStatus(original);
  assert(status.error_code() == code);

  bool threw = false;
  try {
    mirrorsync::grpc::ThrowIfError(status, "call");
  } catch (const Ex& e) {
    threw = std::string(e.what()).find(original.what()) != std::string::npos;
  }
  assert(threw);
}

void TestEveryKindSurvivesTheWire() {
  using namespace mirrorsync::util;
  using ::grpc::StatusCode;

  ExpectRoundTrip(NotFound("no such mirror"), StatusCode::NOT_FOUND);
  ExpectRoundTrip(InvalidCode("bad code"), StatusCode::NOT_FOUND);
  ExpectRoundTrip(InvalidState("mirror is pending"), StatusCode::FAILED_PRECONDITION);
  ExpectRoundTrip(ExpiredCode("code expired"), StatusCode::FAILED_PRECONDITION);
  ExpectRoundTrip(InvalidArgument("max_files"), StatusCode::INVALID_ARGUMENT);
  ExpectRoundTrip(AlreadyConsumed("used"), StatusCode::ALREADY_EXISTS);
  ExpectRoundTrip(RateLimited("slow down"), StatusCode::RESOURCE_EXHAUSTED);
  ExpectRoundTrip(CapacityExceeded("full"), StatusCode::RESOURCE_EXHAUSTED);
  ExpectRoundTrip(Unauthenticated("who"), StatusCode::UNAUTHENTICATED);
  ExpectRoundTrip(Unreachable("down"), StatusCode::UNAVAILABLE);
  ExpectRoundTrip(HashMismatch("digest"), StatusCode::DATA_LOSS);
  ExpectRoundTrip(AlreadyRunning("busy"), StatusCode::ABORTED);

  assert(mirrorsync::grpc::ToStatus(std::runtime_error("boom")).error_code() == StatusCode::INTERNAL);
}

void TestTransportFailuresBecomeUnreachable() {
  for (auto code : {::grpc::StatusCode::UNAVAILABLE, ::grpc::StatusCode::DEADLINE_EXCEEDED}) {
    bool threw = false;
    try {
      mirrorsync::grpc::ThrowIfError(::grpc::Status(code, "connection refused"), "heartbeat");
    } catch (const mirrorsync::util::Unreachable&) {
      threw = true;
    }
    assert(threw);
  }
  mirrorsync::grpc::ThrowIfError(::grpc::Status::OK, "noop");
}

void TestAdminCallWithoutTokenIsUnauthenticated() {
  auto                          svc = std::make_shared<mirrorsync::service::AdminService>(BuildServiceContext());
  mirrorsync::grpc::AdminServer server(svc);

  IssuePairingCodeRequest  req;
  IssuePairingCodeResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.IssuePairingCode(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(resp.code().empty());
}

void TestRedeemUnknownCodeReturnsNotFound() {
  auto                           svc = std::make_shared<mirrorsync::service::OriginService>(BuildServiceContext());
  mirrorsync::grpc::OriginServer server(svc);

  RedeemRequest req;
  req.set_pairing_code("ZZZZZZZZ");
  req.set_mirror_name("edge");
  req.set_direct_url("http://edge:8080");
  req.set_max_files(3);
  RedeemResponse        resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Redeem(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_details() == "InvalidCode");
}

void TestHeartbeatWithoutCredentialIsUnauthenticated() {
  auto                           svc = std::make_shared<mirrorsync::service::OriginService>(BuildServiceContext());
  mirrorsync::grpc::OriginServer server(svc);

  HeartbeatRequest      req;
  HeartbeatResponse     resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Heartbeat(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestApproveUnknownMirrorMapsToNotFound() {
  mirrorsync::service::AdminService svc(BuildServiceContext());

  ApproveMirrorRequest req;
  req.set_mirror_id("missing");
  try {
    svc.ApproveMirror("admin-token", req);
    assert(false);
  } catch (const std::exception& e) {
    assert(mirrorsync::grpc::ToStatus(e).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
}

} // namespace

int main() {
  TestEveryKindSurvivesTheWire();
  TestTransportFailuresBecomeUnreachable();
  TestAdminCallWithoutTokenIsUnauthenticated();
  TestRedeemUnknownCodeReturnsNotFound();
  TestHeartbeatWithoutCredentialIsUnauthenticated();
  TestApproveUnknownMirrorMapsToNotFound();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
