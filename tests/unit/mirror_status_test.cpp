#include <cassert>
#include <iostream>

#include "internal/model/mirror_status.hpp"

namespace {

using namespace mirrorsync::v1;
using mirrorsync::model::CanTransition;

static_assert(CanTransition(MIRROR_STATUS_PENDING, MIRROR_STATUS_APPROVED));
static_assert(!CanTransition(MIRROR_STATUS_REJECTED, MIRROR_STATUS_APPROVED));

void TestAdminDecisionsOnlyFromPending() {
  assert(CanTransition(MIRROR_STATUS_PENDING, MIRROR_STATUS_APPROVED));
  assert(CanTransition(MIRROR_STATUS_PENDING, MIRROR_STATUS_REJECTED));

  assert(!CanTransition(MIRROR_STATUS_APPROVED, MIRROR_STATUS_REJECTED));
  assert(!CanTransition(MIRROR_STATUS_ONLINE, MIRROR_STATUS_APPROVED));
  assert(!CanTransition(MIRROR_STATUS_PENDING, MIRROR_STATUS_ONLINE));
}

void TestLivenessCycle() {
  assert(CanTransition(MIRROR_STATUS_APPROVED, MIRROR_STATUS_ONLINE));
  assert(CanTransition(MIRROR_STATUS_ONLINE, MIRROR_STATUS_OFFLINE));
  assert(CanTransition(MIRROR_STATUS_OFFLINE, MIRROR_STATUS_ONLINE));
  assert(CanTransition(MIRROR_STATUS_ONLINE, MIRROR_STATUS_ONLINE));
  assert(!CanTransition(MIRROR_STATUS_OFFLINE, MIRROR_STATUS_PENDING));
}

void TestRejectedIsFinal() {
  for (auto to : {MIRROR_STATUS_PENDING, MIRROR_STATUS_APPROVED, MIRROR_STATUS_ONLINE, MIRROR_STATUS_OFFLINE}) {
    assert(!CanTransition(MIRROR_STATUS_REJECTED, to));
  }
  assert(mirrorsync::model::IsTerminal(MIRROR_STATUS_REJECTED));
}

void TestEligibility() {
  assert(mirrorsync::model::IsSyncEligible(MIRROR_STATUS_APPROVED));
  assert(mirrorsync::model::IsSyncEligible(MIRROR_STATUS_ONLINE));
  assert(!mirrorsync::model::IsSyncEligible(MIRROR_STATUS_OFFLINE));
  assert(!mirrorsync::model::IsSyncEligible(MIRROR_STATUS_PENDING));

  assert(mirrorsync::model::TracksHeartbeat(MIRROR_STATUS_OFFLINE));
  assert(!mirrorsync::model::TracksHeartbeat(MIRROR_STATUS_PENDING));
  assert(!mirrorsync::model::TracksHeartbeat(MIRROR_STATUS_REJECTED));

  assert(mirrorsync::model::ActionName(SYNC_ACTION_VERIFY_FAIL) == "verify-fail");
  assert(mirrorsync::model::StatusName(MIRROR_STATUS_OFFLINE) == "offline");
}

} // namespace

int main() {
  TestAdminDecisionsOnlyFromPending();
  TestLivenessCycle();
  TestRejectedIsFinal();
  TestEligibility();

  std::cout << "mirror_status_test: pass\n";
  return 0;
}
