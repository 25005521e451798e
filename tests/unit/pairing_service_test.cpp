#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using mirrorsync::pairing::PairingOptions;
using mirrorsync::pairing::PairingService;
using mirrorsync::pairing::RedeemRequest;

struct Fixture {
  std::shared_ptr<mirrorsync::db::memory::MemoryRepository> repo = std::make_shared<mirrorsync::db::memory::MemoryRepository>();
  uint64_t                                                  now  = 1'000'000;
  PairingService                                            pairing;

  explicit Fixture(PairingOptions options = {}) : pairing(repo, options, [this] { return now; }) {
  }
};

RedeemRequest Request(const std::string& code, const std::string& name = "edge-1") {
  RedeemRequest r;
  r.code        = code;
  r.mirror_name = name;
  r.direct_url  = "http://10.0.0.5:8080";
  r.max_files   = 10;
  return r;
}

template <typename Ex, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Ex&) {
    threw = true;
  }
  assert(threw);
}

void TestRedeemCreatesPendingMirror() {
  Fixture f;
  const auto code   = f.pairing.IssueCode();
  assert(code.expires_at_ms == f.now + 15 * 60 * 1000);
  assert(code.code.size() == 8);

  const auto result = f.pairing.Redeem(Request(code.code));
  assert(!result.mirror_id.empty());
  assert(result.credential.size() == 64);

  mirrorsync::registry::MirrorRegistry registry(f.repo);
  const auto                           mirror = registry.Get(result.mirror_id);
  assert(mirror.status == mirrorsync::v1::MIRROR_STATUS_PENDING);
  assert(mirror.name == "edge-1");
  assert(registry.FindByCredential(result.credential)->id == result.mirror_id);
}

void TestCodeIsSingleUseEvenAfterRejection() {
  Fixture f;
  const auto code   = f.pairing.IssueCode();
  const auto result = f.pairing.Redeem(Request(code.code));

  mirrorsync::registry::MirrorRegistry registry(f.repo);
  registry.Reject(result.mirror_id);

  ExpectThrows<mirrorsync::util::AlreadyConsumed>([&] { f.pairing.Redeem(Request(code.code, "edge-2")); });
  assert(registry.List().size() == 1);
}

void TestUnknownAndExpiredCodes() {
  Fixture f;
  ExpectThrows<mirrorsync::util::InvalidCode>([&] { f.pairing.Redeem(Request("NOPE2345")); });

  const auto code = f.pairing.IssueCode();
  f.now           = code.expires_at_ms;
  ExpectThrows<mirrorsync::util::ExpiredCode>([&] { f.pairing.Redeem(Request(code.code)); });
}

void TestArgumentsValidatedBeforeCodeIsSpent() {
  Fixture f;
  const auto code = f.pairing.IssueCode();

  auto bad      = Request(code.code);
  bad.max_files = 0;
  ExpectThrows<mirrorsync::util::InvalidArgument>([&] { f.pairing.Redeem(bad); });

  bad            = Request(code.code);
  bad.direct_url = "";
  ExpectThrows<mirrorsync::util::InvalidArgument>([&] { f.pairing.Redeem(bad); });

  // still redeemable
  f.pairing.Redeem(Request(code.code));
}

void TestOutstandingCodesAreRateLimited() {
  PairingOptions options;
  options.max_outstanding_codes = 3;
  Fixture f(options);

  std::set<std::string> codes;
  for (int i = 0; i < 3; ++i) codes.insert(f.pairing.IssueCode().code);
  assert(codes.size() == 3);
  ExpectThrows<mirrorsync::util::RateLimited>([&] { f.pairing.IssueCode(); });

  // redemption frees a slot
  f.pairing.Redeem(Request(*codes.begin()));
  f.pairing.IssueCode();
  ExpectThrows<mirrorsync::util::RateLimited>([&] { f.pairing.IssueCode(); });

  // so does expiry
  f.now += 16 * 60 * 1000;
  f.pairing.IssueCode();
}

void TestCollectExpiredKeepsConsumedCodes() {
  Fixture f;
  const auto used    = f.pairing.IssueCode();
  const auto stale   = f.pairing.IssueCode();
  f.pairing.Redeem(Request(used.code));

  f.now += 16 * 60 * 1000;
  assert(f.pairing.CollectExpired() == 1);
  assert(f.pairing.CollectExpired() == 0);

  ExpectThrows<mirrorsync::util::InvalidCode>([&] { f.pairing.Redeem(Request(stale.code)); });
  ExpectThrows<mirrorsync::util::AlreadyConsumed>([&] { f.pairing.Redeem(Request(used.code)); });
}

} // namespace

int main() {
  TestRedeemCreatesPendingMirror();
  TestCodeIsSingleUseEvenAfterRejection();
  TestUnknownAndExpiredCodes();
  TestArgumentsValidatedBeforeCodeIsSpent();
  TestOutstandingCodesAreRateLimited();
  TestCollectExpiredKeepsConsumedCodes();

  std::cout << "pairing_service_test: pass\n";
  return 0;
}
