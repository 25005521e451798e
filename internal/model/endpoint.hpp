#pragma once

#include <string>
#include <variant>

namespace mirrorsync::model {

/*
  How a mirror is reached. A tunneled mirror is reachable through a relay
  and is preferred because it works behind NAT; a direct one is dialed as is.
*/

struct Direct {
  std::string address;
};

struct Tunneled {
  std::string address;
};

using Endpoint = std::variant<Direct, Tunneled>;

// Tunnel wins when configured.
inline Endpoint EndpointOf(const std::string& direct_url, const std::string& tunnel_url) {
  if (!tunnel_url.empty()) return Tunneled{tunnel_url};
  return Direct{direct_url};
}

inline bool IsTunneled(const Endpoint& endpoint) {
  return std::holds_alternative<Tunneled>(endpoint);
}

// Public URL for redirecting an end user.
inline std::string EffectiveUrl(const Endpoint& endpoint) {
  return std::visit([](const auto& e) { return e.address; }, endpoint);
}

// Where to open a gRPC channel and whether it needs TLS.
struct GrpcTarget {
  std::string address; // host:port
  bool        tls = false;

  bool operator<(const GrpcTarget& other) const {
    return address != other.address ? address < other.address : tls < other.tls;
  }
};

// https:// and grpcs:// select TLS and default to port 443; http:// defaults
// to port 80. A bare host:port is dialed in plaintext. Paths are dropped.
GrpcTarget ToGrpcTarget(const Endpoint& endpoint);

} // namespace mirrorsync::model
