#include "internal/model/endpoint.hpp"

namespace mirrorsync::model {

namespace {

bool HasPort(const std::string& host) {
  const auto colon = host.rfind(':');
  if (colon == std::string::npos) return false;
  // [v6]:port
  const auto bracket = host.rfind(']');
  return bracket == std::string::npos || colon > bracket;
}

GrpcTarget Parse(std::string url) {
  GrpcTarget  target;
  std::string default_port;

  const auto scheme_end = url.find("://");
  if (scheme_end != std::string::npos) {
    const auto scheme = url.substr(0, scheme_end);
    if (scheme == "https" || scheme == "grpcs") {
      target.tls   = true;
      default_port = "443";
    } else if (scheme == "http") {
      default_port = "80";
    }
    url.erase(0, scheme_end + 3);
  }

  const auto path = url.find('/');
  if (path != std::string::npos) url.erase(path);

  if (!url.empty() && !default_port.empty() && !HasPort(url)) url += ":" + default_port;
  target.address = std::move(url);
  return target;
}

} // namespace

GrpcTarget ToGrpcTarget(const Endpoint& endpoint) {
  return std::visit([](const auto& e) { return Parse(e.address); }, endpoint);
}

} // namespace mirrorsync::model
