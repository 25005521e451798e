#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace mirrorsync::service {

/*
  Wraps one RPC body with a span, request count and latency metrics.
  Failures are logged and rethrown for the gRPC layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view mirror_id, Fn&& fn) {
  mirrorsync::observability::SpanScope span(route);
  if (!mirror_id.empty()) {
    span.SetAttribute("mirror.id", mirror_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       observe    = [&](bool ok) {
    mirrorsync::observability::Metrics::Instance().RecordRequest(route, ok);
    mirrorsync::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observe(true);
      return;
    } else {
      auto result = fn();
      observe(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    MIRRORSYNC_LOG_ERROR("RPC failed", {mirrorsync::observability::StringField("route", route), mirrorsync::observability::StringField("error", ex.what()),
                                        mirrorsync::observability::StringField("mirror_id", mirror_id)});
    observe(false);
    throw;
  }
}

} // namespace mirrorsync::service
