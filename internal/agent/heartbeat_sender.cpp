#include "internal/agent/heartbeat_sender.hpp"

#include "internal/agent/mirror_agent.hpp"
#include "internal/agent/origin_link.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::agent {

using mirrorsync::observability::StringField;

HeartbeatSender::HeartbeatSender(std::shared_ptr<MirrorAgent> agent, std::shared_ptr<OriginLink> origin, std::chrono::milliseconds interval)
    : agent_(std::move(agent)), origin_(std::move(origin)), task_("heartbeat-sender", interval, [this] { SendOnce(); }) {
}

void HeartbeatSender::Start() {
  task_.Start(true);
}

void HeartbeatSender::Stop() {
  task_.Stop();
}

bool HeartbeatSender::SendOnce() {
  if (!agent_->Paired()) return false;

  try {
    const auto status = origin_->Heartbeat(agent_->Credential(), agent_->Counters());
    MIRRORSYNC_LOG_DEBUG("heartbeat sent", {StringField("status", model::StatusName(status))});
    return true;
  } catch (const util::Unreachable& e) {
    MIRRORSYNC_LOG_WARN("heartbeat failed: origin unreachable", {StringField("error", e.what())});
  } catch (const util::InvalidState& e) {
    // pending approval, or rejected
    MIRRORSYNC_LOG_INFO("heartbeat refused", {StringField("reason", e.what())});
  } catch (const util::Unauthenticated& e) {
    MIRRORSYNC_LOG_WARN("heartbeat rejected: credential unknown to origin", {StringField("error", e.what())});
  }
  return false;
}

} // namespace mirrorsync::agent
