#include "cluster/leader_elector.h"
#include "common/logging.h"

namespace autoscale {
namespace cluster {

namespace {
const std::string kModule = "leader";
} // namespace

const char *membership_event_to_string(MembershipEvent event) {
  switch (event) {
  case MembershipEvent::JOINED:
    return "JOINED";
  case MembershipEvent::CHANGED:
    return "CHANGED";
  case MembershipEvent::DISCONNECTED:
    return "DISCONNECTED";
  }
  return "UNKNOWN";
}

LeaderElector::LeaderElector(std::shared_ptr<CoordinationService> coordination,
                             LeaderElectorConfig config)
    : coordination_(std::move(coordination)), config_(std::move(config)),
      connected_(false) {}

// Reached without deactivate() when the owner drops an active elector
LeaderElector::~LeaderElector() {
  std::shared_ptr<Group> group;
  {
    std::lock_guard<std::mutex> lock(group_mutex_);
    group = std::move(group_);
  }
  if (group) {
    group->close();
  }
}

void LeaderElector::set_listener(std::weak_ptr<ILeadershipListener> listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void LeaderElector::activate() {
  std::lock_guard<std::mutex> lock(group_mutex_);
  if (group_) {
    return;
  }
  if (!coordination_) {
    throw CoordinationError("no coordination service to join " +
                            config_.group_path);
  }

  auto group = coordination_->join(config_.group_path, config_.node_type);
  group->add(weak_from_this());
  group->update(create_state());
  group_ = group;
  group->start();

  LOG_INFO(kModule, "joined ", config_.group_path, " as ", group->id());
}

void LeaderElector::deactivate() {
  std::shared_ptr<Group> group;
  {
    std::lock_guard<std::mutex> lock(group_mutex_);
    group = std::move(group_);
    group_.reset();
  }
  connected_.store(false);
  if (!group) {
    return;
  }

  group->remove(shared_from_this());
  group->close();
  LOG_INFO(kModule, "left ", config_.group_path);
}

bool LeaderElector::is_active() const {
  std::lock_guard<std::mutex> lock(group_mutex_);
  return group_ != nullptr;
}

bool LeaderElector::is_master() const {
  if (!connected_.load()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(group_mutex_);
  return group_ && group_->is_master();
}

std::string LeaderElector::member_id() const {
  std::lock_guard<std::mutex> lock(group_mutex_);
  return group_ ? group_->id() : std::string();
}

bool LeaderElector::republish_state() {
  std::shared_ptr<Group> group;
  {
    std::lock_guard<std::mutex> lock(group_mutex_);
    group = group_;
  }
  if (!group) {
    LOG_DEBUG(kModule, "not republishing state; no active group");
    return false;
  }

  try {
    group->update(create_state());
    return true;
  } catch (const StaleGroupStateError &e) {
    LOG_DEBUG(kModule, "ignoring stale group state: ", e.what());
    return false;
  }
}

void LeaderElector::group_event(Group &group, GroupEvent event) {
  MembershipEvent forwarded;
  switch (event) {
  case GroupEvent::CONNECTED:
    connected_.store(true);
    forwarded = MembershipEvent::JOINED;
    break;
  case GroupEvent::CHANGED:
    connected_.store(true);
    forwarded = MembershipEvent::CHANGED;
    break;
  case GroupEvent::DISCONNECTED:
  default:
    connected_.store(false);
    forwarded = MembershipEvent::DISCONNECTED;
    break;
  }

  LOG_DEBUG(kModule, group.id(), " received ", group_event_to_string(event));

  std::shared_ptr<ILeadershipListener> listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_.lock();
  }
  if (listener) {
    listener->membership_event(forwarded);
  }
}

MembershipState LeaderElector::create_state() const {
  MembershipState state;
  state.node_id = config_.node_id;
  state.node_type = config_.node_type;
  return state;
}

} // namespace cluster
} // namespace autoscale
