#pragma once

#include "cluster/coordination.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace autoscale {
namespace cluster {

// Events delivered by the LeaderElector to its listener
enum class MembershipEvent { JOINED, CHANGED, DISCONNECTED };

class ILeadershipListener {
public:
  virtual ~ILeadershipListener() = default;
  virtual void membership_event(MembershipEvent event) = 0;
};

struct LeaderElectorConfig {
  std::string group_path = "/autoscale/controllers";
  std::string node_type = "autoscaler";
  std::string node_id;
};

/**
 * @brief Master election on top of a coordination service group
 *
 * Joins the group on activate(), publishes this node's MembershipState and
 * forwards group events to a single listener in the order the coordination
 * service emits them. is_master() reads the group directly but reports false
 * between a DISCONNECTED and the next CONNECTED/CHANGED.
 */
class LeaderElector : public IGroupListener,
                      public std::enable_shared_from_this<LeaderElector> {
public:
  LeaderElector(std::shared_ptr<CoordinationService> coordination,
                LeaderElectorConfig config);
  ~LeaderElector() override;

  void set_listener(std::weak_ptr<ILeadershipListener> listener);

  void activate();
  void deactivate();
  bool is_active() const;

  bool is_master() const;

  /**
   * @brief Publish this node's state again
   * @return false when the group went away underneath us; the race is
   * logged and swallowed because a later event re-synchronizes the state
   */
  bool republish_state();

  const LeaderElectorConfig &config() const { return config_; }
  std::string member_id() const;

  void group_event(Group &group, GroupEvent event) override;

private:
  MembershipState create_state() const;

  std::shared_ptr<CoordinationService> coordination_;
  LeaderElectorConfig config_;

  mutable std::mutex group_mutex_;
  std::shared_ptr<Group> group_;

  std::mutex listener_mutex_;
  std::weak_ptr<ILeadershipListener> listener_;

  std::atomic<bool> connected_;
};

const char *membership_event_to_string(MembershipEvent event);

} // namespace cluster
} // namespace autoscale
