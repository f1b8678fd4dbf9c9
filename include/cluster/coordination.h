#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace autoscale {
namespace cluster {

// Membership events raised by a Group
enum class GroupEvent { CONNECTED, CHANGED, DISCONNECTED };

/**
 * @brief Record a node publishes into its membership group
 *
 * Carries no payload beyond presence. node_id is kept for diagnostics.
 */
struct MembershipState {
  std::string node_id;
  std::string node_type;
};

// Raised when a group is updated after its membership was torn down.
// Transient: another event re-synchronizes the state shortly after.
class StaleGroupStateError : public std::logic_error {
public:
  explicit StaleGroupStateError(const std::string &what)
      : std::logic_error(what) {}
};

class CoordinationError : public std::runtime_error {
public:
  explicit CoordinationError(const std::string &what)
      : std::runtime_error(what) {}
};

class Group;

class IGroupListener {
public:
  virtual ~IGroupListener() = default;
  virtual void group_event(Group &group, GroupEvent event) = 0;
};

/**
 * @brief One node's membership in a named group
 *
 * Listeners are notified of membership and mastership changes in emission
 * order, from a thread owned by the coordination service. A group does not
 * own its listeners; an expired listener is skipped.
 */
class Group {
public:
  virtual ~Group() = default;

  virtual void add(std::weak_ptr<IGroupListener> listener) = 0;
  virtual void remove(const std::shared_ptr<IGroupListener> &listener) = 0;

  /// Publish this node's state; throws StaleGroupStateError once closed
  virtual void update(const MembershipState &state) = 0;

  virtual bool is_master() const = 0;

  virtual void start() = 0;
  virtual void close() = 0;

  virtual const std::string &id() const = 0;
};

class CoordinationService {
public:
  virtual ~CoordinationService() = default;

  virtual std::shared_ptr<Group> join(const std::string &group_path,
                                      const std::string &node_type) = 0;
};

const char *group_event_to_string(GroupEvent event);

} // namespace cluster
} // namespace autoscale
