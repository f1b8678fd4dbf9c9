#pragma once

#include "cluster/coordination.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/lockfree/queue.hpp>

namespace autoscale {
namespace cluster {

class LocalCoordinationService;

/**
 * @brief Single-consumer event channel feeding one member's listeners
 *
 * Producers push under the coordination service lock; the member's
 * dispatcher thread drains in FIFO order.
 */
struct GroupEventChannel {
  explicit GroupEventChannel(size_t capacity) : events(capacity) {}

  boost::lockfree::queue<GroupEvent> events;
  std::mutex wake_mutex;
  std::condition_variable wake_cv;
  std::atomic<bool> shutdown{false};
  std::atomic<uint64_t> pending{0};
};

/**
 * @brief Membership of one node in a LocalCoordinationService group
 */
class LocalGroup : public Group,
                   public std::enable_shared_from_this<LocalGroup> {
public:
  LocalGroup(std::shared_ptr<LocalCoordinationService> service,
             std::string group_path, std::string member_id);
  ~LocalGroup() override;

  void add(std::weak_ptr<IGroupListener> listener) override;
  void remove(const std::shared_ptr<IGroupListener> &listener) override;
  void update(const MembershipState &state) override;
  bool is_master() const override;
  void start() override;
  void close() override;
  const std::string &id() const override { return member_id_; }

  const std::string &group_path() const { return group_path_; }
  MembershipState last_state() const;

  // Called by the service with its lock held
  void enqueue(GroupEvent event);

  /// Block until every queued event has been handed to the listeners
  bool wait_idle(std::chrono::milliseconds timeout) const;

private:
  void dispatch_loop(std::shared_ptr<GroupEventChannel> channel);
  std::vector<std::shared_ptr<IGroupListener>> listeners_snapshot() const;

  std::shared_ptr<LocalCoordinationService> service_;
  std::string group_path_;
  std::string member_id_;

  mutable std::mutex listeners_mutex_;
  std::vector<std::weak_ptr<IGroupListener>> listeners_;

  mutable std::mutex state_mutex_;
  MembershipState state_;

  std::atomic<bool> started_;
  std::atomic<bool> closed_;

  std::shared_ptr<GroupEventChannel> channel_;
  std::thread dispatcher_;
};

/**
 * @brief In-process coordination service
 *
 * The earliest started member of a group path that is neither closed nor
 * disconnected is the master. Any membership change raises CHANGED on the
 * remaining connected members; a member's own start raises CONNECTED on it.
 * disconnect()/reconnect() simulate a lost and re-established session; a
 * reconnected member re-enters at the back of the line.
 */
class LocalCoordinationService
    : public CoordinationService,
      public std::enable_shared_from_this<LocalCoordinationService> {
public:
  LocalCoordinationService() = default;

  std::shared_ptr<Group> join(const std::string &group_path,
                              const std::string &node_type) override;

  bool disconnect(const std::string &member_id);
  bool reconnect(const std::string &member_id);

  /// Current master of the group path, empty when there is none
  std::string master_of(const std::string &group_path) const;
  std::vector<std::string> members_of(const std::string &group_path) const;

  // LocalGroup hooks
  void member_started(LocalGroup &group);
  void member_closed(LocalGroup &group);
  bool is_master(const LocalGroup &group) const;

private:
  struct Member {
    LocalGroup *group;
    uint64_t sequence;
    bool started;
    bool connected;
  };

  std::string master_locked(const std::string &group_path) const;
  void notify_others_locked(const std::string &group_path,
                            const std::string &except_id);
  Member *find_locked(const std::string &member_id,
                      std::string *group_path = nullptr);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unordered_map<std::string, Member>>
      groups_;
  uint64_t next_sequence_ = 0;
  uint64_t next_member_ = 0;
};

} // namespace cluster
} // namespace autoscale
