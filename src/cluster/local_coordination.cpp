#include "cluster/local_coordination.h"
#include "common/logging.h"
#include <algorithm>

namespace autoscale {
namespace cluster {

namespace {
const std::string kModule = "coordination";
// Preallocated nodes; the queue is not fixed-sized and allocates past this
constexpr size_t kEventQueueReserve = 64;
} // namespace

const char *group_event_to_string(GroupEvent event) {
  switch (event) {
  case GroupEvent::CONNECTED:
    return "CONNECTED";
  case GroupEvent::CHANGED:
    return "CHANGED";
  case GroupEvent::DISCONNECTED:
    return "DISCONNECTED";
  }
  return "UNKNOWN";
}

// LocalGroup

LocalGroup::LocalGroup(std::shared_ptr<LocalCoordinationService> service,
                       std::string group_path, std::string member_id)
    : service_(std::move(service)), group_path_(std::move(group_path)),
      member_id_(std::move(member_id)), started_(false), closed_(false),
      channel_(std::make_shared<GroupEventChannel>(kEventQueueReserve)) {}

LocalGroup::~LocalGroup() {
  close();
  if (dispatcher_.joinable()) {
    if (dispatcher_.get_id() == std::this_thread::get_id()) {
      // Last reference dropped by a listener; the loop only touches the
      // channel from here on.
      dispatcher_.detach();
    } else {
      dispatcher_.join();
    }
  }
}

void LocalGroup::add(std::weak_ptr<IGroupListener> listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void LocalGroup::remove(const std::shared_ptr<IGroupListener> &listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(
      std::remove_if(listeners_.begin(), listeners_.end(),
                     [&listener](const std::weak_ptr<IGroupListener> &entry) {
                       auto live = entry.lock();
                       return !live || live == listener;
                     }),
      listeners_.end());
}

std::vector<std::shared_ptr<IGroupListener>>
LocalGroup::listeners_snapshot() const {
  std::vector<std::shared_ptr<IGroupListener>> live;
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  for (const auto &entry : listeners_) {
    if (auto listener = entry.lock()) {
      live.push_back(std::move(listener));
    }
  }
  return live;
}

void LocalGroup::update(const MembershipState &state) {
  if (closed_.load()) {
    throw StaleGroupStateError("group member " + member_id_ +
                               " has been closed");
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_ = state;
}

MembershipState LocalGroup::last_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool LocalGroup::is_master() const {
  if (closed_.load()) {
    return false;
  }
  return service_->is_master(*this);
}

void LocalGroup::start() {
  if (closed_.load()) {
    throw StaleGroupStateError("cannot start closed group member " +
                               member_id_);
  }
  if (started_.exchange(true)) {
    return;
  }

  std::weak_ptr<LocalGroup> weak_self = weak_from_this();
  auto channel = channel_;
  dispatcher_ = std::thread([weak_self, channel]() {
    while (!channel->shutdown.load()) {
      {
        std::unique_lock<std::mutex> lock(channel->wake_mutex);
        channel->wake_cv.wait(lock, [&channel] {
          return channel->pending.load() > 0 || channel->shutdown.load();
        });
      }

      GroupEvent event;
      while (!channel->shutdown.load() && channel->events.pop(event)) {
        if (auto self = weak_self.lock()) {
          for (auto &listener : self->listeners_snapshot()) {
            try {
              listener->group_event(*self, event);
            } catch (const std::exception &e) {
              LOG_ERROR(kModule, "listener of ", self->id(), " failed on ",
                        group_event_to_string(event), ": ", e.what());
            }
          }
        }
        channel->pending.fetch_sub(1);
      }
    }
  });

  service_->member_started(*this);
}

void LocalGroup::close() {
  if (closed_.exchange(true)) {
    return;
  }
  service_->member_closed(*this);

  channel_->shutdown.store(true);
  {
    std::lock_guard<std::mutex> lock(channel_->wake_mutex);
  }
  channel_->wake_cv.notify_all();

  if (dispatcher_.joinable() &&
      dispatcher_.get_id() != std::this_thread::get_id()) {
    dispatcher_.join();
  }
}

void LocalGroup::enqueue(GroupEvent event) {
  if (closed_.load() || !started_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(channel_->wake_mutex);
    channel_->pending.fetch_add(1);
    if (!channel_->events.push(event)) {
      channel_->pending.fetch_sub(1);
      LOG_ERROR(kModule, "dropped ", group_event_to_string(event), " for ",
                member_id_);
      return;
    }
  }
  channel_->wake_cv.notify_one();
}

bool LocalGroup::wait_idle(std::chrono::milliseconds timeout) const {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (channel_->pending.load() > 0 && !channel_->shutdown.load()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

// LocalCoordinationService

std::shared_ptr<Group>
LocalCoordinationService::join(const std::string &group_path,
                               const std::string &node_type) {
  if (group_path.empty()) {
    throw CoordinationError("group path must not be empty");
  }

  std::string member_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    member_id = group_path + "/" + node_type + "-" +
                std::to_string(next_member_++);
  }

  auto group =
      std::make_shared<LocalGroup>(shared_from_this(), group_path, member_id);

  std::lock_guard<std::mutex> lock(mutex_);
  groups_[group_path][member_id] = Member{group.get(), 0, false, true};
  LOG_DEBUG(kModule, "member ", member_id, " joined ", group_path);
  return group;
}

LocalCoordinationService::Member *
LocalCoordinationService::find_locked(const std::string &member_id,
                                      std::string *group_path) {
  for (auto &[path, members] : groups_) {
    auto it = members.find(member_id);
    if (it != members.end()) {
      if (group_path) {
        *group_path = path;
      }
      return &it->second;
    }
  }
  return nullptr;
}

std::string
LocalCoordinationService::master_locked(const std::string &group_path) const {
  auto it = groups_.find(group_path);
  if (it == groups_.end()) {
    return "";
  }

  const Member *best = nullptr;
  std::string best_id;
  for (const auto &[id, member] : it->second) {
    if (!member.started || !member.connected) {
      continue;
    }
    if (!best || member.sequence < best->sequence) {
      best = &member;
      best_id = id;
    }
  }
  return best_id;
}

void LocalCoordinationService::notify_others_locked(
    const std::string &group_path, const std::string &except_id) {
  auto it = groups_.find(group_path);
  if (it == groups_.end()) {
    return;
  }
  for (auto &[id, member] : it->second) {
    if (id != except_id && member.started && member.connected) {
      member.group->enqueue(GroupEvent::CHANGED);
    }
  }
}

void LocalCoordinationService::member_started(LocalGroup &group) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &members = groups_[group.group_path()];
  auto it = members.find(group.id());
  if (it == members.end()) {
    return;
  }
  it->second.started = true;
  it->second.sequence = next_sequence_++;

  LOG_DEBUG(kModule, "member ", group.id(), " started; master of ",
            group.group_path(), " is ", master_locked(group.group_path()));

  group.enqueue(GroupEvent::CONNECTED);
  notify_others_locked(group.group_path(), group.id());
}

void LocalCoordinationService::member_closed(LocalGroup &group) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto path_it = groups_.find(group.group_path());
  if (path_it == groups_.end()) {
    return;
  }
  auto removed = path_it->second.erase(group.id());
  if (removed == 0) {
    return;
  }
  LOG_DEBUG(kModule, "member ", group.id(), " left ", group.group_path());
  notify_others_locked(group.group_path(), group.id());
}

bool LocalCoordinationService::is_master(const LocalGroup &group) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return master_locked(group.group_path()) == group.id();
}

bool LocalCoordinationService::disconnect(const std::string &member_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string path;
  Member *member = find_locked(member_id, &path);
  if (!member || !member->connected) {
    return false;
  }
  member->connected = false;
  LOG_INFO(kModule, "session of ", member_id, " lost");

  member->group->enqueue(GroupEvent::DISCONNECTED);
  notify_others_locked(path, member_id);
  return true;
}

bool LocalCoordinationService::reconnect(const std::string &member_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string path;
  Member *member = find_locked(member_id, &path);
  if (!member || member->connected) {
    return false;
  }
  member->connected = true;
  member->sequence = next_sequence_++;
  LOG_INFO(kModule, "session of ", member_id, " re-established");

  member->group->enqueue(GroupEvent::CONNECTED);
  notify_others_locked(path, member_id);
  return true;
}

std::string
LocalCoordinationService::master_of(const std::string &group_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return master_locked(group_path);
}

std::vector<std::string>
LocalCoordinationService::members_of(const std::string &group_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  auto it = groups_.find(group_path);
  if (it != groups_.end()) {
    for (const auto &[id, member] : it->second) {
      if (member.started) {
        ids.push_back(id);
      }
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace cluster
} // namespace autoscale
