#include "reconcile/simulated_cluster.h"
#include "common/logging.h"
#include <algorithm>
#include <stdexcept>

namespace autoscale {
namespace reconcile {

namespace {
const std::string kModule = "cluster";

class SimulatedAutoscaler : public Autoscaler {
public:
  explicit SimulatedAutoscaler(std::weak_ptr<SimulatedCluster> cluster)
      : cluster_(std::move(cluster)) {}

  void create_containers(const ScaleUpRequest &request) override {
    lock()->provision(request);
  }

  void destroy_containers(const ProfileId &profile, int count,
                          const std::vector<InstanceRecord> &candidates) override {
    lock()->decommission(profile, count, candidates);
  }

private:
  std::shared_ptr<SimulatedCluster> lock() const {
    auto cluster = cluster_.lock();
    if (!cluster) {
      throw std::runtime_error("simulated cluster has been shut down");
    }
    return cluster;
  }

  std::weak_ptr<SimulatedCluster> cluster_;
};
} // namespace

SimulatedCluster::SimulatedCluster(std::shared_ptr<RequirementsStore> store,
                                   std::string default_version)
    : store_(std::move(store)), default_version_(std::move(default_version)) {
  if (!store_) {
    throw std::invalid_argument("SimulatedCluster needs a requirements store");
  }
}

RequirementsDocument SimulatedCluster::get_requirements() {
  return store_->get_requirements();
}

void SimulatedCluster::track_configuration(ConfigurationCallback callback) {
  store_->track_configuration(std::move(callback));
}

void SimulatedCluster::untrack_configuration(
    const ConfigurationCallback &callback) {
  store_->untrack_configuration(callback);
}

std::vector<InstanceRecord>
SimulatedCluster::containers_for_profile(const ProfileId &profile) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<InstanceRecord> answer;
  for (const auto &instance : instances_) {
    if (instance.record.profile == profile) {
      answer.push_back(instance.record);
    }
  }
  return answer;
}

std::shared_ptr<Autoscaler>
SimulatedCluster::create_autoscaler(const RequirementsDocument &,
                                    const ProfileRequirement &profile_requirement) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unscalable_.count(profile_requirement.profile)) {
      return nullptr;
    }
  }
  return std::make_shared<SimulatedAutoscaler>(weak_from_this());
}

std::string SimulatedCluster::get_default_version_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_version_;
}

void SimulatedCluster::set_default_version_id(const std::string &version) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_version_ = version;
}

void SimulatedCluster::set_unscalable(const ProfileId &profile,
                                      bool unscalable) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unscalable) {
    unscalable_.insert(profile);
  } else {
    unscalable_.erase(profile);
  }
}

std::string SimulatedCluster::add_instance_locked(const ProfileId &profile,
                                                  bool alive,
                                                  bool provisioning_pending,
                                                  const std::string &version) {
  Instance instance;
  instance.sequence = next_sequence_++;
  instance.record.id = profile + "-" + std::to_string(instance.sequence);
  instance.record.profile = profile;
  instance.record.alive = alive;
  instance.record.provisioning_pending = provisioning_pending;
  instance.version = version;
  instances_.push_back(instance);
  return instance.record.id;
}

std::string SimulatedCluster::add_instance(const ProfileId &profile,
                                           bool alive,
                                           bool provisioning_pending) {
  std::lock_guard<std::mutex> lock(mutex_);
  return add_instance_locked(profile, alive, provisioning_pending,
                             default_version_);
}

bool SimulatedCluster::fail_instance(const InstanceId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &instance : instances_) {
    if (instance.record.id == id) {
      instance.record.alive = false;
      instance.record.provisioning_pending = false;
      return true;
    }
  }
  return false;
}

size_t SimulatedCluster::settle() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t settled = 0;
  for (auto &instance : instances_) {
    if (instance.record.provisioning_pending) {
      instance.record.provisioning_pending = false;
      instance.record.alive = true;
      ++settled;
    }
  }
  // Dead instances are reaped once they have been observed
  instances_.erase(std::remove_if(instances_.begin(), instances_.end(),
                                  [](const Instance &instance) {
                                    return !instance.record.is_countable();
                                  }),
                   instances_.end());
  return settled;
}

std::vector<InstanceRecord> SimulatedCluster::all_instances() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<InstanceRecord> answer;
  answer.reserve(instances_.size());
  for (const auto &instance : instances_) {
    answer.push_back(instance.record);
  }
  return answer;
}

size_t SimulatedCluster::countable_count(const ProfileId &profile) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(instances_.begin(), instances_.end(),
                       [&profile](const Instance &instance) {
                         return instance.record.profile == profile &&
                                instance.record.is_countable();
                       });
}

void SimulatedCluster::provision(const ScaleUpRequest &request) {
  if (request.count <= 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (int i = 0; i < request.count; ++i) {
    auto id = add_instance_locked(request.profile, false, true, request.version);
    LOG_INFO(kModule, "provisioning ", id, " at version ", request.version);
  }
}

void SimulatedCluster::decommission(
    const ProfileId &profile, int count,
    const std::vector<InstanceRecord> &candidates) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<const Instance *> victims;
  for (const auto &candidate : candidates) {
    for (const auto &instance : instances_) {
      if (instance.record.id == candidate.id &&
          instance.record.profile == profile) {
        victims.push_back(&instance);
      }
    }
  }
  std::sort(victims.begin(), victims.end(),
            [](const Instance *a, const Instance *b) {
              if (a->record.alive != b->record.alive) {
                return !a->record.alive;
              }
              return a->sequence > b->sequence;
            });
  if (static_cast<int>(victims.size()) > count) {
    victims.resize(count);
  }

  std::unordered_set<InstanceId> doomed;
  for (const auto *victim : victims) {
    doomed.insert(victim->record.id);
    LOG_INFO(kModule, "stopping ", victim->record.id);
  }
  instances_.erase(std::remove_if(instances_.begin(), instances_.end(),
                                  [&doomed](const Instance &instance) {
                                    return doomed.count(instance.record.id) > 0;
                                  }),
                   instances_.end());
}

} // namespace reconcile
} // namespace autoscale
