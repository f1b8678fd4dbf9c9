#pragma once

#include "reconcile/cluster_service.h"
#include "reconcile/requirements_store.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace autoscale {
namespace reconcile {

/**
 * @brief In-process cluster backing the daemon
 *
 * Scale-up adds instances in the provisioning-pending state; settle() makes
 * them alive. Scale-down removes not-yet-alive victims first, then the most
 * recently created ones.
 */
class SimulatedCluster : public ClusterService,
                         public std::enable_shared_from_this<SimulatedCluster> {
public:
  explicit SimulatedCluster(std::shared_ptr<RequirementsStore> store,
                            std::string default_version = "1.0");

  // RequirementsSource / ConfigurationChangeTracker
  RequirementsDocument get_requirements() override;
  void track_configuration(ConfigurationCallback callback) override;
  void untrack_configuration(const ConfigurationCallback &callback) override;

  // InventoryProvider
  std::vector<InstanceRecord>
  containers_for_profile(const ProfileId &profile) override;

  // AutoscalerFactory
  std::shared_ptr<Autoscaler>
  create_autoscaler(const RequirementsDocument &requirements,
                    const ProfileRequirement &profile_requirement) override;

  // ClusterVersionSource
  std::string get_default_version_id() override;
  void set_default_version_id(const std::string &version);

  /// Profiles for which no autoscaler is offered
  void set_unscalable(const ProfileId &profile, bool unscalable);

  std::string add_instance(const ProfileId &profile, bool alive,
                           bool provisioning_pending);
  bool fail_instance(const InstanceId &id);
  size_t settle();

  std::vector<InstanceRecord> all_instances() const;
  size_t countable_count(const ProfileId &profile) const;

  std::shared_ptr<RequirementsStore> store() const { return store_; }

  // Used by the simulated autoscaler
  void provision(const ScaleUpRequest &request);
  void decommission(const ProfileId &profile, int count,
                    const std::vector<InstanceRecord> &candidates);

private:
  struct Instance {
    InstanceRecord record;
    uint64_t sequence;
    std::string version;
  };

  std::string add_instance_locked(const ProfileId &profile, bool alive,
                                  bool provisioning_pending,
                                  const std::string &version);

  std::shared_ptr<RequirementsStore> store_;

  mutable std::mutex mutex_;
  std::vector<Instance> instances_;
  std::unordered_set<ProfileId> unscalable_;
  std::string default_version_;
  uint64_t next_sequence_ = 0;
};

} // namespace reconcile
} // namespace autoscale
