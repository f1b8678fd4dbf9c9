#pragma once

#include "common/types.h"
#include "reconcile/requirements.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace autoscale {
namespace reconcile {

using common::InstanceId;

/**
 * @brief One workload instance as reported by the cluster inventory
 */
struct InstanceRecord {
  InstanceId id;
  ProfileId profile;
  bool alive = false;
  bool provisioning_pending = false;

  /// Live or still being provisioned; counted toward the profile minimum
  bool is_countable() const { return alive || provisioning_pending; }
};

/**
 * @brief Request to start new instances of a profile
 */
struct ScaleUpRequest {
  std::string version;
  ProfileId profile;
  int count = 0;
  RequirementsDocument requirements;
  ProfileRequirement profile_requirement;
};

// Interfaces for the cluster-side capabilities the controller consumes

class RequirementsSource {
public:
  virtual ~RequirementsSource() = default;
  virtual RequirementsDocument get_requirements() = 0;
};

using ConfigurationCallback = std::shared_ptr<std::function<void()>>;

class ConfigurationChangeTracker {
public:
  virtual ~ConfigurationChangeTracker() = default;
  /// Callbacks are identified by pointer; tracking the same one twice is a no-op
  virtual void track_configuration(ConfigurationCallback callback) = 0;
  virtual void untrack_configuration(const ConfigurationCallback &callback) = 0;
};

class InventoryProvider {
public:
  virtual ~InventoryProvider() = default;
  virtual std::vector<InstanceRecord>
  containers_for_profile(const ProfileId &profile) = 0;
};

class Autoscaler {
public:
  virtual ~Autoscaler() = default;
  virtual void create_containers(const ScaleUpRequest &request) = 0;
  virtual void
  destroy_containers(const ProfileId &profile, int count,
                     const std::vector<InstanceRecord> &candidates) = 0;
};

class AutoscalerFactory {
public:
  virtual ~AutoscalerFactory() = default;
  /// nullptr when no autoscaler can handle the profile
  virtual std::shared_ptr<Autoscaler>
  create_autoscaler(const RequirementsDocument &requirements,
                    const ProfileRequirement &profile_requirement) = 0;
};

class ClusterVersionSource {
public:
  virtual ~ClusterVersionSource() = default;
  virtual std::string get_default_version_id() = 0;
};

/**
 * @brief Domain-service handle bound into the controller
 */
class ClusterService : public RequirementsSource,
                       public ConfigurationChangeTracker,
                       public InventoryProvider,
                       public AutoscalerFactory,
                       public ClusterVersionSource {
public:
  ~ClusterService() override = default;
};

} // namespace reconcile
} // namespace autoscale
