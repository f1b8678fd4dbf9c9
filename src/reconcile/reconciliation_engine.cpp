#include "reconcile/reconciliation_engine.h"
#include "common/logging.h"
#include <sstream>

namespace autoscale {
namespace reconcile {

namespace {
const std::string kModule = "reconcile";
} // namespace

const char *profile_outcome_to_string(ProfileOutcome outcome) {
  switch (outcome) {
  case ProfileOutcome::UNMANAGED:
    return "unmanaged";
  case ProfileOutcome::NO_AUTOSCALER:
    return "no-autoscaler";
  case ProfileOutcome::SATISFIED:
    return "satisfied";
  case ProfileOutcome::SCALED_UP:
    return "scaled-up";
  case ProfileOutcome::SCALED_DOWN:
    return "scaled-down";
  case ProfileOutcome::GATED:
    return "gated";
  case ProfileOutcome::FAILED:
    return "failed";
  }
  return "unknown";
}

const ProfileResult *
ReconciliationReport::find(const ProfileId &profile) const {
  for (const auto &result : profiles) {
    if (result.profile == profile) {
      return &result;
    }
  }
  return nullptr;
}

std::string ReconciliationReport::summary() const {
  std::ostringstream oss;
  oss << profiles.size() << " profile(s), " << scale_up_commands
      << " scale-up, " << scale_down_commands << " scale-down, " << gated
      << " gated, " << failures << " failed in " << duration.count() << "ms";
  return oss.str();
}

// State of one reconciliation pass
class ReconciliationEngine::Pass {
public:
  Pass(const RequirementsDocument &requirements, InventoryProvider &inventory)
      : lookup_(requirements), inventory_(inventory) {}

  const std::vector<InstanceRecord> &countable(const ProfileId &profile) {
    auto it = countable_.find(profile);
    if (it != countable_.end()) {
      return it->second;
    }

    std::vector<InstanceRecord> answer;
    for (auto &instance : inventory_.containers_for_profile(profile)) {
      if (instance.is_countable()) {
        LOG_TRACE(kModule, "instance ", instance.id, " alive=", instance.alive,
                  " provisioning_pending=", instance.provisioning_pending);
        answer.push_back(std::move(instance));
      }
    }
    return countable_.emplace(profile, std::move(answer)).first->second;
  }

  bool satisfied(const ProfileRequirement &profile_requirement,
                 ProfileId *blocking) {
    for (const auto &dependency : profile_requirement.dependent_profiles) {
      const auto minimum =
          lookup_.get_or_create_profile_requirement(dependency)
              .minimum_instances;
      if (!minimum) {
        continue;
      }
      int available = static_cast<int>(countable(dependency).size());
      if (available < *minimum) {
        LOG_STRUCTURED(common::LogLevel::INFO, kModule,
                       "cannot yet scale up " + profile_requirement.profile +
                           " since dependent profile " + dependency +
                           " has only " + std::to_string(available) +
                           " instance(s) when it requires " +
                           std::to_string(*minimum),
                       {{"profile", profile_requirement.profile},
                        {"dependency", dependency}});
        if (blocking) {
          *blocking = dependency;
        }
        return false;
      }
    }
    return true;
  }

private:
  RequirementsDocument lookup_;
  InventoryProvider &inventory_;
  std::unordered_map<ProfileId, std::vector<InstanceRecord>> countable_;
};

ReconciliationReport
ReconciliationEngine::run(const RequirementsDocument &requirements,
                          InventoryProvider &inventory,
                          AutoscalerFactory &autoscalers,
                          ClusterVersionSource &versions) const {
  auto start = std::chrono::steady_clock::now();
  ReconciliationReport report;

  // The caller's document may be backed by a mutable store
  const RequirementsDocument snapshot = requirements;
  Pass pass(snapshot, inventory);

  for (const auto &profile_requirement : snapshot.profile_requirements()) {
    ProfileResult result;
    result.profile = profile_requirement.profile;

    if (!profile_requirement.minimum_instances) {
      report.profiles.push_back(std::move(result));
      continue;
    }
    result.desired = *profile_requirement.minimum_instances;

    try {
      auto autoscaler =
          autoscalers.create_autoscaler(snapshot, profile_requirement);
      if (!autoscaler) {
        LOG_WARN(kModule, "no autoscaler available for profile ",
                 result.profile);
        result.outcome = ProfileOutcome::NO_AUTOSCALER;
        report.profiles.push_back(std::move(result));
        continue;
      }

      const auto &instances = pass.countable(result.profile);
      result.observed = static_cast<int>(instances.size());
      result.delta = result.desired - result.observed;

      if (result.delta < 0) {
        LOG_INFO(kModule, "scaling down ", result.profile, " by ",
                 -result.delta, " (", result.observed, " running, ",
                 result.desired, " required)");
        autoscaler->destroy_containers(result.profile, -result.delta,
                                       instances);
        result.outcome = ProfileOutcome::SCALED_DOWN;
        ++report.scale_down_commands;
      } else if (result.delta > 0) {
        if (pass.satisfied(profile_requirement, &result.blocking_dependency)) {
          ScaleUpRequest request;
          request.version = versions.get_default_version_id();
          request.profile = result.profile;
          request.count = result.delta;
          request.requirements = snapshot;
          request.profile_requirement = profile_requirement;

          LOG_INFO(kModule, "scaling up ", result.profile, " by ",
                   result.delta, " at version ", request.version, " (",
                   result.observed, " running, ", result.desired,
                   " required)");
          autoscaler->create_containers(request);
          result.outcome = ProfileOutcome::SCALED_UP;
          ++report.scale_up_commands;
        } else {
          result.outcome = ProfileOutcome::GATED;
          ++report.gated;
        }
      } else {
        result.outcome = ProfileOutcome::SATISFIED;
      }
    } catch (const std::exception &e) {
      LOG_STRUCTURED(common::LogLevel::ERROR, kModule,
                     "failed to auto-scale " + result.profile + ": " + e.what(),
                     {{"profile", result.profile}});
      result.outcome = ProfileOutcome::FAILED;
      result.error = e.what();
      ++report.failures;
    }

    report.profiles.push_back(std::move(result));
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  LOG_DEBUG(kModule, "pass complete: ", report.summary());
  return report;
}

bool ReconciliationEngine::dependencies_satisfied(
    const RequirementsDocument &requirements,
    const ProfileRequirement &profile_requirement, InventoryProvider &inventory,
    ProfileId *blocking) const {
  Pass pass(requirements, inventory);
  return pass.satisfied(profile_requirement, blocking);
}

} // namespace reconcile
} // namespace autoscale
