#pragma once

#include "reconcile/cluster_service.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoscale {
namespace reconcile {

enum class ProfileOutcome {
  UNMANAGED,     // no minimum declared
  NO_AUTOSCALER, // factory had nothing for the profile
  SATISFIED,     // countable == minimum
  SCALED_UP,
  SCALED_DOWN,
  GATED, // scale-up withheld by an under-provisioned dependency
  FAILED // the autoscaler or inventory threw
};

struct ProfileResult {
  ProfileId profile;
  ProfileOutcome outcome = ProfileOutcome::UNMANAGED;
  int desired = 0;
  int observed = 0;
  int delta = 0;
  ProfileId blocking_dependency;
  std::string error;
};

/**
 * @brief Outcome of one reconciliation pass, in document order
 */
struct ReconciliationReport {
  std::vector<ProfileResult> profiles;
  uint32_t scale_up_commands = 0;
  uint32_t scale_down_commands = 0;
  uint32_t gated = 0;
  uint32_t failures = 0;
  std::chrono::milliseconds duration{0};

  uint32_t commands_issued() const {
    return scale_up_commands + scale_down_commands;
  }
  const ProfileResult *find(const ProfileId &profile) const;
  std::string summary() const;
};

/**
 * @brief Diffs desired against observed instance counts and issues scale
 * commands
 *
 * A pass works on a private copy of the requirements document and queries
 * the inventory at most once per profile, so a profile's own delta and every
 * dependency check that references it see the same instances. Each profile
 * is handled independently: a missing autoscaler, an unmet dependency or a
 * throwing collaborator affects only that profile.
 */
class ReconciliationEngine {
public:
  ReconciliationReport run(const RequirementsDocument &requirements,
                           InventoryProvider &inventory,
                           AutoscalerFactory &autoscalers,
                           ClusterVersionSource &versions) const;

  /**
   * @brief Dependency gating for a single profile
   * @param blocking set to the first dependency below its minimum
   * @return true when every declared dependency has reached its minimum
   */
  bool dependencies_satisfied(const RequirementsDocument &requirements,
                              const ProfileRequirement &profile_requirement,
                              InventoryProvider &inventory,
                              ProfileId *blocking = nullptr) const;

private:
  class Pass;
};

const char *profile_outcome_to_string(ProfileOutcome outcome);

} // namespace reconcile
} // namespace autoscale
