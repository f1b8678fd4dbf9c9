#pragma once

#include "common/types.h"
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace autoscale {
namespace reconcile {

using common::ProfileId;
using common::Result;

/**
 * @brief Desired state of one profile
 *
 * An absent minimum_instances means the profile is not scaled at all; it is
 * never treated as zero.
 */
struct ProfileRequirement {
  ProfileId profile;
  std::optional<int> minimum_instances;
  std::vector<ProfileId> dependent_profiles;

  ProfileRequirement() = default;
  explicit ProfileRequirement(ProfileId profile_id)
      : profile(std::move(profile_id)) {}
  ProfileRequirement(ProfileId profile_id, int minimum,
                     std::vector<ProfileId> dependencies = {})
      : profile(std::move(profile_id)), minimum_instances(minimum),
        dependent_profiles(std::move(dependencies)) {}

  bool has_minimum() const { return minimum_instances.has_value(); }

  bool operator==(const ProfileRequirement &other) const {
    return profile == other.profile &&
           minimum_instances == other.minimum_instances &&
           dependent_profiles == other.dependent_profiles;
  }
  bool operator!=(const ProfileRequirement &other) const {
    return !(*this == other);
  }
};

/**
 * @brief Operator-declared requirement set, in declaration order
 *
 * Profile ids are unique; adding a requirement for a profile that is already
 * present replaces it in place.
 */
class RequirementsDocument {
public:
  RequirementsDocument() = default;
  explicit RequirementsDocument(std::vector<ProfileRequirement> requirements);
  RequirementsDocument(std::initializer_list<ProfileRequirement> requirements)
      : RequirementsDocument(std::vector<ProfileRequirement>(requirements)) {}

  const std::vector<ProfileRequirement> &profile_requirements() const {
    return requirements_;
  }

  /// Insert or replace by profile id
  void add_or_replace(ProfileRequirement requirement);
  bool remove(const ProfileId &profile);

  const ProfileRequirement *find(const ProfileId &profile) const;

  /**
   * @brief Requirement for a profile, creating an empty one if absent
   *
   * The created entry has no minimum and no dependencies and is appended to
   * the document.
   */
  ProfileRequirement &get_or_create_profile_requirement(const ProfileId &profile);

  bool empty() const { return requirements_.empty(); }
  size_t size() const { return requirements_.size(); }

  bool operator==(const RequirementsDocument &other) const {
    return requirements_ == other.requirements_;
  }
  bool operator!=(const RequirementsDocument &other) const {
    return !(*this == other);
  }

private:
  std::vector<ProfileRequirement> requirements_;
};

// JSON form: {"profileRequirements":[{"profile":..,"minimumInstances":..,
// "dependentProfiles":[..]}]}
nlohmann::json to_json(const ProfileRequirement &requirement);
nlohmann::json to_json(const RequirementsDocument &document);

Result<ProfileRequirement> profile_requirement_from_json(const nlohmann::json &json);
Result<RequirementsDocument> requirements_from_json(const nlohmann::json &json);
Result<RequirementsDocument> parse_requirements(const std::string &text);

} // namespace reconcile
} // namespace autoscale
