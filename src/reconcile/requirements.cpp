#include "reconcile/requirements.h"
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace autoscale {
namespace reconcile {

RequirementsDocument::RequirementsDocument(
    std::vector<ProfileRequirement> requirements) {
  for (auto &requirement : requirements) {
    add_or_replace(std::move(requirement));
  }
}

void RequirementsDocument::add_or_replace(ProfileRequirement requirement) {
  auto it = std::find_if(requirements_.begin(), requirements_.end(),
                         [&requirement](const ProfileRequirement &existing) {
                           return existing.profile == requirement.profile;
                         });
  if (it != requirements_.end()) {
    *it = std::move(requirement);
  } else {
    requirements_.push_back(std::move(requirement));
  }
}

bool RequirementsDocument::remove(const ProfileId &profile) {
  auto it = std::find_if(requirements_.begin(), requirements_.end(),
                         [&profile](const ProfileRequirement &existing) {
                           return existing.profile == profile;
                         });
  if (it == requirements_.end()) {
    return false;
  }
  requirements_.erase(it);
  return true;
}

const ProfileRequirement *
RequirementsDocument::find(const ProfileId &profile) const {
  for (const auto &requirement : requirements_) {
    if (requirement.profile == profile) {
      return &requirement;
    }
  }
  return nullptr;
}

ProfileRequirement &
RequirementsDocument::get_or_create_profile_requirement(const ProfileId &profile) {
  for (auto &requirement : requirements_) {
    if (requirement.profile == profile) {
      return requirement;
    }
  }
  requirements_.emplace_back(profile);
  return requirements_.back();
}

nlohmann::json to_json(const ProfileRequirement &requirement) {
  nlohmann::json json;
  json["profile"] = requirement.profile;
  if (requirement.minimum_instances) {
    json["minimumInstances"] = *requirement.minimum_instances;
  }
  if (!requirement.dependent_profiles.empty()) {
    json["dependentProfiles"] = requirement.dependent_profiles;
  }
  return json;
}

nlohmann::json to_json(const RequirementsDocument &document) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &requirement : document.profile_requirements()) {
    list.push_back(to_json(requirement));
  }
  return nlohmann::json{{"profileRequirements", list}};
}

Result<ProfileRequirement>
profile_requirement_from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Result<ProfileRequirement>("profile requirement must be an object");
  }

  auto profile_it = json.find("profile");
  if (profile_it == json.end() || !profile_it->is_string() ||
      profile_it->get<std::string>().empty()) {
    return Result<ProfileRequirement>(
        "profile requirement needs a non-empty \"profile\"");
  }

  ProfileRequirement requirement(profile_it->get<std::string>());

  auto minimum_it = json.find("minimumInstances");
  if (minimum_it != json.end() && !minimum_it->is_null()) {
    if (!minimum_it->is_number_integer()) {
      return Result<ProfileRequirement>("minimumInstances of " +
                                        requirement.profile +
                                        " must be an integer");
    }
    if (!minimum_it->is_number_unsigned() &&
        minimum_it->get<int64_t>() < 0) {
      return Result<ProfileRequirement>("minimumInstances of " +
                                        requirement.profile +
                                        " must not be negative");
    }
    if (minimum_it->get<uint64_t>() >
        static_cast<uint64_t>(std::numeric_limits<int>::max())) {
      return Result<ProfileRequirement>("minimumInstances of " +
                                        requirement.profile +
                                        " is out of range");
    }
    requirement.minimum_instances = minimum_it->get<int>();
  }

  auto deps_it = json.find("dependentProfiles");
  if (deps_it != json.end() && !deps_it->is_null()) {
    if (!deps_it->is_array()) {
      return Result<ProfileRequirement>("dependentProfiles of " +
                                        requirement.profile +
                                        " must be an array");
    }
    for (const auto &dep : *deps_it) {
      if (!dep.is_string()) {
        return Result<ProfileRequirement>("dependentProfiles of " +
                                          requirement.profile +
                                          " must contain strings");
      }
      requirement.dependent_profiles.push_back(dep.get<std::string>());
    }
  }

  return Result<ProfileRequirement>(std::move(requirement));
}

Result<RequirementsDocument> requirements_from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Result<RequirementsDocument>("requirements must be a JSON object");
  }

  RequirementsDocument document;
  auto list_it = json.find("profileRequirements");
  if (list_it == json.end() || list_it->is_null()) {
    return Result<RequirementsDocument>(std::move(document));
  }
  if (!list_it->is_array()) {
    return Result<RequirementsDocument>(
        "\"profileRequirements\" must be an array");
  }

  std::unordered_set<std::string> seen;
  for (const auto &entry : *list_it) {
    auto parsed = profile_requirement_from_json(entry);
    if (parsed.is_err()) {
      return Result<RequirementsDocument>(parsed.error());
    }
    if (!seen.insert(parsed.value().profile).second) {
      return Result<RequirementsDocument>("duplicate profile requirement: " +
                                          parsed.value().profile);
    }
    document.add_or_replace(std::move(parsed).value());
  }
  return Result<RequirementsDocument>(std::move(document));
}

Result<RequirementsDocument> parse_requirements(const std::string &text) {
  try {
    return requirements_from_json(nlohmann::json::parse(text));
  } catch (const nlohmann::json::parse_error &e) {
    return Result<RequirementsDocument>(std::string("invalid JSON: ") +
                                        e.what());
  }
}

} // namespace reconcile
} // namespace autoscale
