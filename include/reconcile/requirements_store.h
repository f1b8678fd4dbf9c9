#pragma once

#include "reconcile/cluster_service.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace autoscale {
namespace reconcile {

/**
 * @brief In-memory requirements document with change notification
 *
 * Tracked callbacks run on the store's notifier thread after every
 * set_requirements(). Several changes in quick succession may be coalesced
 * into one notification.
 */
class RequirementsStore : public RequirementsSource,
                          public ConfigurationChangeTracker {
public:
  RequirementsStore();
  explicit RequirementsStore(RequirementsDocument initial);
  ~RequirementsStore() override;

  RequirementsStore(const RequirementsStore &) = delete;
  RequirementsStore &operator=(const RequirementsStore &) = delete;

  RequirementsDocument get_requirements() override;
  void set_requirements(RequirementsDocument document);

  void track_configuration(ConfigurationCallback callback) override;
  void untrack_configuration(const ConfigurationCallback &callback) override;
  size_t tracked_count() const;

  common::Result<bool> load_file(const std::string &path);
  common::Result<bool> save_file(const std::string &path) const;

  uint64_t generation() const { return generation_.load(); }

private:
  void notifier_loop();

  mutable std::mutex document_mutex_;
  RequirementsDocument document_;
  std::atomic<uint64_t> generation_;

  mutable std::mutex callbacks_mutex_;
  std::vector<ConfigurationCallback> callbacks_;

  std::mutex notify_mutex_;
  std::condition_variable notify_cv_;
  uint64_t notified_generation_;
  bool shutdown_;
  std::thread notifier_;
};

} // namespace reconcile
} // namespace autoscale
