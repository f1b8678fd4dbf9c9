#pragma once

#include "cluster/coordination.h"
#include "cluster/leader_elector.h"
#include "common/bound_reference.h"
#include "reconcile/cluster_service.h"
#include "reconcile/config.h"
#include "reconcile/reconciliation_engine.h"
#include "reconcile/reconciliation_scheduler.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace autoscale {
namespace reconcile {

enum class ControllerState { UNKNOWN, MASTER, STANDBY, DISCONNECTED };

struct ControllerStats {
  ControllerState state = ControllerState::UNKNOWN;
  uint64_t passes = 0;
  uint64_t skipped_passes = 0;
  uint64_t ticks = 0;
  uint64_t scale_up_commands = 0;
  uint64_t scale_down_commands = 0;
  uint64_t failures = 0;
  ReconciliationReport last_report;
  std::chrono::system_clock::time_point last_pass_time;
};

/**
 * @brief Autoscaler that reconciles profile requirements while it is master
 *
 * Membership events drive the state machine:
 *  - JOINED/CHANGED as master: republish state, track configuration changes,
 *    enable the periodic scheduler and run one pass immediately.
 *  - JOINED/CHANGED as standby: republish state, disable the scheduler and
 *    stop tracking configuration changes.
 *  - DISCONNECTED: stop tracking configuration changes.
 * JOINED/CHANGED are ignored (and logged) while a binding is missing.
 * Passes triggered by the timer or by a configuration change only run while
 * this node is master.
 */
class AutoScaleController
    : public cluster::ILeadershipListener,
      public std::enable_shared_from_this<AutoScaleController> {
public:
  explicit AutoScaleController(AutoscaleConfig config = AutoscaleConfig());
  ~AutoScaleController() override;

  AutoScaleController(const AutoScaleController &) = delete;
  AutoScaleController &operator=(const AutoScaleController &) = delete;

  // Capability bindings
  void bind_coordination(std::shared_ptr<cluster::CoordinationService> service);
  void
  unbind_coordination(const std::shared_ptr<cluster::CoordinationService> &service);
  void bind_cluster(std::shared_ptr<ClusterService> service);
  void unbind_cluster(const std::shared_ptr<ClusterService> &service);

  bool is_valid() const;
  /// Comma-separated names of missing bindings; empty when valid
  std::string missing_bindings() const;

  // Lifecycle
  void activate();
  void deactivate();
  bool is_active() const;

  bool is_master() const;
  ControllerState state() const { return state_.load(); }
  std::string member_id() const;
  ControllerStats stats() const;
  bool scheduler_enabled() const { return scheduler_.is_enabled(); }

  /// Run one reconciliation pass now, regardless of mastership
  ReconciliationReport reconcile();

  void membership_event(cluster::MembershipEvent event) override;

private:
  void become_master(ClusterService &cluster);
  void become_standby(ClusterService &cluster);
  void on_configuration_changed();
  void on_timer();

  AutoscaleConfig config_;

  common::BoundReference<cluster::CoordinationService> coordination_;
  common::BoundReference<ClusterService> cluster_;

  mutable std::mutex elector_mutex_;
  std::shared_ptr<cluster::LeaderElector> elector_;

  std::mutex event_mutex_;
  std::atomic<ControllerState> state_;

  ReconciliationEngine engine_;
  ReconciliationScheduler scheduler_;
  ConfigurationCallback configuration_callback_;

  mutable std::mutex stats_mutex_;
  ControllerStats stats_;
};

const char *controller_state_to_string(ControllerState state);

} // namespace reconcile
} // namespace autoscale
