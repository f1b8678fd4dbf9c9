#include "reconcile/autoscale_controller.h"
#include "common/logging.h"

namespace autoscale {
namespace reconcile {

namespace {
const std::string kModule = "controller";
} // namespace

const char *controller_state_to_string(ControllerState state) {
  switch (state) {
  case ControllerState::UNKNOWN:
    return "UNKNOWN";
  case ControllerState::MASTER:
    return "MASTER";
  case ControllerState::STANDBY:
    return "STANDBY";
  case ControllerState::DISCONNECTED:
    return "DISCONNECTED";
  }
  return "UNKNOWN";
}

AutoScaleController::AutoScaleController(AutoscaleConfig config)
    : config_(std::move(config)), coordination_("coordination service"),
      cluster_("cluster service"), state_(ControllerState::UNKNOWN),
      scheduler_([this]() { on_timer(); }, "autoscale-timer") {}

AutoScaleController::~AutoScaleController() {
  scheduler_.disable();
  std::shared_ptr<cluster::LeaderElector> elector;
  {
    std::lock_guard<std::mutex> lock(elector_mutex_);
    elector = std::move(elector_);
  }
  if (elector) {
    elector->deactivate();
  }
}

void AutoScaleController::bind_coordination(
    std::shared_ptr<cluster::CoordinationService> service) {
  coordination_.bind(std::move(service));
}

void AutoScaleController::unbind_coordination(
    const std::shared_ptr<cluster::CoordinationService> &service) {
  coordination_.unbind(service);
}

void AutoScaleController::bind_cluster(std::shared_ptr<ClusterService> service) {
  cluster_.bind(std::move(service));
}

void AutoScaleController::unbind_cluster(
    const std::shared_ptr<ClusterService> &service) {
  if (service && configuration_callback_) {
    service->untrack_configuration(configuration_callback_);
  }
  cluster_.unbind(service);
}

bool AutoScaleController::is_valid() const {
  return coordination_.is_bound() && cluster_.is_bound();
}

std::string AutoScaleController::missing_bindings() const {
  std::string missing;
  if (!coordination_.is_bound()) {
    missing = coordination_.name();
  }
  if (!cluster_.is_bound()) {
    missing += (missing.empty() ? "" : ", ") + cluster_.name();
  }
  return missing;
}

void AutoScaleController::activate() {
  std::lock_guard<std::mutex> lock(elector_mutex_);
  if (elector_) {
    return;
  }

  if (!configuration_callback_) {
    std::weak_ptr<AutoScaleController> weak_self = weak_from_this();
    configuration_callback_ =
        std::make_shared<std::function<void()>>([weak_self]() {
          if (auto self = weak_self.lock()) {
            self->on_configuration_changed();
          }
        });
  }

  cluster::LeaderElectorConfig elector_config;
  elector_config.group_path = config_.group_path;
  elector_config.node_type = config_.node_type;
  elector_config.node_id = config_.node_id;

  auto elector = std::make_shared<cluster::LeaderElector>(coordination_.get(),
                                                          elector_config);
  elector->set_listener(weak_from_this());
  elector->activate();
  elector_ = elector;

  LOG_INFO(kModule, "activated ", elector->member_id(), " with poll interval ",
           config_.poll_interval_ms, "ms");
}

void AutoScaleController::deactivate() {
  std::shared_ptr<cluster::LeaderElector> elector;
  {
    std::lock_guard<std::mutex> lock(elector_mutex_);
    elector = std::move(elector_);
    elector_.reset();
  }
  // Closing the group waits for in-flight events, so no controller lock is
  // held here.
  if (elector) {
    elector->deactivate();
  }

  scheduler_.disable();
  if (auto cluster = cluster_.get_optional()) {
    if (configuration_callback_) {
      cluster->untrack_configuration(configuration_callback_);
    }
  }
  state_.store(ControllerState::UNKNOWN);
  if (elector) {
    LOG_INFO(kModule, "deactivated");
  }
}

bool AutoScaleController::is_active() const {
  std::lock_guard<std::mutex> lock(elector_mutex_);
  return elector_ != nullptr;
}

bool AutoScaleController::is_master() const {
  std::lock_guard<std::mutex> lock(elector_mutex_);
  return elector_ && elector_->is_master();
}

std::string AutoScaleController::member_id() const {
  std::lock_guard<std::mutex> lock(elector_mutex_);
  return elector_ ? elector_->member_id() : std::string();
}

ControllerStats AutoScaleController::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ControllerStats snapshot = stats_;
  snapshot.state = state_.load();
  snapshot.ticks = scheduler_.tick_count();
  return snapshot;
}

void AutoScaleController::membership_event(cluster::MembershipEvent event) {
  std::lock_guard<std::mutex> lock(event_mutex_);

  std::shared_ptr<cluster::LeaderElector> elector;
  {
    std::lock_guard<std::mutex> elector_lock(elector_mutex_);
    elector = elector_;
  }

  if (event == cluster::MembershipEvent::DISCONNECTED) {
    if (auto cluster = cluster_.get_optional()) {
      cluster->untrack_configuration(configuration_callback_);
    }
    state_.store(ControllerState::DISCONNECTED);
    LOG_WARN(kModule, "lost membership; no longer acting as master");
    return;
  }

  if (!is_valid() || !elector) {
    LOG_INFO(kModule, "ignoring ", cluster::membership_event_to_string(event),
             " with master: ", elector && elector->is_master(),
             "; missing: ",
             elector ? missing_bindings() : std::string("leader elector"));
    return;
  }

  auto cluster = cluster_.get();
  bool master = elector->is_master();
  LOG_INFO(kModule, "AutoScaleController is ", master ? "" : "not ",
           "the master");
  if (!elector->republish_state()) {
    LOG_DEBUG(kModule, "membership state not republished; awaiting next event");
  }
  if (master) {
    become_master(*cluster);
  } else {
    become_standby(*cluster);
  }
}

void AutoScaleController::become_master(ClusterService &cluster) {
  cluster.track_configuration(configuration_callback_);
  scheduler_.enable(std::chrono::milliseconds(config_.poll_interval_ms));
  state_.store(ControllerState::MASTER);

  // Do not wait a full poll interval after an election
  reconcile();
}

void AutoScaleController::become_standby(ClusterService &cluster) {
  scheduler_.disable();
  cluster.untrack_configuration(configuration_callback_);
  state_.store(ControllerState::STANDBY);
}

void AutoScaleController::on_configuration_changed() {
  if (!is_master()) {
    LOG_DEBUG(kModule, "configuration changed while not master; ignoring");
    return;
  }
  LOG_DEBUG(kModule,
            "configuration has changed; checking the auto-scaling requirements");
  reconcile();
}

void AutoScaleController::on_timer() {
  if (!is_master()) {
    LOG_DEBUG(kModule, "autoscale timer fired while not master; skipping");
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.skipped_passes;
    return;
  }
  LOG_DEBUG(kModule, "autoscale timer");
  reconcile();
}

ReconciliationReport AutoScaleController::reconcile() {
  auto cluster = cluster_.get_optional();
  if (!cluster || !coordination_.is_bound()) {
    LOG_WARN(kModule, "skipping reconciliation pass; missing ",
             missing_bindings());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.skipped_passes;
    return ReconciliationReport();
  }

  RequirementsDocument requirements;
  try {
    requirements = cluster->get_requirements();
  } catch (const std::exception &e) {
    LOG_ERROR(kModule, "cannot read requirements: ", e.what());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.skipped_passes;
    return ReconciliationReport();
  }

  auto report = engine_.run(requirements, *cluster, *cluster, *cluster);

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.passes;
  stats_.scale_up_commands += report.scale_up_commands;
  stats_.scale_down_commands += report.scale_down_commands;
  stats_.failures += report.failures;
  stats_.last_report = report;
  stats_.last_pass_time = std::chrono::system_clock::now();
  return report;
}

} // namespace reconcile
} // namespace autoscale
