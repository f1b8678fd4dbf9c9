#include "cluster/local_coordination.h"
#include "common/logging.h"
#include "reconcile/autoscale_controller.h"
#include "reconcile/config.h"
#include "reconcile/requirements_store.h"
#include "reconcile/simulated_cluster.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace autoscale;

std::atomic<bool> g_shutdown_requested{false};
const std::string kMainModule = "main";
const std::string kStatusModule = "status";

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
  }
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --requirements FILE        Path to JSON requirements document"
            << std::endl;
  std::cout << "  --poll-interval MS         Milliseconds between reconciliation "
               "passes (default: 10000)"
            << std::endl;
  std::cout << "  --nodes COUNT              Controller nodes to run (default: 2)"
            << std::endl;
  std::cout << "  --run-seconds SECONDS      Exit after this long (default: run "
               "until interrupted)"
            << std::endl;
  std::cout << "  --failover-after SECONDS   Stop the master after this long"
            << std::endl;
  std::cout << "  --log-level LEVEL          trace, debug, info, warn, error"
            << std::endl;
  std::cout << "  --json-logs                Emit JSON log lines" << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

struct CommandLine {
  std::string config_path;
  reconcile::AutoscaleConfig overrides;
  bool has_poll_interval = false;
  bool has_nodes = false;
  bool has_run_seconds = false;
  bool has_failover = false;
  bool has_log_level = false;
  bool has_requirements = false;
  bool json_logs = false;
};

bool parse_unsigned(const std::string &text, uint32_t &out) {
  try {
    size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

common::Result<CommandLine> parse_arguments(int argc, char *argv[]) {
  CommandLine cli;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      cli.config_path = argv[++i];
    } else if (arg == "--requirements" && i + 1 < argc) {
      cli.overrides.requirements_path = argv[++i];
      cli.has_requirements = true;
    } else if (arg == "--poll-interval" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], cli.overrides.poll_interval_ms)) {
        return common::Result<CommandLine>("invalid --poll-interval");
      }
      cli.has_poll_interval = true;
    } else if (arg == "--nodes" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], cli.overrides.demo_nodes)) {
        return common::Result<CommandLine>("invalid --nodes");
      }
      cli.has_nodes = true;
    } else if (arg == "--run-seconds" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], cli.overrides.run_seconds)) {
        return common::Result<CommandLine>("invalid --run-seconds");
      }
      cli.has_run_seconds = true;
    } else if (arg == "--failover-after" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], cli.overrides.failover_after_seconds)) {
        return common::Result<CommandLine>("invalid --failover-after");
      }
      cli.has_failover = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      cli.overrides.log_level = argv[++i];
      cli.has_log_level = true;
    } else if (arg == "--json-logs") {
      cli.json_logs = true;
    } else {
      return common::Result<CommandLine>("unknown argument: " + arg);
    }
  }
  return common::Result<CommandLine>(std::move(cli));
}

common::Result<reconcile::AutoscaleConfig>
resolve_config(const CommandLine &cli) {
  reconcile::AutoscaleConfig config = reconcile::ConfigManager::create_default();

  if (!cli.config_path.empty()) {
    auto loaded = reconcile::ConfigManager::load_from_file(cli.config_path);
    if (loaded.is_err()) {
      return loaded;
    }
    config = loaded.value();
  }

  if (cli.has_requirements)
    config.requirements_path = cli.overrides.requirements_path;
  if (cli.has_poll_interval)
    config.poll_interval_ms = cli.overrides.poll_interval_ms;
  if (cli.has_nodes)
    config.demo_nodes = cli.overrides.demo_nodes;
  if (cli.has_run_seconds)
    config.run_seconds = cli.overrides.run_seconds;
  if (cli.has_failover)
    config.failover_after_seconds = cli.overrides.failover_after_seconds;
  if (cli.has_log_level)
    config.log_level = cli.overrides.log_level;
  if (cli.json_logs)
    config.json_logs = true;

  std::string error = reconcile::ConfigManager::validate_config(config);
  if (!error.empty()) {
    return common::Result<reconcile::AutoscaleConfig>(error);
  }
  return common::Result<reconcile::AutoscaleConfig>(std::move(config));
}

void print_status(const std::vector<std::shared_ptr<reconcile::AutoScaleController>>
                      &controllers,
                  const reconcile::SimulatedCluster &cluster) {
  for (const auto &controller : controllers) {
    auto stats = controller->stats();
    LOG_INFO(kStatusModule, controller->member_id(), " ",
             reconcile::controller_state_to_string(stats.state), " passes=",
             stats.passes, " scale_up=", stats.scale_up_commands,
             " scale_down=", stats.scale_down_commands,
             " failures=", stats.failures);
  }
  LOG_INFO(kStatusModule, cluster.all_instances().size(),
           " instance(s) in the cluster");
}

int main(int argc, char *argv[]) {
  auto cli = parse_arguments(argc, argv);
  if (cli.is_err()) {
    std::cerr << cli.error() << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  auto resolved = resolve_config(cli.value());
  if (resolved.is_err()) {
    std::cerr << "Configuration error: " << resolved.error() << std::endl;
    return 1;
  }
  const reconcile::AutoscaleConfig config = resolved.value();

  common::LogLevel level = common::LogLevel::INFO;
  if (!common::parse_log_level(config.log_level, level)) {
    std::cerr << "Unknown log level: " << config.log_level << std::endl;
    return 1;
  }
  auto &logger = common::Logger::instance();
  logger.set_level(level);
  logger.set_json_format(config.json_logs);
  logger.set_async_logging(config.async_logging);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  try {
    auto store = std::make_shared<reconcile::RequirementsStore>();
    if (!config.requirements_path.empty()) {
      auto loaded = store->load_file(config.requirements_path);
      if (loaded.is_err()) {
        std::cerr << "Requirements error: " << loaded.error() << std::endl;
        return 1;
      }
    } else {
      LOG_WARN(kMainModule,
               "no requirements document given; nothing will be scaled");
    }

    auto simulated = std::make_shared<reconcile::SimulatedCluster>(store);
    auto coordination = std::make_shared<cluster::LocalCoordinationService>();

    std::vector<std::shared_ptr<reconcile::AutoScaleController>> controllers;
    for (uint32_t i = 0; i < config.demo_nodes; ++i) {
      reconcile::AutoscaleConfig node_config = config;
      if (node_config.node_id.empty()) {
        node_config.node_id = "node-" + std::to_string(i);
      } else {
        node_config.node_id += "-" + std::to_string(i);
      }
      auto controller =
          std::make_shared<reconcile::AutoScaleController>(node_config);
      controller->bind_coordination(coordination);
      controller->bind_cluster(simulated);
      controller->activate();
      controllers.push_back(controller);
    }

    auto started = std::chrono::steady_clock::now();
    auto last_status = started;
    bool failed_over = false;
    const auto poll = std::chrono::milliseconds(config.poll_interval_ms);

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      auto now = std::chrono::steady_clock::now();
      auto uptime =
          std::chrono::duration_cast<std::chrono::seconds>(now - started);

      if (now - last_status >= poll) {
        // Provisioning completes between passes
        simulated->settle();
        print_status(controllers, *simulated);
        last_status = now;
      }

      if (!failed_over && config.failover_after_seconds > 0 &&
          uptime.count() >= config.failover_after_seconds) {
        for (auto &controller : controllers) {
          if (controller->is_master()) {
            LOG_INFO(kMainModule, "stopping master ",
                     controller->member_id());
            controller->deactivate();
            break;
          }
        }
        failed_over = true;
      }

      if (config.run_seconds > 0 && uptime.count() >= config.run_seconds) {
        break;
      }
    }

    LOG_INFO(kMainModule, "shutting down");
    for (auto &controller : controllers) {
      controller->deactivate();
    }
    print_status(controllers, *simulated);
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  logger.set_async_logging(false);
  return 0;
}
