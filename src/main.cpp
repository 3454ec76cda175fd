#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/web/web_server.hpp"
#include "registry/registry_factory.hpp"
#include "retrain/process_job_runner.hpp"
#include "retrain/retrain_coordinator.hpp"
#include "retrain/retrain_monitor.hpp"
#include "serving/model_loader.hpp"
#include "serving/model_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_requested = true;
  }
}

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --config <file>   Configuration file (default: config.ini)\n"
            << "  --help            Show this message\n";
}

int main(int argc, char *argv[]) {
  auto command_line = Config::parse_server_command_line(argc, argv);
  if (command_line.action == Config::CommandLineAction::SHOW_HELP) {
    print_usage(argv[0]);
    return 0;
  }
  if (command_line.action == Config::CommandLineAction::USAGE_ERROR) {
    std::cerr << command_line.error << std::endl;
    print_usage(argv[0]);
    return 2;
  }
  const std::string &config_file_to_load = command_line.config_file;

  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "Model server starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  // Registers the lifecycle metric families before the first scrape
  LifecycleMetrics::instance();

  // --- Initialize Core Components ---
  std::shared_ptr<IRegistryClient> registry;
  try {
    registry = make_registry_client(current_config->registry);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to create the model registry client: " << e.what());
    return 1;
  }

  ArtifactLoaderConfig loader_config;
  loader_config.model_file_name = current_config->serving.model_file_name;
  loader_config.artifact_cache_dir = current_config->serving.artifact_cache_dir;
  loader_config.tracking_uri = current_config->registry.tracking_uri;
  loader_config.timeout =
      std::chrono::milliseconds(current_config->registry.request_timeout_ms);
  auto loader = std::make_shared<ArtifactModelLoader>(loader_config);

  ModelServerConfig server_config;
  server_config.model_name = current_config->model_name;
  server_config.feature_count = current_config->serving.feature_names.size();
  server_config.load_wait_timeout =
      std::chrono::milliseconds(current_config->serving.load_wait_timeout_ms);
  auto model_server =
      std::make_shared<ModelServer>(registry, loader, server_config);

  if (current_config->serving.load_on_startup) {
    if (!model_server->reload())
      LOG(LogLevel::WARN, LogComponent::CORE,
          "No production model loaded at startup; predictions will return "
          "503 until one is promoted");
  }

  ProcessJobConfig job_config;
  job_config.command_template = current_config->retrain.job_command;
  job_config.output_tail_bytes = current_config->retrain.output_tail_bytes;
  auto job_runner = std::make_shared<ProcessJobRunner>(job_config);

  RetrainCoordinatorConfig coordinator_config;
  coordinator_config.service_name = current_config->retrain.service_name;
  coordinator_config.job_timeout =
      std::chrono::seconds(current_config->retrain.job_timeout_seconds);
  auto coordinator = std::make_shared<RetrainCoordinator>(
      job_runner, model_server, coordinator_config);

  std::unique_ptr<RetrainMonitor> monitor;
  if (current_config->monitor.enabled) {
    monitor = std::make_unique<RetrainMonitor>(
        current_config->monitor.signal_file_path, coordinator,
        std::chrono::seconds(current_config->monitor.poll_interval_seconds));
    monitor->start();
  }

  WebServer web_server(current_config->serving, current_config->metrics,
                       *model_server, *coordinator);
  if (!web_server.start()) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to start the web server. Exiting.");
    if (monitor)
      monitor->stop();
    coordinator->shutdown();
    return 1;
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Serving '" << current_config->model_name << "' on "
                  << current_config->serving.host << ":"
                  << web_server.get_port());

  // --- Main loop ---
  while (!g_shutdown_requested) {
    if (g_reload_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP received: reloading log levels and production model");
      if (config_manager.load_configuration(config_file_to_load))
        LogManager::instance().configure(config_manager.get_config()->logging);
      model_server->reload();
    }
    if (!web_server.is_running()) {
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Web server thread exited; shutting down");
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // --- Shutdown ---
  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested...");
  web_server.stop();
  if (monitor)
    monitor->stop();
  coordinator->shutdown();

  LOG(LogLevel::INFO, LogComponent::CORE, "Model server shut down cleanly.");
  return 0;
}
