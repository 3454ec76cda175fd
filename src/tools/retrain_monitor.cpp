#include "core/config.hpp"
#include "core/logger.hpp"
#include "retrain/http_reload_client.hpp"
#include "retrain/process_job_runner.hpp"
#include "retrain/retrain_coordinator.hpp"
#include "retrain/retrain_monitor.hpp"
#include "retrain/signal_file.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

namespace {

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --config <file>      Configuration file (default: config.ini)\n"
            << "  --request <reason>   Write the retrain signal and exit\n"
            << "  --once               Process at most one pending signal and exit\n"
            << "  --help               Show this message\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_file = "config.ini";
  std::string request_reason;
  bool request_mode = false;
  bool once = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--request" && i + 1 < argc) {
      request_mode = true;
      request_reason = argv[++i];
    } else if (arg == "--once") {
      once = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }

  Config::ConfigManager config_manager;
  config_manager.load_configuration(config_file);
  auto config = config_manager.get_config();
  LogManager::instance().configure(config->logging);

  if (request_mode) {
    if (!SignalFile::request(config->monitor.signal_file_path, request_reason)) {
      std::cerr << "Could not write signal file "
                << config->monitor.signal_file_path << std::endl;
      return 1;
    }
    std::cout << "Retrain requested via " << config->monitor.signal_file_path
              << std::endl;
    return 0;
  }

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  std::shared_ptr<HttpReloadClient> reload_client;
  try {
    reload_client = std::make_shared<HttpReloadClient>(
        config->monitor.reload_url,
        std::chrono::milliseconds(config->registry.request_timeout_ms));
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::RETRAIN_MONITOR,
        "Invalid reload URL: " << e.what());
    return 1;
  }

  ProcessJobConfig job_config;
  job_config.command_template = config->retrain.job_command;
  job_config.output_tail_bytes = config->retrain.output_tail_bytes;

  RetrainCoordinatorConfig coordinator_config;
  coordinator_config.service_name = config->retrain.service_name;
  coordinator_config.job_timeout =
      std::chrono::seconds(config->retrain.job_timeout_seconds);

  auto coordinator = std::make_shared<RetrainCoordinator>(
      std::make_shared<ProcessJobRunner>(job_config), reload_client,
      coordinator_config);

  RetrainMonitor monitor(
      config->monitor.signal_file_path, coordinator,
      std::chrono::seconds(config->monitor.poll_interval_seconds));

  if (once) {
    bool processed = monitor.poll_once();
    coordinator->shutdown();
    return processed ? 0 : 3;
  }

  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Starting retraining monitor service...");
  monitor.start();
  while (!g_shutdown_requested)
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Shutting down retraining monitor...");
  monitor.stop();
  coordinator->shutdown();
  return 0;
}
