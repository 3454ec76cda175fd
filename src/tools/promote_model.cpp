#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "promotion/promotion_engine.hpp"
#include "registry/registry_factory.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <exception>
#include <iostream>
#include <string>

// Registers a trained artifact and applies the promotion rule.
// Exit codes: 0 registered (promoted or not), 1 registry failure, 2 usage.

namespace {

void print_usage(const char *program) {
  std::cout
      << "Usage: " << program << " --artifact <uri> --metric <value> [options]\n"
      << "  --config <file>        Configuration file (default: config.ini)\n"
      << "  --model-name <name>    Registered model (default from config)\n"
      << "  --run-id <id>          Training run that produced the artifact\n"
      << "  --description <text>   Version description\n"
      << "  --param <key=value>    Training parameter, repeatable\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_file = "config.ini";
  std::string model_name;
  RegistrationRequest request;
  bool have_artifact = false;
  bool have_metric = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--config" && has_value) {
      config_file = argv[++i];
    } else if (arg == "--model-name" && has_value) {
      model_name = argv[++i];
    } else if (arg == "--artifact" && has_value) {
      request.artifact_uri = argv[++i];
      have_artifact = !request.artifact_uri.empty();
    } else if (arg == "--metric" && has_value) {
      auto value = Utils::string_to_number<double>(argv[++i]);
      if (!value) {
        std::cerr << "Invalid metric value: " << argv[i] << std::endl;
        return 2;
      }
      request.metric = *value;
      have_metric = true;
    } else if (arg == "--run-id" && has_value) {
      request.run_id = argv[++i];
    } else if (arg == "--description" && has_value) {
      request.description = argv[++i];
    } else if (arg == "--param" && has_value) {
      std::string pair = argv[++i];
      size_t eq = pair.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "Parameters must look like key=value: " << pair
                  << std::endl;
        return 2;
      }
      request.params[pair.substr(0, eq)] = pair.substr(eq + 1);
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }

  if (!have_artifact || !have_metric) {
    print_usage(argv[0]);
    return 2;
  }

  Config::ConfigManager config_manager;
  config_manager.load_configuration(config_file);
  auto config = config_manager.get_config();
  LogManager::instance().configure(config->logging);

  if (model_name.empty())
    model_name = config->model_name;
  request.metric_name = config->registry.metric_name;

  try {
    auto registry = make_registry_client(config->registry);
    PromotionEngine engine(registry, config->registry.metric_name);
    PromotionOutcome outcome = engine.register_and_decide(model_name, request);
    std::cout << JsonFormatter::promotion_to_json_object(model_name, outcome)
                     .dump(2)
              << std::endl;
    return 0;
  } catch (const RegistryError &e) {
    LOG(LogLevel::ERROR, LogComponent::PROMOTION,
        "Registration failed: " << e.what());
    std::cerr << "Registration failed: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 2;
  }
}
