#include "mongo_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <exception>
#include <memory>
#include <mongocxx/exception/exception.hpp>

namespace {

std::string with_timeout_option(const std::string &uri, unsigned timeout_ms) {
  if (uri.find("serverSelectionTimeoutMS") != std::string::npos)
    return uri;
  std::string option = "serverSelectionTimeoutMS=" + std::to_string(timeout_ms);
  if (uri.find('?') != std::string::npos)
    return uri + "&" + option;
  // "mongodb://host:port" needs the path separator before the options
  size_t scheme_end = uri.find("://");
  size_t path_start = scheme_end == std::string::npos
                          ? std::string::npos
                          : uri.find('/', scheme_end + 3);
  return uri + (path_start == std::string::npos ? "/?" : "?") + option;
}

} // namespace

mongocxx::instance &MongoManager::driver_instance() {
  // The driver must be initialised exactly once per process
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const std::string &uri,
                           unsigned server_selection_timeout_ms) {
  driver_instance();
  try {
    mongocxx::uri mongo_uri(with_timeout_option(uri, server_selection_timeout_ms));
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
    LOG(LogLevel::INFO, LogComponent::REGISTRY,
        "MongoDB connection pool initialized for URI: " << uri);
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "Could not initialize MongoDB connection pool. Error: " << e.what());
    pool_ = nullptr;
  }
}

mongocxx::pool::entry MongoManager::get_client() {
  if (!pool_) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "MongoDB pool is not initialized.");
    throw RegistryUnavailableError("MongoDB pool is not initialized.");
  }
  return pool_->acquire();
}

bool MongoManager::ping() {
  if (!pool_) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "MongoDB pool is not initialized.");
    return false;
  }
  try {
    auto client = pool_->acquire();

    bsoncxx::builder::basic::document doc_builder{};
    doc_builder.append(bsoncxx::builder::basic::kvp("ping", 1));

    // The "ping" command is a lightweight way to check server status
    (*client)["admin"].run_command(doc_builder.view());

    LOG(LogLevel::TRACE, LogComponent::REGISTRY,
        "MongoDB server is reachable and responsive.");

    return true;
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::WARN, LogComponent::REGISTRY,
        "MongoDB server is unreachable. Error: " << e.what());
    return false;
  }
}
