#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <string>

// Owns the process-wide driver instance and a connection pool
class MongoManager {
public:
  // server_selection_timeout_ms bounds how long an operation waits for a
  // reachable server before the driver gives up
  MongoManager(const std::string &uri, unsigned server_selection_timeout_ms);

  // Throws RegistryUnavailableError when the pool could not be created
  mongocxx::pool::entry get_client();
  bool ping();

private:
  static mongocxx::instance &driver_instance();
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
