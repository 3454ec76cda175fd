#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "retrain/retrain_coordinator.hpp"
#include "serving/model_server.hpp"
#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class WebServer {
public:
  WebServer(const Config::ServingConfig &serving_config,
            const Config::MetricsConfig &metrics_config,
            ModelServer &model_server, RetrainCoordinator &coordinator);
  ~WebServer();

  // Binds and starts serving on a background thread. Port 0 picks a free
  // port. Returns false when the address could not be bound.
  bool start();
  void stop();

  int get_port() const { return port_; }
  bool is_running() const { return running_.load(); }

private:
  void run();

  void handle_predict(const httplib::Request &req, httplib::Response &res);
  void handle_health(const httplib::Request &req, httplib::Response &res);
  void handle_model_info(const httplib::Request &req, httplib::Response &res);
  void handle_retrain(const httplib::Request &req, httplib::Response &res);
  void handle_reload(const httplib::Request &req, httplib::Response &res);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::string host_;
  int port_;
  std::vector<std::string> feature_names_;
  ModelServer &model_server_;
  RetrainCoordinator &coordinator_;
};

#endif // WEB_SERVER_HPP
