#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/json_formatter.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

constexpr const char *JSON_CONTENT_TYPE = "application/json";

void send_json(httplib::Response &res, int status, const nlohmann::json &j) {
  res.status = status;
  res.set_content(j.dump(2), JSON_CONTENT_TYPE);
}

void send_detail(httplib::Response &res, int status, const std::string &detail) {
  send_json(res, status, nlohmann::json{{"detail", detail}});
}

} // namespace

WebServer::WebServer(const Config::ServingConfig &serving_config,
                     const Config::MetricsConfig &metrics_config,
                     ModelServer &model_server, RetrainCoordinator &coordinator)
    : host_(serving_config.host), port_(serving_config.port),
      feature_names_(serving_config.feature_names),
      model_server_(model_server), coordinator_(coordinator) {
  server_ = std::make_unique<httplib::Server>();

  const size_t worker_threads =
      serving_config.worker_threads > 0 ? serving_config.worker_threads : 1;
  server_->new_task_queue = [worker_threads] {
    return new httplib::ThreadPool(worker_threads);
  };

  server_->set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_HTTP,
        req.method << " " << req.path << " from " << req.remote_addr << " -> "
                   << res.status);
  });

  server_->Post("/predict",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_predict(req, res);
                });
  server_->Get("/health",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_health(req, res);
               });
  server_->Get("/model/info",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_model_info(req, res);
               });
  server_->Post("/retrain",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_retrain(req, res);
                });
  server_->Post("/model/reload",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_reload(req, res);
                });

  if (metrics_config.enabled) {
    server_->Get(metrics_config.path, [](const httplib::Request &req,
                                         httplib::Response &res) {
      LOG(LogLevel::DEBUG, LogComponent::IO_HTTP,
          "WebServer: Received request for metrics from " << req.remote_addr);
      res.set_content(MetricsRegistry::instance().serialize_text(),
                      "text/plain; version=0.0.4");
    });
  }

  LOG(LogLevel::INFO, LogComponent::IO_HTTP,
      "Web server initialized for " << host_ << ":" << port_ << " with "
                                    << worker_threads << " worker threads");
}

WebServer::~WebServer() { stop(); }

bool WebServer::start() {
  if (server_thread_.joinable())
    return true; // Already running

  if (port_ == 0) {
    int bound = server_->bind_to_any_port(host_.c_str());
    if (bound <= 0) {
      LOG(LogLevel::FATAL, LogComponent::IO_HTTP,
          "Web server failed to bind any port on " << host_);
      return false;
    }
    port_ = bound;
  } else if (!server_->bind_to_port(host_.c_str(), port_)) {
    LOG(LogLevel::FATAL, LogComponent::IO_HTTP,
        "Web server failed to bind " << host_ << ":" << port_);
    return false;
  }

  running_ = true;
  server_thread_ = std::thread(&WebServer::run, this);
  return true;
}

void WebServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    LOG(LogLevel::INFO, LogComponent::IO_HTTP, "Web server stopping...");
    server_thread_.join();
  }
  running_ = false;
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_HTTP,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen_after_bind()) {
    LOG(LogLevel::ERROR, LogComponent::IO_HTTP,
        "Web server on " << host_ << ":" << port_ << " stopped unexpectedly");
  }
  running_ = false;
}

void WebServer::handle_predict(const httplib::Request &req,
                               httplib::Response &res) {
  nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded()) {
    send_detail(res, 400, "Request body is not valid JSON");
    return;
  }
  if (!body.is_object()) {
    send_detail(res, 422, "Request body must be a JSON object");
    return;
  }

  std::vector<double> features;
  features.reserve(feature_names_.size());
  for (const auto &name : feature_names_) {
    auto it = body.find(name);
    if (it == body.end()) {
      send_detail(res, 422, "Missing field '" + name + "'");
      return;
    }
    if (!it->is_number()) {
      send_detail(res, 422, "Field '" + name + "' must be a number");
      return;
    }
    features.push_back(it->get<double>());
  }

  try {
    int label = model_server_.predict(features);
    send_json(res, 200, nlohmann::json{{"prediction", label}});
  } catch (const ModelUnavailableError &e) {
    send_detail(res, 503, e.what());
  } catch (const std::invalid_argument &e) {
    send_detail(res, 422, e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_HTTP,
        "Prediction failed: " << e.what());
    send_detail(res, 500, std::string("Prediction failed: ") + e.what());
  }
}

void WebServer::handle_health(const httplib::Request &, httplib::Response &res) {
  send_json(res, 200,
            JsonFormatter::health_to_json_object(model_server_.health()));
}

void WebServer::handle_model_info(const httplib::Request &,
                                  httplib::Response &res) {
  send_json(res, 200, JsonFormatter::model_info_to_json_object(
                          model_server_.model_info()));
}

void WebServer::handle_retrain(const httplib::Request &req,
                               httplib::Response &res) {
  LifecycleMetrics::instance().retrain_requests.Increment();

  RetrainRequest request;
  request.source = "http";
  request.reason = "Requested over HTTP from " + req.remote_addr;

  SubmitStatus status = coordinator_.submit(std::move(request));
  if (status == SubmitStatus::REJECTED) {
    send_detail(res, 503, "Service is shutting down");
    return;
  }

  send_json(res, 202,
            nlohmann::json{
                {"status", "retraining_started"},
                {"message",
                 "Model retraining has been started in the background. The "
                 "new model will be used for predictions once training is "
                 "complete."},
                {"request", submit_status_to_string(status)}});
}

void WebServer::handle_reload(const httplib::Request &, httplib::Response &res) {
  bool reloaded = model_server_.reload();
  nlohmann::json j;
  j["reloaded"] = reloaded;
  auto snapshot = model_server_.snapshot();
  j["model_version"] = snapshot ? nlohmann::json(snapshot->version.version)
                                : nlohmann::json(nullptr);
  send_json(res, 200, j);
}
