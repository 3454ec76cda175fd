#include "retrain/http_reload_client.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

HttpReloadClient::HttpReloadClient(const std::string &reload_url,
                                   std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  if (!Utils::starts_with(reload_url, "http://") &&
      !Utils::starts_with(reload_url, "https://"))
    throw std::invalid_argument("Reload URL must be http(s): " + reload_url);

  size_t host_start = reload_url.find("://") + 3;
  size_t path_start = reload_url.find('/', host_start);
  if (path_start == std::string::npos) {
    base_url_ = reload_url;
    path_ = "/model/reload";
  } else {
    base_url_ = reload_url.substr(0, path_start);
    path_ = reload_url.substr(path_start);
  }
  if (base_url_.size() <= host_start)
    throw std::invalid_argument("Reload URL has no host: " + reload_url);
}

bool HttpReloadClient::reload() {
  httplib::Client client(base_url_);
  client.set_connection_timeout(timeout_.count() / 1000,
                                timeout_.count() % 1000 * 1000);
  client.set_read_timeout(timeout_.count() / 1000,
                          timeout_.count() % 1000 * 1000);

  auto res = client.Post(path_, "", "application/json");
  if (!res) {
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
        "Reload request to " << base_url_ << path_
                             << " failed: " << httplib::to_string(res.error()));
    return false;
  }
  if (res->status != 200) {
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
        "Reload request returned HTTP " << res->status);
    return false;
  }

  auto body = nlohmann::json::parse(res->body, nullptr, false);
  bool reloaded = !body.is_discarded() && body.is_object() &&
                  body.contains("reloaded") && body["reloaded"].is_boolean() &&
                  body["reloaded"].get<bool>();
  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Model server answered reload with reloaded=" << std::boolalpha
                                                    << reloaded);
  return reloaded;
}
