#ifndef HTTP_RELOAD_CLIENT_HPP
#define HTTP_RELOAD_CLIENT_HPP

#include "serving/reload_target.hpp"

#include <chrono>
#include <string>

// Asks a running model server to reload through POST /model/reload.
// Used by the standalone monitor, which has no model of its own.
class HttpReloadClient : public IReloadTarget {
public:
  // reload_url like "http://localhost:8000/model/reload"; throws
  // std::invalid_argument when it is not an http(s) URL
  HttpReloadClient(const std::string &reload_url,
                   std::chrono::milliseconds timeout);

  bool reload() override;

  const std::string &get_base_url() const { return base_url_; }
  const std::string &get_path() const { return path_; }

private:
  std::string base_url_;
  std::string path_;
  std::chrono::milliseconds timeout_;
};

#endif // HTTP_RELOAD_CLIENT_HPP
