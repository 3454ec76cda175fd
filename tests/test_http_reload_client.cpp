#include "retrain/http_reload_client.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

// Model server stand-in answering POST /model/reload with a canned body
class FakeReloadEndpoint {
public:
  FakeReloadEndpoint() {
    server_.Post("/model/reload",
                 [this](const httplib::Request &, httplib::Response &res) {
                   ++requests;
                   std::lock_guard<std::mutex> lock(mutex_);
                   res.status = status_;
                   res.set_content(body_, "application/json");
                 });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    while (!server_.is_running())
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  ~FakeReloadEndpoint() {
    server_.stop();
    thread_.join();
  }

  void answer(int status, const std::string &body) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    body_ = body;
  }

  std::string reload_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/model/reload";
  }

  std::atomic<int> requests{0};

private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
  std::mutex mutex_;
  int status_ = 200;
  std::string body_ = R"({"reloaded": true, "model_version": 1})";
};

} // namespace

TEST(HttpReloadClientTest, SplitsReloadUrl) {
  HttpReloadClient client("http://model-server:8000/model/reload",
                          std::chrono::milliseconds(500));
  EXPECT_EQ(client.get_base_url(), "http://model-server:8000");
  EXPECT_EQ(client.get_path(), "/model/reload");

  HttpReloadClient bare("http://model-server:8000",
                        std::chrono::milliseconds(500));
  EXPECT_EQ(bare.get_path(), "/model/reload");

  EXPECT_THROW(HttpReloadClient("model-server:8000", std::chrono::milliseconds(500)),
               std::invalid_argument);
}

TEST(HttpReloadClientTest, ReportsServerAnswer) {
  FakeReloadEndpoint endpoint;
  HttpReloadClient client(endpoint.reload_url(), std::chrono::milliseconds(2000));

  EXPECT_TRUE(client.reload());

  endpoint.answer(200, R"({"reloaded": false, "model_version": null})");
  EXPECT_FALSE(client.reload());

  endpoint.answer(500, R"({"detail": "boom"})");
  EXPECT_FALSE(client.reload());
  EXPECT_EQ(endpoint.requests.load(), 3);
}

TEST(HttpReloadClientTest, MalformedReloadedFieldIsNotSuccess) {
  FakeReloadEndpoint endpoint;
  HttpReloadClient client(endpoint.reload_url(), std::chrono::milliseconds(2000));

  endpoint.answer(200, R"({"reloaded": "yes"})");
  bool reloaded = true;
  ASSERT_NO_THROW(reloaded = client.reload());
  EXPECT_FALSE(reloaded);

  endpoint.answer(200, R"({"reloaded": 1})");
  ASSERT_NO_THROW(reloaded = client.reload());
  EXPECT_FALSE(reloaded);

  endpoint.answer(200, "not json");
  ASSERT_NO_THROW(reloaded = client.reload());
  EXPECT_FALSE(reloaded);
}

TEST(HttpReloadClientTest, UnreachableServerIsNotSuccess) {
  HttpReloadClient client("http://127.0.0.1:1/model/reload",
                          std::chrono::milliseconds(300));
  EXPECT_FALSE(client.reload());
}
