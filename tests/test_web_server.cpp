#include "core/config.hpp"
#include "core/errors.hpp"
#include "io/web/web_server.hpp"
#include "registry/in_memory_registry.hpp"
#include "retrain/retrain_coordinator.hpp"
#include "serving/model_loader.hpp"
#include "serving/model_server.hpp"
#include "test_models.hpp"
#include "test_retrain_fakes.hpp"

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char *SETOSA_BODY = R"({"sepal_length": 5.1, "sepal_width": 3.5,
                              "petal_length": 1.4, "petal_width": 0.2})";
const char *VIRGINICA_BODY = R"({"sepal_length": 6.9, "sepal_width": 3.1,
                                 "petal_length": 5.4, "petal_width": 2.1})";

// Registry whose alias table lookups fail while `down` is set
class OutageRegistry : public InMemoryRegistry {
public:
  std::map<std::string, uint64_t>
  get_aliases(const std::string &model_name) override {
    if (down)
      throw RegistryUnavailableError("connection refused");
    return InMemoryRegistry::get_aliases(model_name);
  }

  std::atomic<bool> down{false};
};

} // namespace

class WebServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("web_server_" + std::to_string(::getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    registry = std::make_shared<OutageRegistry>();
    ArtifactLoaderConfig loader_config;
    loader_config.model_file_name = "model.json";
    ModelServerConfig server_config;
    server_config.model_name = "iris";
    server_config.feature_count = 4;
    model_server = std::make_shared<ModelServer>(
        registry, std::make_shared<ArtifactModelLoader>(loader_config),
        server_config);

    runner = std::make_shared<FakeJobRunner>();
    coordinator = std::make_shared<RetrainCoordinator>(
        runner, model_server, RetrainCoordinatorConfig{});

    Config::ServingConfig serving;
    serving.host = "127.0.0.1";
    serving.port = 0;
    serving.worker_threads = 4;
    Config::MetricsConfig metrics;

    web = std::make_unique<WebServer>(serving, metrics, *model_server,
                                      *coordinator);
    ASSERT_TRUE(web->start());
    ASSERT_GT(web->get_port(), 0);
    client = std::make_unique<httplib::Client>("127.0.0.1", web->get_port());
    client->set_read_timeout(5, 0);
  }

  void TearDown() override {
    web->stop();
    runner->release();
    coordinator->shutdown();
    fs::remove_all(dir);
  }

  void promote_iris() {
    std::string path = (dir / "iris.json").string();
    write_document(path, iris_tree_document());
    RegistrationRequest request;
    request.artifact_uri = path;
    request.metric = 0.96;
    uint64_t v = registry->register_version("iris", request).version;
    registry->set_alias("iris", Alias::PRODUCTION, v);
  }

  fs::path dir;
  std::shared_ptr<OutageRegistry> registry;
  std::shared_ptr<ModelServer> model_server;
  std::shared_ptr<FakeJobRunner> runner;
  std::shared_ptr<RetrainCoordinator> coordinator;
  std::unique_ptr<WebServer> web;
  std::unique_ptr<httplib::Client> client;
};

TEST_F(WebServerTest, PredictWithoutModelIs503) {
  auto res = client->Post("/predict", SETOSA_BODY, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 503);
  EXPECT_EQ(json::parse(res->body)["detail"],
            "Model not available. Please train the model first.");
}

TEST_F(WebServerTest, PredictReturnsClassLabel) {
  promote_iris();
  auto res = client->Post("/predict", SETOSA_BODY, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(json::parse(res->body)["prediction"], 0);

  res = client->Post("/predict", VIRGINICA_BODY, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(json::parse(res->body)["prediction"], 2);
}

TEST_F(WebServerTest, PredictValidatesBody) {
  promote_iris();
  auto bad_json = client->Post("/predict", "{not json", "application/json");
  ASSERT_TRUE(bad_json);
  EXPECT_EQ(bad_json->status, 400);

  auto missing = client->Post("/predict", R"({"sepal_length": 5.1})",
                              "application/json");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 422);

  auto wrong_type = client->Post(
      "/predict",
      R"({"sepal_length": "long", "sepal_width": 3.5, "petal_length": 1.4, "petal_width": 0.2})",
      "application/json");
  ASSERT_TRUE(wrong_type);
  EXPECT_EQ(wrong_type->status, 422);
}

TEST_F(WebServerTest, HealthIsAlwaysOk) {
  auto res = client->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_FALSE(body["model_loaded"].get<bool>());
  EXPECT_TRUE(body["model_version"].is_null());

  promote_iris();
  body = json::parse(client->Get("/health")->body);
  EXPECT_TRUE(body["model_loaded"].get<bool>());
  EXPECT_EQ(body["model_version"], 1);
}

TEST_F(WebServerTest, ModelInfo) {
  auto res = client->Get("/model/info");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(json::parse(res->body)["status"], "no_production_model");

  promote_iris();
  json body = json::parse(client->Get("/model/info")->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["production"]["version"], 1);
  EXPECT_DOUBLE_EQ(body["metrics"]["accuracy"].get<double>(), 0.96);
  EXPECT_EQ(body["aliases"]["production"], 1);
}

TEST_F(WebServerTest, ModelInfoReportsPartialStateWhenRegistryIsDown) {
  promote_iris();
  ASSERT_TRUE(model_server->reload());
  registry->down = true;

  auto res = client->Get("/model/info");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["status"], "registry_unavailable");
  EXPECT_EQ(body["model_name"], "iris");
  EXPECT_EQ(body["serving_version"], 1);
  EXPECT_NE(body["message"].get<std::string>().find("connection refused"),
            std::string::npos);
  EXPECT_FALSE(body.contains("production"));

  registry->down = false;
  EXPECT_EQ(json::parse(client->Get("/model/info")->body)["status"], "ok");
}

TEST_F(WebServerTest, RetrainIsAcceptedInTheBackground) {
  runner->hold();
  auto res = client->Post("/retrain", "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  json body = json::parse(res->body);
  EXPECT_EQ(body["status"], "retraining_started");
  EXPECT_EQ(body["message"],
            "Model retraining has been started in the background. The new "
            "model will be used for predictions once training is complete.");

  ASSERT_TRUE(wait_until([&] { return runner->calls.load() == 1; }));
  // The server keeps answering while the job runs
  EXPECT_EQ(client->Get("/health")->status, 200);
  runner->release();
  ASSERT_TRUE(wait_until([&] { return coordinator->completed_runs() == 1; }));
}

TEST_F(WebServerTest, ReloadEndpointSwapsModel) {
  auto res = client->Post("/model/reload", "", "application/json");
  ASSERT_TRUE(res);
  json body = json::parse(res->body);
  EXPECT_FALSE(body["reloaded"].get<bool>());
  EXPECT_TRUE(body["model_version"].is_null());

  promote_iris();
  body = json::parse(client->Post("/model/reload", "", "application/json")->body);
  EXPECT_TRUE(body["reloaded"].get<bool>());
  EXPECT_EQ(body["model_version"], 1);
}

TEST_F(WebServerTest, MetricsAreExposed) {
  promote_iris();
  client->Post("/predict", SETOSA_BODY, "application/json");

  auto res = client->Get("/metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_NE(res->body.find("prediction_requests"), std::string::npos);
}
