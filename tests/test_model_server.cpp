#include "core/errors.hpp"
#include "registry/in_memory_registry.hpp"
#include "serving/model_loader.hpp"
#include "serving/model_server.hpp"
#include "test_models.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// In-memory registry with a switchable outage on lookups
class FlakyRegistry : public InMemoryRegistry {
public:
  std::optional<ModelVersion> get_version_by_alias(const std::string &model_name,
                                                   Alias alias) override {
    if (down)
      throw RegistryUnavailableError("registry down");
    return InMemoryRegistry::get_version_by_alias(model_name, alias);
  }

  std::atomic<bool> down{false};
};

const std::vector<double> SETOSA = {5.1, 3.5, 1.4, 0.2};

} // namespace

class ModelServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("model_server_" + std::to_string(::getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    registry = std::make_shared<FlakyRegistry>();
    ArtifactLoaderConfig loader_config;
    loader_config.model_file_name = "model.json";
    auto loader = std::make_shared<ArtifactModelLoader>(loader_config);

    ModelServerConfig config;
    config.model_name = "iris";
    config.feature_count = 4;
    config.load_wait_timeout = std::chrono::milliseconds(200);
    server = std::make_unique<ModelServer>(registry, loader, config);
  }

  void TearDown() override { fs::remove_all(dir); }

  // Registers a constant model answering `label` and points production at it
  uint64_t promote_constant(int label, double accuracy) {
    std::string path = (dir / ("model-" + std::to_string(label) + ".json")).string();
    write_document(path, constant_document(label));
    RegistrationRequest request;
    request.artifact_uri = path;
    request.metric = accuracy;
    request.params["max_depth"] = "3";
    uint64_t version = registry->register_version("iris", request).version;
    registry->set_alias("iris", Alias::PRODUCTION, version);
    return version;
  }

  fs::path dir;
  std::shared_ptr<FlakyRegistry> registry;
  std::unique_ptr<ModelServer> server;
};

TEST_F(ModelServerTest, UnavailableUntilSomethingIsPromoted) {
  try {
    server->predict(SETOSA);
    FAIL() << "expected ModelUnavailableError";
  } catch (const ModelUnavailableError &e) {
    EXPECT_STREQ(e.what(), "Model not available. Please train the model first.");
  }
  EXPECT_FALSE(server->reload());
  EXPECT_EQ(server->snapshot(), nullptr);
}

TEST_F(ModelServerTest, LoadsLazilyOnFirstPrediction) {
  promote_constant(1, 0.9);
  EXPECT_EQ(server->snapshot(), nullptr);
  EXPECT_EQ(server->predict(SETOSA), 1);
  ASSERT_NE(server->snapshot(), nullptr);
  EXPECT_EQ(server->snapshot()->version.version, 1u);
}

TEST_F(ModelServerTest, PromotionIsPickedUpOnlyOnReload) {
  promote_constant(1, 0.9);
  EXPECT_EQ(server->predict(SETOSA), 1);

  promote_constant(2, 0.95);
  // Still serving the loaded model until told to reload
  EXPECT_EQ(server->predict(SETOSA), 1);

  EXPECT_TRUE(server->reload());
  EXPECT_EQ(server->predict(SETOSA), 2);
  EXPECT_EQ(server->snapshot()->version.version, 2u);

  // Same production version: nothing to swap, still a success
  auto before = server->snapshot();
  EXPECT_TRUE(server->reload());
  EXPECT_EQ(server->snapshot(), before);
}

TEST_F(ModelServerTest, FailedReloadKeepsServingPreviousModel) {
  promote_constant(1, 0.9);
  ASSERT_TRUE(server->reload());

  RegistrationRequest broken;
  broken.artifact_uri = (dir / "missing.json").string();
  broken.metric = 0.99;
  uint64_t v = registry->register_version("iris", broken).version;
  registry->set_alias("iris", Alias::PRODUCTION, v);

  EXPECT_FALSE(server->reload());
  EXPECT_EQ(server->predict(SETOSA), 1);

  registry->down = true;
  EXPECT_FALSE(server->reload());
  EXPECT_EQ(server->predict(SETOSA), 1);
}

TEST_F(ModelServerTest, FeatureCountMismatchIsNotServed) {
  std::string path = (dir / "narrow.json").string();
  write_document(path, {{"n_features", 2},
                        {"classes", {0}},
                        {"trees", {{{"nodes", {{{"value", {1.0}}}}}}}}});
  RegistrationRequest request;
  request.artifact_uri = path;
  request.metric = 0.9;
  registry->register_version("iris", request);
  registry->set_alias("iris", Alias::PRODUCTION, 1);

  EXPECT_FALSE(server->reload());
  EXPECT_THROW(server->predict(SETOSA), ModelUnavailableError);
}

TEST_F(ModelServerTest, WrongArityIsInvalidArgument) {
  promote_constant(1, 0.9);
  EXPECT_THROW(server->predict({1.0, 2.0}), std::invalid_argument);
}

TEST_F(ModelServerTest, PredictionsDuringReloadsSeeOldOrNewModel) {
  promote_constant(1, 0.9);
  promote_constant(2, 0.95);
  ASSERT_TRUE(server->reload());

  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};
  std::atomic<int> predictions{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop) {
        try {
          int label = server->predict(SETOSA);
          if (label != 1 && label != 2)
            ++failures;
          ++predictions;
        } catch (const std::exception &) {
          ++failures;
        }
      }
    });
  }

  for (int i = 0; i < 20; ++i) {
    registry->set_alias("iris", Alias::PRODUCTION, i % 2 == 0 ? 1 : 2);
    EXPECT_TRUE(server->reload());
  }
  stop = true;
  for (auto &t : readers)
    t.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_GT(predictions.load(), 0);
}

TEST_F(ModelServerTest, HealthReportsLoadState) {
  HealthStatus empty = server->health();
  EXPECT_FALSE(empty.model_loaded);
  EXPECT_FALSE(empty.model_available);
  EXPECT_FALSE(empty.model_version.has_value());
  EXPECT_EQ(empty.model_name, "iris");

  promote_constant(1, 0.9);
  // health() attempts the load itself
  HealthStatus loaded = server->health();
  EXPECT_TRUE(loaded.model_loaded);
  EXPECT_TRUE(loaded.model_available);
  ASSERT_TRUE(loaded.model_version.has_value());
  EXPECT_EQ(*loaded.model_version, 1u);

  registry->down = true;
  EXPECT_TRUE(server->health().model_loaded);
}

TEST_F(ModelServerTest, ModelInfoDescribesProduction) {
  ModelInfo none = server->model_info();
  EXPECT_FALSE(none.has_production);
  EXPECT_EQ(none.version_count, 0u);

  promote_constant(1, 0.9);
  promote_constant(2, 0.95);
  ModelInfo info = server->model_info();
  ASSERT_TRUE(info.has_production);
  EXPECT_EQ(info.production->version, 2u);
  EXPECT_DOUBLE_EQ(info.metrics.at("accuracy"), 0.95);
  EXPECT_EQ(info.params.at("max_depth"), "3");
  EXPECT_EQ(info.version_count, 2u);
  EXPECT_EQ(info.aliases.at("production"), 2u);
  EXPECT_FALSE(info.serving_version.has_value());

}

TEST_F(ModelServerTest, ModelInfoDegradesWhenRegistryIsDown) {
  promote_constant(1, 0.9);
  ASSERT_TRUE(server->reload());
  registry->down = true;

  ModelInfo info;
  ASSERT_NO_THROW(info = server->model_info());
  EXPECT_FALSE(info.registry_available);
  EXPECT_EQ(info.registry_error, "registry down");
  EXPECT_EQ(info.model_name, "iris");
  ASSERT_TRUE(info.serving_version.has_value());
  EXPECT_EQ(*info.serving_version, 1u);
  EXPECT_FALSE(info.has_production);
  EXPECT_TRUE(info.aliases.empty());
  EXPECT_EQ(info.version_count, 0u);
}
