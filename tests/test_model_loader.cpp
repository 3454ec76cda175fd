#include "core/errors.hpp"
#include "serving/model_loader.hpp"
#include "test_models.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

class ModelLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("model_loader_" + std::to_string(::getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir / "artifact");
    write_document((dir / "iris.json").string(), iris_tree_document());
    write_document((dir / "artifact" / "model.json").string(),
                   constant_document(7));
  }

  void TearDown() override { fs::remove_all(dir); }

  ArtifactLoaderConfig config() const {
    ArtifactLoaderConfig c;
    c.model_file_name = "model.json";
    c.artifact_cache_dir = (dir / "cache").string();
    c.timeout = std::chrono::milliseconds(1000);
    return c;
  }

  static ModelVersion version_at(const std::string &uri) {
    ModelVersion v;
    v.model_name = "iris";
    v.version = 1;
    v.artifact_uri = uri;
    return v;
  }

  fs::path dir;
};

TEST_F(ModelLoaderTest, LoadsLocalPathsAndFileUris) {
  ArtifactModelLoader loader(config());

  auto plain = loader.load(version_at((dir / "iris.json").string()));
  EXPECT_EQ(plain->predict({6.9, 3.1, 5.4, 2.1}), 2);

  auto uri = loader.load(version_at("file://" + (dir / "iris.json").string()));
  EXPECT_EQ(uri->predict({5.1, 3.5, 1.4, 0.2}), 0);

  // A directory resolves to the configured file inside it
  auto from_dir = loader.load(version_at((dir / "artifact").string()));
  EXPECT_EQ(from_dir->predict({0, 0, 0, 0}), 7);
}

TEST_F(ModelLoaderTest, UnresolvableArtifactsFail) {
  ArtifactModelLoader loader(config());
  EXPECT_THROW(loader.load(version_at("")), ModelLoadError);
  EXPECT_THROW(loader.load(version_at((dir / "missing.json").string())),
               ModelLoadError);
  EXPECT_THROW(loader.load(version_at("s3://bucket/model.onnx")), ModelLoadError);
  EXPECT_THROW(loader.load(version_at("runs:/abc/model")), ModelLoadError);

  write_document((dir / "model.bin").string(), iris_tree_document());
  EXPECT_THROW(loader.load(version_at((dir / "model.bin").string())),
               ModelLoadError);

  // mlflow-artifacts URIs need a tracking server
  EXPECT_THROW(loader.load(version_at("mlflow-artifacts:/1/abc/artifacts/model")),
               ModelLoadError);
}

TEST_F(ModelLoaderTest, DownloadsAndCachesTrackingServerArtifacts) {
  httplib::Server server;
  std::atomic<int> downloads{0};
  server.Get("/api/2.0/mlflow-artifacts/artifacts/1/abc/artifacts/model/model.json",
             [&downloads](const httplib::Request &, httplib::Response &res) {
               ++downloads;
               res.set_content(constant_document(5).dump(), "application/json");
             });
  int port = server.bind_to_any_port("127.0.0.1");
  std::thread thread([&server] { server.listen_after_bind(); });
  while (!server.is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

  ArtifactLoaderConfig c = config();
  c.tracking_uri = "http://127.0.0.1:" + std::to_string(port);
  ArtifactModelLoader loader(c);

  auto model = loader.load(version_at("mlflow-artifacts:/1/abc/artifacts/model"));
  EXPECT_EQ(model->predict({1, 2, 3, 4}), 5);
  EXPECT_TRUE(fs::exists(dir / "cache" / "1/abc/artifacts/model/model.json"));

  server.stop();
  thread.join();

  // Served from the cache once downloaded
  auto cached = loader.load(version_at("mlflow-artifacts:/1/abc/artifacts/model/"));
  EXPECT_EQ(cached->predict({1, 2, 3, 4}), 5);
  EXPECT_EQ(downloads.load(), 1);

  EXPECT_THROW(loader.resolve_local_path("mlflow-artifacts:/../etc/passwd"),
               ModelLoadError);
}

TEST_F(ModelLoaderTest, MissingRemoteArtifactFails) {
  httplib::Server server;
  int port = server.bind_to_any_port("127.0.0.1");
  std::thread thread([&server] { server.listen_after_bind(); });
  while (!server.is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

  ArtifactLoaderConfig c = config();
  c.tracking_uri = "http://127.0.0.1:" + std::to_string(port);
  ArtifactModelLoader loader(c);
  EXPECT_THROW(loader.load(version_at("mlflow-artifacts:/2/x/model.json")),
               ModelLoadError);

  server.stop();
  thread.join();
}
