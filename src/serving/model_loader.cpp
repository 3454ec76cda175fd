#include "serving/model_loader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "serving/onnx_classifier.hpp"
#include "serving/tree_ensemble_classifier.hpp"
#include "utils/utils.hpp"

#include <filesystem>
#include <fstream>
#include <httplib.h>

namespace fs = std::filesystem;

namespace {

constexpr const char *FILE_SCHEME = "file://";
constexpr const char *MLFLOW_ARTIFACTS_SCHEME = "mlflow-artifacts:";

bool has_model_extension(const std::string &path) {
  std::string ext = Utils::to_lower_copy(fs::path(path).extension().string());
  return ext == ".onnx" || ext == ".json";
}

} // namespace

ArtifactModelLoader::ArtifactModelLoader(ArtifactLoaderConfig config)
    : config_(std::move(config)) {}

std::string ArtifactModelLoader::download_artifact(const std::string &artifact_path) {
  if (config_.tracking_uri.empty())
    throw ModelLoadError("No tracking URI configured to fetch " +
                         artifact_path);

  fs::path cached = fs::path(config_.artifact_cache_dir) / artifact_path;
  std::error_code ec;
  // A given artifact path never changes content once logged
  if (fs::is_regular_file(cached, ec) && fs::file_size(cached, ec) > 0)
    return cached.string();

  httplib::Client client(config_.tracking_uri);
  client.set_connection_timeout(config_.timeout.count() / 1000,
                                config_.timeout.count() % 1000 * 1000);
  client.set_read_timeout(config_.timeout.count() / 1000,
                          config_.timeout.count() % 1000 * 1000);
  client.set_follow_location(true);

  std::string url = "/api/2.0/mlflow-artifacts/artifacts/" + artifact_path;
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Downloading artifact " << config_.tracking_uri << url);
  auto res = client.Get(url);
  if (!res)
    throw ModelLoadError("Artifact download failed: " +
                         httplib::to_string(res.error()));
  if (res->status != 200)
    throw ModelLoadError("Artifact download returned HTTP " +
                         std::to_string(res->status) + " for " + artifact_path);

  fs::create_directories(cached.parent_path(), ec);
  if (ec)
    throw ModelLoadError("Cannot create cache directory " +
                         cached.parent_path().string() + ": " + ec.message());

  fs::path tmp = cached;
  tmp += ".part";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      throw ModelLoadError("Cannot write " + tmp.string());
    out.write(res->body.data(), static_cast<std::streamsize>(res->body.size()));
    if (!out)
      throw ModelLoadError("Short write to " + tmp.string());
  }
  fs::rename(tmp, cached, ec);
  if (ec)
    throw ModelLoadError("Cannot move artifact into cache: " + ec.message());
  return cached.string();
}

std::string ArtifactModelLoader::resolve_local_path(const std::string &artifact_uri) {
  if (artifact_uri.empty())
    throw ModelLoadError("Version has no artifact URI");

  if (Utils::starts_with(artifact_uri, MLFLOW_ARTIFACTS_SCHEME)) {
    std::string path =
        artifact_uri.substr(std::string(MLFLOW_ARTIFACTS_SCHEME).size());
    while (!path.empty() && path.front() == '/')
      path.erase(0, 1);
    while (!path.empty() && path.back() == '/')
      path.pop_back();
    if (path.empty() || path.find("..") != std::string::npos)
      throw ModelLoadError("Invalid artifact URI " + artifact_uri);
    if (!has_model_extension(path))
      path += "/" + config_.model_file_name;
    return download_artifact(path);
  }

  std::string local = artifact_uri;
  if (Utils::starts_with(local, FILE_SCHEME))
    local = local.substr(std::string(FILE_SCHEME).size());
  else if (local.find("://") != std::string::npos ||
           Utils::starts_with(local, "runs:/"))
    throw ModelLoadError("Unsupported artifact URI scheme: " + artifact_uri);

  std::error_code ec;
  if (fs::is_directory(local, ec))
    local = (fs::path(local) / config_.model_file_name).string();
  if (!fs::is_regular_file(local, ec))
    throw ModelLoadError("Model artifact not found: " + local);
  return local;
}

std::shared_ptr<const IClassifierModel>
ArtifactModelLoader::load(const ModelVersion &version) {
  std::string path = resolve_local_path(version.artifact_uri);
  std::string ext = Utils::to_lower_copy(fs::path(path).extension().string());

  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Loading " << version.model_name << " v" << version.version << " from "
                 << path);

  if (ext == ".onnx")
    return std::make_shared<ONNXClassifier>(path);
  if (ext == ".json")
    return TreeEnsembleClassifier::from_file(path);
  throw ModelLoadError("Unknown model format '" + ext + "' for " + path);
}
