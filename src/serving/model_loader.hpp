#ifndef MODEL_LOADER_HPP
#define MODEL_LOADER_HPP

#include "registry/model_version.hpp"
#include "serving/classifier_model.hpp"

#include <chrono>
#include <memory>
#include <string>

// Turns a registered version into a ready-to-serve model
class IModelLoader {
public:
  virtual ~IModelLoader() = default;

  // Throws ModelLoadError when the artifact cannot be resolved or parsed
  virtual std::shared_ptr<const IClassifierModel>
  load(const ModelVersion &version) = 0;
};

struct ArtifactLoaderConfig {
  std::string model_file_name = "model.onnx";
  std::string artifact_cache_dir = "data/artifacts";
  // Tracking server that serves mlflow-artifacts:/ URIs
  std::string tracking_uri;
  std::chrono::milliseconds timeout{5000};
};

// Loads artifacts from local paths, file:// URIs and mlflow-artifacts:/ URIs
// (downloaded into the cache directory first). The file extension picks the
// model kind: .onnx or .json (tree ensemble).
class ArtifactModelLoader : public IModelLoader {
public:
  explicit ArtifactModelLoader(ArtifactLoaderConfig config);

  std::shared_ptr<const IClassifierModel>
  load(const ModelVersion &version) override;

  // Local file that holds the artifact, downloading it when needed
  std::string resolve_local_path(const std::string &artifact_uri);

private:
  std::string download_artifact(const std::string &artifact_path);

  ArtifactLoaderConfig config_;
};

#endif // MODEL_LOADER_HPP
