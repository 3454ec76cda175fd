#include "serving/onnx_classifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <array>
#include <stdexcept>

namespace {

Ort::SessionOptions make_session_options() {
  Ort::SessionOptions options;
  // Requests are already parallel across HTTP workers
  options.SetIntraOpNumThreads(1);
  return options;
}

} // namespace

Ort::Env &ONNXClassifier::ort_env() {
  static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "model-lifecycle-onnx");
  return env;
}

ONNXClassifier::ONNXClassifier(const std::string &model_path) try
    : session_(ort_env(), model_path.c_str(), make_session_options()) {

  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loading ONNX classifier from: " << model_path);

  if (session_.GetInputCount() != 1)
    throw std::runtime_error("Model must have exactly one input node.");

  owned_input_names_.push_back(
      session_.GetInputNameAllocated(0, allocator_).get());
  input_node_names_.push_back(owned_input_names_.back().c_str());

  Ort::TypeInfo type_info = session_.GetInputTypeInfo(0);
  auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> input_dims = tensor_info.GetShape();
  if (input_dims.size() != 2 || input_dims[1] <= 0)
    throw std::runtime_error(
        "Model input must be a 2D tensor of shape [None, num_features].");
  if (tensor_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)
    throw std::runtime_error("Model input must be a float tensor.");
  feature_count_ = static_cast<size_t>(input_dims[1]);

  // Only the label output is needed; probabilities are ignored
  if (session_.GetOutputCount() < 1)
    throw std::runtime_error("Model has no outputs.");
  owned_output_names_.push_back(
      session_.GetOutputNameAllocated(0, allocator_).get());
  output_node_names_.push_back(owned_output_names_.back().c_str());

  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "ONNX input '" << input_node_names_[0] << "' expects " << feature_count_
                     << " features, label output '" << output_node_names_[0]
                     << "'");

} catch (const Ort::Exception &e) {
  throw ModelLoadError("ONNX Runtime could not load " + model_path + ": " +
                       e.what());
} catch (const std::runtime_error &e) {
  throw ModelLoadError("Invalid ONNX classifier " + model_path + ": " +
                       e.what());
}

ONNXClassifier::~ONNXClassifier() = default;

int ONNXClassifier::predict(const std::vector<double> &features) const {
  if (features.size() != feature_count_)
    throw std::invalid_argument(
        "Expected " + std::to_string(feature_count_) + " features, got " +
        std::to_string(features.size()));

  std::vector<float> float_features(features.begin(), features.end());
  std::array<int64_t, 2> shape{1, static_cast<int64_t>(feature_count_)};

  Ort::MemoryInfo memory_info =
      Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      memory_info, float_features.data(), float_features.size(), shape.data(),
      shape.size());

  std::vector<Ort::Value> output_tensors = session_.Run(
      Ort::RunOptions{nullptr}, input_node_names_.data(), &input_tensor, 1,
      output_node_names_.data(), output_node_names_.size());

  LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
      "ONNX session Run() completed.");

  const Ort::Value &label = output_tensors.at(0);
  switch (label.GetTensorTypeAndShapeInfo().GetElementType()) {
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
    return static_cast<int>(label.GetTensorData<int64_t>()[0]);
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
    return label.GetTensorData<int32_t>()[0];
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    return static_cast<int>(label.GetTensorData<float>()[0]);
  default:
    throw std::runtime_error("Unsupported ONNX label output type");
  }
}
