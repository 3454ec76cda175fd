#ifndef ONNX_CLASSIFIER_HPP
#define ONNX_CLASSIFIER_HPP

#include "serving/classifier_model.hpp"

#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

// Classifier exported to ONNX (e.g. scikit-learn through skl2onnx): one float
// input of shape [None, n_features], first output holds the int64 label.
class ONNXClassifier : public IClassifierModel {
public:
  // Throws ModelLoadError when the file cannot be loaded or has the wrong
  // signature
  explicit ONNXClassifier(const std::string &model_path);
  ~ONNXClassifier() override;

  int predict(const std::vector<double> &features) const override;
  size_t feature_count() const override { return feature_count_; }
  const char *get_kind() const override { return "onnx"; }

private:
  static Ort::Env &ort_env();

  // Ort::Session::Run is thread-safe but not const-qualified
  mutable Ort::Session session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::vector<const char *> input_node_names_;
  std::vector<const char *> output_node_names_;
  std::vector<std::string> owned_input_names_;
  std::vector<std::string> owned_output_names_;
  size_t feature_count_ = 0;
};

#endif // ONNX_CLASSIFIER_HPP
