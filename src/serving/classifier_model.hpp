#ifndef CLASSIFIER_MODEL_HPP
#define CLASSIFIER_MODEL_HPP

#include <cstddef>
#include <vector>

// Abstract base class for all served classification models.
// predict() is const and must be safe to call from many threads at once.
class IClassifierModel {
public:
  virtual ~IClassifierModel() = default;

  // Returns the predicted class label. Throws std::invalid_argument when the
  // feature vector does not have feature_count() entries.
  virtual int predict(const std::vector<double> &features) const = 0;

  virtual size_t feature_count() const = 0;

  // Short name of the artifact format, for logs and model info
  virtual const char *get_kind() const = 0;
};

#endif // CLASSIFIER_MODEL_HPP
