#ifndef SERVING_STATE_HPP
#define SERVING_STATE_HPP

#include "registry/model_version.hpp"
#include "serving/classifier_model.hpp"

#include <chrono>
#include <memory>
#include <mutex>

// One immutable view of what is being served
struct ServingSnapshot {
  std::shared_ptr<const IClassifierModel> model;
  ModelVersion version;
  std::chrono::system_clock::time_point loaded_at;
};

// Holder of the active snapshot. Readers copy the pointer and keep using
// their copy; swap() replaces it wholesale. The mutex only covers the pointer
// copy, never inference.
class ServingState {
public:
  ServingState() = default;
  ServingState(const ServingState &) = delete;
  ServingState &operator=(const ServingState &) = delete;

  // nullptr until the first successful load
  std::shared_ptr<const ServingSnapshot> get() const;
  void swap(std::shared_ptr<const ServingSnapshot> snapshot);

private:
  std::shared_ptr<const ServingSnapshot> snapshot_;
  mutable std::mutex mutex_;
};

#endif // SERVING_STATE_HPP
