#include "serving/serving_state.hpp"
#include "core/logger.hpp"

#include <stdexcept>

std::shared_ptr<const ServingSnapshot> ServingState::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

void ServingState::swap(std::shared_ptr<const ServingSnapshot> snapshot) {
  if (!snapshot || !snapshot->model)
    throw std::invalid_argument("Cannot serve an empty snapshot");

  std::shared_ptr<const ServingSnapshot> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::move(snapshot_);
    snapshot_ = std::move(snapshot);
  }
  // `previous` is released outside the lock; in-flight readers keep theirs
  LOG(LogLevel::DEBUG, LogComponent::SERVING,
      "Serving snapshot swapped (previous version "
          << (previous ? std::to_string(previous->version.version) : "none")
          << ")");
}
