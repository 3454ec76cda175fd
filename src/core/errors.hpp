#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// The registry rejected a request (unknown version, invalid argument, ...)
class RegistryError : public std::runtime_error {
public:
  explicit RegistryError(const std::string &msg) : std::runtime_error(msg) {}
};

// The registry could not be reached: transport failure, timeout, 5xx or an
// open circuit breaker. Retrying later may succeed.
class RegistryUnavailableError : public RegistryError {
public:
  explicit RegistryUnavailableError(const std::string &msg)
      : RegistryError(msg) {}
};

// No model is loaded and none could be loaded
class ModelUnavailableError : public std::runtime_error {
public:
  explicit ModelUnavailableError(const std::string &msg)
      : std::runtime_error(msg) {}
};

// A model artifact could not be resolved, fetched or parsed
class ModelLoadError : public std::runtime_error {
public:
  explicit ModelLoadError(const std::string &msg) : std::runtime_error(msg) {}
};

#endif // ERRORS_HPP
