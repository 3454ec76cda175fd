#ifndef REGISTRY_CLIENT_HPP
#define REGISTRY_CLIENT_HPP

#include "registry/model_version.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Interface to an external versioned model store.
//
// Lookups that find nothing return std::nullopt (or an empty container);
// RegistryUnavailableError is thrown when the store cannot be reached and
// RegistryError when it rejects a request. Implementations must be safe to
// call from several threads.
class IRegistryClient {
public:
  virtual ~IRegistryClient() = default;

  virtual std::optional<ModelVersion>
  get_version_by_alias(const std::string &model_name, Alias alias) = 0;

  virtual std::optional<RunData> get_run(const std::string &run_id) = 0;

  // Registers a new version carrying Alias::NONE
  virtual ModelVersion register_version(const std::string &model_name,
                                        const RegistrationRequest &request) = 0;

  // Points `alias` at `version`, revoking it from its previous holder in the
  // same step. Alias::NONE is rejected with std::invalid_argument.
  virtual void set_alias(const std::string &model_name, Alias alias,
                         uint64_t version) = 0;

  // All versions of a model, ordered by version number
  virtual std::vector<ModelVersion>
  list_versions(const std::string &model_name) = 0;

  virtual std::map<std::string, uint64_t>
  get_aliases(const std::string &model_name) = 0;

  virtual const char *get_name() const = 0;
};

#endif // REGISTRY_CLIENT_HPP
