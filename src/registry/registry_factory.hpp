#ifndef REGISTRY_FACTORY_HPP
#define REGISTRY_FACTORY_HPP

#include "core/config.hpp"
#include "registry/registry_client.hpp"

#include <memory>

// Builds the backend named by [Registry] backend. Throws
// std::invalid_argument for an unknown backend name.
std::shared_ptr<IRegistryClient>
make_registry_client(const Config::RegistryConfig &config);

#endif // REGISTRY_FACTORY_HPP
