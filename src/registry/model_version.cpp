#include "registry/model_version.hpp"
#include "utils/utils.hpp"

const char *alias_to_string(Alias alias) {
  switch (alias) {
  case Alias::NONE:
    return "none";
  case Alias::PRODUCTION:
    return "production";
  case Alias::CHALLENGER:
    return "challenger";
  }
  return "none";
}

std::optional<Alias> alias_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(name);
  if (lowered == "production")
    return Alias::PRODUCTION;
  if (lowered == "challenger")
    return Alias::CHALLENGER;
  return std::nullopt;
}
