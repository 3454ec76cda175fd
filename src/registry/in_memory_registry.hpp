#ifndef IN_MEMORY_REGISTRY_HPP
#define IN_MEMORY_REGISTRY_HPP

#include "registry/registry_client.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Registry held in process memory. With a persistence path it becomes the
// "file" backend: the whole registry lives in one JSON document that is
// re-read on every call, so other processes' changes are visible, and
// rewritten atomically (temporary file, then rename) after every mutation. Mutations across
// processes are serialized with an advisory lock on "<path>.lock".
class InMemoryRegistry : public IRegistryClient {
public:
  InMemoryRegistry() = default;
  explicit InMemoryRegistry(std::string persistence_path);

  std::optional<ModelVersion> get_version_by_alias(const std::string &model_name,
                                                   Alias alias) override;
  std::optional<RunData> get_run(const std::string &run_id) override;
  ModelVersion register_version(const std::string &model_name,
                                const RegistrationRequest &request) override;
  void set_alias(const std::string &model_name, Alias alias,
                 uint64_t version) override;
  std::vector<ModelVersion>
  list_versions(const std::string &model_name) override;
  std::map<std::string, uint64_t>
  get_aliases(const std::string &model_name) override;

  const char *get_name() const override {
    return persistence_path_.empty() ? "memory" : "file";
  }

private:
  struct ModelEntry {
    uint64_t next_version = 1;
    std::map<std::string, uint64_t> aliases;
    std::vector<ModelVersion> versions;
  };

  // Stamps the alias currently pointing at the version, if any
  static ModelVersion with_alias(const ModelEntry &entry, ModelVersion version);

  // Both require mutex_ to be held
  void refresh_locked();
  void persist_locked();

  std::mutex mutex_;
  std::map<std::string, ModelEntry> models_;
  std::map<std::string, RunData> runs_;

  std::string persistence_path_;
};

#endif // IN_MEMORY_REGISTRY_HPP
