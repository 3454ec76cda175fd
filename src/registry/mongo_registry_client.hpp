#ifndef MONGO_REGISTRY_CLIENT_HPP
#define MONGO_REGISTRY_CLIENT_HPP

#include "io/db/mongo_manager.hpp"
#include "registry/registry_client.hpp"

#include <bsoncxx/document/view.hpp>
#include <memory>
#include <string>

// IRegistryClient stored in three MongoDB collections:
//   registered_models  { _id: name, last_version, aliases: { alias: version } }
//   model_versions     { model_name, version, artifact_uri, run_id, metric,
//                        description, created_at }
//   runs               { _id: run_id, metrics: {...}, params: {...} }
//
// Versions are allocated with an atomic $inc on the model document and an
// alias moves with a single-document $set, so readers see the old or the new
// holder and never both.
class MongoRegistryClient : public IRegistryClient {
public:
  MongoRegistryClient(std::shared_ptr<MongoManager> mongo_manager,
                      std::string database);

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

  const char *get_name() const override { return "mongodb"; }

private:
  static std::map<std::string, uint64_t>
  aliases_from_model(const bsoncxx::document::view &model_doc);
  static ModelVersion
  version_from_bson(const bsoncxx::document::view &doc,
                    const std::map<std::string, uint64_t> &aliases);

  std::shared_ptr<MongoManager> mongo_manager_;
  std::string database_;
};

#endif // MONGO_REGISTRY_CLIENT_HPP
