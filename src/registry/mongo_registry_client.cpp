#include "registry/mongo_registry_client.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <mongocxx/options/update.hpp>
#include <stdexcept>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

constexpr const char *MODELS_COLLECTION = "registered_models";
constexpr const char *VERSIONS_COLLECTION = "model_versions";
constexpr const char *RUNS_COLLECTION = "runs";

std::string to_std_string(const bsoncxx::document::element &element) {
  if (element && element.type() == bsoncxx::type::k_string) {
    auto value = element.get_string().value;
    return std::string(value.data(), value.size());
  }
  return "";
}

std::optional<double> to_number(const bsoncxx::document::element &element) {
  if (!element)
    return std::nullopt;
  switch (element.type()) {
  case bsoncxx::type::k_double:
    return element.get_double().value;
  case bsoncxx::type::k_int32:
    return static_cast<double>(element.get_int32().value);
  case bsoncxx::type::k_int64:
    return static_cast<double>(element.get_int64().value);
  default:
    return std::nullopt;
  }
}

std::string key_of(const bsoncxx::document::element &element) {
  auto key = element.key();
  return std::string(key.data(), key.size());
}

// Runs a driver call, turning driver failures into RegistryUnavailableError
template <typename Fn> auto guarded(const char *operation, Fn &&fn) {
  try {
    return fn();
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::WARN, LogComponent::REGISTRY,
        "MongoDB " << operation << " failed: " << e.what());
    throw RegistryUnavailableError(std::string("MongoDB ") + operation +
                                   " failed: " + e.what());
  }
}

} // namespace

MongoRegistryClient::MongoRegistryClient(
    std::shared_ptr<MongoManager> mongo_manager, std::string database)
    : mongo_manager_(std::move(mongo_manager)), database_(std::move(database)) {
  if (!mongo_manager_)
    throw std::invalid_argument("MongoRegistryClient needs a MongoManager");
}

std::map<std::string, uint64_t>
MongoRegistryClient::aliases_from_model(const bsoncxx::document::view &model_doc) {
  std::map<std::string, uint64_t> aliases;
  auto element = model_doc["aliases"];
  if (!element || element.type() != bsoncxx::type::k_document)
    return aliases;
  for (const auto &entry : element.get_document().value) {
    if (auto version = to_number(entry))
      aliases[key_of(entry)] = static_cast<uint64_t>(*version);
  }
  return aliases;
}

ModelVersion MongoRegistryClient::version_from_bson(
    const bsoncxx::document::view &doc,
    const std::map<std::string, uint64_t> &aliases) {
  ModelVersion mv;
  mv.model_name = to_std_string(doc["model_name"]);
  mv.version = static_cast<uint64_t>(to_number(doc["version"]).value_or(0));
  mv.artifact_uri = to_std_string(doc["artifact_uri"]);
  mv.run_id = to_std_string(doc["run_id"]);
  mv.metric = to_number(doc["metric"]).value_or(0.0);
  mv.description = to_std_string(doc["description"]);

  auto created = doc["created_at"];
  if (created && created.type() == bsoncxx::type::k_date)
    mv.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(created.get_date().to_int64()));

  for (const auto &[alias_name, holder] : aliases) {
    if (holder != mv.version)
      continue;
    auto alias = alias_from_string(alias_name);
    if (alias && (mv.alias == Alias::NONE || *alias == Alias::PRODUCTION))
      mv.alias = *alias;
  }
  return mv;
}

std::optional<ModelVersion>
MongoRegistryClient::get_version_by_alias(const std::string &model_name,
                                          Alias alias) {
  if (alias == Alias::NONE)
    return std::nullopt;

  return guarded("get-version-by-alias", [&]() -> std::optional<ModelVersion> {
    auto client = mongo_manager_->get_client();
    auto db = (*client)[database_];

    auto model_doc =
        db[MODELS_COLLECTION].find_one(make_document(kvp("_id", model_name)));
    if (!model_doc)
      return std::nullopt;

    auto aliases = aliases_from_model(model_doc->view());
    auto it = aliases.find(alias_to_string(alias));
    if (it == aliases.end())
      return std::nullopt;

    auto version_doc = db[VERSIONS_COLLECTION].find_one(
        make_document(kvp("model_name", model_name),
                      kvp("version", static_cast<int64_t>(it->second))));
    if (!version_doc)
      return std::nullopt;
    return version_from_bson(version_doc->view(), aliases);
  });
}

std::optional<RunData> MongoRegistryClient::get_run(const std::string &run_id) {
  return guarded("get-run", [&]() -> std::optional<RunData> {
    auto client = mongo_manager_->get_client();
    auto run_doc = (*client)[database_][RUNS_COLLECTION].find_one(
        make_document(kvp("_id", run_id)));
    if (!run_doc)
      return std::nullopt;

    RunData run;
    run.run_id = run_id;
    auto view = run_doc->view();
    auto metrics = view["metrics"];
    if (metrics && metrics.type() == bsoncxx::type::k_document) {
      for (const auto &m : metrics.get_document().value) {
        if (auto value = to_number(m))
          run.metrics[key_of(m)] = *value;
      }
    }
    auto params = view["params"];
    if (params && params.type() == bsoncxx::type::k_document) {
      for (const auto &p : params.get_document().value)
        run.params[key_of(p)] = to_std_string(p);
    }
    return run;
  });
}

ModelVersion
MongoRegistryClient::register_version(const std::string &model_name,
                                      const RegistrationRequest &request) {
  if (model_name.empty())
    throw RegistryError("Model name must not be empty");

  return guarded("register-version", [&]() -> ModelVersion {
    auto client = mongo_manager_->get_client();
    auto db = (*client)[database_];

    mongocxx::options::find_one_and_update allocate_opts{};
    allocate_opts.upsert(true);
    allocate_opts.return_document(mongocxx::options::return_document::k_after);
    auto model_doc = db[MODELS_COLLECTION].find_one_and_update(
        make_document(kvp("_id", model_name)),
        make_document(
            kvp("$inc", make_document(kvp("last_version", int64_t{1})))),
        allocate_opts);
    if (!model_doc)
      throw RegistryError("MongoDB did not return the allocated version");

    ModelVersion mv;
    mv.model_name = model_name;
    mv.version = static_cast<uint64_t>(
        to_number(model_doc->view()["last_version"]).value_or(0));
    mv.artifact_uri = request.artifact_uri;
    mv.run_id = request.run_id.empty()
                    ? "run-" + model_name + "-" + std::to_string(mv.version)
                    : request.run_id;
    mv.metric = request.metric;
    mv.alias = Alias::NONE;
    mv.created_at = std::chrono::system_clock::now();
    mv.description = request.description;

    db[VERSIONS_COLLECTION].insert_one(make_document(
        kvp("model_name", mv.model_name),
        kvp("version", static_cast<int64_t>(mv.version)),
        kvp("artifact_uri", mv.artifact_uri), kvp("run_id", mv.run_id),
        kvp("metric", mv.metric), kvp("description", mv.description),
        kvp("created_at", bsoncxx::types::b_date{mv.created_at})));

    bsoncxx::builder::basic::document run_fields{};
    run_fields.append(kvp("metrics." + request.metric_name, request.metric));
    for (const auto &[key, value] : request.params)
      run_fields.append(kvp("params." + key, value));

    mongocxx::options::update run_opts{};
    run_opts.upsert(true);
    db[RUNS_COLLECTION].update_one(
        make_document(kvp("_id", mv.run_id)),
        make_document(kvp("$set", bsoncxx::types::b_document{run_fields.view()})),
        run_opts);

    LOG(LogLevel::INFO, LogComponent::REGISTRY,
        "Registered " << model_name << " version " << mv.version << " ("
                      << mv.artifact_uri << ")");
    return mv;
  });
}

void MongoRegistryClient::set_alias(const std::string &model_name, Alias alias,
                                    uint64_t version) {
  if (alias == Alias::NONE)
    throw std::invalid_argument("Cannot assign the 'none' alias");

  guarded("set-alias", [&]() {
    auto client = mongo_manager_->get_client();
    auto db = (*client)[database_];

    auto version_doc = db[VERSIONS_COLLECTION].find_one(
        make_document(kvp("model_name", model_name),
                      kvp("version", static_cast<int64_t>(version))));
    if (!version_doc)
      throw RegistryError("Model '" + model_name + "' has no version " +
                          std::to_string(version));

    auto result = db[MODELS_COLLECTION].update_one(
        make_document(kvp("_id", model_name)),
        make_document(kvp(
            "$set",
            make_document(kvp(std::string("aliases.") + alias_to_string(alias),
                              static_cast<int64_t>(version))))));
    if (!result || result->matched_count() == 0)
      throw RegistryError("Unknown registered model '" + model_name + "'");
  });

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Alias '" << alias_to_string(alias) << "' of " << model_name
                << " now points at version " << version);
}

std::vector<ModelVersion>
MongoRegistryClient::list_versions(const std::string &model_name) {
  return guarded("list-versions", [&]() {
    auto client = mongo_manager_->get_client();
    auto db = (*client)[database_];

    std::map<std::string, uint64_t> aliases;
    if (auto model_doc = db[MODELS_COLLECTION].find_one(
            make_document(kvp("_id", model_name))))
      aliases = aliases_from_model(model_doc->view());

    mongocxx::options::find opts{};
    opts.sort(make_document(kvp("version", 1)));
    auto cursor = db[VERSIONS_COLLECTION].find(
        make_document(kvp("model_name", model_name)), opts);

    std::vector<ModelVersion> versions;
    for (const auto &doc : cursor)
      versions.push_back(version_from_bson(doc, aliases));
    return versions;
  });
}

std::map<std::string, uint64_t>
MongoRegistryClient::get_aliases(const std::string &model_name) {
  return guarded("get-aliases", [&]() {
    auto client = mongo_manager_->get_client();
    auto model_doc = (*client)[database_][MODELS_COLLECTION].find_one(
        make_document(kvp("_id", model_name)));
    if (!model_doc)
      return std::map<std::string, uint64_t>{};
    return aliases_from_model(model_doc->view());
  });
}
