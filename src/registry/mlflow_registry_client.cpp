#include "registry/mlflow_registry_client.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace {

constexpr const char *API_PREFIX = "/api/2.0/mlflow";

// MLflow renders int64 fields either as JSON numbers or as strings
uint64_t json_to_u64(const json &value) {
  if (value.is_number_unsigned())
    return value.get<uint64_t>();
  if (value.is_number_integer())
    return static_cast<uint64_t>(std::max<int64_t>(0, value.get<int64_t>()));
  if (value.is_string())
    return Utils::string_to_number<uint64_t>(value.get<std::string>())
        .value_or(0);
  return 0;
}

double json_to_double(const json &value) {
  if (value.is_number())
    return value.get<double>();
  if (value.is_string()) {
    try {
      return std::stod(value.get<std::string>());
    } catch (const std::exception &) {
      return 0.0;
    }
  }
  return 0.0;
}

} // namespace

std::string MlflowRegistryClient::Response::error_code() const {
  if (body.is_object() && body.contains("error_code") &&
      body["error_code"].is_string())
    return body["error_code"].get<std::string>();
  return "";
}

MlflowRegistryClient::MlflowRegistryClient(const MlflowClientConfig &config)
    : config_(config), breaker_("mlflow-registry", [&config] {
        circuit_breaker::CircuitBreaker::Config cb;
        cb.failure_threshold = std::max<size_t>(1, config.circuit_breaker_threshold);
        cb.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            config.circuit_breaker_recovery);
        return cb;
      }()) {
  if (config_.tracking_uri.empty())
    throw std::invalid_argument("MLflow tracking URI must not be empty");
  while (!config_.tracking_uri.empty() && config_.tracking_uri.back() == '/')
    config_.tracking_uri.pop_back();
}

std::unique_ptr<httplib::Client> MlflowRegistryClient::make_client() const {
  auto client = std::make_unique<httplib::Client>(config_.tracking_uri);
  client->set_connection_timeout(config_.timeout.count() / 1000,
                                 config_.timeout.count() % 1000 * 1000);
  client->set_read_timeout(config_.timeout.count() / 1000,
                           config_.timeout.count() % 1000 * 1000);
  client->set_write_timeout(config_.timeout.count() / 1000,
                            config_.timeout.count() % 1000 * 1000);
  return client;
}

MlflowRegistryClient::Response MlflowRegistryClient::send(
    const std::string &description, bool idempotent,
    const std::function<httplib::Result(httplib::Client &)> &call) {
  const int max_attempts = idempotent ? config_.max_retries + 1 : 1;
  std::string last_error;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (!breaker_.allow_request())
      throw RegistryUnavailableError("MLflow circuit breaker open, refusing " +
                                     description);

    auto client = make_client();
    httplib::Result res = call(*client);

    if (!res) {
      last_error = httplib::to_string(res.error());
    } else if (res->status >= 500) {
      last_error = "HTTP " + std::to_string(res->status);
    } else {
      breaker_.record_success();
      Response response;
      response.status = res->status;
      response.body = json::parse(res->body, nullptr, false);
      if (response.body.is_discarded())
        response.body = json::object();
      return response;
    }

    breaker_.record_failure();
    LOG(LogLevel::WARN, LogComponent::REGISTRY,
        "MLflow " << description << " failed (attempt " << attempt << "/"
                  << max_attempts << "): " << last_error);
    if (attempt < max_attempts)
      std::this_thread::sleep_for(std::chrono::milliseconds(100 * attempt));
  }

  throw RegistryUnavailableError("MLflow " + description + " failed: " +
                                 last_error);
}

MlflowRegistryClient::Response
MlflowRegistryClient::get(const std::string &path,
                          const httplib::Params &params) {
  std::string url = std::string(API_PREFIX) + path;
  return send("GET " + path, true, [&url, &params](httplib::Client &client) {
    return client.Get(url, params, httplib::Headers{});
  });
}

MlflowRegistryClient::Response
MlflowRegistryClient::post(const std::string &path, const json &body,
                           bool idempotent) {
  std::string url = std::string(API_PREFIX) + path;
  std::string payload = body.dump();
  return send("POST " + path, idempotent,
              [&url, &payload](httplib::Client &client) {
                return client.Post(url, payload, "application/json");
              });
}

void MlflowRegistryClient::expect_ok(const Response &response,
                                     const std::string &context) {
  if (response.ok())
    return;
  std::string message = response.body.is_object()
                            ? response.body.value("message", std::string())
                            : std::string();
  throw RegistryError(context + " rejected (HTTP " +
                      std::to_string(response.status) + " " +
                      response.error_code() + "): " + message);
}

ModelVersion MlflowRegistryClient::parse_model_version(const json &mv) {
  ModelVersion version;
  version.model_name = mv.value("name", "");
  version.version = json_to_u64(mv.value("version", json()));
  version.artifact_uri = mv.value("source", "");
  version.run_id = mv.value("run_id", "");
  version.description = mv.value("description", "");
  version.created_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(json_to_u64(mv.value("creation_timestamp", json()))));

  for (const auto &alias_name : mv.value("aliases", json::array())) {
    if (!alias_name.is_string())
      continue;
    auto alias = alias_from_string(alias_name.get<std::string>());
    if (alias && (version.alias == Alias::NONE || *alias == Alias::PRODUCTION))
      version.alias = *alias;
  }

  if (!version.run_id.empty())
    version.metric = lookup_run_metric(version.run_id).value_or(0.0);
  return version;
}

std::optional<double>
MlflowRegistryClient::lookup_run_metric(const std::string &run_id) {
  auto run = get_run(run_id);
  if (!run)
    return std::nullopt;
  auto it = run->metrics.find(config_.metric_name);
  if (it == run->metrics.end())
    return std::nullopt;
  return it->second;
}

std::optional<ModelVersion>
MlflowRegistryClient::get_version_by_alias(const std::string &model_name,
                                           Alias alias) {
  if (alias == Alias::NONE)
    return std::nullopt;

  Response response = get("/registered-models/alias",
                          {{"name", model_name}, {"alias", alias_to_string(alias)}});
  if (response.error_code() == "RESOURCE_DOES_NOT_EXIST" ||
      response.status == 404)
    return std::nullopt;
  expect_ok(response, "get-version-by-alias");

  if (!response.body.contains("model_version"))
    return std::nullopt;
  return parse_model_version(response.body["model_version"]);
}

std::optional<RunData> MlflowRegistryClient::get_run(const std::string &run_id) {
  if (run_id.empty())
    return std::nullopt;

  Response response = get("/runs/get", {{"run_id", run_id}});
  if (response.error_code() == "RESOURCE_DOES_NOT_EXIST" ||
      response.status == 404)
    return std::nullopt;
  expect_ok(response, "get-run");

  RunData run;
  run.run_id = run_id;
  const json &data = response.body.value("run", json::object())
                         .value("data", json::object());
  for (const auto &m : data.value("metrics", json::array()))
    run.metrics[m.value("key", "")] = json_to_double(m.value("value", json()));
  for (const auto &p : data.value("params", json::array()))
    run.params[p.value("key", "")] = p.value("value", "");
  return run;
}

std::string MlflowRegistryClient::ensure_experiment() {
  Response response = get("/experiments/get-by-name",
                          {{"experiment_name", config_.experiment_name}});
  if (response.ok())
    return response.body.value("experiment", json::object())
        .value("experiment_id", "");
  if (response.error_code() != "RESOURCE_DOES_NOT_EXIST" &&
      response.status != 404)
    expect_ok(response, "get-experiment");

  response = post("/experiments/create", {{"name", config_.experiment_name}},
                  false);
  if (response.error_code() == "RESOURCE_ALREADY_EXISTS") {
    // Lost a creation race with another registrar
    response = get("/experiments/get-by-name",
                   {{"experiment_name", config_.experiment_name}});
    expect_ok(response, "get-experiment");
    return response.body.value("experiment", json::object())
        .value("experiment_id", "");
  }
  expect_ok(response, "create-experiment");
  return response.body.value("experiment_id", "");
}

std::string MlflowRegistryClient::create_run(const RegistrationRequest &request) {
  const int64_t now_ms = static_cast<int64_t>(Utils::get_current_time_ms());

  Response response = post("/runs/create",
                           {{"experiment_id", ensure_experiment()},
                            {"start_time", now_ms}},
                           false);
  expect_ok(response, "create-run");
  std::string run_id = response.body.value("run", json::object())
                           .value("info", json::object())
                           .value("run_id", "");
  if (run_id.empty())
    throw RegistryError("MLflow create-run returned no run_id");

  json params = json::array();
  for (const auto &[key, value] : request.params)
    params.push_back({{"key", key}, {"value", value}});
  json batch = {{"run_id", run_id},
                {"metrics",
                 json::array({{{"key", request.metric_name},
                               {"value", request.metric},
                               {"timestamp", now_ms},
                               {"step", 0}}})},
                {"params", params}};
  expect_ok(post("/runs/log-batch", batch, false), "log-batch");

  expect_ok(post("/runs/update",
                 {{"run_id", run_id},
                  {"status", "FINISHED"},
                  {"end_time", static_cast<int64_t>(Utils::get_current_time_ms())}},
                 true),
            "update-run");
  return run_id;
}

ModelVersion
MlflowRegistryClient::register_version(const std::string &model_name,
                                       const RegistrationRequest &request) {
  if (model_name.empty())
    throw RegistryError("Model name must not be empty");

  // Runs logged by the training job already carry the metric
  std::string run_id =
      request.run_id.empty() ? create_run(request) : request.run_id;

  Response created = post("/registered-models/create", {{"name", model_name}},
                          false);
  if (!created.ok() && created.error_code() != "RESOURCE_ALREADY_EXISTS")
    expect_ok(created, "create-registered-model");

  Response response = post("/model-versions/create",
                           {{"name", model_name},
                            {"source", request.artifact_uri},
                            {"run_id", run_id},
                            {"description", request.description}},
                           false);
  expect_ok(response, "create-model-version");

  ModelVersion version =
      parse_model_version(response.body.value("model_version", json::object()));
  version.model_name = model_name;
  version.alias = Alias::NONE;
  version.metric = request.metric;

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Registered " << model_name << " version " << version.version
                    << " from run " << run_id);
  return version;
}

void MlflowRegistryClient::set_alias(const std::string &model_name,
                                     Alias alias, uint64_t version) {
  if (alias == Alias::NONE)
    throw std::invalid_argument("Cannot assign the 'none' alias");

  // The server moves the alias in one write, revoking the previous holder
  Response response = post("/registered-models/alias",
                           {{"name", model_name},
                            {"alias", alias_to_string(alias)},
                            {"version", std::to_string(version)}},
                           true);
  expect_ok(response, "set-alias");

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Alias '" << alias_to_string(alias) << "' of " << model_name
                << " now points at version " << version);
}

std::vector<ModelVersion>
MlflowRegistryClient::list_versions(const std::string &model_name) {
  std::vector<ModelVersion> versions;
  std::string page_token;

  do {
    httplib::Params params = {{"filter", "name='" + model_name + "'"},
                              {"max_results", "200"}};
    if (!page_token.empty())
      params.emplace("page_token", page_token);

    Response response = get("/model-versions/search", params);
    if (response.error_code() == "RESOURCE_DOES_NOT_EXIST")
      return versions;
    expect_ok(response, "search-model-versions");

    for (const auto &mv : response.body.value("model_versions", json::array()))
      versions.push_back(parse_model_version(mv));
    page_token = response.body.value("next_page_token", "");
  } while (!page_token.empty());

  std::sort(versions.begin(), versions.end(),
            [](const ModelVersion &a, const ModelVersion &b) {
              return a.version < b.version;
            });
  return versions;
}

std::map<std::string, uint64_t>
MlflowRegistryClient::get_aliases(const std::string &model_name) {
  Response response = get("/registered-models/get", {{"name", model_name}});
  if (response.error_code() == "RESOURCE_DOES_NOT_EXIST" ||
      response.status == 404)
    return {};
  expect_ok(response, "get-registered-model");

  std::map<std::string, uint64_t> aliases;
  const json &model = response.body.value("registered_model", json::object());
  for (const auto &entry : model.value("aliases", json::array()))
    aliases[entry.value("alias", "")] = json_to_u64(entry.value("version", json()));
  return aliases;
}
