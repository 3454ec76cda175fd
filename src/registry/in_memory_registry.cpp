#include "registry/in_memory_registry.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Advisory lock on "<registry>.lock", held for the duration of one call
class ScopedFileLock {
public:
  ScopedFileLock(const std::string &path, bool exclusive) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
      throw RegistryUnavailableError("Cannot open registry lock " + path +
                                     ": " + std::strerror(errno));
    if (::flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
      int err = errno;
      ::close(fd_);
      throw RegistryUnavailableError("Cannot lock registry " + path + ": " +
                                     std::strerror(err));
    }
  }

  ~ScopedFileLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  ScopedFileLock(const ScopedFileLock &) = delete;
  ScopedFileLock &operator=(const ScopedFileLock &) = delete;

private:
  int fd_ = -1;
};

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

InMemoryRegistry::InMemoryRegistry(std::string persistence_path)
    : persistence_path_(std::move(persistence_path)) {
  if (persistence_path_.empty())
    return;

  std::filesystem::path parent =
      std::filesystem::path(persistence_path_).parent_path();
  std::error_code ec;
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);
  if (ec)
    LOG(LogLevel::WARN, LogComponent::REGISTRY,
        "Could not create registry directory " << parent << ": "
                                               << ec.message());
}

ModelVersion InMemoryRegistry::with_alias(const ModelEntry &entry,
                                          ModelVersion version) {
  version.alias = Alias::NONE;
  for (const auto &[alias_name, holder] : entry.aliases) {
    if (holder != version.version)
      continue;
    // Production wins if a version happens to hold both
    auto alias = alias_from_string(alias_name);
    if (alias && (version.alias == Alias::NONE || *alias == Alias::PRODUCTION))
      version.alias = *alias;
  }
  return version;
}

void InMemoryRegistry::refresh_locked() {
  if (persistence_path_.empty())
    return;

  std::ifstream file(persistence_path_);
  if (!file.is_open()) {
    if (!std::filesystem::exists(persistence_path_)) {
      models_.clear();
      runs_.clear();
      return;
    }
    throw RegistryUnavailableError("Cannot read registry file " +
                                   persistence_path_);
  }

  json doc;
  try {
    file >> doc;
  } catch (const json::exception &e) {
    throw RegistryUnavailableError("Corrupt registry file " +
                                   persistence_path_ + ": " + e.what());
  }

  std::map<std::string, ModelEntry> models;
  std::map<std::string, RunData> runs;
  try {
    for (const auto &[name, m] : doc.value("models", json::object()).items()) {
      ModelEntry entry;
      entry.next_version = m.value("next_version", uint64_t{1});
      entry.aliases =
          m.value("aliases", std::map<std::string, uint64_t>{});
      for (const auto &v : m.value("versions", json::array())) {
        ModelVersion mv;
        mv.model_name = name;
        mv.version = v.at("version").get<uint64_t>();
        mv.artifact_uri = v.value("artifact_uri", "");
        mv.run_id = v.value("run_id", "");
        mv.metric = v.value("metric", 0.0);
        mv.created_at = from_epoch_ms(v.value("created_at_ms", int64_t{0}));
        mv.description = v.value("description", "");
        entry.versions.push_back(std::move(mv));
      }
      models.emplace(name, std::move(entry));
    }
    for (const auto &[run_id, r] : doc.value("runs", json::object()).items()) {
      RunData run;
      run.run_id = run_id;
      run.metrics = r.value("metrics", std::map<std::string, double>{});
      run.params = r.value("params", std::map<std::string, std::string>{});
      runs.emplace(run_id, std::move(run));
    }
  } catch (const json::exception &e) {
    throw RegistryUnavailableError("Malformed registry file " +
                                   persistence_path_ + ": " + e.what());
  }

  models_ = std::move(models);
  runs_ = std::move(runs);
}

void InMemoryRegistry::persist_locked() {
  if (persistence_path_.empty())
    return;

  json doc;
  doc["models"] = json::object();
  for (const auto &[name, entry] : models_) {
    json versions = json::array();
    for (const auto &v : entry.versions) {
      versions.push_back({{"version", v.version},
                          {"artifact_uri", v.artifact_uri},
                          {"run_id", v.run_id},
                          {"metric", v.metric},
                          {"created_at_ms", to_epoch_ms(v.created_at)},
                          {"description", v.description}});
    }
    doc["models"][name] = {{"next_version", entry.next_version},
                           {"aliases", entry.aliases},
                           {"versions", std::move(versions)}};
  }
  doc["runs"] = json::object();
  for (const auto &[run_id, run] : runs_)
    doc["runs"][run_id] = {{"metrics", run.metrics}, {"params", run.params}};

  const std::string tmp_path = persistence_path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open())
      throw RegistryUnavailableError("Cannot write registry file " + tmp_path);
    out << doc.dump(2);
    out.flush();
    if (!out)
      throw RegistryUnavailableError("Short write to registry file " +
                                     tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, persistence_path_, ec);
  if (ec)
    throw RegistryUnavailableError("Cannot replace registry file " +
                                   persistence_path_ + ": " + ec.message());
}

std::optional<ModelVersion>
InMemoryRegistry::get_version_by_alias(const std::string &model_name,
                                       Alias alias) {
  if (alias == Alias::NONE)
    return std::nullopt;

  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", false);
  refresh_locked();

  auto model_it = models_.find(model_name);
  if (model_it == models_.end())
    return std::nullopt;

  const ModelEntry &entry = model_it->second;
  auto alias_it = entry.aliases.find(alias_to_string(alias));
  if (alias_it == entry.aliases.end())
    return std::nullopt;

  for (const auto &v : entry.versions) {
    if (v.version == alias_it->second)
      return with_alias(entry, v);
  }
  return std::nullopt;
}

std::optional<RunData> InMemoryRegistry::get_run(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", false);
  refresh_locked();

  auto it = runs_.find(run_id);
  if (it == runs_.end())
    return std::nullopt;
  return it->second;
}

ModelVersion
InMemoryRegistry::register_version(const std::string &model_name,
                                   const RegistrationRequest &request) {
  if (model_name.empty())
    throw RegistryError("Model name must not be empty");

  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", true);
  refresh_locked();

  ModelEntry &entry = models_[model_name];

  ModelVersion mv;
  mv.model_name = model_name;
  mv.version = entry.next_version++;
  mv.artifact_uri = request.artifact_uri;
  mv.run_id = request.run_id.empty()
                  ? "run-" + model_name + "-" + std::to_string(mv.version)
                  : request.run_id;
  mv.metric = request.metric;
  mv.alias = Alias::NONE;
  mv.created_at = std::chrono::system_clock::now();
  mv.description = request.description;
  entry.versions.push_back(mv);

  RunData &run = runs_[mv.run_id];
  run.run_id = mv.run_id;
  run.metrics[request.metric_name] = request.metric;
  for (const auto &[key, value] : request.params)
    run.params[key] = value;

  persist_locked();

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Registered " << model_name << " version " << mv.version << " ("
                    << mv.artifact_uri << ")");
  return mv;
}

void InMemoryRegistry::set_alias(const std::string &model_name, Alias alias,
                                 uint64_t version) {
  if (alias == Alias::NONE)
    throw std::invalid_argument("Cannot assign the 'none' alias");

  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", true);
  refresh_locked();

  auto model_it = models_.find(model_name);
  if (model_it == models_.end())
    throw RegistryError("Unknown registered model '" + model_name + "'");

  ModelEntry &entry = model_it->second;
  bool known = false;
  for (const auto &v : entry.versions) {
    if (v.version == version) {
      known = true;
      break;
    }
  }
  if (!known)
    throw RegistryError("Model '" + model_name + "' has no version " +
                        std::to_string(version));

  // A single map slot per alias: the previous holder loses it in this write
  entry.aliases[alias_to_string(alias)] = version;
  persist_locked();

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Alias '" << alias_to_string(alias) << "' of " << model_name
                << " now points at version " << version);
}

std::vector<ModelVersion>
InMemoryRegistry::list_versions(const std::string &model_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", false);
  refresh_locked();

  std::vector<ModelVersion> result;
  auto model_it = models_.find(model_name);
  if (model_it == models_.end())
    return result;

  for (const auto &v : model_it->second.versions)
    result.push_back(with_alias(model_it->second, v));
  return result;
}

std::map<std::string, uint64_t>
InMemoryRegistry::get_aliases(const std::string &model_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ScopedFileLock> file_lock;
  if (!persistence_path_.empty())
    file_lock.emplace(persistence_path_ + ".lock", false);
  refresh_locked();

  auto model_it = models_.find(model_name);
  if (model_it == models_.end())
    return {};
  return model_it->second.aliases;
}
