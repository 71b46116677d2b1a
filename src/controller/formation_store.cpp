#include "controller/formation_store.hpp"

#include <utility>

#include "util/json_file.hpp"

namespace rollout::controller {

FormationStore::FormationStore(std::filesystem::path path) : path_(std::move(path)) {}

bool FormationStore::Load(std::string* error) {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json document;
  bool missing = false;
  if (!util::ReadJsonFile(path_, &document, &missing, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  formations_.clear();
  if (missing) {
    return true;
  }
  try {
    for (const auto& entry : document.at("formations")) {
      auto formation = FormationFromJson(entry);
      formations_[formation.app_id][formation.release_id] = std::move(formation.processes);
    }
  } catch (const std::exception& ex) {
    formations_.clear();
    if (error) {
      *error = path_.string() + ": " + ex.what();
    }
    return false;
  }
  return true;
}

bool FormationStore::Get(const std::string& app_id, const std::string& release_id,
                         Formation* out, bool* not_found) const {
  if (not_found) {
    *not_found = false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto app_it = formations_.find(app_id);
  if (app_it != formations_.end()) {
    auto release_it = app_it->second.find(release_id);
    if (release_it != app_it->second.end()) {
      if (out) {
        out->app_id = app_id;
        out->release_id = release_id;
        out->processes = release_it->second;
      }
      return true;
    }
  }
  if (not_found) {
    *not_found = true;
  }
  return false;
}

bool FormationStore::Put(const Formation& formation, std::string* error) {
  if (formation.app_id.empty() || formation.release_id.empty()) {
    if (error) {
      *error = "formation requires app_id and release_id";
    }
    return false;
  }
  if (!ValidateProcessCounts(formation.processes, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto& releases = formations_[formation.app_id];
  auto existing = releases.find(formation.release_id);
  const bool existed = existing != releases.end();
  ProcessCounts previous = existed ? existing->second : ProcessCounts{};
  releases[formation.release_id] = formation.processes;
  if (!PersistLocked(error)) {
    if (existed) {
      releases[formation.release_id] = std::move(previous);
    } else {
      releases.erase(formation.release_id);
    }
    return false;
  }
  return true;
}

std::vector<Formation> FormationStore::ListForApp(const std::string& app_id) const {
  std::vector<Formation> out;
  std::lock_guard<std::mutex> lock(mutex_);
  auto app_it = formations_.find(app_id);
  if (app_it == formations_.end()) {
    return out;
  }
  for (const auto& [release_id, processes] : app_it->second) {
    out.push_back(Formation{app_id, release_id, processes});
  }
  return out;
}

bool FormationStore::PersistLocked(std::string* error) const {
  if (path_.empty()) {
    return true;
  }
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& [app_id, releases] : formations_) {
    for (const auto& [release_id, processes] : releases) {
      entries.push_back(FormationToJson(Formation{app_id, release_id, processes}));
    }
  }
  nlohmann::json document = {{"version", 1}, {"formations", std::move(entries)}};
  return util::AtomicWriteJson(path_, document, error);
}

}  // namespace rollout::controller
