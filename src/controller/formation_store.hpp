#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "controller/types.hpp"

namespace rollout::controller {

// Durable app+release -> process counts table. Every Put rewrites the whole
// table file atomically; an empty path keeps the table in memory only.
class FormationStore {
 public:
  explicit FormationStore(std::filesystem::path path = {});

  // Loads the table from disk. A missing file is an empty table.
  bool Load(std::string* error);

  // Returns false with `*not_found` set when no formation exists.
  bool Get(const std::string& app_id, const std::string& release_id, Formation* out,
           bool* not_found = nullptr) const;

  // Full overwrite of the formation's process map.
  bool Put(const Formation& formation, std::string* error);

  std::vector<Formation> ListForApp(const std::string& app_id) const;

 private:
  bool PersistLocked(std::string* error) const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::map<std::string, std::map<std::string, ProcessCounts>> formations_;
};

}  // namespace rollout::controller
