#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "controller/formation_store.hpp"

using rollout::controller::Formation;
using rollout::controller::FormationStore;

namespace {

std::filesystem::path MakeTempDir() {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  const auto dir = base / ("rollout_formation_store_tests_" + std::to_string(suffix));
  std::filesystem::create_directories(dir);
  return dir;
}

bool TestPutIsFullOverwrite() {
  FormationStore store;
  std::string error;
  if (!store.Put(Formation{"app", "r1", {{"web", 3}, {"worker", 1}}}, &error)) {
    std::cerr << "put failed: " << error << "\n";
    return false;
  }
  if (!store.Put(Formation{"app", "r1", {{"web", 2}}}, &error)) {
    std::cerr << "second put failed: " << error << "\n";
    return false;
  }
  Formation out;
  if (!store.Get("app", "r1", &out)) {
    std::cerr << "formation missing after put\n";
    return false;
  }
  if (out.processes.size() != 1 || out.processes.at("web") != 2) {
    std::cerr << "put merged instead of overwriting\n";
    return false;
  }
  bool not_found = false;
  if (store.Get("app", "r2", &out, &not_found) || !not_found) {
    std::cerr << "expected not_found for unknown release\n";
    return false;
  }
  return true;
}

bool TestRejectsInvalidCounts() {
  FormationStore store;
  std::string error;
  if (store.Put(Formation{"app", "r1", {{"web", -1}}}, &error)) {
    std::cerr << "negative count accepted\n";
    return false;
  }
  if (store.Put(Formation{"app", "", {{"web", 1}}}, &error)) {
    std::cerr << "empty release accepted\n";
    return false;
  }
  if (store.Get("app", "r1", nullptr)) {
    std::cerr << "rejected formation was stored\n";
    return false;
  }
  return true;
}

bool RejectsCount(const nlohmann::json& count) {
  const nlohmann::json json = {
      {"app_id", "app"}, {"release_id", "r1"}, {"processes", {{"web", count}}}};
  try {
    (void)rollout::controller::FormationFromJson(json);
  } catch (const std::invalid_argument&) {
    return true;
  }
  std::cerr << "count " << count.dump() << " accepted\n";
  return false;
}

bool TestRejectsNonIntegerCountsFromJson() {
  if (!RejectsCount(nlohmann::json(4294967297ULL)) || !RejectsCount(nlohmann::json(2.7)) ||
      !RejectsCount(nlohmann::json(-4294967296LL)) || !RejectsCount(nlohmann::json("3"))) {
    return false;
  }
  const nlohmann::json json = {
      {"app_id", "app"}, {"release_id", "r1"}, {"processes", {{"web", 2147483647}}}};
  if (rollout::controller::FormationFromJson(json).processes.at("web") != 2147483647) {
    std::cerr << "largest int count not accepted\n";
    return false;
  }
  return true;
}

bool TestPersistsAcrossReload() {
  const auto dir = MakeTempDir();
  const auto path = dir / "formations.json";
  std::string error;
  {
    FormationStore store(path);
    if (!store.Load(&error)) {
      std::cerr << "load of missing file failed: " << error << "\n";
      return false;
    }
    if (!store.Put(Formation{"app", "r1", {{"web", 3}}}, &error) ||
        !store.Put(Formation{"app", "r2", {{"web", 0}}}, &error)) {
      std::cerr << "put failed: " << error << "\n";
      return false;
    }
  }
  FormationStore reopened(path);
  if (!reopened.Load(&error)) {
    std::cerr << "reload failed: " << error << "\n";
    return false;
  }
  const auto listed = reopened.ListForApp("app");
  if (listed.size() != 2 || listed[0].release_id != "r1" ||
      listed[0].processes.at("web") != 3 || listed[1].processes.at("web") != 0) {
    std::cerr << "formations not restored from disk\n";
    return false;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

}  // namespace

int main() {
  if (!TestPutIsFullOverwrite()) {
    return EXIT_FAILURE;
  }
  if (!TestRejectsInvalidCounts()) {
    return EXIT_FAILURE;
  }
  if (!TestRejectsNonIntegerCountsFromJson()) {
    return EXIT_FAILURE;
  }
  if (!TestPersistsAcrossReload()) {
    return EXIT_FAILURE;
  }
  std::cout << "formation_store_tests: OK\n";
  return EXIT_SUCCESS;
}
