#include "controller/local_controller.hpp"

namespace rollout::controller {

LocalController::LocalController(FormationStore& formations, JobEventHub& events)
    : formations_(formations), events_(events) {}

bool LocalController::GetFormation(const std::string& app_id, const std::string& release_id,
                                   Formation* out, std::string* error) {
  bool not_found = false;
  if (formations_.Get(app_id, release_id, out, &not_found)) {
    return true;
  }
  if (error) {
    *error = not_found ? "formation not found for app " + app_id + " release " + release_id
                       : "formation lookup failed";
  }
  return false;
}

bool LocalController::PutFormation(const Formation& formation, std::string* error) {
  return formations_.Put(formation, error);
}

std::shared_ptr<JobEventStream> LocalController::StreamJobEvents(const std::string& app_id,
                                                                 std::uint64_t since_id,
                                                                 std::string* error) {
  return events_.Subscribe(app_id, since_id, error);
}

}  // namespace rollout::controller
