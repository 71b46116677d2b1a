#pragma once

#include "controller/client.hpp"
#include "controller/formation_store.hpp"
#include "controller/job_event_hub.hpp"

namespace rollout::controller {

// ControllerClient served from this process: formations from the local
// store, job events from the hub the scheduler reports into.
class LocalController : public ControllerClient {
 public:
  LocalController(FormationStore& formations, JobEventHub& events);

  bool GetFormation(const std::string& app_id, const std::string& release_id, Formation* out,
                    std::string* error) override;
  bool PutFormation(const Formation& formation, std::string* error) override;
  std::shared_ptr<JobEventStream> StreamJobEvents(const std::string& app_id,
                                                  std::uint64_t since_id,
                                                  std::string* error) override;

 private:
  FormationStore& formations_;
  JobEventHub& events_;
};

}  // namespace rollout::controller
