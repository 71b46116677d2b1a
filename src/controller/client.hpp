#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "controller/job_event_stream.hpp"
#include "controller/types.hpp"

namespace rollout::controller {

// The controller operations a deployment consumes. Formation writes are
// whole-document overwrites of the process map, never merges.
class ControllerClient {
 public:
  virtual ~ControllerClient() = default;

  virtual bool GetFormation(const std::string& app_id, const std::string& release_id,
                            Formation* out, std::string* error) = 0;
  virtual bool PutFormation(const Formation& formation, std::string* error) = 0;

  // Opens a stream of job events for `app_id`. since_id == 0 starts with
  // live events only; a non-zero id first replays retained events with a
  // larger id. Returns nullptr and sets `error` on failure.
  virtual std::shared_ptr<JobEventStream> StreamJobEvents(const std::string& app_id,
                                                          std::uint64_t since_id,
                                                          std::string* error) = 0;
};

}  // namespace rollout::controller
