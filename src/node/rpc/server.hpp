#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

#include "controller/client.hpp"
#include "controller/job_event_hub.hpp"
#include "nlohmann/json.hpp"
#include "notify/wakeup_bus.hpp"
#include "queue/work_queue.hpp"
#include "rpc/http_server.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"
#include "stream/live_tail.hpp"

namespace rollout::rpc {

// JSON-RPC error codes beyond the standard -326xx range.
inline constexpr int kRpcNotFound = -32004;
inline constexpr int kRpcConflict = -32009;
inline constexpr int kRpcNotQueued = -32010;

class RpcServer {
 public:
  struct Options {
    std::chrono::milliseconds keep_alive{std::chrono::seconds(30)};
    std::size_t tail_queue_capacity{1024};
  };

  RpcServer(storage::DeploymentRepo& deployments, storage::DeploymentEventLog& events,
            controller::ControllerClient& controller, controller::JobEventHub& job_events,
            queue::WorkQueue& queue, std::shared_ptr<notify::WakeupBus> bus, Options options);

  nlohmann::json Handle(const nlohmann::json& request);

  // Serves GET /deployments/<id>/events as text/event-stream until the
  // client disconnects or `stop` is requested.
  void ServeEventStream(const StreamRequest& request, net::TcpSocket& client,
                        std::stop_token stop);

 private:
  nlohmann::json HandleCreateDeployment(const nlohmann::json& params);
  nlohmann::json HandleGetDeployment(const nlohmann::json& params) const;
  nlohmann::json HandleListDeployments(const nlohmann::json& params) const;
  nlohmann::json HandleListDeploymentEvents(const nlohmann::json& params) const;
  nlohmann::json HandleGetFormation(const nlohmann::json& params);
  nlohmann::json HandlePutFormation(const nlohmann::json& params);
  nlohmann::json HandleReportJobEvent(const nlohmann::json& params);
  nlohmann::json HandleGetInfo() const;

  nlohmann::json DeploymentWithStatus(const controller::Deployment& deployment) const;

  storage::DeploymentRepo& deployments_;
  storage::DeploymentEventLog& events_;
  controller::ControllerClient& controller_;
  controller::JobEventHub& job_events_;
  queue::WorkQueue& queue_;
  std::shared_ptr<notify::WakeupBus> bus_;
  Options options_;
  const std::chrono::steady_clock::time_point started_;
};

}  // namespace rollout::rpc
