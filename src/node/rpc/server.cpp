#include "rpc/server.hpp"

#include <charconv>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace rollout::rpc {

namespace {

constexpr const char* kServerVersion = "0.3.0";

// Lightweight RPC exception that carries a structured error code in
// addition to the human-readable message.
struct RpcError : public std::runtime_error {
  int code;
  RpcError(int c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

[[noreturn]] void ThrowRpcError(int code, const std::string& msg) {
  throw RpcError(code, msg);
}

[[noreturn]] void ThrowStoreError(const storage::StoreError& error) {
  switch (error.kind) {
    case storage::StoreErrorKind::kNotFound:
      ThrowRpcError(kRpcNotFound, error.message);
    case storage::StoreErrorKind::kInvalid:
      ThrowRpcError(-32602, error.message);
    case storage::StoreErrorKind::kConflict:
      ThrowRpcError(kRpcConflict, error.message);
    case storage::StoreErrorKind::kEnqueue:
      ThrowRpcError(kRpcNotQueued, error.message);
    default:
      ThrowRpcError(-32603, error.message.empty() ? "storage error" : error.message);
  }
}

std::string RequireString(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || !params.at(key).is_string() ||
      params.at(key).get<std::string>().empty()) {
    ThrowRpcError(-32602, std::string("missing ") + key);
  }
  return params.at(key).get<std::string>();
}

std::string OptionalString(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || params.at(key).is_null()) {
    return {};
  }
  if (!params.at(key).is_string()) {
    ThrowRpcError(-32602, std::string(key) + " must be a string");
  }
  return params.at(key).get<std::string>();
}

std::uint64_t OptionalId(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || params.at(key).is_null()) {
    return 0;
  }
  if (!params.at(key).is_number_unsigned()) {
    ThrowRpcError(-32602, std::string(key) + " must be a non-negative integer");
  }
  return params.at(key).get<std::uint64_t>();
}

bool ParseCursor(std::string_view text, std::uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), *out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Writes the live tail as server-sent events.
class SseSink : public stream::EventSink {
 public:
  explicit SseSink(net::TcpSocket& client) : client_(client) {}

  bool SendHeaders() {
    return client_.SendAll(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n\r\n");
  }

  bool SendEvent(const controller::DeploymentEvent& event) override {
    const std::string record = "id: " + std::to_string(event.id) +
                               "\ndata: " + controller::DeploymentEventToJson(event).dump() +
                               "\n\n";
    return client_.SendAll(record);
  }

  bool SendKeepAlive() override { return client_.SendAll(":\n"); }

 private:
  net::TcpSocket& client_;
};

}  // namespace

RpcServer::RpcServer(storage::DeploymentRepo& deployments, storage::DeploymentEventLog& events,
                     controller::ControllerClient& controller,
                     controller::JobEventHub& job_events, queue::WorkQueue& queue,
                     std::shared_ptr<notify::WakeupBus> bus, Options options)
    : deployments_(deployments),
      events_(events),
      controller_(controller),
      job_events_(job_events),
      queue_(queue),
      bus_(std::move(bus)),
      options_(options),
      started_(std::chrono::steady_clock::now()) {}

nlohmann::json RpcServer::Handle(const nlohmann::json& request) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (request.contains("id")) {
    response["id"] = request["id"];
  } else {
    response["id"] = nullptr;
  }
  try {
    const auto method = request.at("method").get<std::string>();
    const nlohmann::json params =
        request.contains("params") ? request.at("params") : nlohmann::json::object();
    if (!params.is_object()) {
      ThrowRpcError(-32602, "params must be an object");
    }

    if (method == "createdeployment") {
      response["result"] = HandleCreateDeployment(params);
    } else if (method == "getdeployment") {
      response["result"] = HandleGetDeployment(params);
    } else if (method == "listdeployments") {
      response["result"] = HandleListDeployments(params);
    } else if (method == "listdeploymentevents") {
      response["result"] = HandleListDeploymentEvents(params);
    } else if (method == "getformation") {
      response["result"] = HandleGetFormation(params);
    } else if (method == "putformation") {
      response["result"] = HandlePutFormation(params);
    } else if (method == "reportjobevent") {
      response["result"] = HandleReportJobEvent(params);
    } else if (method == "getinfo") {
      response["result"] = HandleGetInfo();
    } else {
      response["error"] = {{"code", -32601}, {"message", "unknown method"}};
    }
  } catch (const RpcError& ex) {
    response["error"] = {{"code", ex.code}, {"message", ex.what()}};
  } catch (const std::out_of_range&) {
    response["error"] = {{"code", -32600}, {"message", "invalid request"}};
  } catch (const std::invalid_argument& ex) {
    response["error"] = {{"code", -32602}, {"message", ex.what()}};
  } catch (const nlohmann::json::exception& ex) {
    response["error"] = {{"code", -32602}, {"message", ex.what()}};
  } catch (const std::exception& ex) {
    response["error"] = {{"code", -32603}, {"message", ex.what()}};
  }
  return response;
}

nlohmann::json RpcServer::HandleCreateDeployment(const nlohmann::json& params) {
  controller::Deployment deployment;
  deployment.id = OptionalString(params, "id");
  deployment.app_id = RequireString(params, "app_id");
  deployment.old_release_id = RequireString(params, "old_release_id");
  deployment.new_release_id = RequireString(params, "new_release_id");
  const auto strategy_name = OptionalString(params, "strategy");
  const auto strategy = controller::ParseStrategy(strategy_name);
  if (!strategy) {
    ThrowRpcError(-32602, "unknown strategy '" + strategy_name + "'");
  }
  deployment.strategy = *strategy;
  const bool force = params.value("force", false);

  // One deployment at a time per app: concurrent runs would race whole
  // formation overwrites.
  controller::Deployment active;
  if (!force && deployments_.FindUnfinished(deployment.app_id, &active)) {
    ThrowRpcError(kRpcConflict, "app " + deployment.app_id + " has an unfinished deployment " +
                                    active.id + " (pass force to override)");
  }

  storage::StoreError error;
  if (!deployments_.Add(&deployment, &error)) {
    ThrowStoreError(error);
  }
  return DeploymentWithStatus(deployment);
}

nlohmann::json RpcServer::HandleGetDeployment(const nlohmann::json& params) const {
  const auto id = RequireString(params, "id");
  controller::Deployment deployment;
  storage::StoreError error;
  if (!deployments_.Get(id, &deployment, &error)) {
    ThrowStoreError(error);
  }
  return DeploymentWithStatus(deployment);
}

nlohmann::json RpcServer::HandleListDeployments(const nlohmann::json& params) const {
  const auto app_id = OptionalString(params, "app_id");
  nlohmann::json result = nlohmann::json::array();
  for (const auto& deployment : deployments_.List(app_id)) {
    result.push_back(DeploymentWithStatus(deployment));
  }
  return result;
}

nlohmann::json RpcServer::HandleListDeploymentEvents(const nlohmann::json& params) const {
  const auto id = RequireString(params, "id");
  const auto since = OptionalId(params, "since");
  controller::Deployment deployment;
  storage::StoreError error;
  if (!deployments_.Get(id, &deployment, &error)) {
    ThrowStoreError(error);
  }
  std::vector<controller::DeploymentEvent> events;
  if (!events_.ListSince(deployment.id, since, &events, &error)) {
    ThrowStoreError(error);
  }
  nlohmann::json result = nlohmann::json::array();
  for (const auto& event : events) {
    result.push_back(controller::DeploymentEventToJson(event));
  }
  return result;
}

nlohmann::json RpcServer::HandleGetFormation(const nlohmann::json& params) {
  const auto app_id = RequireString(params, "app_id");
  const auto release_id = RequireString(params, "release_id");
  controller::Formation formation;
  std::string error;
  if (!controller_.GetFormation(app_id, release_id, &formation, &error)) {
    ThrowRpcError(kRpcNotFound, error);
  }
  return controller::FormationToJson(formation);
}

nlohmann::json RpcServer::HandlePutFormation(const nlohmann::json& params) {
  const auto formation = controller::FormationFromJson(params);
  if (formation.app_id.empty() || formation.release_id.empty()) {
    ThrowRpcError(-32602, "app_id and release_id required");
  }
  std::string error;
  if (!controller_.PutFormation(formation, &error)) {
    ThrowRpcError(-32602, error);
  }
  return controller::FormationToJson(formation);
}

nlohmann::json RpcServer::HandleReportJobEvent(const nlohmann::json& params) {
  auto event = controller::JobEventFromJson(params);
  if (event.process_type.empty()) {
    ThrowRpcError(-32602, "missing type");
  }
  event.id = 0;
  const auto id = job_events_.Publish(std::move(event));
  return nlohmann::json{{"id", id}};
}

nlohmann::json RpcServer::HandleGetInfo() const {
  nlohmann::json result;
  result["version"] = kServerVersion;
  result["uptime_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::steady_clock::now() - started_)
                                 .count();
  result["deployments"] = deployments_.List({}).size();
  result["last_event_id"] = events_.LastId();

  std::size_t queued = 0;
  std::size_t leased = 0;
  std::size_t dead = 0;
  const auto now = std::chrono::system_clock::now();
  for (const auto& job : queue_.Snapshot()) {
    if (job.dead) {
      ++dead;
    } else if (job.leased_until && *job.leased_until > now) {
      ++leased;
    } else {
      ++queued;
    }
  }
  result["jobs"] = {{"queued", queued}, {"leased", leased}, {"dead", dead}};

  const auto hub = job_events_.GetStats();
  result["job_events"] = {{"published", hub.events_published},
                          {"deliveries", hub.deliveries},
                          {"dropped_streams", hub.dropped_streams},
                          {"open_streams", hub.open_streams}};
  if (bus_) {
    const auto bus = bus_->GetStats();
    result["wakeups"] = {{"published", bus.published},
                         {"delivered", bus.delivered},
                         {"overflowed", bus.overflowed},
                         {"subscribers", bus.subscribers}};
  }
  return result;
}

nlohmann::json RpcServer::DeploymentWithStatus(const controller::Deployment& deployment) const {
  auto json = controller::DeploymentToJson(deployment);
  std::vector<controller::DeploymentEvent> events;
  storage::StoreError error;
  auto status = controller::DeploymentStatus::kPending;
  if (events_.ListSince(deployment.id, 0, &events, &error) && !events.empty()) {
    status = events.back().status;
  } else if (deployment.finished_at) {
    status = controller::DeploymentStatus::kComplete;
  }
  json["status"] = controller::DeploymentStatusName(status);
  return json;
}

void RpcServer::ServeEventStream(const StreamRequest& request, net::TcpSocket& client,
                                 std::stop_token stop) {
  constexpr std::string_view kPrefix = "/deployments/";
  constexpr std::string_view kSuffix = "/events";
  std::string_view path(request.path);
  if (!path.starts_with(kPrefix) || !path.ends_with(kSuffix) ||
      path.size() <= kPrefix.size() + kSuffix.size()) {
    HttpServer::SendResponse(client, 404,
                             R"({"jsonrpc":"2.0","error":{"code":-32004,"message":"no such stream"}})");
    return;
  }
  const std::string id(
      path.substr(kPrefix.size(), path.size() - kPrefix.size() - kSuffix.size()));

  controller::Deployment deployment;
  storage::StoreError store_error;
  if (!deployments_.Get(id, &deployment, &store_error)) {
    nlohmann::json error = {
        {"jsonrpc", "2.0"},
        {"error", {{"code", kRpcNotFound}, {"message", store_error.message}}},
    };
    HttpServer::SendResponse(client, 404, error.dump());
    return;
  }

  // A reconnecting EventSource sends Last-Event-ID; it wins over ?since.
  std::uint64_t since = 0;
  auto cursor = request.Header("Last-Event-ID");
  if (!cursor) {
    cursor = request.QueryParam("since");
  }
  if (cursor && !cursor->empty() && !ParseCursor(*cursor, &since)) {
    HttpServer::SendResponse(
        client, 400, R"({"jsonrpc":"2.0","error":{"code":-32602,"message":"invalid cursor"}})");
    return;
  }

  SseSink sink(client);
  if (!sink.SendHeaders()) {
    return;
  }
  stream::LiveTailOptions tail_options;
  tail_options.keep_alive = options_.keep_alive;
  tail_options.queue_capacity = options_.tail_queue_capacity;
  stream::LiveTail tail(events_, bus_, deployment.id, since, tail_options);
  std::string tail_error;
  const auto end = tail.Run(sink, stop, &tail_error);
  std::cerr << "[rpc] event stream " << deployment.id << " for " << request.peer
            << " ended: " << stream::TailEndName(end) << " cursor=" << tail.Cursor()
            << (tail_error.empty() ? "" : " (" + tail_error + ")") << "\n";
}

}  // namespace rollout::rpc
