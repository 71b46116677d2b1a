#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include "config/service.hpp"
#include "controller/formation_store.hpp"
#include "controller/job_event_hub.hpp"
#include "controller/local_controller.hpp"
#include "deployer/worker.hpp"
#include "notify/wakeup_bus.hpp"
#include "queue/work_queue.hpp"
#include "rpc/http_server.hpp"
#include "rpc/server.hpp"
#include "storage/deployment_repo.hpp"
#include "storage/event_log.hpp"
#include "util/time.hpp"

namespace {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogLevelEntry {
  const char* name;
  LogLevel level;
};

constexpr LogLevelEntry kLogLevels[] = {
    {"debug", LogLevel::kDebug}, {"info", LogLevel::kInfo},   {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
};

const char* LogLevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "?";
}

std::optional<LogLevel> ParseLogLevel(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (const auto& entry : kLogLevels) {
    if (value == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

// Daemon log file with size-based rotation: debug.log, debug.log.1, ...
// Messages below the configured level are dropped.
class DebugLogger {
 public:
  void Configure(LogLevel threshold, std::uintmax_t max_bytes, std::size_t keep_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
    max_bytes_ = max_bytes;
    keep_files_ = keep_files;
  }

  bool Open(const std::filesystem::path& path, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (!ReopenLocked(std::ios::app)) {
      if (error) *error = "cannot open debug log " + path.string();
      return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    written_ = ec ? 0 : size;
    WriteLocked("---- rolloutd debug log opened " +
                rollout::util::FormatRfc3339(rollout::util::NowMillis()) + " ----\n");
    return true;
  }

  void Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open() || level < threshold_) {
      return;
    }
    if (max_bytes_ != 0 && written_ >= max_bytes_ && keep_files_ != 0) {
      RotateLocked();
    }
    WriteLocked(rollout::util::FormatRfc3339(rollout::util::NowMillis()) + " " +
                LogLevelTag(level) + " " + message + "\n");
  }

 private:
  bool ReopenLocked(std::ios::openmode mode) {
    out_.close();
    out_.open(path_, mode);
    return out_.is_open();
  }

  void WriteLocked(const std::string& text) {
    out_ << text;
    out_.flush();
    written_ += text.size();
  }

  // Shifts every kept file up one suffix; the oldest falls off the end.
  void RotateLocked() {
    out_.close();
    std::error_code ec;
    const auto suffixed = [this](std::size_t n) {
      auto rotated = path_;
      rotated += "." + std::to_string(n);
      return rotated;
    };
    std::filesystem::remove(suffixed(keep_files_), ec);
    for (std::size_t n = keep_files_; n > 1; --n) {
      std::filesystem::rename(suffixed(n - 1), suffixed(n), ec);
    }
    std::filesystem::rename(path_, suffixed(1), ec);
    ReopenLocked(std::ios::trunc);
    written_ = 0;
  }

  std::mutex mutex_;
  std::filesystem::path path_;
  std::ofstream out_;
  LogLevel threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t keep_files_{0};
  std::uintmax_t written_{0};
};

DebugLogger g_debug_logger;

void LogInfo(const std::string& message) {
  std::cout << "[rolloutd] " << message << "\n";
  g_debug_logger.Log(LogLevel::kInfo, message);
}

void LogWarn(const std::string& message) {
  std::cerr << "[rolloutd] warn: " << message << "\n";
  g_debug_logger.Log(LogLevel::kWarn, message);
}

void LogDebug(const std::string& message) { g_debug_logger.Log(LogLevel::kDebug, message); }

std::atomic<bool> g_shutdown_requested{false};

bool ShutdownRequested() { return g_shutdown_requested.load(); }

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

bool IsLoopbackBind(const std::string& address) {
  return address == "127.0.0.1" || address == "::1" || address == "localhost";
}

int Run(const rollout::config::ServiceConfig& cfg) {
  namespace controller = rollout::controller;
  namespace storage = rollout::storage;

  std::error_code ec;
  std::filesystem::create_directories(cfg.data_dir, ec);
  if (ec) {
    std::cerr << "[rolloutd] fatal: cannot create data dir " << cfg.data_dir << ": "
              << ec.message() << "\n";
    return 1;
  }

  controller::FormationStore formations(cfg.FormationsPath());
  std::string error;
  if (!formations.Load(&error)) {
    std::cerr << "[rolloutd] fatal: " << error << "\n";
    return 1;
  }
  controller::JobEventHub job_events(cfg.job_event_history);
  controller::LocalController local_controller(formations, job_events);

  auto bus = rollout::notify::WakeupBus::Create();
  storage::DeploymentEventLog event_log(cfg.EventLogPath(), bus);
  storage::StoreError store_error;
  if (!event_log.Open(&store_error)) {
    std::cerr << "[rolloutd] fatal: event log: " << store_error.message << "\n";
    return 1;
  }
  rollout::queue::WorkQueue queue(cfg.QueuePath());
  if (!queue.Load(&store_error)) {
    std::cerr << "[rolloutd] fatal: work queue: " << store_error.message << "\n";
    return 1;
  }
  storage::DeploymentRepo deployments(cfg.DeploymentsPath(), queue);
  if (!deployments.Load(&store_error)) {
    std::cerr << "[rolloutd] fatal: deployments: " << store_error.message << "\n";
    return 1;
  }
  LogDebug("stores loaded from " + cfg.data_dir + ", last event id " +
           std::to_string(event_log.LastId()));

  rollout::deployer::WorkerOptions worker_options;
  worker_options.threads = cfg.workers;
  worker_options.lease = std::chrono::seconds(cfg.job_lease_seconds);
  rollout::deployer::DeploymentWorker worker(queue, deployments, event_log, local_controller,
                                             worker_options);

  rollout::rpc::RpcServer::Options rpc_options;
  rpc_options.keep_alive = std::chrono::seconds(cfg.keep_alive_seconds);
  rollout::rpc::RpcServer rpc(deployments, event_log, local_controller, job_events, queue, bus,
                              rpc_options);

  rollout::rpc::HttpServer::Options http_options;
  http_options.bind_address = cfg.rpc_bind;
  http_options.port = cfg.rpc_port;
  http_options.rpc_user = cfg.rpc_user;
  http_options.rpc_password = cfg.rpc_pass;
  http_options.require_auth = cfg.rpc_require_auth;
  http_options.allowed_hosts = cfg.rpc_allow;
  http_options.max_stream_clients = cfg.max_stream_clients;
  if (http_options.require_auth &&
      (http_options.rpc_user.empty() || http_options.rpc_password.empty())) {
    std::cerr << "[rolloutd] fatal: RPC auth is required but rpc-user/rpc-pass are not set "
                 "(pass --rpc-require-auth 0 for an unauthenticated local setup)\n";
    return 1;
  }
  if (!IsLoopbackBind(cfg.rpc_bind) && cfg.rpc_allow.empty()) {
    LogWarn("RPC bound to " + cfg.rpc_bind +
            " without --rpc-allow-ip; only loopback clients will be accepted");
  }

  rollout::rpc::HttpServer http(
      http_options, [&rpc](const nlohmann::json& request) { return rpc.Handle(request); },
      [&rpc](const rollout::rpc::StreamRequest& request, rollout::net::TcpSocket& client,
             std::stop_token stop) { rpc.ServeEventStream(request, client, std::move(stop)); });

  worker.Start();
  try {
    http.Start();
  } catch (const std::exception& ex) {
    std::cerr << "[rolloutd] fatal: " << ex.what() << "\n";
    worker.Stop();
    return 1;
  }
  LogInfo("listening on " + cfg.rpc_bind + ":" + std::to_string(http.Port()) + " with " +
          std::to_string(cfg.workers) + " deployment worker(s)");

  while (!ShutdownRequested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LogInfo("shutting down");
  // Streams first so no client is left waiting on a bus that is going away,
  // then the workers, whose in-flight deployments are cancelled and leave
  // their job leases to expire.
  http.Stop();
  worker.Stop();
  queue.Close();
  job_events.Shutdown();
  bus->Shutdown();
  const auto stats = worker.GetStats();
  LogDebug("worker stats: completed=" + std::to_string(stats.completed) +
           " failed=" + std::to_string(stats.failed) + " skipped=" +
           std::to_string(stats.skipped));
  LogInfo("stopped");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto cfg = rollout::config::ParseServiceConfig(argc, argv);
    if (cfg.show_help) {
      return 0;
    }
    const auto parsed_level = ParseLogLevel(cfg.log_level);
    if (!parsed_level) {
      std::cerr << "[rolloutd] warn: invalid log level " << cfg.log_level
                << " (falling back to info level)\n";
    }
    const LogLevel level = parsed_level.value_or(LogLevel::kInfo);
    if (!cfg.debug_log_path.empty()) {
      std::uintmax_t max_bytes = 0;
      if (cfg.log_max_size_mb > 0) {
        max_bytes = static_cast<std::uintmax_t>(cfg.log_max_size_mb) * 1024ULL * 1024ULL;
      }
      g_debug_logger.Configure(level, max_bytes, cfg.log_max_files);
      std::string log_error;
      if (!g_debug_logger.Open(cfg.debug_log_path, &log_error)) {
        std::cerr << "[rolloutd] fatal: " << log_error << "\n";
        return 1;
      }
      LogDebug("debug log enabled at " + cfg.debug_log_path);
    }

    InstallSignalHandlers();
    LogDebug("rolloutd starting, data_dir=" + cfg.data_dir + ", rpc=" + cfg.rpc_bind + ":" +
             std::to_string(cfg.rpc_port));
    return Run(cfg);
  } catch (const std::exception& ex) {
    std::cerr << "[rolloutd] fatal: " << ex.what() << "\n";
    return 1;
  }
}
