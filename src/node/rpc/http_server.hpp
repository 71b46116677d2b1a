#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

#include "net/socket.hpp"

namespace rollout::rpc {

// A GET request handed to the stream handler. Header lookup is
// case-insensitive.
struct StreamRequest {
  std::string path;
  std::string query;
  std::string headers;
  std::string peer;

  std::optional<std::string> Header(std::string_view name) const;
  std::optional<std::string> QueryParam(std::string_view name) const;
};

class HttpServer {
 public:
  struct Options {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};
    std::string rpc_user;
    std::string rpc_password;
    bool require_auth{true};
    std::vector<std::string> allowed_hosts;  // exact IP strings; empty -> allow loopback only.
    std::size_t max_body_bytes{1024 * 1024};
    int socket_timeout_ms{5000};
    std::size_t max_stream_clients{32};
  };

  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;
  // Owns the connection for as long as it runs, response headers included.
  using StreamHandler =
      std::function<void(const StreamRequest&, net::TcpSocket&, std::stop_token)>;

  HttpServer(Options options, Handler handler, StreamHandler stream_handler = {});
  ~HttpServer();

  // Binds the listen socket and starts accepting on a background thread.
  // Throws std::runtime_error when the port cannot be bound.
  void Start();

  // Closes the listener, cancels every open stream and joins all threads.
  // Safe to call more than once.
  void Stop();

  // Port actually bound (differs from Options::port when that was 0).
  std::uint16_t Port() const;

  std::size_t ActiveStreams();

  static void SendResponse(net::TcpSocket& client, int status, const std::string& json_body);

 private:
  struct Request {
    std::string method;
    std::string target;
    std::string headers;
    std::string body;
    std::string peer;
  };

  struct StreamSlot {
    std::shared_ptr<std::atomic<bool>> done;
    std::jthread thread;
  };

  void ServeLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, Request* request, int* status);
  void StartStream(net::TcpSocket client, Request request);
  void PruneStreamsLocked();
  bool Authorized(const std::string& headers, const std::string& peer);
  bool HostAllowed(const std::string& peer) const;
  static std::string ParseAuthHeader(const std::string& headers);

  Options options_;
  Handler handler_;
  StreamHandler stream_handler_;
  std::atomic<bool> running_{false};
  net::TcpSocket listener_;
  std::uint16_t bound_port_{0};
  std::thread worker_;
  std::mutex streams_mutex_;
  std::list<StreamSlot> streams_;
};

}  // namespace rollout::rpc
