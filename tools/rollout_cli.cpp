#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "config/service.hpp"
#include "net/socket.hpp"
#include "nlohmann/json.hpp"

namespace {

struct CliOptions {
  std::string rpc_host{"127.0.0.1"};
  std::uint16_t rpc_port{rollout::config::kDefaultRpcPort};
  bool rpc_wait{false};
  std::uint32_t rpc_wait_seconds{30};
  bool raw{false};
  std::string rpc_user;
  std::string rpc_pass;
  std::vector<std::string> args;
};

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

bool HasFlag(const std::vector<std::string>& args, std::string_view flag) {
  for (const auto& arg : args) {
    if (arg == flag) {
      return true;
    }
  }
  return false;
}

// Positional arguments after the command, with --flags removed.
std::vector<std::string> Positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) != 0) {
      out.push_back(args[i]);
    }
  }
  return out;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void PrintUsage() {
  std::cout << "Usage: rollout-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  createdeployment <app> <old-release> <new-release> [--strategy=one-by-one|all-at-once]\n"
            << "                   [--id=<uuid>] [--force]\n"
            << "  getdeployment <id>\n"
            << "  listdeployments [app]\n"
            << "  listdeploymentevents <id> [--since=N]\n"
            << "  watch <id> [--since=N]         Follow deployment events until complete or failed\n"
            << "  getformation <app> <release>\n"
            << "  putformation <app> <release> [type=count...]\n"
            << "  reportjobevent <app> <release> <type> <starting|up|down|crashed> [--job-id=<id>]\n"
            << "  getinfo\n"
            << "Options:\n"
            << "  --rpc-host <host>   RPC host (default 127.0.0.1)\n"
            << "  --rpc-port <port>   RPC port (default 7480)\n"
            << "  --rpc-user <user>   RPC basic auth user (default $ROLLOUT_RPC_USER)\n"
            << "  --rpc-pass <pass>   RPC basic auth password (default $ROLLOUT_RPC_PASS)\n"
            << "  --rpc-wait          Wait for the RPC server to be reachable\n"
            << "  --rpc-wait-seconds <n>  Max seconds to wait when --rpc-wait is set (default: 30)\n"
            << "  --raw               Print raw JSON response\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  if (auto value = GetEnvValue("ROLLOUT_RPC_USER")) {
    opts.rpc_user = *value;
  }
  if (auto value = GetEnvValue("ROLLOUT_RPC_PASS")) {
    opts.rpc_pass = *value;
  }
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--rpc-host") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-host");
      opts.rpc_host = argv[i];
    } else if (arg == "--rpc-port") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-port");
      opts.rpc_port = static_cast<std::uint16_t>(std::stoi(argv[i]));
    } else if (arg == "--rpc-user") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-user");
      opts.rpc_user = argv[i];
    } else if (arg == "--rpc-pass") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-pass");
      opts.rpc_pass = argv[i];
    } else if (arg == "--rpc-wait") {
      opts.rpc_wait = true;
    } else if (arg == "--rpc-wait-seconds") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-wait-seconds");
      const unsigned long parsed = std::stoul(argv[i]);
      if (parsed > 3600) {
        throw std::runtime_error("--rpc-wait-seconds out of range (max 3600)");
      }
      opts.rpc_wait_seconds = static_cast<std::uint32_t>(parsed);
      opts.rpc_wait = true;
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

std::string Base64Encode(std::string_view input) {
  static const char kBase64[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string encoded;
  encoded.reserve(((input.size() + 2) / 3) * 4);
  std::uint32_t val = 0;
  int valb = -6;
  for (unsigned char c : input) {
    val = (val << 8) | c;
    valb += 8;
    while (valb >= 0) {
      encoded.push_back(kBase64[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    encoded.push_back(kBase64[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (encoded.size() % 4) {
    encoded.push_back('=');
  }
  return encoded;
}

std::optional<std::string> ResolveBasicAuth(const CliOptions& opts) {
  if (opts.rpc_user.empty() && opts.rpc_pass.empty()) {
    return std::nullopt;
  }
  if (opts.rpc_user.empty() || opts.rpc_pass.empty()) {
    throw std::runtime_error("--rpc-user and --rpc-pass must be set together");
  }
  return Base64Encode(opts.rpc_user + ":" + opts.rpc_pass);
}

rollout::net::TcpSocket ConnectToRpc(const CliOptions& opts) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::seconds(opts.rpc_wait_seconds);

  while (true) {
    rollout::net::TcpSocket socket;
    if (socket.Connect(opts.rpc_host, opts.rpc_port, /*quiet=*/opts.rpc_wait)) {
      return socket;
    }
    if (!opts.rpc_wait) {
      break;
    }
    if (clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  throw std::runtime_error("failed to connect to RPC server");
}

std::optional<std::size_t> FindHeaderEnd(const std::string& data) {
  auto pos = data.find("\r\n\r\n");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return pos + 4;
}

std::optional<int> ParseContentLength(std::string_view headers) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    auto line = headers.substr(offset, end - offset);
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      auto key = line.substr(0, colon);
      auto value = line.substr(colon + 1);
      if (key == "Content-Length" || key == "content-length") {
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
          value.remove_prefix(1);
        }
        try {
          return std::stoi(std::string(value));
        } catch (const std::exception&) {
          return std::nullopt;
        }
      }
    }
    if (end >= headers.size()) {
      break;
    }
    offset = end + 2;
  }
  return std::nullopt;
}

int ParseStatusCode(std::string_view headers) {
  // "HTTP/1.1 200 OK"
  const auto space = headers.find(' ');
  if (space == std::string_view::npos || space + 4 > headers.size()) {
    return 0;
  }
  try {
    return std::stoi(std::string(headers.substr(space + 1, 3)));
  } catch (const std::exception&) {
    return 0;
  }
}

nlohmann::json CallRpc(const CliOptions& opts, const nlohmann::json& request) {
  rollout::net::TcpSocket socket = ConnectToRpc(opts);
  const auto payload = request.dump();
  const auto basic_auth = ResolveBasicAuth(opts);

  std::ostringstream http;
  http << "POST / HTTP/1.1\r\n";
  http << "Host: " << opts.rpc_host << ":" << opts.rpc_port << "\r\n";
  if (basic_auth) {
    http << "Authorization: Basic " << *basic_auth << "\r\n";
  }
  http << "Content-Type: application/json\r\n";
  http << "Content-Length: " << payload.size() << "\r\n";
  http << "Connection: close\r\n\r\n";
  http << payload;
  if (!socket.SendAll(http.str())) {
    throw std::runtime_error("failed to send request");
  }

  std::string response;
  response.reserve(1024);
  std::array<std::uint8_t, 2048> chunk{};
  std::optional<std::size_t> body_offset;
  int content_length = -1;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      break;
    }
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      body_offset = FindHeaderEnd(response);
      if (body_offset) {
        auto headers = std::string_view(response.data(), *body_offset - 4);
        if (ParseStatusCode(headers) == 401) {
          throw std::runtime_error("RPC authentication failed (check --rpc-user/--rpc-pass)");
        }
        auto length = ParseContentLength(headers);
        if (!length) {
          throw std::runtime_error("missing Content-Length");
        }
        content_length = *length;
      }
    }
    if (body_offset &&
        response.size() >= *body_offset + static_cast<std::size_t>(content_length)) {
      break;
    }
  }
  if (!body_offset || content_length < 0) {
    throw std::runtime_error("invalid RPC response");
  }
  return nlohmann::json::parse(response.substr(*body_offset, content_length));
}

std::uint64_t ParseUint(const std::string& text, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed);
    if (consumed == text.size()) {
      return value;
    }
  } catch (const std::exception&) {
  }
  throw std::runtime_error(std::string("invalid ") + what + ": " + text);
}

nlohmann::json BuildRequest(const CliOptions& opts) {
  if (opts.args.empty()) {
    throw std::runtime_error("missing command");
  }
  const auto command = opts.args.front();
  const auto positional = Positionals(opts.args);
  nlohmann::json params = nlohmann::json::object();
  auto find_option = [&](std::string_view name) -> std::optional<std::string> {
    return FindPrefixedOptionValue(opts.args, name);
  };
  auto require = [&](std::size_t count, const char* usage) {
    if (positional.size() < count) {
      throw std::runtime_error(command + " requires " + usage);
    }
  };

  if (command == "getinfo") {
    // no params
  } else if (command == "createdeployment") {
    require(3, "<app> <old-release> <new-release>");
    params["app_id"] = positional[0];
    params["old_release_id"] = positional[1];
    params["new_release_id"] = positional[2];
    if (auto strategy = find_option("--strategy=")) {
      params["strategy"] = *strategy;
    }
    if (auto id = find_option("--id=")) {
      params["id"] = *id;
    }
    if (HasFlag(opts.args, "--force")) {
      params["force"] = true;
    }
  } else if (command == "getdeployment") {
    require(1, "<id>");
    params["id"] = positional[0];
  } else if (command == "listdeployments") {
    if (!positional.empty()) {
      params["app_id"] = positional[0];
    }
  } else if (command == "listdeploymentevents") {
    require(1, "<id>");
    params["id"] = positional[0];
    if (auto since = find_option("--since=")) {
      params["since"] = ParseUint(*since, "--since");
    }
  } else if (command == "getformation") {
    require(2, "<app> <release>");
    params["app_id"] = positional[0];
    params["release_id"] = positional[1];
  } else if (command == "putformation") {
    require(2, "<app> <release>");
    params["app_id"] = positional[0];
    params["release_id"] = positional[1];
    nlohmann::json processes = nlohmann::json::object();
    for (std::size_t i = 2; i < positional.size(); ++i) {
      const auto& item = positional[i];
      const auto eq = item.find('=');
      if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error("process counts must be type=count, got " + item);
      }
      processes[item.substr(0, eq)] =
          static_cast<int>(ParseUint(item.substr(eq + 1), "process count"));
    }
    params["processes"] = std::move(processes);
  } else if (command == "reportjobevent") {
    require(4, "<app> <release> <type> <state>");
    params["app_id"] = positional[0];
    params["release_id"] = positional[1];
    params["type"] = positional[2];
    params["state"] = positional[3];
    if (auto job_id = find_option("--job-id=")) {
      params["job_id"] = *job_id;
    }
  } else {
    throw std::runtime_error("unknown command: " + command);
  }
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", command}, {"params", params}};
}

void PrintEvent(const nlohmann::json& event) {
  std::cout << event.value("id", 0ULL) << "  " << event.value("created_at", std::string{}) << "  "
            << event.value("status", std::string{}) << "  "
            << event.value("release_id", std::string{}) << "  "
            << event.value("job_type", std::string{}) << ":"
            << event.value("job_state", std::string{});
  const auto error = event.value("error", std::string{});
  if (!error.empty()) {
    std::cout << "  error=" << error;
  }
  std::cout << "\n";
}

bool IsTerminalStatus(const std::string& status) {
  return status == "complete" || status == "failed";
}

// Result of one SSE connection.
enum class WatchOutcome {
  kFinished,
  kDisconnected,
};

WatchOutcome StreamEvents(const CliOptions& opts, const std::string& id, std::uint64_t* cursor,
                          std::string* final_status) {
  rollout::net::TcpSocket socket = ConnectToRpc(opts);
  // Keep-alives arrive well within this; silence means the server is gone.
  (void)socket.SetTimeout(120 * 1000);
  const auto basic_auth = ResolveBasicAuth(opts);

  std::ostringstream http;
  http << "GET /deployments/" << id << "/events HTTP/1.1\r\n";
  http << "Host: " << opts.rpc_host << ":" << opts.rpc_port << "\r\n";
  if (basic_auth) {
    http << "Authorization: Basic " << *basic_auth << "\r\n";
  }
  http << "Accept: text/event-stream\r\n";
  if (*cursor > 0) {
    http << "Last-Event-ID: " << *cursor << "\r\n";
  }
  http << "Connection: close\r\n\r\n";
  if (!socket.SendAll(http.str())) {
    return WatchOutcome::kDisconnected;
  }

  std::string buffer;
  std::array<std::uint8_t, 4096> chunk{};
  bool headers_done = false;
  std::string event_id;
  std::string event_data;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      return WatchOutcome::kDisconnected;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!headers_done) {
      const auto body_offset = FindHeaderEnd(buffer);
      if (!body_offset) {
        continue;
      }
      const auto status = ParseStatusCode(std::string_view(buffer.data(), *body_offset - 4));
      if (status != 200) {
        std::string body = buffer.substr(*body_offset);
        throw std::runtime_error("event stream refused (HTTP " + std::to_string(status) + ")" +
                                 (body.empty() ? "" : ": " + body));
      }
      buffer.erase(0, *body_offset);
      headers_done = true;
    }
    std::size_t newline = 0;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        if (!event_data.empty()) {
          const auto event = nlohmann::json::parse(event_data);
          if (opts.raw) {
            std::cout << event.dump() << "\n";
          } else {
            PrintEvent(event);
          }
          std::cout.flush();
          if (!event_id.empty()) {
            *cursor = std::stoull(event_id);
          }
          const auto status = event.value("status", std::string{});
          if (IsTerminalStatus(status)) {
            *final_status = status;
            return WatchOutcome::kFinished;
          }
        }
        event_id.clear();
        event_data.clear();
      } else if (line.front() == ':') {
        // keep-alive
      } else if (line.rfind("id: ", 0) == 0) {
        event_id = line.substr(4);
      } else if (line.rfind("data: ", 0) == 0) {
        event_data += line.substr(6);
      }
    }
  }
}

int Watch(const CliOptions& opts) {
  const auto positional = Positionals(opts.args);
  if (positional.empty()) {
    throw std::runtime_error("watch requires <id>");
  }
  const auto& id = positional[0];
  std::uint64_t cursor = 0;
  if (auto since = FindPrefixedOptionValue(opts.args, "--since=")) {
    cursor = ParseUint(*since, "--since");
  }

  // A finished deployment has nothing left to stream: print what the log
  // holds and stop.
  auto deployment = CallRpc(opts, {{"jsonrpc", "2.0"},
                                   {"id", 1},
                                   {"method", "getdeployment"},
                                   {"params", {{"id", id}}}});
  if (deployment.contains("error") && !deployment["error"].is_null()) {
    std::cerr << "error: " << deployment["error"].dump() << "\n";
    return 1;
  }
  const auto& record = deployment.at("result");
  if (!record.at("finished_at").is_null()) {
    auto events = CallRpc(opts, {{"jsonrpc", "2.0"},
                                 {"id", 2},
                                 {"method", "listdeploymentevents"},
                                 {"params", {{"id", id}, {"since", cursor}}}});
    if (events.contains("result")) {
      for (const auto& event : events["result"]) {
        if (opts.raw) {
          std::cout << event.dump() << "\n";
        } else {
          PrintEvent(event);
        }
      }
    }
    const auto status = record.value("status", std::string{});
    std::cout << "deployment " << record.value("id", id) << " already finished: " << status
              << "\n";
    return status == "failed" ? 2 : 0;
  }

  constexpr int kMaxReconnects = 10;
  int reconnects = 0;
  std::string final_status;
  while (true) {
    WatchOutcome outcome = WatchOutcome::kDisconnected;
    try {
      outcome = StreamEvents(opts, id, &cursor, &final_status);
    } catch (const nlohmann::json::exception& ex) {
      throw std::runtime_error(std::string("malformed event: ") + ex.what());
    }
    if (outcome == WatchOutcome::kFinished) {
      break;
    }
    if (++reconnects > kMaxReconnects) {
      throw std::runtime_error("event stream lost after " + std::to_string(kMaxReconnects) +
                               " reconnects");
    }
    std::cerr << "rollout-cli: stream disconnected, resuming after event " << cursor << "\n";
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  return final_status == "failed" ? 2 : 0;
}

bool PrintResponse(const CliOptions& opts, const nlohmann::json& response) {
  if (opts.raw) {
    std::cout << response.dump(2) << "\n";
    return !(response.contains("error") && !response["error"].is_null());
  }
  if (response.contains("error") && !response["error"].is_null()) {
    std::cerr << "error: " << response["error"].dump() << "\n";
    return false;
  }
  const std::string command = opts.args.empty() ? std::string{} : opts.args.front();
  const auto& result = response.at("result");
  if (command == "listdeploymentevents") {
    for (const auto& event : result) {
      PrintEvent(event);
    }
    return true;
  }
  if (command == "listdeployments") {
    for (const auto& deployment : result) {
      std::cout << deployment.value("id", std::string{}) << "  "
                << deployment.value("app_id", std::string{}) << "  "
                << deployment.value("old_release_id", std::string{}) << " -> "
                << deployment.value("new_release_id", std::string{}) << "  "
                << deployment.value("strategy", std::string{}) << "  "
                << deployment.value("status", std::string{}) << "\n";
    }
    return true;
  }
  if (result.is_string()) {
    std::cout << result.get<std::string>() << "\n";
  } else {
    std::cout << result.dump(2) << "\n";
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (!opts.args.empty() && opts.args.front() == "watch") {
      return Watch(opts);
    }
    auto request = BuildRequest(opts);
    auto response = CallRpc(opts, request);
    if (!PrintResponse(opts, response)) {
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "rollout-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
