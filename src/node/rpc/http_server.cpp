#include "rpc/http_server.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace rollout::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kDefaultMaxBodySize = 1024 * 1024;

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// Value of the first header called `name`, skipping the request line.
std::optional<std::string> FindHeader(std::string_view headers, std::string_view name) {
  std::size_t start = headers.find("\r\n");
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  start += 2;
  while (start < headers.size()) {
    auto end = headers.find("\r\n", start);
    auto line = end == std::string_view::npos ? headers.substr(start)
                                              : headers.substr(start, end - start);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && EqualsIgnoreCase(Trim(line.substr(0, colon)), name)) {
      return std::string(Trim(line.substr(colon + 1)));
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 2;
  }
  return std::nullopt;
}

bool IsJsonContentType(std::string_view value) {
  auto sep = value.find(';');
  if (sep != std::string_view::npos) {
    value = value.substr(0, sep);
  }
  return EqualsIgnoreCase(Trim(value), "application/json");
}

int ParseContentLength(const std::string& headers) {
  const auto value = FindHeader(headers, "Content-Length");
  if (!value) {
    return -1;
  }
  try {
    return std::stoi(*value);
  } catch (const std::exception&) {
    return -1;
  }
}

std::string StatusText(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
    case 503:
      return "Service Unavailable";
    default:
      return "Error";
  }
}

}  // namespace

std::optional<std::string> StreamRequest::Header(std::string_view name) const {
  return FindHeader(headers, name);
}

std::optional<std::string> StreamRequest::QueryParam(std::string_view name) const {
  std::string_view rest(query);
  while (!rest.empty()) {
    const auto amp = rest.find('&');
    const auto pair = rest.substr(0, amp);
    const auto eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      return eq == std::string_view::npos ? std::string() : std::string(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

HttpServer::HttpServer(Options options, Handler handler, StreamHandler stream_handler)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      stream_handler_(std::move(stream_handler)) {
  if (options_.max_body_bytes == 0) {
    options_.max_body_bytes = kDefaultMaxBodySize;
  }
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen(options_.bind_address, options_.port)) {
    running_.store(false);
    throw std::runtime_error("failed to bind RPC port " + std::to_string(options_.port) + " on " +
                             options_.bind_address);
  }
  bound_port_ = listener_.LocalPort();
  worker_ = std::thread([this]() { ServeLoop(); });
}

void HttpServer::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  listener_.Close();
  std::list<StreamSlot> streams;
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams.swap(streams_);
  }
  for (auto& slot : streams) {
    slot.thread.request_stop();
  }
  streams.clear();  // joins
}

std::uint16_t HttpServer::Port() const { return bound_port_; }

std::size_t HttpServer::ActiveStreams() {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  PruneStreamsLocked();
  return streams_.size();
}

void HttpServer::ServeLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(200);
    if (!client.IsValid()) {
      if (!running_) {
        break;
      }
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    HandleClient(std::move(client));
  }
}

void HttpServer::HandleClient(net::TcpSocket client) {
  Request request;
  int status = 200;
  if (!ReadRequest(client, &request, &status)) {
    std::string error_json = R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"parse error"}})";
    if (status == 401) {
      error_json = R"({"jsonrpc":"2.0","error":{"code":-32651,"message":"unauthorized"}})";
    } else if (status == 415) {
      error_json = R"({"jsonrpc":"2.0","error":{"code":-32600,"message":"unsupported media type"}})";
    } else if (status == 413) {
      error_json = R"({"jsonrpc":"2.0","error":{"code":-32000,"message":"request too large"}})";
    } else if (status == 405) {
      error_json = R"({"jsonrpc":"2.0","error":{"code":-32600,"message":"method not allowed"}})";
    }
    SendResponse(client, status, error_json);
    return;
  }
  if (request.method == "GET") {
    StartStream(std::move(client), std::move(request));
    return;
  }
  try {
    auto payload = nlohmann::json::parse(request.body);
    auto response = handler_(payload);
    SendResponse(client, 200, response.dump());
  } catch (const nlohmann::json::exception&) {
    SendResponse(client, 400, R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"invalid JSON"}})");
  } catch (const std::exception& ex) {
    nlohmann::json error = {
        {"jsonrpc", "2.0"},
        {"error", {{"code", -32603}, {"message", ex.what()}}},
    };
    SendResponse(client, 200, error.dump());
  }
}

void HttpServer::StartStream(net::TcpSocket client, Request request) {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  PruneStreamsLocked();
  if (streams_.size() >= options_.max_stream_clients) {
    SendResponse(client, 503,
                 R"({"jsonrpc":"2.0","error":{"code":-32000,"message":"too many streams"}})");
    return;
  }
  StreamRequest stream_request;
  const auto question = request.target.find('?');
  stream_request.path = request.target.substr(0, question);
  if (question != std::string::npos) {
    stream_request.query = request.target.substr(question + 1);
  }
  stream_request.headers = std::move(request.headers);
  stream_request.peer = std::move(request.peer);

  auto done = std::make_shared<std::atomic<bool>>(false);
  StreamSlot slot;
  slot.done = done;
  slot.thread = std::jthread(
      [this, done, stream_request = std::move(stream_request),
       socket = std::move(client)](std::stop_token stop) mutable {
        try {
          stream_handler_(stream_request, socket, stop);
        } catch (const std::exception& ex) {
          std::cerr << "[rpc] warn: stream " << stream_request.path << " aborted: " << ex.what()
                    << "\n";
        }
        socket.Close();
        done->store(true);
      });
  streams_.push_back(std::move(slot));
}

void HttpServer::PruneStreamsLocked() {
  for (auto it = streams_.begin(); it != streams_.end();) {
    if (it->done->load()) {
      it = streams_.erase(it);  // joins a thread that has already returned
    } else {
      ++it;
    }
  }
}

bool HttpServer::ReadRequest(net::TcpSocket& client, Request* request, int* status) {
  std::string buffer;
  buffer.reserve(1024);
  std::array<std::uint8_t, 2048> chunk{};
  std::ptrdiff_t bytes = 0;
  std::size_t header_end = std::string::npos;
  request->peer = client.PeerAddress();
  while (buffer.size() < kMaxHeaderSize) {
    bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), bytes);
    header_end = buffer.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    *status = 413;
    return false;
  }
  request->headers = buffer.substr(0, header_end);
  const auto first_line_end = request->headers.find("\r\n");
  const std::string request_line = request->headers.substr(0, first_line_end);
  const auto method_end = request_line.find(' ');
  if (method_end == std::string::npos) {
    *status = 400;
    return false;
  }
  request->method = request_line.substr(0, method_end);
  const auto target_end = request_line.find(' ', method_end + 1);
  request->target = request_line.substr(method_end + 1, target_end == std::string::npos
                                                            ? std::string::npos
                                                            : target_end - method_end - 1);

  if (request->method == "GET") {
    if (!stream_handler_) {
      *status = 405;
      return false;
    }
    if (!Authorized(request->headers, request->peer)) {
      *status = 401;
      return false;
    }
    return true;
  }
  if (request->method != "POST") {
    *status = 405;
    return false;
  }
  const auto content_type = FindHeader(request->headers, "Content-Type");
  if (!content_type || !IsJsonContentType(*content_type)) {
    *status = 415;
    return false;
  }
  int content_length = ParseContentLength(request->headers);
  if (content_length < 0) {
    content_length = 0;
  }
  if (!Authorized(request->headers, request->peer)) {
    *status = 401;
    return false;
  }
  if (static_cast<std::size_t>(content_length) > options_.max_body_bytes) {
    *status = 413;
    return false;
  }
  std::string payload = buffer.substr(header_end + 4);
  while (payload.size() < static_cast<std::size_t>(content_length)) {
    bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), bytes);
    if (payload.size() > options_.max_body_bytes) {
      *status = 413;
      return false;
    }
  }
  if (content_length > 0 && payload.size() > static_cast<std::size_t>(content_length)) {
    payload.resize(content_length);
  }
  request->body = std::move(payload);
  return true;
}

bool HttpServer::Authorized(const std::string& headers, const std::string& peer) {
  if (!HostAllowed(peer)) {
    return false;
  }
  if (!options_.require_auth) {
    return true;
  }
  if (options_.rpc_user.empty() || options_.rpc_password.empty()) {
    return false;
  }
  const auto auth = ParseAuthHeader(headers);
  if (auth.empty()) {
    return false;
  }
  return auth == (options_.rpc_user + ":" + options_.rpc_password);
}

bool HttpServer::HostAllowed(const std::string& peer) const {
  if (peer.empty()) {
    return false;
  }
  if (options_.allowed_hosts.empty()) {
    return peer == "127.0.0.1" || peer == "::1" || peer.rfind("127.", 0) == 0;
  }
  return std::find(options_.allowed_hosts.begin(), options_.allowed_hosts.end(), peer) !=
         options_.allowed_hosts.end();
}

std::string HttpServer::ParseAuthHeader(const std::string& headers) {
  const auto value = FindHeader(headers, "Authorization");
  if (!value) {
    return {};
  }
  std::string_view scheme(*value);
  constexpr std::string_view kBasic = "Basic ";
  if (!scheme.starts_with(kBasic)) {
    return {};
  }
  scheme.remove_prefix(kBasic.size());
  static const std::string base64_chars =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string decoded;
  decoded.reserve(scheme.size());
  // Only the low 14 bits are ever pending; masking keeps the shift bounded.
  std::uint32_t val = 0;
  int valb = -8;
  for (unsigned char c : scheme) {
    if (std::isspace(c)) continue;
    if (c == '=') break;
    auto pos = base64_chars.find(static_cast<char>(c));
    if (pos == std::string::npos) {
      return {};
    }
    val = ((val << 6) | static_cast<std::uint32_t>(pos)) & 0xFFFFFFu;
    valb += 6;
    if (valb >= 0) {
      decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return decoded;
}

void HttpServer::SendResponse(net::TcpSocket& client, int status, const std::string& json_body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << " " << StatusText(status) << "\r\n";
  oss << "Content-Type: application/json\r\n";
  if (status == 401) {
    oss << "WWW-Authenticate: Basic realm=\"rollout\"\r\n";
  }
  oss << "Content-Length: " << json_body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << json_body;
  if (!client.SendAll(oss.str())) {
    std::cerr << "[rpc] warn: failed to send response to " << client.PeerAddress() << "\n";
  }
  client.Close();
}

}  // namespace rollout::rpc
