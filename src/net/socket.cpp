#include "net/socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace rollout::net {

namespace {

constexpr int kInvalidSocket = -1;

int CreateSocket(int family) { return ::socket(family, SOCK_STREAM, IPPROTO_TCP); }

void CloseHandle(int handle) {
  if (handle != kInvalidSocket) {
    ::close(handle);
  }
}

bool ConnectWithTimeout(int socket_fd, const sockaddr* addr, socklen_t addr_len, int timeout_ms,
                        bool quiet, const std::string& host, std::uint16_t port) {
  if (socket_fd == kInvalidSocket || addr == nullptr) {
    return false;
  }
  const int original_flags = fcntl(socket_fd, F_GETFL, 0);
  if (original_flags >= 0) {
    (void)fcntl(socket_fd, F_SETFL, original_flags | O_NONBLOCK);
  }
  const int connect_rc = ::connect(socket_fd, addr, addr_len);
  const int connect_err = errno;
  if (connect_rc == 0) {
    if (original_flags >= 0) {
      (void)fcntl(socket_fd, F_SETFL, original_flags);
    }
    return true;
  }
  if (connect_err != EINPROGRESS) {
    if (original_flags >= 0) {
      (void)fcntl(socket_fd, F_SETFL, original_flags);
    }
    if (!quiet) {
      std::cerr << "[socket] connect(" << host << ":" << port << ") failed, errno " << connect_err
                << "\n";
    }
    return false;
  }

  fd_set write_fds;
  FD_ZERO(&write_fds);
  FD_SET(socket_fd, &write_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  const int ready = ::select(socket_fd + 1, nullptr, &write_fds, nullptr, &tv);

  int so_error = 0;
  socklen_t so_error_len = sizeof(so_error);
  const int so_rc = ::getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_error, &so_error_len);
  if (original_flags >= 0) {
    (void)fcntl(socket_fd, F_SETFL, original_flags);
  }
  if (ready <= 0 || so_rc != 0 || so_error != 0) {
    if (!quiet) {
      std::cerr << "[socket] connect(" << host << ":" << port << ") timed out or failed, errno "
                << (so_error != 0 ? so_error : connect_err) << "\n";
    }
    return false;
  }
  return true;
}

}  // namespace

TcpSocket::TcpSocket() = default;

TcpSocket::TcpSocket(int handle) : handle_(handle) {}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(other.handle_) {
  other.handle_ = kInvalidSocket;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = kInvalidSocket;
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, bool quiet) {
  constexpr int kConnectTimeoutMs = 5000;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (!quiet) {
      std::cerr << "[socket] resolve(" << host << ":" << port << ") failed\n";
    }
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const int sock = CreateSocket(entry->ai_family);
    if (sock == kInvalidSocket) {
      continue;
    }
    if (ConnectWithTimeout(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen),
                           kConnectTimeoutMs, quiet, host, port)) {
      Close();
      handle_ = sock;
      EnableKeepAlive();
      freeaddrinfo(result);
      return true;
    }
    CloseHandle(sock);
  }
  freeaddrinfo(result);
  return false;
}

bool TcpSocket::BindAndListen(const std::string& address, std::uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE;

  const bool wants_v4_any = address.empty() || address == "0.0.0.0";
  const bool wants_v6_any = address == "::";
  if (wants_v4_any) {
    hints.ai_family = AF_INET;
  } else if (wants_v6_any) {
    hints.ai_family = AF_INET6;
  } else {
    hints.ai_family = AF_UNSPEC;
  }

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  const char* node = (wants_v4_any || wants_v6_any) ? nullptr : address.c_str();
  if (getaddrinfo(node, port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const int sock = CreateSocket(entry->ai_family);
    if (sock == kInvalidSocket) {
      continue;
    }
    int opt = 1;
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (entry->ai_family == AF_INET6) {
      // Dual-stack so "::" also accepts IPv4-mapped connections.
      int v6only = 0;
      (void)setsockopt(sock, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    if (::bind(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen)) != 0 ||
        ::listen(sock, backlog) != 0) {
      CloseHandle(sock);
      continue;
    }
    Close();
    handle_ = sock;
    freeaddrinfo(result);
    return true;
  }
  freeaddrinfo(result);
  return false;
}

TcpSocket TcpSocket::Accept() const {
  if (!IsValid()) return TcpSocket(kInvalidSocket);
  const int client = ::accept(handle_, nullptr, nullptr);
  if (client == kInvalidSocket) {
    return TcpSocket(kInvalidSocket);
  }
  TcpSocket peer(client);
  peer.EnableKeepAlive();
  return peer;
}

TcpSocket TcpSocket::AcceptWithTimeout(int timeout_ms) const {
  if (timeout_ms < 0) {
    return Accept();
  }
  if (!IsValid()) return TcpSocket(kInvalidSocket);
  fd_set read_fds;
  FD_ZERO(&read_fds);
  FD_SET(handle_, &read_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  const int ready = ::select(handle_ + 1, &read_fds, nullptr, nullptr, &tv);
  if (ready <= 0) {
    return TcpSocket(kInvalidSocket);
  }
  return Accept();
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::send(handle_, data, length, MSG_NOSIGNAL);
}

bool TcpSocket::SendAll(std::string_view data) const {
  const auto* cursor = reinterpret_cast<const std::uint8_t*>(data.data());
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const auto sent = Send(cursor, remaining);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::recv(handle_, data, length, 0);
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
  struct timeval tv {
    milliseconds / 1000, (milliseconds % 1000) * 1000
  };
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool TcpSocket::EnableKeepAlive(std::uint32_t idle_s, std::uint32_t interval_s,
                                std::uint32_t max_probes) {
  if (!IsValid()) {
    return false;
  }
  const int enable = 1;
  if (setsockopt(handle_, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) != 0) {
    return false;
  }
  const int idle = static_cast<int>(idle_s);
  const int interval = static_cast<int>(interval_s);
  const int probes = static_cast<int>(max_probes);
  if (setsockopt(handle_, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0) return false;
  if (setsockopt(handle_, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0) {
    return false;
  }
  if (setsockopt(handle_, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes)) != 0) return false;
  return true;
}

std::string TcpSocket::PeerAddress() const {
  if (!IsValid()) return {};
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getpeername(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char hostbuf[NI_MAXHOST]{};
  if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, hostbuf, sizeof(hostbuf), nullptr, 0,
                  NI_NUMERICHOST) != 0) {
    return {};
  }
  std::string peer(hostbuf);
  // IPv4-mapped peers on a dual-stack listener.
  constexpr std::string_view kMappedPrefix = "::ffff:";
  if (peer.rfind(kMappedPrefix, 0) == 0 && peer.find('.') != std::string::npos) {
    peer.erase(0, kMappedPrefix.size());
  }
  return peer;
}

std::uint16_t TcpSocket::LocalPort() const {
  if (!IsValid()) return 0;
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getsockname(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

void TcpSocket::Close() {
  if (handle_ != kInvalidSocket) {
    CloseHandle(handle_);
    handle_ = kInvalidSocket;
  }
}

bool TcpSocket::IsValid() const noexcept { return handle_ != kInvalidSocket; }

}  // namespace rollout::net
