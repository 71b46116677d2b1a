#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rollout::net {

class TcpSocket {
 public:
  TcpSocket();
  explicit TcpSocket(int handle);
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  bool Connect(const std::string& host, std::uint16_t port, bool quiet = false);
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 16);
  TcpSocket Accept() const;
  TcpSocket AcceptWithTimeout(int timeout_ms) const;
  // Never raises SIGPIPE; a vanished peer shows up as a negative return.
  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);
  bool EnableKeepAlive(std::uint32_t idle_s = 60, std::uint32_t interval_s = 10,
                       std::uint32_t max_probes = 6);
  std::string PeerAddress() const;
  // Port the socket is bound to; useful after binding port 0.
  std::uint16_t LocalPort() const;
  void Close();
  bool IsValid() const noexcept;

 private:
  int handle_{-1};
};

}  // namespace rollout::net
