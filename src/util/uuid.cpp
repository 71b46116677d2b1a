#include "util/uuid.hpp"

#include <array>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

namespace rollout::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";
constexpr std::size_t kDashPositions[] = {8, 13, 18, 23};

bool IsHexDigit(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsDashPosition(std::size_t i) {
  for (auto pos : kDashPositions) {
    if (pos == i) {
      return true;
    }
  }
  return false;
}

// Pulls bytes from `source`, which behaves like read(2), until `out` is full.
template <typename Source>
bool FillFrom(std::span<std::uint8_t> out, std::size_t* filled, Source source) {
  while (*filled < out.size()) {
    errno = 0;
    const ssize_t n = source(out.data() + *filled, out.size() - *filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    *filled += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

bool FillRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  std::size_t filled = 0;
#if defined(__linux__)
  if (FillFrom(out, &filled, [](std::uint8_t* dst, std::size_t len) {
        return getrandom(dst, len, 0);
      })) {
    return true;
  }
#endif
  // Kernels without getrandom(2); `filled` keeps what it already produced.
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (error) *error = std::string("open(/dev/urandom): ") + std::strerror(errno);
    return false;
  }
  const bool ok = FillFrom(out, &filled, [fd](std::uint8_t* dst, std::size_t len) {
    return ::read(fd, dst, len);
  });
  const int saved_errno = errno;
  ::close(fd);
  if (!ok && error) {
    *error = filled < out.size() && saved_errno != 0
                 ? std::string("read(/dev/urandom): ") + std::strerror(saved_errno)
                 : std::string("read(/dev/urandom): short read");
  }
  return ok;
}

std::string NewUuid() {
  std::array<std::uint8_t, 16> bytes{};
  std::string error;
  if (!FillRandomBytes(bytes, &error)) {
    throw std::runtime_error("uuid: " + error);
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexLower[(bytes[i] >> 4) & 0x0F]);
    out.push_back(kHexLower[bytes[i] & 0x0F]);
  }
  return out;
}

bool IsUuid(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (IsDashPosition(i)) {
      if (text[i] != '-') {
        return false;
      }
    } else if (!IsHexDigit(text[i])) {
      return false;
    }
  }
  return true;
}

std::string CleanUuid(std::string_view text) {
  std::string digits;
  digits.reserve(32);
  if (text.size() == 36) {
    if (!IsUuid(text)) {
      return {};
    }
    for (char c : text) {
      if (c != '-') {
        digits.push_back(c);
      }
    }
  } else if (text.size() == 32) {
    for (char c : text) {
      if (!IsHexDigit(c)) {
        return {};
      }
      digits.push_back(c);
    }
  } else {
    return {};
  }

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) {
      out.push_back('-');
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(digits[i]))));
  }
  return out;
}

}  // namespace rollout::util
