#include "util/json_file.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace rollout::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

bool SyncFile(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

bool AtomicWriteJson(const std::filesystem::path& path, const nlohmann::json& document,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const std::string text = document.dump(2);
  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "failed to open " + tmp_path.string() + " for write";
      }
      return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.put('\n');
    out.flush();
    if (!out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error) {
        *error = "write failed: " + tmp_path.string();
      }
      return false;
    }
  }
  if (!SyncFile(tmp_path)) {
    RemoveQuietly(tmp_path);
    if (error) {
      *error = "fsync failed: " + tmp_path.string();
    }
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    RemoveQuietly(tmp_path);
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    return false;
  }
  return true;
}

bool ReadJsonFile(const std::filesystem::path& path, nlohmann::json* document, bool* missing,
                  std::string* error) {
  if (missing) {
    *missing = false;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (missing) {
      *missing = true;
    }
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    *document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::exception& ex) {
    if (error) {
      *error = path.string() + ": " + ex.what();
    }
    return false;
  }
  return true;
}

}  // namespace rollout::util
