#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "nlohmann/json.hpp"

namespace rollout::storage {

// Append-only file of JSON records. Each record is framed as
//   magic (u32 LE) | payload size (u32 LE) | SHA3-256(payload) | payload
// so that a torn write at the tail can be told apart from corruption.
class RecordFile {
 public:
  enum class ScanStatus {
    kOk,
    kCorrupt,
    kIoError,
  };

  explicit RecordFile(std::filesystem::path path);

  const std::filesystem::path& Path() const noexcept { return path_; }

  // Walks every complete record from the start of the file. A truncated
  // record at the tail ends the walk; `*valid_bytes` receives the length of
  // the intact prefix. The visitor may return false to stop early.
  ScanStatus Scan(const std::function<bool(const nlohmann::json&, std::uint64_t offset)>& visitor,
                  std::uint64_t* valid_bytes, std::string* error) const;

  // Cuts a torn tail left by a crash so later appends stay readable.
  bool TruncateTo(std::uint64_t size, std::string* error);

  // A failed append is rolled back to the previous end of file. If that
  // rollback fails too, TailDirty() turns true and every later append is
  // refused until a TruncateTo() repairs the tail.
  bool Append(const nlohmann::json& record, std::uint64_t* out_offset, std::string* error);
  bool TailDirty() const noexcept { return tail_dirty_; }
  bool ReadAt(std::uint64_t offset, nlohmann::json* record, std::string* error) const;

 private:
  std::filesystem::path path_;
  bool tail_dirty_{false};
};

}  // namespace rollout::storage
