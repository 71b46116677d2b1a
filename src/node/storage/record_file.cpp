#include "storage/record_file.hpp"

#include <array>
#include <fstream>
#include <system_error>
#include <vector>

#include <oqs/sha3.h>

namespace rollout::storage {

namespace {

constexpr std::uint32_t kRecordMagic = 0x31455652;  // 'RVE1' (little-endian uint32)
constexpr std::uint32_t kMaxRecordSize = 256 * 1024;
constexpr std::size_t kHeaderSize = 8;

using Checksum = std::array<std::uint8_t, 32>;

enum class RecordReadStatus {
  kOk,
  kEndOfFile,
  kTruncatedTail,
  kError,
};

Checksum Sha3_256(const std::vector<std::uint8_t>& data) {
  Checksum out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

bool ReadAll(std::ifstream* in, std::uint8_t* data, std::size_t len) {
  if (!in || !in->is_open()) return false;
  in->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
  return in->good();
}

bool WriteAll(std::ofstream* out, const std::uint8_t* data, std::size_t len) {
  if (!out || !out->is_open()) return false;
  out->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
  return out->good();
}

std::uint32_t DecodeU32LE(const std::uint8_t* data) {
  return static_cast<std::uint32_t>(data[0]) |
         (static_cast<std::uint32_t>(data[1]) << 8) |
         (static_cast<std::uint32_t>(data[2]) << 16) |
         (static_cast<std::uint32_t>(data[3]) << 24);
}

void EncodeU32LE(std::uint32_t value, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>(value & 0xFFu);
  out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
  out[2] = static_cast<std::uint8_t>((value >> 16) & 0xFFu);
  out[3] = static_cast<std::uint8_t>((value >> 24) & 0xFFu);
}

RecordReadStatus ReadNextRecord(std::ifstream* in, nlohmann::json* out_record,
                                std::uint64_t* out_record_bytes, std::string* error) {
  std::uint8_t header[kHeaderSize] = {0};
  in->read(reinterpret_cast<char*>(header), sizeof(header));
  if (in->gcount() == 0 && in->eof()) {
    return RecordReadStatus::kEndOfFile;
  }
  if (!in->good()) {
    // Partial header: the writer died mid-append.
    return RecordReadStatus::kTruncatedTail;
  }
  const std::uint32_t magic = DecodeU32LE(header);
  const std::uint32_t size = DecodeU32LE(header + 4);
  if (magic != kRecordMagic || size == 0 || size > kMaxRecordSize) {
    if (error) *error = "bad record header";
    return RecordReadStatus::kError;
  }
  Checksum expected{};
  if (!ReadAll(in, expected.data(), expected.size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  std::vector<std::uint8_t> buffer(size);
  if (!ReadAll(in, buffer.data(), buffer.size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  if (Sha3_256(buffer) != expected) {
    if (error) *error = "record checksum mismatch";
    return RecordReadStatus::kError;
  }
  auto parsed = nlohmann::json::parse(buffer.begin(), buffer.end(), nullptr, false);
  if (parsed.is_discarded()) {
    if (error) *error = "record payload is not valid JSON";
    return RecordReadStatus::kError;
  }
  if (out_record) {
    *out_record = std::move(parsed);
  }
  if (out_record_bytes) {
    *out_record_bytes = kHeaderSize + expected.size() + size;
  }
  return RecordReadStatus::kOk;
}

}  // namespace

RecordFile::RecordFile(std::filesystem::path path) : path_(std::move(path)) {}

RecordFile::ScanStatus RecordFile::Scan(
    const std::function<bool(const nlohmann::json&, std::uint64_t offset)>& visitor,
    std::uint64_t* valid_bytes, std::string* error) const {
  if (valid_bytes) {
    *valid_bytes = 0;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return ec ? ScanStatus::kIoError : ScanStatus::kOk;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "unable to open " + path_.string();
    return ScanStatus::kIoError;
  }
  std::uint64_t offset = 0;
  while (true) {
    nlohmann::json record;
    std::uint64_t record_bytes = 0;
    std::string read_error;
    const auto status = ReadNextRecord(&in, &record, &record_bytes, &read_error);
    if (status == RecordReadStatus::kEndOfFile || status == RecordReadStatus::kTruncatedTail) {
      break;
    }
    if (status != RecordReadStatus::kOk) {
      if (error) {
        *error = path_.string() + ": " + read_error + " at offset " + std::to_string(offset);
      }
      return ScanStatus::kCorrupt;
    }
    if (!visitor(record, offset)) {
      offset += record_bytes;
      break;
    }
    offset += record_bytes;
  }
  if (valid_bytes) {
    *valid_bytes = offset;
  }
  return ScanStatus::kOk;
}

bool RecordFile::TruncateTo(std::uint64_t size, std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec) ||
      (std::filesystem::file_size(path_, ec) == size && !ec)) {
    tail_dirty_ = false;
    return true;
  }
  std::filesystem::resize_file(path_, size, ec);
  if (ec) {
    if (error) *error = "failed to truncate " + path_.string() + ": " + ec.message();
    return false;
  }
  tail_dirty_ = false;
  return true;
}

bool RecordFile::Append(const nlohmann::json& record, std::uint64_t* out_offset,
                        std::string* error) {
  const std::string text = record.dump();
  const std::vector<std::uint8_t> buffer(text.begin(), text.end());
  if (buffer.empty() || buffer.size() > kMaxRecordSize) {
    if (error) *error = "record size out of range";
    return false;
  }
  const auto checksum = Sha3_256(buffer);

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  if (tail_dirty_) {
    if (error) *error = path_.string() + " has an unrepaired partial record at its tail";
    return false;
  }
  // Unbuffered, so nothing is left pending in the stream once a write fails.
  std::ofstream out;
  out.rdbuf()->pubsetbuf(nullptr, 0);
  out.open(path_, std::ios::binary | std::ios::app);
  if (!out.is_open()) {
    if (error) *error = "unable to open " + path_.string() + " for append";
    return false;
  }
  out.seekp(0, std::ios::end);
  const auto pos = out.tellp();
  if (pos < 0) {
    if (error) *error = "unable to determine append offset";
    return false;
  }
  std::uint8_t header[kHeaderSize];
  EncodeU32LE(kRecordMagic, header);
  EncodeU32LE(static_cast<std::uint32_t>(buffer.size()), header + 4);
  std::string failure;
  if (!WriteAll(&out, header, sizeof(header)) ||
      !WriteAll(&out, checksum.data(), checksum.size()) ||
      !WriteAll(&out, buffer.data(), buffer.size())) {
    failure = "short write to " + path_.string();
  } else {
    out.flush();
    if (!out.good()) {
      failure = "flush failed for " + path_.string();
    }
  }
  if (!failure.empty()) {
    out.close();
    // Cut the partial frame so the next record starts on a boundary.
    std::string truncate_error;
    if (!TruncateTo(static_cast<std::uint64_t>(pos), &truncate_error)) {
      tail_dirty_ = true;
      failure += "; " + truncate_error;
    }
    if (error) *error = failure;
    return false;
  }
  if (out_offset) {
    *out_offset = static_cast<std::uint64_t>(pos);
  }
  return true;
}

bool RecordFile::ReadAt(std::uint64_t offset, nlohmann::json* record, std::string* error) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "unable to open " + path_.string();
    return false;
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in.good()) {
    if (error) *error = "seek failed";
    return false;
  }
  std::string read_error;
  const auto status = ReadNextRecord(&in, record, nullptr, &read_error);
  if (status != RecordReadStatus::kOk) {
    if (error) {
      *error = read_error.empty() ? "incomplete record at offset " + std::to_string(offset)
                                  : read_error;
    }
    return false;
  }
  return true;
}

}  // namespace rollout::storage
