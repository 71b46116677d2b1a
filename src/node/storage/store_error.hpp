#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace rollout::storage {

enum class StoreErrorKind {
  kNone,
  kNotFound,
  kIo,
  kCorrupt,
  kConflict,
  kInvalid,
  // The record was stored but the follow-up work item could not be queued.
  kEnqueue,
};

struct StoreError {
  StoreErrorKind kind{StoreErrorKind::kNone};
  std::string message;
};

inline std::string_view StoreErrorKindName(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::kNone:
      return "none";
    case StoreErrorKind::kNotFound:
      return "not found";
    case StoreErrorKind::kIo:
      return "i/o error";
    case StoreErrorKind::kCorrupt:
      return "corrupt";
    case StoreErrorKind::kConflict:
      return "conflict";
    case StoreErrorKind::kInvalid:
      return "invalid";
    case StoreErrorKind::kEnqueue:
      return "enqueue failed";
  }
  return "unknown";
}

// Sets `*error` when the caller asked for it; always returns false so call
// sites can `return Fail(...)`.
inline bool Fail(StoreError* error, StoreErrorKind kind, std::string message) {
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace rollout::storage
