#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rollout::util {

// Fills `out` from the kernel CSPRNG (getrandom, falling back to
// /dev/urandom). Returns false and sets `error` when neither is usable.
bool FillRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Random RFC 4122 version 4 identifier in canonical lower-case form
// (8-4-4-4-12). Throws std::runtime_error if no entropy source is usable.
std::string NewUuid();

// True for a canonical 36-character UUID (either case).
bool IsUuid(std::string_view text);

// Lower-cases a UUID and inserts dashes into the 32-digit compact form.
// Returns an empty string when `text` is not a UUID in either form.
std::string CleanUuid(std::string_view text);

}  // namespace rollout::util
