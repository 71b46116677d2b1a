#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

namespace rollout::util {

// Atomically replace `path` with the serialized document: the JSON is
// written to a temp file in the same directory, flushed, fsync'd and renamed
// into place, so readers see either the old or the new document.
bool AtomicWriteJson(const std::filesystem::path& path, const nlohmann::json& document,
                     std::string* error = nullptr);

// Loads a JSON document. A missing file is not an error: `*missing` is set
// and `document` is left untouched. Parse failures return false.
bool ReadJsonFile(const std::filesystem::path& path, nlohmann::json* document, bool* missing,
                  std::string* error = nullptr);

}  // namespace rollout::util
