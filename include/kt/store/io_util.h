#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "kt/error.h"

namespace kt::store {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place. Readers see either the old contents or the new, never a mix.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Whole-file read. std::nullopt when the file does not exist; kt::Error{IO}
// for any other failure.
std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path);

// Removes the file if present. Missing files are not an error.
void RemoveFileIfExists(const std::filesystem::path& path);

}  // namespace kt::store
