#pragma once

#include <canopy/core/types.h>

#include <filesystem>
#include <string_view>

namespace canopy::storage::platform {

// rename(2) onto the target; replaces an existing file atomically.
Result<void> atomicRename(const std::filesystem::path& from, const std::filesystem::path& to);

// Write the whole buffer to a new file, optionally fsync'ing it before close.
Result<void> writeFileFully(const std::filesystem::path& path, std::string_view data, bool sync);

// fsync a directory so a completed rename survives power loss.
Result<void> syncDirectory(const std::filesystem::path& dir);

} // namespace canopy::storage::platform
