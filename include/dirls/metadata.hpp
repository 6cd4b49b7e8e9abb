#pragma once

#include "dirls/entry.hpp"

#include <filesystem>
#include <optional>
#include <system_error>

namespace dirls {

// Snapshots the path with lstat(2); symlinks are described, not followed.
[[nodiscard]] std::optional<Entry> read_entry(const std::filesystem::path& path, std::error_code& ec);

} // namespace dirls
