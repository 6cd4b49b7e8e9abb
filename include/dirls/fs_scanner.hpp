#pragma once

#include "dirls/entry.hpp"
#include "dirls/error_log.hpp"

#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace dirls {

class FileSystemScanner {
public:
    FileSystemScanner();

    // Lists the immediate children of `path`. Children whose metadata cannot be
    // read are skipped and recorded in `entry_errors`; `ec` is set only when the
    // directory itself cannot be opened.
    [[nodiscard]] std::vector<Entry> scan(const std::filesystem::path& path, bool show_hidden,
        ErrorLog& entry_errors, std::error_code& ec) const;

    [[nodiscard]] std::optional<Entry> stat_path(const std::filesystem::path& path, std::error_code& ec) const;
};

} // namespace dirls
