#pragma once

#include "dirls/config.hpp"
#include "dirls/error_log.hpp"
#include "dirls/fs_scanner.hpp"
#include "dirls/renderer.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <system_error>
#include <vector>

namespace dirls {

class Lister {
public:
    Lister(const ListingOptions& options, const FileSystemScanner& scanner, const Renderer& renderer,
        std::ostream& out, std::ostream& err);

    // Lists every root in order. Roots that cannot be resolved are returned for
    // the caller to report once all output has been written.
    [[nodiscard]] ErrorLog run(const std::vector<std::filesystem::path>& roots) const;

private:
    bool list_root(const std::filesystem::path& root, bool print_header, bool separate,
        ErrorLog& errors) const;
    void list_directory(const std::filesystem::path& dir, std::size_t depth, bool print_header,
        bool separate, std::error_code& ec) const;
    void descend(const std::vector<std::filesystem::path>& subdirs, std::size_t depth) const;

    const ListingOptions& options_;
    const FileSystemScanner& scanner_;
    const Renderer& renderer_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace dirls
