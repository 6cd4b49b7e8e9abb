#include "dirls/lister.hpp"

#include "dirls/logger.hpp"
#include "dirls/perf.hpp"
#include "dirls/sorter.hpp"

#include <format>
#include <functional>
#include <utility>

namespace dirls {

Lister::Lister(const ListingOptions& options, const FileSystemScanner& scanner, const Renderer& renderer,
    std::ostream& out, std::ostream& err)
    : options_{options}
    , scanner_{scanner}
    , renderer_{renderer}
    , out_{out}
    , err_{err} {}

ErrorLog Lister::run(const std::vector<std::filesystem::path>& roots) const {
    ErrorLog errors;
    const bool print_header = roots.size() > 1;
    bool first_output = true;
    for (const auto& root : roots) {
        if (list_root(root, print_header, !first_output, errors)) {
            first_output = false;
        }
    }
    Logger::instance().debug("listed {} root(s), {} unresolved", roots.size(), errors.size());
    return errors;
}

bool Lister::list_root(const std::filesystem::path& root, bool print_header, bool separate,
    ErrorLog& errors) const {
    std::error_code ec;
    const auto status = std::filesystem::status(root, ec);
    if (!ec && std::filesystem::is_directory(status)) {
        list_directory(root, 0, print_header, separate, ec);
        if (ec) {
            errors.record(root, classify_path_error(ec), ec);
            return false;
        }
        return true;
    }

    // Anything else, including a dangling symlink, is described by lstat.
    auto entry = scanner_.stat_path(root, ec);
    if (!entry) {
        errors.record(root, classify_path_error(ec), ec);
        return false;
    }
    if (separate) {
        out_ << '\n';
    }
    out_ << renderer_.format_line(*entry) << '\n';
    return true;
}

void Lister::list_directory(const std::filesystem::path& dir, std::size_t depth, bool print_header,
    bool separate, std::error_code& ec) const {
    ScopedTimer timer{std::format("list {}", dir.string()), Logger::Level::Trace};

    ErrorLog entry_errors;
    auto entries = scanner_.scan(dir, options_.show_hidden, entry_errors, ec);
    if (ec) {
        return;
    }

    if (separate) {
        out_ << '\n';
    }
    if (print_header || depth > 0) {
        out_ << dir.string() << ":\n";
    }

    sort_entries(entries, options_.sort);
    if (options_.render.format == Format::Long) {
        out_ << renderer_.format_total(entries) << '\n';
    }
    for (const auto& entry : entries) {
        out_ << renderer_.format_line(entry) << '\n';
    }
    entry_errors.flush(err_);

    if (!options_.recursive) {
        return;
    }

    std::vector<std::reference_wrapper<const Entry>> dirs;
    for (const auto& entry : entries) {
        if (entry.is_directory() && !entry.is_hidden()) {
            dirs.emplace_back(entry);
        }
    }
    sort_subdirectories(dirs);

    std::vector<std::filesystem::path> subdirs;
    subdirs.reserve(dirs.size());
    for (const Entry& entry : dirs) {
        subdirs.push_back(entry.path());
    }
    dirs.clear();
    entries.clear();

    descend(subdirs, depth + 1);
}

void Lister::descend(const std::vector<std::filesystem::path>& subdirs, std::size_t depth) const {
    for (const auto& subdir : subdirs) {
        Logger::instance().trace("descending into {} at depth {}", subdir.string(), depth);
        std::error_code ec;
        list_directory(subdir, depth, true, true, ec);
        if (ec) {
            ErrorLog failure;
            failure.record(subdir, classify_path_error(ec), ec);
            failure.flush(err_);
        }
    }
}

} // namespace dirls
