#include "dirls/fs_scanner.hpp"

#include "dirls/logger.hpp"
#include "dirls/metadata.hpp"
#include "dirls/string_utils.hpp"

#include <string>
#include <utility>

namespace dirls {

FileSystemScanner::FileSystemScanner() = default;

std::vector<Entry> FileSystemScanner::scan(const std::filesystem::path& path, bool show_hidden,
    ErrorLog& entry_errors, std::error_code& ec) const {
    std::vector<Entry> entries;
    ec.clear();
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return entries;
    }

    auto& logger = Logger::instance();
    std::size_t skipped = 0;
    while (it != std::filesystem::directory_iterator{}) {
        const auto child = it->path();
        if (!show_hidden && string_utils::is_hidden(child.filename().string())) {
            ++skipped;
        } else {
            std::error_code entry_ec;
            auto entry = read_entry(child, entry_ec);
            if (entry) {
                entries.push_back(std::move(*entry));
            } else {
                logger.warn("failed to inspect {}: {}", child.string(), entry_ec.message());
                entry_errors.record(child, ErrorKind::EntryMetadata, entry_ec);
            }
        }

        std::error_code step_ec;
        it.increment(step_ec);
        if (step_ec) {
            logger.warn("directory iteration aborted in {}: {}", path.string(), step_ec.message());
            entry_errors.record(path, classify_path_error(step_ec), step_ec);
            break;
        }
    }

    logger.debug("scanned {}: {} entries, {} hidden skipped", path.string(), entries.size(), skipped);
    return entries;
}

std::optional<Entry> FileSystemScanner::stat_path(const std::filesystem::path& path, std::error_code& ec) const {
    return read_entry(path, ec);
}

} // namespace dirls
