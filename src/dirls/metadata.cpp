#include "dirls/metadata.hpp"

#include <cerrno>
#include <chrono>

#include <sys/stat.h>
#include <sys/types.h>

namespace dirls {
namespace {

std::chrono::system_clock::time_point to_time_point(const struct ::timespec& ts) {
    using namespace std::chrono;
    const auto since_epoch = seconds{ts.tv_sec} + nanoseconds{ts.tv_nsec};
    return system_clock::time_point{duration_cast<system_clock::duration>(since_epoch)};
}

EntryKind kind_from_mode(std::uint32_t mode) noexcept {
    if (S_ISDIR(mode)) {
        return EntryKind::Directory;
    }
    if (S_ISLNK(mode)) {
        return EntryKind::Symlink;
    }
    if (S_ISREG(mode)) {
        return EntryKind::Regular;
    }
    return EntryKind::Other;
}

} // namespace

std::optional<Entry> read_entry(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    struct ::stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }

    EntryStat stat;
    stat.kind = kind_from_mode(static_cast<std::uint32_t>(st.st_mode));
    stat.mode = static_cast<std::uint32_t>(st.st_mode) & 07777u;
    stat.size = st.st_size >= 0 ? static_cast<std::uintmax_t>(st.st_size) : 0;
    stat.links = static_cast<std::uintmax_t>(st.st_nlink);
    stat.blocks = st.st_blocks >= 0 ? static_cast<std::uintmax_t>(st.st_blocks) : 0;
    stat.uid = static_cast<std::uint32_t>(st.st_uid);
    stat.gid = static_cast<std::uint32_t>(st.st_gid);
    stat.mtime = to_time_point(st.st_mtim);

    std::optional<std::filesystem::path> target;
    if (stat.kind == EntryKind::Symlink) {
        std::error_code link_ec;
        auto raw = std::filesystem::read_symlink(path, link_ec);
        if (!link_ec) {
            target = std::move(raw);
        }
    }

    return Entry{path, stat, std::move(target)};
}

} // namespace dirls
