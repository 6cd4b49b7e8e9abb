#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dirls {

enum class EntryKind {
    Regular,
    Directory,
    Symlink,
    Other,
};

// Raw metadata as reported by lstat(2).
struct EntryStat {
    EntryKind kind{EntryKind::Regular};
    std::uint32_t mode{0};
    std::uintmax_t size{0};
    std::uintmax_t links{1};
    std::uintmax_t blocks{0};
    std::uint32_t uid{0};
    std::uint32_t gid{0};
    std::optional<std::chrono::system_clock::time_point> mtime{};
};

class Entry {
public:
    Entry(std::filesystem::path path, const EntryStat& stat,
        std::optional<std::filesystem::path> symlink_target = std::nullopt);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] EntryKind kind() const noexcept { return stat_.kind; }
    [[nodiscard]] std::uint32_t mode() const noexcept { return stat_.mode; }
    [[nodiscard]] std::uintmax_t size() const noexcept { return stat_.size; }
    [[nodiscard]] std::uintmax_t links() const noexcept { return stat_.links; }
    [[nodiscard]] std::uintmax_t blocks() const noexcept { return stat_.blocks; }
    [[nodiscard]] std::uint32_t uid() const noexcept { return stat_.uid; }
    [[nodiscard]] std::uint32_t gid() const noexcept { return stat_.gid; }
    [[nodiscard]] const std::optional<std::chrono::system_clock::time_point>& mtime() const noexcept {
        return stat_.mtime;
    }
    [[nodiscard]] const std::optional<std::filesystem::path>& symlink_target() const noexcept {
        return symlink_target_;
    }

    // Missing timestamps sort and print as the epoch.
    [[nodiscard]] std::chrono::system_clock::time_point mtime_or_epoch() const noexcept;

    [[nodiscard]] bool is_directory() const noexcept { return stat_.kind == EntryKind::Directory; }
    [[nodiscard]] bool is_symlink() const noexcept { return stat_.kind == EntryKind::Symlink; }
    [[nodiscard]] bool is_hidden() const noexcept;

private:
    std::filesystem::path path_;
    std::string name_;
    EntryStat stat_;
    std::optional<std::filesystem::path> symlink_target_;
};

} // namespace dirls
