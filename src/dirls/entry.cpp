#include "dirls/entry.hpp"

#include "dirls/string_utils.hpp"

#include <utility>

namespace dirls {

Entry::Entry(std::filesystem::path path, const EntryStat& stat,
    std::optional<std::filesystem::path> symlink_target)
    : path_{std::move(path)}
    , stat_{stat} {
    auto filename = path_.filename();
    name_ = filename.empty() ? path_.string() : filename.string();
    if (stat_.kind == EntryKind::Symlink) {
        symlink_target_ = std::move(symlink_target);
    }
}

std::chrono::system_clock::time_point Entry::mtime_or_epoch() const noexcept {
    return stat_.mtime.value_or(std::chrono::system_clock::time_point{});
}

bool Entry::is_hidden() const noexcept {
    return string_utils::is_hidden(name_);
}

} // namespace dirls
