#include "dirls/renderer.hpp"

#include "dirls/formatter.hpp"

#include <format>
#include <string>

namespace dirls {

Renderer::Renderer(RenderOptions options, const IdentityResolver& identities, const Theme& theme)
    : options_{options}
    , identities_{identities}
    , theme_{theme} {}

std::string Renderer::format_line(const Entry& entry) const {
    switch (options_.format) {
    case Format::Name:
        return format_name(entry);
    case Format::WithSize:
        return format_with_size(entry);
    case Format::Long:
        return format_long(entry);
    }
    return format_name(entry);
}

std::string Renderer::format_total(std::span<const Entry> entries) const {
    std::uintmax_t blocks = 0;
    for (const auto& entry : entries) {
        blocks += entry.blocks();
    }
    return std::format("total {}", formatter::blocks_to_kib(blocks));
}

std::string Renderer::format_name(const Entry& entry) const {
    return theme_.paint(entry, entry.name());
}

std::string Renderer::format_with_size(const Entry& entry) const {
    const auto size = options_.human_readable ? formatter::human_size(entry.size())
                                              : formatter::block_size(entry.blocks());
    return std::format("{} {}", size, format_name(entry));
}

std::string Renderer::format_long(const Entry& entry) const {
    const auto perms = formatter::permissions(entry.kind(), entry.mode());
    const auto links = entry.links();
    const auto owner = owner_display(entry.uid());
    const auto group = group_display(entry.gid());
    const auto size = format_size(entry);
    const auto time = formatter::timestamp(entry.mtime_or_epoch());

    std::string name = format_name(entry);
    if (const auto& target = entry.symlink_target()) {
        name += " -> ";
        name += target->string();
    }
    return std::format("{} {:>3} {} {} {:>8} {} {}", perms, links, owner, group, size, time, name);
}

std::string Renderer::format_size(const Entry& entry) const {
    if (options_.human_readable) {
        return formatter::human_size(entry.size());
    }
    return std::to_string(entry.size());
}

std::string Renderer::owner_display(std::uint32_t uid) const {
    return identities_.user_name(uid).value_or(std::to_string(uid));
}

std::string Renderer::group_display(std::uint32_t gid) const {
    return identities_.group_name(gid).value_or(std::to_string(gid));
}

} // namespace dirls
