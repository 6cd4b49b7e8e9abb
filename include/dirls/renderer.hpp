#pragma once

#include "dirls/config.hpp"
#include "dirls/entry.hpp"
#include "dirls/identity.hpp"
#include "dirls/theme.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace dirls {

class Renderer {
public:
    Renderer(RenderOptions options, const IdentityResolver& identities, const Theme& theme);

    [[nodiscard]] std::string format_line(const Entry& entry) const;

    // "total N" for a long listing of `entries`.
    [[nodiscard]] std::string format_total(std::span<const Entry> entries) const;

private:
    RenderOptions options_;
    const IdentityResolver& identities_;
    const Theme& theme_;

    [[nodiscard]] std::string format_name(const Entry& entry) const;
    [[nodiscard]] std::string format_with_size(const Entry& entry) const;
    [[nodiscard]] std::string format_long(const Entry& entry) const;
    [[nodiscard]] std::string format_size(const Entry& entry) const;
    [[nodiscard]] std::string owner_display(std::uint32_t uid) const;
    [[nodiscard]] std::string group_display(std::uint32_t gid) const;
};

} // namespace dirls
