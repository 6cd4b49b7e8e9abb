#pragma once

#include "dirls/entry.hpp"

#include <string>
#include <string_view>

namespace dirls {

class Theme {
public:
    explicit Theme(bool use_color);

    [[nodiscard]] bool use_color() const noexcept;

    [[nodiscard]] std::string_view color_for(const Entry& entry) const;
    [[nodiscard]] std::string paint(const Entry& entry, std::string_view text) const;

    static constexpr std::string_view reset_color() noexcept { return "\033[0m"; }

private:
    bool use_color_{false};
};

} // namespace dirls
