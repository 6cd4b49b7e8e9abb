#include "dirls/theme.hpp"

namespace dirls {

Theme::Theme(bool use_color)
    : use_color_{use_color} {}

bool Theme::use_color() const noexcept {
    return use_color_;
}

std::string_view Theme::color_for(const Entry& entry) const {
    if (!use_color_) {
        return {};
    }
    if (entry.is_directory()) {
        return "\033[34m"; // blue
    }
    if ((entry.mode() & 0111u) != 0) {
        return "\033[31m"; // red
    }
    if ((entry.mode() & 0004u) != 0) {
        return "\033[32m"; // green
    }
    return "\033[37m"; // white
}

std::string Theme::paint(const Entry& entry, std::string_view text) const {
    const auto color = color_for(entry);
    if (color.empty()) {
        return std::string{text};
    }
    std::string out;
    out.reserve(color.size() + text.size() + reset_color().size());
    out.append(color);
    out.append(text);
    out.append(reset_color());
    return out;
}

} // namespace dirls
