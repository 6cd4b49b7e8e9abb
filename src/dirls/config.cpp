#include "dirls/config.hpp"

#include <utility>

namespace dirls {

Config::Config(Data data)
    : data_{std::move(data)} {}

Format Config::format() const noexcept {
    if (data_.long_format) {
        return Format::Long;
    }
    if (data_.size) {
        return Format::WithSize;
    }
    return Format::Name;
}

SortConfig Config::sort_config() const noexcept {
    return SortConfig{data_.sort_time, data_.reverse};
}

RenderOptions Config::render_options() const noexcept {
    return RenderOptions{format(), data_.human_readable};
}

ListingOptions Config::listing_options() const noexcept {
    return ListingOptions{data_.all, data_.recursive, sort_config(), render_options()};
}

} // namespace dirls
