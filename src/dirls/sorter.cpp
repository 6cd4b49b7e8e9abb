#include "dirls/sorter.hpp"

#include "dirls/string_utils.hpp"

#include <algorithm>
#include <compare>
#include <string>

namespace dirls {

void sort_entries(std::vector<Entry>& entries, const SortConfig& config) {
    const auto compare_key = [&config](const Entry& a, const Entry& b) {
        if (config.by_time) {
            return b.mtime_or_epoch() <=> a.mtime_or_epoch();
        }
        return string_utils::to_lower(a.name()) <=> string_utils::to_lower(b.name());
    };

    std::ranges::stable_sort(entries, [&](const Entry& a, const Entry& b) {
        const auto order = compare_key(a, b);
        return config.reverse ? order > 0 : order < 0;
    });
}

void sort_subdirectories(std::vector<std::reference_wrapper<const Entry>>& dirs) {
    std::ranges::stable_sort(dirs, [](const Entry& a, const Entry& b) {
        return a.name() < b.name();
    });
}

} // namespace dirls
