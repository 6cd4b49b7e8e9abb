#pragma once

#include "dirls/config.hpp"
#include "dirls/entry.hpp"

#include <functional>
#include <vector>

namespace dirls {

// Stable; by lower-cased name, or newest first when `by_time` is set.
void sort_entries(std::vector<Entry>& entries, const SortConfig& config);

// Case-sensitive order by raw name, regardless of the display sort.
void sort_subdirectories(std::vector<std::reference_wrapper<const Entry>>& dirs);

} // namespace dirls
