#pragma once

#include "dirls/config.hpp"

namespace dirls::platform {

[[nodiscard]] bool stdout_is_tty();

// Auto enables color on a terminal unless NO_COLOR is set.
[[nodiscard]] bool supports_color(ColorPolicy policy);

} // namespace dirls::platform
