#include "dirls/platform.hpp"

#include <cstdlib>

#include <unistd.h>

namespace dirls::platform {

bool stdout_is_tty() {
    return ::isatty(STDOUT_FILENO) != 0;
}

bool supports_color(ColorPolicy policy) {
    switch (policy) {
    case ColorPolicy::Always:
        return true;
    case ColorPolicy::Never:
        return false;
    case ColorPolicy::Auto:
        break;
    }
    if (const char* no_color = std::getenv("NO_COLOR"); no_color != nullptr && *no_color != '\0') {
        return false;
    }
    return stdout_is_tty();
}

} // namespace dirls::platform
