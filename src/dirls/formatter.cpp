#include "dirls/formatter.hpp"

#include <ctime>

namespace dirls::formatter {

std::string timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    if (::localtime_r(&seconds, &tm) == nullptr) {
        return {};
    }
    char buffer[64]{};
    if (std::strftime(buffer, sizeof(buffer), "%b %d %H:%M", &tm) == 0) {
        return {};
    }
    return std::string(buffer);
}

} // namespace dirls::formatter
