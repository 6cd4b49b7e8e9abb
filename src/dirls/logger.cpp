#include "dirls/logger.hpp"

#include <functional>
#include <iostream>
#include <map>

namespace dirls {

Logger& Logger::instance() {
    static Logger logger;
    static bool initialized = [] {
        logger.set_output_stream(&std::cerr);
        return true;
    }();
    (void)initialized;
    return logger;
}

void Logger::set_level(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }

Logger::Level Logger::level() const noexcept { return level_.load(std::memory_order_relaxed); }

void Logger::set_output_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) {
    static const std::map<std::string, Level, std::less<>> table{
        {"error", Level::Error},
        {"warn", Level::Warn},
        {"warning", Level::Warn},
        {"info", Level::Info},
        {"debug", Level::Debug},
        {"trace", Level::Trace},
    };
    auto it = table.find(name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dirls
