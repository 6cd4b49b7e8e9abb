#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "dirls/logger.hpp"

namespace dirls {

class ScopedTimer {
public:
    explicit ScopedTimer(std::string label, Logger::Level level = Logger::Level::Debug)
        : label_(std::move(label))
        , level_(level)
        , start_(std::chrono::steady_clock::now()) {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        const auto micros = elapsed.count();
        Logger::instance().log(level_, "{} took {} us", label_, micros);
    }

private:
    std::string label_;
    Logger::Level level_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace dirls
