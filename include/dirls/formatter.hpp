#pragma once

#include "dirls/entry.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace dirls::formatter {

inline constexpr std::uintmax_t kBlockBytes = 512;
inline constexpr std::uintmax_t kKibibyte = 1024;

inline char type_char(EntryKind kind) {
    switch (kind) {
    case EntryKind::Directory:
        return 'd';
    case EntryKind::Symlink:
        return 'l';
    case EntryKind::Regular:
    case EntryKind::Other:
        break;
    }
    return '-';
}

// Type character followed by the owner/group/other rwx triplets.
inline std::string permissions(EntryKind kind, std::uint32_t mode) {
    std::string out;
    out.reserve(10);
    out.push_back(type_char(kind));
    for (int shift = 6; shift >= 0; shift -= 3) {
        const auto bits = (mode >> shift) & 07u;
        out.push_back((bits & 04u) != 0 ? 'r' : '-');
        out.push_back((bits & 02u) != 0 ? 'w' : '-');
        out.push_back((bits & 01u) != 0 ? 'x' : '-');
    }
    return out;
}

inline std::uintmax_t ceil_div(std::uintmax_t value, std::uintmax_t divisor) {
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

// 512-byte blocks expressed in KiB, rounded up.
inline std::uintmax_t blocks_to_kib(std::uintmax_t blocks) {
    return ceil_div(blocks * kBlockBytes, kKibibyte);
}

inline std::string block_size(std::uintmax_t blocks) {
    return std::format("{:>8}", blocks_to_kib(blocks));
}

inline std::string human_size(std::uintmax_t size) {
    static constexpr std::array<std::string_view, 6> units{"", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(size);
    std::size_t idx = 0;
    while (value >= 1024.0 && idx + 1 < units.size()) {
        value /= 1024.0;
        ++idx;
    }
    if (idx == 0) {
        return std::format("{:>4}", size);
    }
    if (value >= 10.0) {
        return std::format("{:>3.0f}{}", value, units[idx]);
    }
    return std::format("{:>3.1f}{}", value, units[idx]);
}

// "%b %d %H:%M" in local time.
[[nodiscard]] std::string timestamp(std::chrono::system_clock::time_point time);

} // namespace dirls::formatter
