#pragma once

#include "dirls/logger.hpp"

#include <string>
#include <vector>

namespace dirls {

struct SortConfig {
    bool by_time{false};
    bool reverse{false};
};

enum class Format {
    Name,
    WithSize,
    Long,
};

struct RenderOptions {
    Format format{Format::Name};
    bool human_readable{false};
};

struct ListingOptions {
    bool show_hidden{false};
    bool recursive{false};
    SortConfig sort{};
    RenderOptions render{};
};

enum class ColorPolicy {
    Auto,
    Always,
    Never,
};

class Config {
public:
    struct Data {
        bool long_format{false};
        bool all{false};
        bool size{false};
        bool human_readable{false};
        bool recursive{false};
        bool sort_time{false};
        bool reverse{false};
        bool one_column{false};

        ColorPolicy color_policy{ColorPolicy::Auto};
        Logger::Level log_level{Logger::Level::Error};

        std::vector<std::string> paths{};
    };

    Config() = default;
    explicit Config(Data data);

    [[nodiscard]] const Data& data() const noexcept { return data_; }
    [[nodiscard]] Data& data() noexcept { return data_; }

    [[nodiscard]] Format format() const noexcept;
    [[nodiscard]] SortConfig sort_config() const noexcept;
    [[nodiscard]] RenderOptions render_options() const noexcept;
    [[nodiscard]] ListingOptions listing_options() const noexcept;

private:
    Data data_{};
};

} // namespace dirls
