#include "dirls/cli.hpp"

#include "dirls/logger.hpp"

#include <CLI/CLI.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <utility>

namespace dirls {

namespace {

constexpr const char* kVersion = "dirls version 1.0.0";

ColorPolicy parse_color_policy(const std::string& value) {
    static const std::map<std::string, ColorPolicy, std::less<>> table{
        {"auto", ColorPolicy::Auto},
        {"always", ColorPolicy::Always},
        {"never", ColorPolicy::Never},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        throw CLI::ValidationError("--color", "invalid value: " + value);
    }
    return it->second;
}

} // namespace

Cli::Cli() = default;

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, const char* const* argv, Config& config) {
    Config::Data data{};
    std::string color{"auto"};
    std::string log_level{"error"};

    app_ = std::make_unique<CLI::App>("List directory contents");
    // -h belongs to --human-readable, as in ls.
    app_->set_help_flag("--help", "Print this help message and exit");

    auto* version_flag = app_->add_flag("-V,--version", "Print version information and exit");

    app_->add_flag("-l,--long", data.long_format, "Use a long listing format");
    app_->add_flag("-a,--all", data.all, "Show hidden entries (names starting with .)");
    app_->add_flag("-s,--size", data.size, "Print the allocated size of each file, in KiB");
    app_->add_flag("-h,--human-readable", data.human_readable, "Print sizes like 1.5K, 234M, 2.0G");
    app_->add_flag("-R,--recursive", data.recursive, "List subdirectories recursively");
    app_->add_flag("-t", data.sort_time, "Sort by modification time, newest first");
    app_->add_flag("-r,--reverse", data.reverse, "Reverse order while sorting");
    app_->add_flag("-1", data.one_column, "List one entry per line");

    app_->add_option("--color", color, "Colorize names (auto, always, never)")
        ->type_name("WHEN")
        ->default_str("auto");
    app_->add_option("--log-level", log_level, "Set diagnostic log verbosity")
        ->type_name("LEVEL")
        ->default_str("error");

    app_->add_option("paths", data.paths, "Paths to list")->type_name("PATH");

    try {
        app_->parse(argc, argv);
        data.color_policy = parse_color_policy(color);
        auto level = Logger::parse_level(log_level);
        if (!level) {
            throw CLI::ValidationError("--log-level", "invalid log level: " + log_level);
        }
        data.log_level = *level;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (*version_flag) {
        std::cout << kVersion << std::endl;
        return 0;
    }

    if (data.paths.empty()) {
        data.paths.emplace_back(".");
    }

    Logger::instance().set_level(data.log_level);
    config = Config{std::move(data)};
    return std::nullopt;
}

} // namespace dirls
