#pragma once

#include "dirls/config.hpp"

#include <memory>
#include <optional>

namespace CLI {
class App;
}

namespace dirls {

class Cli {
public:
    Cli();
    ~Cli();

    Cli(const Cli&) = delete;
    Cli& operator=(const Cli&) = delete;

    // Returns an exit code when the process should stop (help, version or a
    // parse error), or std::nullopt when `config` is ready for listing.
    [[nodiscard]] std::optional<int> parse(int argc, const char* const* argv, Config& config);

private:
    std::unique_ptr<CLI::App> app_;
};

} // namespace dirls
