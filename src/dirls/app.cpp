#include "dirls/app.hpp"

#include "dirls/config.hpp"
#include "dirls/fs_scanner.hpp"
#include "dirls/identity.hpp"
#include "dirls/lister.hpp"
#include "dirls/logger.hpp"
#include "dirls/perf.hpp"
#include "dirls/platform.hpp"
#include "dirls/renderer.hpp"
#include "dirls/theme.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

namespace dirls {

App::App() = default;

int App::run(int argc, char** argv) {
    Config config;
    if (const auto exit_code = cli_.parse(argc, argv, config)) {
        return *exit_code;
    }

    ScopedTimer timer{"dirls run"};
    const ListingOptions options = config.listing_options();

    SystemIdentityResolver identities;
    Theme theme(platform::supports_color(config.data().color_policy));
    Logger::instance().debug("color output {}", theme.use_color() ? "enabled" : "disabled");
    FileSystemScanner scanner;
    Renderer renderer(options.render, identities, theme);
    Lister lister(options, scanner, renderer, std::cout, std::cerr);

    std::vector<std::filesystem::path> roots(config.data().paths.begin(), config.data().paths.end());
    ErrorLog errors = lister.run(roots);
    std::cout.flush();
    errors.flush(std::cerr);

    return 0;
}

} // namespace dirls
