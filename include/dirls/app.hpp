#pragma once

#include "dirls/cli.hpp"

namespace dirls {

class App {
public:
    App();
    int run(int argc, char** argv);

private:
    Cli cli_;
};

} // namespace dirls
