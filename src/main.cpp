#include "dirls/app.hpp"

int main(int argc, char** argv) {
    dirls::App app;
    return app.run(argc, argv);
}
