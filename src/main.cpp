#include "toolhub/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    toolhub::cli::App app;
    return app.run(argc, argv);
}
