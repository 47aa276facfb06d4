#include "cli.hpp"
#include "util.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // Logger first, so nothing can fail before there is a sink for it
    auto logger = util::setup_logging(util::get_env_var("LOG_LEVEL", "warn"));

    return run_cli(argc, argv, logger, std::cin, std::cout, std::cerr);
}
