#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    netledger::app::CommandLineOptions options;
    try {
        options = netledger::app::CommandLineOptions::parse({argv + 1, argv + argc});
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << netledger::app::CommandLineOptions::usage();
        return 2;
    }

    if (options.help) {
        std::cout << netledger::app::CommandLineOptions::usage();
        return 0;
    }

    try {
        netledger::app::Application app(std::move(options));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
