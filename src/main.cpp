#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        snmplink::app::Application app(std::vector<std::string>(argv + 1, argv + argc), std::cout);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
