#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        snmpwire::app::Application app(argc, argv);
        return app.run();
    } catch (const snmpwire::app::UsageError& e) {
        std::cerr << "snmpwire: " << e.what() << "\n\n" << snmpwire::app::usage();
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
