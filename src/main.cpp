#include "app/Application.hpp"

#include <spdlog/spdlog.h>

int main() {
    try {
        lanwatch::app::Application app(lanwatch::app::Application::defaultConfigDir());
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
