#pragma once

#include "engine/MonitoringEngine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/LinuxNetworkEnvironment.hpp"
#include "infrastructure/network/ProbeService.hpp"

#include <filesystem>
#include <memory>

namespace lanwatch::app {

/**
 * @brief Wires configuration, logging, probes and the engine together.
 *
 * run() sweeps the local subnet once, watches every device found online and
 * then supervises them until SIGINT or SIGTERM.
 */
class Application {
public:
    /**
     * @param configDir Directory holding config.json and the log file.
     */
    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    engine::MonitoringEngine& engine() { return *engine_; }

    /**
     * @brief Translates the configuration file into engine tunables.
     */
    static engine::EngineOptions engineOptions(const infra::AppConfig& config);

    /**
     * @brief Resolves the configuration directory from the environment.
     *
     * LANWATCH_CONFIG_DIR wins, then $XDG_CONFIG_HOME/lanwatch, then
     * $HOME/.config/lanwatch, then ./lanwatch.
     */
    static std::filesystem::path defaultConfigDir();

private:
    void initializeLogging();
    void initializeComponents();
    void watchDiscovered(const engine::ScanOutcome& outcome);

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::ProbeService> probeService_;
    std::unique_ptr<infra::LinuxNetworkEnvironment> environment_;
    std::unique_ptr<engine::MonitoringEngine> engine_;
};

} // namespace lanwatch::app
