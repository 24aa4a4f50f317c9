#pragma once

#include "core/types/WatchEntry.hpp"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Discovery sweep settings.
 */
struct ScanSettings {
    int concurrency{64};              ///< Addresses probed in parallel.
    int pingTimeoutMs{1000};          ///< ICMP echo timeout.
    int portTimeoutMs{500};           ///< TCP connect timeout for fallback and service probes.
    std::vector<uint16_t> fallbackPorts{80, 443, 22, 445, 139, 53, 8080, 62078}; ///< Tried when ICMP fails.
    bool probeServicePorts{true};     ///< Probe service ports of live hosts for classification.
    std::vector<uint16_t> servicePorts{22, 80, 443, 445, 515, 554, 631, 3389, 9100, 62078};
    int timeBudgetSeconds{60};        ///< No new address is started after this.
    bool resolveHostnames{true};      ///< Reverse-resolve live hosts for display names.
    int lookupTimeoutMs{1000};        ///< Upper bound on one reverse lookup.
};

/**
 * @brief Watchlist supervision settings.
 */
struct MonitoringSettings {
    int defaultIntervalSeconds{30};   ///< Tick interval for new watch entries.
    int samplesPerTick{5};            ///< Echo probes per tick.
    int sampleSpacingMs{200};         ///< Delay between echo probes.
    int probeTimeoutMs{1000};         ///< Timeout of each echo probe.
    int maxConcurrentTicks{8};        ///< Ticks running at once across all devices.
    core::HealthThresholds thresholds; ///< State machine limits.
};

/**
 * @brief Bandwidth sampling settings.
 */
struct BandwidthSettings {
    bool enabled{false};              ///< Measure bandwidth on every tick.
    int durationMs{2000};             ///< Transfer time per measurement.
    std::string direction{"download"}; ///< "download" or "upload".
    uint16_t downloadPort{19};        ///< Character generator service port.
    uint16_t uploadPort{9};           ///< Discard service port.
    int connectTimeoutMs{2000};       ///< Handshake limit.
};

/**
 * @brief In-memory retention settings.
 */
struct MetricsSettings {
    int capacityPerDevice{720};       ///< Samples kept per device (6h at 30s).
    int recentAlertCapacity{500};     ///< Alerts kept in the activity log.
};

/**
 * @brief Log output settings.
 */
struct LoggingSettings {
    std::string level{"info"};        ///< spdlog level name for the console.
    std::string fileLevel{"debug"};   ///< spdlog level name for the log file.
    std::string fileName{"lanwatch.log"}; ///< Log file name inside the config directory.
    int maxFileSizeMb{5};             ///< Size at which the log file rotates.
    int maxFiles{3};                  ///< Rotated files kept.
};

/**
 * @brief Engine configuration settings.
 */
struct AppConfig {
    ScanSettings scan;
    MonitoringSettings monitoring;
    BandwidthSettings bandwidth;
    MetricsSettings metrics;
    LoggingSettings logging;
};

/**
 * @brief Manages configuration persistence.
 *
 * Loads and saves config.json in a configuration directory. Missing keys
 * fall back to defaults and out-of-range values are clamped on load.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded successfully, false otherwise (defaults stay in effect).
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path logPath() const;
    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    void clamp();

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace lanwatch::infra
