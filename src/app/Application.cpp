#include "app/Application.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>

namespace lanwatch::app {

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (engine_) {
        engine_->stop();
    }
    // Components log while they shut down.
    engine_.reset();
    environment_.reset();
    probeService_.reset();
    spdlog::shutdown();
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* dir = std::getenv("LANWATCH_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "lanwatch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "lanwatch";
    }
    return std::filesystem::current_path() / "lanwatch";
}

void Application::initializeLogging() {
    const auto& logging = config_->config().logging;
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(logging.level));

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), static_cast<size_t>(logging.maxFileSizeMb) * 1024 * 1024,
        static_cast<size_t>(logging.maxFiles));
    fileSink->set_level(spdlog::level::from_str(logging.fileLevel));

    auto logger =
        std::make_shared<spdlog::logger>("lanwatch", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("LanWatch starting...");
    spdlog::info("Config file: {}", config_->configPath().string());
    spdlog::info("Log file: {}", logPath.string());
}

engine::EngineOptions Application::engineOptions(const infra::AppConfig& config) {
    using std::chrono::milliseconds;

    engine::EngineOptions options;

    // Discovery
    const auto& scan = config.scan;
    options.scanConcurrency = static_cast<size_t>(scan.concurrency);
    options.discovery.pingTimeout = milliseconds(scan.pingTimeoutMs);
    options.discovery.portTimeout = milliseconds(scan.portTimeoutMs);
    options.discovery.fallbackPorts = scan.fallbackPorts;
    options.discovery.probeServicePorts = scan.probeServicePorts;
    options.discovery.servicePorts = scan.servicePorts;
    options.discovery.timeBudget = std::chrono::seconds(scan.timeBudgetSeconds);
    options.discovery.resolveHostnames = scan.resolveHostnames;
    options.discovery.lookupTimeout = milliseconds(scan.lookupTimeoutMs);

    // Monitoring
    const auto& monitoring = config.monitoring;
    options.defaultInterval = std::chrono::seconds(monitoring.defaultIntervalSeconds);
    options.probeTimeout = milliseconds(monitoring.probeTimeoutMs);
    options.monitoring.samplesPerTick = monitoring.samplesPerTick;
    options.monitoring.sampleSpacing = milliseconds(monitoring.sampleSpacingMs);
    options.monitoring.maxConcurrentTicks = static_cast<size_t>(monitoring.maxConcurrentTicks);
    options.monitoring.thresholds = monitoring.thresholds;

    if (config.bandwidth.enabled) {
        engine::BandwidthRequest request;
        request.direction = core::bandwidthDirectionFromString(config.bandwidth.direction);
        request.duration = milliseconds(config.bandwidth.durationMs);
        request.connectTimeout = milliseconds(config.bandwidth.connectTimeoutMs);
        options.monitoring.bandwidth = request;
    }

    // Retention
    options.metricsCapacity = static_cast<size_t>(config.metrics.capacityPerDevice);
    options.recentAlertCapacity = static_cast<size_t>(config.metrics.recentAlertCapacity);

    return options;
}

void Application::initializeComponents() {
    const auto& config = config_->config();

    infra::ProbeService::Options probeOptions;
    probeOptions.downloadPort = config.bandwidth.downloadPort;
    probeOptions.uploadPort = config.bandwidth.uploadPort;
    probeOptions.connectTimeout = std::chrono::milliseconds(config.bandwidth.connectTimeoutMs);
    probeService_ = std::make_unique<infra::ProbeService>(probeOptions);

    environment_ = std::make_unique<infra::LinuxNetworkEnvironment>();

    engine_ = std::make_unique<engine::MonitoringEngine>(*probeService_, *environment_,
                                                         engineOptions(config));

    engine_->subscribeAlerts([](const core::AlertEvent& event) {
        nlohmann::json j = event;
        spdlog::debug("alert {}", j.dump());
    });

    spdlog::info("Application components initialized");
}

void Application::watchDiscovered(const engine::ScanOutcome& outcome) {
    if (!outcome.succeeded()) {
        spdlog::error("Initial scan of {} failed: {}", outcome.range, outcome.errorMessage);
        return;
    }

    for (const auto& device : outcome.devices) {
        if (device.reachability != core::Reachability::Online) {
            continue;
        }
        try {
            engine_->addWatch(device.address);
        } catch (const core::EngineError& e) {
            spdlog::warn("Cannot watch {}: {}", device.address, e.what());
        }
    }
    spdlog::info("Watching {} devices", engine_->getWatchlist().size());
}

int Application::run() {
    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const asio::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Received signal {}, stopping", signal);
        }
        io.stop();
    });

    try {
        engine_->triggerScan([this](const engine::ScanOutcome& outcome) {
            watchDiscovered(outcome);
        });
    } catch (const core::EngineError& e) {
        spdlog::error("Cannot start discovery: {}", e.what());
        return 1;
    }

    io.run();
    return 0;
}

} // namespace lanwatch::app
