#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace lanwatch::infra {

namespace {

template <typename T>
T clampValue(const char* key, T value, T low, T high) {
    T clamped = std::clamp(value, low, high);
    if (clamped != value) {
        spdlog::warn("Config value {}={} out of range, using {}", key, value, clamped);
    }
    return clamped;
}

bool isLogLevel(const std::string& level) {
    for (const char* name : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Discovery
    const auto& s = config_.scan;
    j["scan"]["concurrency"] = s.concurrency;
    j["scan"]["ping_timeout_ms"] = s.pingTimeoutMs;
    j["scan"]["port_timeout_ms"] = s.portTimeoutMs;
    j["scan"]["fallback_ports"] = s.fallbackPorts;
    j["scan"]["probe_service_ports"] = s.probeServicePorts;
    j["scan"]["service_ports"] = s.servicePorts;
    j["scan"]["time_budget_seconds"] = s.timeBudgetSeconds;
    j["scan"]["resolve_hostnames"] = s.resolveHostnames;
    j["scan"]["lookup_timeout_ms"] = s.lookupTimeoutMs;

    // Monitoring
    const auto& m = config_.monitoring;
    j["monitoring"]["default_interval_seconds"] = m.defaultIntervalSeconds;
    j["monitoring"]["samples_per_tick"] = m.samplesPerTick;
    j["monitoring"]["sample_spacing_ms"] = m.sampleSpacingMs;
    j["monitoring"]["probe_timeout_ms"] = m.probeTimeoutMs;
    j["monitoring"]["max_concurrent_ticks"] = m.maxConcurrentTicks;
    j["monitoring"]["max_packet_loss"] = m.thresholds.maxPacketLoss;
    j["monitoring"]["max_latency_ms"] = m.thresholds.maxLatency.count();
    j["monitoring"]["failures_for_offline"] = m.thresholds.failuresForOffline;

    // Bandwidth
    const auto& b = config_.bandwidth;
    j["bandwidth"]["enabled"] = b.enabled;
    j["bandwidth"]["duration_ms"] = b.durationMs;
    j["bandwidth"]["direction"] = b.direction;
    j["bandwidth"]["download_port"] = b.downloadPort;
    j["bandwidth"]["upload_port"] = b.uploadPort;
    j["bandwidth"]["connect_timeout_ms"] = b.connectTimeoutMs;

    // Retention
    j["metrics"]["capacity_per_device"] = config_.metrics.capacityPerDevice;
    j["metrics"]["recent_alert_capacity"] = config_.metrics.recentAlertCapacity;

    // Logging
    const auto& l = config_.logging;
    j["logging"]["level"] = l.level;
    j["logging"]["file_level"] = l.fileLevel;
    j["logging"]["file_name"] = l.fileName;
    j["logging"]["max_file_size_mb"] = l.maxFileSizeMb;
    j["logging"]["max_files"] = l.maxFiles;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;

    // Discovery
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        auto& out = config_.scan;
        out.concurrency = s.value("concurrency", defaults.scan.concurrency);
        out.pingTimeoutMs = s.value("ping_timeout_ms", defaults.scan.pingTimeoutMs);
        out.portTimeoutMs = s.value("port_timeout_ms", defaults.scan.portTimeoutMs);
        out.fallbackPorts = s.value("fallback_ports", defaults.scan.fallbackPorts);
        out.probeServicePorts = s.value("probe_service_ports", defaults.scan.probeServicePorts);
        out.servicePorts = s.value("service_ports", defaults.scan.servicePorts);
        out.timeBudgetSeconds = s.value("time_budget_seconds", defaults.scan.timeBudgetSeconds);
        out.resolveHostnames = s.value("resolve_hostnames", defaults.scan.resolveHostnames);
        out.lookupTimeoutMs = s.value("lookup_timeout_ms", defaults.scan.lookupTimeoutMs);
    }

    // Monitoring
    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        auto& out = config_.monitoring;
        out.defaultIntervalSeconds =
            m.value("default_interval_seconds", defaults.monitoring.defaultIntervalSeconds);
        out.samplesPerTick = m.value("samples_per_tick", defaults.monitoring.samplesPerTick);
        out.sampleSpacingMs = m.value("sample_spacing_ms", defaults.monitoring.sampleSpacingMs);
        out.probeTimeoutMs = m.value("probe_timeout_ms", defaults.monitoring.probeTimeoutMs);
        out.maxConcurrentTicks =
            m.value("max_concurrent_ticks", defaults.monitoring.maxConcurrentTicks);
        out.thresholds.maxPacketLoss =
            m.value("max_packet_loss", defaults.monitoring.thresholds.maxPacketLoss);
        out.thresholds.maxLatency = std::chrono::milliseconds(
            m.value("max_latency_ms",
                    static_cast<int64_t>(defaults.monitoring.thresholds.maxLatency.count())));
        out.thresholds.failuresForOffline =
            m.value("failures_for_offline", defaults.monitoring.thresholds.failuresForOffline);
    }

    // Bandwidth
    if (j.contains("bandwidth")) {
        const auto& b = j["bandwidth"];
        auto& out = config_.bandwidth;
        out.enabled = b.value("enabled", defaults.bandwidth.enabled);
        out.durationMs = b.value("duration_ms", defaults.bandwidth.durationMs);
        out.direction = b.value("direction", defaults.bandwidth.direction);
        out.downloadPort = b.value("download_port", defaults.bandwidth.downloadPort);
        out.uploadPort = b.value("upload_port", defaults.bandwidth.uploadPort);
        out.connectTimeoutMs = b.value("connect_timeout_ms", defaults.bandwidth.connectTimeoutMs);
    }

    // Retention
    if (j.contains("metrics")) {
        const auto& r = j["metrics"];
        config_.metrics.capacityPerDevice =
            r.value("capacity_per_device", defaults.metrics.capacityPerDevice);
        config_.metrics.recentAlertCapacity =
            r.value("recent_alert_capacity", defaults.metrics.recentAlertCapacity);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        auto& out = config_.logging;
        out.level = l.value("level", defaults.logging.level);
        out.fileLevel = l.value("file_level", defaults.logging.fileLevel);
        out.fileName = l.value("file_name", defaults.logging.fileName);
        out.maxFileSizeMb = l.value("max_file_size_mb", defaults.logging.maxFileSizeMb);
        out.maxFiles = l.value("max_files", defaults.logging.maxFiles);
    }

    clamp();
}

void ConfigManager::clamp() {
    auto& s = config_.scan;
    s.concurrency = clampValue("scan.concurrency", s.concurrency, 1, 512);
    s.pingTimeoutMs = clampValue("scan.ping_timeout_ms", s.pingTimeoutMs, 10, 10000);
    s.portTimeoutMs = clampValue("scan.port_timeout_ms", s.portTimeoutMs, 10, 10000);
    s.lookupTimeoutMs = clampValue("scan.lookup_timeout_ms", s.lookupTimeoutMs, 10, 10000);
    s.timeBudgetSeconds = clampValue("scan.time_budget_seconds", s.timeBudgetSeconds, 1, 3600);

    auto& m = config_.monitoring;
    m.defaultIntervalSeconds =
        clampValue("monitoring.default_interval_seconds", m.defaultIntervalSeconds, 1, 86400);
    m.samplesPerTick = clampValue("monitoring.samples_per_tick", m.samplesPerTick, 1, 100);
    m.sampleSpacingMs = clampValue("monitoring.sample_spacing_ms", m.sampleSpacingMs, 0, 10000);
    m.probeTimeoutMs = clampValue("monitoring.probe_timeout_ms", m.probeTimeoutMs, 10, 10000);
    m.maxConcurrentTicks =
        clampValue("monitoring.max_concurrent_ticks", m.maxConcurrentTicks, 1, 256);
    m.thresholds.maxPacketLoss =
        clampValue("monitoring.max_packet_loss", m.thresholds.maxPacketLoss, 0.0, 1.0);
    m.thresholds.failuresForOffline =
        clampValue("monitoring.failures_for_offline", m.thresholds.failuresForOffline, 1, 1000);
    if (m.thresholds.maxLatency.count() <= 0) {
        spdlog::warn("Config value monitoring.max_latency_ms must be positive, using default");
        m.thresholds.maxLatency = core::HealthThresholds{}.maxLatency;
    }

    auto& b = config_.bandwidth;
    b.durationMs = clampValue("bandwidth.duration_ms", b.durationMs, 100, 60000);
    b.connectTimeoutMs = clampValue("bandwidth.connect_timeout_ms", b.connectTimeoutMs, 10, 10000);
    if (b.direction != "download" && b.direction != "upload") {
        spdlog::warn("Config value bandwidth.direction='{}' invalid, using download", b.direction);
        b.direction = "download";
    }

    config_.metrics.capacityPerDevice =
        clampValue("metrics.capacity_per_device", config_.metrics.capacityPerDevice, 1, 1000000);
    config_.metrics.recentAlertCapacity = clampValue(
        "metrics.recent_alert_capacity", config_.metrics.recentAlertCapacity, 1, 100000);

    for (auto* level : {&config_.logging.level, &config_.logging.fileLevel}) {
        if (!isLogLevel(*level)) {
            spdlog::warn("Config log level '{}' invalid, using info", *level);
            *level = "info";
        }
    }
    config_.logging.maxFileSizeMb =
        clampValue("logging.max_file_size_mb", config_.logging.maxFileSizeMb, 1, 1024);
    config_.logging.maxFiles = clampValue("logging.max_files", config_.logging.maxFiles, 1, 100);
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / config_.logging.fileName;
}

} // namespace lanwatch::infra
