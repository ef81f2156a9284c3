#include "DeviceConfig.hpp"
#include <algorithm>
#include <iostream>

namespace {

bool loadEUI(const ConfigManager& config, const std::string& path, EUI64& eui) {
    if (!config.getHexBytes(path, eui.data(), eui.size())) {
        std::cerr << "Configuration: " << path << " must be 16 hex digits" << std::endl;
        return false;
    }
    std::reverse(eui.begin(), eui.end());
    return true;
}

} // namespace

bool DeviceConfig::load(const ConfigManager& config, DeviceConfig& out) {
    DeviceConfig result;

    if (!loadEUI(config, "device.devEUI", result.devEUI) ||
        !loadEUI(config, "device.appEUI", result.appEUI)) {
        return false;
    }
    if (!config.getHexBytes("device.appKey", result.appKey.data(), result.appKey.size())) {
        std::cerr << "Configuration: device.appKey must be 32 hex digits" << std::endl;
        return false;
    }

    std::string regionStr = config.getString("network.region", "EU868");
    if (!parseRegion(regionStr, result.region)) {
        std::cerr << "Configuration: unknown region " << regionStr << std::endl;
        return false;
    }

    result.adr = config.getBool("options.adr", true);
    result.verbose = config.getBool("options.verbose", false);

    int attempts = config.getInt("options.max_join_attempts", 5);
    int retryDelay = config.getInt("options.join_retry_delay_ms", 10000);
    int rxWindow = config.getInt("options.rx_window_ms", 500);
    int battery = config.getInt("options.battery_level", 255);
    if (attempts < 1 || retryDelay < 0 || rxWindow < 1 || battery < 0 || battery > 255) {
        std::cerr << "Configuration: option out of range" << std::endl;
        return false;
    }
    result.maxJoinAttempts = attempts;
    result.joinRetryDelayMs = static_cast<uint32_t>(retryDelay);
    result.rxWindowMs = static_cast<uint32_t>(rxWindow);
    result.batteryLevel = static_cast<uint8_t>(battery);
    result.sessionFile = config.getString("options.session_file", "");

    out = result;
    return true;
}
