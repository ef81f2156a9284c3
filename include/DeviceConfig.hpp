#pragma once

#include <string>
#include <cstdint>
#include "LoRaWANTypes.hpp"
#include "ChannelPlan.hpp"
#include "ConfigManager.hpp"

/**
 * @brief Typed device configuration.
 *
 * Expected JSON layout:
 * @code
 * {
 *   "device":  { "devEUI": "70B3D57ED0000001", "appEUI": "0000000000000000",
 *                "appKey": "2B7E151628AED2A6ABF7158809CF4F3C" },
 *   "network": { "region": "EU868" },
 *   "options": { "adr": true, "verbose": false, "max_join_attempts": 5,
 *                "join_retry_delay_ms": 10000, "rx_window_ms": 500,
 *                "battery_level": 255, "session_file": "session.json" }
 * }
 * @endcode
 * EUIs are written MSB first, as network consoles print them, and stored in
 * wire order (reversed). The AppKey is used as written.
 */
struct DeviceConfig {
    EUI64 devEUI = {{0}};
    EUI64 appEUI = {{0}};
    AES128Key appKey = {{0}};
    Region region = Region::EU868;
    bool adr = true;
    bool verbose = false;
    int maxJoinAttempts = 5;
    uint32_t joinRetryDelayMs = 10000;
    uint32_t rxWindowMs = 500;
    uint8_t batteryLevel = 255; ///< 255: not measured
    std::string sessionFile;    ///< Empty: no persistence

    /**
     * @brief Read every field from @p config.
     * @return false, with the reason on std::cerr, if a credential is missing or
     *         malformed, the region is unknown, or a numeric option is out of range
     */
    static bool load(const ConfigManager& config, DeviceConfig& out);
};
