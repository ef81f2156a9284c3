/**
 * @file SessionManager.hpp
 * @brief Persistence of the session and channel state as a JSON file.
 *
 * Saving writes a sibling ".tmp" file and renames it over the target, so a
 * reader sees either the previous file or the new one. Loading fills the
 * output only when every field is present and valid; a partial restore could
 * reuse frame counters.
 */

#pragma once

#include <string>
#include <array>
#include <cstdint>
#include "LoRaWANTypes.hpp"
#include "ChannelPlan.hpp"

class SessionManager {
public:
    struct SessionData {
        Region region = Region::EU868;
        DevAddr devAddr = {{0}};
        AES128Key nwkSKey = {{0}};
        AES128Key appSKey = {{0}};
        uint32_t uplinkCounter = 0;
        uint32_t downlinkCounter = 0;
        bool downlinkReceived = false;
        uint16_t lastDevNonce = 0;
        ChannelState channels;
    };

    static bool saveSession(const std::string& filename, const SessionData& data);
    static bool loadSession(const std::string& filename, SessionData& data);

    /**
     * @return false if the file existed and could not be removed
     */
    static bool clearSession(const std::string& filename);

    /**
     * @brief Record the last DevNonce spent, with or without a session.
     *
     * Written atomically like the session file. The DevNonce file outlives
     * clearSession() so a later join never reuses a nonce.
     */
    static bool saveDevNonce(const std::string& filename, uint16_t lastDevNonce);

    /**
     * @return false, with @p lastDevNonce untouched, if the file is missing or invalid
     */
    static bool loadDevNonce(const std::string& filename, uint16_t& lastDevNonce);

    /**
     * @brief DevNonce file kept next to @p sessionFile.
     */
    static std::string devNonceFilename(const std::string& sessionFile);
};
