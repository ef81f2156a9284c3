#pragma once

#include <vector>
#include <cstdint>
#include "LoRaWANTypes.hpp"

/**
 * LoRa modulation of the next operation
 */
struct ModulationParams {
    SpreadingFactor spreadingFactor;
    Bandwidth bandwidth;
    uint8_t codingRate; ///< 5..8 for 4/5..4/8
};

/**
 * Packet framing of the next operation
 */
struct PacketParams {
    uint16_t preambleLength; ///< Symbols
    bool implicitHeader;
    bool crcOn;              ///< Uplinks carry a CRC, downlinks do not
    bool invertIQ;           ///< Set for downlink reception
};

/**
 * Signal metrics reported with a received frame
 */
struct RxPacket {
    std::vector<uint8_t> data;
    int16_t rssi; ///< dBm
    int8_t snr;   ///< dB
};

/**
 * Abstract radio collaborator driven by the MAC engine.
 *
 * Calls are blocking and never overlap: the engine issues one operation at a
 * time and waits for its completion.
 */
class RadioInterface {
public:
    enum RxResult {
        RX_PACKET,  ///< A frame was received
        RX_TIMEOUT, ///< The window closed without a frame
        RX_ERROR    ///< The radio failed
    };

    virtual ~RadioInterface() = default;

    virtual bool configure(const ModulationParams& modulation, const PacketParams& packet) = 0;
    virtual bool setFrequency(uint32_t frequencyHz) = 0;
    virtual bool setTxPower(int8_t powerDbm) = 0;

    // Returns once the frame has left the antenna
    virtual bool transmit(const std::vector<uint8_t>& frame) = 0;
    virtual RxResult receive(uint32_t timeoutMs, RxPacket& packet) = 0;
    virtual void sleep() = 0;
};
