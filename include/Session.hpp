/**
 * @file Session.hpp
 * @brief Security context of a joined device and the frames built from it.
 *
 * The uplink counter is read by prepareBuffer() but only advanced when the
 * exchange completes (downlinkComplete() or rx2Complete()), so a cancelled
 * attempt that never reached the air does not consume a counter value.
 */

#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include "LoRaWANTypes.hpp"
#include "LoRaWANFrame.hpp"
#include "CryptoInterface.hpp"
#include "MacCommands.hpp"

#define MAX_PENDING_MAC_COMMANDS 8

class Session {
public:
    /**
     * @brief Outcome of a receive cycle that ended without a downlink.
     */
    enum Rx2Result {
        RX_COMPLETE,    ///< Unconfirmed uplink, nothing received
        NO_ACK,         ///< Confirmed uplink was not acknowledged
        SESSION_EXPIRED ///< Uplink counter exhausted, re-join required
    };

    /**
     * @brief Why a received frame was accepted or dropped.
     */
    enum DownlinkStatus {
        DOWNLINK_ACCEPTED,
        DOWNLINK_MALFORMED,     ///< Not a downlink data frame, or truncated
        DOWNLINK_WRONG_ADDRESS, ///< Addressed to another device
        DOWNLINK_REPLAYED,      ///< Counter not above the last accepted one
        DOWNLINK_BAD_MIC
    };

    /**
     * @brief Content of an accepted downlink.
     */
    struct Downlink {
        DataFrame frame;                              ///< fcnt is the full 32-bit value, payload decrypted
        std::vector<DownlinkMacCommand> macCommands;  ///< From FOpts or FPort 0
        bool ack = false;
        bool framePending = false;
    };

    /**
     * @brief Start a fresh session; both counters are zero.
     */
    Session(const SessionKeys& keys, const DevAddr& devAddr);

    /**
     * @brief Resume a persisted session.
     */
    Session(const SessionKeys& keys, const DevAddr& devAddr, uint32_t fcntUp, uint32_t fcntDown,
            bool downlinkReceived);

    const DevAddr& devAddr() const { return address; }
    const SessionKeys& keys() const { return sessionKeys; }
    uint32_t fcntUp() const { return uplinkCounter; }
    uint32_t fcntDown() const { return downlinkCounter; }
    bool hasReceivedDownlink() const { return downlinkReceived; }
    bool isExpired() const { return expired; }
    bool pendingAck() const { return confirmsDownlink; }

    /**
     * @brief Queue a MAC command for the next uplink.
     * @throws CapacityError if MAX_PENDING_MAC_COMMANDS are already queued
     */
    void queueMacCommand(const UplinkMacCommand& cmd);

    bool macCommandQueueFull() const { return pending.size() >= MAX_PENDING_MAC_COMMANDS; }

    const std::vector<UplinkMacCommand>& pendingMacCommands() const { return pending; }

    /**
     * @brief Serialized size of the queued commands that fit in FOpts.
     */
    size_t pendingFOptsLength() const;

    /**
     * @brief Build the next uplink into the transmit buffer.
     *
     * Sets the ACK bit when the last downlink was confirmed and clears that
     * request. Queued MAC commands go into FOpts; commands that do not fit in
     * 15 bytes stay queued for the following uplink.
     *
     * @param payload Application payload; when empty the frame carries no FPort
     * @param port FPort, 1..223
     * @param fctrl ADR and ADRACKReq bits
     * @return The uplink counter used by the frame
     * @throws SessionExpiredError if the session is expired
     */
    uint32_t prepareBuffer(const std::vector<uint8_t>& payload, bool confirmed, uint8_t port,
                           uint8_t fctrl, CryptoInterface& crypto);

    const std::vector<uint8_t>& buffer() const { return txBuffer; }

    /**
     * @brief The receive windows closed without a downlink for this device.
     */
    Rx2Result rx2Complete();

    /**
     * @brief A downlink was accepted for the last uplink; advance the uplink counter.
     * @return false if the counter is exhausted and the session is now expired
     */
    bool downlinkComplete();

    /**
     * @brief Authenticate and decrypt a received frame.
     *
     * The counter is checked before the MIC, so a replayed frame is dropped
     * whether or not its MIC is valid. Nothing in the session changes unless
     * DOWNLINK_ACCEPTED is returned.
     */
    DownlinkStatus processDownlink(const uint8_t* frame, size_t len, CryptoInterface& crypto,
                                   Downlink& out);

private:
    bool advanceUplinkCounter();

    SessionKeys sessionKeys;
    DevAddr address;
    uint32_t uplinkCounter;
    uint32_t downlinkCounter;
    bool downlinkReceived;
    bool expired;
    bool confirmsDownlink;
    bool lastUplinkConfirmed;
    std::vector<UplinkMacCommand> pending;
    std::vector<uint8_t> txBuffer;
};

const char* downlinkStatusName(Session::DownlinkStatus status);
