/**
 * @file LoRaWAN.hpp
 * @brief Class A end-device MAC engine.
 *
 * The LoRaWAN class drives one device through OTAA join and confirmed or
 * unconfirmed data exchanges. It owns the session, the regional channel plan
 * and the pending MAC answers, and talks to the hardware only through the
 * RadioInterface, TimerInterface and CryptoInterface collaborators it is
 * constructed with.
 *
 * Every operation runs to completion on the calling thread. cancel() may be
 * called from another thread; the running operation stops at its next
 * suspension point (timer wait or radio receive).
 *
 * @see LoRaWAN.cpp for the implementation
 */

#pragma once

#include <memory>
#include <vector>
#include <cstdint>
#include <optional>
#include "LoRaWANTypes.hpp"
#include "DeviceConfig.hpp"
#include "RadioInterface.hpp"
#include "TimerInterface.hpp"
#include "CryptoInterface.hpp"
#include "ChannelPlan.hpp"

// Class A timing, milliseconds
#define JOIN_ACCEPT_DELAY1 5000
#define JOIN_ACCEPT_DELAY2 6000
#define RECEIVE_DELAY_STEP 1000

// ADR backoff
#define ADR_ACK_LIMIT 64
#define ADR_ACK_DELAY 32

#define MAX_APP_PORT 223

class LoRaWAN {
public:
    /**
     * @brief Result of join() and send().
     */
    enum class Response {
        JoinSuccess,      /**< Session established */
        NoJoinAccept,     /**< One join attempt got no valid join-accept */
        JoinFailed,       /**< All attempts failed, or the DevNonce space is exhausted */
        DownlinkReceived, /**< A downlink was accepted; see poll() */
        RxComplete,       /**< Unconfirmed uplink sent, no downlink */
        NoAck,            /**< Confirmed uplink was not acknowledged */
        SessionExpired,   /**< Uplink counter exhausted, join again */
        NoSession,        /**< send() before join() or restoreSession() */
        Cancelled,
        RadioError,
        PayloadTooLarge,  /**< Payload plus pending MAC answers exceed the data rate limit */
        InvalidPort       /**< FPort outside 1..223 */
    };

    enum class State {
        Idle,
        Joining,
        WaitingForTx,
        WaitingRx1,
        WaitingRx2,
        SessionExpired
    };

    /**
     * @brief Application view of an accepted downlink.
     */
    struct DownlinkEvent {
        uint32_t fcnt = 0;
        bool hasPort = false;        ///< false for MAC-only frames
        uint8_t port = 0;
        std::vector<uint8_t> payload;
        bool confirmed = false;      ///< Network expects an ACK on the next uplink
        bool ack = false;            ///< Acknowledges the last confirmed uplink
        bool framePending = false;
        int16_t rssi = 0;
        int8_t snr = 0;

        std::optional<LinkCheckAns> linkCheck;   ///< Answer to requestLinkCheck()
        std::optional<DeviceTimeAns> deviceTime; ///< Answer to requestDeviceTime()

        /// Requests applied without an answer because the MAC answer queue was full
        uint8_t unansweredCommands = 0;
    };

    /**
     * @brief Create an engine using SoftwareCrypto.
     */
    LoRaWAN(const DeviceConfig& config, std::unique_ptr<RadioInterface> radio,
            std::unique_ptr<TimerInterface> timer);

    LoRaWAN(const DeviceConfig& config, std::unique_ptr<RadioInterface> radio,
            std::unique_ptr<TimerInterface> timer, std::unique_ptr<CryptoInterface> crypto);

    ~LoRaWAN();

    LoRaWAN(const LoRaWAN&) = delete;
    LoRaWAN& operator=(const LoRaWAN&) = delete;

    /**
     * @brief OTAA join with the configured credentials.
     *
     * Makes up to maxJoinAttempts attempts, waiting joinRetryDelayMs between
     * them, doubled after every failed attempt up to 32 times the base delay.
     *
     * @return JoinSuccess, JoinFailed, Cancelled or RadioError
     */
    Response join();

    /**
     * @brief A single join attempt: join-request, then RX1 and RX2.
     *
     * An existing session stays in use until a join-accept replaces it. The
     * DevNonce is spent, and saved next to the session file, whether or not
     * an answer arrives.
     *
     * @return JoinSuccess, NoJoinAccept, JoinFailed, Cancelled or RadioError
     */
    Response joinAttempt();

    /**
     * @brief Send one uplink and listen in RX1 and RX2.
     *
     * Pending MAC answers travel in FOpts. Unconfirmed frames are repeated
     * up to NbTrans times while no downlink arrives. A received downlink is
     * queued for poll(), also when NoAck is returned because it did not
     * acknowledge a confirmed uplink.
     *
     * @param payload Application payload; may be empty
     * @param port FPort, 1..223
     * @param confirmed Request an acknowledgement from the network
     */
    Response send(const std::vector<uint8_t>& payload, uint8_t port, bool confirmed = false);

    /**
     * @brief Oldest downlink not yet handed to the application.
     */
    std::optional<DownlinkEvent> poll();

    /**
     * @brief Abandon the running join() or send() at its next suspension point.
     *
     * Safe to call from another thread. A frame that already went on air
     * still consumes its uplink counter value.
     */
    void cancel();

    /**
     * @brief Ask the network for link quality on the next uplink.
     * @return false without a session
     * @throws CapacityError if the MAC answer queue is full
     */
    bool requestLinkCheck();

    /**
     * @brief Ask the network for the GPS time on the next uplink.
     * @return false without a session
     * @throws CapacityError if the MAC answer queue is full
     */
    bool requestDeviceTime();

    /**
     * @brief Restore session and channel state from the configured session file.
     *
     * @return false, with nothing changed, if no file is configured, the file
     *         is missing or incomplete, or it belongs to another region
     */
    bool restoreSession();

    /**
     * @brief Write session and channel state to the configured session file.
     * @return false if there is no session or the file cannot be written
     */
    bool saveSession() const;

    /**
     * @brief Forget the session and remove the session file.
     */
    void resetSession();

    State state() const;
    bool isJoined() const;
    DevAddr devAddr() const;
    uint32_t fcntUp() const;
    uint32_t fcntDown() const;
    uint16_t lastDevNonce() const;

    const ChannelPlan& channelPlan() const;

    /**
     * @brief Earliest time (TimerInterface::now()) the duty cycle allows the next uplink.
     */
    uint64_t nextTxTime() const;

    /**
     * @brief Enable or disable ADR.
     */
    void setADR(bool enabled);

    /**
     * @brief Data rate of the next uplink when ADR is off.
     * @return false if the region does not define @p dataRate
     */
    bool setDataRate(uint8_t dataRate);

    void setBatteryLevel(uint8_t level);

    /**
     * @brief Seed channel selection, for reproducible runs.
     */
    void seedChannelSelection(uint32_t seed);

    static void setVerbose(bool verbose);
    static bool getVerbose();

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

const char* responseName(LoRaWAN::Response response);
