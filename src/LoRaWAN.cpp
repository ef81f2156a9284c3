/**
 * @file LoRaWAN.cpp
 * @brief Class A MAC engine: join, uplink/downlink exchange and MAC command handling.
 *
 * The engine never talks to hardware directly. Frames go out through
 * RadioInterface, waits go through TimerInterface and every cipher operation
 * goes through CryptoInterface, so the whole state machine can be driven by
 * a scripted radio and a fake clock.
 *
 * Exchange timing (Class A):
 * @code
 *   TX |---- rx1Delay ----| RX1 |-- 1 s --| RX2 |
 *   join-request          5 s            6 s
 * @endcode
 *
 * @section Usage
 * @code
 * ConfigManager file("config.json");
 * DeviceConfig config;
 * if (file.loadConfig() && DeviceConfig::load(file, config)) {
 *     LoRaWAN node(config, std::move(radio), std::make_unique<SteadyTimer>());
 *     if (node.restoreSession() || node.join() == LoRaWAN::Response::JoinSuccess) {
 *         node.send({0x01, 0x02}, 1);
 *         while (auto event = node.poll()) { ... }
 *     }
 * }
 * @endcode
 */

#include "LoRaWAN.hpp"
#include "Session.hpp"
#include "SessionManager.hpp"
#include "SoftwareCrypto.hpp"
#include "LoRaWANFrame.hpp"
#include "MacCommands.hpp"
#include "Debug.hpp"
#include <atomic>
#include <queue>
#include <mutex>
#include <functional>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {

// Longest join backoff is joinRetryDelayMs << MAX_JOIN_BACKOFF_SHIFT
const int MAX_JOIN_BACKOFF_SHIFT = 5;

const PacketParams UPLINK_PACKET = {8, false, true, false};
const PacketParams DOWNLINK_PACKET = {8, false, false, true};

ModulationParams modulationFor(const Datarate& dr) {
    return ModulationParams{dr.spreadingFactor, dr.bandwidth, 5};
}

int8_t demodulationMargin(int8_t snr) {
    return std::max<int8_t>(-32, std::min<int8_t>(31, snr));
}

} // namespace

struct LoRaWAN::Impl {
    enum WindowResult {
        WINDOW_RECEIVED,
        WINDOW_TIMEOUT,
        WINDOW_CANCELLED,
        WINDOW_RADIO_ERROR
    };

    struct RxWindow {
        uint64_t opensAt;
        uint32_t frequency;
        uint8_t dataRate;
    };

    DeviceConfig config;
    std::unique_ptr<RadioInterface> radio;
    std::unique_ptr<TimerInterface> timer;
    std::unique_ptr<CryptoInterface> crypto;
    std::unique_ptr<ChannelPlan> plan;
    std::unique_ptr<Session> session;

    std::queue<DownlinkEvent> rxQueue;
    std::mutex queueMutex;
    std::atomic<bool> cancelRequested{false};

    State state = State::Idle;
    uint16_t lastDevNonce = 0;
    uint64_t nextTxTime = 0;
    uint32_t adrAckCounter = 0;
    int8_t lastSnr = 0;

    Impl(const DeviceConfig& cfg, std::unique_ptr<RadioInterface> radioInterface,
         std::unique_ptr<TimerInterface> timerInterface, std::unique_ptr<CryptoInterface> cryptoInterface)
        : config(cfg),
          radio(std::move(radioInterface)),
          timer(std::move(timerInterface)),
          crypto(std::move(cryptoInterface)),
          plan(ChannelPlan::create(cfg.region)) {
        if (!radio || !timer || !crypto) {
            throw std::invalid_argument("LoRaWAN: radio, timer and crypto are required");
        }
        if (!config.sessionFile.empty() &&
            SessionManager::loadDevNonce(SessionManager::devNonceFilename(config.sessionFile), lastDevNonce)) {
            DEBUG_PRINTLN("Last DevNonce " << lastDevNonce);
        }
    }

    bool cancelled() const {
        return cancelRequested.load();
    }

    // Sleep until the deadline, tolerating early wake-ups
    bool waitUntil(uint64_t deadline) {
        while (timer->now() < deadline) {
            if (cancelled()) {
                return false;
            }
            timer->sleepUntil(deadline);
        }
        return !cancelled();
    }

    bool transmit(const std::vector<uint8_t>& frame, uint32_t frequency, uint8_t dataRate,
                  int8_t powerDbm, uint64_t& txEnd) {
        std::optional<Datarate> dr = plan->datarate(dataRate);
        if (!dr) {
            std::cerr << "Transmit: DR" << static_cast<int>(dataRate) << " not defined in "
                      << regionName(plan->region()) << std::endl;
            return false;
        }

        DEBUG_PRINTLN("TX " << frequency << " Hz DR" << static_cast<int>(dataRate)
                      << " " << static_cast<int>(powerDbm) << " dBm, " << frame.size() << " bytes");
        if (!radio->setFrequency(frequency) ||
            !radio->setTxPower(powerDbm) ||
            !radio->configure(modulationFor(*dr), UPLINK_PACKET) ||
            !radio->transmit(frame)) {
            std::cerr << "Radio: transmit failed" << std::endl;
            return false;
        }
        txEnd = timer->now();

        uint8_t dutyCycle = plan->maxDutyCycle();
        if (dutyCycle > 0) {
            double airtime = timeOnAirMs(dr->spreadingFactor, dr->bandwidth, frame.size());
            nextTxTime = txEnd + static_cast<uint64_t>(airtime * ((1u << dutyCycle) - 1));
            DEBUG_PRINTLN("Duty cycle: next uplink not before " << nextTxTime);
        }
        return true;
    }

    /**
     * Open RX1 then RX2. A window whose opening time has already passed by
     * more than its length is skipped.
     */
    WindowResult listen(const RxWindow (&windows)[2],
                        const std::function<bool(const RxPacket&)>& accept, RxPacket& packet) {
        for (int w = 0; w < 2; w++) {
            const RxWindow& window = windows[w];
            state = (w == 0) ? State::WaitingRx1 : State::WaitingRx2;

            if (!waitUntil(window.opensAt)) {
                return WINDOW_CANCELLED;
            }
            uint64_t closesAt = window.opensAt + config.rxWindowMs;
            uint64_t now = timer->now();
            if (now >= closesAt) {
                DEBUG_PRINTLN("RX" << (w + 1) << " missed by " << (now - window.opensAt) << " ms");
                continue;
            }

            std::optional<Datarate> dr = plan->datarate(window.dataRate);
            if (!dr) {
                DEBUG_PRINTLN("RX" << (w + 1) << ": DR" << static_cast<int>(window.dataRate)
                              << " not defined, window skipped");
                continue;
            }
            if (!radio->setFrequency(window.frequency) ||
                !radio->configure(modulationFor(*dr), DOWNLINK_PACKET)) {
                std::cerr << "Radio: cannot configure RX" << (w + 1) << std::endl;
                return WINDOW_RADIO_ERROR;
            }
            DEBUG_PRINTLN("RX" << (w + 1) << " " << window.frequency << " Hz DR"
                          << static_cast<int>(window.dataRate));

            while (now < closesAt) {
                RxPacket candidate;
                RadioInterface::RxResult result =
                    radio->receive(static_cast<uint32_t>(closesAt - now), candidate);
                if (cancelled()) {
                    return WINDOW_CANCELLED;
                }
                if (result == RadioInterface::RX_ERROR) {
                    std::cerr << "Radio: receive failed" << std::endl;
                    return WINDOW_RADIO_ERROR;
                }
                if (result == RadioInterface::RX_TIMEOUT) {
                    break;
                }
                DEBUG_PRINTLN("RX" << (w + 1) << ": " << candidate.data.size() << " bytes, RSSI "
                              << candidate.rssi << " dBm, SNR " << static_cast<int>(candidate.snr) << " dB");
                if (accept(candidate)) {
                    packet = candidate;
                    return WINDOW_RECEIVED;
                }
                now = timer->now();
            }
        }
        return WINDOW_TIMEOUT;
    }

    bool save() const {
        if (config.sessionFile.empty() || !session) {
            return false;
        }
        SessionManager::SessionData data;
        data.region = config.region;
        data.devAddr = session->devAddr();
        data.nwkSKey = session->keys().nwkSKey;
        data.appSKey = session->keys().appSKey;
        data.uplinkCounter = session->fcntUp();
        data.downlinkCounter = session->fcntDown();
        data.downlinkReceived = session->hasReceivedDownlink();
        data.lastDevNonce = lastDevNonce;
        data.channels = plan->state();
        return SessionManager::saveSession(config.sessionFile, data);
    }

    void persist() const {
        if (config.sessionFile.empty() || !session) {
            return;
        }
        if (!save()) {
            std::cerr << "Session state not saved" << std::endl;
        }
    }

    // Kept apart from the session file so it also covers joins before the first session
    void persistDevNonce() const {
        if (config.sessionFile.empty()) {
            return;
        }
        if (!SessionManager::saveDevNonce(SessionManager::devNonceFilename(config.sessionFile), lastDevNonce)) {
            std::cerr << "DevNonce " << lastDevNonce << " not saved" << std::endl;
        }
    }

    Response attemptJoin() {
        if (lastDevNonce == 0xFFFF) {
            std::cerr << "Join: DevNonce space exhausted" << std::endl;
            return Response::JoinFailed;
        }

        state = State::Joining;
        uint16_t devNonce = ++lastDevNonce;
        // The nonce is spent even if nothing answers
        persistDevNonce();
        persist();

        std::vector<uint8_t> frame = LoRaWANFrame::buildJoinRequest(config.appEUI, config.devEUI,
                                                                   devNonce, config.appKey, *crypto);
        DEBUG_PRINTLN("Join request, DevNonce " << devNonce);
        DEBUG_HEX("Join request: ", frame);

        const RegionParams& region = regionParams(config.region);
        uint8_t channel = 0;
        if (!plan->selectChannel(true, channel)) {
            return Response::RadioError;
        }
        uint32_t frequency = region.joinChannels[channel];

        state = State::WaitingForTx;
        if (!waitUntil(nextTxTime)) {
            return Response::Cancelled;
        }
        uint64_t txEnd = 0;
        std::optional<uint8_t> fullPower = plan->txPowerAdjust(0);
        if (!transmit(frame, frequency, region.defaultDataRate,
                      static_cast<int8_t>(fullPower ? *fullPower : region.maxEirp), txEnd)) {
            return Response::RadioError;
        }

        RxWindow windows[2] = {
            {txEnd + JOIN_ACCEPT_DELAY1, frequency, region.defaultDataRate},
            {txEnd + JOIN_ACCEPT_DELAY2, region.defaultRx2Frequency, region.defaultRx2DataRate}
        };
        JoinAccept accept;
        RxPacket packet;
        WindowResult result = listen(windows, [&](const RxPacket& p) {
            if (!LoRaWANFrame::decodeJoinAccept(p.data.data(), p.data.size(), config.appKey, *crypto, accept)) {
                DEBUG_PRINTLN("Dropped frame: not a valid join-accept");
                return false;
            }
            return true;
        }, packet);
        radio->sleep();

        if (result == WINDOW_CANCELLED) {
            return Response::Cancelled;
        }
        if (result == WINDOW_RADIO_ERROR) {
            return Response::RadioError;
        }
        if (result == WINDOW_TIMEOUT) {
            DEBUG_PRINTLN("No join accept received");
            return Response::NoJoinAccept;
        }

        JoinNonces nonces = {accept.appNonce, accept.netId, devNonce};
        SessionKeys keys = crypto->deriveSessionKeys(config.appKey, nonces);
        session = std::make_unique<Session>(keys, accept.devAddr);
        plan->handleJoinAccept(accept.dlSettings, accept.rxDelay, accept.hasCFList ? &accept.cfList : nullptr);
        adrAckCounter = 0;
        lastSnr = packet.snr;

        DEBUG_PRINTLN("Joined, DevAddr " << Debug::hex(accept.devAddr) << ", RX1 delay "
                      << static_cast<int>(plan->rx1Delay()) << " s");
        DEBUG_HEX("NwkSKey: ", keys.nwkSKey);
        DEBUG_HEX("AppSKey: ", keys.appSKey);
        persist();
        return Response::JoinSuccess;
    }

    bool acceptDownlink(const RxPacket& packet, Session::Downlink& out) {
        Session::DownlinkStatus status = session->processDownlink(packet.data.data(), packet.data.size(),
                                                                  *crypto, out);
        if (status != Session::DOWNLINK_ACCEPTED) {
            DEBUG_PRINTLN("Dropped downlink: " << downlinkStatusName(status));
            return false;
        }
        return true;
    }

    // Requests arrive from the network, so a full queue is reported instead of thrown
    void queueAnswer(const UplinkMacCommand& answer, DownlinkEvent& event) {
        if (session->macCommandQueueFull()) {
            std::cerr << "MAC answer 0x" << std::hex << static_cast<int>(macCommandCid(answer)) << std::dec
                      << " not queued: " << MAX_PENDING_MAC_COMMANDS << " answers already pending" << std::endl;
            event.unansweredCommands++;
            return;
        }
        session->queueMacCommand(answer);
    }

    // Each request gets its answer queued for the next uplink, acked or not
    void applyMacCommands(const std::vector<DownlinkMacCommand>& commands, DownlinkEvent& event) {
        for (const auto& cmd : commands) {
            switch (macCommandCid(cmd)) {
            case MAC_LINK_CHECK_ANS: {
                const LinkCheckAns& ans = std::get<LinkCheckAns>(cmd);
                DEBUG_PRINTLN("LinkCheckAns: margin " << static_cast<int>(ans.margin()) << " dB, "
                              << static_cast<int>(ans.gatewayCount()) << " gateway(s)");
                event.linkCheck = ans;
                break;
            }
            case MAC_LINK_ADR_REQ: {
                LinkADRAnsCreator ans = plan->handleLinkADRReq(std::get<LinkADRReq>(cmd));
                DEBUG_PRINTLN("LinkADRReq -> status 0x" << std::hex << static_cast<int>(ans.build()[1])
                              << std::dec);
                queueAnswer(ans.payload(), event);
                break;
            }
            case MAC_DUTY_CYCLE_REQ: {
                const DutyCycleReq& req = std::get<DutyCycleReq>(cmd);
                plan->handleDutyCycleReq(req);
                DEBUG_PRINTLN("DutyCycleReq: 1/" << (1u << req.maxDutyCycleRaw()));
                queueAnswer(DutyCycleAns(), event);
                break;
            }
            case MAC_RX_PARAM_SETUP_REQ: {
                RXParamSetupAnsCreator ans = plan->handleRXParamSetupReq(std::get<RXParamSetupReq>(cmd));
                DEBUG_PRINTLN("RXParamSetupReq -> " << (ans.payload().ack() ? "accepted" : "rejected"));
                queueAnswer(ans.payload(), event);
                break;
            }
            case MAC_DEV_STATUS_REQ: {
                DevStatusAnsCreator ans;
                ans.setBattery(config.batteryLevel).setMargin(demodulationMargin(lastSnr));
                DEBUG_PRINTLN("DevStatusReq: battery " << static_cast<int>(config.batteryLevel)
                              << ", margin " << static_cast<int>(demodulationMargin(lastSnr)));
                queueAnswer(ans.payload(), event);
                break;
            }
            case MAC_NEW_CHANNEL_REQ: {
                NewChannelAnsCreator ans = plan->handleNewChannelReq(std::get<NewChannelReq>(cmd));
                DEBUG_PRINTLN("NewChannelReq -> " << (ans.payload().ack() ? "accepted" : "rejected"));
                queueAnswer(ans.payload(), event);
                break;
            }
            case MAC_RX_TIMING_SETUP_REQ:
                plan->handleRXTimingSetupReq(std::get<RXTimingSetupReq>(cmd));
                DEBUG_PRINTLN("RXTimingSetupReq: RX1 delay " << static_cast<int>(plan->rx1Delay()) << " s");
                queueAnswer(RXTimingSetupAns(), event);
                break;
            case MAC_TX_PARAM_SETUP_REQ:
                if (plan->handleTXParamSetupReq(std::get<TXParamSetupReq>(cmd))) {
                    queueAnswer(TXParamSetupAns(), event);
                } else {
                    DEBUG_PRINTLN("TXParamSetupReq ignored in " << regionName(plan->region()));
                }
                break;
            case MAC_DL_CHANNEL_REQ: {
                DlChannelAnsCreator ans = plan->handleDlChannelReq(std::get<DlChannelReq>(cmd));
                DEBUG_PRINTLN("DlChannelReq -> " << (ans.payload().ack() ? "accepted" : "rejected"));
                queueAnswer(ans.payload(), event);
                break;
            }
            case MAC_DEVICE_TIME_ANS: {
                const DeviceTimeAns& ans = std::get<DeviceTimeAns>(cmd);
                DEBUG_PRINTLN("DeviceTimeAns: " << ans.seconds() << " s + " << ans.nanoSeconds() << " ns");
                event.deviceTime = ans;
                break;
            }
            default:
                DEBUG_PRINTLN("Unhandled MAC command 0x" << std::hex << static_cast<int>(macCommandCid(cmd))
                              << std::dec);
                break;
            }
        }
    }

    Response completeWithDownlink(const Session::Downlink& downlink, const RxPacket& packet, bool confirmed) {
        bool alive = session->downlinkComplete();
        adrAckCounter = 0;
        lastSnr = packet.snr;

        DownlinkEvent event;
        event.fcnt = downlink.frame.fcnt;
        event.hasPort = downlink.frame.hasPort && downlink.frame.fport != 0;
        if (event.hasPort) {
            event.port = downlink.frame.fport;
            event.payload = downlink.frame.payload;
        }
        event.confirmed = downlink.frame.isConfirmed();
        event.ack = downlink.ack;
        event.framePending = downlink.framePending;
        event.rssi = packet.rssi;
        event.snr = packet.snr;

        applyMacCommands(downlink.macCommands, event);
        persist();
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            rxQueue.push(event);
        }

        if (!alive) {
            return Response::SessionExpired;
        }
        if (confirmed && !downlink.ack) {
            return Response::NoAck;
        }
        return Response::DownlinkReceived;
    }

    // ADR_ACK_CNT bookkeeping for an uplink that got no downlink
    void adrAfterSilence() {
        if (!config.adr) {
            return;
        }
        adrAckCounter++;
        if (adrAckCounter >= ADR_ACK_LIMIT + ADR_ACK_DELAY) {
            if (!plan->adrBackoff()) {
                DEBUG_PRINTLN("ADR backoff: already at the slowest data rate");
            }
            adrAckCounter = ADR_ACK_LIMIT;
        }
    }

    Response exchange(const std::vector<uint8_t>& payload, uint8_t port, bool confirmed) {
        uint8_t fctrl = 0;
        if (config.adr) {
            fctrl |= FCTRL_ADR;
            if (adrAckCounter >= ADR_ACK_LIMIT) {
                fctrl |= FCTRL_ADR_ACK_REQ;
            }
        }

        state = State::WaitingForTx;
        if (!waitUntil(nextTxTime)) {
            return Response::Cancelled;
        }

        session->prepareBuffer(payload, confirmed, port, fctrl, *crypto);
        const std::vector<uint8_t> frame = session->buffer();

        // Unconfirmed frames are repeated NbTrans times unless a downlink arrives
        int transmissions = confirmed ? 1 : std::max<int>(1, plan->nbTrans());
        bool transmitted = false;
        WindowResult outcome = WINDOW_TIMEOUT;
        Session::Downlink downlink;
        RxPacket packet;

        for (int n = 0; n < transmissions; n++) {
            if (n > 0) {
                state = State::WaitingForTx;
                if (!waitUntil(nextTxTime)) {
                    outcome = WINDOW_CANCELLED;
                    break;
                }
            }
            uint8_t channel = 0;
            if (!plan->selectChannel(false, channel)) {
                outcome = WINDOW_RADIO_ERROR;
                break;
            }
            uint8_t dataRate = plan->dataRate();
            uint64_t txEnd = 0;
            if (!transmit(frame, plan->uplinkFrequency(channel), dataRate, plan->txPowerDbm(), txEnd)) {
                outcome = WINDOW_RADIO_ERROR;
                break;
            }
            transmitted = true;

            uint64_t rx1At = txEnd + static_cast<uint64_t>(plan->rx1Delay()) * RECEIVE_DELAY_STEP;
            RxWindow windows[2] = {
                {rx1At, plan->rx1Frequency(channel), plan->rx1DataRate(dataRate)},
                {rx1At + RECEIVE_DELAY_STEP, plan->rx2Frequency(), plan->rx2DataRate()}
            };
            outcome = listen(windows, [&](const RxPacket& p) { return acceptDownlink(p, downlink); }, packet);
            if (outcome != WINDOW_TIMEOUT) {
                break;
            }
        }
        radio->sleep();

        if (!transmitted) {
            // The counter value was never on air and stays available
            DEBUG_PRINTLN("Uplink not transmitted");
            return outcome == WINDOW_CANCELLED ? Response::Cancelled : Response::RadioError;
        }
        if (outcome == WINDOW_RECEIVED) {
            return completeWithDownlink(downlink, packet, confirmed);
        }

        Session::Rx2Result rx = session->rx2Complete();
        adrAfterSilence();
        persist();
        if (rx == Session::SESSION_EXPIRED) {
            return Response::SessionExpired;
        }
        if (outcome == WINDOW_CANCELLED) {
            return Response::Cancelled;
        }
        if (outcome == WINDOW_RADIO_ERROR) {
            return Response::RadioError;
        }
        return rx == Session::NO_ACK ? Response::NoAck : Response::RxComplete;
    }

    void settle(Response result) {
        if (result == Response::SessionExpired || (session && session->isExpired())) {
            state = State::SessionExpired;
        } else {
            state = State::Idle;
        }
    }
};

LoRaWAN::LoRaWAN(const DeviceConfig& config, std::unique_ptr<RadioInterface> radio,
                 std::unique_ptr<TimerInterface> timer)
    : LoRaWAN(config, std::move(radio), std::move(timer), std::make_unique<SoftwareCrypto>()) {
}

LoRaWAN::LoRaWAN(const DeviceConfig& config, std::unique_ptr<RadioInterface> radio,
                 std::unique_ptr<TimerInterface> timer, std::unique_ptr<CryptoInterface> crypto)
    : pimpl(std::make_unique<Impl>(config, std::move(radio), std::move(timer), std::move(crypto))) {
    Debug::setVerbose(config.verbose);
    DEBUG_PRINTLN("LoRaWAN node, region " << regionName(config.region)
                  << ", DevEUI " << Debug::hex(config.devEUI));
}

LoRaWAN::~LoRaWAN() = default;

LoRaWAN::Response LoRaWAN::join() {
    pimpl->cancelRequested = false;

    Response result = Response::JoinFailed;
    for (int attempt = 1; attempt <= pimpl->config.maxJoinAttempts; attempt++) {
        if (attempt > 1) {
            uint64_t delay = static_cast<uint64_t>(pimpl->config.joinRetryDelayMs)
                             << std::min(attempt - 2, MAX_JOIN_BACKOFF_SHIFT);
            DEBUG_PRINTLN("Join attempt " << attempt << " in " << delay << " ms");
            if (!pimpl->waitUntil(pimpl->timer->now() + delay)) {
                result = Response::Cancelled;
                break;
            }
        }
        result = pimpl->attemptJoin();
        if (result != Response::NoJoinAccept) {
            break;
        }
    }
    if (result == Response::NoJoinAccept) {
        std::cerr << "Join failed after " << pimpl->config.maxJoinAttempts << " attempt(s)" << std::endl;
        result = Response::JoinFailed;
    }
    pimpl->settle(result);
    return result;
}

LoRaWAN::Response LoRaWAN::joinAttempt() {
    pimpl->cancelRequested = false;
    Response result = pimpl->attemptJoin();
    pimpl->settle(result);
    return result;
}

LoRaWAN::Response LoRaWAN::send(const std::vector<uint8_t>& payload, uint8_t port, bool confirmed) {
    pimpl->cancelRequested = false;

    if (!pimpl->session) {
        return Response::NoSession;
    }
    if (pimpl->session->isExpired()) {
        pimpl->state = State::SessionExpired;
        return Response::SessionExpired;
    }
    if (port == 0 || port > MAX_APP_PORT) {
        return Response::InvalidPort;
    }

    // FHDR (7 + FOpts) | FPort | FRMPayload
    size_t macPayloadSize = 7 + pimpl->session->pendingFOptsLength() +
                            (payload.empty() ? 0 : 1 + payload.size());
    if (macPayloadSize > pimpl->plan->maxMacPayloadSize()) {
        DEBUG_PRINTLN("MACPayload of " << macPayloadSize << " bytes exceeds "
                      << static_cast<int>(pimpl->plan->maxMacPayloadSize()) << " at DR"
                      << static_cast<int>(pimpl->plan->dataRate()));
        return Response::PayloadTooLarge;
    }

    Response result = pimpl->exchange(payload, port, confirmed);
    pimpl->settle(result);
    DEBUG_PRINTLN("Uplink result: " << responseName(result));
    return result;
}

std::optional<LoRaWAN::DownlinkEvent> LoRaWAN::poll() {
    std::lock_guard<std::mutex> lock(pimpl->queueMutex);
    if (pimpl->rxQueue.empty()) {
        return std::nullopt;
    }
    DownlinkEvent event = pimpl->rxQueue.front();
    pimpl->rxQueue.pop();
    return event;
}

void LoRaWAN::cancel() {
    pimpl->cancelRequested = true;
}

bool LoRaWAN::requestLinkCheck() {
    if (!pimpl->session) {
        return false;
    }
    pimpl->session->queueMacCommand(LinkCheckReq());
    return true;
}

bool LoRaWAN::requestDeviceTime() {
    if (!pimpl->session) {
        return false;
    }
    pimpl->session->queueMacCommand(DeviceTimeReq());
    return true;
}

bool LoRaWAN::restoreSession() {
    const std::string& file = pimpl->config.sessionFile;
    if (file.empty()) {
        return false;
    }

    SessionManager::SessionData data;
    if (!SessionManager::loadSession(file, data)) {
        return false;
    }
    if (data.region != pimpl->config.region) {
        std::cerr << "Session file " << file << " belongs to region " << regionName(data.region)
                  << ", not " << regionName(pimpl->config.region) << std::endl;
        return false;
    }
    if (!pimpl->plan->restoreState(data.channels)) {
        std::cerr << "Session file " << file << ": channel plan rejected" << std::endl;
        return false;
    }

    SessionKeys keys = {data.nwkSKey, data.appSKey};
    pimpl->session = std::make_unique<Session>(keys, data.devAddr, data.uplinkCounter,
                                               data.downlinkCounter, data.downlinkReceived);
    pimpl->lastDevNonce = std::max(pimpl->lastDevNonce, data.lastDevNonce);
    pimpl->adrAckCounter = 0;
    pimpl->state = State::Idle;

    DEBUG_PRINTLN("Session restored, DevAddr " << Debug::hex(data.devAddr) << ", FCntUp "
                  << data.uplinkCounter << ", FCntDown " << data.downlinkCounter);
    return true;
}

bool LoRaWAN::saveSession() const {
    return pimpl->save();
}

void LoRaWAN::resetSession() {
    pimpl->session.reset();
    pimpl->state = State::Idle;
    pimpl->adrAckCounter = 0;
    if (!pimpl->config.sessionFile.empty()) {
        SessionManager::clearSession(pimpl->config.sessionFile);
    }
}

LoRaWAN::State LoRaWAN::state() const {
    return pimpl->state;
}

bool LoRaWAN::isJoined() const {
    return pimpl->session != nullptr;
}

DevAddr LoRaWAN::devAddr() const {
    if (!pimpl->session) {
        return DevAddr{{0, 0, 0, 0}};
    }
    return pimpl->session->devAddr();
}

uint32_t LoRaWAN::fcntUp() const {
    return pimpl->session ? pimpl->session->fcntUp() : 0;
}

uint32_t LoRaWAN::fcntDown() const {
    return pimpl->session ? pimpl->session->fcntDown() : 0;
}

uint16_t LoRaWAN::lastDevNonce() const {
    return pimpl->lastDevNonce;
}

const ChannelPlan& LoRaWAN::channelPlan() const {
    return *pimpl->plan;
}

uint64_t LoRaWAN::nextTxTime() const {
    return pimpl->nextTxTime;
}

void LoRaWAN::setADR(bool enabled) {
    pimpl->config.adr = enabled;
    if (!enabled) {
        pimpl->adrAckCounter = 0;
    }
}

bool LoRaWAN::setDataRate(uint8_t dataRate) {
    return pimpl->plan->setDataRate(dataRate);
}

void LoRaWAN::setBatteryLevel(uint8_t level) {
    pimpl->config.batteryLevel = level;
}

void LoRaWAN::seedChannelSelection(uint32_t seed) {
    pimpl->plan->seed(seed);
}

void LoRaWAN::setVerbose(bool verbose) {
    Debug::setVerbose(verbose);
}

bool LoRaWAN::getVerbose() {
    return Debug::getVerbose();
}

const char* responseName(LoRaWAN::Response response) {
    switch (response) {
    case LoRaWAN::Response::JoinSuccess:
        return "join success";
    case LoRaWAN::Response::NoJoinAccept:
        return "no join accept";
    case LoRaWAN::Response::JoinFailed:
        return "join failed";
    case LoRaWAN::Response::DownlinkReceived:
        return "downlink received";
    case LoRaWAN::Response::RxComplete:
        return "rx complete";
    case LoRaWAN::Response::NoAck:
        return "no ack";
    case LoRaWAN::Response::SessionExpired:
        return "session expired";
    case LoRaWAN::Response::NoSession:
        return "no session";
    case LoRaWAN::Response::Cancelled:
        return "cancelled";
    case LoRaWAN::Response::RadioError:
        return "radio error";
    case LoRaWAN::Response::PayloadTooLarge:
        return "payload too large";
    case LoRaWAN::Response::InvalidPort:
        return "invalid port";
    }
    return "unknown";
}
