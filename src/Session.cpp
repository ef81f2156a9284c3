#include "Session.hpp"
#include "LoRaWANError.hpp"
#include "Debug.hpp"

Session::Session(const SessionKeys& keys, const DevAddr& devAddr)
    : Session(keys, devAddr, 0, 0, false) {
}

Session::Session(const SessionKeys& keys, const DevAddr& devAddr, uint32_t fcntUp, uint32_t fcntDown,
                 bool received)
    : sessionKeys(keys),
      address(devAddr),
      uplinkCounter(fcntUp),
      downlinkCounter(fcntDown),
      downlinkReceived(received),
      expired(false),
      confirmsDownlink(false),
      lastUplinkConfirmed(false) {
    pending.reserve(MAX_PENDING_MAC_COMMANDS);
}

void Session::queueMacCommand(const UplinkMacCommand& cmd) {
    if (pending.size() >= MAX_PENDING_MAC_COMMANDS) {
        throw CapacityError("MAC command queue full (" + std::to_string(MAX_PENDING_MAC_COMMANDS) +
                            " commands)");
    }
    pending.push_back(cmd);
}

size_t Session::pendingFOptsLength() const {
    size_t len = 0;
    for (const auto& cmd : pending) {
        size_t cmdLen = 1 + macCommandPayloadLength(cmd);
        if (len + cmdLen > MAX_FOPTS_LEN) {
            break;
        }
        len += cmdLen;
    }
    return len;
}

uint32_t Session::prepareBuffer(const std::vector<uint8_t>& payload, bool confirmed, uint8_t port,
                                uint8_t fctrl, CryptoInterface& crypto) {
    if (expired) {
        throw SessionExpiredError();
    }
    txBuffer.clear();

    DataFrame frame;
    frame.mhdr = confirmed ? MHDR_CONFIRMED_UP : MHDR_UNCONFIRMED_UP;
    frame.devAddr = address;
    frame.fctrl = fctrl & (FCTRL_ADR | FCTRL_ADR_ACK_REQ);
    frame.fcnt = uplinkCounter;

    if (confirmsDownlink) {
        frame.fctrl |= FCTRL_ACK;
        confirmsDownlink = false;
    }

    // Drain in order while the commands fit
    size_t sent = 0;
    std::vector<UplinkMacCommand> fitting;
    size_t foptsLen = pendingFOptsLength();
    size_t used = 0;
    while (sent < pending.size() && used < foptsLen) {
        used += 1 + macCommandPayloadLength(pending[sent]);
        fitting.push_back(pending[sent]);
        sent++;
    }
    frame.fopts.resize(foptsLen);
    buildMacCommands(fitting, frame.fopts.data(), frame.fopts.size());
    if (sent < pending.size()) {
        DEBUG_PRINTLN((pending.size() - sent) << " MAC command(s) deferred to the next uplink");
    }
    pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(sent));

    if (!payload.empty()) {
        frame.hasPort = true;
        frame.fport = port;
        frame.payload = payload;
    }

    txBuffer = LoRaWANFrame::buildDataFrame(frame, Direction::Uplink, sessionKeys.nwkSKey,
                                            sessionKeys.appSKey, crypto);
    lastUplinkConfirmed = confirmed;

    DEBUG_PRINTLN("Uplink FCnt " << uplinkCounter << (confirmed ? " (confirmed)" : ""));
    DEBUG_HEX("Uplink frame: ", txBuffer);
    return uplinkCounter;
}

bool Session::advanceUplinkCounter() {
    if (uplinkCounter == 0xFFFFFFFFu) {
        expired = true;
        DEBUG_PRINTLN("Uplink counter exhausted, session expired");
        return false;
    }
    uplinkCounter++;
    return true;
}

Session::Rx2Result Session::rx2Complete() {
    if (!advanceUplinkCounter()) {
        return SESSION_EXPIRED;
    }
    return lastUplinkConfirmed ? NO_ACK : RX_COMPLETE;
}

bool Session::downlinkComplete() {
    return advanceUplinkCounter();
}

Session::DownlinkStatus Session::processDownlink(const uint8_t* data, size_t len, CryptoInterface& crypto,
                                                 Downlink& out) {
    DataFrame frame;
    if (!LoRaWANFrame::parseDataFrame(data, len, frame)) {
        return DOWNLINK_MALFORMED;
    }
    uint8_t mtype = frame.mhdr & MHDR_MTYPE_MASK;
    if (mtype != MHDR_UNCONFIRMED_DOWN && mtype != MHDR_CONFIRMED_DOWN) {
        return DOWNLINK_MALFORMED;
    }
    if (frame.hasPort && frame.fport == 0 && !frame.fopts.empty()) {
        return DOWNLINK_MALFORMED;
    }
    if (frame.devAddr != address) {
        return DOWNLINK_WRONG_ADDRESS;
    }

    uint32_t fcnt = LoRaWANFrame::expandFCnt(static_cast<uint16_t>(frame.fcnt), downlinkCounter);
    if (downlinkReceived && fcnt <= downlinkCounter) {
        DEBUG_PRINTLN("Downlink FCnt " << fcnt << " not above " << downlinkCounter);
        return DOWNLINK_REPLAYED;
    }
    if (!LoRaWANFrame::verifyDataMIC(data, len, Direction::Downlink, address, fcnt,
                                     sessionKeys.nwkSKey, crypto)) {
        return DOWNLINK_BAD_MIC;
    }

    downlinkCounter = fcnt;
    downlinkReceived = true;
    frame.fcnt = fcnt;

    if (frame.hasPort && !frame.payload.empty()) {
        const AES128Key& key = frame.fport == 0 ? sessionKeys.nwkSKey : sessionKeys.appSKey;
        crypto.encryptPayload(key, fcnt, Direction::Downlink, address, frame.payload);
    }

    Downlink downlink;
    const std::vector<uint8_t>& commands = (frame.hasPort && frame.fport == 0) ? frame.payload : frame.fopts;
    if (!parseDownlinkMacCommands(commands.data(), commands.size(), downlink.macCommands)) {
        DEBUG_PRINTLN("Downlink MAC commands partially decoded: " << downlink.macCommands.size());
    }
    downlink.ack = (frame.fctrl & FCTRL_ACK) != 0;
    downlink.framePending = (frame.fctrl & FCTRL_FPENDING) != 0;
    if (mtype == MHDR_CONFIRMED_DOWN) {
        confirmsDownlink = true;
    }
    downlink.frame = frame;

    DEBUG_PRINTLN("Downlink FCnt " << fcnt << " accepted, " << downlink.macCommands.size()
                  << " MAC command(s)");
    out = downlink;
    return DOWNLINK_ACCEPTED;
}

const char* downlinkStatusName(Session::DownlinkStatus status) {
    switch (status) {
    case Session::DOWNLINK_ACCEPTED:
        return "accepted";
    case Session::DOWNLINK_MALFORMED:
        return "malformed";
    case Session::DOWNLINK_WRONG_ADDRESS:
        return "wrong address";
    case Session::DOWNLINK_REPLAYED:
        return "replayed counter";
    case Session::DOWNLINK_BAD_MIC:
        return "MIC mismatch";
    }
    return "unknown";
}
