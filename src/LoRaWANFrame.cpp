#include "LoRaWANFrame.hpp"
#include "LoRaWANError.hpp"
#include "Debug.hpp"
#include <algorithm>

std::vector<uint8_t> LoRaWANFrame::buildJoinRequest(const EUI64& appEUI, const EUI64& devEUI,
                                                    uint16_t devNonce, const AES128Key& appKey,
                                                    CryptoInterface& crypto) {
    std::vector<uint8_t> packet;
    packet.reserve(JOIN_REQUEST_LEN);

    packet.push_back(MHDR_JOIN_REQUEST);
    packet.insert(packet.end(), appEUI.begin(), appEUI.end());
    packet.insert(packet.end(), devEUI.begin(), devEUI.end());
    packet.push_back(devNonce & 0xFF);
    packet.push_back((devNonce >> 8) & 0xFF);

    // MIC = CMAC(AppKey, MHDR | AppEUI | DevEUI | DevNonce)
    MIC mic = crypto.computeMIC(appKey, packet);
    packet.insert(packet.end(), mic.begin(), mic.end());

    DEBUG_HEX("Join Request: ", packet);
    return packet;
}

bool LoRaWANFrame::decodeJoinAccept(const uint8_t* frame, size_t len, const AES128Key& appKey,
                                    CryptoInterface& crypto, JoinAccept& out) {
    if (len != JOIN_ACCEPT_LEN && len != JOIN_ACCEPT_CFLIST_LEN) {
        DEBUG_PRINTLN("Join Accept: invalid length " << len);
        return false;
    }
    if ((frame[0] & MHDR_MTYPE_MASK) != MHDR_JOIN_ACCEPT) {
        DEBUG_PRINTLN("Join Accept: unexpected MHDR 0x" << std::hex << static_cast<int>(frame[0]) << std::dec);
        return false;
    }

    // MHDR travels in clear, the rest is a whole number of blocks
    std::vector<uint8_t> decrypted(len);
    decrypted[0] = frame[0];
    crypto.decryptJoinAccept(appKey, frame + 1, len - 1, decrypted.data() + 1);

    std::vector<uint8_t> micData(decrypted.begin(), decrypted.end() - 4);
    MIC calculated = crypto.computeMIC(appKey, micData);
    if (!std::equal(calculated.begin(), calculated.end(), decrypted.end() - 4)) {
        DEBUG_PRINTLN("Join Accept: invalid MIC");
        return false;
    }

    JoinAccept accept;
    std::copy(decrypted.begin() + 1, decrypted.begin() + 4, accept.appNonce.begin());
    std::copy(decrypted.begin() + 4, decrypted.begin() + 7, accept.netId.begin());
    std::copy(decrypted.begin() + 7, decrypted.begin() + 11, accept.devAddr.begin());
    accept.dlSettings = DLSettings(decrypted[11]);
    accept.rxDelay = decrypted[12];
    accept.hasCFList = false;

    if (len == JOIN_ACCEPT_CFLIST_LEN) {
        // Only CFList type 0 (frequency list) is defined for dynamic plans
        if (decrypted[28] == 0x00) {
            accept.hasCFList = true;
            for (size_t i = 0; i < CFLIST_CHANNELS; i++) {
                accept.cfList[i] = Frequency(&decrypted[13 + i * 3]);
            }
        } else {
            DEBUG_PRINTLN("Join Accept: ignoring CFList type " << static_cast<int>(decrypted[28]));
        }
    }

    out = accept;
    return true;
}

MIC LoRaWANFrame::dataMIC(const uint8_t* msg, size_t len, Direction dir, const DevAddr& devAddr,
                          uint32_t fcnt, const AES128Key& nwkSKey, CryptoInterface& crypto) {
    // B0 = 0x49 | 0x00^4 | Dir | DevAddr | FCnt | 0x00 | len(msg)
    std::vector<uint8_t> micData;
    micData.reserve(16 + len);
    micData.push_back(0x49);
    micData.insert(micData.end(), 4, 0x00);
    micData.push_back(static_cast<uint8_t>(dir));
    micData.insert(micData.end(), devAddr.begin(), devAddr.end());
    micData.push_back(fcnt & 0xFF);
    micData.push_back((fcnt >> 8) & 0xFF);
    micData.push_back((fcnt >> 16) & 0xFF);
    micData.push_back((fcnt >> 24) & 0xFF);
    micData.push_back(0x00);
    micData.push_back(static_cast<uint8_t>(len));
    micData.insert(micData.end(), msg, msg + len);

    return crypto.computeMIC(nwkSKey, micData);
}

std::vector<uint8_t> LoRaWANFrame::buildDataFrame(const DataFrame& frame, Direction dir,
                                                  const AES128Key& nwkSKey, const AES128Key& appSKey,
                                                  CryptoInterface& crypto) {
    if (frame.fopts.size() > MAX_FOPTS_LEN) {
        throw CapacityError("FOpts holds at most 15 bytes, got " + std::to_string(frame.fopts.size()));
    }
    if (frame.hasPort && frame.fport == 0 && !frame.fopts.empty()) {
        throw LoRaWANError("MAC commands cannot travel in FOpts and on FPort 0 at once");
    }
    if (!frame.hasPort && !frame.payload.empty()) {
        throw LoRaWANError("FRMPayload requires an FPort");
    }

    std::vector<uint8_t> packet;
    packet.reserve(8 + frame.fopts.size() + 1 + frame.payload.size() + 4);

    packet.push_back(frame.mhdr);
    packet.insert(packet.end(), frame.devAddr.begin(), frame.devAddr.end());
    packet.push_back(static_cast<uint8_t>((frame.fctrl & ~FCTRL_FOPTS_LEN) | frame.fopts.size()));
    packet.push_back(frame.fcnt & 0xFF);
    packet.push_back((frame.fcnt >> 8) & 0xFF);
    packet.insert(packet.end(), frame.fopts.begin(), frame.fopts.end());

    if (frame.hasPort) {
        packet.push_back(frame.fport);
        std::vector<uint8_t> encrypted = frame.payload;
        const AES128Key& key = frame.fport == 0 ? nwkSKey : appSKey;
        crypto.encryptPayload(key, frame.fcnt, dir, frame.devAddr, encrypted);
        packet.insert(packet.end(), encrypted.begin(), encrypted.end());
    }

    MIC mic = dataMIC(packet.data(), packet.size(), dir, frame.devAddr, frame.fcnt, nwkSKey, crypto);
    packet.insert(packet.end(), mic.begin(), mic.end());
    return packet;
}

bool LoRaWANFrame::parseDataFrame(const uint8_t* frame, size_t len, DataFrame& out) {
    // MHDR + FHDR(7) + MIC(4)
    if (len < 12) {
        DEBUG_PRINTLN("Data frame too short: " << len << " bytes");
        return false;
    }
    uint8_t mtype = frame[0] & MHDR_MTYPE_MASK;
    if (mtype != MHDR_UNCONFIRMED_UP && mtype != MHDR_UNCONFIRMED_DOWN &&
        mtype != MHDR_CONFIRMED_UP && mtype != MHDR_CONFIRMED_DOWN) {
        DEBUG_PRINTLN("Not a data frame, MHDR 0x" << std::hex << static_cast<int>(frame[0]) << std::dec);
        return false;
    }

    size_t foptsLen = frame[5] & FCTRL_FOPTS_LEN;
    if (8 + foptsLen + 4 > len) {
        DEBUG_PRINTLN("Data frame truncated inside FOpts");
        return false;
    }

    DataFrame parsed;
    parsed.mhdr = frame[0];
    std::copy(frame + 1, frame + 5, parsed.devAddr.begin());
    parsed.fctrl = frame[5] & static_cast<uint8_t>(~FCTRL_FOPTS_LEN);
    parsed.fcnt = static_cast<uint32_t>(frame[6]) | (static_cast<uint32_t>(frame[7]) << 8);
    parsed.fopts.assign(frame + 8, frame + 8 + foptsLen);

    size_t pos = 8 + foptsLen;
    size_t micPos = len - 4;
    if (pos < micPos) {
        parsed.hasPort = true;
        parsed.fport = frame[pos++];
        parsed.payload.assign(frame + pos, frame + micPos);
    }

    out = parsed;
    return true;
}

bool LoRaWANFrame::verifyDataMIC(const uint8_t* frame, size_t len, Direction dir,
                                 const DevAddr& devAddr, uint32_t fcnt,
                                 const AES128Key& nwkSKey, CryptoInterface& crypto) {
    if (len < 4) {
        return false;
    }
    MIC calculated = dataMIC(frame, len - 4, dir, devAddr, fcnt, nwkSKey, crypto);
    return std::equal(calculated.begin(), calculated.end(), frame + len - 4);
}

uint32_t LoRaWANFrame::expandFCnt(uint16_t fcnt16, uint32_t last) {
    uint32_t candidate = (last & 0xFFFF0000u) | fcnt16;
    if (candidate < last && (last & 0xFFFF0000u) != 0xFFFF0000u) {
        candidate += 0x10000u;
    }
    return candidate;
}
