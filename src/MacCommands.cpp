#include "MacCommands.hpp"
#include "Debug.hpp"
#include <utility>
#include <iomanip>

uint8_t TXParamSetupReq::maxEirp() const {
    static const uint8_t MAX_EIRP_DBM[16] = {
        8, 10, 12, 13, 14, 16, 18, 20, 21, 24, 26, 27, 29, 30, 33, 36
    };
    return MAX_EIRP_DBM[maxEirpIndex()];
}

LinkCheckAnsCreator& LinkCheckAnsCreator::setMargin(uint8_t margin) {
    data[1] = margin;
    return *this;
}

LinkCheckAnsCreator& LinkCheckAnsCreator::setGatewayCount(uint8_t gatewayCount) {
    data[2] = gatewayCount;
    return *this;
}

LinkADRReqCreator& LinkADRReqCreator::setDataRate(uint8_t dataRate) {
    if (dataRate > 0x0F) {
        throw CodecError(CodecError::InvalidDataRate,
                         "LinkADRReq: data rate " + std::to_string(dataRate) + " exceeds 15");
    }
    data[1] &= 0x0F;
    data[1] |= static_cast<uint8_t>(dataRate << 4);
    return *this;
}

LinkADRReqCreator& LinkADRReqCreator::setTxPower(uint8_t txPower) {
    if (txPower > 0x0F) {
        throw CodecError(CodecError::InvalidTxPower,
                         "LinkADRReq: TX power " + std::to_string(txPower) + " exceeds 15");
    }
    data[1] &= 0xF0;
    data[1] |= txPower;
    return *this;
}

LinkADRReqCreator& LinkADRReqCreator::setChannelMask(const ChannelMask<2>& mask) {
    data[2] = mask.getBank(0);
    data[3] = mask.getBank(1);
    return *this;
}

LinkADRReqCreator& LinkADRReqCreator::setChannelMask(const std::array<uint8_t, 2>& mask) {
    return setChannelMask(ChannelMask<2>(mask));
}

LinkADRReqCreator& LinkADRReqCreator::setRedundancy(const Redundancy& redundancy) {
    data[4] = redundancy.rawValue();
    return *this;
}

LinkADRReqCreator& LinkADRReqCreator::setRedundancy(uint8_t redundancy) {
    return setRedundancy(Redundancy(redundancy));
}

LinkADRAnsCreator& LinkADRAnsCreator::setChannelMaskAck(bool ack) {
    data[1] &= 0xFE;
    data[1] |= static_cast<uint8_t>(ack);
    return *this;
}

LinkADRAnsCreator& LinkADRAnsCreator::setDataRateAck(bool ack) {
    data[1] &= 0xFD;
    data[1] |= static_cast<uint8_t>(ack) << 1;
    return *this;
}

LinkADRAnsCreator& LinkADRAnsCreator::setTxPowerAck(bool ack) {
    data[1] &= 0xFB;
    data[1] |= static_cast<uint8_t>(ack) << 2;
    return *this;
}

DutyCycleReqCreator& DutyCycleReqCreator::setMaxDutyCycle(uint8_t maxDutyCycle) {
    if (maxDutyCycle > 0x0F) {
        throw CodecError(CodecError::DutyCycleOutOfRange,
                         "DutyCycleReq: exponent " + std::to_string(maxDutyCycle) + " exceeds 15");
    }
    data[1] = maxDutyCycle;
    return *this;
}

RXParamSetupReqCreator& RXParamSetupReqCreator::setDLSettings(const DLSettings& settings) {
    data[1] = settings.rawValue();
    return *this;
}

RXParamSetupReqCreator& RXParamSetupReqCreator::setDLSettings(uint8_t settings) {
    return setDLSettings(DLSettings(settings));
}

RXParamSetupReqCreator& RXParamSetupReqCreator::setFrequency(const Frequency& frequency) {
    const auto& bytes = frequency.bytes();
    data[2] = bytes[0];
    data[3] = bytes[1];
    data[4] = bytes[2];
    return *this;
}

RXParamSetupAnsCreator& RXParamSetupAnsCreator::setChannelAck(bool ack) {
    data[1] &= 0xFE;
    data[1] |= static_cast<uint8_t>(ack);
    return *this;
}

RXParamSetupAnsCreator& RXParamSetupAnsCreator::setRx2DataRateAck(bool ack) {
    data[1] &= 0xFD;
    data[1] |= static_cast<uint8_t>(ack) << 1;
    return *this;
}

RXParamSetupAnsCreator& RXParamSetupAnsCreator::setRx1DataRateOffsetAck(bool ack) {
    data[1] &= 0xFB;
    data[1] |= static_cast<uint8_t>(ack) << 2;
    return *this;
}

DevStatusAnsCreator& DevStatusAnsCreator::setBattery(uint8_t battery) {
    data[1] = battery;
    return *this;
}

DevStatusAnsCreator& DevStatusAnsCreator::setMargin(int8_t margin) {
    if (margin < -32 || margin > 31) {
        throw CodecError(CodecError::MarginOutOfRange,
                         "DevStatusAns: margin " + std::to_string(margin) + " outside -32..31");
    }
    data[2] = static_cast<uint8_t>(margin) & 0x3F;
    return *this;
}

NewChannelReqCreator& NewChannelReqCreator::setChannelIndex(uint8_t channelIndex) {
    data[1] = channelIndex;
    return *this;
}

NewChannelReqCreator& NewChannelReqCreator::setFrequency(const Frequency& frequency) {
    const auto& bytes = frequency.bytes();
    data[2] = bytes[0];
    data[3] = bytes[1];
    data[4] = bytes[2];
    return *this;
}

NewChannelReqCreator& NewChannelReqCreator::setDataRateRange(const DataRateRange& range) {
    data[5] = range.rawValue();
    return *this;
}

NewChannelReqCreator& NewChannelReqCreator::setDataRateRange(uint8_t range) {
    return setDataRateRange(DataRateRange(range));
}

NewChannelAnsCreator& NewChannelAnsCreator::setChannelFrequencyAck(bool ack) {
    data[1] &= 0xFE;
    data[1] |= static_cast<uint8_t>(ack);
    return *this;
}

NewChannelAnsCreator& NewChannelAnsCreator::setDataRateRangeAck(bool ack) {
    data[1] &= 0xFD;
    data[1] |= static_cast<uint8_t>(ack) << 1;
    return *this;
}

RXTimingSetupReqCreator& RXTimingSetupReqCreator::setDelay(uint8_t delay) {
    if (delay > 0x0F) {
        throw CodecError(CodecError::DelayOutOfRange,
                         "RXTimingSetupReq: delay " + std::to_string(delay) + " exceeds 15");
    }
    data[1] &= 0xF0;
    data[1] |= delay;
    return *this;
}

TXParamSetupReqCreator& TXParamSetupReqCreator::setDownlinkDwellTime(bool enabled) {
    data[1] &= 0xDF;
    data[1] |= static_cast<uint8_t>(enabled) << 5;
    return *this;
}

TXParamSetupReqCreator& TXParamSetupReqCreator::setUplinkDwellTime(bool enabled) {
    data[1] &= 0xEF;
    data[1] |= static_cast<uint8_t>(enabled) << 4;
    return *this;
}

TXParamSetupReqCreator& TXParamSetupReqCreator::setMaxEirp(uint8_t maxEirpIndex) {
    if (maxEirpIndex > 0x0F) {
        throw CodecError(CodecError::MaxEirpOutOfRange,
                         "TXParamSetupReq: max EIRP index " + std::to_string(maxEirpIndex) + " exceeds 15");
    }
    data[1] &= 0xF0;
    data[1] |= maxEirpIndex;
    return *this;
}

DlChannelReqCreator& DlChannelReqCreator::setChannelIndex(uint8_t channelIndex) {
    data[1] = channelIndex;
    return *this;
}

DlChannelReqCreator& DlChannelReqCreator::setFrequency(const Frequency& frequency) {
    const auto& bytes = frequency.bytes();
    data[2] = bytes[0];
    data[3] = bytes[1];
    data[4] = bytes[2];
    return *this;
}

DlChannelAnsCreator& DlChannelAnsCreator::setChannelFrequencyAck(bool ack) {
    data[1] &= 0xFE;
    data[1] |= static_cast<uint8_t>(ack);
    return *this;
}

DlChannelAnsCreator& DlChannelAnsCreator::setUplinkFrequencyExistsAck(bool ack) {
    data[1] &= 0xFD;
    data[1] |= static_cast<uint8_t>(ack) << 1;
    return *this;
}

DeviceTimeAnsCreator& DeviceTimeAnsCreator::setSeconds(uint32_t seconds) {
    data[1] = seconds & 0xFF;
    data[2] = (seconds >> 8) & 0xFF;
    data[3] = (seconds >> 16) & 0xFF;
    data[4] = (seconds >> 24) & 0xFF;
    return *this;
}

DeviceTimeAnsCreator& DeviceTimeAnsCreator::setNanoSeconds(uint32_t nanoSeconds) {
    if (nanoSeconds >= 1000000000u) {
        throw CodecError(CodecError::NanoSecondsOutOfRange,
                         "DeviceTimeAns: " + std::to_string(nanoSeconds) + " ns is not a fraction of a second");
    }
    data[5] = static_cast<uint8_t>(nanoSeconds / 3906250u);
    return *this;
}

namespace {

// CID -> payload length for one direction, -1 for CIDs the direction does not define
template <class Variant, size_t... I>
std::array<int, 256> makeLengthTable(std::index_sequence<I...>) {
    std::array<int, 256> table;
    table.fill(-1);
    ((table[std::variant_alternative_t<I, Variant>::CID] =
          static_cast<int>(std::variant_alternative_t<I, Variant>::LENGTH)), ...);
    return table;
}

template <class Variant>
const std::array<int, 256>& lengthTable() {
    static const std::array<int, 256> table =
        makeLengthTable<Variant>(std::make_index_sequence<std::variant_size_v<Variant>>());
    return table;
}

template <class Variant, size_t... I>
Variant makeCommand(uint8_t cid, const uint8_t* payload, std::index_sequence<I...>) {
    Variant result;
    (void)((std::variant_alternative_t<I, Variant>::CID == cid
                ? (result = std::variant_alternative_t<I, Variant>(payload), true)
                : false) || ...);
    return result;
}

template <class Variant>
bool parseMacCommands(const uint8_t* data, size_t len, std::vector<Variant>& out, const char* direction) {
    const auto& lengths = lengthTable<Variant>();
    size_t i = 0;
    while (i < len) {
        uint8_t cid = data[i];
        int payloadLen = lengths[cid];
        if (payloadLen < 0) {
            DEBUG_PRINTLN("Unknown " << direction << " MAC command: 0x" << std::hex
                          << static_cast<int>(cid) << std::dec);
            return false;
        }
        if (i + 1 + static_cast<size_t>(payloadLen) > len) {
            DEBUG_PRINTLN("Truncated " << direction << " MAC command 0x" << std::hex
                          << static_cast<int>(cid) << std::dec << ": needs " << payloadLen
                          << " bytes, " << (len - i - 1) << " left");
            return false;
        }
        out.push_back(makeCommand<Variant>(cid, data + i + 1,
                                           std::make_index_sequence<std::variant_size_v<Variant>>()));
        i += 1 + static_cast<size_t>(payloadLen);
    }
    return true;
}

} // namespace

bool parseDownlinkMacCommands(const uint8_t* data, size_t len, std::vector<DownlinkMacCommand>& out) {
    return parseMacCommands(data, len, out, "downlink");
}

bool parseUplinkMacCommands(const uint8_t* data, size_t len, std::vector<UplinkMacCommand>& out) {
    return parseMacCommands(data, len, out, "uplink");
}
