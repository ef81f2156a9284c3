/**
 * @file MacCommands.hpp
 * @brief Binary layout of the LoRaWAN 1.0.x MAC commands.
 *
 * Every command is a CID byte followed by a fixed-size payload. For each
 * command this header provides:
 * - a payload class (e.g. LinkADRReq) that decodes the fields of a received
 *   payload, and
 * - a creator class (e.g. LinkADRReqCreator) with fluent setters that writes
 *   CID and payload into a fixed-offset buffer.
 *
 * Sub-byte fields are packed with mask-and-shift, so setters may be called in
 * any order without disturbing bits written by a sibling setter. Setters whose
 * argument has a protocol-defined range throw CodecError instead of clamping.
 *
 * Commands travelling in each direction are grouped in a tagged union
 * (DownlinkMacCommand, UplinkMacCommand). A sequence of commands serializes
 * as CID|payload concatenated with no padding or delimiter.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <variant>
#include <vector>
#include "LoRaWANTypes.hpp"
#include "LoRaWANError.hpp"

// LoRaWAN 1.0.x MAC commands
#define MAC_LINK_CHECK_REQ 0x02
#define MAC_LINK_CHECK_ANS 0x02
#define MAC_LINK_ADR_REQ 0x03
#define MAC_LINK_ADR_ANS 0x03
#define MAC_DUTY_CYCLE_REQ 0x04
#define MAC_DUTY_CYCLE_ANS 0x04
#define MAC_RX_PARAM_SETUP_REQ 0x05
#define MAC_RX_PARAM_SETUP_ANS 0x05
#define MAC_DEV_STATUS_REQ 0x06
#define MAC_DEV_STATUS_ANS 0x06
#define MAC_NEW_CHANNEL_REQ 0x07
#define MAC_NEW_CHANNEL_ANS 0x07
#define MAC_RX_TIMING_SETUP_REQ 0x08
#define MAC_RX_TIMING_SETUP_ANS 0x08
#define MAC_TX_PARAM_SETUP_REQ 0x09
#define MAC_TX_PARAM_SETUP_ANS 0x09
#define MAC_DL_CHANNEL_REQ 0x0A
#define MAC_DL_CHANNEL_ANS 0x0A
#define MAC_DEVICE_TIME_REQ 0x0D
#define MAC_DEVICE_TIME_ANS 0x0D

/**
 * @brief Fixed-size payload of one MAC command.
 *
 * @tparam Cid Command identifier
 * @tparam Len Payload length in bytes (CID excluded)
 */
template <uint8_t Cid, size_t Len>
class MacCommandPayload {
public:
    static constexpr uint8_t CID = Cid;
    static constexpr size_t LENGTH = Len;

    MacCommandPayload() { data.fill(0); }

    /**
     * @brief Decode from the payload bytes that follow the CID.
     *
     * The caller guarantees that @p payload holds at least LENGTH bytes.
     */
    explicit MacCommandPayload(const uint8_t* payload) {
        for (size_t i = 0; i < Len; i++) {
            data[i] = payload[i];
        }
    }

    uint8_t cid() const { return Cid; }
    size_t payloadLength() const { return Len; }
    const uint8_t* payloadBytes() const { return data.data(); }

    bool operator==(const MacCommandPayload& other) const { return data == other.data; }
    bool operator!=(const MacCommandPayload& other) const { return data != other.data; }

protected:
    std::array<uint8_t, Len> data;
};

// ---------------------------------------------------------------------------
// Network -> device
// ---------------------------------------------------------------------------

/**
 * @brief LinkCheckAns: link margin in dB above demodulation floor and gateway count.
 */
class LinkCheckAns : public MacCommandPayload<MAC_LINK_CHECK_ANS, 2> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t margin() const { return data[0]; }
    uint8_t gatewayCount() const { return data[1]; }
};

/**
 * @brief LinkADRReq: requested data rate, TX power, channel mask and redundancy.
 */
class LinkADRReq : public MacCommandPayload<MAC_LINK_ADR_REQ, 4> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t dataRate() const { return data[0] >> 4; }
    uint8_t txPower() const { return data[0] & 0x0F; }
    ChannelMask<2> channelMask() const { return ChannelMask<2>(std::array<uint8_t, 2>{{data[1], data[2]}}); }
    Redundancy redundancy() const { return Redundancy(data[3]); }
};

/**
 * @brief DutyCycleReq: aggregated duty cycle limit 1 / 2^MaxDCycle.
 */
class DutyCycleReq : public MacCommandPayload<MAC_DUTY_CYCLE_REQ, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t maxDutyCycleRaw() const { return data[0] & 0x0F; }
    double maxDutyCycle() const { return 1.0 / static_cast<double>(1u << maxDutyCycleRaw()); }
};

/**
 * @brief RXParamSetupReq: RX1 data rate offset, RX2 data rate and RX2 frequency.
 */
class RXParamSetupReq : public MacCommandPayload<MAC_RX_PARAM_SETUP_REQ, 4> {
public:
    using MacCommandPayload::MacCommandPayload;
    DLSettings dlSettings() const { return DLSettings(data[0]); }
    Frequency frequency() const { return Frequency(&data[1]); }
};

class DevStatusReq : public MacCommandPayload<MAC_DEV_STATUS_REQ, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

/**
 * @brief NewChannelReq: create, modify or (frequency 0) delete an uplink channel.
 */
class NewChannelReq : public MacCommandPayload<MAC_NEW_CHANNEL_REQ, 5> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t channelIndex() const { return data[0]; }
    Frequency frequency() const { return Frequency(&data[1]); }
    DataRateRange dataRateRange() const { return DataRateRange(data[4]); }
};

/**
 * @brief RXTimingSetupReq: delay in seconds before RX1 opens (0 means 1 s).
 */
class RXTimingSetupReq : public MacCommandPayload<MAC_RX_TIMING_SETUP_REQ, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t delay() const { return data[0] & 0x0F; }
};

/**
 * @brief TXParamSetupReq: dwell time limits and maximum EIRP (AS923).
 */
class TXParamSetupReq : public MacCommandPayload<MAC_TX_PARAM_SETUP_REQ, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    bool downlinkDwellTime() const { return (data[0] & 0x20) != 0; }
    bool uplinkDwellTime() const { return (data[0] & 0x10) != 0; }
    uint8_t maxEirpIndex() const { return data[0] & 0x0F; }

    /**
     * @brief Maximum EIRP in dBm encoded by maxEirpIndex().
     */
    uint8_t maxEirp() const;
};

/**
 * @brief DlChannelReq: move the RX1 downlink frequency of an uplink channel.
 */
class DlChannelReq : public MacCommandPayload<MAC_DL_CHANNEL_REQ, 4> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t channelIndex() const { return data[0]; }
    Frequency frequency() const { return Frequency(&data[1]); }
};

/**
 * @brief DeviceTimeAns: GPS epoch seconds and fractional second in 1/256 s steps.
 */
class DeviceTimeAns : public MacCommandPayload<MAC_DEVICE_TIME_ANS, 5> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint32_t seconds() const {
        return static_cast<uint32_t>(data[0]) |
               (static_cast<uint32_t>(data[1]) << 8) |
               (static_cast<uint32_t>(data[2]) << 16) |
               (static_cast<uint32_t>(data[3]) << 24);
    }
    uint32_t nanoSeconds() const { return static_cast<uint32_t>(data[4]) * 3906250u; }
};

// ---------------------------------------------------------------------------
// Device -> network
// ---------------------------------------------------------------------------

class LinkCheckReq : public MacCommandPayload<MAC_LINK_CHECK_REQ, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

class LinkADRAns : public MacCommandPayload<MAC_LINK_ADR_ANS, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    bool channelMaskAck() const { return (data[0] & 0x01) != 0; }
    bool dataRateAck() const { return (data[0] & 0x02) != 0; }
    bool txPowerAck() const { return (data[0] & 0x04) != 0; }
    bool ack() const { return (data[0] & 0x07) == 0x07; }
};

class DutyCycleAns : public MacCommandPayload<MAC_DUTY_CYCLE_ANS, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

class RXParamSetupAns : public MacCommandPayload<MAC_RX_PARAM_SETUP_ANS, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    bool channelAck() const { return (data[0] & 0x01) != 0; }
    bool rx2DataRateAck() const { return (data[0] & 0x02) != 0; }
    bool rx1DataRateOffsetAck() const { return (data[0] & 0x04) != 0; }
    bool ack() const { return (data[0] & 0x07) == 0x07; }
};

/**
 * @brief DevStatusAns: battery level and demodulation margin (6-bit signed).
 */
class DevStatusAns : public MacCommandPayload<MAC_DEV_STATUS_ANS, 2> {
public:
    using MacCommandPayload::MacCommandPayload;
    uint8_t battery() const { return data[0]; }
    int8_t margin() const {
        uint8_t raw = data[1] & 0x3F;
        return static_cast<int8_t>((raw & 0x20) ? (raw | 0xC0) : raw);
    }
};

class NewChannelAns : public MacCommandPayload<MAC_NEW_CHANNEL_ANS, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    bool channelFrequencyAck() const { return (data[0] & 0x01) != 0; }
    bool dataRateRangeAck() const { return (data[0] & 0x02) != 0; }
    bool ack() const { return (data[0] & 0x03) == 0x03; }
};

class RXTimingSetupAns : public MacCommandPayload<MAC_RX_TIMING_SETUP_ANS, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

class TXParamSetupAns : public MacCommandPayload<MAC_TX_PARAM_SETUP_ANS, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

class DlChannelAns : public MacCommandPayload<MAC_DL_CHANNEL_ANS, 1> {
public:
    using MacCommandPayload::MacCommandPayload;
    bool channelFrequencyAck() const { return (data[0] & 0x01) != 0; }
    bool uplinkFrequencyExistsAck() const { return (data[0] & 0x02) != 0; }
    bool ack() const { return (data[0] & 0x03) == 0x03; }
};

class DeviceTimeReq : public MacCommandPayload<MAC_DEVICE_TIME_REQ, 0> {
public:
    using MacCommandPayload::MacCommandPayload;
};

/**
 * @brief Commands a device receives (FOpts or FPort 0 of a downlink).
 */
typedef std::variant<LinkCheckAns, LinkADRReq, DutyCycleReq, RXParamSetupReq,
                     DevStatusReq, NewChannelReq, RXTimingSetupReq, TXParamSetupReq,
                     DlChannelReq, DeviceTimeAns> DownlinkMacCommand;

/**
 * @brief Commands a device sends (FOpts or FPort 0 of an uplink).
 */
typedef std::variant<LinkCheckReq, LinkADRAns, DutyCycleAns, RXParamSetupAns,
                     DevStatusAns, NewChannelAns, RXTimingSetupAns, TXParamSetupAns,
                     DlChannelAns, DeviceTimeReq> UplinkMacCommand;

// ---------------------------------------------------------------------------
// Creators
// ---------------------------------------------------------------------------

/**
 * @brief Writes CID and payload of one command into a fixed-offset buffer.
 *
 * build() returns the serialized command (CID at offset 0). payload() returns
 * the same bytes decoded as the command's payload class.
 */
template <class Payload>
class MacCommandCreator {
public:
    MacCommandCreator() {
        data.fill(0);
        data[0] = Payload::CID;
    }

    const std::array<uint8_t, 1 + Payload::LENGTH>& build() const { return data; }

    Payload payload() const { return Payload(data.data() + 1); }

protected:
    std::array<uint8_t, 1 + Payload::LENGTH> data;
};

typedef MacCommandCreator<LinkCheckReq> LinkCheckReqCreator;
typedef MacCommandCreator<DutyCycleAns> DutyCycleAnsCreator;
typedef MacCommandCreator<DevStatusReq> DevStatusReqCreator;
typedef MacCommandCreator<RXTimingSetupAns> RXTimingSetupAnsCreator;
typedef MacCommandCreator<TXParamSetupAns> TXParamSetupAnsCreator;
typedef MacCommandCreator<DeviceTimeReq> DeviceTimeReqCreator;

class LinkCheckAnsCreator : public MacCommandCreator<LinkCheckAns> {
public:
    /**
     * @brief Margin in dB above the demodulation floor (255 is reserved).
     */
    LinkCheckAnsCreator& setMargin(uint8_t margin);
    LinkCheckAnsCreator& setGatewayCount(uint8_t gatewayCount);
};

class LinkADRReqCreator : public MacCommandCreator<LinkADRReq> {
public:
    /**
     * @brief Data rate index, stored in the upper nibble.
     * @throws CodecError(InvalidDataRate) if @p dataRate exceeds 15
     */
    LinkADRReqCreator& setDataRate(uint8_t dataRate);

    /**
     * @brief TX power index, stored in the lower nibble.
     * @throws CodecError(InvalidTxPower) if @p txPower exceeds 15
     */
    LinkADRReqCreator& setTxPower(uint8_t txPower);

    LinkADRReqCreator& setChannelMask(const ChannelMask<2>& mask);
    LinkADRReqCreator& setChannelMask(const std::array<uint8_t, 2>& mask);
    LinkADRReqCreator& setRedundancy(const Redundancy& redundancy);
    LinkADRReqCreator& setRedundancy(uint8_t redundancy);
};

class LinkADRAnsCreator : public MacCommandCreator<LinkADRAns> {
public:
    LinkADRAnsCreator& setChannelMaskAck(bool ack);
    LinkADRAnsCreator& setDataRateAck(bool ack);
    LinkADRAnsCreator& setTxPowerAck(bool ack);
};

class DutyCycleReqCreator : public MacCommandCreator<DutyCycleReq> {
public:
    /**
     * @brief Aggregated duty cycle exponent: limit is 1 / 2^maxDutyCycle.
     * @throws CodecError(DutyCycleOutOfRange) if @p maxDutyCycle exceeds 15
     */
    DutyCycleReqCreator& setMaxDutyCycle(uint8_t maxDutyCycle);
};

class RXParamSetupReqCreator : public MacCommandCreator<RXParamSetupReq> {
public:
    RXParamSetupReqCreator& setDLSettings(const DLSettings& settings);
    RXParamSetupReqCreator& setDLSettings(uint8_t settings);
    RXParamSetupReqCreator& setFrequency(const Frequency& frequency);
};

class RXParamSetupAnsCreator : public MacCommandCreator<RXParamSetupAns> {
public:
    RXParamSetupAnsCreator& setChannelAck(bool ack);
    RXParamSetupAnsCreator& setRx2DataRateAck(bool ack);
    RXParamSetupAnsCreator& setRx1DataRateOffsetAck(bool ack);
};

class DevStatusAnsCreator : public MacCommandCreator<DevStatusAns> {
public:
    /**
     * @brief Battery level: 0 external power, 1..254 battery, 255 not measured.
     */
    DevStatusAnsCreator& setBattery(uint8_t battery);

    /**
     * @brief Demodulation margin in dB.
     * @throws CodecError(MarginOutOfRange) outside -32..31
     */
    DevStatusAnsCreator& setMargin(int8_t margin);
};

class NewChannelReqCreator : public MacCommandCreator<NewChannelReq> {
public:
    NewChannelReqCreator& setChannelIndex(uint8_t channelIndex);
    NewChannelReqCreator& setFrequency(const Frequency& frequency);
    NewChannelReqCreator& setDataRateRange(const DataRateRange& range);
    NewChannelReqCreator& setDataRateRange(uint8_t range);
};

class NewChannelAnsCreator : public MacCommandCreator<NewChannelAns> {
public:
    NewChannelAnsCreator& setChannelFrequencyAck(bool ack);
    NewChannelAnsCreator& setDataRateRangeAck(bool ack);
};

class RXTimingSetupReqCreator : public MacCommandCreator<RXTimingSetupReq> {
public:
    /**
     * @throws CodecError(DelayOutOfRange) if @p delay exceeds 15
     */
    RXTimingSetupReqCreator& setDelay(uint8_t delay);
};

class TXParamSetupReqCreator : public MacCommandCreator<TXParamSetupReq> {
public:
    TXParamSetupReqCreator& setDownlinkDwellTime(bool enabled);
    TXParamSetupReqCreator& setUplinkDwellTime(bool enabled);

    /**
     * @throws CodecError(MaxEirpOutOfRange) if @p maxEirpIndex exceeds 15
     */
    TXParamSetupReqCreator& setMaxEirp(uint8_t maxEirpIndex);
};

class DlChannelReqCreator : public MacCommandCreator<DlChannelReq> {
public:
    DlChannelReqCreator& setChannelIndex(uint8_t channelIndex);
    DlChannelReqCreator& setFrequency(const Frequency& frequency);
};

class DlChannelAnsCreator : public MacCommandCreator<DlChannelAns> {
public:
    DlChannelAnsCreator& setChannelFrequencyAck(bool ack);
    DlChannelAnsCreator& setUplinkFrequencyExistsAck(bool ack);
};

class DeviceTimeAnsCreator : public MacCommandCreator<DeviceTimeAns> {
public:
    DeviceTimeAnsCreator& setSeconds(uint32_t seconds);

    /**
     * @throws CodecError(NanoSecondsOutOfRange) at 1e9 or more
     */
    DeviceTimeAnsCreator& setNanoSeconds(uint32_t nanoSeconds);
};

// ---------------------------------------------------------------------------
// Sequences
// ---------------------------------------------------------------------------

template <class Command>
uint8_t macCommandCid(const Command& cmd) {
    return std::visit([](const auto& c) { return c.cid(); }, cmd);
}

template <class Command>
size_t macCommandPayloadLength(const Command& cmd) {
    return std::visit([](const auto& c) { return c.payloadLength(); }, cmd);
}

/**
 * @brief Serialized length of a command sequence: sum of 1 + payload length.
 */
template <class Command>
size_t macCommandsLength(const std::vector<Command>& cmds) {
    size_t len = 0;
    for (const auto& cmd : cmds) {
        len += 1 + macCommandPayloadLength(cmd);
    }
    return len;
}

/**
 * @brief Serialize a command sequence as CID|payload, back to back.
 *
 * The total length is computed before anything is written.
 *
 * @return number of bytes written
 * @throws CodecError(BufferTooShort) if @p outLen cannot hold the sequence
 */
template <class Command>
size_t buildMacCommands(const std::vector<Command>& cmds, uint8_t* out, size_t outLen) {
    if (macCommandsLength(cmds) > outLen) {
        throw CodecError(CodecError::BufferTooShort, "MAC commands do not fit in output buffer");
    }
    size_t i = 0;
    for (const auto& cmd : cmds) {
        std::visit([&](const auto& c) {
            out[i++] = c.cid();
            const uint8_t* payload = c.payloadBytes();
            for (size_t j = 0; j < c.payloadLength(); j++) {
                out[i++] = payload[j];
            }
        }, cmd);
    }
    return i;
}

/**
 * @brief Decode the MAC commands of a downlink (FOpts or FPort 0 payload).
 *
 * @return false on an unknown CID or a truncated command; @p out then holds
 *         the commands decoded before the error
 */
bool parseDownlinkMacCommands(const uint8_t* data, size_t len, std::vector<DownlinkMacCommand>& out);

/**
 * @brief Decode the MAC commands of an uplink.
 */
bool parseUplinkMacCommands(const uint8_t* data, size_t len, std::vector<UplinkMacCommand>& out);
