#include "ChannelPlan.hpp"
#include "Debug.hpp"
#include <algorithm>
#include <cmath>

namespace {

// EU868 implements the certification minimum DR0..DR5; EU433 uses the same table
const DatarateTable EU868_DATARATES = {{
    Datarate{SpreadingFactor::SF12, Bandwidth::BW125, 59, 59},
    Datarate{SpreadingFactor::SF11, Bandwidth::BW125, 59, 59},
    Datarate{SpreadingFactor::SF10, Bandwidth::BW125, 59, 59},
    Datarate{SpreadingFactor::SF9, Bandwidth::BW125, 123, 123},
    Datarate{SpreadingFactor::SF8, Bandwidth::BW125, 250, 250},
    Datarate{SpreadingFactor::SF7, Bandwidth::BW125, 250, 250},
}};

// AS923 DR0..DR6; DR7 (FSK) is not supported
const DatarateTable AS923_DATARATES = {{
    Datarate{SpreadingFactor::SF12, Bandwidth::BW125, 59, 0},
    Datarate{SpreadingFactor::SF11, Bandwidth::BW125, 59, 0},
    Datarate{SpreadingFactor::SF10, Bandwidth::BW125, 123, 19},
    Datarate{SpreadingFactor::SF9, Bandwidth::BW125, 123, 61},
    Datarate{SpreadingFactor::SF8, Bandwidth::BW125, 250, 133},
    Datarate{SpreadingFactor::SF7, Bandwidth::BW125, 250, 250},
    Datarate{SpreadingFactor::SF7, Bandwidth::BW250, 250, 250},
}};

const uint32_t AS923_JOIN_CHANNELS[2] = {923200000, 923400000};

bool eu868FrequencyCheck(uint32_t f) {
    return f >= 863000000 && f <= 870000000;
}

bool eu433FrequencyCheck(uint32_t f) {
    return f >= 433175000 && f <= 434665000;
}

bool as923FrequencyCheck(uint32_t f) {
    return f >= 915000000 && f <= 928000000;
}

bool as923_4FrequencyCheck(uint32_t f) {
    return f >= 917000000 && f <= 920000000;
}

RegionParams as923Params(Region region, uint32_t offset, FrequencyCheck check) {
    RegionParams p;
    p.region = region;
    p.joinChannels = {AS923_JOIN_CHANNELS[0] - offset, AS923_JOIN_CHANNELS[1] - offset};
    p.defaultRx2Frequency = AS923_JOIN_CHANNELS[0] - offset;
    p.defaultRx2DataRate = 2;
    p.defaultDataRate = 2;
    p.maxEirp = 16;
    p.maxTxPowerIndex = 7;
    p.maxRx1DrOffset = 7;
    p.defaultChannelMaxDataRate = 5;
    p.txParamSetupSupported = true;
    p.datarates = &AS923_DATARATES;
    p.frequencyValid = check;
    return p;
}

bool isAS923(Region region) {
    return region == Region::AS923_1 || region == Region::AS923_2 ||
           region == Region::AS923_3 || region == Region::AS923_4;
}

} // namespace

bool parseRegion(const std::string& name, Region& region) {
    if (name == "EU868") {
        region = Region::EU868;
    } else if (name == "EU433") {
        region = Region::EU433;
    } else if (name == "AS923_1" || name == "AS923") {
        region = Region::AS923_1;
    } else if (name == "AS923_2") {
        region = Region::AS923_2;
    } else if (name == "AS923_3") {
        region = Region::AS923_3;
    } else if (name == "AS923_4") {
        region = Region::AS923_4;
    } else {
        return false;
    }
    return true;
}

const char* regionName(Region region) {
    switch (region) {
    case Region::EU868:
        return "EU868";
    case Region::EU433:
        return "EU433";
    case Region::AS923_1:
        return "AS923_1";
    case Region::AS923_2:
        return "AS923_2";
    case Region::AS923_3:
        return "AS923_3";
    case Region::AS923_4:
        return "AS923_4";
    }
    return "unknown";
}

const RegionParams& regionParams(Region region) {
    static const RegionParams EU868_PARAMS = {
        Region::EU868, {868100000, 868300000, 868500000}, 869525000, 0, 0,
        16, 7, 5, 5, false, &EU868_DATARATES, eu868FrequencyCheck
    };
    static const RegionParams EU433_PARAMS = {
        Region::EU433, {433175000, 433375000, 433575000}, 434665000, 0, 0,
        12, 5, 5, 5, false, &EU868_DATARATES, eu433FrequencyCheck
    };
    static const RegionParams AS923_1_PARAMS = as923Params(Region::AS923_1, 0, as923FrequencyCheck);
    static const RegionParams AS923_2_PARAMS = as923Params(Region::AS923_2, 1800000, as923FrequencyCheck);
    static const RegionParams AS923_3_PARAMS = as923Params(Region::AS923_3, 6600000, as923FrequencyCheck);
    static const RegionParams AS923_4_PARAMS = as923Params(Region::AS923_4, 5900000, as923_4FrequencyCheck);

    switch (region) {
    case Region::EU868:
        return EU868_PARAMS;
    case Region::EU433:
        return EU433_PARAMS;
    case Region::AS923_1:
        return AS923_1_PARAMS;
    case Region::AS923_2:
        return AS923_2_PARAMS;
    case Region::AS923_3:
        return AS923_3_PARAMS;
    case Region::AS923_4:
        return AS923_4_PARAMS;
    }
    return EU868_PARAMS;
}

double timeOnAirMs(SpreadingFactor sf, Bandwidth bw, size_t phyPayloadLen,
                   uint8_t codingRate, uint16_t preambleLength, bool crc) {
    int sfValue = static_cast<int>(sf);
    double symbolDuration = std::pow(2.0, sfValue) / bandwidthHz(bw) * 1000.0;

    // Low data rate optimization is mandated for SF11/SF12 at 125 kHz
    bool lowDataRate = sfValue >= 11 && bw == Bandwidth::BW125;
    int cr = codingRate - 4;

    double numerator = 8.0 * phyPayloadLen - 4.0 * sfValue + 28 + (crc ? 16 : 0);
    double denominator = 4.0 * (sfValue - (lowDataRate ? 2 : 0));
    double payloadSymbols = 8 + std::max(std::ceil(numerator / denominator) * (cr + 4), 0.0);

    return (preambleLength + 4.25 + payloadSymbols) * symbolDuration;
}

std::unique_ptr<ChannelPlan> ChannelPlan::create(Region region) {
    return std::make_unique<DynamicChannelPlan>(regionParams(region));
}

DynamicChannelPlan::DynamicChannelPlan(const RegionParams& regionParams)
    : params(regionParams), current(defaultState()), rng(std::random_device{}()) {
}

ChannelState DynamicChannelPlan::defaultState() const {
    ChannelState state;
    for (size_t i = 0; i < params.joinChannels.size(); i++) {
        state.channels[i].uplinkFrequency = params.joinChannels[i];
        state.channels[i].minDataRate = 0;
        state.channels[i].maxDataRate = params.defaultChannelMaxDataRate;
    }
    state.rx2Frequency = params.defaultRx2Frequency;
    state.rx2DataRate = params.defaultRx2DataRate;
    state.rx1DrOffset = 0;
    state.rx1Delay = 1;
    state.dataRate = params.defaultDataRate;
    state.txPowerIndex = 0;
    state.nbTrans = 1;
    state.maxDutyCycle = 0;
    state.uplinkDwellTime = false;
    state.downlinkDwellTime = false;
    state.maxEirp = params.maxEirp;
    return state;
}

bool DynamicChannelPlan::isSupportedDataRate(uint8_t dr) const {
    return datarate(dr).has_value();
}

std::optional<uint8_t> DynamicChannelPlan::txPowerAdjust(uint8_t powerIndex) const {
    if (powerIndex > params.maxTxPowerIndex || 2 * powerIndex > current.maxEirp) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(current.maxEirp - 2 * powerIndex);
}

LinkADRAnsCreator DynamicChannelPlan::handleLinkADRReq(const LinkADRReq& req) {
    uint8_t dr = req.dataRate();
    uint8_t power = req.txPower();
    Redundancy redundancy = req.redundancy();

    // 0xF keeps the current value
    bool powerOk = power == 0x0F || txPowerAdjust(power).has_value();

    ChannelMask<2> mask = current.channelMask;
    bool maskOk = false;
    switch (redundancy.channelMaskControl()) {
    case 0:
        mask = req.channelMask();
        maskOk = !mask.none();
        for (size_t ch = 0; ch < MAX_CHANNELS && maskOk; ch++) {
            if (mask.isEnabled(ch) && !current.channels[ch].defined()) {
                DEBUG_PRINTLN("LinkADRReq: mask enables undefined channel " << ch);
                maskOk = false;
            }
        }
        break;
    case 6:
        for (size_t ch = 0; ch < MAX_CHANNELS; ch++) {
            mask.setChannel(ch, current.channels[ch].defined());
        }
        maskOk = true;
        break;
    default:
        DEBUG_PRINTLN("LinkADRReq: ChMaskCntl " << static_cast<int>(redundancy.channelMaskControl())
                      << " not supported");
        break;
    }

    bool drOk = dr == 0x0F || isSupportedDataRate(dr);
    if (drOk && dr != 0x0F && maskOk) {
        // At least one enabled channel must accept the new data rate
        bool usable = false;
        for (size_t ch = 0; ch < MAX_CHANNELS; ch++) {
            const Channel& c = current.channels[ch];
            if (c.defined() && mask.isEnabled(ch) && dr >= c.minDataRate && dr <= c.maxDataRate) {
                usable = true;
                break;
            }
        }
        drOk = usable;
    }

    LinkADRAnsCreator ans;
    ans.setChannelMaskAck(maskOk).setDataRateAck(drOk).setTxPowerAck(powerOk);

    if (maskOk && drOk && powerOk) {
        current.channelMask = mask;
        if (dr != 0x0F) {
            current.dataRate = dr;
        }
        if (power != 0x0F) {
            current.txPowerIndex = power;
        }
        uint8_t nb = redundancy.numberOfTransmissions();
        current.nbTrans = nb == 0 ? 1 : nb;
        DEBUG_PRINTLN("LinkADRReq applied: DR" << static_cast<int>(current.dataRate)
                      << ", TXPower " << static_cast<int>(current.txPowerIndex)
                      << ", NbTrans " << static_cast<int>(current.nbTrans));
    } else {
        DEBUG_PRINTLN("LinkADRReq rejected: mask=" << maskOk << " dr=" << drOk << " power=" << powerOk);
    }
    return ans;
}

NewChannelAnsCreator DynamicChannelPlan::handleNewChannelReq(const NewChannelReq& req) {
    uint8_t index = req.channelIndex();
    uint32_t freq = req.frequency().hz();
    DataRateRange range = req.dataRateRange();

    bool indexOk = index >= numJoinChannels() && index < MAX_CHANNELS;
    bool freqOk = false;
    bool drOk = false;

    if (freq == 0) {
        // Deletion
        freqOk = indexOk;
        drOk = indexOk;
        if (indexOk) {
            current.channels[index] = Channel();
            current.channelMask.setChannel(index, false);
            DEBUG_PRINTLN("NewChannelReq: removed channel " << static_cast<int>(index));
        }
    } else {
        freqOk = indexOk && isValidFrequency(freq);
        drOk = range.minDataRate() <= range.maxDataRate() &&
               isSupportedDataRate(range.minDataRate()) &&
               isSupportedDataRate(range.maxDataRate());
        if (freqOk && drOk) {
            Channel& c = current.channels[index];
            c.uplinkFrequency = freq;
            c.downlinkFrequency = 0;
            c.minDataRate = range.minDataRate();
            c.maxDataRate = range.maxDataRate();
            current.channelMask.setChannel(index, true);
            DEBUG_PRINTLN("NewChannelReq: channel " << static_cast<int>(index) << " = " << freq
                          << " Hz, DR" << static_cast<int>(c.minDataRate)
                          << "-DR" << static_cast<int>(c.maxDataRate));
        } else {
            DEBUG_PRINTLN("NewChannelReq rejected: index " << static_cast<int>(index) << ", " << freq << " Hz");
        }
    }

    NewChannelAnsCreator ans;
    ans.setChannelFrequencyAck(freqOk).setDataRateRangeAck(drOk);
    return ans;
}

RXParamSetupAnsCreator DynamicChannelPlan::handleRXParamSetupReq(const RXParamSetupReq& req) {
    DLSettings settings = req.dlSettings();
    uint32_t freq = req.frequency().hz();

    bool channelOk = isValidFrequency(freq);
    bool rx2Ok = isSupportedDataRate(settings.rx2DataRate());
    bool offsetOk = settings.rx1DataRateOffset() <= params.maxRx1DrOffset;

    if (channelOk && rx2Ok && offsetOk) {
        current.rx2Frequency = freq;
        current.rx2DataRate = settings.rx2DataRate();
        current.rx1DrOffset = settings.rx1DataRateOffset();
        DEBUG_PRINTLN("RXParamSetupReq applied: RX2 " << freq << " Hz DR"
                      << static_cast<int>(current.rx2DataRate) << ", RX1DROffset "
                      << static_cast<int>(current.rx1DrOffset));
    }

    RXParamSetupAnsCreator ans;
    ans.setChannelAck(channelOk).setRx2DataRateAck(rx2Ok).setRx1DataRateOffsetAck(offsetOk);
    return ans;
}

DlChannelAnsCreator DynamicChannelPlan::handleDlChannelReq(const DlChannelReq& req) {
    uint8_t index = req.channelIndex();
    uint32_t freq = req.frequency().hz();

    bool freqOk = isValidFrequency(freq);
    bool existsOk = index < MAX_CHANNELS && current.channels[index].defined();

    if (freqOk && existsOk) {
        current.channels[index].downlinkFrequency = freq;
        DEBUG_PRINTLN("DlChannelReq: channel " << static_cast<int>(index) << " RX1 at " << freq << " Hz");
    }

    DlChannelAnsCreator ans;
    ans.setChannelFrequencyAck(freqOk).setUplinkFrequencyExistsAck(existsOk);
    return ans;
}

bool DynamicChannelPlan::handleTXParamSetupReq(const TXParamSetupReq& req) {
    if (!params.txParamSetupSupported) {
        DEBUG_PRINTLN("TXParamSetupReq ignored in " << regionName(params.region));
        return false;
    }
    current.uplinkDwellTime = req.uplinkDwellTime();
    current.downlinkDwellTime = req.downlinkDwellTime();
    current.maxEirp = req.maxEirp();
    if (!txPowerAdjust(current.txPowerIndex)) {
        current.txPowerIndex = 0;
    }
    DEBUG_PRINTLN("TXParamSetupReq: uplink dwell " << current.uplinkDwellTime
                  << ", downlink dwell " << current.downlinkDwellTime
                  << ", max EIRP " << static_cast<int>(current.maxEirp) << " dBm");
    return true;
}

void DynamicChannelPlan::handleDutyCycleReq(const DutyCycleReq& req) {
    current.maxDutyCycle = req.maxDutyCycleRaw();
    DEBUG_PRINTLN("DutyCycleReq: aggregated duty cycle 1/" << (1u << current.maxDutyCycle));
}

void DynamicChannelPlan::handleRXTimingSetupReq(const RXTimingSetupReq& req) {
    current.rx1Delay = req.delay() == 0 ? 1 : req.delay();
    DEBUG_PRINTLN("RXTimingSetupReq: RX1 delay " << static_cast<int>(current.rx1Delay) << " s");
}

void DynamicChannelPlan::handleJoinAccept(const DLSettings& dlSettings, uint8_t rxDelay,
                                          const std::array<Frequency, 5>* cfList) {
    // A new session starts from the region defaults
    current = defaultState();

    if (dlSettings.rx1DataRateOffset() <= params.maxRx1DrOffset) {
        current.rx1DrOffset = dlSettings.rx1DataRateOffset();
    }
    if (isSupportedDataRate(dlSettings.rx2DataRate())) {
        current.rx2DataRate = dlSettings.rx2DataRate();
    }
    uint8_t delay = rxDelay & 0x0F;
    current.rx1Delay = delay == 0 ? 1 : delay;

    if (cfList) {
        for (size_t i = 0; i < cfList->size(); i++) {
            size_t index = numJoinChannels() + i;
            uint32_t freq = (*cfList)[i].hz();
            if (freq == 0 || index >= MAX_CHANNELS) {
                continue;
            }
            if (!isValidFrequency(freq)) {
                DEBUG_PRINTLN("CFList: ignoring " << freq << " Hz");
                continue;
            }
            Channel& c = current.channels[index];
            c.uplinkFrequency = freq;
            c.minDataRate = 0;
            c.maxDataRate = params.defaultChannelMaxDataRate;
            current.channelMask.setChannel(index, true);
            DEBUG_PRINTLN("CFList: channel " << index << " = " << freq << " Hz");
        }
    }
}

bool DynamicChannelPlan::selectChannel(bool joining, uint8_t& channelIndex) {
    std::vector<uint8_t> candidates;
    if (joining) {
        for (uint8_t i = 0; i < numJoinChannels(); i++) {
            candidates.push_back(i);
        }
    } else {
        for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
            const Channel& c = current.channels[i];
            if (c.defined() && current.channelMask.isEnabled(i) &&
                current.dataRate >= c.minDataRate && current.dataRate <= c.maxDataRate) {
                candidates.push_back(i);
            }
        }
    }
    if (candidates.empty()) {
        DEBUG_PRINTLN("No channel available for DR" << static_cast<int>(current.dataRate));
        return false;
    }
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    channelIndex = candidates[pick(rng)];
    return true;
}

uint32_t DynamicChannelPlan::uplinkFrequency(uint8_t channelIndex) const {
    if (channelIndex >= MAX_CHANNELS) {
        return 0;
    }
    return current.channels[channelIndex].uplinkFrequency;
}

uint32_t DynamicChannelPlan::rx1Frequency(uint8_t channelIndex) const {
    if (channelIndex >= MAX_CHANNELS) {
        return 0;
    }
    const Channel& c = current.channels[channelIndex];
    return c.downlinkFrequency != 0 ? c.downlinkFrequency : c.uplinkFrequency;
}

uint8_t DynamicChannelPlan::rx1DataRate(uint8_t uplinkDataRate) const {
    int offset = current.rx1DrOffset;
    int minDr = 0;
    int maxDr = 0;
    for (uint8_t dr = 0; dr < NUM_DATARATES; dr++) {
        if (isSupportedDataRate(dr)) {
            maxDr = dr;
        }
    }
    if (isAS923(params.region)) {
        // Offsets 6 and 7 raise the data rate by 1 and 2
        if (offset > 5) {
            offset = 5 - offset;
        }
        minDr = current.downlinkDwellTime ? 2 : 0;
    }
    int dr = static_cast<int>(uplinkDataRate) - offset;
    return static_cast<uint8_t>(std::min(std::max(dr, minDr), maxDr));
}

bool DynamicChannelPlan::setDataRate(uint8_t dr) {
    if (!isSupportedDataRate(dr)) {
        return false;
    }
    current.dataRate = dr;
    return true;
}

int8_t DynamicChannelPlan::txPowerDbm() const {
    std::optional<uint8_t> eirp = txPowerAdjust(current.txPowerIndex);
    return static_cast<int8_t>(eirp ? *eirp : current.maxEirp);
}

uint8_t DynamicChannelPlan::maxMacPayloadSize() const {
    std::optional<Datarate> dr = datarate(current.dataRate);
    if (!dr) {
        return 0;
    }
    return current.uplinkDwellTime ? dr->maxMacPayloadSizeWithDwellTime : dr->maxMacPayloadSize;
}

bool DynamicChannelPlan::adrBackoff() {
    if (current.txPowerIndex != 0) {
        current.txPowerIndex = 0;
        DEBUG_PRINTLN("ADR backoff: full power");
        return true;
    }
    uint8_t lowest = (isAS923(params.region) && current.uplinkDwellTime) ? 2 : 0;
    if (current.dataRate > lowest) {
        uint8_t dr = current.dataRate - 1;
        while (dr > lowest && !isSupportedDataRate(dr)) {
            dr--;
        }
        current.dataRate = dr;
        DEBUG_PRINTLN("ADR backoff: DR" << static_cast<int>(dr));
        return true;
    }
    // Slowest rate reached: make sure every defined channel can be used
    for (size_t ch = 0; ch < MAX_CHANNELS; ch++) {
        current.channelMask.setChannel(ch, current.channels[ch].defined());
    }
    return false;
}

bool DynamicChannelPlan::restoreState(const ChannelState& state) {
    for (size_t i = 0; i < params.joinChannels.size(); i++) {
        if (state.channels[i].uplinkFrequency != params.joinChannels[i]) {
            DEBUG_PRINTLN("Channel state: join channel " << i << " does not belong to "
                          << regionName(params.region));
            return false;
        }
    }
    for (size_t i = 0; i < MAX_CHANNELS; i++) {
        const Channel& c = state.channels[i];
        if (!c.defined()) {
            continue;
        }
        if (!isValidFrequency(c.uplinkFrequency) ||
            (c.downlinkFrequency != 0 && !isValidFrequency(c.downlinkFrequency)) ||
            c.minDataRate > c.maxDataRate || !isSupportedDataRate(c.minDataRate)) {
            DEBUG_PRINTLN("Channel state: channel " << i << " is invalid");
            return false;
        }
    }
    if (!isSupportedDataRate(state.dataRate) || !isSupportedDataRate(state.rx2DataRate) ||
        !isValidFrequency(state.rx2Frequency) || state.rx1DrOffset > params.maxRx1DrOffset ||
        state.rx1Delay < 1 || state.rx1Delay > 15 || state.nbTrans < 1 || state.nbTrans > 15 ||
        state.txPowerIndex > params.maxTxPowerIndex || state.maxDutyCycle > 15) {
        DEBUG_PRINTLN("Channel state: radio settings out of range");
        return false;
    }
    if (!params.txParamSetupSupported &&
        (state.uplinkDwellTime || state.downlinkDwellTime || state.maxEirp != params.maxEirp)) {
        DEBUG_PRINTLN("Channel state: dwell time settings not supported by region");
        return false;
    }
    current = state;
    return true;
}
