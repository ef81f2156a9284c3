/**
 * @file ChannelPlan.hpp
 * @brief Regional channel plans: data rate tables, join channels, RX2 defaults
 *        and validation of the channel related MAC commands.
 *
 * All supported regions are "dynamic": the network may add uplink channels
 * beyond the join channels with NewChannelReq or a CFList. Regions sharing a
 * table shape (the four AS923 variants) are one RegionParams entry built
 * with a different offset and frequency check.
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "LoRaWANTypes.hpp"
#include "MacCommands.hpp"

#define NUM_DATARATES 15
#define MAX_CHANNELS 16

/**
 * @brief Supported regions.
 */
enum class Region {
    EU868, /**< Europe 863-870 MHz */
    EU433, /**< Europe 433 MHz */
    AS923_1, /**< AS923, no offset */
    AS923_2, /**< AS923, -1.8 MHz */
    AS923_3, /**< AS923, -6.6 MHz */
    AS923_4  /**< AS923, -5.9 MHz, 917-920 MHz only */
};

/**
 * @brief Parse a region name such as "EU868" or "AS923_2".
 * @return false if the name is unknown
 */
bool parseRegion(const std::string& name, Region& region);

const char* regionName(Region region);

typedef std::array<std::optional<Datarate>, NUM_DATARATES> DatarateTable;

typedef bool (*FrequencyCheck)(uint32_t frequencyHz);

/**
 * @brief Constant description of a region.
 */
struct RegionParams {
    Region region;
    std::vector<uint32_t> joinChannels; ///< Hz
    uint32_t defaultRx2Frequency;       ///< Hz
    uint8_t defaultRx2DataRate;
    uint8_t defaultDataRate;            ///< Join and first uplinks
    uint8_t maxEirp;                    ///< dBm
    uint8_t maxTxPowerIndex;
    uint8_t maxRx1DrOffset;
    uint8_t defaultChannelMaxDataRate;  ///< DR range of join and CFList channels is 0..this
    bool txParamSetupSupported;
    const DatarateTable* datarates;
    FrequencyCheck frequencyValid;
};

/**
 * @brief Region description lookup; the returned reference is valid for the process lifetime.
 */
const RegionParams& regionParams(Region region);

/**
 * @brief LoRa time on air of a PHY payload in milliseconds.
 *
 * @param codingRate 5..8 for 4/5..4/8
 */
double timeOnAirMs(SpreadingFactor sf, Bandwidth bw, size_t phyPayloadLen,
                   uint8_t codingRate = 5, uint16_t preambleLength = 8, bool crc = true);

/**
 * @brief One entry of the uplink channel table.
 */
struct Channel {
    uint32_t uplinkFrequency = 0;   ///< Hz, 0 when the slot is unused
    uint32_t downlinkFrequency = 0; ///< Hz, RX1 frequency when set by DlChannelReq, else 0
    uint8_t minDataRate = 0;
    uint8_t maxDataRate = 0;

    bool defined() const { return uplinkFrequency != 0; }
};

/**
 * @brief Mutable plan state, as persisted between runs.
 */
struct ChannelState {
    std::array<Channel, MAX_CHANNELS> channels;
    ChannelMask<2> channelMask;
    uint32_t rx2Frequency = 0;
    uint8_t rx2DataRate = 0;
    uint8_t rx1DrOffset = 0;
    uint8_t rx1Delay = 1;         ///< Seconds
    uint8_t dataRate = 0;
    uint8_t txPowerIndex = 0;
    uint8_t nbTrans = 1;
    uint8_t maxDutyCycle = 0;     ///< Aggregated duty cycle exponent
    bool uplinkDwellTime = false;
    bool downlinkDwellTime = false;
    uint8_t maxEirp = 0;
};

/**
 * @brief Channel and radio settings of one device, validated against a region.
 */
class ChannelPlan {
public:
    virtual ~ChannelPlan() = default;

    /**
     * @brief Create the plan of a region in its default state.
     */
    static std::unique_ptr<ChannelPlan> create(Region region);

    virtual Region region() const = 0;

    virtual const DatarateTable& datarates() const = 0;

    /**
     * @brief Table entry, or std::nullopt for a reserved or unsupported index.
     */
    std::optional<Datarate> datarate(uint8_t index) const {
        if (index >= NUM_DATARATES) {
            return std::nullopt;
        }
        return datarates()[index];
    }

    /**
     * @brief EIRP in dBm of a TXPower index, or std::nullopt outside the region range.
     */
    virtual std::optional<uint8_t> txPowerAdjust(uint8_t powerIndex) const = 0;

    virtual std::vector<uint32_t> joinChannels() const = 0;
    virtual uint32_t defaultRx2() const = 0;
    virtual bool isValidFrequency(uint32_t frequencyHz) const = 0;

    // MAC command handling. Each handler applies the request only when every
    // acknowledgement bit of the answer is set.
    virtual LinkADRAnsCreator handleLinkADRReq(const LinkADRReq& req) = 0;
    virtual NewChannelAnsCreator handleNewChannelReq(const NewChannelReq& req) = 0;
    virtual RXParamSetupAnsCreator handleRXParamSetupReq(const RXParamSetupReq& req) = 0;
    virtual DlChannelAnsCreator handleDlChannelReq(const DlChannelReq& req) = 0;

    /**
     * @return false if the region does not support TXParamSetupReq (no answer is sent)
     */
    virtual bool handleTXParamSetupReq(const TXParamSetupReq& req) = 0;

    virtual void handleDutyCycleReq(const DutyCycleReq& req) = 0;
    virtual void handleRXTimingSetupReq(const RXTimingSetupReq& req) = 0;

    /**
     * @brief Apply the join-accept settings and optional CFList.
     */
    virtual void handleJoinAccept(const DLSettings& dlSettings, uint8_t rxDelay,
                                  const std::array<Frequency, 5>* cfList) = 0;

    /**
     * @brief Pick the channel of the next uplink.
     *
     * Join requests use the join channels. Data frames use a random enabled
     * channel whose data rate range contains the current data rate.
     *
     * @return false if no channel qualifies
     */
    virtual bool selectChannel(bool joining, uint8_t& channelIndex) = 0;

    virtual uint32_t uplinkFrequency(uint8_t channelIndex) const = 0;
    virtual uint32_t rx1Frequency(uint8_t channelIndex) const = 0;
    virtual uint8_t rx1DataRate(uint8_t uplinkDataRate) const = 0;
    virtual uint32_t rx2Frequency() const = 0;
    virtual uint8_t rx2DataRate() const = 0;
    virtual uint8_t rx1Delay() const = 0;

    virtual uint8_t dataRate() const = 0;
    virtual bool setDataRate(uint8_t dataRate) = 0;
    virtual uint8_t txPowerIndex() const = 0;
    virtual int8_t txPowerDbm() const = 0;
    virtual uint8_t nbTrans() const = 0;
    virtual uint8_t maxDutyCycle() const = 0;

    /**
     * @brief Largest MACPayload the current data rate allows, honouring dwell time.
     */
    virtual uint8_t maxMacPayloadSize() const = 0;

    /**
     * @brief ADR backoff: one data rate step towards the slowest rate at full power.
     * @return false if already at the slowest data rate and full power
     */
    virtual bool adrBackoff() = 0;

    virtual const ChannelState& state() const = 0;

    /**
     * @brief Replace the mutable state, e.g. from persisted data.
     * @return false (state unchanged) if it is inconsistent with the region
     */
    virtual bool restoreState(const ChannelState& state) = 0;

    /**
     * @brief Seed the channel selection generator
     */
    virtual void seed(uint32_t value) = 0;
};

/**
 * @brief Channel plan of a region whose uplink channels can be added at runtime.
 */
class DynamicChannelPlan : public ChannelPlan {
public:
    explicit DynamicChannelPlan(const RegionParams& params);

    Region region() const override { return params.region; }
    const DatarateTable& datarates() const override { return *params.datarates; }
    std::optional<uint8_t> txPowerAdjust(uint8_t powerIndex) const override;
    std::vector<uint32_t> joinChannels() const override { return params.joinChannels; }
    uint32_t defaultRx2() const override { return params.defaultRx2Frequency; }
    bool isValidFrequency(uint32_t frequencyHz) const override { return params.frequencyValid(frequencyHz); }

    LinkADRAnsCreator handleLinkADRReq(const LinkADRReq& req) override;
    NewChannelAnsCreator handleNewChannelReq(const NewChannelReq& req) override;
    RXParamSetupAnsCreator handleRXParamSetupReq(const RXParamSetupReq& req) override;
    DlChannelAnsCreator handleDlChannelReq(const DlChannelReq& req) override;
    bool handleTXParamSetupReq(const TXParamSetupReq& req) override;
    void handleDutyCycleReq(const DutyCycleReq& req) override;
    void handleRXTimingSetupReq(const RXTimingSetupReq& req) override;
    void handleJoinAccept(const DLSettings& dlSettings, uint8_t rxDelay,
                          const std::array<Frequency, 5>* cfList) override;

    bool selectChannel(bool joining, uint8_t& channelIndex) override;
    uint32_t uplinkFrequency(uint8_t channelIndex) const override;
    uint32_t rx1Frequency(uint8_t channelIndex) const override;
    uint8_t rx1DataRate(uint8_t uplinkDataRate) const override;
    uint32_t rx2Frequency() const override { return current.rx2Frequency; }
    uint8_t rx2DataRate() const override { return current.rx2DataRate; }
    uint8_t rx1Delay() const override { return current.rx1Delay; }

    uint8_t dataRate() const override { return current.dataRate; }
    bool setDataRate(uint8_t dataRate) override;
    uint8_t txPowerIndex() const override { return current.txPowerIndex; }
    int8_t txPowerDbm() const override;
    uint8_t nbTrans() const override { return current.nbTrans; }
    uint8_t maxDutyCycle() const override { return current.maxDutyCycle; }
    uint8_t maxMacPayloadSize() const override;
    bool adrBackoff() override;

    const ChannelState& state() const override { return current; }
    bool restoreState(const ChannelState& state) override;
    void seed(uint32_t value) override { rng.seed(value); }

private:
    bool isSupportedDataRate(uint8_t dataRate) const;
    uint8_t numJoinChannels() const { return static_cast<uint8_t>(params.joinChannels.size()); }
    ChannelState defaultState() const;

    const RegionParams& params;
    ChannelState current;
    std::mt19937 rng;
};
