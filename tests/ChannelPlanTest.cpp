#include <gtest/gtest.h>
#include "ChannelPlan.hpp"

namespace {

LinkADRReq linkADR(uint8_t dr, uint8_t power, uint16_t mask, uint8_t redundancy) {
    LinkADRReqCreator creator;
    creator.setDataRate(dr)
           .setTxPower(power)
           .setChannelMask(std::array<uint8_t, 2>{{static_cast<uint8_t>(mask & 0xFF),
                                                    static_cast<uint8_t>(mask >> 8)}})
           .setRedundancy(redundancy);
    return creator.payload();
}

NewChannelReq newChannel(uint8_t index, uint32_t hz, uint8_t minDr, uint8_t maxDr) {
    NewChannelReqCreator creator;
    creator.setChannelIndex(index)
           .setFrequency(Frequency::fromHz(hz))
           .setDataRateRange(DataRateRange(static_cast<uint8_t>((maxDr << 4) | minDr)));
    return creator.payload();
}

} // namespace

TEST(RegionTest, ParseNames) {
    Region region;
    ASSERT_TRUE(parseRegion("EU433", region));
    EXPECT_EQ(Region::EU433, region);
    ASSERT_TRUE(parseRegion("AS923", region));
    EXPECT_EQ(Region::AS923_1, region);
    ASSERT_TRUE(parseRegion("AS923_4", region));
    EXPECT_EQ(Region::AS923_4, region);
    EXPECT_FALSE(parseRegion("US915", region));
    EXPECT_STREQ("AS923_2", regionName(Region::AS923_2));
}

TEST(RegionTest, EU868Defaults) {
    auto plan = ChannelPlan::create(Region::EU868);
    EXPECT_EQ((std::vector<uint32_t>{868100000, 868300000, 868500000}), plan->joinChannels());
    EXPECT_EQ(869525000u, plan->defaultRx2());
    EXPECT_EQ(0, plan->rx2DataRate());
    EXPECT_EQ(0, plan->dataRate());
    EXPECT_EQ(1, plan->rx1Delay());
    EXPECT_EQ(16, plan->txPowerDbm());
    EXPECT_EQ(59, plan->maxMacPayloadSize());
    EXPECT_FALSE(plan->datarate(6).has_value());
}

TEST(RegionTest, EU433Defaults) {
    auto plan = ChannelPlan::create(Region::EU433);
    EXPECT_EQ((std::vector<uint32_t>{433175000, 433375000, 433575000}), plan->joinChannels());
    EXPECT_EQ(434665000u, plan->defaultRx2());
    EXPECT_EQ(12, plan->txPowerDbm());
    EXPECT_TRUE(plan->isValidFrequency(434665000));
    EXPECT_FALSE(plan->isValidFrequency(868100000));
}

TEST(RegionTest, AS923VariantsShiftJoinChannelsDown) {
    EXPECT_EQ((std::vector<uint32_t>{923200000, 923400000}), ChannelPlan::create(Region::AS923_1)->joinChannels());
    EXPECT_EQ((std::vector<uint32_t>{921400000, 921600000}), ChannelPlan::create(Region::AS923_2)->joinChannels());
    EXPECT_EQ((std::vector<uint32_t>{916600000, 916800000}), ChannelPlan::create(Region::AS923_3)->joinChannels());
    EXPECT_EQ((std::vector<uint32_t>{917300000, 917500000}), ChannelPlan::create(Region::AS923_4)->joinChannels());

    auto plan = ChannelPlan::create(Region::AS923_2);
    EXPECT_EQ(921400000u, plan->defaultRx2());
    EXPECT_EQ(2, plan->rx2DataRate());
    EXPECT_EQ(2, plan->dataRate());
    EXPECT_FALSE(ChannelPlan::create(Region::AS923_4)->isValidFrequency(923200000));
}

TEST(TimeOnAirTest, KnownAirtimes) {
    EXPECT_NEAR(56.576, timeOnAirMs(SpreadingFactor::SF7, Bandwidth::BW125, 20), 0.001);
    EXPECT_NEAR(2465.792, timeOnAirMs(SpreadingFactor::SF12, Bandwidth::BW125, 51), 0.001);
}

TEST(LinkADRTest, AcceptedRequestIsApplied) {
    auto plan = ChannelPlan::create(Region::EU868);
    LinkADRAns ans = plan->handleLinkADRReq(linkADR(5, 3, 0x0007, 0x02)).payload();
    EXPECT_TRUE(ans.ack());
    EXPECT_EQ(5, plan->dataRate());
    EXPECT_EQ(3, plan->txPowerIndex());
    EXPECT_EQ(10, plan->txPowerDbm());
    EXPECT_EQ(2, plan->nbTrans());
    EXPECT_EQ(250, plan->maxMacPayloadSize());
}

TEST(LinkADRTest, AnyNegativeBitLeavesStateUntouched) {
    auto plan = ChannelPlan::create(Region::EU868);
    ChannelState before = plan->state();

    // Channel 3 is not defined
    LinkADRAns ans = plan->handleLinkADRReq(linkADR(5, 3, 0x000F, 0x00)).payload();
    EXPECT_FALSE(ans.channelMaskAck());
    EXPECT_TRUE(ans.txPowerAck());
    EXPECT_EQ(before.dataRate, plan->dataRate());
    EXPECT_EQ(before.txPowerIndex, plan->txPowerIndex());

    ans = plan->handleLinkADRReq(linkADR(7, 0, 0x0007, 0x00)).payload();
    EXPECT_FALSE(ans.dataRateAck());
    EXPECT_TRUE(ans.channelMaskAck());

    ans = plan->handleLinkADRReq(linkADR(0, 9, 0x0007, 0x00)).payload();
    EXPECT_FALSE(ans.txPowerAck());

    ans = plan->handleLinkADRReq(linkADR(0, 0, 0x0000, 0x00)).payload();
    EXPECT_FALSE(ans.channelMaskAck());

    ans = plan->handleLinkADRReq(linkADR(0, 0, 0x0007, 0x50)).payload();
    EXPECT_FALSE(ans.channelMaskAck());

    EXPECT_EQ(before.channelMask, plan->state().channelMask);
}

TEST(LinkADRTest, KeepValuesAndEnableAll) {
    auto plan = ChannelPlan::create(Region::EU868);
    ASSERT_TRUE(plan->handleLinkADRReq(linkADR(3, 2, 0x0001, 0x00)).payload().ack());

    // 0xF keeps data rate and power, ChMaskCntl 6 enables every defined channel
    LinkADRAns ans = plan->handleLinkADRReq(linkADR(0x0F, 0x0F, 0x0000, 0x60)).payload();
    EXPECT_TRUE(ans.ack());
    EXPECT_EQ(3, plan->dataRate());
    EXPECT_EQ(2, plan->txPowerIndex());
    EXPECT_EQ(1, plan->nbTrans());
    EXPECT_TRUE(plan->state().channelMask.isEnabled(2));
    EXPECT_FALSE(plan->state().channelMask.isEnabled(3));
}

TEST(NewChannelTest, AddAndRemove) {
    auto plan = ChannelPlan::create(Region::EU868);
    NewChannelAns ans = plan->handleNewChannelReq(newChannel(3, 867100000, 0, 5)).payload();
    EXPECT_TRUE(ans.ack());
    EXPECT_EQ(867100000u, plan->uplinkFrequency(3));
    EXPECT_TRUE(plan->state().channelMask.isEnabled(3));

    NewChannelReqCreator remove;
    remove.setChannelIndex(3);
    EXPECT_TRUE(plan->handleNewChannelReq(remove.payload()).payload().ack());
    EXPECT_EQ(0u, plan->uplinkFrequency(3));
}

TEST(NewChannelTest, ValidationBitsAreSeparate) {
    auto plan = ChannelPlan::create(Region::EU868);

    NewChannelAns ans = plan->handleNewChannelReq(newChannel(4, 915000000, 0, 5)).payload();
    EXPECT_FALSE(ans.channelFrequencyAck());
    EXPECT_TRUE(ans.dataRateRangeAck());

    ans = plan->handleNewChannelReq(newChannel(4, 867300000, 5, 2)).payload();
    EXPECT_TRUE(ans.channelFrequencyAck());
    EXPECT_FALSE(ans.dataRateRangeAck());

    // Join channels cannot be modified
    ans = plan->handleNewChannelReq(newChannel(1, 867300000, 0, 5)).payload();
    EXPECT_FALSE(ans.channelFrequencyAck());
    EXPECT_EQ(868300000u, plan->uplinkFrequency(1));

    ans = plan->handleNewChannelReq(newChannel(16, 867300000, 0, 5)).payload();
    EXPECT_FALSE(ans.ack());
    EXPECT_EQ(0u, plan->uplinkFrequency(4));
}

TEST(RXParamSetupTest, AppliedOnlyWhenValid) {
    auto plan = ChannelPlan::create(Region::EU868);
    RXParamSetupReqCreator req;
    req.setDLSettings(DLSettings::make(2, 3)).setFrequency(Frequency::fromHz(869525000));
    EXPECT_TRUE(plan->handleRXParamSetupReq(req.payload()).payload().ack());
    EXPECT_EQ(3, plan->rx2DataRate());
    EXPECT_EQ(3, plan->rx1DataRate(5));

    RXParamSetupReqCreator bad;
    bad.setDLSettings(DLSettings::make(0, 0)).setFrequency(Frequency::fromHz(915000000));
    RXParamSetupAns ans = plan->handleRXParamSetupReq(bad.payload()).payload();
    EXPECT_FALSE(ans.channelAck());
    EXPECT_TRUE(ans.rx2DataRateAck());
    EXPECT_EQ(3, plan->rx2DataRate());
    EXPECT_EQ(869525000u, plan->rx2Frequency());
}

TEST(RX1DataRateTest, EU868OffsetFloorsAtZero) {
    auto plan = ChannelPlan::create(Region::EU868);
    plan->handleJoinAccept(DLSettings::make(3, 0), 1, nullptr);
    EXPECT_EQ(2, plan->rx1DataRate(5));
    EXPECT_EQ(0, plan->rx1DataRate(1));
}

TEST(RX1DataRateTest, AS923HighOffsetsRaiseTheRate) {
    auto plan = ChannelPlan::create(Region::AS923_1);
    plan->handleJoinAccept(DLSettings::make(6, 2), 1, nullptr);
    EXPECT_EQ(3, plan->rx1DataRate(2));
    plan->handleJoinAccept(DLSettings::make(7, 2), 1, nullptr);
    EXPECT_EQ(4, plan->rx1DataRate(2));
    EXPECT_EQ(6, plan->rx1DataRate(5));
}

TEST(DlChannelTest, RequiresDefinedChannel) {
    auto plan = ChannelPlan::create(Region::EU868);
    DlChannelReqCreator req;
    req.setChannelIndex(0).setFrequency(Frequency::fromHz(868300000));
    EXPECT_TRUE(plan->handleDlChannelReq(req.payload()).payload().ack());
    EXPECT_EQ(868300000u, plan->rx1Frequency(0));
    EXPECT_EQ(868100000u, plan->uplinkFrequency(0));

    req.setChannelIndex(5);
    DlChannelAns ans = plan->handleDlChannelReq(req.payload()).payload();
    EXPECT_TRUE(ans.channelFrequencyAck());
    EXPECT_FALSE(ans.uplinkFrequencyExistsAck());
}

TEST(TXParamSetupTest, OnlyAS923Answers) {
    TXParamSetupReqCreator req;
    req.setUplinkDwellTime(true).setDownlinkDwellTime(true).setMaxEirp(5);

    auto eu = ChannelPlan::create(Region::EU868);
    EXPECT_FALSE(eu->handleTXParamSetupReq(req.payload()));

    auto as = ChannelPlan::create(Region::AS923_1);
    ASSERT_TRUE(as->handleTXParamSetupReq(req.payload()));
    EXPECT_TRUE(as->state().uplinkDwellTime);
    EXPECT_EQ(16, as->state().maxEirp);
    EXPECT_EQ(19, as->maxMacPayloadSize());
    // Downlink dwell time keeps RX1 at DR2 or above
    EXPECT_EQ(2, as->rx1DataRate(2));
}

TEST(TimingTest, DutyCycleAndRxDelay) {
    auto plan = ChannelPlan::create(Region::EU868);
    DutyCycleReqCreator dc;
    dc.setMaxDutyCycle(7);
    plan->handleDutyCycleReq(dc.payload());
    EXPECT_EQ(7, plan->maxDutyCycle());

    RXTimingSetupReqCreator timing;
    timing.setDelay(0);
    plan->handleRXTimingSetupReq(timing.payload());
    EXPECT_EQ(1, plan->rx1Delay());
    timing.setDelay(3);
    plan->handleRXTimingSetupReq(timing.payload());
    EXPECT_EQ(3, plan->rx1Delay());
}

TEST(JoinAcceptTest, CFListAddsValidChannels) {
    auto plan = ChannelPlan::create(Region::EU868);
    std::array<Frequency, 5> cfList = {{
        Frequency::fromHz(867100000), Frequency::fromHz(867300000), Frequency::fromHz(915000000),
        Frequency(), Frequency::fromHz(867900000)
    }};
    plan->handleJoinAccept(DLSettings::make(1, 3), 5, &cfList);

    EXPECT_EQ(867100000u, plan->uplinkFrequency(3));
    EXPECT_EQ(867300000u, plan->uplinkFrequency(4));
    EXPECT_EQ(0u, plan->uplinkFrequency(5));
    EXPECT_EQ(0u, plan->uplinkFrequency(6));
    EXPECT_EQ(867900000u, plan->uplinkFrequency(7));
    EXPECT_EQ(3, plan->rx2DataRate());
    EXPECT_EQ(5, plan->rx1Delay());
}

TEST(JoinAcceptTest, ResetsPreviousSessionSettings) {
    auto plan = ChannelPlan::create(Region::EU868);
    ASSERT_TRUE(plan->handleNewChannelReq(newChannel(3, 867100000, 0, 5)).payload().ack());
    ASSERT_TRUE(plan->handleLinkADRReq(linkADR(5, 3, 0x0009, 0x00)).payload().ack());

    plan->handleJoinAccept(DLSettings(), 1, nullptr);
    EXPECT_EQ(0u, plan->uplinkFrequency(3));
    EXPECT_EQ(0, plan->dataRate());
    EXPECT_EQ(0, plan->txPowerIndex());
}

TEST(ChannelSelectionTest, HonoursMaskAndDataRateRange) {
    auto plan = ChannelPlan::create(Region::EU868);
    plan->seed(1);
    ASSERT_TRUE(plan->handleNewChannelReq(newChannel(3, 867100000, 4, 5)).payload().ack());
    ASSERT_TRUE(plan->handleLinkADRReq(linkADR(5, 0, 0x000A, 0x00)).payload().ack());

    for (int i = 0; i < 50; i++) {
        uint8_t channel = 0;
        ASSERT_TRUE(plan->selectChannel(false, channel));
        EXPECT_TRUE(channel == 1 || channel == 3) << "channel " << static_cast<int>(channel);
    }

    // Joins ignore the mask
    for (int i = 0; i < 20; i++) {
        uint8_t channel = 0;
        ASSERT_TRUE(plan->selectChannel(true, channel));
        EXPECT_LT(channel, 3);
    }
}

TEST(ChannelSelectionTest, NoChannelForDataRate) {
    auto plan = ChannelPlan::create(Region::EU868);
    ChannelState state = plan->state();
    state.channelMask = ChannelMask<2>(std::array<uint8_t, 2>{{0, 0}});
    ASSERT_TRUE(plan->restoreState(state));
    uint8_t channel = 0;
    EXPECT_FALSE(plan->selectChannel(false, channel));
}

TEST(AdrBackoffTest, PowerFirstThenDataRate) {
    auto plan = ChannelPlan::create(Region::EU868);
    ASSERT_TRUE(plan->handleLinkADRReq(linkADR(2, 4, 0x0001, 0x00)).payload().ack());

    EXPECT_TRUE(plan->adrBackoff());
    EXPECT_EQ(0, plan->txPowerIndex());
    EXPECT_EQ(2, plan->dataRate());
    EXPECT_TRUE(plan->adrBackoff());
    EXPECT_EQ(1, plan->dataRate());
    EXPECT_TRUE(plan->adrBackoff());
    EXPECT_EQ(0, plan->dataRate());

    EXPECT_FALSE(plan->adrBackoff());
    EXPECT_TRUE(plan->state().channelMask.isEnabled(1));
    EXPECT_TRUE(plan->state().channelMask.isEnabled(2));
}

TEST(RestoreStateTest, RejectsForeignOrInconsistentState) {
    auto eu = ChannelPlan::create(Region::EU868);
    auto as = ChannelPlan::create(Region::AS923_1);
    EXPECT_FALSE(eu->restoreState(as->state()));

    ChannelState state = eu->state();
    state.dataRate = 9;
    EXPECT_FALSE(eu->restoreState(state));

    state = eu->state();
    state.rx1Delay = 0;
    EXPECT_FALSE(eu->restoreState(state));

    state = eu->state();
    state.uplinkDwellTime = true;
    EXPECT_FALSE(eu->restoreState(state));

    state = eu->state();
    state.dataRate = 4;
    state.maxDutyCycle = 3;
    ASSERT_TRUE(eu->restoreState(state));
    EXPECT_EQ(4, eu->dataRate());
    EXPECT_EQ(3, eu->maxDutyCycle());
}
