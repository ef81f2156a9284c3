#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include "SessionManager.hpp"
#include "Vectors.hpp"

using namespace vectors;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "session_manager_test.json";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
        std::remove((path + ".tmp").c_str());
    }

    SessionManager::SessionData sample() {
        auto plan = ChannelPlan::create(Region::EU868);
        std::array<Frequency, 5> cfList = {{
            Frequency::fromHz(867100000), Frequency::fromHz(867300000), Frequency(), Frequency(), Frequency()
        }};
        plan->handleJoinAccept(DLSettings::make(2, 3), 2, &cfList);

        SessionManager::SessionData data;
        data.region = Region::EU868;
        data.devAddr = devAddr();
        data.nwkSKey = key(NWK_SKEY);
        data.appSKey = key(APP_SKEY);
        data.uplinkCounter = 0xFFFFFFF0u;
        data.downlinkCounter = 0x10001;
        data.downlinkReceived = true;
        data.lastDevNonce = 513;
        data.channels = plan->state();
        data.channels.txPowerIndex = 4;
        data.channels.channels[0].downlinkFrequency = 868300000;
        return data;
    }

    std::string path;
};

TEST_F(SessionManagerTest, RoundTrip) {
    SessionManager::SessionData saved = sample();
    ASSERT_TRUE(SessionManager::saveSession(path, saved));

    std::ifstream tmp(path + ".tmp");
    EXPECT_FALSE(tmp.good());

    SessionManager::SessionData loaded;
    ASSERT_TRUE(SessionManager::loadSession(path, loaded));
    EXPECT_EQ(saved.region, loaded.region);
    EXPECT_EQ(saved.devAddr, loaded.devAddr);
    EXPECT_EQ(saved.nwkSKey, loaded.nwkSKey);
    EXPECT_EQ(saved.appSKey, loaded.appSKey);
    EXPECT_EQ(0xFFFFFFF0u, loaded.uplinkCounter);
    EXPECT_EQ(0x10001u, loaded.downlinkCounter);
    EXPECT_TRUE(loaded.downlinkReceived);
    EXPECT_EQ(513, loaded.lastDevNonce);

    EXPECT_EQ(867300000u, loaded.channels.channels[4].uplinkFrequency);
    EXPECT_EQ(5, loaded.channels.channels[4].maxDataRate);
    EXPECT_EQ(868300000u, loaded.channels.channels[0].downlinkFrequency);
    EXPECT_FALSE(loaded.channels.channels[5].defined());
    EXPECT_EQ(saved.channels.channelMask, loaded.channels.channelMask);
    EXPECT_EQ(3, loaded.channels.rx2DataRate);
    EXPECT_EQ(2, loaded.channels.rx1DrOffset);
    EXPECT_EQ(2, loaded.channels.rx1Delay);
    EXPECT_EQ(4, loaded.channels.txPowerIndex);
    EXPECT_EQ(16, loaded.channels.maxEirp);

    auto plan = ChannelPlan::create(Region::EU868);
    EXPECT_TRUE(plan->restoreState(loaded.channels));
}

TEST_F(SessionManagerTest, DevAddrIsWrittenMostSignificantFirst) {
    ASSERT_TRUE(SessionManager::saveSession(path, sample()));
    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(std::string::npos, content.find("\"12345678\""));
}

TEST_F(SessionManagerTest, MissingOrPartialFileIsRejected) {
    SessionManager::SessionData data;
    EXPECT_FALSE(SessionManager::loadSession(path, data));

    {
        std::ofstream file(path);
        file << R"({"region": "EU868", "devAddr": "12345678", "nwkSKey": "d70c297f3ca00034341ebfdae84dcc6c"})";
    }
    data.uplinkCounter = 77;
    EXPECT_FALSE(SessionManager::loadSession(path, data));
    EXPECT_EQ(77u, data.uplinkCounter);

    {
        std::ofstream file(path);
        file << "not json";
    }
    EXPECT_FALSE(SessionManager::loadSession(path, data));
}

TEST_F(SessionManagerTest, OutOfRangeCounterIsRejected) {
    ASSERT_TRUE(SessionManager::saveSession(path, sample()));
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    std::string needle = "\"lastDevNonce\":";
    size_t pos = content.find(needle);
    ASSERT_NE(std::string::npos, pos);
    size_t end = content.find_first_of(",\n}", pos + needle.size());
    content.replace(pos, end - pos, needle + "\t70000");
    {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    SessionManager::SessionData data;
    EXPECT_FALSE(SessionManager::loadSession(path, data));
}

TEST_F(SessionManagerTest, ClearSession) {
    ASSERT_TRUE(SessionManager::saveSession(path, sample()));
    EXPECT_TRUE(SessionManager::clearSession(path));
    SessionManager::SessionData data;
    EXPECT_FALSE(SessionManager::loadSession(path, data));
    // Nothing to remove is not an error
    EXPECT_TRUE(SessionManager::clearSession(path));
}

TEST_F(SessionManagerTest, DevNonceFile) {
    std::string noncePath = SessionManager::devNonceFilename(path);
    uint16_t nonce = 9;
    EXPECT_FALSE(SessionManager::loadDevNonce(noncePath, nonce));
    EXPECT_EQ(9, nonce);

    ASSERT_TRUE(SessionManager::saveDevNonce(noncePath, 65535));
    ASSERT_TRUE(SessionManager::loadDevNonce(noncePath, nonce));
    EXPECT_EQ(65535, nonce);

    // Not a session, and not removed with one
    SessionManager::SessionData data;
    EXPECT_FALSE(SessionManager::loadSession(noncePath, data));
    EXPECT_TRUE(SessionManager::clearSession(path));
    ASSERT_TRUE(SessionManager::loadDevNonce(noncePath, nonce));

    {
        std::ofstream file(noncePath, std::ios::trunc);
        file << R"({"lastDevNonce": 70000})";
    }
    EXPECT_FALSE(SessionManager::loadDevNonce(noncePath, nonce));
    EXPECT_EQ(65535, nonce);
    std::remove(noncePath.c_str());
}
