#include <gtest/gtest.h>
#include "AES-CMAC.hpp"
#include "SoftwareCrypto.hpp"
#include "TestDoubles.hpp"

namespace {

std::array<uint8_t, 16> key16(const std::string& hex) {
    std::array<uint8_t, 16> key;
    Debug::hexToBytes(hex, key.data(), key.size());
    return key;
}

const std::string RFC4493_KEY = "2b7e151628aed2a6abf7158809cf4f3c";
const std::string RFC4493_MESSAGE =
    "6bc1bee22e409f96e93d7e117393172a"
    "ae2d8a571e03ac9c9eb76fac45af8e51"
    "30c81c46a35ce411e5fbc1191a0a52ef"
    "f69f2445df4f9b17ad2b417be66c3710";

std::string cmacHex(size_t messageLen) {
    std::vector<uint8_t> message = fromHex(RFC4493_MESSAGE);
    message.resize(messageLen);
    std::array<uint8_t, 16> tag = AESCMAC::calculate(message, key16(RFC4493_KEY));
    return Debug::bytesToHex(tag.data(), tag.size());
}

} // namespace

TEST(AESCMACTest, Rfc4493EmptyMessage) {
    EXPECT_EQ("bb1d6929e95937287fa37d129b756746", cmacHex(0));
}

TEST(AESCMACTest, Rfc4493OneBlock) {
    EXPECT_EQ("070a16b46b4d4144f79bdd9dd04a287c", cmacHex(16));
}

TEST(AESCMACTest, Rfc4493PartialLastBlock) {
    EXPECT_EQ("dfa66747de9ae63030ca32611497c827", cmacHex(40));
}

TEST(AESCMACTest, Rfc4493FourBlocks) {
    EXPECT_EQ("51f0bebf7e3b9d92fc49741779363cfe", cmacHex(64));
}

TEST(AESCMACTest, BlockCipherFips197) {
    std::array<uint8_t, 16> key = key16("000102030405060708090a0b0c0d0e0f");
    std::vector<uint8_t> plain = fromHex("00112233445566778899aabbccddeeff");

    uint8_t cipher[16];
    AESCMAC::aes_encrypt(plain.data(), key.data(), cipher);
    EXPECT_EQ("69c4e0d86a7b0430d8cdb78070b4c55a", Debug::bytesToHex(cipher, 16));

    uint8_t back[16];
    AESCMAC::aes_decrypt(cipher, key.data(), back);
    EXPECT_EQ(std::vector<uint8_t>(back, back + 16), plain);
}

TEST(SoftwareCryptoTest, MicIsLeadingFourBytesOfCmac) {
    SoftwareCrypto crypto;
    std::vector<uint8_t> message = fromHex(RFC4493_MESSAGE.substr(0, 32));
    MIC mic = crypto.computeMIC(key16(RFC4493_KEY), message);
    EXPECT_EQ("070a16b4", Debug::bytesToHex(mic.data(), mic.size()));
}

TEST(SoftwareCryptoTest, PayloadEncryptionIsSymmetric) {
    SoftwareCrypto crypto;
    AES128Key key = key16(RFC4493_KEY);
    DevAddr addr = {{0x04, 0x03, 0x02, 0x01}};
    std::vector<uint8_t> original(37);
    for (size_t i = 0; i < original.size(); i++) {
        original[i] = static_cast<uint8_t>(i * 7);
    }

    std::vector<uint8_t> data = original;
    crypto.encryptPayload(key, 42, Direction::Uplink, addr, data);
    EXPECT_NE(data, original);
    crypto.encryptPayload(key, 42, Direction::Uplink, addr, data);
    EXPECT_EQ(data, original);
}

TEST(SoftwareCryptoTest, DirectionChangesKeystream) {
    SoftwareCrypto crypto;
    AES128Key key = key16(RFC4493_KEY);
    DevAddr addr = {{0x04, 0x03, 0x02, 0x01}};
    std::vector<uint8_t> up(8, 0);
    std::vector<uint8_t> down(8, 0);
    crypto.encryptPayload(key, 1, Direction::Uplink, addr, up);
    crypto.encryptPayload(key, 1, Direction::Downlink, addr, down);
    EXPECT_NE(up, down);
}

TEST(SoftwareCryptoTest, JoinAcceptRequiresWholeBlocks) {
    SoftwareCrypto crypto;
    uint8_t in[20] = {0};
    uint8_t out[20];
    EXPECT_THROW(crypto.decryptJoinAccept(key16(RFC4493_KEY), in, 20, out), std::invalid_argument);
}
