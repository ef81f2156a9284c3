#include "SoftwareCrypto.hpp"
#include "AES-CMAC.hpp"
#include <stdexcept>
#include <algorithm>

namespace {

AES128Key deriveKey(uint8_t type, const AES128Key& appKey, const JoinNonces& nonces) {
    // type | AppNonce | NetID | DevNonce | pad16
    std::array<uint8_t, 16> block = {0};
    block[0] = type;
    std::copy(nonces.appNonce.begin(), nonces.appNonce.end(), block.begin() + 1);
    std::copy(nonces.netId.begin(), nonces.netId.end(), block.begin() + 4);
    block[7] = nonces.devNonce & 0xFF;
    block[8] = (nonces.devNonce >> 8) & 0xFF;

    AES128Key key;
    AESCMAC::aes_encrypt(block.data(), appKey.data(), key.data());
    return key;
}

} // namespace

SessionKeys SoftwareCrypto::deriveSessionKeys(const AES128Key& appKey, const JoinNonces& nonces) {
    SessionKeys keys;
    keys.nwkSKey = deriveKey(0x01, appKey, nonces);
    keys.appSKey = deriveKey(0x02, appKey, nonces);
    return keys;
}

MIC SoftwareCrypto::computeMIC(const AES128Key& key, const std::vector<uint8_t>& data) {
    std::array<uint8_t, 16> cmac = AESCMAC::calculate(data, key);
    MIC mic;
    std::copy(cmac.begin(), cmac.begin() + 4, mic.begin());
    return mic;
}

void SoftwareCrypto::encryptPayload(const AES128Key& key, uint32_t fcnt, Direction dir,
                                    const DevAddr& devAddr, std::vector<uint8_t>& data) {
    // A_i = 0x01 | 0x00 x4 | Dir | DevAddr | FCnt | 0x00 | i
    std::array<uint8_t, 16> a = {0};
    a[0] = 0x01;
    a[5] = static_cast<uint8_t>(dir);
    std::copy(devAddr.begin(), devAddr.end(), a.begin() + 6);
    a[10] = fcnt & 0xFF;
    a[11] = (fcnt >> 8) & 0xFF;
    a[12] = (fcnt >> 16) & 0xFF;
    a[13] = (fcnt >> 24) & 0xFF;

    std::array<uint8_t, 16> s;
    size_t blocks = (data.size() + 15) / 16;
    for (size_t i = 0; i < blocks; i++) {
        a[15] = static_cast<uint8_t>(i + 1);
        AESCMAC::aes_encrypt(a.data(), key.data(), s.data());
        for (size_t j = 0; j < 16 && i * 16 + j < data.size(); j++) {
            data[i * 16 + j] ^= s[j];
        }
    }
}

void SoftwareCrypto::decryptJoinAccept(const AES128Key& appKey, const uint8_t* in, size_t len, uint8_t* out) {
    if (len % 16 != 0) {
        throw std::invalid_argument("Join-accept ciphertext is not a whole number of blocks");
    }
    for (size_t i = 0; i < len; i += 16) {
        AESCMAC::aes_encrypt(in + i, appKey.data(), out + i);
    }
}
