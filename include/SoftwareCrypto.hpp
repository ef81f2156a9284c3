#pragma once

#include "CryptoInterface.hpp"

/**
 * @brief LoRaWAN 1.0.x security on top of AESCMAC (OpenSSL).
 */
class SoftwareCrypto : public CryptoInterface {
public:
    SessionKeys deriveSessionKeys(const AES128Key& appKey, const JoinNonces& nonces) override;
    MIC computeMIC(const AES128Key& key, const std::vector<uint8_t>& data) override;
    void encryptPayload(const AES128Key& key, uint32_t fcnt, Direction dir,
                        const DevAddr& devAddr, std::vector<uint8_t>& data) override;
    void decryptJoinAccept(const AES128Key& appKey, const uint8_t* in, size_t len, uint8_t* out) override;
};
