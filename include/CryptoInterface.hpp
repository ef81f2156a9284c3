/**
 * @file CryptoInterface.hpp
 * @brief Cryptographic capability used by the frame codec and the session.
 *
 * Nothing above this interface touches a cipher directly, so tests can
 * substitute a recording or deterministic implementation.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>
#include "LoRaWANTypes.hpp"

/**
 * @brief Traffic direction as encoded in the MIC and encryption blocks.
 */
enum class Direction : uint8_t {
    Uplink = 0,
    Downlink = 1
};

/**
 * @brief Values a join exchange contributes to the session key derivation.
 */
struct JoinNonces {
    std::array<uint8_t, 3> appNonce; /**< From the join-accept, wire order */
    std::array<uint8_t, 3> netId;    /**< From the join-accept, wire order */
    uint16_t devNonce;               /**< From the join-request */
};

struct SessionKeys {
    AES128Key nwkSKey;
    AES128Key appSKey;
};

class CryptoInterface {
public:
    virtual ~CryptoInterface() = default;

    /**
     * @brief Derive NwkSKey and AppSKey from the root key and the join nonces
     */
    virtual SessionKeys deriveSessionKeys(const AES128Key& appKey, const JoinNonces& nonces) = 0;

    /**
     * @brief First four bytes of AES-CMAC over @p data
     */
    virtual MIC computeMIC(const AES128Key& key, const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Encrypt or decrypt FRMPayload in place (the operation is symmetric)
     *
     * @param key AppSKey, or NwkSKey when FPort is 0
     * @param fcnt Full 32-bit frame counter
     * @param dir Direction of the frame
     * @param devAddr Device address in wire order
     * @param data Payload, replaced by its transform
     */
    virtual void encryptPayload(const AES128Key& key, uint32_t fcnt, Direction dir,
                                const DevAddr& devAddr, std::vector<uint8_t>& data) = 0;

    /**
     * @brief Recover the plaintext of a join-accept
     *
     * The network encrypts with AES decrypt, so this applies AES encrypt
     * block by block. @p len must be a multiple of 16.
     */
    virtual void decryptJoinAccept(const AES128Key& appKey, const uint8_t* in, size_t len, uint8_t* out) = 0;
};
