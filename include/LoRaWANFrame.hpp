/**
 * @file LoRaWANFrame.hpp
 * @brief PHYPayload framing: join-request, join-accept and data frames.
 *
 * Data frame layout:
 *   MHDR | DevAddr(4, LE) | FCtrl | FCnt(2, LE) | FOpts(0..15) | [FPort | FRMPayload] | MIC(4)
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>
#include "LoRaWANTypes.hpp"
#include "CryptoInterface.hpp"

// MHDR message types (major version 0)
#define MHDR_JOIN_REQUEST 0x00
#define MHDR_JOIN_ACCEPT 0x20
#define MHDR_UNCONFIRMED_UP 0x40
#define MHDR_UNCONFIRMED_DOWN 0x60
#define MHDR_CONFIRMED_UP 0x80
#define MHDR_CONFIRMED_DOWN 0xA0
#define MHDR_MTYPE_MASK 0xE0

// FCtrl bits
#define FCTRL_ADR 0x80
#define FCTRL_ADR_ACK_REQ 0x40
#define FCTRL_ACK 0x20
#define FCTRL_FPENDING 0x10
#define FCTRL_FOPTS_LEN 0x0F

#define MAX_FOPTS_LEN 15
#define JOIN_REQUEST_LEN 23
#define JOIN_ACCEPT_LEN 17
#define JOIN_ACCEPT_CFLIST_LEN 33
#define CFLIST_CHANNELS 5

/**
 * @brief Decrypted and authenticated content of a join-accept.
 */
struct JoinAccept {
    std::array<uint8_t, 3> appNonce;
    std::array<uint8_t, 3> netId;
    DevAddr devAddr;
    DLSettings dlSettings;
    uint8_t rxDelay;
    bool hasCFList;
    std::array<Frequency, CFLIST_CHANNELS> cfList; /**< Valid when hasCFList */
};

/**
 * @brief A data frame, either to be built or as decoded from the air.
 *
 * fctrl holds the ADR/ACK/FPending bits only; the FOpts length nibble is
 * derived from fopts.
 */
struct DataFrame {
    uint8_t mhdr = MHDR_UNCONFIRMED_UP;
    DevAddr devAddr = {{0, 0, 0, 0}};
    uint8_t fctrl = 0;
    uint32_t fcnt = 0;            /**< Full counter; only the low 16 bits travel */
    std::vector<uint8_t> fopts;
    bool hasPort = false;
    uint8_t fport = 0;
    std::vector<uint8_t> payload; /**< Plaintext FRMPayload */

    bool isConfirmed() const {
        uint8_t mtype = mhdr & MHDR_MTYPE_MASK;
        return mtype == MHDR_CONFIRMED_UP || mtype == MHDR_CONFIRMED_DOWN;
    }
};

class LoRaWANFrame {
public:
    /**
     * @brief Build MHDR | AppEUI | DevEUI | DevNonce | MIC
     *
     * @param appEUI Application EUI in wire order
     * @param devEUI Device EUI in wire order
     */
    static std::vector<uint8_t> buildJoinRequest(const EUI64& appEUI, const EUI64& devEUI,
                                                 uint16_t devNonce, const AES128Key& appKey,
                                                 CryptoInterface& crypto);

    /**
     * @brief Decrypt and verify a join-accept
     *
     * @return false if the length or message type is wrong or the MIC does not match
     */
    static bool decodeJoinAccept(const uint8_t* frame, size_t len, const AES128Key& appKey,
                                 CryptoInterface& crypto, JoinAccept& out);

    /**
     * @brief Encrypt FRMPayload, assemble the frame and append the MIC
     *
     * FRMPayload is encrypted with @p nwkSKey when fport is 0.
     *
     * @throws CapacityError if fopts exceeds 15 bytes
     * @throws LoRaWANError if FOpts are combined with FPort 0 or a payload is given without a port
     */
    static std::vector<uint8_t> buildDataFrame(const DataFrame& frame, Direction dir,
                                               const AES128Key& nwkSKey, const AES128Key& appSKey,
                                               CryptoInterface& crypto);

    /**
     * @brief Split a data frame into its fields without any cryptographic check
     *
     * fcnt receives the 16-bit counter as transmitted; payload stays encrypted.
     *
     * @return false if the frame is not a data frame or is truncated
     */
    static bool parseDataFrame(const uint8_t* frame, size_t len, DataFrame& out);

    /**
     * @brief Compare the trailing MIC with CMAC(nwkSKey, B0 | msg)
     *
     * @param fcnt Full 32-bit counter the sender used
     */
    static bool verifyDataMIC(const uint8_t* frame, size_t len, Direction dir,
                              const DevAddr& devAddr, uint32_t fcnt,
                              const AES128Key& nwkSKey, CryptoInterface& crypto);

    /**
     * @brief MIC of a data frame (B0 block prepended to @p msg)
     */
    static MIC dataMIC(const uint8_t* msg, size_t len, Direction dir, const DevAddr& devAddr,
                       uint32_t fcnt, const AES128Key& nwkSKey, CryptoInterface& crypto);

    /**
     * @brief Closest 32-bit counter to @p last whose low 16 bits are @p fcnt16
     *        and that is not below @p last
     */
    static uint32_t expandFCnt(uint16_t fcnt16, uint32_t last);
};
