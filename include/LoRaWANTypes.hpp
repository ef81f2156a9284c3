/**
 * @file LoRaWANTypes.hpp
 * @brief Value types shared by the codec, the channel plan and the session.
 *
 * Multi-byte identifiers (EUIs, DevAddr) are stored in air-interface order,
 * that is least significant byte first. Conversion from the MSB-first strings
 * printed by network consoles happens once, when the configuration is loaded.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include "LoRaWANError.hpp"

typedef std::array<uint8_t, 16> AES128Key;
typedef std::array<uint8_t, 8> EUI64;
typedef std::array<uint8_t, 4> DevAddr;
typedef std::array<uint8_t, 4> MIC;

/**
 * @brief LoRa spreading factors used by the LoRaWAN data rate tables.
 */
enum class SpreadingFactor : uint8_t {
    SF7 = 7,
    SF8 = 8,
    SF9 = 9,
    SF10 = 10,
    SF11 = 11,
    SF12 = 12
};

/**
 * @brief LoRa channel bandwidths used by the LoRaWAN data rate tables.
 */
enum class Bandwidth : uint8_t {
    BW125,
    BW250,
    BW500
};

/**
 * @brief Bandwidth in Hz.
 */
uint32_t bandwidthHz(Bandwidth bw);

/**
 * @brief One entry of a regional data rate table.
 */
struct Datarate {
    SpreadingFactor spreadingFactor;
    Bandwidth bandwidth;
    uint8_t maxMacPayloadSize;             /**< Max MACPayload (M) */
    uint8_t maxMacPayloadSizeWithDwellTime; /**< Max MACPayload with 400 ms dwell time */
};

/**
 * @brief 24-bit channel frequency in units of 100 Hz, as carried by MAC commands.
 */
class Frequency {
public:
    Frequency() : raw{{0, 0, 0}} {}

    /**
     * @brief Read the 3 little-endian bytes of a frequency field.
     */
    explicit Frequency(const uint8_t* bytes) : raw{{bytes[0], bytes[1], bytes[2]}} {}

    /**
     * @brief Build a frequency field from a value in Hz.
     *
     * @throws CodecError(InvalidFrequency) if @p hz is not a multiple of 100 Hz
     *         or does not fit in 24 bits of 100 Hz units
     */
    static Frequency fromHz(uint32_t hz);

    uint32_t hz() const {
        return (static_cast<uint32_t>(raw[0]) |
                (static_cast<uint32_t>(raw[1]) << 8) |
                (static_cast<uint32_t>(raw[2]) << 16)) * 100;
    }

    const std::array<uint8_t, 3>& bytes() const { return raw; }

private:
    std::array<uint8_t, 3> raw;
};

/**
 * @brief DLSettings byte: RX1 data rate offset (bits 6..4) and RX2 data rate (bits 3..0).
 */
class DLSettings {
public:
    explicit DLSettings(uint8_t value = 0) : raw(value) {}

    /**
     * @throws CodecError(InvalidDataRate) if the offset exceeds 7 or the data rate exceeds 15
     */
    static DLSettings make(uint8_t rx1DrOffset, uint8_t rx2DataRate);

    uint8_t rx1DataRateOffset() const { return (raw >> 4) & 0x07; }
    uint8_t rx2DataRate() const { return raw & 0x0F; }
    uint8_t rawValue() const { return raw; }

private:
    uint8_t raw;
};

/**
 * @brief DrRange byte of NewChannelReq: max data rate (bits 7..4), min data rate (bits 3..0).
 */
class DataRateRange {
public:
    explicit DataRateRange(uint8_t value = 0) : raw(value) {}

    /**
     * @throws CodecError(InvalidDataRate) if either bound exceeds 15
     */
    static DataRateRange make(uint8_t minDataRate, uint8_t maxDataRate);

    uint8_t maxDataRate() const { return raw >> 4; }
    uint8_t minDataRate() const { return raw & 0x0F; }
    uint8_t rawValue() const { return raw; }

private:
    uint8_t raw;
};

/**
 * @brief Redundancy byte of LinkADRReq: ChMaskCntl (bits 6..4), NbTrans (bits 3..0).
 */
class Redundancy {
public:
    explicit Redundancy(uint8_t value = 0) : raw(value) {}

    uint8_t channelMaskControl() const { return (raw >> 4) & 0x07; }
    uint8_t numberOfTransmissions() const { return raw & 0x0F; }
    uint8_t rawValue() const { return raw; }

private:
    uint8_t raw;
};

/**
 * @brief Bit vector of N*8 channels; bit i enables channel i.
 *
 * A default constructed mask has every channel enabled.
 */
template <size_t N>
class ChannelMask {
public:
    ChannelMask() { bank.fill(0xFF); }

    explicit ChannelMask(const std::array<uint8_t, N>& bytes) : bank(bytes) {}

    /**
     * @brief Build a mask from the first N bytes of @p data.
     *
     * @throws CodecError(BufferTooShort) if fewer than N bytes are available
     */
    static ChannelMask fromBytes(const uint8_t* data, size_t len) {
        if (len < N) {
            throw CodecError(CodecError::BufferTooShort, "ChannelMask: not enough bytes");
        }
        std::array<uint8_t, N> bytes;
        for (size_t i = 0; i < N; i++) {
            bytes[i] = data[i];
        }
        return ChannelMask(bytes);
    }

    static constexpr size_t size() { return N * 8; }

    /**
     * @brief Enable or disable a channel.
     *
     * @throws CodecError(InvalidIndex) if @p channel is not below size()
     */
    void setChannel(size_t channel, bool enabled) {
        checkIndex(channel);
        uint8_t flag = static_cast<uint8_t>(1 << (channel & 0x07));
        if (enabled) {
            bank[channel >> 3] |= flag;
        } else {
            bank[channel >> 3] &= static_cast<uint8_t>(~flag);
        }
    }

    /**
     * @brief Whether a channel is enabled.
     *
     * @throws CodecError(InvalidIndex) if @p channel is not below size()
     */
    bool isEnabled(size_t channel) const {
        checkIndex(channel);
        return (bank[channel >> 3] & (1 << (channel & 0x07))) != 0;
    }

    void setBank(size_t index, uint8_t value) { bank.at(index) = value; }
    uint8_t getBank(size_t index) const { return bank.at(index); }

    bool none() const {
        for (uint8_t b : bank) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    const std::array<uint8_t, N>& bytes() const { return bank; }

    bool operator==(const ChannelMask& other) const { return bank == other.bank; }
    bool operator!=(const ChannelMask& other) const { return bank != other.bank; }

private:
    void checkIndex(size_t channel) const {
        if (channel >= N * 8) {
            throw CodecError(CodecError::InvalidIndex,
                             "ChannelMask: channel " + std::to_string(channel) + " out of range");
        }
    }

    std::array<uint8_t, N> bank;
};
